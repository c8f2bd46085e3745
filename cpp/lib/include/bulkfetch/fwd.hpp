/**************************************************************************
*   Copyright (C) 2026 by Eugene V. Lyubimkin                             *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#ifndef BULKFETCH_FWD_SEEN
#define BULKFETCH_FWD_SEEN

namespace bulkfetch {

class Config;
class File;
class RequiredFile;
class Clock;
struct ObjectDescriptor;
class Catalog;
struct PlanEntry;
class Planner;
class Ledger;

namespace download {

class Method;
class TransferError;
class FailureClassifier;
struct TransferPolicy;
class ResumableTransfer;
class Progress;
class ConsoleProgress;

}

namespace system {

class CancellationToken;
class ShutdownCoordinator;
class Guard;
class Worker;

}

}

#endif
