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
#ifndef BULKFETCH_DOWNLOAD_PROGRESSES_CONSOLE_SEEN
#define BULKFETCH_DOWNLOAD_PROGRESSES_CONSOLE_SEEN

/// @file

#include <bulkfetch/download/progress.hpp>

namespace bulkfetch {

namespace internal {

class ConsoleProgressImpl;

}

namespace download {

/// console download progress meter
/**
 * Prints per-object lines and retry notices to the standard error. A
 * self-refreshing progress line is shown for big objects when the standard
 * error is a terminal.
 */
class BULKFETCH_API ConsoleProgress: public Progress
{
	internal::ConsoleProgressImpl* __impl;
 protected:
	virtual void newDownloadHook(const string& key, const DownloadRecord&);
	virtual void transferHook(const string& key, const DownloadRecord&);
	virtual void retryHook(const string& key, const RetryInfo&);
	virtual void finishedDownloadHook(const string& key, const string& result);
	virtual void updateHook(bool immediate);
	virtual void finishHook();
 public:
	/// constructor
	ConsoleProgress();
	/// destructor
	virtual ~ConsoleProgress();
};

}
}

#endif
