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
#ifndef BULKFETCH_INTERNAL_COMMON_SEEN
#define BULKFETCH_INTERNAL_COMMON_SEEN

#include <ctime>

#include <bulkfetch/common.hpp>

namespace bulkfetch {
namespace internal {

vector< string > split(char, const string&, bool allowEmpty = false);

string trim(const string&);
string toLower(string);

bool startsWith(const string& str, const string& prefix);
bool endsWith(const string& str, const string& suffix);

// strftime() over the local time
string formatLocalTime(time_t timestamp, const char* format = "%Y-%m-%d %H:%M:%S");

} // namespace
} // namespace

#endif
