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
#ifndef BULKFETCH_INTERNAL_FILESYSTEM_SEEN
#define BULKFETCH_INTERNAL_FILESYSTEM_SEEN

#include <ctime>
#include <functional>

#include <bulkfetch/common.hpp>

namespace bulkfetch {
namespace internal {
namespace fs {

string dirname(const string& path);
// rename(2); on failure returns false, errno is preserved
bool move(const string& oldPath, const string& newPath);
void copyFile(const string& sourcePath, const string& targetPath);
// returns false if the file didn't exist
bool remove(const string& path);
bool fileExists(const string& path);
bool dirExists(const string& path);
uint64_t fileSize(const string& path);
time_t fileModificationTime(const string& path);
void touch(const string& path);
void mkpath(const string& path);
uint64_t freeSpace(const string& path);
// calls a callback for each regular file under the directory, recursively,
// without following symbolic links
void walk(const string& directoryPath, const std::function< void (const string&) >& callback);

}
}
}

#endif
