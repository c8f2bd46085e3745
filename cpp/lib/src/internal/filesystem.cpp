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
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <libgen.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/time.h>
#include <unistd.h>
#include <dirent.h>

#include <common/common.hpp>

#include <bulkfetch/file.hpp>

#include <internal/filesystem.hpp>

namespace bulkfetch {
namespace internal {
namespace fs {

string dirname(const string& path)
{
	char* pathCopy = strdup(path.c_str());
	string result(::dirname(pathCopy));
	free(pathCopy);

	return result;
}

bool move(const string& oldPath, const string& newPath)
{
	return (rename(oldPath.c_str(), newPath.c_str()) != -1);
}

void copyFile(const string& sourcePath, const string& targetPath)
{
	RequiredFile source(sourcePath, "r");
	RequiredFile target(targetPath, "w");

	char buffer[65536];
	size_t size;
	while ((size = source.read(buffer, sizeof(buffer))))
	{
		target.put(buffer, size);
	}
	target.sync();
}

bool remove(const string& path)
{
	if (unlink(path.c_str()) == -1)
	{
		if (errno == ENOENT)
		{
			return false;
		}
		fatal2e(__("unable to remove the file '%s'"), path);
	}
	return true;
}

static bool __lstat(const string& path, struct stat* result)
{
	auto error = lstat(path.c_str(), result);
	if (error)
	{
		if (errno == ENOENT || errno == ENOTDIR)
		{
			return false;
		}
		else
		{
			fatal2e(__("%s() failed: '%s'"), "lstat", path);
		}
	}
	return true;
}

bool fileExists(const string& path)
{
	struct stat s;
	return __lstat(path, &s) && (S_ISREG(s.st_mode) || S_ISLNK(s.st_mode) || S_ISFIFO(s.st_mode));
}

bool dirExists(const string& path)
{
	struct stat s;
	return __lstat(path, &s) && S_ISDIR(s.st_mode);
}

uint64_t fileSize(const string& path)
{
	struct stat s;
	if (!__lstat(path, &s))
	{
		fatal2(__("the file '%s' does not exist"), path);
	}
	if (!S_ISREG(s.st_mode))
	{
		fatal2(__("the file '%s' is not a regular file"), path);
	}
	return s.st_size;
}

time_t fileModificationTime(const string& path)
{
	struct stat s;
	if (!__lstat(path, &s))
	{
		fatal2(__("the file '%s' does not exist"), path);
	}
	return s.st_mtime;
}

void touch(const string& path)
{
	if (utimes(path.c_str(), NULL) == -1)
	{
		fatal2e(__("unable to update the modification time of the file '%s'"), path);
	}
}

void mkpath(const string& path)
{
	auto ensureDirectoryExist = [](const string& pathPart)
	{
		if (mkdir(pathPart.c_str(), 0755) == -1)
		{
			if (errno != EEXIST &&
					errno != EISDIR /* http://www.freebsd.org/cgi/query-pr.cgi?pr=59739 */)
			{
				fatal2e(__("unable to create the directory '%s'"), pathPart);
			}
		}
	};

	size_t position = 0;
	while (position = path.find('/', ++position), position != string::npos)
	{
		ensureDirectoryExist(path.substr(0, position));
	}
	ensureDirectoryExist(path);
}

uint64_t freeSpace(const string& path)
{
	struct statvfs s;
	if (statvfs(path.c_str(), &s) == -1)
	{
		fatal2e(__("%s() failed: '%s'"), "statvfs", path);
	}
	return uint64_t(s.f_bavail) * s.f_frsize;
}

void walk(const string& directoryPath, const std::function< void (const string&) >& callback)
{
	auto dirPtr = opendir(directoryPath.c_str());
	if (!dirPtr)
	{
		fatal2e(__("unable to open the directory '%s'"), directoryPath);
	}

	vector< string > subdirectories;
	for (;;)
	{
		errno = 0;
		auto entry = readdir(dirPtr);
		if (!entry)
		{
			if (errno)
			{
				auto savedErrno = errno;
				closedir(dirPtr);
				errno = savedErrno;
				fatal2e(__("%s() failed: '%s'"), "readdir", directoryPath);
			}
			break;
		}

		const char* name = entry->d_name;
		if (!strcmp(name, ".") || !strcmp(name, ".."))
		{
			continue;
		}

		string path = directoryPath + '/' + name;
		struct stat s;
		if (!__lstat(path, &s))
		{
			continue; // removed meanwhile
		}
		if (S_ISDIR(s.st_mode))
		{
			subdirectories.push_back(path);
		}
		else if (S_ISREG(s.st_mode))
		{
			callback(path);
		}
	}
	if (closedir(dirPtr) == -1)
	{
		fatal2e(__("unable to close the directory '%s'"), directoryPath);
	}

	FORIT(it, subdirectories)
	{
		walk(*it, callback);
	}
}

}
}
}
