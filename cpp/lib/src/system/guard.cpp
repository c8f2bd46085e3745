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
#include <fcntl.h>
#include <unistd.h>

#include <bulkfetch/clock.hpp>
#include <bulkfetch/file.hpp>
#include <bulkfetch/system/guard.hpp>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>

namespace bulkfetch {
namespace system {

Guard::Guard(const Clock& clock, size_t staleLockAge, bool debugging)
	: __clock(clock), __stale_age(staleLockAge), __debugging(debugging)
{}

Guard::~Guard()
{}

uint64_t Guard::getFreeSpace(const string& path) const
{
	return internal::fs::freeSpace(path);
}

bool Guard::checkSpace(const string& path, uint64_t requiredBytes) const
{
	auto freeSpace = getFreeSpace(path);
	if (__debugging)
	{
		debug2("free space at '%s': %s, required: %s", path,
				humanReadableSizeString(freeSpace), humanReadableSizeString(requiredBytes));
	}
	return freeSpace >= requiredBytes;
}

void Guard::checkWritableDirectory(const string& path)
{
	try
	{
		internal::fs::mkpath(path);
		auto testPath = path + "/.write_test";
		{
			RequiredFile testFile(testPath, "w");
			testFile.put("test");
		}
		internal::fs::remove(testPath);
	}
	catch (Exception&)
	{
		fatal2(__("the output directory '%s' is not writable"), path);
	}
}

string Guard::getLockPath(const string& path)
{
	return path + ".lock";
}

bool Guard::acquireLock(const string& path)
{
	auto lockPath = getLockPath(path);
	for (size_t attempt = 0; attempt < 2; ++attempt)
	{
		int fd = open(lockPath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
		if (fd != -1)
		{
			auto pidString = format2("%d\n", (int)getpid());
			auto writeResult = write(fd, pidString.c_str(), pidString.size());
			if (writeResult != (ssize_t)pidString.size())
			{
				warn2e(__("unable to write to the file '%s'"), lockPath);
			}
			if (close(fd) == -1)
			{
				warn2e(__("unable to close the file '%s'"), lockPath);
			}
			if (__debugging)
			{
				debug2("obtained lock '%s'", lockPath);
			}
			return true;
		}
		if (errno != EEXIST)
		{
			warn2e(__("unable to create the lock file '%s'"), lockPath);
			return false;
		}
		if (attempt == 0 && isLocked(path))
		{
			break;
		}
	}
	if (__debugging)
	{
		debug2("the lock '%s' is held by another process", lockPath);
	}
	return false;
}

void Guard::releaseLock(const string& path)
{
	auto lockPath = getLockPath(path);
	try
	{
		internal::fs::remove(lockPath);
		if (__debugging)
		{
			debug2("released lock '%s'", lockPath);
		}
	}
	catch (Exception&)
	{
		warn2(__("unable to release the lock '%s'"), lockPath);
	}
}

void Guard::refreshLock(const string& path)
{
	try
	{
		internal::fs::touch(getLockPath(path));
	}
	catch (Exception&)
	{
		warn2(__("unable to refresh the lock '%s'"), getLockPath(path));
	}
}

bool Guard::isStale(const string& lockPath, size_t maxAge) const
{
	if (!internal::fs::fileExists(lockPath))
	{
		return false;
	}
	auto age = __clock.now() - internal::fs::fileModificationTime(lockPath);
	return age > (time_t)maxAge;
}

bool Guard::isLocked(const string& path) const
{
	auto lockPath = getLockPath(path);
	if (!internal::fs::fileExists(lockPath))
	{
		return false;
	}
	if (!isStale(lockPath, __stale_age))
	{
		return true;
	}

	if (__debugging)
	{
		debug2("removing the stale lock '%s'", lockPath);
	}
	try
	{
		internal::fs::remove(lockPath);
	}
	catch (Exception&)
	{
		return true;
	}
	return false;
}

size_t Guard::sweepStaleArtifacts(const string& root, size_t maxAge) const
{
	if (!internal::fs::dirExists(root))
	{
		return 0;
	}

	vector< string > candidates;
	internal::fs::walk(root, [&candidates](const string& path)
	{
		if (internal::endsWith(path, ".tmp") || internal::endsWith(path, ".tmp.meta") ||
				internal::endsWith(path, ".tmp.meta.new"))
		{
			candidates.push_back(path);
		}
	});

	size_t removedCount = 0;
	auto now = __clock.now();
	for (const auto& path: candidates)
	{
		try
		{
			// a companion file and its unfinished replacement belong to the staging file
			string stagingPath = path.substr(0, path.rfind(".tmp") + 4);
			if (isLocked(stagingPath))
			{
				continue;
			}
			if (now - internal::fs::fileModificationTime(path) <= (time_t)maxAge)
			{
				continue;
			}
			if (internal::fs::remove(path))
			{
				++removedCount;
				if (__debugging)
				{
					debug2("removed the stale artifact '%s'", path);
				}
			}
		}
		catch (Exception&)
		{
			warn2(__("unable to clean up the file '%s'"), path);
		}
	}
	return removedCount;
}

}
}
