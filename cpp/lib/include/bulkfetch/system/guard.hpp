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
#ifndef BULKFETCH_SYSTEM_GUARD_SEEN
#define BULKFETCH_SYSTEM_GUARD_SEEN

/// @file

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {
namespace system {

/// disk space admission and per-path advisory locks
/**
 * A lock on the path @c P is the file @c P.lock created with an exclusive
 * create and containing the pid of the holder. Locks are advisory: they only
 * exclude other cooperating processes. A lock whose modification time is older
 * than the stale age is considered abandoned and may be removed by whoever
 * checks it.
 */
class BULKFETCH_API Guard
{
	const Clock& __clock;
	size_t __stale_age;
	bool __debugging;
 public:
	/// constructor
	/**
	 * @param clock time source for staleness checks
	 * @param staleLockAge age in seconds after which a lock is stale
	 * @param debugging print debug messages about locking
	 */
	Guard(const Clock& clock, size_t staleLockAge, bool debugging = false);
	virtual ~Guard();

	/// returns the amount of bytes available to unprivileged users on the
	/// filesystem containing @a path
	virtual uint64_t getFreeSpace(const string& path) const;
	/// is there at least @a requiredBytes of free space for @a path
	bool checkSpace(const string& path, uint64_t requiredBytes) const;

	/// creates the directory @a path if needed and checks that files can be
	/// written there
	/**
	 * Throws Exception if not.
	 */
	static void checkWritableDirectory(const string& path);

	/// returns the path of the lock file protecting @a path
	static string getLockPath(const string& path);
	/// tries to lock @a path
	/**
	 * A stale lock is reclaimed and creation is retried once.
	 *
	 * @return @c false if @a path is locked by a live holder
	 */
	bool acquireLock(const string& path);
	/// removes the lock on @a path
	void releaseLock(const string& path);
	/// renews the modification time of the lock on @a path, so it stays fresh
	void refreshLock(const string& path);
	/// is the lock file @a lockPath older than @a maxAge seconds
	bool isStale(const string& lockPath, size_t maxAge) const;
	/// is @a path protected by a fresh lock
	/**
	 * A stale lock found here is removed.
	 */
	bool isLocked(const string& path) const;

	/// removes abandoned staging artifacts under @a root
	/**
	 * Removes @c .tmp and @c .tmp.meta files older than @a maxAge seconds
	 * which are not protected by a fresh lock.
	 *
	 * @return the number of removed files
	 */
	size_t sweepStaleArtifacts(const string& root, size_t maxAge) const;
};

}
}

#endif
