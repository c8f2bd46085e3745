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
#ifndef BULKFETCH_DOWNLOAD_TRANSFER_SEEN
#define BULKFETCH_DOWNLOAD_TRANSFER_SEEN

/// @file

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {

namespace internal {

class ResumableTransferImpl;

}

namespace download {

/// retry and admission parameters of a transfer
struct BULKFETCH_API TransferPolicy
{
	vector< size_t > retryDelays; ///< waits after consecutive transient errors, the last one repeats
	size_t maxFileRetries; ///< permanent errors tolerated per object
	size_t maxRetryTime; ///< seconds after which an object is abandoned
	size_t permanentRetryDelay; ///< wait before restarting after a permanent error
	size_t diskWait; ///< wait before rechecking free disk space
	uint64_t minFreeSpace; ///< free space reserve kept on the target filesystem
	uint64_t progressThreshold; ///< objects from this size on get a detailed progress
	size_t lockRefreshInterval; ///< how often a held lock is renewed

	/// built-in defaults
	TransferPolicy();
	/// reads @c bulkfetch::transfer::* options
	explicit TransferPolicy(const Config&);

	/// returns the wait after the @a attempt-th (starting from 1) transient error
	size_t getRetryDelay(size_t attempt) const;
};

/// resumable, crash-tolerant transfer of one object
/**
 * The object is fetched into the staging file @c <local>.tmp, which survives
 * transient errors and restarts of the program, and is renamed to the local
 * path once it has the expected size. The companion @c <local>.tmp.meta file
 * records what the staging file holds; a staging file without a matching
 * companion is never resumed. The staging file is protected by the lock
 * @c <local>.tmp.lock for the whole run.
 *
 * Transient errors are retried with the delays of the policy until the
 * overall time limit is reached. Permanent errors discard the staging file and
 * restart from zero, up to TransferPolicy::maxFileRetries times.
 */
class BULKFETCH_API ResumableTransfer
{
	internal::ResumableTransferImpl* __impl;

	ResumableTransfer(const ResumableTransfer&) = delete;
	ResumableTransfer& operator=(const ResumableTransfer&) = delete;
 public:
	enum class State { Idle, Locking, SpaceCheck, ResumeCheck, Transferring,
			Waiting, Verifying, Promoting, Done, Failed };
	enum class Outcome
	{
		Done, ///< the object is in place
		Failed, ///< gave up on the object
		Locked, ///< another process is working on the object
		Interrupted ///< a stop was requested, staging files are kept
	};

	/// constructor
	/**
	 * @param method transport
	 * @param policy retry parameters
	 * @param guard disk space and lock keeper
	 * @param token stop request to poll
	 * @param clock time source for waits
	 * @param progress progress meter, may be empty
	 * @param debugging print debug messages
	 */
	ResumableTransfer(const shared_ptr< Method >& method, const TransferPolicy& policy,
			system::Guard& guard, const system::CancellationToken& token, const Clock& clock,
			const shared_ptr< Progress >& progress, bool debugging = false);
	~ResumableTransfer();

	/// transfers @a descriptor from @a container to @a localPath
	Outcome run(const string& container, const ObjectDescriptor& descriptor,
			const string& localPath);
	/// @copydoc run
	/**
	 * @return @c true if the object is in place
	 */
	bool perform(const string& container, const string& key, const string& localPath,
			uint64_t expectedSize, const string& expectedEtag);

	/// the current (or the final) state of the last run
	State getState() const;
	/// number of transient errors in the last run
	size_t getNetworkRetryCount() const;
	/// number of permanent errors in the last run
	size_t getFileErrorCount() const;
	/// description of the last error of the last run
	const string& getLastError() const;

	static string getStagingPath(const string& localPath);
};

}
}

#endif
