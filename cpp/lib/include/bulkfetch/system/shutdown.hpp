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
#ifndef BULKFETCH_SYSTEM_SHUTDOWN_SEEN
#define BULKFETCH_SYSTEM_SHUTDOWN_SEEN

/// @file

#include <atomic>
#include <functional>

#include <bulkfetch/common.hpp>

namespace bulkfetch {

namespace internal {

class ShutdownCoordinatorImpl;

}

namespace system {

/// cooperative stop request
/**
 * Set once, from any thread; polled by long-running operations at their
 * safe checkpoints.
 */
class BULKFETCH_API CancellationToken
{
	std::atomic< bool > __requested;

	CancellationToken(const CancellationToken&) = delete;
	CancellationToken& operator=(const CancellationToken&) = delete;
 public:
	CancellationToken();
	/// requests a stop; idempotent
	void request();
	/// has a stop been requested
	bool isRequested() const;
};

/// turns termination signals into a cancellation request
/**
 * On construction blocks @c SIGINT, @c SIGTERM and @c SIGHUP in the calling
 * thread (and so in all threads created afterwards) and starts a thread
 * waiting for them. The first signal requests a stop on the token. The second
 * one runs the forced exit action, if any, and terminates the process with
 * the exit code @c 1.
 *
 * Construct it before any other thread is started.
 */
class BULKFETCH_API ShutdownCoordinator
{
	internal::ShutdownCoordinatorImpl* __impl;

	ShutdownCoordinator(const ShutdownCoordinator&) = delete;
	ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;
 public:
	/// constructor
	/**
	 * @param token token to request a stop on, must outlive the object
	 */
	explicit ShutdownCoordinator(CancellationToken& token);
	/// destructor
	/**
	 * Stops the waiting thread and restores the previous signal mask.
	 */
	~ShutdownCoordinator();

	/// sets a best-effort action run before the forced exit
	void setForcedExitAction(const std::function< void () >&);

	/// processes a termination signal as if it was received
	void notify(int signalNumber);

	/// returns the number of termination signals received so far
	size_t getSignalCount() const;
};

/// sets the forced exit action for the lifetime of the object
/**
 * Use it when the action refers to objects with a shorter lifetime than the
 * coordinator.
 */
class BULKFETCH_API ScopedForcedExitAction
{
	ShutdownCoordinator& __coordinator;

	ScopedForcedExitAction(const ScopedForcedExitAction&) = delete;
	ScopedForcedExitAction& operator=(const ScopedForcedExitAction&) = delete;
 public:
	ScopedForcedExitAction(ShutdownCoordinator&, const std::function< void () >&);
	/// clears the action; waits for it if it is running
	~ScopedForcedExitAction();
};

}
}

#endif
