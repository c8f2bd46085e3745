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
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <pthread.h>
#include <unistd.h>

#include <bulkfetch/system/shutdown.hpp>

namespace bulkfetch {

namespace system {

CancellationToken::CancellationToken()
	: __requested(false)
{}

void CancellationToken::request()
{
	__requested.store(true);
}

bool CancellationToken::isRequested() const
{
	return __requested.load();
}

}

namespace internal {

class ShutdownCoordinatorImpl
{
	system::CancellationToken& __token;
	sigset_t __waitedSignals;
	sigset_t __oldMask;
	std::thread __waiter;
	std::atomic< bool > __stopping;
	std::atomic< size_t > __signalCount;
	std::mutex __actionMutex;
	std::function< void () > __forcedExitAction;

	void __wait();
 public:
	ShutdownCoordinatorImpl(system::CancellationToken&);
	~ShutdownCoordinatorImpl();
	void setForcedExitAction(const std::function< void () >&);
	void notify(int signalNumber);
	size_t getSignalCount() const;
};

ShutdownCoordinatorImpl::ShutdownCoordinatorImpl(system::CancellationToken& token)
	: __token(token), __stopping(false), __signalCount(0)
{
	if (sigemptyset(&__waitedSignals) == -1)
	{
		fatal2e(__("%s() failed"), "sigemptyset");
	}
	for (int signalNumber: { SIGINT, SIGTERM, SIGHUP })
	{
		if (sigaddset(&__waitedSignals, signalNumber) == -1)
		{
			fatal2e(__("%s() failed"), "sigaddset");
		}
	}
	auto blockResult = pthread_sigmask(SIG_BLOCK, &__waitedSignals, &__oldMask);
	if (blockResult)
	{
		fatal2(__("%s() failed: %s"), "pthread_sigmask", strerror(blockResult));
	}

	__waiter = std::thread(&ShutdownCoordinatorImpl::__wait, this);
}

ShutdownCoordinatorImpl::~ShutdownCoordinatorImpl()
{
	__stopping.store(true);
	// wakes up sigwait() in the waiting thread only
	pthread_kill(__waiter.native_handle(), SIGTERM);
	__waiter.join();

	auto restoreResult = pthread_sigmask(SIG_SETMASK, &__oldMask, NULL);
	if (restoreResult)
	{
		warn2(__("%s() failed: %s"), "pthread_sigmask", strerror(restoreResult));
	}
}

void ShutdownCoordinatorImpl::__wait()
{
	while (true)
	{
		int signalNumber;
		if (sigwait(&__waitedSignals, &signalNumber) != 0)
		{
			continue;
		}
		if (__stopping.load())
		{
			return;
		}
		notify(signalNumber);
	}
}

void ShutdownCoordinatorImpl::setForcedExitAction(const std::function< void () >& action)
{
	std::lock_guard< std::mutex > guard(__actionMutex);
	__forcedExitAction = action;
}

void ShutdownCoordinatorImpl::notify(int signalNumber)
{
	auto count = ++__signalCount;
	if (count == 1)
	{
		__token.request();
		warn2(__("received the signal '%s', stopping after the current checkpoint (send it again to exit immediately)"),
				strsignal(signalNumber));
		return;
	}

	warn2(__("received the signal '%s' again, exiting"), strsignal(signalNumber));
	{
		std::lock_guard< std::mutex > guard(__actionMutex);
		if (__forcedExitAction)
		{
			try
			{
				__forcedExitAction();
			}
			catch (std::exception& e)
			{
				warn2(__("the final action before exit failed: %s"), e.what());
			}
		}
	}
	_exit(1);
}

size_t ShutdownCoordinatorImpl::getSignalCount() const
{
	return __signalCount.load();
}

}

namespace system {

ShutdownCoordinator::ShutdownCoordinator(CancellationToken& token)
	: __impl(new internal::ShutdownCoordinatorImpl(token))
{}

ShutdownCoordinator::~ShutdownCoordinator()
{
	delete __impl;
}

void ShutdownCoordinator::setForcedExitAction(const std::function< void () >& action)
{
	__impl->setForcedExitAction(action);
}

void ShutdownCoordinator::notify(int signalNumber)
{
	__impl->notify(signalNumber);
}

size_t ShutdownCoordinator::getSignalCount() const
{
	return __impl->getSignalCount();
}

ScopedForcedExitAction::ScopedForcedExitAction(ShutdownCoordinator& coordinator,
		const std::function< void () >& action)
	: __coordinator(coordinator)
{
	__coordinator.setForcedExitAction(action);
}

ScopedForcedExitAction::~ScopedForcedExitAction()
{
	__coordinator.setForcedExitAction(std::function< void () >());
}

}
}
