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
#include <algorithm>
#include <cerrno>

#include <boost/lexical_cast.hpp>

#include <bulkfetch/common.hpp>

#include <bulkfetch/catalog.hpp>
#include <bulkfetch/clock.hpp>
#include <bulkfetch/config.hpp>
#include <bulkfetch/download/failureclassifier.hpp>
#include <bulkfetch/download/method.hpp>
#include <bulkfetch/download/progress.hpp>
#include <bulkfetch/download/transfer.hpp>
#include <bulkfetch/system/guard.hpp>
#include <bulkfetch/system/shutdown.hpp>

#include <internal/filesystem.hpp>
#include <internal/stagingmeta.hpp>

namespace bulkfetch {

namespace download {

TransferPolicy::TransferPolicy()
	: retryDelays { 5, 10, 30, 60, 300 }
	, maxFileRetries(3)
	, maxRetryTime(48*60*60)
	, permanentRetryDelay(5)
	, diskWait(60)
	, minFreeSpace(10ULL*1024*1024*1024)
	, progressThreshold(10*1024*1024)
	, lockRefreshInterval(60)
{}

TransferPolicy::TransferPolicy(const Config& config)
	: TransferPolicy()
{
	retryDelays.clear();
	for (const string& item: config.getList("bulkfetch::transfer::retry-delays"))
	{
		try
		{
			retryDelays.push_back(boost::lexical_cast< size_t >(item));
		}
		catch (boost::bad_lexical_cast&)
		{
			fatal2(__("the retry delay '%s' is not a number"), item);
		}
	}
	if (retryDelays.empty())
	{
		fatal2(__("the option '%s' cannot be empty"), "bulkfetch::transfer::retry-delays");
	}
	maxFileRetries = config.getUnsigned("bulkfetch::transfer::max-file-retries");
	if (!maxFileRetries)
	{
		maxFileRetries = 1;
	}
	maxRetryTime = config.getUnsigned("bulkfetch::transfer::max-retry-time");
	permanentRetryDelay = config.getUnsigned("bulkfetch::transfer::permanent-retry-delay");
	diskWait = config.getUnsigned("bulkfetch::transfer::disk-wait");
	if (!diskWait)
	{
		diskWait = 1;
	}
	minFreeSpace = config.getUnsigned("bulkfetch::transfer::min-free-space");
	progressThreshold = config.getUnsigned("bulkfetch::transfer::progress-threshold");
	lockRefreshInterval = config.getUnsigned("bulkfetch::transfer::lock-stale-age") / 5;
	if (!lockRefreshInterval)
	{
		lockRefreshInterval = 1;
	}
}

size_t TransferPolicy::getRetryDelay(size_t attempt) const
{
	if (retryDelays.empty())
	{
		return 0;
	}
	if (attempt == 0)
	{
		attempt = 1;
	}
	return retryDelays[std::min(attempt, retryDelays.size()) - 1];
}

}

namespace internal {

typedef download::ResumableTransfer::State State;
typedef download::ResumableTransfer::Outcome Outcome;
typedef download::FailureClassifier::Verdict Verdict;
using download::TransferError;

namespace {

// removes the lock in every exit path
class LockHolder
{
	system::Guard& __guard;
	const string& __path;
 public:
	LockHolder(system::Guard& guard, const string& path)
		: __guard(guard), __path(path)
	{}
	~LockHolder()
	{
		__guard.releaseLock(__path);
	}
};

const size_t maxShownErrorLength = 100;

bool isNetworkError(const std::exception& e)
{
	auto transferError = dynamic_cast< const TransferError* >(&e);
	return transferError && transferError->getKind() == TransferError::Kind::Network;
}

}

class ResumableTransferImpl
{
	shared_ptr< download::Method > __method;
	download::TransferPolicy __policy;
	system::Guard& __guard;
	const system::CancellationToken& __token;
	const Clock& __clock;
	shared_ptr< download::Progress > __progress;
	bool __debugging;
	download::FailureClassifier __classifier;

	// per-run state
	string __container;
	ObjectDescriptor __descriptor;
	string __local_path;
	string __staging_path;
	string __meta_path;
	time_t __last_lock_refresh;

	bool __wait(size_t seconds);
	void __refresh_lock_if_needed();
	void __discard_staging();
	void __save_meta(uint64_t downloaded);
	bool __get_resume_offset(uint64_t* offset);
	void __fetch(uint64_t offset);
	void __verify();
	void __promote();
	Outcome __loop();
	Outcome __finish(Outcome, const string& result);
 public:
	State state;
	size_t networkRetryCount;
	size_t fileErrorCount;
	string lastError;

	ResumableTransferImpl(const shared_ptr< download::Method >&, const download::TransferPolicy&,
			system::Guard&, const system::CancellationToken&, const Clock&,
			const shared_ptr< download::Progress >&, bool debugging);
	Outcome run(const string& container, const ObjectDescriptor&, const string& localPath);
};

ResumableTransferImpl::ResumableTransferImpl(const shared_ptr< download::Method >& method,
		const download::TransferPolicy& policy, system::Guard& guard,
		const system::CancellationToken& token, const Clock& clock,
		const shared_ptr< download::Progress >& progress, bool debugging)
	: __method(method), __policy(policy), __guard(guard), __token(token), __clock(clock)
	, __progress(progress), __debugging(debugging), __last_lock_refresh(0)
	, state(State::Idle), networkRetryCount(0), fileErrorCount(0)
{}

// sleeps in one-second ticks, returns false if a stop was requested meanwhile
bool ResumableTransferImpl::__wait(size_t seconds)
{
	for (size_t i = 0; i < seconds; ++i)
	{
		if (__token.isRequested())
		{
			return false;
		}
		__clock.sleep(1);
		__refresh_lock_if_needed();
	}
	return !__token.isRequested();
}

void ResumableTransferImpl::__refresh_lock_if_needed()
{
	auto now = __clock.now();
	if (now - __last_lock_refresh >= (time_t)__policy.lockRefreshInterval)
	{
		__guard.refreshLock(__staging_path);
		__last_lock_refresh = now;
	}
}

void ResumableTransferImpl::__discard_staging()
{
	fs::remove(__staging_path);
	fs::remove(__meta_path);
}

void ResumableTransferImpl::__save_meta(uint64_t downloaded)
{
	StagingMeta meta;
	meta.etag = __descriptor.etag;
	meta.size = __descriptor.size;
	meta.downloaded = downloaded;
	meta.timestamp = __clock.now();
	meta.save(__meta_path);
}

// returns true if the staging file already holds the whole object
bool ResumableTransferImpl::__get_resume_offset(uint64_t* offset)
{
	*offset = 0;
	if (!fs::fileExists(__staging_path))
	{
		fs::remove(__meta_path);
		return false;
	}

	auto actualSize = fs::fileSize(__staging_path);
	StagingMeta meta;
	const char* mismatch = NULL;
	if (actualSize > __descriptor.size)
	{
		mismatch = "the staging file is larger than the object";
	}
	else if (!fs::fileExists(__meta_path))
	{
		// left by a crash during the first attempt, before any companion was written
		if (__debugging)
		{
			debug2("resuming the staging file '%s' without a companion file", __staging_path);
		}
	}
	else if (!meta.load(__meta_path))
	{
		mismatch = "unreadable companion file";
	}
	else if (meta.etag != __descriptor.etag)
	{
		mismatch = "etag mismatch";
	}
	else if (meta.size != __descriptor.size)
	{
		mismatch = "size mismatch";
	}
	else if (meta.downloaded != actualSize)
	{
		mismatch = "recorded and actual staging sizes differ";
	}

	if (mismatch)
	{
		if (__debugging)
		{
			debug2("discarding the staging file '%s': %s", __staging_path, mismatch);
		}
		__discard_staging();
		return false;
	}

	*offset = actualSize;
	return actualSize == __descriptor.size;
}

void ResumableTransferImpl::__fetch(uint64_t offset)
{
	if (!offset)
	{
		__discard_staging();
	}
	if (__progress)
	{
		__progress->transfer(__descriptor.key, offset,
				__descriptor.size >= __policy.progressThreshold);
	}

	download::Method::Request request;
	request.container = __container;
	request.key = __descriptor.key;
	request.offset = offset;

	auto callback = [this](uint64_t chunkSize) -> bool
	{
		if (__progress)
		{
			__progress->downloading(__descriptor.key, chunkSize);
		}
		__refresh_lock_if_needed();
		return !__token.isRequested();
	};
	__method->perform(request, __staging_path, callback);
}

void ResumableTransferImpl::__verify()
{
	if (!fs::fileExists(__staging_path))
	{
		throw TransferError(TransferError::Kind::Integrity, __("the staging file is missing"));
	}
	auto actualSize = fs::fileSize(__staging_path);
	if (actualSize != __descriptor.size)
	{
		throw TransferError(TransferError::Kind::Integrity,
				format2(__("size mismatch: expected %llu bytes, got %llu bytes"),
				(unsigned long long)__descriptor.size, (unsigned long long)actualSize));
	}
}

void ResumableTransferImpl::__promote()
{
	if (!fs::move(__staging_path, __local_path))
	{
		if (errno != EXDEV)
		{
			throw TransferError(TransferError::Kind::System,
					format2e(__("unable to rename '%s' to '%s'"), __staging_path, __local_path), errno);
		}
		// different filesystems
		fs::copyFile(__staging_path, __local_path);
		fs::remove(__staging_path);
	}

	if (!fs::fileExists(__local_path) || fs::fileSize(__local_path) != __descriptor.size)
	{
		throw TransferError(TransferError::Kind::Integrity,
				format2(__("the file '%s' is not in place after promotion"), __local_path));
	}
	fs::remove(__meta_path);
}

Outcome ResumableTransferImpl::__finish(Outcome outcome, const string& result)
{
	if (__progress)
	{
		__progress->done(__descriptor.key, result);
	}
	return outcome;
}

Outcome ResumableTransferImpl::__loop()
{
	auto startTime = __clock.now();
	while (true)
	{
		if (__token.isRequested())
		{
			return Outcome::Interrupted;
		}
		if (__clock.now() - startTime > (time_t)__policy.maxRetryTime)
		{
			lastError = format2(__("giving up after %s of retries, the last error: %s"),
					humanReadableDifftimeString(__policy.maxRetryTime), lastError);
			return Outcome::Failed;
		}

		state = State::SpaceCheck;
		auto requiredSpace = 2 * __descriptor.size + __policy.minFreeSpace;
		if (!__guard.checkSpace(fs::dirname(__local_path), requiredSpace))
		{
			warn2(__("not enough free disk space for '%s' (%s required), waiting %zus"),
					__descriptor.key, humanReadableSizeString(requiredSpace), __policy.diskWait);
			state = State::Waiting;
			if (!__wait(__policy.diskWait))
			{
				return Outcome::Interrupted;
			}
			continue;
		}

		try
		{
			state = State::ResumeCheck;
			uint64_t offset;
			bool complete = __get_resume_offset(&offset);
			if (!complete)
			{
				state = State::Transferring;
				__fetch(offset);
			}
			state = State::Verifying;
			__verify();
			state = State::Promoting;
			__promote();
			state = State::Done;
			return Outcome::Done;
		}
		catch (std::exception& e)
		{
			if (__token.isRequested())
			{
				if (fs::fileExists(__staging_path))
				{
					__save_meta(fs::fileSize(__staging_path));
				}
				return Outcome::Interrupted;
			}

			lastError = truncateMessage(e.what(), maxShownErrorLength);
			download::Progress::RetryInfo retryInfo;
			retryInfo.reason = lastError;
			retryInfo.reachable = true;

			if (__classifier.classify(e) == Verdict::Transient)
			{
				++networkRetryCount;
				// keep the staging file resumable
				if (fs::fileExists(__staging_path))
				{
					__save_meta(fs::fileSize(__staging_path));
				}
				retryInfo.transient = true;
				retryInfo.attempt = networkRetryCount;
				retryInfo.limit = 0;
				retryInfo.delay = __policy.getRetryDelay(networkRetryCount);
				if (isNetworkError(e))
				{
					try
					{
						retryInfo.reachable = __method->isReachable(__container);
					}
					catch (Exception& checkError)
					{
						warn2(__("unable to check the network connection: %s"), checkError.what());
					}
				}
				if (__progress)
				{
					__progress->retry(__descriptor.key, retryInfo);
				}
				state = State::Waiting;
				if (!__wait(retryInfo.delay))
				{
					return Outcome::Interrupted;
				}
			}
			else
			{
				++fileErrorCount;
				__discard_staging();
				retryInfo.transient = false;
				retryInfo.attempt = fileErrorCount;
				retryInfo.limit = __policy.maxFileRetries;
				retryInfo.delay = __policy.permanentRetryDelay;
				if (__progress)
				{
					__progress->retry(__descriptor.key, retryInfo);
				}
				if (fileErrorCount >= __policy.maxFileRetries)
				{
					return Outcome::Failed;
				}
				state = State::Waiting;
				if (!__wait(__policy.permanentRetryDelay))
				{
					return Outcome::Interrupted;
				}
			}
		}
	}
}

Outcome ResumableTransferImpl::run(const string& container,
		const ObjectDescriptor& descriptor, const string& localPath)
{
	__container = container;
	__descriptor = descriptor;
	__local_path = localPath;
	__staging_path = download::ResumableTransfer::getStagingPath(localPath);
	__meta_path = StagingMeta::getPath(__staging_path);
	state = State::Idle;
	networkRetryCount = 0;
	fileErrorCount = 0;
	lastError.clear();

	if (__progress)
	{
		__progress->start(descriptor.key, descriptor.size);
	}

	try
	{
		fs::mkpath(fs::dirname(localPath));
	}
	catch (Exception& e)
	{
		state = State::Failed;
		lastError = truncateMessage(e.what(), maxShownErrorLength);
		return __finish(Outcome::Failed, lastError);
	}

	state = State::Locking;
	if (!__guard.acquireLock(__staging_path))
	{
		state = State::Failed;
		lastError = __("locked by another process");
		return __finish(Outcome::Locked, lastError);
	}
	__last_lock_refresh = __clock.now();

	Outcome outcome;
	{
		LockHolder lockHolder(__guard, __staging_path);
		try
		{
			outcome = __loop();
		}
		catch (Exception& e)
		{
			// local errors outside of the transfer attempt, like an unwritable companion file
			lastError = truncateMessage(e.what(), maxShownErrorLength);
			outcome = Outcome::Failed;
		}
	}

	switch (outcome)
	{
		case Outcome::Done:
			return __finish(outcome, "");
		case Outcome::Interrupted:
			state = State::Failed;
			return __finish(outcome, __("interrupted"));
		default:
			state = State::Failed;
			return __finish(outcome, lastError);
	}
}

}

namespace download {

ResumableTransfer::ResumableTransfer(const shared_ptr< Method >& method,
		const TransferPolicy& policy, system::Guard& guard,
		const system::CancellationToken& token, const Clock& clock,
		const shared_ptr< Progress >& progress, bool debugging)
	: __impl(new internal::ResumableTransferImpl(method, policy, guard, token, clock,
			progress, debugging))
{}

ResumableTransfer::~ResumableTransfer()
{
	delete __impl;
}

ResumableTransfer::Outcome ResumableTransfer::run(const string& container,
		const ObjectDescriptor& descriptor, const string& localPath)
{
	return __impl->run(container, descriptor, localPath);
}

bool ResumableTransfer::perform(const string& container, const string& key,
		const string& localPath, uint64_t expectedSize, const string& expectedEtag)
{
	return run(container, ObjectDescriptor(key, expectedSize, expectedEtag), localPath) == Outcome::Done;
}

ResumableTransfer::State ResumableTransfer::getState() const
{
	return __impl->state;
}

size_t ResumableTransfer::getNetworkRetryCount() const
{
	return __impl->networkRetryCount;
}

size_t ResumableTransfer::getFileErrorCount() const
{
	return __impl->fileErrorCount;
}

const string& ResumableTransfer::getLastError() const
{
	return __impl->lastError;
}

string ResumableTransfer::getStagingPath(const string& localPath)
{
	return localPath + ".tmp";
}

}
}
