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
#include <bulkfetch/clock.hpp>
#include <bulkfetch/config.hpp>
#include <bulkfetch/ledger.hpp>
#include <bulkfetch/download/method.hpp>
#include <bulkfetch/download/progress.hpp>
#include <bulkfetch/download/transfer.hpp>
#include <bulkfetch/system/guard.hpp>
#include <bulkfetch/system/shutdown.hpp>
#include <bulkfetch/system/worker.hpp>

#include <internal/logger.hpp>

namespace bulkfetch {

namespace system {

Worker::Summary::Summary()
	: downloaded(0), downloadedBytes(0), failed(0), locked(0), notAttempted(0), interrupted(false)
{}

}

namespace internal {

typedef Logger::Subsystem Subsystem;

class WorkerImpl
{
 public:
	shared_ptr< const Config > config;
	shared_ptr< download::Method > method;
	const system::CancellationToken& token;
	shared_ptr< Ledger > ledger;
	shared_ptr< const Clock > clock;
	bool debugging;
	unique_ptr< Logger > logger;
	system::Guard guard;
	Planner::Counters planCounters;

	WorkerImpl(const shared_ptr< const Config >&, const shared_ptr< download::Method >&,
			const system::CancellationToken&, const shared_ptr< Ledger >&,
			const shared_ptr< const Clock >&);
	void logPlanCounters();
};

WorkerImpl::WorkerImpl(const shared_ptr< const Config >& config_,
		const shared_ptr< download::Method >& method_, const system::CancellationToken& token_,
		const shared_ptr< Ledger >& ledger_, const shared_ptr< const Clock >& clock_)
	: config(config_), method(method_), token(token_), ledger(ledger_), clock(clock_)
	, debugging(config_->getBool("debug::worker"))
	, logger(new Logger(*config_))
	, guard(*clock_, config_->getUnsigned("bulkfetch::transfer::lock-stale-age"), debugging)
{}

void WorkerImpl::logPlanCounters()
{
	const auto& c = planCounters;
	logger->log(Subsystem::Planner, 1, format2("listed %zu objects: %zu to download (%s), "
			"%zu already present (%s), %zu excluded, %zu unsafe, %zu over the cap",
			c.listed, c.selected, humanReadableSizeString(c.plannedBytes),
			c.alreadyPresent, humanReadableSizeString(c.presentBytes),
			c.excluded, c.rejected, c.overCap));
}

}

namespace system {

typedef download::ResumableTransfer::Outcome Outcome;

Worker::Worker(const shared_ptr< const Config >& config, const shared_ptr< download::Method >& method,
		const CancellationToken& token, const shared_ptr< Ledger >& ledger,
		const shared_ptr< const Clock >& clock)
	: __impl(new internal::WorkerImpl(config, method, token, ledger, clock))
{}

Worker::~Worker()
{
	delete __impl;
}

vector< PlanEntry > Worker::plan(Catalog& catalog, const Planner::Observer& observer)
{
	const auto& config = *__impl->config;
	auto& logger = *__impl->logger;

	logger.log(internal::Subsystem::Planner, 1, format2("planning 's3://%s/%s'",
			config.getString("s3::bucket"), config.getString("s3::prefix")));

	Planner planner(Planner::Settings(config), __impl->token, __impl->ledger.get());
	vector< PlanEntry > result;
	try
	{
		result = planner.plan(catalog, observer);
	}
	catch (Exception& e)
	{
		__impl->planCounters = planner.getCounters();
		logger.log(internal::Subsystem::Planner, 1, format2("error: %s", e.what()), true);
		throw;
	}
	__impl->planCounters = planner.getCounters();
	__impl->logPlanCounters();
	if (__impl->token.isRequested())
	{
		logger.log(internal::Subsystem::Planner, 1, "interrupted", true);
	}

	if (__impl->ledger && __impl->ledger->flush(true))
	{
		logger.log(internal::Subsystem::Ledger, 2, "progress file written");
	}
	return result;
}

const Planner::Counters& Worker::getPlanCounters() const
{
	return __impl->planCounters;
}

size_t Worker::cleanup()
{
	const auto& config = *__impl->config;
	auto root = config.getPath("bulkfetch::directory");
	size_t removedCount = 0;
	try
	{
		removedCount = __impl->guard.sweepStaleArtifacts(root,
				config.getUnsigned("bulkfetch::transfer::cleanup-age"));
	}
	catch (Exception&)
	{
		warn2(__("unable to clean up stale temporary files under '%s'"), root);
		return 0;
	}
	if (removedCount)
	{
		__impl->logger->log(internal::Subsystem::Session, 1,
				format2("removed %zu stale temporary files", removedCount));
	}
	return removedCount;
}

Worker::Summary Worker::download(const vector< PlanEntry >& plan,
		const shared_ptr< download::Progress >& progress)
{
	const auto& config = *__impl->config;
	auto& logger = *__impl->logger;
	auto container = config.getString("s3::bucket");

	progress->setTotalCount(plan.size());
	download::ResumableTransfer transfer(__impl->method, download::TransferPolicy(config),
			__impl->guard, __impl->token, *__impl->clock, progress, __impl->debugging);

	Summary summary;
	for (size_t i = 0; i < plan.size(); ++i)
	{
		if (__impl->token.isRequested())
		{
			summary.interrupted = true;
			summary.notAttempted = plan.size() - i;
			break;
		}

		const PlanEntry& entry = plan[i];
		const auto& descriptor = entry.descriptor;
		logger.log(internal::Subsystem::Transfer, 2, format2("downloading '%s' (%s)",
				descriptor.key, humanReadableSizeString(descriptor.size)));

		auto outcome = transfer.run(container, descriptor, entry.localPath);
		auto retrySuffix = format2("%zu network retries, %zu file errors",
				transfer.getNetworkRetryCount(), transfer.getFileErrorCount());
		if (outcome == Outcome::Done)
		{
			++summary.downloaded;
			summary.downloadedBytes += descriptor.size;
			logger.log(internal::Subsystem::Transfer, 1, format2("downloaded '%s' (%s)",
					descriptor.key, retrySuffix));
			if (__impl->ledger)
			{
				__impl->ledger->recordCompleted(descriptor);
			}
		}
		else if (outcome == Outcome::Interrupted)
		{
			logger.log(internal::Subsystem::Transfer, 1,
					format2("interrupted '%s', the partial file is kept", descriptor.key), true);
			summary.interrupted = true;
			summary.notAttempted = plan.size() - i;
			break;
		}
		else
		{
			if (outcome == Outcome::Locked)
			{
				++summary.locked;
			}
			else
			{
				++summary.failed;
			}
			summary.failedKeys.push_back(descriptor.key);
			logger.log(internal::Subsystem::Transfer, 1, format2("error: failed to download '%s': %s (%s)",
					descriptor.key, transfer.getLastError(), retrySuffix), true);
		}
	}
	progress->finish();

	logger.log(internal::Subsystem::Session, 1, format2("downloaded %zu files (%s), failed %zu, locked %zu%s",
			summary.downloaded, humanReadableSizeString(summary.downloadedBytes),
			summary.failed, summary.locked, summary.interrupted ? ", interrupted" : ""));
	return summary;
}

}
}
