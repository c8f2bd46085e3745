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
#include <iostream>
using std::cout;
using std::endl;

#include <bulkfetch/clock.hpp>
#include <bulkfetch/ledger.hpp>
#include <bulkfetch/planner.hpp>
#include <bulkfetch/system/shutdown.hpp>
#include <bulkfetch/system/worker.hpp>

#include <downloadmethods/s3.hpp>

#include "../handlers.hpp"

namespace {

void printPlanTotals(const Config& config, const Planner::Counters& counters)
{
	cout << format2(__("To download: %zu files, %s (cap %s)"), counters.selected,
			humanReadableSizeString(counters.plannedBytes),
			humanReadableSizeString(config.getUnsigned("bulkfetch::planner::cap-bytes"))) << endl;
	cout << format2(__("Already present, skipped: %zu"), counters.alreadyPresent) << endl;
	if (counters.rejected)
	{
		cout << format2(__("Unsafe keys, skipped: %zu"), counters.rejected) << endl;
	}
}

void printLedgerSummary(const Ledger& ledger)
{
	auto summary = ledger.getSummary();
	string separator(80, '=');

	cout << endl << separator << endl;
	cout << __("Per-folder download progress") << endl;
	cout << separator << endl;
	cout << format2(__("Folders: %zu"), summary.totalFolders) << endl;
	cout << format2(__("  complete: %zu"), summary.completedFolders) << endl;
	cout << format2(__("  pending: %zu"), summary.pendingFolders) << endl;
	cout << endl;
	cout << format2(__("Files: %llu"), (unsigned long long)summary.totalFiles) << endl;
	cout << format2(__("  downloaded: %llu"), (unsigned long long)summary.downloadedFiles) << endl;
	cout << format2(__("  overall progress: %u%%"), summary.overallPercent) << endl;
	cout << endl;
	cout << format2(__("Total size: %s"), humanReadableSizeString(summary.totalSize)) << endl;
	cout << format2(__("  downloaded: %s"), humanReadableSizeString(summary.downloadedSize)) << endl;
	cout << separator << endl;
}

int dryRun(const shared_ptr< const Config >& config, system::Worker& worker, Catalog& catalog)
{
	cout << __("=== DRY RUN ===") << endl;

	size_t shownCount = 0;
	auto maxShownCount = config->getUnsigned("bulkfetch::planner::dry-run::shown");
	auto plan = worker.plan(catalog, [&shownCount, maxShownCount](const PlanEntry& entry)
	{
		if (entry.status == PlanEntry::Status::ToDownload && shownCount < maxShownCount)
		{
			cout << format2(" - %s -> %s", entry.descriptor.key,
					humanReadableSizeString(entry.descriptor.size)) << endl;
			++shownCount;
		}
	});

	printPlanTotals(*config, worker.getPlanCounters());
	if (plan.size() > shownCount)
	{
		cout << format2(__("... %zu more not shown"), plan.size() - shownCount) << endl;
	}
	return 0;
}

}

int download(Context& context)
{
	shared_ptr< const Config > config = context.getConfig();
	auto prefix = config->getString("s3::prefix");
	auto clock = std::make_shared< Clock >();
	bool isDryRun = config->getBool("bulkfetch::planner::dry-run");

	shared_ptr< Ledger > ledger;
	// declared after the ledger and the clock, so is destroyed before them
	unique_ptr< system::ScopedForcedExitAction > forcedExitAction;
	auto ledgerPath = config->getPath("bulkfetch::ledger::path");
	if (!ledgerPath.empty() && !isDryRun)
	{
		auto depth = config->getUnsigned("bulkfetch::ledger::depth");
		ledger = std::make_shared< Ledger >(ledgerPath, prefix, depth,
				config->getUnsigned("bulkfetch::ledger::flush-interval"), *clock,
				config->getBool("debug::ledger"));
		// runs on the second interrupt, from the signal thread
		forcedExitAction.reset(new system::ScopedForcedExitAction(context.shutdownCoordinator,
				[ledger]() { ledger->flush(true); }));
		cout << format2(__("Using the progress file '%s' (folder depth %zu)."), ledgerPath, size_t(depth)) << endl;
	}

	s3::S3Catalog catalog(config, config->getString("s3::bucket"), prefix);
	system::Worker worker(config, s3::createCurlMethod(config), context.token, ledger, clock);

	if (isDryRun)
	{
		return dryRun(config, worker, catalog);
	}

	cout << __("Planning...") << endl;
	vector< PlanEntry > plan;
	try
	{
		plan = worker.plan(catalog);
	}
	catch (Exception&)
	{
		if (ledger)
		{
			ledger->flush(true);
		}
		fatal2(__("unable to plan the download"));
	}
	printPlanTotals(*config, worker.getPlanCounters());
	if (ledger)
	{
		printLedgerSummary(*ledger);
	}

	cout << __("Cleaning up stale temporary files...") << endl;
	auto removedCount = worker.cleanup();
	if (removedCount)
	{
		cout << format2(__("Removed %zu stale temporary files."), removedCount) << endl;
	}

	if (context.token.isRequested())
	{
		cout << __("Interrupted, nothing was downloaded.") << endl;
		return 0;
	}

	auto summary = worker.download(plan, getDownloadProgress(*config));

	if (ledger)
	{
		ledger->flush(true);
		printLedgerSummary(*ledger);
	}
	cout << endl << format2(__("Finished: downloaded %zu files (%s), skipped %zu already present, failed %zu"),
			summary.downloaded, humanReadableSizeString(summary.downloadedBytes),
			worker.getPlanCounters().alreadyPresent, summary.failed + summary.locked) << endl;
	if (summary.locked)
	{
		cout << format2(__("%zu files were locked by another process."), summary.locked) << endl;
	}
	if (summary.interrupted)
	{
		cout << format2(__("Interrupted: %zu files were not attempted, partial downloads are kept for resuming."),
				summary.notAttempted) << endl;
	}
	return 0;
}
