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
#include <bulkfetch/config.hpp>
#include <bulkfetch/ledger.hpp>
#include <bulkfetch/system/shutdown.hpp>
#include <bulkfetch/system/worker.hpp>

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

using download::TransferError;
typedef ScriptedMethod::Step Step;

class WorkerTest: public ::testing::Test
{
 protected:
	TemporaryDirectory directory;
	shared_ptr< Config > config;
	shared_ptr< ScriptedMethod > method;
	shared_ptr< FakeClock > clock;
	shared_ptr< RecordingProgress > progress;
	system::CancellationToken token;

	void SetUp()
	{
		config = std::make_shared< Config >();
		config->setScalar("s3::bucket", "bucket");
		config->setScalar("s3::prefix", "tasks");
		config->setScalar("bulkfetch::directory", directory.getPath());
		config->setScalar("bulkfetch::worker::log", "no");
		config->setScalar("bulkfetch::transfer::min-free-space", "0");

		method = std::make_shared< ScriptedMethod >();
		method->contents["tasks/a/1.bin"] = "0123456789";
		method->contents["tasks/b/2.bin"] = "abcde";
		clock = std::make_shared< FakeClock >();
		progress = std::make_shared< RecordingProgress >();
	}

	vector< ObjectDescriptor > getObjects() const
	{
		return { ObjectDescriptor("tasks/a/1.bin", 10, "e1"), ObjectDescriptor("tasks/b/2.bin", 5, "e2") };
	}
};

TEST_F(WorkerTest, PlansAndDownloads)
{
	auto ledger = std::make_shared< Ledger >("", "tasks", 1, 10, *clock);
	system::Worker worker(config, method, token, ledger, clock);

	VectorCatalog catalog(getObjects());
	auto plan = worker.plan(catalog);
	ASSERT_EQ(2u, plan.size());
	EXPECT_EQ(2u, worker.getPlanCounters().selected);
	EXPECT_EQ(15u, worker.getPlanCounters().plannedBytes);

	auto summary = worker.download(plan, progress);
	EXPECT_EQ(2u, summary.downloaded);
	EXPECT_EQ(15u, summary.downloadedBytes);
	EXPECT_EQ(0u, summary.failed);
	EXPECT_FALSE(summary.interrupted);
	EXPECT_EQ("0123456789", readFile(directory / "a/1.bin"));
	EXPECT_EQ("abcde", readFile(directory / "b/2.bin"));

	auto ledgerSummary = ledger->getSummary();
	EXPECT_EQ(2u, ledgerSummary.completedFolders);
	EXPECT_EQ(100u, ledgerSummary.overallPercent);
}

TEST_F(WorkerTest, FailedObjectDoesNotStopTheRun)
{
	config->setScalar("bulkfetch::transfer::max-file-retries", "2");
	method->steps = { Step::failStore("NoSuchKey", 404), Step::failStore("NoSuchKey", 404), Step::serve() };
	system::Worker worker(config, method, token, shared_ptr< Ledger >(), clock);

	VectorCatalog catalog(getObjects());
	auto summary = worker.download(worker.plan(catalog), progress);
	EXPECT_EQ(1u, summary.downloaded);
	EXPECT_EQ(1u, summary.failed);
	EXPECT_EQ(vector< string > { "tasks/a/1.bin" }, summary.failedKeys);
	EXPECT_FALSE(exists(directory / "a/1.bin"));
	EXPECT_EQ("abcde", readFile(directory / "b/2.bin"));
}

TEST_F(WorkerTest, StopRequestLeavesTheRestUnattempted)
{
	system::Worker worker(config, method, token, shared_ptr< Ledger >(), clock);
	VectorCatalog catalog(getObjects());
	auto plan = worker.plan(catalog);

	token.request();
	auto summary = worker.download(plan, progress);
	EXPECT_TRUE(summary.interrupted);
	EXPECT_EQ(2u, summary.notAttempted);
	EXPECT_EQ(0u, summary.downloaded);
	EXPECT_TRUE(method->requests.empty());
}

TEST_F(WorkerTest, CleanupRemovesAbandonedStagingFiles)
{
	ASSERT_EQ(0, mkdir((directory / "a").c_str(), 0755));
	writeFile(directory / "a/old.bin.tmp", "x");
	config->setScalar("bulkfetch::transfer::cleanup-age", "100");
	system::Worker worker(config, method, token, shared_ptr< Ledger >(), clock);

	EXPECT_EQ(0u, worker.cleanup());
	clock->advance(200);
	EXPECT_EQ(1u, worker.cleanup());
	EXPECT_FALSE(exists(directory / "a/old.bin.tmp"));
}

TEST_F(WorkerTest, WritesSessionLog)
{
	config->setScalar("bulkfetch::worker::log", "yes");
	{
		system::Worker worker(config, method, token, shared_ptr< Ledger >(), clock);
		VectorCatalog catalog(getObjects());
		worker.download(worker.plan(catalog), progress);
	}
	auto log = readFile(directory / "bulkfetch.log");
	EXPECT_NE(string::npos, log.find("planning 's3://bucket/tasks'"));
	EXPECT_NE(string::npos, log.find("downloaded 'tasks/b/2.bin'"));
}

}
}
}
