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
#include <bulkfetch/download/transfer.hpp>
#include <bulkfetch/system/shutdown.hpp>

#include <internal/stagingmeta.hpp>

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

using download::ResumableTransfer;
using download::TransferError;
typedef ResumableTransfer::Outcome Outcome;
typedef ScriptedMethod::Step Step;

string makeContent(size_t size)
{
	string result;
	for (size_t i = 0; i < size; ++i)
	{
		result += char('a' + i % 26);
	}
	return result;
}

class TransferTest: public ::testing::Test
{
 protected:
	TemporaryDirectory directory;
	FakeClock clock;
	FakeGuard guard;
	system::CancellationToken token;
	shared_ptr< ScriptedMethod > method;
	shared_ptr< RecordingProgress > progress;
	download::TransferPolicy policy;

	TransferTest()
		: guard(clock)
		, method(std::make_shared< ScriptedMethod >())
		, progress(std::make_shared< RecordingProgress >())
	{
		policy.minFreeSpace = 0;
	}

	ObjectDescriptor addObject(const string& key, const string& content, const string& etag = "abc123")
	{
		method->contents[key] = content;
		return ObjectDescriptor(key, content.size(), etag);
	}
	string getLocalPath(const ObjectDescriptor& descriptor) const
	{
		return directory / descriptor.key;
	}
	string getStagingPath(const ObjectDescriptor& descriptor) const
	{
		return getLocalPath(descriptor) + ".tmp";
	}
	vector< uint64_t > getRequestedOffsets() const
	{
		vector< uint64_t > result;
		for (const auto& request: method->requests)
		{
			result.push_back(request.offset);
		}
		return result;
	}
	void writeStaging(const ObjectDescriptor& descriptor, const string& data, const string& etag)
	{
		writeFile(getStagingPath(descriptor), data);
		internal::StagingMeta meta;
		meta.etag = etag;
		meta.size = descriptor.size;
		meta.downloaded = data.size();
		meta.save(getStagingPath(descriptor) + ".meta");
	}
};

TEST_F(TransferTest, DownloadsAndPromotes)
{
	auto content = makeContent(64);
	auto descriptor = addObject("tasks/one/image.tif", content);
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ(ResumableTransfer::State::Done, transfer.getState());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
	EXPECT_FALSE(exists(getStagingPath(descriptor)));
	EXPECT_FALSE(exists(getStagingPath(descriptor) + ".meta"));
	EXPECT_FALSE(exists(getStagingPath(descriptor) + ".lock"));

	ASSERT_EQ(1u, method->requests.size());
	EXPECT_EQ("bucket", method->requests[0].container);
	EXPECT_EQ(0u, method->requests[0].offset);
	EXPECT_EQ("", progress->results[descriptor.key]);
}

TEST_F(TransferTest, TransientErrorsBackOffAndResume)
{
	auto content = makeContent(100);
	auto descriptor = addObject("a/b.bin", content);
	method->steps = {
		Step::fail(10, TransferError::Kind::Network, "connection reset by peer"),
		Step::fail(20, TransferError::Kind::Network, "connection reset by peer"),
		Step::fail(0, TransferError::Kind::Network, "timed out"),
		Step::serve()
	};
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
	EXPECT_EQ(3u, transfer.getNetworkRetryCount());
	EXPECT_EQ(0u, transfer.getFileErrorCount());

	// the partial data survives between attempts
	EXPECT_EQ((vector< uint64_t >{ 0, 10, 30, 30 }), getRequestedOffsets());

	const auto& retries = progress->retries[descriptor.key];
	ASSERT_EQ(3u, retries.size());
	vector< size_t > delays;
	for (const auto& retry: retries)
	{
		EXPECT_TRUE(retry.transient);
		delays.push_back(retry.delay);
	}
	EXPECT_EQ((vector< size_t >{ 5, 10, 30 }), delays);
	EXPECT_EQ(45u, clock.getSleptTime());
}

TEST_F(TransferTest, NetworkErrorsCheckReachability)
{
	auto content = makeContent(40);
	auto descriptor = addObject("a/c.bin", content);
	method->reachable = false;
	method->steps = {
		Step::fail(10, TransferError::Kind::Network, "could not resolve host"),
		Step::failStore("", 503),
		Step::serve()
	};
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
	// a reply from the store proves it is reachable
	EXPECT_EQ(1u, method->reachabilityChecks);

	const auto& retries = progress->retries[descriptor.key];
	ASSERT_EQ(2u, retries.size());
	EXPECT_TRUE(retries[0].transient);
	EXPECT_FALSE(retries[0].reachable);
	EXPECT_TRUE(retries[1].transient);
	EXPECT_TRUE(retries[1].reachable);
}

TEST_F(TransferTest, PerformReportsSuccess)
{
	auto content = makeContent(30);
	addObject("a/plain.bin", content, "e1");
	auto localPath = directory / "a/plain.bin";
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_TRUE(transfer.perform("bucket", "a/plain.bin", localPath, content.size(), "e1"));
	EXPECT_EQ(content, readFile(localPath));
}

TEST_F(TransferTest, PerformReportsFailure)
{
	auto content = makeContent(30);
	addObject("a/missing.bin", content);
	auto notFound = std::make_shared< TransferError >(
			TransferError::fromStore("NoSuchKey", 404, "The specified key does not exist."));
	method->steps = { Step{ 0, notFound }, Step{ 0, notFound }, Step{ 0, notFound } };
	auto localPath = directory / "a/missing.bin";
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_FALSE(transfer.perform("bucket", "a/missing.bin", localPath, content.size(), "abc123"));
	EXPECT_FALSE(exists(localPath));
}

TEST_F(TransferTest, PermanentErrorsAbandonTheObject)
{
	auto content = makeContent(50);
	auto failing = addObject("a/denied.bin", content);
	auto accessDenied = std::make_shared< TransferError >(
			TransferError::fromStore("AccessDenied", 403, "Access Denied"));
	method->steps = { Step{ 10, accessDenied }, Step{ 10, accessDenied }, Step{ 10, accessDenied } };
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Failed, transfer.run("bucket", failing, getLocalPath(failing)));
	EXPECT_EQ(3u, transfer.getFileErrorCount());
	EXPECT_FALSE(exists(getLocalPath(failing)));
	EXPECT_FALSE(exists(getStagingPath(failing)));
	EXPECT_FALSE(exists(getStagingPath(failing) + ".meta"));
	EXPECT_FALSE(exists(getStagingPath(failing) + ".lock"));
	// every attempt starts from scratch
	EXPECT_EQ((vector< uint64_t >{ 0, 0, 0 }), getRequestedOffsets());

	const auto& retries = progress->retries[failing.key];
	ASSERT_EQ(3u, retries.size());
	EXPECT_FALSE(retries[2].transient);
	EXPECT_EQ(3u, retries[2].attempt);
	EXPECT_EQ(3u, retries[2].limit);
	EXPECT_EQ(10u, clock.getSleptTime());
	EXPECT_NE("", progress->results[failing.key]);

	// the batch goes on
	auto next = addObject("a/next.bin", makeContent(20));
	EXPECT_EQ(Outcome::Done, transfer.run("bucket", next, getLocalPath(next)));
	EXPECT_EQ(0u, transfer.getFileErrorCount());
}

TEST_F(TransferTest, ResumesFromValidStagingFile)
{
	auto content = makeContent(100);
	auto descriptor = addObject("resume.bin", content);
	writeStaging(descriptor, content.substr(0, 40), "abc123");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 40 }), getRequestedOffsets());
	EXPECT_EQ((vector< uint64_t >{ 40 }), progress->offsets[descriptor.key]);
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, CompleteStagingFileIsPromotedWithoutRequests)
{
	auto content = makeContent(30);
	auto descriptor = addObject("complete.bin", content);
	writeStaging(descriptor, content, "abc123");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_TRUE(method->requests.empty());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, StagingFileWithoutCompanionIsResumed)
{
	auto content = makeContent(100);
	auto descriptor = addObject("crashed.bin", content);
	writeFile(getStagingPath(descriptor), content.substr(0, 60));
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 60 }), getRequestedOffsets());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
	EXPECT_FALSE(exists(getStagingPath(descriptor) + ".meta"));
}

TEST_F(TransferTest, OversizedStagingFileWithoutCompanionIsDiscarded)
{
	auto content = makeContent(100);
	auto descriptor = addObject("oversized.bin", content);
	writeFile(getStagingPath(descriptor), string(120, '#'));
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 0 }), getRequestedOffsets());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, CompanionDisagreeingWithStagingSizeIsDiscarded)
{
	auto content = makeContent(100);
	auto descriptor = addObject("disagreeing.bin", content);
	writeStaging(descriptor, content.substr(0, 40), "abc123");
	// the staging file grew after the companion was written
	writeFile(getStagingPath(descriptor), content.substr(0, 55));
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 0 }), getRequestedOffsets());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, StagingFileOfAnotherVersionIsDiscarded)
{
	auto content = makeContent(100);
	auto descriptor = addObject("changed.bin", content, "new-etag");
	writeStaging(descriptor, string(40, '#'), "old-etag");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 0 }), getRequestedOffsets());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, CorruptCompanionIsDiscarded)
{
	auto content = makeContent(100);
	auto descriptor = addObject("corrupt.bin", content);
	writeFile(getStagingPath(descriptor), content.substr(0, 40));
	writeFile(getStagingPath(descriptor) + ".meta", "{ \"etag\": ");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 0 }), getRequestedOffsets());
}

TEST_F(TransferTest, LockedObjectIsSkipped)
{
	auto descriptor = addObject("locked.bin", makeContent(10));
	auto lockPath = getStagingPath(descriptor) + ".lock";
	writeFile(lockPath, "1\n");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Locked, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_TRUE(method->requests.empty());
	// somebody else's lock stays
	EXPECT_TRUE(exists(lockPath));
	EXPECT_FALSE(exists(getLocalPath(descriptor)));
}

TEST_F(TransferTest, StaleLockIsReclaimed)
{
	auto descriptor = addObject("stale.bin", makeContent(10));
	writeFile(getStagingPath(descriptor) + ".lock", "1\n");
	clock.advance(1000);
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_FALSE(exists(getStagingPath(descriptor) + ".lock"));
}

TEST_F(TransferTest, WaitsForDiskSpace)
{
	auto descriptor = addObject("big.bin", makeContent(10));
	guard.setFreeSpace({ 0, 0, uint64_t(1) << 40 });
	policy.diskWait = 60;
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ(120u, clock.getSleptTime());
	EXPECT_EQ(1u, method->requests.size());
}

TEST_F(TransferTest, InterruptionKeepsStagingFileForResume)
{
	auto content = makeContent(100);
	auto descriptor = addObject("interrupted.bin", content);
	method->steps = { Step{ 10, shared_ptr< TransferError >() } };
	method->onRequest = [this]() { token.request(); };

	{
		ResumableTransfer transfer(method, policy, guard, token, clock, progress);
		EXPECT_EQ(Outcome::Interrupted, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	}
	EXPECT_FALSE(exists(getLocalPath(descriptor)));
	EXPECT_EQ(content.substr(0, 10), readFile(getStagingPath(descriptor)));
	EXPECT_FALSE(exists(getStagingPath(descriptor) + ".lock"));
	internal::StagingMeta meta;
	ASSERT_TRUE(meta.load(getStagingPath(descriptor) + ".meta"));
	EXPECT_EQ(10u, meta.downloaded);
	EXPECT_EQ("abc123", meta.etag);

	// the next run continues where this one stopped
	system::CancellationToken freshToken;
	method->onRequest = nullptr;
	method->requests.clear();
	ResumableTransfer transfer(method, policy, guard, freshToken, clock, progress);
	EXPECT_EQ(Outcome::Done, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ((vector< uint64_t >{ 10 }), getRequestedOffsets());
	EXPECT_EQ(content, readFile(getLocalPath(descriptor)));
}

TEST_F(TransferTest, GivesUpAfterRetryTimeCeiling)
{
	auto descriptor = addObject("flaky.bin", makeContent(10));
	for (size_t i = 0; i < 10; ++i)
	{
		method->steps.push_back(Step::fail(0, TransferError::Kind::Network, "connection refused"));
	}
	policy.maxRetryTime = 20;
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Failed, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	// 5 + 10 + 30 seconds passed after three errors
	EXPECT_EQ(3u, method->requests.size());
	EXPECT_NE(string::npos, transfer.getLastError().find("giving up"));
}

TEST_F(TransferTest, SizeMismatchIsPermanent)
{
	auto content = makeContent(10);
	addObject("short.bin", content);
	ObjectDescriptor descriptor("short.bin", 15, "abc123");
	ResumableTransfer transfer(method, policy, guard, token, clock, progress);

	EXPECT_EQ(Outcome::Failed, transfer.run("bucket", descriptor, getLocalPath(descriptor)));
	EXPECT_EQ(3u, transfer.getFileErrorCount());
	EXPECT_FALSE(exists(getStagingPath(descriptor)));
}

TEST(TransferPolicyTest, ReadsConfiguration)
{
	Config config;
	config.clearList("bulkfetch::transfer::retry-delays");
	config.setList("bulkfetch::transfer::retry-delays", "2");
	config.setList("bulkfetch::transfer::retry-delays", "7");
	config.setScalar("bulkfetch::transfer::lock-stale-age", "100");
	config.setScalar("bulkfetch::transfer::max-file-retries", "5");

	download::TransferPolicy policy(config);
	EXPECT_EQ(2u, policy.getRetryDelay(1));
	EXPECT_EQ(7u, policy.getRetryDelay(2));
	EXPECT_EQ(7u, policy.getRetryDelay(10));
	EXPECT_EQ(20u, policy.lockRefreshInterval);
	EXPECT_EQ(5u, policy.maxFileRetries);
	EXPECT_EQ(172800u, policy.maxRetryTime);
}

TEST(TransferPolicyTest, DefaultScheduleRepeatsLastDelay)
{
	download::TransferPolicy policy;
	EXPECT_EQ(5u, policy.getRetryDelay(1));
	EXPECT_EQ(300u, policy.getRetryDelay(5));
	EXPECT_EQ(300u, policy.getRetryDelay(6));
}

}
}
}
