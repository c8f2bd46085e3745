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
#include <sys/file.h>

#include <bulkfetch/file.hpp>
#include <bulkfetch/ledger.hpp>

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

typedef PlanEntry::Status Status;

class LedgerTest: public ::testing::Test
{
 protected:
	TemporaryDirectory directory;
	FakeClock clock;
	string path;

	LedgerTest()
		: path(directory / "progress.csv")
	{}
};

TEST_F(LedgerTest, GroupsByFirstFolder)
{
	Ledger ledger(path, "", 1, 10, clock);
	ObjectDescriptor first("a/b/f1", 100, "e1");
	ObjectDescriptor second("a/c/f2", 50, "e2");
	ledger.recordPlanned(first, Status::ToDownload);
	ledger.recordPlanned(second, Status::ToDownload);
	ledger.recordCompleted(first);
	ASSERT_TRUE(ledger.flush(true));

	auto records = ledger.getRecords();
	ASSERT_EQ(1u, records.size());
	const auto& record = records["a"];
	EXPECT_EQ(2u, record.totalFiles);
	EXPECT_EQ(150u, record.totalSize);
	EXPECT_EQ(1u, record.downloadedFiles);
	EXPECT_EQ(100u, record.downloadedSize);
	EXPECT_EQ("in-progress 50%", Ledger::getProgressLabel(record));

	auto content = readFile(path);
	EXPECT_EQ(0u, content.find("folder_path,total_files,total_size_bytes,total_size_human,"
			"downloaded_files,downloaded_size_bytes,downloaded_size_human,progress,last_update\r\n"));
	EXPECT_NE(string::npos, content.find("\r\na,2,150,150.00 B,1,100,100.00 B,in-progress 50%,"));
}

TEST_F(LedgerTest, AlreadyPresentCountsAsDownloaded)
{
	Ledger ledger(path, "tasks", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("tasks/g/1", 10, ""), Status::AlreadyPresent);
	ledger.recordPlanned(ObjectDescriptor("tasks/g/2", 10, ""), Status::AlreadyPresent);
	ledger.recordPlanned(ObjectDescriptor("tasks/h/1", 10, ""), Status::ToDownload);

	auto records = ledger.getRecords();
	EXPECT_EQ("complete", Ledger::getProgressLabel(records["g"]));
	EXPECT_EQ("pending", Ledger::getProgressLabel(records["h"]));

	auto summary = ledger.getSummary();
	EXPECT_EQ(2u, summary.totalFolders);
	EXPECT_EQ(1u, summary.completedFolders);
	EXPECT_EQ(1u, summary.pendingFolders);
	EXPECT_EQ(3u, summary.totalFiles);
	EXPECT_EQ(2u, summary.downloadedFiles);
	EXPECT_EQ(30u, summary.totalSize);
	EXPECT_EQ(20u, summary.downloadedSize);
	EXPECT_EQ(66u, summary.overallPercent);
}

TEST_F(LedgerTest, ProgressLabels)
{
	Ledger::Record record;
	record.totalFiles = 3;
	EXPECT_EQ("pending", Ledger::getProgressLabel(record));
	record.downloadedFiles = 1;
	EXPECT_EQ("in-progress 33%", Ledger::getProgressLabel(record));
	record.downloadedFiles = 3;
	EXPECT_EQ("complete", Ledger::getProgressLabel(record));
}

TEST_F(LedgerTest, GroupKeys)
{
	Ledger shallow("", "tasks", 1, 10, clock);
	EXPECT_EQ("2024", shallow.getGroupKey("tasks/2024/01/file.tif"));
	EXPECT_EQ("2024", shallow.getGroupKey("tasks//2024/file.tif"));
	// a file at the root is a group of its own
	EXPECT_EQ("file.tif", shallow.getGroupKey("tasks/file.tif"));
	EXPECT_EQ("other", shallow.getGroupKey("other/file.tif"));

	Ledger deep("", "tasks", 2, 10, clock);
	EXPECT_EQ("2024/01", deep.getGroupKey("tasks/2024/01/02/file.tif"));
	EXPECT_EQ("2024/01", deep.getGroupKey("tasks/2024/01/file.tif"));
	EXPECT_EQ("2024", deep.getGroupKey("tasks/2024/file.tif"));
}

TEST_F(LedgerTest, FlushIsRateLimited)
{
	Ledger ledger(path, "", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("a/1", 1, ""), Status::ToDownload);

	EXPECT_TRUE(ledger.flush(false));
	EXPECT_FALSE(ledger.flush(false));
	EXPECT_TRUE(ledger.flush(true));
	clock.advance(10);
	EXPECT_TRUE(ledger.flush(false));
}

TEST_F(LedgerTest, DebuggingReportsWrites)
{
	MessageCapture capture(directory / "messages");
	Ledger ledger(path, "", 1, 10, clock, true);
	ledger.recordPlanned(ObjectDescriptor("a/1", 1, ""), Status::ToDownload);

	EXPECT_TRUE(ledger.flush(true));
	EXPECT_NE(string::npos, capture.getMessages().find("wrote the progress file")) << capture.getMessages();
}

TEST_F(LedgerTest, DisabledWithoutPath)
{
	Ledger ledger("", "", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("a/1", 1, ""), Status::ToDownload);
	EXPECT_FALSE(ledger.flush(true));
	EXPECT_EQ(1u, ledger.getSummary().totalFiles);
}

TEST_F(LedgerTest, SnapshotReplacesPreviousContent)
{
	writeFile(path, string(4096, 'z'));
	Ledger ledger(path, "", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("a/1", 1, ""), Status::ToDownload);
	ASSERT_TRUE(ledger.flush(true));

	auto content = readFile(path);
	EXPECT_EQ(string::npos, content.find('z'));
	EXPECT_EQ(ledger.render(), content);
}

TEST_F(LedgerTest, QuotesSpecialCharacters)
{
	Ledger ledger("", "", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("with,comma/1", 1, ""), Status::ToDownload);
	ledger.recordPlanned(ObjectDescriptor("with\"quote/1", 1, ""), Status::ToDownload);

	auto content = ledger.render();
	EXPECT_NE(string::npos, content.find("\r\n\"with,comma\",1,"));
	EXPECT_NE(string::npos, content.find("\r\n\"with\"\"quote\",1,"));
}

TEST_F(LedgerTest, SkipsFlushWhileFileIsLocked)
{
	Ledger ledger(path, "", 1, 10, clock);
	ledger.recordPlanned(ObjectDescriptor("a/1", 1, ""), Status::ToDownload);

	RequiredFile reader(path, "a");
	reader.lock(LOCK_EX);
	EXPECT_FALSE(ledger.flush(true));
	reader.lock(LOCK_UN);
	EXPECT_TRUE(ledger.flush(true));
}

}
}
}
