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
#include <bulkfetch/system/guard.hpp>

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

class GuardTest: public ::testing::Test
{
 protected:
	TemporaryDirectory directory;
	FakeClock clock;
};

TEST_F(GuardTest, LockIsExclusive)
{
	system::Guard guard(clock, 300);
	auto path = directory / "object.tmp";

	ASSERT_TRUE(guard.acquireLock(path));
	EXPECT_EQ(format2("%d\n", (int)getpid()), readFile(path + ".lock"));
	EXPECT_TRUE(guard.isLocked(path));
	EXPECT_FALSE(guard.acquireLock(path));

	guard.releaseLock(path);
	EXPECT_FALSE(exists(path + ".lock"));
	EXPECT_FALSE(guard.isLocked(path));
	EXPECT_TRUE(guard.acquireLock(path));
	guard.releaseLock(path);
}

TEST_F(GuardTest, StaleLockIsRemoved)
{
	system::Guard guard(clock, 300);
	auto path = directory / "object.tmp";
	writeFile(path + ".lock", "12345\n");

	EXPECT_FALSE(guard.isStale(path + ".lock", 300));
	clock.advance(301);
	EXPECT_TRUE(guard.isStale(path + ".lock", 300));
	EXPECT_FALSE(guard.isLocked(path));
	EXPECT_FALSE(exists(path + ".lock"));
}

TEST_F(GuardTest, MissingLockIsNotStale)
{
	system::Guard guard(clock, 300);
	EXPECT_FALSE(guard.isStale(directory / "absent.lock", 0));
}

TEST_F(GuardTest, SweepRemovesOnlyOldUnlockedArtifacts)
{
	ASSERT_EQ(0, mkdir((directory / "sub").c_str(), 0755));
	writeFile(directory / "x.tmp", "x");
	writeFile(directory / "sub/y.tmp.meta", "{}");
	writeFile(directory / "sub/w.tmp.meta.new", "{");
	writeFile(directory / "z.tmp", "z");
	writeFile(directory / "z.tmp.lock", "1\n");
	writeFile(directory / "z.tmp.meta.new", "{");
	writeFile(directory / "keep.bin", "k");

	system::Guard guard(clock, 2000);
	EXPECT_EQ(0u, guard.sweepStaleArtifacts(directory.getPath(), 500));

	clock.advance(1000);
	EXPECT_EQ(3u, guard.sweepStaleArtifacts(directory.getPath(), 500));
	EXPECT_FALSE(exists(directory / "x.tmp"));
	EXPECT_FALSE(exists(directory / "sub/y.tmp.meta"));
	EXPECT_FALSE(exists(directory / "sub/w.tmp.meta.new"));
	EXPECT_TRUE(exists(directory / "z.tmp"));
	EXPECT_TRUE(exists(directory / "z.tmp.meta.new"));
	EXPECT_TRUE(exists(directory / "z.tmp.lock"));
	EXPECT_TRUE(exists(directory / "keep.bin"));
}

TEST_F(GuardTest, SweepOfMissingDirectoryIsNoop)
{
	system::Guard guard(clock, 300);
	EXPECT_EQ(0u, guard.sweepStaleArtifacts(directory / "absent", 0));
}

TEST_F(GuardTest, SpaceCheck)
{
	FakeGuard guard(clock);
	guard.setFreeSpace({ 100 });
	EXPECT_TRUE(guard.checkSpace(directory.getPath(), 100));
	EXPECT_FALSE(guard.checkSpace(directory.getPath(), 101));
}

TEST_F(GuardTest, WritableDirectoryIsCreated)
{
	auto path = directory / "new/output";
	system::Guard::checkWritableDirectory(path);
	EXPECT_TRUE(exists(path));
	EXPECT_FALSE(exists(path + "/.write_test"));
}

TEST_F(GuardTest, UnwritableDirectoryIsRejected)
{
	writeFile(directory / "file", "");
	EXPECT_THROW(system::Guard::checkWritableDirectory(directory / "file/output"), Exception);
}

}
}
}
