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
#include <bulkfetch/common.hpp>

#include <gtest/gtest.h>

namespace bulkfetch {
namespace test {
namespace {

TEST(HumanReadableTest, Sizes)
{
	EXPECT_EQ("0.00 B", humanReadableSizeString(0));
	EXPECT_EQ("150.00 B", humanReadableSizeString(150));
	EXPECT_EQ("1023.00 B", humanReadableSizeString(1023));
	EXPECT_EQ("1.00 KB", humanReadableSizeString(1024));
	EXPECT_EQ("1.50 MB", humanReadableSizeString(1572864));
	EXPECT_EQ("2.00 TB", humanReadableSizeString(uint64_t(2) << 40));
	EXPECT_EQ("2048.00 TB", humanReadableSizeString(uint64_t(2) << 50));
}

TEST(HumanReadableTest, Durations)
{
	EXPECT_EQ("0s", humanReadableDifftimeString(0));
	EXPECT_EQ("1m5s", humanReadableDifftimeString(65));
	EXPECT_EQ("1h0m1s", humanReadableDifftimeString(3601));
	EXPECT_EQ("2d0h0m0s", humanReadableDifftimeString(172800));
}

TEST(TruncateMessageTest, Basic)
{
	EXPECT_EQ("short", truncateMessage("short", 10));
	EXPECT_EQ("exactly10!", truncateMessage("exactly10!", 10));
	EXPECT_EQ("a long ...", truncateMessage("a long message", 10));
	EXPECT_EQ("ab", truncateMessage("abcdef", 2));
}

TEST(JoinTest, Basic)
{
	EXPECT_EQ("", join(", ", {}));
	EXPECT_EQ("a", join(", ", { "a" }));
	EXPECT_EQ("a, b, c", join(", ", { "a", "b", "c" }));
}

}
}
}
