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

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

TEST(ConfigTest, Defaults)
{
	Config config;
	EXPECT_EQ("umbra-open-data-catalog", config.getString("s3::bucket"));
	EXPECT_EQ("sar-data/tasks", config.getString("s3::prefix"));
	EXPECT_EQ(3u, config.getUnsigned("bulkfetch::transfer::max-file-retries"));
	EXPECT_EQ(172800u, config.getUnsigned("bulkfetch::transfer::max-retry-time"));
	EXPECT_EQ((vector< string > { "5", "10", "30", "60", "300" }),
			config.getList("bulkfetch::transfer::retry-delays"));
	EXPECT_TRUE(config.getList("bulkfetch::planner::exclude").empty());
	EXPECT_FALSE(config.getBool("bulkfetch::planner::dry-run"));
	EXPECT_EQ(0u, config.getString("acquire::user-agent").find("bulkfetch/"));
}

TEST(ConfigTest, ReadsInfoFile)
{
	TemporaryDirectory directory;
	auto path = directory / "bulkfetch.conf";
	writeFile(path,
			"s3\n"
			"{\n"
			"  bucket my-bucket\n"
			"  region eu-central-1\n"
			"}\n"
			"bulkfetch\n"
			"{\n"
			"  planner\n"
			"  {\n"
			"    exclude .xml\n"
			"    exclude .json\n"
			"  }\n"
			"  ledger::depth 2\n"
			"}\n"
			"other::something ignored\n");

	Config config;
	config.setList("bulkfetch::planner::exclude", ".txt");
	config.readFile(path);

	EXPECT_EQ("my-bucket", config.getString("s3::bucket"));
	EXPECT_EQ("eu-central-1", config.getString("s3::region"));
	EXPECT_EQ(2, config.getInteger("bulkfetch::ledger::depth"));
	EXPECT_EQ((vector< string > { ".txt", ".xml", ".json" }),
			config.getList("bulkfetch::planner::exclude"));
}

TEST(ConfigTest, MalformedFileIsRejected)
{
	TemporaryDirectory directory;
	auto path = directory / "broken.conf";
	writeFile(path, "s3\n{\n  bucket x\n");

	Config config;
	EXPECT_THROW(config.readFile(path), Exception);
}

TEST(ConfigTest, RelativePathsAreResolvedAgainstParent)
{
	Config config;
	config.setScalar("bulkfetch::directory", "/srv/data");
	EXPECT_EQ("/srv/data/bulkfetch.log", config.getPath("bulkfetch::directory::log"));

	config.setScalar("bulkfetch::directory::log", "/var/log/bulkfetch.log");
	EXPECT_EQ("/var/log/bulkfetch.log", config.getPath("bulkfetch::directory::log"));

	config.setScalar("bulkfetch::ledger::path", "report.csv");
	EXPECT_EQ("report.csv", config.getPath("bulkfetch::ledger::path"));
}

TEST(ConfigTest, OptionNamesAreCaseInsensitiveOnWrite)
{
	Config config;
	config.setScalar("S3::Bucket", "other");
	EXPECT_EQ("other", config.getString("s3::bucket"));

	config.clearList("BULKFETCH::transfer::retry-delays");
	config.setList("bulkfetch::Transfer::Retry-Delays", "1");
	EXPECT_EQ(vector< string > { "1" }, config.getList("bulkfetch::transfer::retry-delays"));
}

TEST(ConfigTest, NonAsciiOptionNamesAreLeftAlone)
{
	Config config;
	config.setScalar("S3::Bucket\xc3\x89", "other");
	config.setScalar("s3::\xff\x80", "other");
	EXPECT_EQ("umbra-open-data-catalog", config.getString("s3::bucket"));
	EXPECT_THROW(config.getString("s3::bucket\xc3\x89"), Exception);
}

TEST(ConfigTest, WrongOptions)
{
	Config config;
	EXPECT_THROW(config.getString("s3::no-such-option"), Exception);
	EXPECT_THROW(config.getList("s3::bucket"), Exception);

	config.setScalar("bulkfetch::transfer::disk-wait", "-5");
	EXPECT_THROW(config.getUnsigned("bulkfetch::transfer::disk-wait"), Exception);
	EXPECT_EQ(-5, config.getInteger("bulkfetch::transfer::disk-wait"));

	config.setScalar("bulkfetch::transfer::disk-wait", "soon");
	EXPECT_THROW(config.getInteger("bulkfetch::transfer::disk-wait"), Exception);
}

TEST(ConfigTest, CopiesAreIndependent)
{
	Config config;
	Config copy(config);
	copy.setScalar("s3::bucket", "copy");
	EXPECT_EQ("umbra-open-data-catalog", config.getString("s3::bucket"));

	config = copy;
	EXPECT_EQ("copy", config.getString("s3::bucket"));
}

}
}
}
