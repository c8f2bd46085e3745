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
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <bulkfetch/file.hpp>

#include <internal/filesystem.hpp>
#include <internal/stagingmeta.hpp>

namespace bulkfetch {
namespace internal {

StagingMeta::StagingMeta()
	: size(0), downloaded(0), timestamp(0)
{}

string StagingMeta::getPath(const string& stagingPath)
{
	return stagingPath + ".meta";
}

bool StagingMeta::load(const string& path)
{
	if (!fs::fileExists(path))
	{
		return false;
	}
	try
	{
		boost::property_tree::ptree tree;
		boost::property_tree::read_json(path, tree);
		etag = tree.get< string >("etag");
		size = tree.get< uint64_t >("size");
		downloaded = tree.get< uint64_t >("downloaded");
		timestamp = tree.get< time_t >("timestamp", 0);
	}
	catch (boost::property_tree::ptree_error&)
	{
		return false;
	}
	return true;
}

void StagingMeta::save(const string& path) const
{
	boost::property_tree::ptree tree;
	tree.put("etag", etag);
	tree.put("size", size);
	tree.put("downloaded", downloaded);
	tree.put("timestamp", timestamp);

	std::ostringstream stream;
	boost::property_tree::write_json(stream, tree, false);

	// written aside and renamed, so a reader sees either the old or the new content
	auto temporaryPath = path + ".new";
	{
		RequiredFile file(temporaryPath, "w");
		file.put(stream.str());
		file.sync();
	}
	if (!fs::move(temporaryPath, path))
	{
		fatal2e(__("unable to rename '%s' to '%s'"), temporaryPath, path);
	}
}

}
}
