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
#ifndef BULKFETCH_INTERNAL_STAGINGMETA_SEEN
#define BULKFETCH_INTERNAL_STAGINGMETA_SEEN

#include <ctime>

#include <bulkfetch/common.hpp>

namespace bulkfetch {
namespace internal {

// companion of a staging file, describing what the staging file holds
struct StagingMeta
{
	string etag;
	uint64_t size; // expected size of the whole object
	uint64_t downloaded; // bytes in the staging file
	time_t timestamp;

	StagingMeta();

	static string getPath(const string& stagingPath);

	// returns false if the file is absent or unreadable
	bool load(const string& path);
	void save(const string& path) const;
};

}
}

#endif
