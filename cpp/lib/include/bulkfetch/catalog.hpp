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
#ifndef BULKFETCH_CATALOG_SEEN
#define BULKFETCH_CATALOG_SEEN

/// @file

#include <bulkfetch/common.hpp>

namespace bulkfetch {

/// remote object, as seen in the catalog listing
struct BULKFETCH_API ObjectDescriptor
{
	string key; ///< path-like object name
	uint64_t size; ///< size in bytes
	string etag; ///< content fingerprint, without quotes
	string lastModified; ///< ISO 8601 timestamp, empty if unknown

	ObjectDescriptor();
	ObjectDescriptor(const string& key, uint64_t size, const string& etag);
};

/// lazy enumeration of remote objects
/**
 * The sequence may be very long; callers consume it exactly once.
 */
class BULKFETCH_API Catalog
{
 public:
	virtual ~Catalog();

	/// fetches the next object
	/**
	 * @param [out] descriptor the next object, if any
	 * @return @c false at the end of the catalog
	 *
	 * Throws Exception on enumeration errors.
	 */
	virtual bool next(ObjectDescriptor& descriptor) = 0;
};

}

#endif
