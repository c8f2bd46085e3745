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
#ifndef BULKFETCH_DOWNLOADMETHODS_S3_SEEN
#define BULKFETCH_DOWNLOADMETHODS_S3_SEEN

/// @file

#include <bulkfetch/catalog.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {

namespace internal {

class S3CatalogImpl;

}

namespace s3 {

/// libcurl transport for S3 objects
/**
 * Uses the s3:: and acquire:: options of @a config. Requests are signed only
 * if credentials are configured.
 */
shared_ptr< download::Method > createCurlMethod(const shared_ptr< const Config >& config);

/// one page of a ListObjectsV2 reply
struct ListingPage
{
	vector< ObjectDescriptor > objects;
	bool truncated;
	string continuationToken;

	ListingPage();
};

/// parses a ListObjectsV2 XML document, throws Exception if it is malformed
ListingPage parseListingPage(const string& xml);

/// lists a bucket with ListObjectsV2, page after page as the caller consumes it
class S3Catalog: public Catalog
{
	internal::S3CatalogImpl* __impl;

	S3Catalog(const S3Catalog&);
	S3Catalog& operator=(const S3Catalog&);
 public:
	/// constructor
	/**
	 * @param config configuration
	 * @param bucket bucket name
	 * @param prefix only keys with this prefix are listed
	 */
	S3Catalog(const shared_ptr< const Config >& config, const string& bucket, const string& prefix);
	~S3Catalog();

	bool next(ObjectDescriptor&);
};

}
}

#endif
