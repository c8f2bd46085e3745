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
#ifndef BULKFETCH_DOWNLOADMETHODS_SIGNER_SEEN
#define BULKFETCH_DOWNLOADMETHODS_SIGNER_SEEN

#include <ctime>
#include <map>

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {
namespace s3 {

struct Credentials
{
	string accessKey;
	string secretKey;
	string sessionToken;

	bool empty() const;
	// s3::access-key and friends, falling back to the AWS_* environment variables
	static Credentials fromConfig(const Config&);
};

// percent-encodes everything except unreserved characters and, unless
// asked, slashes
string uriEncode(const string& input, bool encodeSlash);
string sha256Hex(const string& data);

// canonical (sorted and encoded) query string
string buildQuery(const std::map< string, string >& parameters);

// where requests for a bucket go
struct Address
{
	string scheme;
	string host; ///< with the port, if any
	string basePath; ///< encoded, empty for virtual-hosted buckets

	string getBucketPath() const;
	string getObjectPath(const string& key) const;
	string getUrl(const string& path, const string& query = string()) const;

	// the virtual-hosted AWS endpoint or, if s3::endpoint is set, a path-style one
	static Address forBucket(const Config&, const string& bucket);
};

class Signer
{
	Credentials __credentials;
	string __region;
 public:
	typedef vector< pair< string, string > > Headers;

	Signer(const Credentials&, const string& region);

	/// signs a request with an empty payload (AWS Signature Version 4)
	/**
	 * @param method HTTP method
	 * @param host value of the Host header
	 * @param path canonical (encoded) request path
	 * @param query canonical query string
	 * @param headers headers to sign besides the mandatory ones, like Range
	 * @param now request time
	 * @return headers to add to the request, the Authorization one last
	 */
	Headers sign(const string& method, const string& host, const string& path,
			const string& query, const Headers& headers, time_t now) const;
};

}
}

#endif
