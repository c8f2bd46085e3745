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
#include <deque>
#include <map>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <bulkfetch/config.hpp>

#include <internal/common.hpp>

#include <downloadmethods/curlwrapper.hpp>
#include <downloadmethods/s3.hpp>
#include <downloadmethods/signer.hpp>

namespace bulkfetch {

namespace s3 {

ListingPage::ListingPage()
	: truncated(false)
{}

ListingPage parseListingPage(const string& xml)
{
	using boost::property_tree::ptree;

	ListingPage result;
	try
	{
		ptree tree;
		std::istringstream stream(xml);
		boost::property_tree::read_xml(stream, tree);

		const ptree& root = tree.get_child("ListBucketResult");
		for (const auto& child: root)
		{
			if (child.first != "Contents")
			{
				continue;
			}
			ObjectDescriptor descriptor;
			descriptor.key = child.second.get< string >("Key");
			descriptor.size = child.second.get< uint64_t >("Size");
			descriptor.lastModified = child.second.get< string >("LastModified", "");

			string etag = internal::trim(child.second.get< string >("ETag", ""));
			if (etag.size() >= 2 && etag[0] == '"' && etag[etag.size()-1] == '"')
			{
				etag = etag.substr(1, etag.size() - 2);
			}
			descriptor.etag = etag;

			result.objects.push_back(std::move(descriptor));
		}
		result.truncated = (root.get< string >("IsTruncated", "false") == "true");
		result.continuationToken = root.get< string >("NextContinuationToken", "");
	}
	catch (boost::property_tree::ptree_error& e)
	{
		fatal2(__("malformed bucket listing: %s"), e.what());
	}
	if (result.truncated && result.continuationToken.empty())
	{
		fatal2(__("malformed bucket listing: a truncated page without a continuation token"));
	}
	return result;
}

}

namespace internal {

namespace {

size_t appendToString(char* data, size_t size, size_t nmemb, void* userData)
{
	size *= nmemb;
	static_cast< string* >(userData)->append(data, size);
	return size;
}

}

class S3CatalogImpl
{
	string __request_page();
 public:
	shared_ptr< const Config > config;
	string bucket;
	string prefix;
	s3::Credentials credentials;
	s3::Signer signer;
	s3::Address address;
	bool debugging;

	std::deque< ObjectDescriptor > pending;
	string continuationToken;
	bool finished;
	size_t pageCount;

	S3CatalogImpl(const shared_ptr< const Config >&, const string&, const string&);
	void fetchPage();
};

S3CatalogImpl::S3CatalogImpl(const shared_ptr< const Config >& config_,
		const string& bucket_, const string& prefix_)
	: config(config_), bucket(bucket_), prefix(prefix_)
	, credentials(s3::Credentials::fromConfig(*config_))
	, signer(credentials, config_->getString("s3::region"))
	, address(s3::Address::forBucket(*config_, bucket_))
	, debugging(config_->getBool("debug::downloader"))
	, finished(false), pageCount(0)
{}

string S3CatalogImpl::__request_page()
{
	std::map< string, string > parameters = {
		{ "list-type", "2" },
		{ "prefix", prefix },
		{ "max-keys", format2("%zu", size_t(config->getUnsigned("s3::max-keys"))) }
	};
	if (!continuationToken.empty())
	{
		parameters["continuation-token"] = continuationToken;
	}
	auto query = s3::buildQuery(parameters);
	auto path = address.getBucketPath();

	s3::CurlWrapper curl(*config);
	curl.setOption(CURLOPT_URL, address.getUrl(path, query), "uri");
	string body;
	curl.setWriter(appendToString, &body);

	auto transientErrorsLeft = config->getInteger("acquire::retries");
	while (true)
	{
		body.clear();
		s3::Signer::Headers headers;
		if (!credentials.empty())
		{
			headers = signer.sign("GET", address.host, path, query, headers, time(NULL));
		}
		curl.setHeaders(headers);

		auto performResult = curl.perform();
		if (performResult != CURLE_OK)
		{
			string curlError = curl.getError();
			if (curlError.empty())
			{
				curlError = curl_easy_strerror(performResult);
			}
			if (s3::isNetworkError(performResult) && transientErrorsLeft > 0)
			{
				if (debugging)
				{
					debug2("transient error while listing the bucket '%s': %s", bucket, curlError);
				}
				--transientErrorsLeft;
				continue;
			}
			if (s3::isNetworkError(performResult) && !s3::isEndpointReachable(*config, address))
			{
				fatal2(__("unable to list the bucket '%s': %s; the host '%s' is unreachable, check the network connection"),
						bucket, curlError, address.host);
			}
			fatal2(__("unable to list the bucket '%s': %s"), bucket, curlError);
		}

		auto status = curl.getHttpStatus();
		if (status != 200)
		{
			string code;
			string message;
			s3::parseErrorBody(body, &code, &message);
			if (message.empty())
			{
				message = code.empty() ? string("request failed") : code;
			}
			fatal2(__("unable to list the bucket '%s': %s (HTTP %ld)"), bucket, message, status);
		}
		return body;
	}
}

void S3CatalogImpl::fetchPage()
{
	auto page = s3::parseListingPage(__request_page());
	++pageCount;
	if (debugging)
	{
		debug2("listing page %zu of the bucket '%s': %zu objects", pageCount, bucket, page.objects.size());
	}
	for (auto& descriptor: page.objects)
	{
		pending.push_back(std::move(descriptor));
	}
	continuationToken = page.continuationToken;
	finished = !page.truncated;
}

}

namespace s3 {

S3Catalog::S3Catalog(const shared_ptr< const Config >& config, const string& bucket, const string& prefix)
	: __impl(new internal::S3CatalogImpl(config, bucket, prefix))
{}

S3Catalog::~S3Catalog()
{
	delete __impl;
}

bool S3Catalog::next(ObjectDescriptor& descriptor)
{
	// an empty page may still be followed by more
	while (__impl->pending.empty())
	{
		if (__impl->finished)
		{
			return false;
		}
		__impl->fetchPage();
	}
	descriptor = std::move(__impl->pending.front());
	__impl->pending.pop_front();
	return true;
}

}
}
