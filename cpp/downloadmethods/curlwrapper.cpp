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
#include <cstring>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <bulkfetch/config.hpp>

#include <downloadmethods/curlwrapper.hpp>

namespace bulkfetch {
namespace s3 {

void initCurl()
{
	static bool initialized = false;
	if (!initialized)
	{
		auto returnCode = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (returnCode != CURLE_OK)
		{
			fatal2(__("unable to initialize Curl: %s"), curl_easy_strerror(returnCode));
		}
		initialized = true;
	}
}

CurlWrapper::CurlWrapper(const Config& config)
	: __headers(NULL)
{
	initCurl();
	memset(__error_buffer, 0, sizeof(__error_buffer));
	__handle = curl_easy_init();
	if (!__handle)
	{
		fatal2(__("unable to create a Curl handle"));
	}
	curl_easy_setopt(__handle, CURLOPT_ERRORBUFFER, __error_buffer);
	// signals are handled by the shutdown coordinator
	setOption(CURLOPT_NOSIGNAL, 1, "no signal");
	setOption(CURLOPT_USERAGENT, config.getString("acquire::user-agent"), "user-agent");

	auto proxy = config.getString("acquire::proxy");
	if (proxy == "DIRECT")
	{
		setOption(CURLOPT_PROXY, string(), "proxy");
	}
	else if (!proxy.empty())
	{
		setOption(CURLOPT_PROXY, proxy, "proxy");
	}

	auto connectTimeout = config.getInteger("acquire::connect-timeout");
	if (connectTimeout > 0)
	{
		setOption(CURLOPT_CONNECTTIMEOUT, connectTimeout, "connect timeout");
	}
	auto readTimeout = config.getInteger("acquire::read-timeout");
	if (readTimeout > 0)
	{
		setOption(CURLOPT_LOW_SPEED_LIMIT, 1, "low speed limit");
		setOption(CURLOPT_LOW_SPEED_TIME, readTimeout, "low speed timeout");
	}
}

CurlWrapper::~CurlWrapper()
{
	curl_easy_cleanup(__handle);
	curl_slist_free_all(__headers);
}

void CurlWrapper::setOption(CURLoption optionName, long value, const char* alias)
{
	auto returnCode = curl_easy_setopt(__handle, optionName, value);
	if (returnCode != CURLE_OK)
	{
		fatal2(__("unable to set the Curl option '%s': curl_easy_setopt failed: %s"),
				alias, curl_easy_strerror(returnCode));
	}
}

void CurlWrapper::setOption(CURLoption optionName, void* value, const char* alias)
{
	auto returnCode = curl_easy_setopt(__handle, optionName, value);
	if (returnCode != CURLE_OK)
	{
		fatal2(__("unable to set the Curl option '%s': curl_easy_setopt failed: %s"),
				alias, curl_easy_strerror(returnCode));
	}
}

void CurlWrapper::setOption(CURLoption optionName, const string& value, const char* alias)
{
	auto returnCode = curl_easy_setopt(__handle, optionName, value.c_str());
	if (returnCode != CURLE_OK)
	{
		fatal2(__("unable to set the Curl option '%s': curl_easy_setopt failed: %s"),
				alias, curl_easy_strerror(returnCode));
	}
}

void CurlWrapper::setLargeOption(CURLoption optionName, curl_off_t value, const char* alias)
{
	auto returnCode = curl_easy_setopt(__handle, optionName, value);
	if (returnCode != CURLE_OK)
	{
		fatal2(__("unable to set the Curl option '%s': curl_easy_setopt failed: %s"),
				alias, curl_easy_strerror(returnCode));
	}
}

void CurlWrapper::setHeaders(const Signer::Headers& headers)
{
	curl_slist* newHeaders = NULL;
	for (const auto& header: headers)
	{
		auto line = header.first + ": " + header.second;
		auto appended = curl_slist_append(newHeaders, line.c_str());
		if (!appended)
		{
			curl_slist_free_all(newHeaders);
			fatal2(__("unable to set the Curl request headers"));
		}
		newHeaders = appended;
	}
	setOption(CURLOPT_HTTPHEADER, (void*)newHeaders, "headers");
	curl_slist_free_all(__headers);
	__headers = newHeaders;
}

void CurlWrapper::setWriter(WriteFunction function, void* data)
{
	setOption(CURLOPT_WRITEFUNCTION, (void*)function, "write function");
	setOption(CURLOPT_WRITEDATA, data, "write data");
}

CURLcode CurlWrapper::perform()
{
	__error_buffer[0] = '\0';
	return curl_easy_perform(__handle);
}

long CurlWrapper::getHttpStatus() const
{
	long value = 0;
	curl_easy_getinfo(__handle, CURLINFO_RESPONSE_CODE, &value);
	return value;
}

string CurlWrapper::getError() const
{
	return string(__error_buffer);
}

bool isNetworkError(CURLcode code)
{
	switch (code)
	{
		case CURLE_COULDNT_RESOLVE_PROXY:
		case CURLE_COULDNT_RESOLVE_HOST:
		case CURLE_COULDNT_CONNECT:
		case CURLE_PARTIAL_FILE:
		case CURLE_OPERATION_TIMEDOUT:
		case CURLE_SSL_CONNECT_ERROR:
		case CURLE_GOT_NOTHING:
		case CURLE_SEND_ERROR:
		case CURLE_RECV_ERROR:
			return true;
		default:
			return false;
	}
}

bool isEndpointReachable(const Config& config, const Address& address)
{
	const long connectivityTimeout = 5;

	CurlWrapper curl(config);
	curl.setOption(CURLOPT_URL, address.getUrl(address.getBucketPath()), "uri");
	curl.setOption(CURLOPT_CONNECT_ONLY, 1, "connect only");
	curl.setOption(CURLOPT_CONNECTTIMEOUT, connectivityTimeout, "connect timeout");
	return curl.perform() == CURLE_OK;
}

void parseErrorBody(const string& body, string* code, string* message)
{
	code->clear();
	message->clear();
	if (body.empty())
	{
		return;
	}

	using boost::property_tree::ptree;
	ptree tree;
	try
	{
		std::istringstream stream(body);
		boost::property_tree::read_xml(stream, tree);
	}
	catch (boost::property_tree::xml_parser_error&)
	{
		return; // not XML, a proxy page or similar
	}
	*code = tree.get< string >("Error.Code", "");
	*message = tree.get< string >("Error.Message", "");
}

}
}
