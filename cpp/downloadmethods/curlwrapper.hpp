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
#ifndef BULKFETCH_DOWNLOADMETHODS_CURLWRAPPER_SEEN
#define BULKFETCH_DOWNLOADMETHODS_CURLWRAPPER_SEEN

#include <curl/curl.h>

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>

#include <downloadmethods/signer.hpp>

namespace bulkfetch {
namespace s3 {

class CurlWrapper
{
	CURL* __handle;
	curl_slist* __headers;
	char __error_buffer[CURL_ERROR_SIZE];

	CurlWrapper(const CurlWrapper&);
	CurlWrapper& operator=(const CurlWrapper&);
 public:
	typedef size_t (*WriteFunction)(char*, size_t, size_t, void*);

	// sets timeouts, the proxy and the user agent from the acquire:: options
	explicit CurlWrapper(const Config&);
	~CurlWrapper();

	void setOption(CURLoption optionName, long value, const char* alias);
	void setOption(CURLoption optionName, void* value, const char* alias);
	void setOption(CURLoption optionName, const string& value, const char* alias);
	void setLargeOption(CURLoption optionName, curl_off_t value, const char* alias);
	void setHeaders(const Signer::Headers&);
	void setWriter(WriteFunction, void* data);

	CURLcode perform();
	long getHttpStatus() const;
	string getError() const;
};

void initCurl();

// does the code mean the network or the peer failed us
bool isNetworkError(CURLcode);

// can a connection to the endpoint of the address be opened at all
bool isEndpointReachable(const Config&, const Address&);

// parses an S3 <Error> document, both outputs stay empty if it is not one
void parseErrorBody(const string& body, string* code, string* message);

}
}

#endif
