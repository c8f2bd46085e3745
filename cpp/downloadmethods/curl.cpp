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
#include <cerrno>

#include <bulkfetch/config.hpp>
#include <bulkfetch/file.hpp>
#include <bulkfetch/download/method.hpp>

#include <downloadmethods/curlwrapper.hpp>
#include <downloadmethods/s3.hpp>

namespace bulkfetch {
namespace s3 {

namespace {

using download::TransferError;

const size_t maxErrorBodySize = 65536;

struct WriteContext
{
	File* file;
	CurlWrapper* curl;
	const download::Method::Callback* callback;
	bool rangeRequested;

	bool statusChecked;
	bool successful;
	bool rangeIgnored;
	bool aborted;
	string errorBody;
	string fileWriteError;
	int fileWriteErrno;
	string callbackError;
	uint64_t writtenBytes;

	void reset()
	{
		statusChecked = false;
		successful = false;
		rangeIgnored = false;
		aborted = false;
		errorBody.clear();
		fileWriteError.clear();
		fileWriteErrno = 0;
		callbackError.clear();
	}
};

size_t curlWriteFunction(char* data, size_t size, size_t nmemb, void* userData)
{
	auto& context = *static_cast< WriteContext* >(userData);
	size *= nmemb;

	if (!context.statusChecked)
	{
		context.statusChecked = true;
		auto status = context.curl->getHttpStatus();
		context.successful = (status >= 200 && status < 300);
		if (status == 200 && context.rangeRequested)
		{
			// the whole object is coming, it must not be appended
			context.rangeIgnored = true;
			return 0;
		}
	}
	if (!size)
	{
		return size;
	}
	if (!context.successful)
	{
		if (context.errorBody.size() < maxErrorBodySize)
		{
			context.errorBody.append(data, size);
		}
		return size;
	}

	try
	{
		context.file->put(data, size);
	}
	catch (Exception& e)
	{
		context.fileWriteErrno = errno;
		context.fileWriteError = e.what();
		return 0;
	}
	context.writtenBytes += size;

	try
	{
		if (!(*context.callback)(size))
		{
			context.aborted = true;
			return 0;
		}
	}
	catch (std::exception& e)
	{
		context.callbackError = e.what();
		return 0;
	}
	return size;
}

class CurlMethod: public download::Method
{
	shared_ptr< const Config > __config;
	Credentials __credentials;
	Signer __signer;

	void __check_status(const WriteContext&, CurlWrapper&) const;
 public:
	explicit CurlMethod(const shared_ptr< const Config >& config)
		: __config(config), __credentials(Credentials::fromConfig(*config))
		, __signer(__credentials, config->getString("s3::region"))
	{}

	bool isReachable(const string& container)
	{
		return isEndpointReachable(*__config, Address::forBucket(*__config, container));
	}

	void perform(const Request& request, const string& targetPath, const Callback& callback)
	{
		bool debugging = __config->getBool("debug::downloader");
		auto address = Address::forBucket(*__config, request.container);
		auto path = address.getObjectPath(request.key);

		CurlWrapper curl(*__config);
		curl.setOption(CURLOPT_URL, address.getUrl(path), "uri");

		string openError;
		File file(targetPath, "a", openError);
		if (!openError.empty())
		{
			throw TransferError(TransferError::Kind::System, openError, errno);
		}

		WriteContext context;
		context.file = &file;
		context.curl = &curl;
		context.callback = &callback;
		context.writtenBytes = 0;
		curl.setWriter(curlWriteFunction, &context);

		// bad connections can return 'receive failure' transient error
		// occasionally, give them several tries to finish the download
		auto transientErrorsLeft = __config->getInteger("acquire::retries");

		while (true)
		{
			context.reset();
			auto offset = request.offset + context.writtenBytes;
			context.rangeRequested = (offset > 0);

			Signer::Headers headers;
			if (offset > 0)
			{
				headers.push_back({ "Range", format2("bytes=%llu-", (unsigned long long)offset) });
			}
			if (!__credentials.empty())
			{
				auto authHeaders = __signer.sign("GET", address.host, path, string(), headers, time(NULL));
				headers.insert(headers.end(), authHeaders.begin(), authHeaders.end());
			}
			curl.setHeaders(headers);

			auto performResult = curl.perform();
			try
			{
				// committing what was received, the caller measures the staging file
				file.sync();
			}
			catch (Exception& e)
			{
				throw TransferError(TransferError::Kind::System, e.what(), errno);
			}

			if (!context.fileWriteError.empty())
			{
				throw TransferError(TransferError::Kind::System, context.fileWriteError, context.fileWriteErrno);
			}
			if (!context.callbackError.empty())
			{
				throw TransferError(TransferError::Kind::Other, context.callbackError);
			}
			if (context.aborted)
			{
				throw TransferError(TransferError::Kind::Other, __("the download was cancelled"));
			}
			if (context.rangeIgnored)
			{
				throw TransferError(TransferError::Kind::Integrity,
						__("the server ignored the range request"));
			}
			if (performResult == CURLE_OK)
			{
				__check_status(context, curl);
				return;
			}

			string curlError = curl.getError();
			if (curlError.empty())
			{
				curlError = curl_easy_strerror(performResult);
			}
			if (performResult == CURLE_RECV_ERROR && transientErrorsLeft > 0)
			{
				if (debugging)
				{
					debug2("transient error while downloading '%s': %s", request.key, curlError);
				}
				--transientErrorsLeft;
				continue;
			}
			if (isNetworkError(performResult))
			{
				throw TransferError(TransferError::Kind::Network, curlError);
			}
			throw TransferError(TransferError::Kind::Other, curlError);
		}
	}
};

void CurlMethod::__check_status(const WriteContext& context, CurlWrapper& curl) const
{
	auto status = curl.getHttpStatus();
	if (status >= 200 && status < 300)
	{
		if (status == 200 && context.rangeRequested)
		{
			throw TransferError(TransferError::Kind::Integrity,
					__("the server ignored the range request"));
		}
		return;
	}

	string code;
	string message;
	parseErrorBody(context.errorBody, &code, &message);
	if (message.empty())
	{
		message = code.empty() ? string("request failed") : code;
	}
	throw TransferError::fromStore(code, status, format2("%s (HTTP %ld)", message, status));
}

}

shared_ptr< download::Method > createCurlMethod(const shared_ptr< const Config >& config)
{
	return std::make_shared< CurlMethod >(config);
}

}
}
