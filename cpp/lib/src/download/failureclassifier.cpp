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

#include <common/regex.hpp>

#include <bulkfetch/download/failureclassifier.hpp>
#include <bulkfetch/download/method.hpp>

namespace bulkfetch {
namespace download {

FailureClassifier::FailureClassifier()
	: __transient_store_codes { "SlowDown", "InternalError", "RequestTimeout",
			"ServiceUnavailable", "RequestTimeTooSkewed", "OperationAborted" }
	, __permanent_store_codes { "NoSuchKey", "AccessDenied", "InvalidObjectState", "NoSuchBucket" }
	, __transient_errnos { ECONNREFUSED, ETIMEDOUT, ENETUNREACH, EHOSTUNREACH }
{}

namespace {

bool mentionsNetwork(const string& message)
{
	static const sregex phrasesRegex = sregex::compile(
			"timed out|connection refused|connection reset|network unreachable|"
			"host unreachable|connection aborted|connection error|socket error",
			regex_constants::icase);
	return regex_search(message, phrasesRegex);
}

}

FailureClassifier::Verdict FailureClassifier::classify(const TransferError& error) const
{
	switch (error.getKind())
	{
		case TransferError::Kind::Network:
			return Verdict::Transient;
		case TransferError::Kind::System:
			return __transient_errnos.count(error.getErrno()) ?
					Verdict::Transient : Verdict::Permanent;
		case TransferError::Kind::Store:
		{
			const string& code = error.getStoreCode();
			if (__transient_store_codes.count(code))
			{
				return Verdict::Transient;
			}
			if (__permanent_store_codes.count(code))
			{
				return Verdict::Permanent;
			}
			auto status = error.getHttpStatus();
			if (status >= 500 || status == 429)
			{
				return Verdict::Transient;
			}
			break;
		}
		default:
			break;
	}
	return mentionsNetwork(error.what()) ? Verdict::Transient : Verdict::Permanent;
}

FailureClassifier::Verdict FailureClassifier::classify(const std::exception& error) const
{
	auto transferError = dynamic_cast< const TransferError* >(&error);
	if (transferError)
	{
		return classify(*transferError);
	}
	return mentionsNetwork(error.what()) ? Verdict::Transient : Verdict::Permanent;
}

}
}
