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
#ifndef BULKFETCH_DOWNLOAD_FAILURECLASSIFIER_SEEN
#define BULKFETCH_DOWNLOAD_FAILURECLASSIFIER_SEEN

/// @file

#include <exception>
#include <set>

#include <bulkfetch/common.hpp>

namespace bulkfetch {
namespace download {

class TransferError;

/// tells retryable transfer errors from the rest
/**
 * Rules, in priority order:
 *  - transport-level (TransferError::Kind::Network) errors are transient;
 *  - operating system errors are transient only for @c ECONNREFUSED,
 *    @c ETIMEDOUT, @c ENETUNREACH and @c EHOSTUNREACH;
 *  - object store errors are decided by the error code, then by the HTTP
 *    status (5xx and 429 are transient);
 *  - otherwise the message is scanned for network-related phrases.
 */
class BULKFETCH_API FailureClassifier
{
	std::set< string > __transient_store_codes;
	std::set< string > __permanent_store_codes;
	std::set< int > __transient_errnos;
 public:
	enum class Verdict { Transient, Permanent };

	FailureClassifier();

	Verdict classify(const TransferError&) const;
	/// classifies an arbitrary exception
	/**
	 * TransferError objects are classified by their details, other
	 * exceptions by the message only.
	 */
	Verdict classify(const std::exception&) const;
};

}
}

#endif
