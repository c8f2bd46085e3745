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
#ifndef BULKFETCH_DOWNLOAD_METHOD_SEEN
#define BULKFETCH_DOWNLOAD_METHOD_SEEN

/// @file

#include <functional>

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {
namespace download {

/// failed transfer, with the details needed to classify it
class BULKFETCH_API TransferError: public Exception
{
 public:
	/// origin of the error
	enum class Kind
	{
		Network, ///< transport-level failure: connection, DNS, timeout
		System, ///< local operating system error, errno is set
		Store, ///< the object store answered with an error
		Integrity, ///< transferred data doesn't match the expectations
		Other
	};

	/// constructor
	/**
	 * @param kind origin of the error
	 * @param message human-readable description
	 * @param errorNumber errno value, @c 0 if not applicable
	 */
	TransferError(Kind kind, const string& message, int errorNumber = 0);
	/// constructs an error from the object store reply
	/**
	 * @param code store error code, like @c "NoSuchKey", may be empty
	 * @param httpStatus HTTP status of the reply
	 * @param message human-readable description
	 */
	static TransferError fromStore(const string& code, long httpStatus, const string& message);

	Kind getKind() const;
	int getErrno() const;
	const string& getStoreCode() const;
	long getHttpStatus() const;
 private:
	Kind __kind;
	int __errno;
	string __store_code;
	long __http_status;
};

/// base class of transfer methods
class BULKFETCH_API Method
{
 protected:
	Method();
 public:
	/// what to fetch
	struct Request
	{
		string container; ///< bucket name
		string key; ///< object key
		uint64_t offset; ///< first byte to fetch
	};
	/// receives the size of every piece appended to the target file
	/**
	 * Returning @c false aborts the transfer; perform() then throws a
	 * TransferError of the kind TransferError::Kind::Other.
	 */
	typedef std::function< bool (uint64_t) > Callback;

	virtual ~Method();

	/// appends bytes [offset, end) of the object to @a targetPath
	/**
	 * The target file must be exactly @a request.offset bytes long (or absent,
	 * when the offset is zero).
	 *
	 * Throws TransferError on failures.
	 *
	 * @param request object and offset
	 * @param targetPath staging file to append to
	 * @param callback called for each appended piece
	 */
	virtual void perform(const Request& request, const string& targetPath,
			const Callback& callback) = 0;
	/// checks whether a connection to the store serving @a container can be opened
	/**
	 * Used to tell a network outage from a failure of a single transfer.
	 * The default implementation returns @c true.
	 */
	virtual bool isReachable(const string& container);
};

}
}

#endif
