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
#include <bulkfetch/download/method.hpp>

namespace bulkfetch {
namespace download {

TransferError::TransferError(Kind kind, const string& message, int errorNumber)
	: Exception(message), __kind(kind), __errno(errorNumber), __http_status(0)
{}

TransferError TransferError::fromStore(const string& code, long httpStatus, const string& message)
{
	TransferError result(Kind::Store, message);
	result.__store_code = code;
	result.__http_status = httpStatus;
	return result;
}

TransferError::Kind TransferError::getKind() const
{
	return __kind;
}

int TransferError::getErrno() const
{
	return __errno;
}

const string& TransferError::getStoreCode() const
{
	return __store_code;
}

long TransferError::getHttpStatus() const
{
	return __http_status;
}

Method::Method()
{}

Method::~Method()
{}

bool Method::isReachable(const string&)
{
	return true;
}

}
}
