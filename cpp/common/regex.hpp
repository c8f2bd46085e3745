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
#ifndef BULKFETCH_COMMON_REGEX_SEEN
#define BULKFETCH_COMMON_REGEX_SEEN

#include <boost/xpressive/xpressive_dynamic.hpp>

namespace bulkfetch {

using boost::xpressive::sregex;
using boost::xpressive::smatch;

using boost::xpressive::regex_match;
using boost::xpressive::regex_search;
using boost::xpressive::regex_error;

namespace regex_constants = boost::xpressive::regex_constants;

}

#endif
