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
#ifndef BULKFETCH_CLOCK_SEEN
#define BULKFETCH_CLOCK_SEEN

/// @file

#include <ctime>

#include <bulkfetch/common.hpp>

namespace bulkfetch {

/// wall clock used for retry waits and timestamps
/**
 * All waits of the library go through this class, so that they can be
 * replaced in a controlled environment.
 */
class BULKFETCH_API Clock
{
 public:
	virtual ~Clock();

	/// current time, in seconds since the Epoch
	virtual time_t now() const;
	/// blocks the calling thread for @a seconds seconds
	virtual void sleep(size_t seconds) const;
};

}

#endif
