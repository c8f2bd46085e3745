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
#include <ctime>

#include <bulkfetch/clock.hpp>

namespace bulkfetch {

Clock::~Clock()
{}

time_t Clock::now() const
{
	return time(NULL);
}

void Clock::sleep(size_t seconds) const
{
	struct timespec remaining;
	remaining.tv_sec = seconds;
	remaining.tv_nsec = 0;
	while (nanosleep(&remaining, &remaining) == -1)
	{
		if (errno != EINTR)
		{
			warn2e(__("%s() failed"), "nanosleep");
			return;
		}
	}
}

}
