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
#include <ctime>

#include <bulkfetch/config.hpp>
#include <bulkfetch/file.hpp>

#include <internal/common.hpp>
#include <internal/logger.hpp>

namespace bulkfetch {
namespace internal {

const char* Logger::__subsystem_strings[4] = {
	"session", "planner", "transfer", "ledger"
};

Logger::Logger(const Config& config)
	: __file(NULL)
{
	__enabled = config.getBool("bulkfetch::worker::log") &&
			!config.getBool("bulkfetch::planner::dry-run");
	__debugging = config.getBool("debug::logger");

	if (!__enabled)
	{
		return;
	}

	__levels[(int)Subsystem::Session] = 1;
	#define SET_LEVEL(x) __levels[x] = config.getInteger( \
			string("bulkfetch::worker::log::levels::") + __subsystem_strings[x]);
	SET_LEVEL(int(Subsystem::Planner))
	SET_LEVEL(int(Subsystem::Transfer))
	SET_LEVEL(int(Subsystem::Ledger))
	#undef SET_LEVEL

	__file = new RequiredFile(config.getPath("bulkfetch::directory::log"), "a");

	log(Subsystem::Session, 1, "started");
}

Logger::~Logger()
{
	if (__enabled)
	{
		try
		{
			log(Subsystem::Session, 1, "finished");
		}
		catch (Exception&)
		{
			// the write error is already reported
		}
	}
	delete __file;
}

string Logger::__get_log_string(Subsystem subsystem, Level level, const string& message)
{
	string indent((level - 1) * 2, ' ');
	return formatLocalTime(time(NULL), "%F %T") + " | " +
			__subsystem_strings[(int)subsystem] + ": " + indent + message;
}

void Logger::log(Subsystem subsystem, Level level, const string& message, bool force)
{
	if (level == 0)
	{
		fatal2i("logger: log: level should be >= 1");
	}

	if (!__enabled)
	{
		return;
	}

	if (__debugging)
	{
		debug2("log: %s", __get_log_string(subsystem, level, message));
	}

	if (force || (level <= __levels[(int)subsystem]))
	{
		auto logData = __get_log_string(subsystem, level, message) + "\n";
		// stdio-buffered fails when there are several writing processes
		__file->unbufferedPut(logData.c_str(), logData.size());
	}
}

}
}
