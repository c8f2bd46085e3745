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
#include <libintl.h>
#include <unistd.h>

#include <cstdio>

#include <bulkfetch/common.hpp>

namespace bulkfetch {

#define QUOTED(x) QUOTED_(x)
#define QUOTED_(x) # x
const char* const libraryVersion = QUOTED(BULKFETCH_VERSION);
#undef QUOTED
#undef QUOTED_

int messageFd = -1;

static void __mwrite(const string& output)
{
	if (messageFd == -1)
	{
		return;
	}
	size_t offset = 0;
	while (offset < output.size())
	{
		auto writeResult = write(messageFd, output.c_str() + offset, output.size() - offset);
		if (writeResult == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			return; // nowhere to report it
		}
		offset += writeResult;
	}
}

void __mwrite_line(const char* prefix, const string& message)
{
	__mwrite(string(prefix) + message + "\n");
}

string join(const string& joiner, const vector< string >& parts)
{
	if (parts.empty())
	{
		return "";
	}
	string result = parts[0];
	auto size = parts.size();
	for (size_t i = 1; i < size; ++i)
	{
		result += joiner;
		result += parts[i];
	}
	return result;
}

string humanReadableSizeString(uint64_t bytes)
{
	static const char* const units[] = { "B", "KB", "MB", "GB", "TB" };
	const size_t unitCount = sizeof(units) / sizeof(units[0]);

	double value = bytes;
	size_t unitIndex = 0;
	while (value >= 1024 && unitIndex < unitCount - 1)
	{
		value /= 1024;
		++unitIndex;
	}

	char buf[32];
	snprintf(buf, sizeof(buf), "%.2f %s", value, units[unitIndex]);
	return string(buf);
}

string humanReadableDifftimeString(size_t time)
{
	auto days = time / (24*60*60);
	time %= (24*60*60);
	auto hours = time / (60*60);
	time %= (60*60);
	auto minutes = time / 60;
	auto seconds = time % 60;

	string result;
	if (days)
	{
		result += format2("%zud", days);
	}
	if (hours || !result.empty())
	{
		result += format2("%zuh", hours);
	}
	if (minutes || !result.empty())
	{
		result += format2("%zum", minutes);
	}
	result += format2("%zus", seconds);
	return result;
}

string truncateMessage(const string& message, size_t maxLength)
{
	if (message.size() <= maxLength)
	{
		return message;
	}
	if (maxLength <= 3)
	{
		return message.substr(0, maxLength);
	}
	return message.substr(0, maxLength - 3) + "...";
}

const char* __(const char* buf)
{
	return dgettext("bulkfetch", buf);
}

} // namespace
