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
#include <cctype>

#include <internal/common.hpp>

namespace bulkfetch {
namespace internal {

vector< string > split(char c, const string& str, bool allowEmpty)
{
	vector< string > result;

	size_t size = str.size();
	size_t startPosition = 0;
	for (size_t i = 0; i < size; ++i)
	{
		if (str[i] == c)
		{
			if (startPosition < i || allowEmpty)
			{
				// there is non-empty substring (or empty one allowed)
				result.push_back(string(str, startPosition, i - startPosition));
			}
			startPosition = i + 1;
		}
	}
	if (startPosition < size || allowEmpty)
	{
		// there is non-empty last substring (or empty allowed)
		result.push_back(string(str, startPosition, size - startPosition));
	}

	return result;
}

string trim(const string& str)
{
	auto begin = str.find_first_not_of(" \t\r\n");
	if (begin == string::npos)
	{
		return string();
	}
	auto end = str.find_last_not_of(" \t\r\n");
	return str.substr(begin, end - begin + 1);
}

string toLower(string str)
{
	for (char& c: str)
	{
		c = std::tolower((unsigned char)c);
	}
	return str;
}

bool startsWith(const string& str, const string& prefix)
{
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const string& str, const string& suffix)
{
	return str.size() >= suffix.size() &&
			str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

string formatLocalTime(time_t timestamp, const char* format)
{
	char buffer[64];
	struct tm tm;
	localtime_r(&timestamp, &tm);
	auto length = strftime(buffer, sizeof(buffer), format, &tm);
	return string(buffer, length);
}

} // namespace
} // namespace
