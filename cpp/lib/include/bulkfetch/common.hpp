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
#ifndef BULKFETCH_COMMON_SEEN
#define BULKFETCH_COMMON_SEEN

/// @cond
#define BULKFETCH_API __attribute__ ((visibility("default")))
#define BULKFETCH_LOCAL __attribute__ ((visibility("hidden")))
/// @endcond

/*! @file */

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

/** @namespace bulkfetch */
namespace bulkfetch {

BULKFETCH_API extern const char* const libraryVersion; ///< the version of bulkfetch library

using std::vector;
using std::string;

/// general library exception class
/**
 * Any library function may throw this exception.
 */
class BULKFETCH_API Exception: public std::runtime_error
{
 public:
	/// constructor
	/**
	 * Creates Exception object with a message @a message.
	 *
	 * @param message human-readable exception description
	 */
	Exception(const char* message)
		: std::runtime_error(message)
	{}
	/// constructor
	/**
	 * @copydoc Exception(const char*)
	 */
	Exception(const string& message)
		: std::runtime_error(message)
	{}
};

using std::pair;

using std::shared_ptr;
using std::static_pointer_cast;
using std::dynamic_pointer_cast;
using std::unique_ptr;

/// message file descriptor
/**
 * All library error, warning and debug messages will be pointed here.
 * If @a messageFd @c == @c -1, messages will be suppressed. Defaults to @c -1.
 */
BULKFETCH_API extern int messageFd;

/// @cond
BULKFETCH_API string join(const string& joiner, const vector< string >& parts);
/// @endcond

/// formats a byte count with binary units
/**
 * Scales @a bytes by 1024 until it drops below 1024 or the largest unit is
 * reached, and prints it with two decimals, for example @c "1.50 KB".
 *
 * @param bytes the byte count
 */
BULKFETCH_API string humanReadableSizeString(uint64_t bytes);
/// formats a duration as, for example, @c "1h5m3s"
BULKFETCH_API string humanReadableDifftimeString(size_t seconds);
/// cuts @a message to at most @a maxLength characters, marking the cut with "..."
BULKFETCH_API string truncateMessage(const string& message, size_t maxLength);

/// localizes message
/**
 * @param message input string
 * @return localized message
 */
BULKFETCH_API const char* __(const char* message);

} // namespace

#include <bulkfetch/format2.hpp>

#endif
