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
#ifndef BULKFETCH_CONFIG_SEEN
#define BULKFETCH_CONFIG_SEEN

/// @file

#include <sys/types.h>

#include <bulkfetch/common.hpp>

namespace bulkfetch {

namespace internal {

struct ConfigImpl;

}

/// stores library's configuration variables
/**
 * Option names are lower-case and use @c "::" as a separator, for example
 * @c "bulkfetch::transfer::retry-delays". Every option has a built-in
 * default; the list of known options is fixed.
 */
class BULKFETCH_API Config
{
	internal::ConfigImpl* __impl;
 public:
	/// constructor
	/**
	 * Initializes defaults and reads the system-wide configuration file
	 * @c /etc/bulkfetch.conf, if it exists.
	 */
	Config();
	/// destructor
	virtual ~Config();

	/// copy constructor
	Config(const Config& other);
	/// assignment operator
	Config& operator=(const Config& other);

	/// reads options from a configuration file
	/**
	 * The file is in the boost.property_tree INFO format. Nested sections
	 * are joined with @c "::"; for list options every occurrence appends an
	 * element.
	 *
	 * @param path path to the file
	 */
	void readFile(const string& path);

	/// sets new value for the scalar option
	/**
	 * @param optionName name of the option to modify
	 * @param value new value for the option
	 */
	void setScalar(const string& optionName, const string& value);
	/// appends new element to the value of the list option
	/**
	 * @param optionName the name of the option to modify
	 * @param value new value element for the option
	 */
	void setList(const string& optionName, const string& value);
	/// removes all elements of the list option
	void clearList(const string& optionName);

	/// is @a optionName a known list option
	bool isList(const string& optionName) const;

	/// gets the value of the list option
	vector< string > getList(const string& optionName) const;
	/// gets the value of the scalar option
	string getString(const string& optionName) const;
	/// gets the value of the scalar option as a path
	/**
	 * Relative paths are resolved against the value of the parent option
	 * (@c "a::b::c" against @c "a::b"), when the parent option exists.
	 */
	string getPath(const string& optionName) const;
	/// gets the value of the scalar option as a boolean
	/**
	 * Empty string, @c "false", @c "0" and @c "no" mean @c false, everything
	 * else means @c true.
	 */
	bool getBool(const string& optionName) const;
	/// gets the value of the scalar option as a signed number
	ssize_t getInteger(const string& optionName) const;
	/// gets the value of the scalar option as an unsigned 64-bit number
	uint64_t getUnsigned(const string& optionName) const;
};

} // namespace

#endif
