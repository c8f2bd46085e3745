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
#ifndef BULKFETCH_FILE_SEEN
#define BULKFETCH_FILE_SEEN

/// @file

#include <bulkfetch/common.hpp>

namespace bulkfetch {

namespace internal {

struct FileImpl;

}

/// high-level interface to file routines
class BULKFETCH_API File
{
	internal::FileImpl* __impl;
	File(const File&) = delete;
 public:
	/// constructor
	/**
	 * Constructs new object for a regular file.
	 *
	 * @warning You must not use constructed object if @a error is not empty.
	 *
	 * @param path path to file
	 * @param mode any value, accepted as @a mode in @c fopen(3)
	 * @param [out] error if open failed, human readable error will be placed here
	 */
	File(const string& path, const char* mode, string& error);
	File(File&&);
	/// destructor
	virtual ~File();
	/// reads up to @a size bytes into @a buffer
	/**
	 * @return the number of bytes read, @c 0 at the end of file
	 */
	size_t read(char* buffer, size_t size);
	/// writes data
	/**
	 * @param data data to write
	 */
	void put(const string& data);
	/// writes data
	/**
	 * @param data pointer to the data buffer
	 * @param size size of the buffer
	 */
	void put(const char* data, size_t size);
	/// @cond
	void unbufferedPut(const char* data, size_t size);
	/// @endcond

	/// truncates the file to @a size bytes
	void truncate(size_t size);
	/// flushes buffered data and commits it to the disk
	void sync();

	/// perform @c flock(2) on file
	/**
	 * @param flags flags passed to flock
	 */
	void lock(int flags);
	/// tries to perform @c flock(2) on file
	/**
	 * @return @c false if the lock is held by somebody else (@c EWOULDBLOCK),
	 * @c true if obtained
	 */
	bool tryLock(int flags);
};

/// File wrapper which throws on open errors
class BULKFETCH_API RequiredFile: public File
{
 public:
	/*
	 * Passes @a path and @a mode to File::File(). If file failed to open (i.e.
	 * !openError.empty()), throws an exception.
	 */
	RequiredFile(const string& path, const char* mode);
};

} // namespace

#endif
