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
#include <cstdio>
#include <cstring>

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <bulkfetch/file.hpp>

namespace bulkfetch {
namespace internal {

struct FileImpl
{
	FILE* handle;
	const string path;
	int fd;

	FileImpl(const string& path_, const char* mode, string& openError);
	~FileImpl();
	inline void assertFileOpened() const;
};

FileImpl::FileImpl(const string& path_, const char* mode, string& openError)
	: handle(NULL), path(path_), fd(-1)
{
	handle = fopen(path.c_str(), mode);
	if (!handle)
	{
		openError = format2e("").substr(2);
		return;
	}

	// setting FD_CLOEXEC flag
	fd = fileno(handle);
	int oldFdFlags = fcntl(fd, F_GETFD);
	if (oldFdFlags < 0)
	{
		openError = format2e("unable to get file descriptor flags");
	}
	else if (fcntl(fd, F_SETFD, oldFdFlags | FD_CLOEXEC) == -1)
	{
		openError = format2e("unable to set the close-on-exec flag");
	}
}

FileImpl::~FileImpl()
{
	if (handle)
	{
		if (fclose(handle))
		{
			warn2e(__("unable to close the file '%s'"), path);
		}
	}
}

void FileImpl::assertFileOpened() const
{
	if (!handle)
	{
		// file was not properly opened
		fatal2i("file '%s' was not properly opened", path);
	}
}

}

File::File(const string& path, const char* mode, string& openError)
	: __impl(new internal::FileImpl(path, mode, openError))
{}

File::File(File&& other)
	: __impl(other.__impl)
{
	other.__impl = nullptr;
}

File::~File()
{
	delete __impl;
}

size_t File::read(char* buffer, size_t size)
{
	__impl->assertFileOpened();
	auto result = fread(buffer, 1, size, __impl->handle);
	if (result < size && ferror(__impl->handle))
	{
		fatal2e(__("unable to read from the file '%s'"), __impl->path);
	}
	return result;
}

void File::truncate(size_t size)
{
	__impl->assertFileOpened();
	fflush(__impl->handle);
	if (ftruncate(__impl->fd, size) == -1)
	{
		fatal2e(__("unable to truncate the file '%s'"), __impl->path);
	}
}

void File::sync()
{
	__impl->assertFileOpened();
	if (fflush(__impl->handle) != 0)
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
	if (fsync(__impl->fd) == -1)
	{
		fatal2e(__("%s() failed: '%s'"), "fsync", __impl->path);
	}
}

void File::lock(int flags)
{
	__impl->assertFileOpened();
	if (flock(__impl->fd, flags) == -1)
	{
		auto actionName = (flags & LOCK_UN) ? __("release") : __("obtain");
		fatal2e(__("unable to %s a lock on the file '%s'"), actionName, __impl->path);
	}
}

bool File::tryLock(int flags)
{
	__impl->assertFileOpened();
	if (flock(__impl->fd, flags | LOCK_NB) == -1)
	{
		if (errno == EWOULDBLOCK)
		{
			return false;
		}
		fatal2e(__("unable to %s a lock on the file '%s'"), __("obtain"), __impl->path);
	}
	return true;
}

void File::put(const char* data, size_t size)
{
	__impl->assertFileOpened();
	if (size && fwrite(data, size, 1, __impl->handle) != 1)
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
}

void File::put(const string& bytes)
{
	put(bytes.c_str(), bytes.size());
}

void File::unbufferedPut(const char* data, size_t size)
{
	__impl->assertFileOpened();
	fflush(__impl->handle);

	size_t currentOffset = 0;
	while (currentOffset < size)
	{
		auto writeResult = write(__impl->fd, data + currentOffset, size - currentOffset);
		if (writeResult == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			else
			{
				fatal2e(__("unable to write to the file '%s'"), __impl->path);
			}
		}
		currentOffset += writeResult;
	}
}

namespace {

File openRequiredFile(const string& path, const char* mode)
{
	string openError;
	File file(path, mode, openError);
	if (!openError.empty())
	{
		fatal2(__("unable to open the file '%s': %s"), path, openError);
	}
	return file;
}

}

RequiredFile::RequiredFile(const string& path, const char* mode)
	: File(openRequiredFile(path, mode))
{}

} // namespace
