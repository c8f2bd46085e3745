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
#ifndef BULKFETCH_TESTS_FAKES_SEEN
#define BULKFETCH_TESTS_FAKES_SEEN

#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <bulkfetch/catalog.hpp>
#include <bulkfetch/clock.hpp>
#include <bulkfetch/download/method.hpp>
#include <bulkfetch/download/progress.hpp>
#include <bulkfetch/system/guard.hpp>

namespace bulkfetch {
namespace test {

// real time at construction, then moves only when slept
class FakeClock: public Clock
{
	time_t __start;
	mutable time_t __offset;
 public:
	mutable vector< size_t > sleeps;

	FakeClock()
		: __start(time(NULL)), __offset(0)
	{}
	time_t now() const
	{
		return __start + __offset;
	}
	void sleep(size_t seconds) const
	{
		sleeps.push_back(seconds);
		__offset += seconds;
	}
	void advance(time_t seconds)
	{
		__offset += seconds;
	}
	size_t getSleptTime() const
	{
		size_t result = 0;
		for (auto seconds: sleeps)
		{
			result += seconds;
		}
		return result;
	}
};

// reports free space from a script, the last value repeats
class FakeGuard: public system::Guard
{
	mutable std::deque< uint64_t > __free_space;
 public:
	FakeGuard(const Clock& clock, size_t staleLockAge = 300)
		: system::Guard(clock, staleLockAge)
		, __free_space { uint64_t(1) << 50 }
	{}
	void setFreeSpace(std::initializer_list< uint64_t > values)
	{
		__free_space.assign(values);
	}
	uint64_t getFreeSpace(const string&) const
	{
		auto result = __free_space.front();
		if (__free_space.size() > 1)
		{
			__free_space.pop_front();
		}
		return result;
	}
};

class VectorCatalog: public Catalog
{
	vector< ObjectDescriptor > __objects;
	size_t __position;
 public:
	size_t consumed;

	explicit VectorCatalog(const vector< ObjectDescriptor >& objects)
		: __objects(objects), __position(0), consumed(0)
	{}
	bool next(ObjectDescriptor& descriptor)
	{
		if (__position == __objects.size())
		{
			return false;
		}
		descriptor = __objects[__position++];
		++consumed;
		return true;
	}
};

// serves one object; every request consumes the next step of the script
class ScriptedMethod: public download::Method
{
 public:
	struct Step
	{
		size_t bytes; ///< how many bytes to append before failing, string::npos = all
		shared_ptr< download::TransferError > error;

		static Step serve()
		{
			return Step{ string::npos, shared_ptr< download::TransferError >() };
		}
		static Step fail(size_t bytes, download::TransferError::Kind kind, const string& message)
		{
			return Step{ bytes, std::make_shared< download::TransferError >(kind, message) };
		}
		static Step failStore(const string& code, long status)
		{
			return Step{ 0, std::make_shared< download::TransferError >(
					download::TransferError::fromStore(code, status, code)) };
		}
	};

	std::map< string, string > contents; ///< key -> object content
	std::deque< Step > steps;
	vector< Request > requests;
	std::function< void () > onRequest;
	bool reachable;
	size_t reachabilityChecks;

	ScriptedMethod()
		: reachable(true), reachabilityChecks(0)
	{}

	bool isReachable(const string&)
	{
		++reachabilityChecks;
		return reachable;
	}

	void perform(const Request& request, const string& targetPath, const Callback& callback)
	{
		requests.push_back(request);
		if (onRequest)
		{
			onRequest();
		}
		Step step = Step::serve();
		if (!steps.empty())
		{
			step = steps.front();
			steps.pop_front();
		}

		const string& content = contents.at(request.key);
		string data = request.offset < content.size() ?
				content.substr(request.offset, step.bytes) : string();
		{
			std::ofstream target(targetPath, std::ios::binary | std::ios::app);
			target << data;
		}
		if (!data.empty() && !callback(data.size()))
		{
			throw download::TransferError(download::TransferError::Kind::Other, "cancelled");
		}
		if (step.error)
		{
			throw *step.error;
		}
	}
};

class RecordingProgress: public download::Progress
{
 protected:
	void transferHook(const string& key, const DownloadRecord& record)
	{
		offsets[key].push_back(record.initialOffset);
	}
	void retryHook(const string& key, const RetryInfo& info)
	{
		retries[key].push_back(info);
	}
	void finishedDownloadHook(const string& key, const string& result)
	{
		results[key] = result;
	}
 public:
	std::map< string, vector< uint64_t > > offsets;
	std::map< string, vector< RetryInfo > > retries;
	std::map< string, string > results;
};

class TemporaryDirectory
{
	string __path;

	static int __remove(const char* path, const struct stat*, int, struct FTW*)
	{
		return ::remove(path);
	}
 public:
	TemporaryDirectory()
	{
		char pattern[] = "/tmp/bulkfetch-test-XXXXXX";
		if (!mkdtemp(pattern))
		{
			throw std::runtime_error("mkdtemp failed");
		}
		__path = pattern;
	}
	~TemporaryDirectory()
	{
		nftw(__path.c_str(), __remove, 16, FTW_DEPTH | FTW_PHYS);
	}
	const string& getPath() const
	{
		return __path;
	}
	string operator/(const string& relativePath) const
	{
		return __path + '/' + relativePath;
	}
};

inline void writeFile(const string& path, const string& content)
{
	std::ofstream file(path, std::ios::binary | std::ios::trunc);
	file << content;
}

inline string readFile(const string& path)
{
	std::ifstream file(path, std::ios::binary);
	std::ostringstream result;
	result << file.rdbuf();
	return result.str();
}

// redirects library messages into a file for the lifetime of the object
class MessageCapture
{
	string __path;
	int __fd;
	int __previousFd;
 public:
	explicit MessageCapture(const string& path)
		: __path(path), __previousFd(messageFd)
	{
		__fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
		if (__fd == -1)
		{
			throw std::runtime_error("unable to open the message capture file");
		}
		messageFd = __fd;
	}
	~MessageCapture()
	{
		messageFd = __previousFd;
		close(__fd);
	}
	string getMessages() const
	{
		return readFile(__path);
	}
};

inline bool exists(const string& path)
{
	struct stat info;
	return lstat(path.c_str(), &info) == 0;
}

}
}

#endif
