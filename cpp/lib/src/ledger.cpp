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
#include <algorithm>
#include <mutex>

#include <sys/file.h>

#include <common/common.hpp>

#include <bulkfetch/clock.hpp>
#include <bulkfetch/file.hpp>
#include <bulkfetch/ledger.hpp>

#include <internal/common.hpp>

namespace bulkfetch {

Ledger::Record::Record()
	: totalFiles(0), totalSize(0), downloadedFiles(0), downloadedSize(0), lastUpdate(0)
{}

Ledger::Summary::Summary()
	: totalFolders(0), completedFolders(0), pendingFolders(0), totalFiles(0),
	downloadedFiles(0), totalSize(0), downloadedSize(0), overallPercent(0)
{}

namespace internal {

class LedgerImpl
{
 public:
	string path;
	string prefix;
	size_t depth;
	size_t flushInterval;
	const Clock& clock;
	bool debugging;

	mutable std::mutex recordsMutex;
	std::map< string, Ledger::Record > records;
	std::mutex flushMutex;
	time_t lastFlushTime;

	LedgerImpl(const string& path_, const string& prefix_, size_t depth_,
			size_t flushInterval_, const Clock& clock_, bool debugging_)
		: path(path_), prefix(prefix_), depth(depth_ ? depth_ : 1)
		, flushInterval(flushInterval_), clock(clock_), debugging(debugging_), lastFlushTime(0)
	{}
	string renderUnlocked() const;
};

static string csvField(const string& value)
{
	if (value.find_first_of(",\"\r\n") == string::npos)
	{
		return value;
	}
	string result = "\"";
	for (char c: value)
	{
		if (c == '"')
		{
			result += '"';
		}
		result += c;
	}
	result += '"';
	return result;
}

string LedgerImpl::renderUnlocked() const
{
	string result = "folder_path,total_files,total_size_bytes,total_size_human,"
			"downloaded_files,downloaded_size_bytes,downloaded_size_human,progress,last_update\r\n";
	FORIT(it, records)
	{
		const Ledger::Record& record = it->second;
		vector< string > fields = {
			csvField(it->first),
			format2("%llu", (unsigned long long)record.totalFiles),
			format2("%llu", (unsigned long long)record.totalSize),
			humanReadableSizeString(record.totalSize),
			format2("%llu", (unsigned long long)record.downloadedFiles),
			format2("%llu", (unsigned long long)record.downloadedSize),
			humanReadableSizeString(record.downloadedSize),
			Ledger::getProgressLabel(record),
			formatLocalTime(record.lastUpdate)
		};
		result += join(",", fields) + "\r\n";
	}
	return result;
}

}

Ledger::Ledger(const string& path, const string& prefix, size_t depth,
		size_t flushInterval, const Clock& clock, bool debugging)
	: __impl(new internal::LedgerImpl(path, prefix, depth, flushInterval, clock, debugging))
{}

Ledger::~Ledger()
{
	delete __impl;
}

string Ledger::getGroupKey(const string& key) const
{
	string relativePath = key;
	const string& prefix = __impl->prefix;
	if (!prefix.empty() && internal::startsWith(key, prefix))
	{
		auto position = key.find_first_not_of('/', prefix.size());
		relativePath = (position == string::npos) ? string() : key.substr(position);
	}

	auto parts = internal::split('/', relativePath, true);
	if (parts.size() <= 1)
	{
		return relativePath; // the file is at the root
	}
	parts.resize(std::min(__impl->depth, parts.size() - 1));
	return join("/", parts);
}

void Ledger::recordPlanned(const ObjectDescriptor& descriptor, PlanEntry::Status status)
{
	auto groupKey = getGroupKey(descriptor.key);
	if (groupKey.empty())
	{
		return;
	}

	std::lock_guard< std::mutex > guard(__impl->recordsMutex);
	Record& record = __impl->records[groupKey];
	++record.totalFiles;
	record.totalSize += descriptor.size;
	if (status == PlanEntry::Status::AlreadyPresent)
	{
		++record.downloadedFiles;
		record.downloadedSize += descriptor.size;
	}
	record.lastUpdate = __impl->clock.now();
}

void Ledger::recordCompleted(const ObjectDescriptor& descriptor)
{
	auto groupKey = getGroupKey(descriptor.key);
	if (groupKey.empty())
	{
		return;
	}

	{
		std::lock_guard< std::mutex > guard(__impl->recordsMutex);
		Record& record = __impl->records[groupKey];
		++record.downloadedFiles;
		record.downloadedSize += descriptor.size;
		record.lastUpdate = __impl->clock.now();
	}
	flush(false);
}

bool Ledger::flush(bool force)
{
	if (__impl->path.empty())
	{
		return false;
	}

	std::lock_guard< std::mutex > flushGuard(__impl->flushMutex);
	auto now = __impl->clock.now();
	if (!force && now - __impl->lastFlushTime < (time_t)__impl->flushInterval)
	{
		return false;
	}

	auto content = render();
	try
	{
		// "a" doesn't truncate the file before the lock is obtained
		RequiredFile file(__impl->path, "a");
		if (!file.tryLock(LOCK_EX))
		{
			warn2(__("the progress file '%s' is locked by another process, skipped writing it"),
					__impl->path);
			return false;
		}
		file.truncate(0);
		file.put(content);
		file.sync();
		file.lock(LOCK_UN);
	}
	catch (Exception&)
	{
		warn2(__("unable to write the progress file '%s'"), __impl->path);
		return false;
	}
	__impl->lastFlushTime = now;
	if (__impl->debugging)
	{
		debug2("wrote the progress file '%s'", __impl->path);
	}
	return true;
}

Ledger::Summary Ledger::getSummary() const
{
	Summary result;
	std::lock_guard< std::mutex > guard(__impl->recordsMutex);
	FORIT(it, __impl->records)
	{
		const Record& record = it->second;
		++result.totalFolders;
		if (record.downloadedFiles >= record.totalFiles)
		{
			++result.completedFolders;
		}
		result.totalFiles += record.totalFiles;
		result.downloadedFiles += record.downloadedFiles;
		result.totalSize += record.totalSize;
		result.downloadedSize += record.downloadedSize;
	}
	result.pendingFolders = result.totalFolders - result.completedFolders;
	if (result.totalFiles)
	{
		result.overallPercent = result.downloadedFiles * 100 / result.totalFiles;
	}
	return result;
}

std::map< string, Ledger::Record > Ledger::getRecords() const
{
	std::lock_guard< std::mutex > guard(__impl->recordsMutex);
	return __impl->records;
}

string Ledger::render() const
{
	std::lock_guard< std::mutex > guard(__impl->recordsMutex);
	return __impl->renderUnlocked();
}

string Ledger::getProgressLabel(const Record& record)
{
	if (record.downloadedFiles == 0)
	{
		return "pending";
	}
	else if (record.downloadedFiles >= record.totalFiles)
	{
		return "complete";
	}
	else
	{
		return format2("in-progress %u%%", (unsigned int)(record.downloadedFiles * 100 / record.totalFiles));
	}
}

}
