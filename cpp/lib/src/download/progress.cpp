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
#include <list>
#include <map>

#include <common/common.hpp>

#include <bulkfetch/download/progress.hpp>

namespace bulkfetch {

namespace internal {

typedef download::Progress::DownloadRecord DownloadRecord;

using std::map;
using std::list;

class ProgressImpl
{
	// for download speed counting
	struct FetchedChunk
	{
		struct timespec timeSpec;
		size_t size;
	};
	list< FetchedChunk > fetchedChunks;
 public:
	ProgressImpl();
	void addChunk(size_t size);
	size_t getDownloadSpeed() const;

	uint64_t fetchedSize;
	size_t nextDownloadNumber;
	size_t totalCount;
	time_t startTimestamp;
	map< string, DownloadRecord > nowDownloading;
};

ProgressImpl::ProgressImpl()
	: fetchedSize(0), nextDownloadNumber(1), totalCount(0), startTimestamp(time(NULL))
{}

static struct timespec getCurrentTimeSpec()
{
	struct timespec currentTimeSpec;
	if (clock_gettime(CLOCK_MONOTONIC, &currentTimeSpec) == -1)
	{
		warn2e(__("%s() failed"), "clock_gettime");
		currentTimeSpec.tv_sec = time(NULL);
		currentTimeSpec.tv_nsec = 0;
	}
	return currentTimeSpec;
}

static float getTimeSpecDiff(const timespec& oldValue, const timespec& newValue)
{
	float result = newValue.tv_sec - oldValue.tv_sec;
	result += float(newValue.tv_nsec - oldValue.tv_nsec) / (1000*1000*1000);
	return result;
}

void ProgressImpl::addChunk(size_t size)
{
	FetchedChunk chunk;
	chunk.size = size;

	auto currentTimeSpec = getCurrentTimeSpec();
	chunk.timeSpec = currentTimeSpec;
	fetchedChunks.push_back(std::move(chunk));

	// cleaning old chunks
	FORIT(it, fetchedChunks)
	{
		if (getTimeSpecDiff(it->timeSpec, currentTimeSpec) < download::Progress::speedCalculatingAccuracy)
		{
			fetchedChunks.erase(fetchedChunks.begin(), it);
			break;
		}
	}
}

size_t ProgressImpl::getDownloadSpeed() const
{
	auto currentTimeSpec = getCurrentTimeSpec();

	size_t fetchedBytes = 0;
	FORIT(it, fetchedChunks)
	{
		if (getTimeSpecDiff(it->timeSpec, currentTimeSpec) < download::Progress::speedCalculatingAccuracy)
		{
			fetchedBytes += it->size;
		}
	}

	return fetchedBytes / download::Progress::speedCalculatingAccuracy;
}

}

namespace download {

float Progress::speedCalculatingAccuracy = 16;

Progress::Progress()
	: __impl(new internal::ProgressImpl)
{}

Progress::~Progress()
{
	delete __impl;
}

void Progress::setTotalCount(size_t count)
{
	__impl->totalCount = count;
}

void Progress::start(const string& key, uint64_t size)
{
	DownloadRecord& record = __impl->nowDownloading[key];
	record.number = __impl->nextDownloadNumber++;
	record.size = size;
	record.initialOffset = 0;
	record.downloadedSize = 0;
	record.detailed = false;

	newDownloadHook(key, record);
	updateHook(true);
}

void Progress::transfer(const string& key, uint64_t offset, bool detailed)
{
	auto recordIt = __impl->nowDownloading.find(key);
	if (recordIt == __impl->nowDownloading.end())
	{
		fatal2i("download progress: received a transfer for a not started download, key '%s'", key);
	}
	DownloadRecord& record = recordIt->second;
	record.initialOffset = offset;
	record.downloadedSize = offset;
	record.detailed = detailed;

	transferHook(key, record);
	updateHook(true);
}

void Progress::downloading(const string& key, uint64_t chunkSize)
{
	auto recordIt = __impl->nowDownloading.find(key);
	if (recordIt == __impl->nowDownloading.end())
	{
		fatal2i("download progress: received an info for a not started download, key '%s'", key);
	}
	recordIt->second.downloadedSize += chunkSize;
	__impl->fetchedSize += chunkSize;
	__impl->addChunk(chunkSize);
	updateHook(false);
}

void Progress::retry(const string& key, const RetryInfo& retryInfo)
{
	retryHook(key, retryInfo);
	updateHook(true);
}

void Progress::done(const string& key, const string& result)
{
	finishedDownloadHook(key, result);
	__impl->nowDownloading.erase(key);
	updateHook(true);
}

void Progress::finish()
{
	finishHook();
}

const std::map< string, Progress::DownloadRecord >& Progress::getDownloadRecords() const
{
	return __impl->nowDownloading;
}

size_t Progress::getTotalCount() const
{
	return __impl->totalCount;
}

uint64_t Progress::getOverallFetchedSize() const
{
	return __impl->fetchedSize;
}

size_t Progress::getOverallDownloadTime() const
{
	return time(NULL) - __impl->startTimestamp;
}

size_t Progress::getDownloadSpeed() const
{
	return __impl->getDownloadSpeed();
}

void Progress::newDownloadHook(const string&, const DownloadRecord&)
{}

void Progress::transferHook(const string&, const DownloadRecord&)
{}

void Progress::retryHook(const string&, const RetryInfo&)
{}

void Progress::finishedDownloadHook(const string&, const string&)
{}

void Progress::updateHook(bool)
{}

void Progress::finishHook()
{}

}
}
