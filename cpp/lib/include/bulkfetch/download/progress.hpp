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
#ifndef BULKFETCH_DOWNLOAD_PROGRESS_SEEN
#define BULKFETCH_DOWNLOAD_PROGRESS_SEEN

/// @file

#include <map>

#include <bulkfetch/common.hpp>

namespace bulkfetch {

namespace internal {

class ProgressImpl;

}

namespace download {

/// download progress meter
/**
 * Receives transfer events and forwards them to the hooks. Subclasses
 * override the hooks to present the progress.
 */
class BULKFETCH_API Progress
{
	internal::ProgressImpl* __impl;
 public:
	/// download element
	struct DownloadRecord
	{
		size_t number; ///< ordinal number of the download, starting from 1
		uint64_t size; ///< expected object size
		uint64_t initialOffset; ///< byte offset the current attempt started from
		uint64_t downloadedSize; ///< bytes present in the staging file
		bool detailed; ///< is the object big enough for a detailed progress
	};
	/// retry notice
	struct RetryInfo
	{
		bool transient; ///< transient (network) or permanent error
		size_t attempt; ///< counter of errors of this kind for the object
		size_t limit; ///< maximum of such errors, @c 0 if unlimited
		size_t delay; ///< seconds to wait before the next attempt
		string reason; ///< shortened error description
		bool reachable; ///< whether the store accepted connections after the error
	};
 protected:
	const std::map< string, DownloadRecord >& getDownloadRecords() const;
	size_t getTotalCount() const;
	uint64_t getOverallFetchedSize() const;
	size_t getOverallDownloadTime() const;
	size_t getDownloadSpeed() const;

	virtual void newDownloadHook(const string& key, const DownloadRecord& downloadRecord);
	virtual void transferHook(const string& key, const DownloadRecord& downloadRecord);
	virtual void retryHook(const string& key, const RetryInfo& retryInfo);
	virtual void finishedDownloadHook(const string& key, const string& result);
	virtual void updateHook(bool immediate);
	virtual void finishHook();
 public:
	/// constructor
	Progress();

	/// amount of seconds considered while calculating a download speed
	static float speedCalculatingAccuracy;

	/// sets the number of downloads planned
	void setTotalCount(size_t count);

	/// @cond
	void start(const string& key, uint64_t size);
	void transfer(const string& key, uint64_t offset, bool detailed);
	void downloading(const string& key, uint64_t chunkSize);
	void retry(const string& key, const RetryInfo& retryInfo);
	void done(const string& key, const string& result);
	void finish();
	/// @endcond

	/// destructor
	virtual ~Progress();
};

}
}

#endif
