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
#ifndef BULKFETCH_LEDGER_SEEN
#define BULKFETCH_LEDGER_SEEN

/// @file

#include <ctime>
#include <map>

#include <bulkfetch/planner.hpp>

namespace bulkfetch {

namespace internal {

class LedgerImpl;

}

/// per-folder download progress, persisted as a CSV file
/**
 * Objects are grouped by the first @a depth folders of their key relative to
 * the prefix; an object directly under the prefix is a group of its own.
 * The CSV file is rewritten wholesale on each flush, which happens at most
 * once per flush interval unless forced.
 *
 * Thread-safe.
 */
class BULKFETCH_API Ledger
{
	internal::LedgerImpl* __impl;

	Ledger(const Ledger&) = delete;
	Ledger& operator=(const Ledger&) = delete;
 public:
	/// progress of one group
	struct Record
	{
		uint64_t totalFiles;
		uint64_t totalSize;
		uint64_t downloadedFiles;
		uint64_t downloadedSize;
		time_t lastUpdate;

		Record();
	};
	/// totals over all groups
	struct Summary
	{
		size_t totalFolders;
		size_t completedFolders;
		size_t pendingFolders;
		uint64_t totalFiles;
		uint64_t downloadedFiles;
		uint64_t totalSize;
		uint64_t downloadedSize;
		unsigned int overallPercent; ///< by file count

		Summary();
	};

	/// constructor
	/**
	 * @param path CSV file path, empty to keep the progress in memory only
	 * @param prefix key prefix stripped before grouping
	 * @param depth number of leading folders forming a group key
	 * @param flushInterval minimal number of seconds between non-forced flushes
	 * @param clock time source, must outlive the object
	 * @param debugging print debug messages about writes of the file
	 */
	Ledger(const string& path, const string& prefix, size_t depth, size_t flushInterval,
			const Clock& clock, bool debugging = false);
	~Ledger();

	/// returns the group key for the object key @a key, empty if none
	string getGroupKey(const string& key) const;

	/// accounts an object accepted by the planner
	/**
	 * @c AlreadyPresent objects count as downloaded too.
	 */
	void recordPlanned(const ObjectDescriptor&, PlanEntry::Status);
	/// accounts a downloaded object, flushing if the flush interval elapsed
	void recordCompleted(const ObjectDescriptor&);
	/// writes the CSV file
	/**
	 * Skipped, if the flush interval didn't elapse since the last write and
	 * @a force is @c false, or if the file is locked by somebody else.
	 *
	 * @return whether the file was written
	 */
	bool flush(bool force);

	Summary getSummary() const;
	std::map< string, Record > getRecords() const;
	/// returns the CSV representation of the current state
	string render() const;

	/// returns @c "pending", @c "complete" or @c "in-progress N%"
	static string getProgressLabel(const Record&);
};

}

#endif
