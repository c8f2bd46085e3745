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
#ifndef BULKFETCH_PLANNER_SEEN
#define BULKFETCH_PLANNER_SEEN

/// @file

#include <functional>

#include <bulkfetch/catalog.hpp>
#include <bulkfetch/fwd.hpp>

namespace bulkfetch {

namespace internal {

class PlannerImpl;

}

/// an object selected for the run
struct BULKFETCH_API PlanEntry
{
	enum class Status { Pending, AlreadyPresent, ToDownload };

	ObjectDescriptor descriptor;
	string localPath; ///< where the object is stored locally
	Status status;

	PlanEntry();
};

/// selects a size-capped subset of the catalog
/**
 * The catalog is consumed once, in order. For each object:
 *  - directory placeholders and empty keys are skipped;
 *  - objects whose key ends with an excluded suffix (case-insensitively)
 *    are skipped;
 *  - objects whose relative path is absolute or contains a @c ".." segment
 *    are rejected;
 *  - objects present locally with the same size are @c AlreadyPresent and
 *    don't count against the cap;
 *  - others are @c ToDownload while the cumulative size stays within the
 *    cap, and dropped after that.
 */
class BULKFETCH_API Planner
{
	internal::PlannerImpl* __impl;

	Planner(const Planner&) = delete;
	Planner& operator=(const Planner&) = delete;
 public:
	/// planning parameters
	struct Settings
	{
		string prefix; ///< common key prefix, stripped from local paths
		vector< string > excludedSuffixes;
		uint64_t capBytes; ///< maximum total size of objects to download
		string outputRoot; ///< local directory to store objects in
		size_t maxListed; ///< stop after this many catalog objects, @c 0 = unlimited
		bool debugging; ///< print debug messages about skipped objects

		Settings();
		/// reads @c s3::prefix, @c bulkfetch::directory, @c bulkfetch::planner::* and @c debug::planner options
		explicit Settings(const Config&);
	};
	/// running totals
	struct Counters
	{
		size_t listed; ///< catalog objects consumed
		size_t selected; ///< objects to download
		size_t alreadyPresent;
		size_t excluded; ///< skipped by suffix or as directory placeholders
		size_t rejected; ///< unsafe paths
		size_t overCap; ///< dropped because of the cap
		uint64_t plannedBytes; ///< total size of objects to download
		uint64_t presentBytes; ///< total size of already present objects

		Counters();
	};
	/// receives each accepted entry
	typedef std::function< void (const PlanEntry&) > Observer;

	/// constructor
	/**
	 * @param settings planning parameters
	 * @param token stop request, polled between catalog objects
	 * @param ledger progress ledger to record accepted entries in, may be
	 * @c NULL
	 */
	Planner(const Settings& settings, const system::CancellationToken& token,
			Ledger* ledger = NULL);
	~Planner();

	/// classifies one object
	/**
	 * @param descriptor the object
	 * @param [out] entry the resulting plan entry
	 * @return @c false if the object is not part of the plan
	 */
	bool consider(const ObjectDescriptor& descriptor, PlanEntry& entry);
	/// consumes the catalog
	/**
	 * Stops early, returning the plan built so far, if a stop is requested.
	 *
	 * @param catalog the catalog
	 * @param observer called for each @c ToDownload and @c AlreadyPresent entry
	 * @return @c ToDownload entries, in catalog order
	 */
	vector< PlanEntry > plan(Catalog& catalog, const Observer& observer = Observer());

	const Counters& getCounters() const;

	/// strips @a prefix and the following slashes from @a key
	static string getRelativePath(const string& prefix, const string& key);
	/// is @a relativePath free of absolute paths and @c ".." segments
	static bool isSafeRelativePath(const string& relativePath);
};

}

#endif
