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
#ifndef BULKFETCH_SYSTEM_WORKER_SEEN
#define BULKFETCH_SYSTEM_WORKER_SEEN

/// @file

#include <bulkfetch/common.hpp>
#include <bulkfetch/fwd.hpp>
#include <bulkfetch/planner.hpp>

namespace bulkfetch {

namespace internal {

class WorkerImpl;

}

namespace system {

/// drives a run: plans it and transfers the planned objects one by one
class BULKFETCH_API Worker
{
	internal::WorkerImpl* __impl;

	Worker(const Worker&);
	Worker& operator=(const Worker&);
 public:
	/// results of the transfer phase
	struct Summary
	{
		size_t downloaded; ///< objects put in place
		uint64_t downloadedBytes; ///< total size of downloaded objects
		size_t failed; ///< objects given up on
		size_t locked; ///< objects skipped because of a foreign lock
		size_t notAttempted; ///< objects left after an interruption
		bool interrupted; ///< was a stop requested during the phase
		vector< string > failedKeys; ///< keys of failed and locked objects

		Summary();
	};

	/// constructor
	/**
	 * @param config configuration
	 * @param method transport
	 * @param token stop request to poll
	 * @param ledger progress ledger, may be empty
	 * @param clock time source
	 */
	Worker(const shared_ptr< const Config >& config, const shared_ptr< download::Method >& method,
			const CancellationToken& token, const shared_ptr< Ledger >& ledger,
			const shared_ptr< const Clock >& clock);
	virtual ~Worker();

	/**
	 * Consumes the catalog and selects the objects to download.
	 *
	 * Throws Exception if the catalog cannot be enumerated.
	 *
	 * @param catalog the catalog
	 * @param observer called for every accepted entry
	 * @return entries to download
	 */
	vector< PlanEntry > plan(Catalog& catalog, const Planner::Observer& observer = Planner::Observer());
	/**
	 * Shouldn't be called before @ref plan.
	 *
	 * @return counters of the last planning
	 */
	const Planner::Counters& getPlanCounters() const;

	/**
	 * Removes staging files abandoned long ago under the output directory.
	 *
	 * @return the number of removed files
	 */
	size_t cleanup();

	/**
	 * Transfers the planned objects in order. Per-object failures don't stop
	 * the run; a stop request does.
	 *
	 * @param plan entries to download
	 * @param progress progress meter
	 */
	Summary download(const vector< PlanEntry >& plan, const shared_ptr< download::Progress >& progress);
};

}
}

#endif
