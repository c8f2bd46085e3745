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
#include <bulkfetch/config.hpp>
#include <bulkfetch/ledger.hpp>
#include <bulkfetch/planner.hpp>
#include <bulkfetch/system/shutdown.hpp>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>

namespace bulkfetch {

PlanEntry::PlanEntry()
	: status(Status::Pending)
{}

Planner::Settings::Settings()
	: capBytes(0), maxListed(0), debugging(false)
{}

Planner::Settings::Settings(const Config& config)
	: prefix(config.getString("s3::prefix"))
	, capBytes(config.getUnsigned("bulkfetch::planner::cap-bytes"))
	, outputRoot(config.getPath("bulkfetch::directory"))
	, maxListed(config.getUnsigned("bulkfetch::planner::max-list"))
	, debugging(config.getBool("debug::planner"))
{
	for (const string& suffix: config.getList("bulkfetch::planner::exclude"))
	{
		excludedSuffixes.push_back(suffix);
	}
}

Planner::Counters::Counters()
	: listed(0), selected(0), alreadyPresent(0), excluded(0), rejected(0), overCap(0)
	, plannedBytes(0), presentBytes(0)
{}

namespace internal {

class PlannerImpl
{
 public:
	Planner::Settings settings;
	const system::CancellationToken& token;
	Ledger* ledger;
	Planner::Counters counters;

	PlannerImpl(const Planner::Settings&, const system::CancellationToken&, Ledger*);
	bool isExcluded(const string& key) const;
	bool isPresent(const string& localPath, uint64_t size) const;
};

PlannerImpl::PlannerImpl(const Planner::Settings& settings_,
		const system::CancellationToken& token_, Ledger* ledger_)
	: settings(settings_), token(token_), ledger(ledger_)
{
	vector< string > suffixes;
	for (const string& suffix: settings.excludedSuffixes)
	{
		auto normalized = toLower(trim(suffix));
		if (!normalized.empty())
		{
			suffixes.push_back(normalized);
		}
	}
	settings.excludedSuffixes.swap(suffixes);

	auto& root = settings.outputRoot;
	while (root.size() > 1 && *root.rbegin() == '/')
	{
		root.erase(root.end() - 1);
	}
}

bool PlannerImpl::isExcluded(const string& key) const
{
	if (settings.excludedSuffixes.empty())
	{
		return false;
	}
	auto lowerKey = toLower(key);
	for (const string& suffix: settings.excludedSuffixes)
	{
		if (endsWith(lowerKey, suffix))
		{
			return true;
		}
	}
	return false;
}

bool PlannerImpl::isPresent(const string& localPath, uint64_t size) const
{
	try
	{
		return fs::fileExists(localPath) && fs::fileSize(localPath) == size;
	}
	catch (Exception&)
	{
		return false; // not a regular file, will be replaced
	}
}

}

Planner::Planner(const Settings& settings, const system::CancellationToken& token, Ledger* ledger)
	: __impl(new internal::PlannerImpl(settings, token, ledger))
{}

Planner::~Planner()
{
	delete __impl;
}

string Planner::getRelativePath(const string& prefix, const string& key)
{
	string result = key;
	if (!prefix.empty() && internal::startsWith(key, prefix))
	{
		auto position = key.find_first_not_of('/', prefix.size());
		result = (position == string::npos) ? string() : key.substr(position);
	}
	return result;
}

bool Planner::isSafeRelativePath(const string& relativePath)
{
	if (relativePath.empty() || relativePath[0] == '/')
	{
		return false;
	}
	for (const string& segment: internal::split('/', relativePath, true))
	{
		if (segment == "..")
		{
			return false;
		}
	}
	return true;
}

bool Planner::consider(const ObjectDescriptor& descriptor, PlanEntry& entry)
{
	auto& counters = __impl->counters;
	const auto& settings = __impl->settings;
	const string& key = descriptor.key;

	if (key.empty() || *key.rbegin() == '/' || __impl->isExcluded(key))
	{
		++counters.excluded;
		if (settings.debugging)
		{
			debug2("excluded the object '%s'", key);
		}
		return false;
	}

	auto relativePath = getRelativePath(settings.prefix, key);
	if (!isSafeRelativePath(relativePath))
	{
		++counters.rejected;
		warn2(__("skipped the object '%s': unsafe local path"), key);
		return false;
	}

	entry.descriptor = descriptor;
	entry.localPath = settings.outputRoot + '/' + relativePath;

	if (__impl->isPresent(entry.localPath, descriptor.size))
	{
		entry.status = PlanEntry::Status::AlreadyPresent;
		++counters.alreadyPresent;
		counters.presentBytes += descriptor.size;
		if (settings.debugging)
		{
			debug2("the object '%s' is already present at '%s'", key, entry.localPath);
		}
	}
	else if (descriptor.size <= settings.capBytes - counters.plannedBytes)
	{
		entry.status = PlanEntry::Status::ToDownload;
		++counters.selected;
		counters.plannedBytes += descriptor.size;
	}
	else
	{
		++counters.overCap;
		if (settings.debugging)
		{
			debug2("the object '%s' (%s) doesn't fit into the cap", key,
					humanReadableSizeString(descriptor.size));
		}
		return false;
	}

	if (__impl->ledger)
	{
		__impl->ledger->recordPlanned(descriptor, entry.status);
	}
	return true;
}

vector< PlanEntry > Planner::plan(Catalog& catalog, const Observer& observer)
{
	vector< PlanEntry > result;
	auto& counters = __impl->counters;
	const auto maxListed = __impl->settings.maxListed;

	ObjectDescriptor descriptor;
	while (!__impl->token.isRequested())
	{
		if (maxListed && counters.listed >= maxListed)
		{
			break;
		}
		if (!catalog.next(descriptor))
		{
			break;
		}
		++counters.listed;

		PlanEntry entry;
		if (!consider(descriptor, entry))
		{
			continue;
		}
		if (observer)
		{
			observer(entry);
		}
		if (entry.status == PlanEntry::Status::ToDownload)
		{
			result.push_back(std::move(entry));
		}
	}
	return result;
}

const Planner::Counters& Planner::getCounters() const
{
	return __impl->counters;
}

}
