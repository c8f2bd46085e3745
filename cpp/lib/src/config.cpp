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
#include <cctype>
#include <map>
using std::map;

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/info_parser.hpp>

#include <common/common.hpp>

#include <bulkfetch/config.hpp>

#include <internal/filesystem.hpp>

namespace bulkfetch {

namespace internal {

struct ConfigImpl
{
	map< string, string > regularVars;
	map< string, vector< string > > listVars;

	void initializeVariables();
	void readTree(Config*, const string& prefix, const boost::property_tree::ptree&);
};

void ConfigImpl::initializeVariables()
{
	regularVars =
	{
		// object store
		{ "s3::bucket", "umbra-open-data-catalog" },
		{ "s3::prefix", "sar-data/tasks" },
		{ "s3::region", "us-west-2" },
		{ "s3::endpoint", "" },
		{ "s3::access-key", "" },
		{ "s3::secret-key", "" },
		{ "s3::session-token", "" },
		{ "s3::max-keys", "1000" },

		// transport
		{ "acquire::connect-timeout", "15" },
		{ "acquire::read-timeout", "60" },
		{ "acquire::retries", "2" },
		{ "acquire::proxy", "" },
		{ "acquire::user-agent", "" }, // will be set a bit later

		{ "bulkfetch::directory", "." },
		{ "bulkfetch::directory::log", "bulkfetch.log" },
		{ "bulkfetch::planner::cap-bytes", "107374182400000" }, // 100000 GiB
		{ "bulkfetch::planner::max-list", "0" },
		{ "bulkfetch::planner::dry-run", "no" },
		{ "bulkfetch::planner::dry-run::shown", "20" },
		{ "bulkfetch::transfer::max-file-retries", "3" },
		{ "bulkfetch::transfer::max-retry-time", "172800" },
		{ "bulkfetch::transfer::permanent-retry-delay", "5" },
		{ "bulkfetch::transfer::disk-wait", "60" },
		{ "bulkfetch::transfer::min-free-space", "10737418240" },
		{ "bulkfetch::transfer::progress-threshold", "10485760" },
		{ "bulkfetch::transfer::lock-stale-age", "300" },
		{ "bulkfetch::transfer::cleanup-age", "172800" },
		{ "bulkfetch::ledger::path", "" },
		{ "bulkfetch::ledger::depth", "1" },
		{ "bulkfetch::ledger::flush-interval", "10" },
		{ "bulkfetch::worker::log", "yes" },
		{ "bulkfetch::worker::log::levels::planner", "1" },
		{ "bulkfetch::worker::log::levels::transfer", "2" },
		{ "bulkfetch::worker::log::levels::ledger", "1" },
		{ "debug::downloader", "no" },
		{ "debug::planner", "no" },
		{ "debug::ledger", "no" },
		{ "debug::worker", "no" },
		{ "debug::logger", "no" },
		{ "quiet", "no" },
	};

	listVars =
	{
		{ "bulkfetch::planner::exclude", vector< string > {} },
		{ "bulkfetch::transfer::retry-delays", vector< string > { "5", "10", "30", "60", "300" } },
	};
}

void ConfigImpl::readTree(Config* config, const string& prefix,
		const boost::property_tree::ptree& tree)
{
	FORIT(childIt, tree)
	{
		string name = prefix.empty() ? childIt->first : prefix + "::" + childIt->first;
		const auto& subtree = childIt->second;
		const string& value = subtree.data();

		if (config->isList(name))
		{
			if (!value.empty())
			{
				config->setList(name, value);
			}
		}
		else if (!value.empty() || subtree.empty())
		{
			config->setScalar(name, value);
		}
		readTree(config, name, subtree);
	}
}

}

Config::Config()
{
	__impl = new internal::ConfigImpl;
	__impl->initializeVariables();
	setScalar("acquire::user-agent", format2("bulkfetch/%s", libraryVersion));

	const char* systemConfigPath = "/etc/bulkfetch.conf";
	if (internal::fs::fileExists(systemConfigPath))
	{
		try
		{
			readFile(systemConfigPath);
		}
		catch (Exception&)
		{
			warn2(__("skipped the configuration file '%s'"), systemConfigPath);
		}
	}
}

Config::~Config()
{
	delete __impl;
}

Config::Config(const Config& other)
{
	__impl = new internal::ConfigImpl(*other.__impl);
}

Config& Config::operator=(const Config& other)
{
	if (this == &other)
	{
		return *this;
	}
	delete __impl;
	__impl = new internal::ConfigImpl(*other.__impl);
	return *this;
}

void Config::readFile(const string& path)
{
	boost::property_tree::ptree tree;
	try
	{
		boost::property_tree::read_info(path, tree);
	}
	catch (boost::property_tree::info_parser_error& e)
	{
		fatal2(__("unable to parse the configuration file '%s': %s"), path, e.what());
	}
	__impl->readTree(this, "", tree);
}

bool Config::isList(const string& optionName) const
{
	return __impl->listVars.count(optionName);
}

string Config::getString(const string& optionName) const
{
	auto it = __impl->regularVars.find(optionName);
	if (it == __impl->regularVars.cend())
	{
		fatal2(__("an attempt to get the wrong scalar option '%s'"), optionName);
	}
	return it->second;
}

string Config::getPath(const string& optionName) const
{
	auto shallowResult = getString(optionName);
	if (!shallowResult.empty() && shallowResult[0] != '/')
	{
		// relative path -> combine with prefix
		auto doubleColonPosition = optionName.rfind("::");
		if (doubleColonPosition != string::npos)
		{
			auto prefixOptionName = optionName.substr(0, doubleColonPosition);
			if (__impl->regularVars.count(prefixOptionName))
			{
				auto prefixPath = getPath(prefixOptionName);
				if (!prefixPath.empty())
				{
					return prefixPath + '/' + shallowResult;
				}
			}
		}
	}
	return shallowResult;
}

bool Config::getBool(const string& optionName) const
{
	auto result = getString(optionName);
	if (result.empty() || result == "false" || result == "0" || result == "no")
	{
		return false;
	}
	else
	{
		return true;
	}
}

ssize_t Config::getInteger(const string& optionName) const
{
	auto source = getString(optionName);
	if (source.empty())
	{
		return 0;
	}
	ssize_t result = 0;
	try
	{
		result = boost::lexical_cast< ssize_t >(source);
	}
	catch (boost::bad_lexical_cast&)
	{
		fatal2(__("unable to convert '%s' to a number"), source);
	}
	return result;
}

uint64_t Config::getUnsigned(const string& optionName) const
{
	auto source = getString(optionName);
	if (source.empty())
	{
		return 0;
	}
	if (source[0] == '-')
	{
		fatal2(__("the option '%s' cannot be negative"), optionName);
	}
	uint64_t result = 0;
	try
	{
		result = boost::lexical_cast< uint64_t >(source);
	}
	catch (boost::bad_lexical_cast&)
	{
		fatal2(__("unable to convert '%s' to a number"), source);
	}
	return result;
}

vector< string > Config::getList(const string& optionName) const
{
	auto it = __impl->listVars.find(optionName);
	if (it == __impl->listVars.end())
	{
		fatal2(__("an attempt to get the wrong list option '%s'"), optionName);
	}
	return it->second;
}

static string normalizeOptionName(const string& optionName)
{
	string result = optionName;
	FORIT(charIt, result)
	{
		*charIt = std::tolower(static_cast< unsigned char >(*charIt));
	}
	return result;
}

static bool isOwnOption(const string& optionName)
{
	return optionName.compare(0, 11, "bulkfetch::") == 0;
}

void Config::setScalar(const string& optionName, const string& value)
{
	auto normalizedOptionName = normalizeOptionName(optionName);

	if (__impl->regularVars.count(normalizedOptionName))
	{
		__impl->regularVars[normalizedOptionName] = value;
	}
	else if (isOwnOption(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong scalar option '%s'"), optionName);
	}
}

void Config::setList(const string& optionName, const string& value)
{
	auto normalizedOptionName = normalizeOptionName(optionName);

	if (__impl->listVars.count(normalizedOptionName))
	{
		__impl->listVars[normalizedOptionName].push_back(value);
	}
	else if (isOwnOption(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong list option '%s'"), optionName);
	}
}

void Config::clearList(const string& optionName)
{
	auto it = __impl->listVars.find(normalizeOptionName(optionName));
	if (it != __impl->listVars.end())
	{
		it->second.clear();
	}
}

} // namespace
