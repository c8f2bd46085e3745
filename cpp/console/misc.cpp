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
#include <unistd.h>

#include <sstream>

#include <boost/lexical_cast.hpp>
using boost::lexical_cast;

#include <common/regex.hpp>

#include <bulkfetch/download/progresses/console.hpp>
#include <bulkfetch/system/guard.hpp>

#include "misc.hpp"

bpo::options_description getOptionsDescription()
{
	bpo::options_description options("Options");
	options.add_options()
		("help,h", __("print this help"))
		("version", __("print the version"))
		("bucket", bpo::value< string >(), __("bucket to download from"))
		("prefix", bpo::value< string >(), __("download only keys under this prefix"))
		("region", bpo::value< string >(), __("region of the bucket"))
		("endpoint", bpo::value< string >(), __("S3-compatible endpoint URL, path-style requests"))
		("out", bpo::value< string >(), __("output directory"))
		("cap-gb", bpo::value< double >(), __("maximum total size to download in GiB"))
		("exclude-ext", bpo::value< string >(), __("comma-separated key suffixes to skip"))
		("dryrun", __("show what would be downloaded and exit"))
		("csv", bpo::value< string >(), __("per-folder progress file"))
		("folder-depth", bpo::value< size_t >(), __("folder depth of the progress file"))
		("max-list", bpo::value< size_t >(), __("stop listing after this many objects"))
		("verbose,v", __("print debug messages"))
		("config", bpo::value< string >(), __("read an additional configuration file"))
		("option,o", bpo::value< vector< string > >(), __("set a configuration option, '<option>=<value>'"));
	return options;
}

namespace {

void setListFromCommaSeparated(Config& config, const string& optionName, const string& valuesString)
{
	config.clearList(optionName);
	std::istringstream valueStream(valuesString);
	string value;
	while (std::getline(valueStream, value, ','))
	{
		auto first = value.find_first_not_of(" \t");
		if (first == string::npos)
		{
			continue;
		}
		auto last = value.find_last_not_of(" \t");
		config.setList(optionName, value.substr(first, last - first + 1));
	}
}

}

void applyDirectOption(Config& config, const string& directOption)
{
	static const sregex optionRegex = sregex::compile("(.*?)=(.*)");
	smatch m;
	if (!regex_match(directOption, m, optionRegex))
	{
		fatal2(__("invalid option syntax in '%s' (right is '<option>=<value>')"), directOption);
	}
	string key = m[1];
	string value = m[2];

	static const sregex listOptionNameRegex = sregex::compile("(.*?)::");
	if (regex_match(key, m, listOptionNameRegex))
	{
		// appending to a list option
		config.setList(m[1], value);
	}
	else if (config.isList(key))
	{
		setListFromCommaSeparated(config, key, value);
	}
	else
	{
		config.setScalar(key, value);
	}
}

Action::Type parseCommandLine(int argc, char** argv, Config& config)
{
	auto options = getOptionsDescription();
	bpo::variables_map variablesMap;
	try
	{
		bpo::parsed_options parsed = bpo::command_line_parser(argc, argv).options(options)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.run();
		bpo::store(parsed, variablesMap);
		bpo::notify(variablesMap);
	}
	catch (const bpo::unknown_option& e)
	{
		fatal2(__("unknown option '%s'"), e.get_option_name());
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}

	if (variablesMap.count("help"))
	{
		return Action::ShowHelp;
	}
	if (variablesMap.count("version"))
	{
		return Action::ShowVersion;
	}

	try
	{
		if (variablesMap.count("config"))
		{
			config.readFile(variablesMap["config"].as< string >());
		}

		auto setIfGiven = [&config, &variablesMap](const char* name, const char* optionName)
		{
			if (variablesMap.count(name))
			{
				config.setScalar(optionName, variablesMap[name].as< string >());
			}
		};
		setIfGiven("bucket", "s3::bucket");
		setIfGiven("prefix", "s3::prefix");
		setIfGiven("region", "s3::region");
		setIfGiven("endpoint", "s3::endpoint");
		setIfGiven("out", "bulkfetch::directory");
		setIfGiven("csv", "bulkfetch::ledger::path");

		if (variablesMap.count("cap-gb"))
		{
			auto capGb = variablesMap["cap-gb"].as< double >();
			if (!(capGb > 0))
			{
				fatal2(__("the option '--cap-gb' must be greater than zero"));
			}
			auto capBytes = static_cast< uint64_t >(capGb * 1024 * 1024 * 1024);
			config.setScalar("bulkfetch::planner::cap-bytes", lexical_cast< string >(capBytes));
		}
		if (variablesMap.count("exclude-ext"))
		{
			setListFromCommaSeparated(config, "bulkfetch::planner::exclude",
					variablesMap["exclude-ext"].as< string >());
		}
		if (variablesMap.count("dryrun"))
		{
			config.setScalar("bulkfetch::planner::dry-run", "yes");
		}
		if (variablesMap.count("folder-depth"))
		{
			config.setScalar("bulkfetch::ledger::depth",
					lexical_cast< string >(variablesMap["folder-depth"].as< size_t >()));
		}
		if (variablesMap.count("max-list"))
		{
			config.setScalar("bulkfetch::planner::max-list",
					lexical_cast< string >(variablesMap["max-list"].as< size_t >()));
		}
		if (variablesMap.count("verbose"))
		{
			for (const char* name: { "debug::downloader", "debug::planner", "debug::ledger", "debug::worker" })
			{
				config.setScalar(name, "yes");
			}
		}

		if (variablesMap.count("option"))
		{
			for (const string& directOption: variablesMap["option"].as< vector< string > >())
			{
				applyDirectOption(config, directOption);
			}
		}
	}
	catch (Exception&)
	{
		fatal2(__("error while processing command-line options"));
	}
	return Action::Run;
}

void validateConfig(Config& config)
{
	if (config.getString("s3::bucket").empty())
	{
		fatal2(__("the bucket name cannot be empty"));
	}
	if (!config.getUnsigned("bulkfetch::planner::cap-bytes"))
	{
		fatal2(__("the download cap must be greater than zero"));
	}
	if (!config.getUnsigned("bulkfetch::ledger::depth"))
	{
		fatal2(__("the folder depth must be at least 1"));
	}

	auto outputDirectory = config.getString("bulkfetch::directory");
	if (outputDirectory.empty())
	{
		fatal2(__("the output directory cannot be empty"));
	}
	if (outputDirectory[0] != '/')
	{
		char* currentDirectory = getcwd(NULL, 0);
		if (!currentDirectory)
		{
			fatal2e(__("unable to determine the current directory"));
		}
		outputDirectory = string(currentDirectory) + '/' + outputDirectory;
		free(currentDirectory);
		config.setScalar("bulkfetch::directory", outputDirectory);
	}
	if (!config.getBool("bulkfetch::planner::dry-run"))
	{
		system::Guard::checkWritableDirectory(outputDirectory);
	}
}

shared_ptr< Progress > getDownloadProgress(const Config& config)
{
	return shared_ptr< Progress >(config.getBool("quiet") ? new Progress : new ConsoleProgress);
}

Context::Context(system::CancellationToken& token_, system::ShutdownCoordinator& shutdownCoordinator_)
	: token(token_), shutdownCoordinator(shutdownCoordinator_)
{}

shared_ptr< Config > Context::getConfig()
{
	if (!__config)
	{
		try
		{
			__config.reset(new Config);
		}
		catch (Exception&)
		{
			fatal2(__("error while loading the configuration"));
		}
	}
	return __config;
}
