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
#ifndef MISC_SEEN
#define MISC_SEEN

#include "common.hpp"

#include <boost/program_options.hpp>
namespace bpo = boost::program_options;

#include <bulkfetch/system/shutdown.hpp>

class Context
{
	shared_ptr< Config > __config;
 public:
	Context(system::CancellationToken&, system::ShutdownCoordinator&);

	shared_ptr< Config > getConfig();

	system::CancellationToken& token;
	system::ShutdownCoordinator& shutdownCoordinator;
};

struct Action
{
	enum Type { Run, ShowHelp, ShowVersion };
};

bpo::options_description getOptionsDescription();
Action::Type parseCommandLine(int argc, char** argv, Config&);
void applyDirectOption(Config&, const string& directOption);
void validateConfig(Config&);

shared_ptr< Progress > getDownloadProgress(const Config&);

#endif
