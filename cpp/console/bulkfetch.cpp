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
#include <clocale>
#include <iostream>
using std::cout;
using std::endl;

#include <unistd.h>

#include "handlers.hpp"

void showOwnVersion();
void showHelp(const char*);

int main(int argc, char* argv[])
{
	setlocale(LC_ALL, "");
	bulkfetch::messageFd = STDERR_FILENO;

	try
	{
		// must exist before any other thread is started
		system::CancellationToken token;
		system::ShutdownCoordinator shutdownCoordinator(token);

		Context context(token, shutdownCoordinator);
		auto action = parseCommandLine(argc, argv, *context.getConfig());
		if (action == Action::ShowHelp)
		{
			showHelp(argv[0]);
			return 0;
		}
		if (action == Action::ShowVersion)
		{
			showOwnVersion();
			return 0;
		}
		validateConfig(*context.getConfig());

		try
		{
			return ::download(context);
		}
		catch (Exception&)
		{
			fatal2(__("error performing the download"));
		}
	}
	catch (Exception&)
	{
		return 1;
	}
	return 255; // not reached
}

void showOwnVersion()
{
	#define QUOTED(x) QUOTED_(x)
	#define QUOTED_(x) # x
	cout << "executable: " << QUOTED(BULKFETCH_VERSION) << endl;
	#undef QUOTED
	#undef QUOTED_
	cout << "library: " << bulkfetch::libraryVersion << endl;
}

void showHelp(const char* argv0)
{
	cout << format2(__("Usage: %s [<options>]"), argv0) << endl;
	cout << __("Downloads objects of an S3 bucket prefix into a local directory, resuming interrupted transfers.") << endl;
	cout << endl;
	cout << getOptionsDescription() << endl;
}
