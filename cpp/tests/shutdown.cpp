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
#include <csignal>

#include <unistd.h>

#include <bulkfetch/system/shutdown.hpp>

#include <gtest/gtest.h>

#include "fakes.hpp"

namespace bulkfetch {
namespace test {
namespace {

using system::CancellationToken;
using system::ShutdownCoordinator;
using system::ScopedForcedExitAction;

TEST(CancellationTokenTest, RequestIsSticky)
{
	CancellationToken token;
	EXPECT_FALSE(token.isRequested());
	token.request();
	EXPECT_TRUE(token.isRequested());
	token.request();
	EXPECT_TRUE(token.isRequested());
}

TEST(ShutdownCoordinatorTest, FirstSignalRequestsStop)
{
	CancellationToken token;
	bool forcedExit = false;
	{
		ShutdownCoordinator coordinator(token);
		coordinator.setForcedExitAction([&forcedExit]() { forcedExit = true; });
		EXPECT_EQ(0u, coordinator.getSignalCount());

		coordinator.notify(SIGINT);
		EXPECT_TRUE(token.isRequested());
		EXPECT_EQ(1u, coordinator.getSignalCount());
	}
	EXPECT_FALSE(forcedExit);
}

TEST(ShutdownCoordinatorTest, StopsCleanlyWithoutSignals)
{
	CancellationToken token;
	{
		ShutdownCoordinator coordinator(token);
	}
	EXPECT_FALSE(token.isRequested());
}

TEST(ShutdownCoordinatorDeathTest, SecondSignalRunsScopedAction)
{
	TemporaryDirectory directory;
	auto markerPath = directory / "marker";
	EXPECT_EXIT(
	{
		CancellationToken token;
		ShutdownCoordinator coordinator(token);
		ScopedForcedExitAction action(coordinator,
				[&markerPath]() { writeFile(markerPath, "ran"); });
		coordinator.notify(SIGINT);
		coordinator.notify(SIGINT);
	}, ::testing::ExitedWithCode(1), "");
	EXPECT_EQ(0, access(markerPath.c_str(), F_OK));
}

TEST(ShutdownCoordinatorDeathTest, ScopedActionIsClearedOnScopeExit)
{
	TemporaryDirectory directory;
	auto markerPath = directory / "marker";
	EXPECT_EXIT(
	{
		CancellationToken token;
		ShutdownCoordinator coordinator(token);
		{
			ScopedForcedExitAction action(coordinator,
					[&markerPath]() { writeFile(markerPath, "ran"); });
		}
		coordinator.notify(SIGINT);
		coordinator.notify(SIGINT);
	}, ::testing::ExitedWithCode(1), "");
	EXPECT_NE(0, access(markerPath.c_str(), F_OK));
}

}
}
}
