/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"
#include "DaemonConfig.hpp"

#include <spdlog/spdlog.h>

#include "SignalHandler.hpp"

int main()
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto const& Config = WDaemonConfig::GetInstance();
	Config.ApplyLogLevel();
	spdlog::info("Weiche daemon starting");
	Config.LogConfig();

	// Installs the stop handlers before any worker thread exists
	WSignalHandler::GetInstance();

	if (!WDaemon::GetInstance().InitController())
	{
		return -1;
	}
	WDaemon::GetInstance().InitRpcServer();

	WDaemon::GetInstance().RunLoop();
	spdlog::info("Weiche daemon stopping");
	WDaemon::GetInstance().Shutdown();
	spdlog::info("Weiche daemon stopped");
	return 0;
}
