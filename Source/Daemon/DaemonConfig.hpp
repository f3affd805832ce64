/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "Controller/ControllerFactory.hpp"

struct WDaemonConfig final : TSingleton<WDaemonConfig>
{
	std::string         DataDir{};
	std::string         LogLevel{ "info" };
	WRpcTransportConfig Transport{};
	int                 StatsPollIntervalMs{ 2000 };
	int                 LogCapacity{ 1000 };

	WDaemonConfig();

	// Overrides the current values with the ones present in Path
	bool Load(std::string const& Path);

	void LogConfig() const;

	void ApplyLogLevel() const;

	[[nodiscard]] WControllerOptions GetControllerOptions() const;
};
