/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <string>

#include "LocalController.hpp"
#include "RemoteController.hpp"

struct WControllerOptions
{
	WRpcTransportConfig Transport{};
	std::string         DataDir{};
	WEngineOptions      Engine{};
	int                 PingTimeoutMs{ 1000 };
	int                 CallTimeoutMs{ WRpcClient::DefaultTimeoutMs };
};

struct WControllerSelection
{
	std::shared_ptr<IServiceController> Controller{};

	// Only set when rules run in this process
	std::shared_ptr<WLocalController> Local{};

	[[nodiscard]] bool IsRemote() const { return Controller && !Local; }
};

class WControllerFactory
{
public:
	// Binds to the daemon if it answers a ping, otherwise hosts the rules locally
	static WResult Create(WControllerOptions const& Options, WControllerSelection& OutSelection);

	// Store, engine and local controller, already initialized
	static WResult CreateLocal(WControllerOptions const& Options, std::shared_ptr<WLocalController>& OutLocal);
};
