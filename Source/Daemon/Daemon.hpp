/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>

#include "Singleton.hpp"
#include "Controller/LocalController.hpp"
#include "Rpc/RpcServer.hpp"

class WDaemon : public TSingleton<WDaemon>
{
	std::shared_ptr<WLocalController> Controller{};
	std::shared_ptr<WRpcServer>       RpcServer{};

public:
	bool InitController();

	// False leaves the daemon running its rules without remote control
	bool InitRpcServer();

	void RunLoop();

	void Shutdown();

	[[nodiscard]] std::shared_ptr<WLocalController> const& GetController() const { return Controller; }
};
