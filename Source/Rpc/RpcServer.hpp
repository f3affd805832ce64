/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "RpcConnection.hpp"
#include "RpcTransport.hpp"

class WRpcServer
{
	std::shared_ptr<IRpcTransport> Transport;
	std::shared_ptr<WRpcHandler>   Handler;

	std::unique_ptr<WServerSocket> Listener{};
	std::atomic<bool>              Running{ false };
	std::thread                    ListenThread{};

	std::mutex                                   ConnectionsMutex{};
	std::vector<std::unique_ptr<WRpcConnection>> Connections{};

	void ListenThreadFunction();
	void RemoveInactiveConnections();

public:
	WRpcServer(std::shared_ptr<IRpcTransport> Transport_, std::shared_ptr<WRpcHandler> Handler_)
		: Transport(std::move(Transport_)), Handler(std::move(Handler_))
	{
	}

	~WRpcServer() { Stop(); }

	WRpcServer(WRpcServer const&) = delete;
	WRpcServer& operator=(WRpcServer const&) = delete;

	// False if the transport could not claim an endpoint
	bool Start();

	// Closes the listener and every connection, then removes the endpoint files
	void Stop();

	[[nodiscard]] bool IsRunning() const { return Running; }

	[[nodiscard]] std::shared_ptr<IRpcTransport> const& GetTransport() const { return Transport; }
};
