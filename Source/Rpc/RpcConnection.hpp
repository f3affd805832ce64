/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <thread>

#include "RpcHandler.hpp"
#include "Socket.hpp"

// One accepted client, served request by request on its own thread
class WRpcConnection
{
	std::shared_ptr<WClientSocket> ClientSocket;
	std::shared_ptr<WRpcHandler>   Handler;

	std::atomic<bool> Running{ false };
	std::thread       ListenThread{};

	void ListenThreadFunction();

public:
	WRpcConnection(std::shared_ptr<WClientSocket> CS, std::shared_ptr<WRpcHandler> Handler_)
		: ClientSocket(std::move(CS)), Handler(std::move(Handler_))
	{
	}

	~WRpcConnection() { Stop(); }

	WRpcConnection(WRpcConnection const&) = delete;
	WRpcConnection& operator=(WRpcConnection const&) = delete;

	void StartListenThread();

	void Stop();

	[[nodiscard]] bool IsRunning() const { return Running; }
};
