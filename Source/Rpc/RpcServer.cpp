/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RpcServer.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

bool WRpcServer::Start()
{
	if (Running)
	{
		return true;
	}

	Listener = Transport->Listen();
	if (!Listener)
	{
		return false;
	}

	spdlog::info("Rpc server listening on {}", Transport->Describe());
	Running = true;
	ListenThread = std::thread(&WRpcServer::ListenThreadFunction, this);
	return true;
}

void WRpcServer::Stop()
{
	bool bWasRunning = Running.exchange(false);
	if (ListenThread.joinable())
	{
		ListenThread.join();
	}

	std::vector<std::unique_ptr<WRpcConnection>> Closing{};
	{
		std::lock_guard Lock(ConnectionsMutex);
		Closing.swap(Connections);
	}
	Closing.clear();

	if (Listener)
	{
		Listener->Close();
		Listener.reset();
	}
	if (bWasRunning)
	{
		Transport->Cleanup();
		spdlog::info("Rpc server stopped");
	}
}

void WRpcServer::ListenThreadFunction()
{
	while (Running)
	{
		bool bTimedOut = false;
		if (auto ClientSocket = Listener->Accept(500, &bTimedOut))
		{
			spdlog::debug("Rpc client connected");
			auto Connection = std::make_unique<WRpcConnection>(ClientSocket, Handler);
			Connection->StartListenThread();

			std::lock_guard Lock(ConnectionsMutex);
			Connections.push_back(std::move(Connection));
		}
		else if (Running && !bTimedOut)
		{
			spdlog::error("Error accepting rpc connection: {} ({})", WErrnoUtil::StrError(), errno);
		}
		RemoveInactiveConnections();
	}
}

void WRpcServer::RemoveInactiveConnections()
{
	std::vector<std::unique_ptr<WRpcConnection>> Finished{};
	{
		std::lock_guard Lock(ConnectionsMutex);
		for (auto It = Connections.begin(); It != Connections.end();)
		{
			if (!(*It)->IsRunning())
			{
				Finished.push_back(std::move(*It));
				It = Connections.erase(It);
			}
			else
			{
				++It;
			}
		}
	}
	// Joined outside the lock
	Finished.clear();
}
