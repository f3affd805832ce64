/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RpcConnection.hpp"

#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

void WRpcConnection::ListenThreadFunction()
{
	std::string Frame{};
	while (Running)
	{
		EReceiveResult Received = ClientSocket->ReceiveFrame(Frame, 500);
		if (Received == RR_Timeout)
		{
			continue;
		}
		if (Received != RR_Data)
		{
			break;
		}

		WRpcRequest  Request{};
		WRpcResponse Response{};
		if (!DecodeMessage(Frame, MT_RpcRequest, Request))
		{
			// Without a readable request the stream cannot be trusted anymore
			Response.ErrorCode = EC_Protocol;
			Response.Error = "malformed request";
			ClientSocket->SendFramed(EncodeMessage(MT_RpcResponse, Response));
			break;
		}

		Response = Handler->Handle(Request);
		if (ClientSocket->SendFramed(EncodeMessage(MT_RpcResponse, Response)) < 0)
		{
			spdlog::warn("Failed to send response to {}: {}", Request.Method, WErrnoUtil::StrError());
			break;
		}
	}
	Running = false;
	spdlog::debug("Rpc client disconnected");
}

void WRpcConnection::StartListenThread()
{
	Running = true;
	ListenThread = std::thread(&WRpcConnection::ListenThreadFunction, this);
}

void WRpcConnection::Stop()
{
	Running = false;
	ClientSocket->Shutdown();
	if (ListenThread.joinable())
	{
		ListenThread.join();
	}
	ClientSocket->Close();
}
