/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RpcClient.hpp"

#include <spdlog/spdlog.h>

#include "Random.hpp"
#include "RpcArgs.hpp"

WResult WRpcClient::Fail(EErrorCode Code, std::string Message)
{
	if (Socket)
	{
		Socket->Close();
		Socket.reset();
	}
	return WResult::Error(Code, std::move(Message));
}

WResult WRpcClient::CallRaw(std::string const& Method, std::string const& Args, std::string& OutPayload)
{
	std::lock_guard Lock(Mutex);
	if (!Socket || !Socket->IsConnected())
	{
		Socket = Transport->Dial(TimeoutMs);
		if (!Socket)
		{
			return WResult::Error(EC_Transport, fmt::format("service not reachable at {}", Transport->Describe()));
		}
	}

	WRpcRequest Request{};
	Request.CallId = WRandom::GenerateCallId();
	Request.Method = Method;
	Request.Args = Args;

	if (Socket->SendFramed(EncodeMessage(MT_RpcRequest, Request)) < 0)
	{
		return Fail(EC_Transport, fmt::format("failed to send {}", Method));
	}

	std::string Frame{};
	switch (Socket->ReceiveFrame(Frame, TimeoutMs))
	{
		case RR_Data:
			break;
		case RR_Timeout:
			return Fail(EC_Transport, fmt::format("timed out waiting for {}", Method));
		case RR_Closed:
			return Fail(EC_Transport, "connection closed by service");
		case RR_Error:
		default:
			return Fail(EC_Transport, fmt::format("failed to receive reply to {}", Method));
	}

	WRpcResponse Response{};
	if (!DecodeMessage(Frame, MT_RpcResponse, Response))
	{
		return Fail(EC_Protocol, fmt::format("malformed reply to {}", Method));
	}
	if (Response.CallId != Request.CallId)
	{
		return Fail(EC_Protocol, fmt::format("reply id {} does not match call {}", Response.CallId, Request.CallId));
	}

	if (!Response.bSuccess)
	{
		return WResult::Error(Response.ErrorCode == EC_Ok ? EC_Protocol : Response.ErrorCode, Response.Error);
	}
	OutPayload = std::move(Response.Payload);
	return WResult::Success();
}

WResult WRpcClient::Ping()
{
	WServiceStatus Status{};
	return Call("GetStatus", WEmptyArgs{}, Status);
}

void WRpcClient::Close()
{
	std::lock_guard Lock(Mutex);
	if (Socket)
	{
		Socket->Close();
		Socket.reset();
	}
}

bool WRpcClient::IsConnected()
{
	std::lock_guard Lock(Mutex);
	return Socket && Socket->IsConnected();
}
