/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "Messages.hpp"
#include "RpcTransport.hpp"

class WRpcClient
{
	std::shared_ptr<IRpcTransport> Transport;
	int                            TimeoutMs{ DefaultTimeoutMs };

	std::mutex                     Mutex{};
	std::shared_ptr<WClientSocket> Socket{};

	// Socket is dropped on any failure, the next call dials again
	WResult Fail(EErrorCode Code, std::string Message);

public:
	static constexpr int DefaultTimeoutMs{ 5000 };

	explicit WRpcClient(std::shared_ptr<IRpcTransport> Transport_, int TimeoutMs_ = DefaultTimeoutMs)
		: Transport(std::move(Transport_)), TimeoutMs(TimeoutMs_)
	{
	}

	WResult CallRaw(std::string const& Method, std::string const& Args, std::string& OutPayload);

	template <class TArgs, class TReply>
	WResult Call(char const* Method, TArgs const& Args, TReply& OutReply)
	{
		std::string Payload{};
		WResult     Result = CallRaw(std::string(WEICHE_METHOD_PREFIX) + Method, PackRecord(Args), Payload);
		if (!Result.Ok())
		{
			return Result;
		}
		if (!UnpackRecord(Payload, OutReply))
		{
			return WResult::Error(EC_Protocol, fmt::format("malformed reply to {}", Method));
		}
		return Result;
	}

	// GetStatus round trip
	WResult Ping();

	void Close();

	[[nodiscard]] bool IsConnected();
};
