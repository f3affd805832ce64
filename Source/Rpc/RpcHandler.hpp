/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "Messages.hpp"
#include "Controller/IServiceController.hpp"

// Maps method names onto controller calls
class WRpcHandler
{
	using WMethod = std::function<WResult(std::string const& Args, std::string& OutPayload)>;

	std::shared_ptr<IServiceController>      Controller;
	std::unordered_map<std::string, WMethod> Methods{};

	template <class TArgs, class TReply, class TFunction>
	void Register(char const* Name, TFunction Function)
	{
		Methods.emplace(std::string(WEICHE_METHOD_PREFIX) + Name,
			[Function = std::move(Function)](std::string const& Blob, std::string& OutPayload) -> WResult {
				TArgs Args{};
				if (!UnpackRecord(Blob, Args))
				{
					return WResult::Error(EC_Protocol, "malformed arguments");
				}
				TReply  Reply{};
				WResult Result = Function(Args, Reply);
				if (Result.Ok())
				{
					OutPayload = PackRecord(Reply);
				}
				return Result;
			});
	}

	void RegisterMethods();

public:
	explicit WRpcHandler(std::shared_ptr<IServiceController> Controller_);

	[[nodiscard]] WRpcResponse Handle(WRpcRequest const& Request) const;
};
