/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

enum EErrorCode : int32_t
{
	EC_Ok = 0,
	EC_AlreadyRunning,
	EC_NotRunning,
	EC_Validation,
	EC_Build,
	EC_RuleNotFound,
	EC_RuleExists,
	EC_ChainNotFound,
	EC_ChainExists,
	EC_ChainInUse,
	EC_StatsNotFound,
	EC_Storage,
	EC_Transport,
	EC_Protocol,
	EC_UnknownMethod
};

inline char const* ErrorCodeToString(EErrorCode Code)
{
	switch (Code)
	{
		case EC_Ok:
			return "ok";
		case EC_AlreadyRunning:
			return "already running";
		case EC_NotRunning:
			return "not running";
		case EC_Validation:
			return "validation";
		case EC_Build:
			return "build";
		case EC_RuleNotFound:
			return "rule not found";
		case EC_RuleExists:
			return "rule exists";
		case EC_ChainNotFound:
			return "chain not found";
		case EC_ChainExists:
			return "chain exists";
		case EC_ChainInUse:
			return "chain in use";
		case EC_StatsNotFound:
			return "stats not found";
		case EC_Storage:
			return "storage";
		case EC_Transport:
			return "transport";
		case EC_Protocol:
			return "protocol";
		case EC_UnknownMethod:
			return "unknown method";
		default:
			return "unknown";
	}
}

// Outcome of a control plane operation. Data travels through out-params.
struct [[nodiscard]] WResult
{
	EErrorCode  Code{ EC_Ok };
	std::string Message{};

	[[nodiscard]] bool Ok() const { return Code == EC_Ok; }

	[[nodiscard]] bool IsTransportError() const { return Code == EC_Transport || Code == EC_Protocol; }

	static WResult Success() { return {}; }

	static WResult Error(EErrorCode Code_, std::string Message_) { return WResult{ Code_, std::move(Message_) }; }

	static WResult RuleNotFound() { return Error(EC_RuleNotFound, "rule not found"); }
	static WResult RuleExists() { return Error(EC_RuleExists, "rule already exists"); }
	static WResult ChainNotFound() { return Error(EC_ChainNotFound, "chain not found"); }
	static WResult ChainExists() { return Error(EC_ChainExists, "chain already exists"); }
	static WResult ChainInUse() { return Error(EC_ChainInUse, "chain is in use by one or more rules"); }
	static WResult NotRunning() { return Error(EC_NotRunning, "service is not running"); }
	static WResult AlreadyRunning() { return Error(EC_AlreadyRunning, "service is already running"); }

	static WResult Validation(std::string const& Field, int Index, std::string const& Msg)
	{
		if (Index >= 0)
		{
			return Error(EC_Validation, fmt::format("validation error on {}[{}]: {}", Field, Index, Msg));
		}
		return Error(EC_Validation, fmt::format("validation error on {}: {}", Field, Msg));
	}

	// Engine errors carry the operation and the rule they happened on
	static WResult Engine(
		std::string const& RuleId, std::string const& Op, std::string const& Msg, std::string const& Cause = {})
	{
		if (Cause.empty())
		{
			return Error(EC_Build, fmt::format("engine error [{}] on rule {}: {}", Op, RuleId, Msg));
		}
		return Error(EC_Build, fmt::format("engine error [{}] on rule {}: {} ({})", Op, RuleId, Msg, Cause));
	}

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Code, Message);
	}
};
