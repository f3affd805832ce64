/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <cereal/cereal.hpp>

#include "Types.hpp"

enum ELogLevel : uint8_t
{
	LL_Debug,
	LL_Info,
	LL_Warn,
	LL_Error
};

inline char const* LogLevelToString(ELogLevel Level)
{
	switch (Level)
	{
		case LL_Debug:
			return "debug";
		case LL_Info:
			return "info";
		case LL_Warn:
			return "warn";
		case LL_Error:
			return "error";
		default:
			return "unknown";
	}
}

struct WLogEntry
{
	WLogId      Id{ 0 };
	std::string Timestamp{};
	ELogLevel   Level{ LL_Info };
	WRuleId     RuleId{};
	std::string RuleName{};
	std::string Message{};
	std::string Details{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Id), CEREAL_NVP(Timestamp), CEREAL_NVP(Level), CEREAL_NVP(RuleId), CEREAL_NVP(RuleName),
			CEREAL_NVP(Message), CEREAL_NVP(Details));
	}
};
