/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <cereal/cereal.hpp>

#include "Types.hpp"

// Snapshot of the cumulative counters of one rule
struct WRuleStats
{
	WRuleId     RuleId{};
	int64_t     BytesIn{ 0 };
	int64_t     BytesOut{ 0 };
	int64_t     Connections{ 0 };
	int32_t     ActiveConns{ 0 };
	int64_t     Errors{ 0 };
	std::string LastActivity{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(RuleId), CEREAL_NVP(BytesIn), CEREAL_NVP(BytesOut), CEREAL_NVP(Connections),
			CEREAL_NVP(ActiveConns), CEREAL_NVP(Errors), CEREAL_NVP(LastActivity));
	}
};

// Counters as reported by a running service, all cumulative
struct WServiceStats
{
	uint64_t TotalConns{ 0 };
	uint64_t CurrentConns{ 0 };
	uint64_t InputBytes{ 0 };
	uint64_t OutputBytes{ 0 };
	uint64_t TotalErrs{ 0 };

	bool operator==(WServiceStats const&) const = default;
};
