/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "Data/RuleStats.hpp"

struct WRuleStatsEntry
{
	std::atomic<int64_t> BytesIn{ 0 };
	std::atomic<int64_t> BytesOut{ 0 };
	std::atomic<int64_t> Connections{ 0 };
	std::atomic<int32_t> ActiveConns{ 0 };
	std::atomic<int64_t> Errors{ 0 };
	std::atomic<WMsec>   LastActivity{ 0 };

	// Errors seen by the engine itself, on top of what the service reports
	std::atomic<int64_t> ServeErrors{ 0 };

	// Cumulative service counters, a reset moves the baseline up to the last observed values
	WServiceStats LastObserved{};
	WServiceStats Baseline{};

	void Zero(WMsec Now)
	{
		BytesIn = 0;
		BytesOut = 0;
		Connections = 0;
		ActiveConns = 0;
		Errors = 0;
		ServeErrors = 0;
		LastActivity = Now;
	}
};

// Per-rule counters. Entries outlive the rule's run until they are reset or removed.
class WStatsTracker
{
	mutable std::shared_mutex                                         Mutex;
	std::unordered_map<WRuleId, std::unique_ptr<WRuleStatsEntry>> Stats{};

	static WRuleStats Snapshot(WRuleId const& RuleId, WRuleStatsEntry const& Entry);
	static void       ResetEntry(WRuleStatsEntry& Entry);

public:
	// Creates a zeroed entry, zeroes an existing one. Meant for a fresh service run.
	void InitRule(WRuleId const& RuleId);
	void RemoveRule(WRuleId const& RuleId);

	void AddBytesIn(WRuleId const& RuleId, int64_t N);
	void AddBytesOut(WRuleId const& RuleId, int64_t N);
	void IncrementConnections(WRuleId const& RuleId);
	void DecrementActiveConnections(WRuleId const& RuleId);
	void IncrementErrors(WRuleId const& RuleId);

	// Overwrites the cumulative counters, creating the entry if needed
	void UpdateFromObserver(WRuleId const& RuleId, WServiceStats const& ServiceStats);

	[[nodiscard]] bool HasRule(WRuleId const& RuleId) const;

	bool GetStats(WRuleId const& RuleId, WRuleStats& OutStats) const;

	[[nodiscard]] std::map<WRuleId, WRuleStats> GetAllStats() const;

	void ResetStats(WRuleId const& RuleId);
	void ResetAllStats();
};
