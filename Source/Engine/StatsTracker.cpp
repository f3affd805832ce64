/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "StatsTracker.hpp"

#include <mutex>

#include "Time.hpp"

WRuleStats WStatsTracker::Snapshot(WRuleId const& RuleId, WRuleStatsEntry const& Entry)
{
	WRuleStats Stats{};
	Stats.RuleId = RuleId;
	Stats.BytesIn = Entry.BytesIn.load();
	Stats.BytesOut = Entry.BytesOut.load();
	Stats.Connections = Entry.Connections.load();
	Stats.ActiveConns = Entry.ActiveConns.load();
	Stats.Errors = Entry.Errors.load();
	Stats.LastActivity = WTime::FormatRfc3339(Entry.LastActivity.load());
	return Stats;
}

void WStatsTracker::InitRule(WRuleId const& RuleId)
{
	std::unique_lock Lock(Mutex);
	auto&            Entry = Stats[RuleId];
	if (!Entry)
	{
		Entry = std::make_unique<WRuleStatsEntry>();
	}
	Entry->Zero(WTime::GetEpochMs());
	Entry->LastObserved = {};
	Entry->Baseline = {};
}

void WStatsTracker::RemoveRule(WRuleId const& RuleId)
{
	std::unique_lock Lock(Mutex);
	Stats.erase(RuleId);
}

void WStatsTracker::AddBytesIn(WRuleId const& RuleId, int64_t N)
{
	std::shared_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		It->second->BytesIn.fetch_add(N);
		It->second->LastActivity = WTime::GetEpochMs();
	}
}

void WStatsTracker::AddBytesOut(WRuleId const& RuleId, int64_t N)
{
	std::shared_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		It->second->BytesOut.fetch_add(N);
		It->second->LastActivity = WTime::GetEpochMs();
	}
}

void WStatsTracker::IncrementConnections(WRuleId const& RuleId)
{
	std::shared_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		It->second->Connections.fetch_add(1);
		It->second->ActiveConns.fetch_add(1);
		It->second->LastActivity = WTime::GetEpochMs();
	}
}

void WStatsTracker::DecrementActiveConnections(WRuleId const& RuleId)
{
	std::shared_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		It->second->ActiveConns.fetch_sub(1);
	}
}

void WStatsTracker::IncrementErrors(WRuleId const& RuleId)
{
	std::shared_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		It->second->Errors.fetch_add(1);
		It->second->ServeErrors.fetch_add(1);
	}
}

void WStatsTracker::UpdateFromObserver(WRuleId const& RuleId, WServiceStats const& ServiceStats)
{
	std::unique_lock Lock(Mutex);
	auto&            Entry = Stats[RuleId];
	if (!Entry)
	{
		Entry = std::make_unique<WRuleStatsEntry>();
	}

	WServiceStats& Base = Entry->Baseline;
	auto Since = [](uint64_t Value, uint64_t Start) { return static_cast<int64_t>(Value >= Start ? Value - Start : Value); };

	Entry->LastObserved = ServiceStats;
	Entry->BytesIn = Since(ServiceStats.InputBytes, Base.InputBytes);
	Entry->BytesOut = Since(ServiceStats.OutputBytes, Base.OutputBytes);
	Entry->Connections = Since(ServiceStats.TotalConns, Base.TotalConns);
	Entry->ActiveConns = static_cast<int32_t>(ServiceStats.CurrentConns);
	Entry->Errors = Since(ServiceStats.TotalErrs, Base.TotalErrs) + Entry->ServeErrors.load();
	Entry->LastActivity = WTime::GetEpochMs();
}

bool WStatsTracker::HasRule(WRuleId const& RuleId) const
{
	std::shared_lock Lock(Mutex);
	return Stats.contains(RuleId);
}

bool WStatsTracker::GetStats(WRuleId const& RuleId, WRuleStats& OutStats) const
{
	std::shared_lock Lock(Mutex);
	auto             It = Stats.find(RuleId);
	if (It == Stats.end())
	{
		return false;
	}
	OutStats = Snapshot(RuleId, *It->second);
	return true;
}

std::map<WRuleId, WRuleStats> WStatsTracker::GetAllStats() const
{
	std::shared_lock              Lock(Mutex);
	std::map<WRuleId, WRuleStats> Result{};
	for (auto const& [RuleId, Entry] : Stats)
	{
		Result.emplace(RuleId, Snapshot(RuleId, *Entry));
	}
	return Result;
}

void WStatsTracker::ResetEntry(WRuleStatsEntry& Entry)
{
	int32_t Active = Entry.ActiveConns;
	Entry.Zero(0);
	// Open connections are a gauge, not history
	Entry.ActiveConns = Active;
	Entry.Baseline = Entry.LastObserved;
}

void WStatsTracker::ResetStats(WRuleId const& RuleId)
{
	std::unique_lock Lock(Mutex);
	if (auto It = Stats.find(RuleId); It != Stats.end())
	{
		ResetEntry(*It->second);
	}
}

void WStatsTracker::ResetAllStats()
{
	std::unique_lock Lock(Mutex);
	for (auto& [RuleId, Entry] : Stats)
	{
		ResetEntry(*Entry);
	}
}
