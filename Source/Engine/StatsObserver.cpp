/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "StatsObserver.hpp"

#include <mutex>

void WStatsObserver::Observe(std::string const& ServiceName, WServiceStats const& Stats)
{
	if (ServiceName.empty())
	{
		return;
	}

	{
		std::unique_lock Lock(Mutex);
		ServiceStats[ServiceName] = Stats;
	}

	OnUpdate(ServiceName, Stats);
}

WServiceStats WStatsObserver::GetStats(std::string const& ServiceName) const
{
	std::shared_lock Lock(Mutex);
	if (auto It = ServiceStats.find(ServiceName); It != ServiceStats.end())
	{
		return It->second;
	}
	return {};
}

std::map<std::string, WServiceStats> WStatsObserver::GetAllStats() const
{
	std::shared_lock Lock(Mutex);
	return ServiceStats;
}

void WStatsObserver::ResetStats(std::string const& ServiceName)
{
	std::unique_lock Lock(Mutex);
	if (auto It = ServiceStats.find(ServiceName); It != ServiceStats.end())
	{
		It->second = {};
	}
}

void WStatsObserver::ResetAllStats()
{
	std::unique_lock Lock(Mutex);
	for (auto& [Name, Stats] : ServiceStats)
	{
		Stats = {};
	}
}

void WStatsObserver::RemoveStats(std::string const& ServiceName)
{
	std::unique_lock Lock(Mutex);
	ServiceStats.erase(ServiceName);
}
