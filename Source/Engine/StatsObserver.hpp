/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <shared_mutex>
#include <string>
#include <sigslot/signal.hpp>

#include "Data/RuleStats.hpp"

// Receives cumulative traffic events keyed by service name and republishes them
class WStatsObserver
{
	mutable std::shared_mutex                Mutex;
	std::map<std::string, WServiceStats> ServiceStats{};

public:
	sigslot::signal<std::string const&, WServiceStats const&> OnUpdate;

	void Observe(std::string const& ServiceName, WServiceStats const& Stats);

	// Zeroed stats if the service never reported
	[[nodiscard]] WServiceStats GetStats(std::string const& ServiceName) const;

	[[nodiscard]] std::map<std::string, WServiceStats> GetAllStats() const;

	void ResetStats(std::string const& ServiceName);
	void ResetAllStats();
	void RemoveStats(std::string const& ServiceName);
};
