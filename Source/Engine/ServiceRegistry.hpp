/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <unordered_map>

#include "ForwardService.hpp"

class WServiceRegistry
{
	mutable std::mutex                                                Mutex;
	std::unordered_map<WRuleId, std::shared_ptr<IForwardService>> Services{};

public:
	// False if the name is taken
	bool Register(WRuleId const& RuleId, std::shared_ptr<IForwardService> Service)
	{
		std::lock_guard Lock(Mutex);
		return Services.emplace(RuleId, std::move(Service)).second;
	}

	void Unregister(WRuleId const& RuleId)
	{
		std::lock_guard Lock(Mutex);
		Services.erase(RuleId);
	}

	[[nodiscard]] std::shared_ptr<IForwardService> Get(WRuleId const& RuleId) const
	{
		std::lock_guard Lock(Mutex);
		if (auto It = Services.find(RuleId); It != Services.end())
		{
			return It->second;
		}
		return nullptr;
	}

	[[nodiscard]] size_t Size() const
	{
		std::lock_guard Lock(Mutex);
		return Services.size();
	}
};
