/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "ForwardService.hpp"
#include "ServiceRegistry.hpp"

// Builds the built-in tcp and udp relays. Proxy handlers and chains are left to external builders.
class WRelayServiceBuilder final : public IServiceBuilder
{
	WServiceRegistry Registry{};

public:
	WResult Build(WRule const& Rule, std::vector<WChain> const& Chains,
		std::shared_ptr<IForwardService>& OutService) override;

	void Unregister(WRuleId const& RuleId) override { Registry.Unregister(RuleId); }

	[[nodiscard]] std::shared_ptr<IForwardService> Lookup(WRuleId const& RuleId) const override
	{
		return Registry.Get(RuleId);
	}
};
