/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RelayServiceBuilder.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "RelayService.hpp"

WResult WRelayServiceBuilder::Build(
	WRule const& Rule, std::vector<WChain> const& Chains, std::shared_ptr<IForwardService>& OutService)
{
	if (!Rule.ChainId.empty())
	{
		auto It = std::ranges::find_if(Chains, [&](WChain const& C) { return C.Id == Rule.ChainId; });
		if (It == Chains.end())
		{
			return WResult::Engine(Rule.Id, "config", "failed to build configuration",
				fmt::format("chain {} not found", Rule.ChainId));
		}
		return WResult::Engine(Rule.Id, "config", "failed to build configuration",
			fmt::format("forwarding through chain '{}' ({} hops) is not supported by the built-in relay", It->Name,
				It->Hops.size()));
	}

	if (Rule.Type == RT_Chain)
	{
		return WResult::Engine(Rule.Id, "config", "failed to build configuration",
			fmt::format("proxy handler {} is not supported by the built-in relay", ProtocolToString(Rule.Protocol)));
	}

	if (Rule.Tls && Rule.Tls->bEnabled)
	{
		return WResult::Engine(
			Rule.Id, "config", "failed to build configuration", "tls termination is not supported by the built-in relay");
	}

	if (Rule.LocalPort <= 0 || Rule.LocalPort > 65535)
	{
		return WResult::Engine(Rule.Id, "config", "failed to build configuration",
			fmt::format("invalid listen port {}", Rule.LocalPort));
	}

	std::vector<WTarget> Targets = Rule.GetEffectiveTargets();
	if (Targets.empty())
	{
		return WResult::Engine(Rule.Id, "config", "failed to build configuration", "no forward targets");
	}

	auto const Port = static_cast<WPort>(Rule.LocalPort);
	std::shared_ptr<WRelayServiceBase> Service{};
	switch (Rule.Protocol)
	{
		case P_Tcp:
			Service = std::make_shared<WTcpRelayService>(Rule.Id, Port, std::move(Targets));
			break;
		case P_Udp:
			Service = std::make_shared<WUdpRelayService>(Rule.Id, Port, std::move(Targets));
			break;
		default:
			return WResult::Engine(Rule.Id, "config", "failed to build configuration",
				fmt::format("handler {} is not supported by the built-in relay", ProtocolToString(Rule.Protocol)));
	}

	// The port is claimed here so a taken address fails the start instead of the serve thread
	if (WServeResult Failure{}; !Service->Listen(Failure))
	{
		return WResult::Engine(Rule.Id, "listen", "failed to listen", Failure.Message);
	}

	if (!Registry.Register(Rule.Id, Service))
	{
		return WResult::Engine(Rule.Id, "registry", "failed to register service", "name already registered");
	}

	spdlog::debug("Built {} {} relay for rule {} on {}", RuleTypeToString(Rule.Type), ProtocolToString(Rule.Protocol),
		Rule.Id, Service->GetAddr());
	OutService = std::move(Service);
	return WResult::Success();
}
