/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Rule.hpp"
#include "Chain.hpp"

char const* RuleTypeToString(ERuleType Type)
{
	switch (Type)
	{
		case RT_Forward:
			return "forward";
		case RT_Reverse:
			return "reverse";
		case RT_Chain:
			return "chain";
		default:
			return "unknown";
	}
}

char const* ProtocolToString(EProtocol Protocol)
{
	switch (Protocol)
	{
		case P_Tcp:
			return "tcp";
		case P_Udp:
			return "udp";
		case P_Http:
			return "http";
		case P_Https:
			return "https";
		case P_Socks5:
			return "socks5";
		case P_Shadowsocks:
			return "ss";
		default:
			return "unknown";
	}
}

char const* RuleStatusToString(ERuleStatus Status)
{
	switch (Status)
	{
		case RS_Stopped:
			return "stopped";
		case RS_Running:
			return "running";
		case RS_Error:
			return "error";
		default:
			return "unknown";
	}
}

bool ParseRuleType(std::string const& Str, ERuleType& OutType)
{
	for (ERuleType Type : { RT_Forward, RT_Reverse, RT_Chain })
	{
		if (Str == RuleTypeToString(Type))
		{
			OutType = Type;
			return true;
		}
	}
	return false;
}

bool ParseProtocol(std::string const& Str, EProtocol& OutProtocol)
{
	for (EProtocol Protocol : { P_Tcp, P_Udp, P_Http, P_Https, P_Socks5, P_Shadowsocks })
	{
		if (Str == ProtocolToString(Protocol))
		{
			OutProtocol = Protocol;
			return true;
		}
	}
	return false;
}

WResult WRule::Validate() const
{
	if (Name.empty())
	{
		return WResult::Error(EC_Validation, "rule name cannot be empty");
	}

	if (LocalPort <= 0)
	{
		return WResult::Error(EC_Validation, "listen address cannot be empty");
	}

	if (HasPrimaryTarget())
	{
		return WResult::Success();
	}

	// Pure proxy rules have no upstream target
	if (Targets.empty() && Type != RT_Chain)
	{
		return WResult::Error(EC_Validation, "at least one target is required");
	}

	for (size_t i = 0; i < Targets.size(); ++i)
	{
		if (Targets[i].Host.empty() || Targets[i].Port <= 0)
		{
			return WResult::Validation("targets", static_cast<int>(i), "host and port are required");
		}
	}

	return WResult::Success();
}

std::vector<WTarget> WRule::GetEffectiveTargets() const
{
	if (HasPrimaryTarget())
	{
		return { WTarget{ TargetHost, TargetPort, 1 } };
	}
	return Targets;
}

std::string WRule::GetTargetAddr() const
{
	if (HasPrimaryTarget())
	{
		return TargetHost + ":" + std::to_string(TargetPort);
	}
	if (!Targets.empty())
	{
		return Targets.front().Host + ":" + std::to_string(Targets.front().Port);
	}
	return {};
}

WResult WChain::Validate() const
{
	if (Name.empty())
	{
		return WResult::Error(EC_Validation, "chain name cannot be empty");
	}

	if (Hops.empty())
	{
		return WResult::Error(EC_Validation, "at least one hop is required");
	}

	for (size_t i = 0; i < Hops.size(); ++i)
	{
		if (Hops[i].Addr.empty())
		{
			return WResult::Validation("hops", static_cast<int>(i), "address is required");
		}
	}

	return WResult::Success();
}
