/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Result.hpp"
#include "Data/Chain.hpp"
#include "Data/Rule.hpp"
#include "Data/RuleStats.hpp"

enum EServeExit
{
	SE_Closed,           // listener was closed, normal stop
	SE_BindFailed,       // address in use
	SE_PermissionDenied, // privileged port or similar
	SE_Other
};

struct WServeResult
{
	EServeExit  Exit{ SE_Closed };
	std::string Message{};

	[[nodiscard]] bool IsFatal() const { return Exit == SE_BindFailed || Exit == SE_PermissionDenied; }

	static WServeResult Closed() { return {}; }

	static WServeResult Fail(EServeExit Exit_, std::string Message_) { return { Exit_, std::move(Message_) }; }
};

// A running forwarding service bound to one rule
class IForwardService
{
public:
	virtual ~IForwardService() = default;

	// Blocks until the service stops or fails
	virtual WServeResult Serve() = 0;

	// Makes a blocked Serve() return, safe to call before Serve() and more than once
	virtual void Close() = 0;

	[[nodiscard]] virtual WServiceStats GetStats() const = 0;

	[[nodiscard]] virtual std::string GetAddr() const = 0;
};

// Turns rules into services and keeps them registered under the rule id
class IServiceBuilder
{
public:
	virtual ~IServiceBuilder() = default;

	virtual WResult Build(WRule const& Rule, std::vector<WChain> const& Chains,
		std::shared_ptr<IForwardService>& OutService) = 0;

	virtual void Unregister(WRuleId const& RuleId) = 0;

	[[nodiscard]] virtual std::shared_ptr<IForwardService> Lookup(WRuleId const& RuleId) const = 0;
};
