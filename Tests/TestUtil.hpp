/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <stdlib.h>

#include "Filesystem.hpp"
#include "Engine/ForwardService.hpp"
#include "Engine/ServiceRegistry.hpp"

// Scratch directory removed with everything in it
class WTempDir
{
	stdfs::path Path{};

public:
	WTempDir()
	{
		std::string Template = (stdfs::temp_directory_path() / "weiche-test-XXXXXX").string();
		if (mkdtemp(Template.data()) != nullptr)
		{
			Path = Template;
		}
	}

	~WTempDir()
	{
		std::error_code Ec{};
		stdfs::remove_all(Path, Ec);
	}

	WTempDir(WTempDir const&) = delete;
	WTempDir& operator=(WTempDir const&) = delete;

	[[nodiscard]] stdfs::path const& Get() const { return Path; }

	[[nodiscard]] std::string operator/(std::string const& Name) const { return (Path / Name).string(); }
};

inline bool WaitUntil(std::function<bool()> const& Predicate, int TimeoutMs = 3000)
{
	auto const Deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(TimeoutMs);
	while (std::chrono::steady_clock::now() < Deadline)
	{
		if (Predicate())
		{
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return Predicate();
}

// Serves the queued results in order, then blocks until closed
class WFakeService final : public IForwardService
{
	mutable std::mutex        Mutex{};
	std::condition_variable   Cv{};
	std::deque<WServeResult>  Results{};
	WServiceStats             Stats{};
	bool                      bClosed{ false };
	int                       ServeCalls{ 0 };

public:
	explicit WFakeService(std::deque<WServeResult> Results_ = {}) : Results(std::move(Results_)) {}

	WServeResult Serve() override
	{
		std::unique_lock Lock(Mutex);
		++ServeCalls;
		if (!Results.empty())
		{
			WServeResult Result = Results.front();
			Results.pop_front();
			return Result;
		}
		Cv.wait(Lock, [this] { return bClosed; });
		return WServeResult::Closed();
	}

	void Close() override
	{
		{
			std::lock_guard Lock(Mutex);
			bClosed = true;
		}
		Cv.notify_all();
	}

	[[nodiscard]] WServiceStats GetStats() const override
	{
		std::lock_guard Lock(Mutex);
		return Stats;
	}

	[[nodiscard]] std::string GetAddr() const override { return ":0"; }

	void SetStats(WServiceStats const& Stats_)
	{
		std::lock_guard Lock(Mutex);
		Stats = Stats_;
	}

	[[nodiscard]] int GetServeCalls() const
	{
		std::lock_guard Lock(Mutex);
		return ServeCalls;
	}
};

// Builds fake services, rules named "bind-fail" fail right after starting
class WFakeBuilder final : public IServiceBuilder
{
	WServiceRegistry Registry{};
	std::atomic<int> BuildCount{ 0 };

public:
	std::function<std::deque<WServeResult>(WRule const&)> Script{};

	WResult Build(WRule const& Rule, std::vector<WChain> const&, std::shared_ptr<IForwardService>& OutService) override
	{
		++BuildCount;
		if (Rule.Protocol != P_Tcp && Rule.Protocol != P_Udp)
		{
			return WResult::Engine(Rule.Id, "config", "failed to build configuration", "unsupported handler");
		}

		std::deque<WServeResult> Results{};
		if (Script)
		{
			Results = Script(Rule);
		}
		else if (Rule.Name == "bind-fail")
		{
			Results.push_back(WServeResult::Fail(SE_BindFailed, "address already in use"));
		}

		auto Service = std::make_shared<WFakeService>(std::move(Results));
		if (!Registry.Register(Rule.Id, Service))
		{
			return WResult::Engine(Rule.Id, "registry", "failed to register service", "name already registered");
		}
		OutService = Service;
		return WResult::Success();
	}

	void Unregister(WRuleId const& RuleId) override { Registry.Unregister(RuleId); }

	[[nodiscard]] std::shared_ptr<IForwardService> Lookup(WRuleId const& RuleId) const override
	{
		return Registry.Get(RuleId);
	}

	[[nodiscard]] int GetBuildCount() const { return BuildCount; }

	[[nodiscard]] std::shared_ptr<WFakeService> GetFake(WRuleId const& RuleId) const
	{
		return std::dynamic_pointer_cast<WFakeService>(Registry.Get(RuleId));
	}
};

inline WRule MakeRule(std::string const& Id, std::string const& Name = "test", int Port = 18080)
{
	WRule Rule{};
	Rule.Id = Id;
	Rule.Name = Name;
	Rule.LocalPort = Port;
	Rule.TargetHost = "127.0.0.1";
	Rule.TargetPort = 9;
	return Rule;
}
