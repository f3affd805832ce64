/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Engine.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

WEngine::WEngine(
	std::shared_ptr<IServiceBuilder> Builder_, std::shared_ptr<WStatsObserver> Observer_, WEngineOptions const& Options_)
	: Builder(std::move(Builder_))
	, Observer(std::move(Observer_))
	, Options(Options_)
	, LogManager(Options_.LogCapacity)
{
	if (!Observer)
	{
		Observer = std::make_shared<WStatsObserver>();
	}

	ObserverConnection = Observer->OnUpdate.connect(
		[this](std::string const& ServiceName, WServiceStats const& Stats) { StatsTracker.UpdateFromObserver(ServiceName, Stats); });
}

WEngine::~WEngine()
{
	StopAll();
}

void WEngine::SetChains(std::vector<WChain> NewChains)
{
	std::unique_lock Lock(Mutex);
	Chains = std::move(NewChains);
}

WResult WEngine::StartRule(WRule const& Rule)
{
	std::string Addr{};
	{
		std::unique_lock Lock(Mutex);
		if (Services.contains(Rule.Id))
		{
			return WResult::AlreadyRunning();
		}

		if (WResult Valid = Rule.Validate(); !Valid.Ok())
		{
			return Valid;
		}

		std::shared_ptr<IForwardService> Service{};
		if (WResult Built = Builder->Build(Rule, Chains, Service); !Built.Ok())
		{
			Lock.unlock();
			spdlog::error("Failed to build service for rule {}: {}", Rule.Id, Built.Message);
			LogManager.Error(Rule.Id, Rule.Name, "Failed to build service", Built.Message);
			return Built;
		}
		if (!Service)
		{
			return WResult::Engine(Rule.Id, "registry", "service not found in registry");
		}

		auto Entry = std::make_unique<WServiceEntry>();
		Entry->Service = Service;
		Entry->Cancel = std::make_shared<WCancelToken>();
		Entry->Rule = Rule;
		Entry->Rule.Status = RS_Running;
		Addr = Service->GetAddr();

		StatsTracker.InitRule(Rule.Id);
		Entry->ServeThread =
			std::thread(&WEngine::ServeThreadFunction, this, Rule.Id, Rule.Name, Service, Entry->Cancel);
		Services.emplace(Rule.Id, std::move(Entry));
	}

	spdlog::info("Starting service: {} ({}) on {}", Rule.Name, Rule.Id, Addr);
	LogManager.Info(Rule.Id, Rule.Name, "Service started", fmt::format("listening on {}", Addr));
	EnsurePolling();
	return WResult::Success();
}

void WEngine::Teardown(WServiceEntry& Entry)
{
	Entry.Cancel->Cancel();
	if (Entry.Service)
	{
		Entry.Service->Close();
	}
	Builder->Unregister(Entry.Rule.Id);
}

WResult WEngine::StopRule(WRuleId const& RuleId)
{
	std::unique_ptr<WServiceEntry> Entry{};
	{
		std::unique_lock Lock(Mutex);
		auto             It = Services.find(RuleId);
		if (It == Services.end())
		{
			return WResult::NotRunning();
		}
		Entry = std::move(It->second);
		Services.erase(It);
		Teardown(*Entry);
	}

	spdlog::info("Stopping service: {}", RuleId);
	LogManager.Info(RuleId, Entry->Rule.Name, "Service stopped");
	if (Entry->ServeThread.joinable())
	{
		Entry->ServeThread.join();
	}
	return WResult::Success();
}

WResult WEngine::RestartRule(WRule const& Rule)
{
	if (WResult Stopped = StopRule(Rule.Id); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
	{
		return Stopped;
	}
	return StartRule(Rule);
}

void WEngine::StopAll()
{
	StopPolling();

	std::vector<std::unique_ptr<WServiceEntry>> Entries{};
	{
		std::unique_lock Lock(Mutex);
		for (auto& [RuleId, Entry] : Services)
		{
			Teardown(*Entry);
			Entries.push_back(std::move(Entry));
		}
		Services.clear();
	}

	if (!Entries.empty())
	{
		spdlog::info("Stopping all services ({})", Entries.size());
	}
	for (auto const& Entry : Entries)
	{
		LogManager.Info(Entry->Rule.Id, Entry->Rule.Name, "Service stopped");
		if (Entry->ServeThread.joinable())
		{
			Entry->ServeThread.join();
		}
	}
	JoinFinishedThreads();
}

bool WEngine::IsRunning(WRuleId const& RuleId) const
{
	std::shared_lock Lock(Mutex);
	return Services.contains(RuleId);
}

std::vector<WRuleId> WEngine::GetRunningRuleIds() const
{
	std::vector<WRuleId> Ids{};
	{
		std::shared_lock Lock(Mutex);
		Ids.reserve(Services.size());
		for (auto const& [RuleId, Entry] : Services)
		{
			Ids.push_back(RuleId);
		}
	}
	std::ranges::sort(Ids);
	return Ids;
}

size_t WEngine::GetRunningCount() const
{
	std::shared_lock Lock(Mutex);
	return Services.size();
}

void WEngine::ServeThreadFunction(
	WRuleId RuleId, std::string RuleName, std::shared_ptr<IForwardService> Service, std::shared_ptr<WCancelToken> Cancel)
{
	for (;;)
	{
		WServeResult Result = Service->Serve();

		if (Cancel->IsCancelled())
		{
			// Stopped on purpose, whatever Serve() reported
			return;
		}

		if (Result.Exit == SE_Closed)
		{
			if (RemoveFinishedEntry(RuleId, Cancel))
			{
				spdlog::info("Service {} closed", RuleId);
				LogManager.Info(RuleId, RuleName, "Service closed");
				OnStatusChanged(RuleId, RS_Stopped, std::string{});
			}
			return;
		}

		if (Result.IsFatal())
		{
			if (RemoveFinishedEntry(RuleId, Cancel))
			{
				spdlog::error("Service {} failed: {}", RuleId, Result.Message);
				LogManager.Error(RuleId, RuleName, "Service failed", Result.Message);
				OnStatusChanged(RuleId, RS_Error, Result.Message);
			}
			return;
		}

		spdlog::warn("Service error: {} - {}", RuleId, Result.Message);
		LogManager.Warn(RuleId, RuleName, "Service error", Result.Message);
		StatsTracker.IncrementErrors(RuleId);

		if (Cancel->WaitFor(Options.ServeRetryDelayMs))
		{
			return;
		}
	}
}

bool WEngine::RemoveFinishedEntry(WRuleId const& RuleId, std::shared_ptr<WCancelToken> const& Cancel)
{
	std::unique_lock Lock(Mutex);
	auto             It = Services.find(RuleId);
	// A newer run of the same rule owns a different token
	if (It == Services.end() || It->second->Cancel != Cancel)
	{
		return false;
	}

	WServiceEntry& Entry = *It->second;
	Entry.Cancel->Cancel();
	Entry.Service->Close();
	Builder->Unregister(RuleId);
	{
		std::lock_guard FinishedLock(FinishedMutex);
		FinishedThreads.push_back(std::move(Entry.ServeThread));
	}
	Services.erase(It);
	return true;
}

void WEngine::JoinFinishedThreads()
{
	std::vector<std::thread> Threads{};
	{
		std::lock_guard Lock(FinishedMutex);
		Threads.swap(FinishedThreads);
	}
	for (auto& Thread : Threads)
	{
		if (Thread.joinable())
		{
			Thread.join();
		}
	}
}

void WEngine::EnsurePolling()
{
	std::lock_guard Lock(PollMutex);
	if (PollThread.joinable())
	{
		return;
	}
	PollCancel = std::make_shared<WCancelToken>();
	PollThread = std::thread(&WEngine::PollThreadFunction, this, PollCancel);
}

void WEngine::StopPolling()
{
	std::lock_guard Lock(PollMutex);
	if (!PollThread.joinable())
	{
		return;
	}
	PollCancel->Cancel();
	PollThread.join();
	PollCancel.reset();
}

void WEngine::PollThreadFunction(std::shared_ptr<WCancelToken> Cancel)
{
	while (!Cancel->WaitFor(Options.StatsPollIntervalMs))
	{
		PollStats();
		JoinFinishedThreads();
	}
}

void WEngine::PollStats()
{
	for (WRuleId const& RuleId : GetRunningRuleIds())
	{
		// Stopped in the meantime if the registry forgot it
		if (auto Service = Builder->Lookup(RuleId))
		{
			Observer->Observe(RuleId, Service->GetStats());
		}
	}
}
