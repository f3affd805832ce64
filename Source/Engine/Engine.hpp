/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include <sigslot/signal.hpp>

#include "CancelToken.hpp"
#include "ForwardService.hpp"
#include "LogManager.hpp"
#include "StatsObserver.hpp"
#include "StatsTracker.hpp"

struct WEngineOptions
{
	int StatsPollIntervalMs{ 2000 };
	int LogCapacity{ static_cast<int>(WLogManager::DefaultCapacity) };

	// Pause before serving again after a non-fatal serve error
	int ServeRetryDelayMs{ 1000 };
};

// Supervises the running rule instances of this process
class WEngine
{
	struct WServiceEntry
	{
		std::shared_ptr<IForwardService> Service{};
		std::shared_ptr<WCancelToken>    Cancel{};
		WRule                            Rule{};
		std::thread                      ServeThread{};
	};

	std::shared_ptr<IServiceBuilder> Builder;
	std::shared_ptr<WStatsObserver>  Observer;
	WEngineOptions                   Options{};

	WStatsTracker StatsTracker{};
	WLogManager   LogManager;

	mutable std::shared_mutex                                     Mutex;
	std::unordered_map<WRuleId, std::unique_ptr<WServiceEntry>> Services{};
	std::vector<WChain>                                           Chains{};

	// Serve threads whose entry was removed by the thread itself
	std::mutex               FinishedMutex{};
	std::vector<std::thread> FinishedThreads{};

	std::mutex                    PollMutex{};
	std::thread                   PollThread{};
	std::shared_ptr<WCancelToken> PollCancel{};

	sigslot::scoped_connection ObserverConnection{};

	void ServeThreadFunction(WRuleId RuleId, std::string RuleName, std::shared_ptr<IForwardService> Service,
		std::shared_ptr<WCancelToken> Cancel);

	// Removes the entry owned by Cancel, false if it was already stopped
	bool RemoveFinishedEntry(WRuleId const& RuleId, std::shared_ptr<WCancelToken> const& Cancel);

	void EnsurePolling();
	void StopPolling();
	void PollThreadFunction(std::shared_ptr<WCancelToken> Cancel);
	void JoinFinishedThreads();

	void Teardown(WServiceEntry& Entry);

public:
	WEngine(std::shared_ptr<IServiceBuilder> Builder_, std::shared_ptr<WStatsObserver> Observer_,
		WEngineOptions const& Options_ = {});
	~WEngine();

	WEngine(WEngine const&) = delete;
	WEngine& operator=(WEngine const&) = delete;

	// (rule id, new status, error) when a rule stops or fails on its own.
	// Fired asynchronously from the serve thread, at least once, unordered relative to API calls.
	sigslot::signal<WRuleId const&, ERuleStatus, std::string const&> OnStatusChanged;

	void SetChains(std::vector<WChain> NewChains);

	WResult StartRule(WRule const& Rule);
	WResult StopRule(WRuleId const& RuleId);
	WResult RestartRule(WRule const& Rule);

	// Stops polling, then every rule. Safe to call repeatedly.
	void StopAll();

	[[nodiscard]] bool IsRunning(WRuleId const& RuleId) const;

	[[nodiscard]] std::vector<WRuleId> GetRunningRuleIds() const;

	[[nodiscard]] size_t GetRunningCount() const;

	// Runs one stats collection pass right away
	void PollStats();

	WStatsTracker& GetStatsTracker() { return StatsTracker; }
	WLogManager&   GetLogManager() { return LogManager; }
};
