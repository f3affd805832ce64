/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <sigslot/signal.hpp>

#include "IServiceController.hpp"
#include "Engine/Engine.hpp"
#include "Storage/Store.hpp"

// Runs rules in this process, backed by the store and the engine
class WLocalController final : public IServiceController
{
	std::shared_ptr<WStore>  Store;
	std::shared_ptr<WEngine> Engine;
	WMsec                    StartTime{ 0 };

	sigslot::scoped_connection StatusConnection{};

	void SyncChains();

	// Starts every enabled rule, returns the first failure
	WResult StartEnabledRules(int& OutStarted, int& OutFailed);

	WResult MarkFailed(WRuleId const& RuleId, WResult const& Failure);

	// Records the failure on the rule, an already running rule is not one
	WResult StartInEngine(WRule const& Rule);

public:
	WLocalController(std::shared_ptr<WStore> Store_, std::shared_ptr<WEngine> Engine_);

	// Wires the engine to the store and starts the enabled rules
	WResult Init();

	[[nodiscard]] std::shared_ptr<WEngine> const& GetEngine() const { return Engine; }
	[[nodiscard]] std::shared_ptr<WStore> const&  GetStore() const { return Store; }

	WResult GetRules(std::vector<WRule>& OutRules) override;
	WResult GetRule(WRuleId const& RuleId, WRule& OutRule) override;
	WResult CreateRule(WRule& Rule) override;
	WResult UpdateRule(WRule& Rule) override;
	WResult DeleteRule(WRuleId const& RuleId) override;
	WResult StartRule(WRuleId const& RuleId) override;
	WResult StopRule(WRuleId const& RuleId) override;
	WResult StartAllRules() override;
	WResult StopAllRules() override;

	WResult GetChains(std::vector<WChain>& OutChains) override;
	WResult CreateChain(WChain& Chain) override;
	WResult UpdateChain(WChain& Chain) override;
	WResult DeleteChain(WChainId const& ChainId) override;

	WResult GetConfig(WAppConfig& OutConfig) override;
	WResult UpdateConfig(WAppConfig const& Config) override;

	WResult GetStatus(WServiceStatus& OutStatus) override;

	WResult GetRuleStats(WRuleId const& RuleId, WRuleStats& OutStats) override;
	WResult GetAllRuleStats(std::vector<WRuleStats>& OutStats) override;
	WResult ResetRuleStats(WRuleId const& RuleId) override;
	WResult ResetAllRuleStats() override;

	WResult GetLogs(int Count, std::vector<WLogEntry>& OutLogs) override;
	WResult GetLogsSince(WLogId SinceId, std::vector<WLogEntry>& OutLogs) override;
	WResult GetLogsByRule(WRuleId const& RuleId, std::vector<WLogEntry>& OutLogs) override;
	WResult ClearLogs() override;

	WResult ImportData(std::string const& Json, bool bMerge) override;
	WResult ExportData(std::string& OutJson) override;
	WResult ClearAllData() override;
};
