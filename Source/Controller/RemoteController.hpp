/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>

#include "IServiceController.hpp"
#include "Rpc/RpcClient.hpp"

// Forwards every operation to the daemon
class WRemoteController final : public IServiceController
{
	std::shared_ptr<WRpcClient> Client;

public:
	explicit WRemoteController(std::shared_ptr<WRpcClient> Client_) : Client(std::move(Client_)) {}

	[[nodiscard]] std::shared_ptr<WRpcClient> const& GetClient() const { return Client; }

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
