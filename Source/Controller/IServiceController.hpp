/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "Result.hpp"
#include "Data/AppData.hpp"
#include "Data/LogEntry.hpp"
#include "Data/RuleStats.hpp"

// Operations shared by the in-process host and the daemon proxy.
// Results report the outcome, data is handed back through the out parameters.
class IServiceController
{
public:
	IServiceController() = default;
	virtual ~IServiceController() = default;

	virtual WResult GetRules(std::vector<WRule>& OutRules) = 0;
	virtual WResult GetRule(WRuleId const& RuleId, WRule& OutRule) = 0;

	// Assigns an id when the rule has none and hands back the stored rule
	virtual WResult CreateRule(WRule& Rule) = 0;
	virtual WResult UpdateRule(WRule& Rule) = 0;
	virtual WResult DeleteRule(WRuleId const& RuleId) = 0;
	virtual WResult StartRule(WRuleId const& RuleId) = 0;
	virtual WResult StopRule(WRuleId const& RuleId) = 0;
	virtual WResult StartAllRules() = 0;
	virtual WResult StopAllRules() = 0;

	virtual WResult GetChains(std::vector<WChain>& OutChains) = 0;
	virtual WResult CreateChain(WChain& Chain) = 0;
	virtual WResult UpdateChain(WChain& Chain) = 0;
	virtual WResult DeleteChain(WChainId const& ChainId) = 0;

	virtual WResult GetConfig(WAppConfig& OutConfig) = 0;
	virtual WResult UpdateConfig(WAppConfig const& Config) = 0;

	virtual WResult GetStatus(WServiceStatus& OutStatus) = 0;

	virtual WResult GetRuleStats(WRuleId const& RuleId, WRuleStats& OutStats) = 0;
	virtual WResult GetAllRuleStats(std::vector<WRuleStats>& OutStats) = 0;
	virtual WResult ResetRuleStats(WRuleId const& RuleId) = 0;
	virtual WResult ResetAllRuleStats() = 0;

	virtual WResult GetLogs(int Count, std::vector<WLogEntry>& OutLogs) = 0;
	virtual WResult GetLogsSince(WLogId SinceId, std::vector<WLogEntry>& OutLogs) = 0;
	virtual WResult GetLogsByRule(WRuleId const& RuleId, std::vector<WLogEntry>& OutLogs) = 0;
	virtual WResult ClearLogs() = 0;

	virtual WResult ImportData(std::string const& Json, bool bMerge) = 0;
	virtual WResult ExportData(std::string& OutJson) = 0;

	// Removes every rule and chain, keeps the config
	virtual WResult ClearAllData() = 0;
};
