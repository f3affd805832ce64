/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RemoteController.hpp"

#include "Rpc/RpcArgs.hpp"
#include "Storage/Store.hpp"

WResult WRemoteController::GetRules(std::vector<WRule>& OutRules)
{
	return Client->Call("GetRules", WEmptyArgs{}, OutRules);
}

WResult WRemoteController::GetRule(WRuleId const& RuleId, WRule& OutRule)
{
	return Client->Call("GetRule", WIdArgs{ RuleId }, OutRule);
}

WResult WRemoteController::CreateRule(WRule& Rule)
{
	return Client->Call("CreateRule", WCreateRuleArgs{ Rule }, Rule);
}

WResult WRemoteController::UpdateRule(WRule& Rule)
{
	return Client->Call("UpdateRule", WCreateRuleArgs{ Rule }, Rule);
}

WResult WRemoteController::DeleteRule(WRuleId const& RuleId)
{
	WEmptyArgs Reply{};
	return Client->Call("DeleteRule", WIdArgs{ RuleId }, Reply);
}

WResult WRemoteController::StartRule(WRuleId const& RuleId)
{
	WEmptyArgs Reply{};
	return Client->Call("StartRule", WIdArgs{ RuleId }, Reply);
}

WResult WRemoteController::StopRule(WRuleId const& RuleId)
{
	WEmptyArgs Reply{};
	return Client->Call("StopRule", WIdArgs{ RuleId }, Reply);
}

WResult WRemoteController::StartAllRules()
{
	WEmptyArgs Reply{};
	return Client->Call("StartAllRules", WEmptyArgs{}, Reply);
}

WResult WRemoteController::StopAllRules()
{
	WEmptyArgs Reply{};
	return Client->Call("StopAllRules", WEmptyArgs{}, Reply);
}

WResult WRemoteController::GetChains(std::vector<WChain>& OutChains)
{
	return Client->Call("GetChains", WEmptyArgs{}, OutChains);
}

WResult WRemoteController::CreateChain(WChain& Chain)
{
	return Client->Call("CreateChain", WCreateChainArgs{ Chain }, Chain);
}

WResult WRemoteController::UpdateChain(WChain& Chain)
{
	return Client->Call("UpdateChain", WCreateChainArgs{ Chain }, Chain);
}

WResult WRemoteController::DeleteChain(WChainId const& ChainId)
{
	WEmptyArgs Reply{};
	return Client->Call("DeleteChain", WIdArgs{ ChainId }, Reply);
}

WResult WRemoteController::GetConfig(WAppConfig& OutConfig)
{
	return Client->Call("GetConfig", WEmptyArgs{}, OutConfig);
}

WResult WRemoteController::UpdateConfig(WAppConfig const& Config)
{
	WEmptyArgs Reply{};
	return Client->Call("UpdateConfig", Config, Reply);
}

WResult WRemoteController::GetStatus(WServiceStatus& OutStatus)
{
	return Client->Call("GetStatus", WEmptyArgs{}, OutStatus);
}

WResult WRemoteController::GetRuleStats(WRuleId const& RuleId, WRuleStats& OutStats)
{
	return Client->Call("GetRuleStats", WIdArgs{ RuleId }, OutStats);
}

WResult WRemoteController::GetAllRuleStats(std::vector<WRuleStats>& OutStats)
{
	return Client->Call("GetAllRuleStats", WEmptyArgs{}, OutStats);
}

WResult WRemoteController::ResetRuleStats(WRuleId const& RuleId)
{
	WEmptyArgs Reply{};
	return Client->Call("ResetRuleStats", WIdArgs{ RuleId }, Reply);
}

WResult WRemoteController::ResetAllRuleStats()
{
	WEmptyArgs Reply{};
	return Client->Call("ResetAllRuleStats", WEmptyArgs{}, Reply);
}

WResult WRemoteController::GetLogs(int Count, std::vector<WLogEntry>& OutLogs)
{
	return Client->Call("GetLogs", WGetLogsArgs{ Count }, OutLogs);
}

WResult WRemoteController::GetLogsSince(WLogId SinceId, std::vector<WLogEntry>& OutLogs)
{
	return Client->Call("GetLogsSince", WGetLogsSinceArgs{ SinceId }, OutLogs);
}

WResult WRemoteController::GetLogsByRule(WRuleId const& RuleId, std::vector<WLogEntry>& OutLogs)
{
	return Client->Call("GetLogsByRule", WGetLogsByRuleArgs{ RuleId }, OutLogs);
}

WResult WRemoteController::ClearLogs()
{
	WEmptyArgs Reply{};
	return Client->Call("ClearLogs", WEmptyArgs{}, Reply);
}

WResult WRemoteController::ImportData(std::string const& Json, bool bMerge)
{
	WEmptyArgs Reply{};
	return Client->Call("ImportData", WImportDataArgs{ Json, bMerge }, Reply);
}

WResult WRemoteController::ExportData(std::string& OutJson)
{
	return Client->Call("ExportData", WEmptyArgs{}, OutJson);
}

WResult WRemoteController::ClearAllData()
{
	WAppData Empty{};
	if (WResult Result = GetConfig(Empty.Config); !Result.Ok())
	{
		return Result;
	}

	std::string Json{};
	if (WResult Result = WStore::SerializeData(Empty, Json); !Result.Ok())
	{
		return Result;
	}
	return ImportData(Json, false);
}
