/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "LocalController.hpp"

#include <unistd.h>
#include <spdlog/spdlog.h>

#include "Random.hpp"
#include "Time.hpp"

#ifndef WEICHE_VERSION
	#define WEICHE_VERSION "unknown"
#endif

static void LogStoreFailure(WRuleId const& RuleId, WResult const& Result)
{
	if (!Result.Ok())
	{
		spdlog::warn("Failed to persist status of rule {}: {}", RuleId, Result.Message);
	}
}

WLocalController::WLocalController(std::shared_ptr<WStore> Store_, std::shared_ptr<WEngine> Engine_)
	: Store(std::move(Store_))
	, Engine(std::move(Engine_))
	, StartTime(WTime::GetEpochMs())
{
}

void WLocalController::SyncChains()
{
	std::vector<WChain> Chains{};
	Store->GetChains(Chains);
	Engine->SetChains(std::move(Chains));
}

WResult WLocalController::MarkFailed(WRuleId const& RuleId, WResult const& Failure)
{
	LogStoreFailure(RuleId, Store->UpdateRuleStatus(RuleId, RS_Error, Failure.Message));
	return Failure;
}

WResult WLocalController::StartInEngine(WRule const& Rule)
{
	// Running is stored first so a failure reported by the serve thread always lands last
	LogStoreFailure(Rule.Id, Store->UpdateRuleStatus(Rule.Id, RS_Running, {}));

	WResult Started = Engine->StartRule(Rule);
	if (!Started.Ok() && Started.Code != EC_AlreadyRunning)
	{
		return MarkFailed(Rule.Id, Started);
	}
	return Started;
}

WResult WLocalController::Init()
{
	SyncChains();

	// The store outlives a running serve thread through this copy
	StatusConnection = Engine->OnStatusChanged.connect(
		[Store = Store](WRuleId const& RuleId, ERuleStatus Status, std::string const& Error) {
			if (Status == RS_Error)
			{
				LogStoreFailure(RuleId, Store->UpdateRuleStatus(RuleId, RS_Error, Error));
			}
			else if (Status == RS_Stopped)
			{
				LogStoreFailure(RuleId, Store->UpdateRuleStatus(RuleId, RS_Stopped, {}));
			}
		});

	std::vector<WRule> Rules{};
	Store->GetRules(Rules);
	for (WRule const& Rule : Rules)
	{
		if (!Rule.bEnabled && Rule.Status == RS_Running)
		{
			LogStoreFailure(Rule.Id, Store->UpdateRuleStatus(Rule.Id, RS_Stopped, {}));
		}
	}

	int Started = 0;
	int Failed = 0;
	if (WResult Result = StartEnabledRules(Started, Failed); !Result.Ok())
	{
		spdlog::warn("Not all enabled rules could be started: {}", Result.Message);
	}
	spdlog::info("Started {} rules, {} failed", Started, Failed);
	return WResult::Success();
}

WResult WLocalController::StartEnabledRules(int& OutStarted, int& OutFailed)
{
	std::vector<WRule> Rules{};
	Store->GetRules(Rules);

	WResult FirstFailure = WResult::Success();
	for (WRule const& Rule : Rules)
	{
		if (!Rule.bEnabled)
		{
			continue;
		}

		WResult Result = StartInEngine(Rule);
		if (Result.Ok() || Result.Code == EC_AlreadyRunning)
		{
			++OutStarted;
			continue;
		}

		++OutFailed;
		spdlog::error("Failed to start rule {} ({}): {}", Rule.Name, Rule.Id, Result.Message);
		if (FirstFailure.Ok())
		{
			FirstFailure = Result;
		}
	}
	return FirstFailure;
}

WResult WLocalController::GetRules(std::vector<WRule>& OutRules)
{
	Store->GetRules(OutRules);
	return WResult::Success();
}

WResult WLocalController::GetRule(WRuleId const& RuleId, WRule& OutRule)
{
	return Store->GetRule(RuleId, OutRule);
}

WResult WLocalController::CreateRule(WRule& Rule)
{
	if (WResult Valid = Rule.Validate(); !Valid.Ok())
	{
		return Valid;
	}
	if (Rule.Id.empty())
	{
		Rule.Id = WRandom::GenerateId();
	}
	Rule.Status = RS_Stopped;
	Rule.ErrorMsg.clear();

	if (WResult Created = Store->CreateRule(Rule); !Created.Ok())
	{
		return Created;
	}

	if (Rule.bEnabled)
	{
		if (WResult Started = StartInEngine(Rule); !Started.Ok())
		{
			Rule.Status = RS_Error;
			Rule.ErrorMsg = Started.Message;
			return Started;
		}
		Rule.Status = RS_Running;
	}
	return WResult::Success();
}

WResult WLocalController::UpdateRule(WRule& Rule)
{
	if (WResult Valid = Rule.Validate(); !Valid.Ok())
	{
		return Valid;
	}

	bool bWasRunning = Engine->IsRunning(Rule.Id);
	if (bWasRunning)
	{
		if (WResult Stopped = Engine->StopRule(Rule.Id); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
		{
			return Stopped;
		}
	}

	Rule.Status = bWasRunning && !Rule.bEnabled ? RS_Stopped : Rule.Status;
	if (WResult Updated = Store->UpdateRule(Rule); !Updated.Ok())
	{
		return Updated;
	}

	if (Rule.bEnabled)
	{
		if (WResult Started = StartInEngine(Rule); !Started.Ok())
		{
			Rule.Status = RS_Error;
			Rule.ErrorMsg = Started.Message;
			return Started;
		}
		Rule.Status = RS_Running;
		Rule.ErrorMsg.clear();
	}
	return WResult::Success();
}

WResult WLocalController::DeleteRule(WRuleId const& RuleId)
{
	if (WResult Stopped = Engine->StopRule(RuleId); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
	{
		return Stopped;
	}
	return Store->DeleteRule(RuleId);
}

WResult WLocalController::StartRule(WRuleId const& RuleId)
{
	WRule Rule{};
	if (WResult Found = Store->GetRule(RuleId, Rule); !Found.Ok())
	{
		return Found;
	}
	if (WResult Valid = Rule.Validate(); !Valid.Ok())
	{
		return MarkFailed(RuleId, Valid);
	}
	if (WResult Started = StartInEngine(Rule); !Started.Ok())
	{
		return Started;
	}

	LogStoreFailure(RuleId, Store->SetRuleEnabled(RuleId, true));
	return WResult::Success();
}

WResult WLocalController::StopRule(WRuleId const& RuleId)
{
	if (WResult Stopped = Engine->StopRule(RuleId); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
	{
		return Stopped;
	}
	if (WResult Disabled = Store->SetRuleEnabled(RuleId, false); !Disabled.Ok())
	{
		return Disabled;
	}
	return Store->UpdateRuleStatus(RuleId, RS_Stopped, {});
}

WResult WLocalController::StartAllRules()
{
	std::vector<WRule> Rules{};
	Store->GetRules(Rules);

	WResult FirstFailure = WResult::Success();
	for (WRule const& Rule : Rules)
	{
		LogStoreFailure(Rule.Id, Store->SetRuleEnabled(Rule.Id, true));

		WResult Started = StartInEngine(Rule);
		if (!Started.Ok() && Started.Code != EC_AlreadyRunning && FirstFailure.Ok())
		{
			FirstFailure = Started;
		}
	}
	return FirstFailure;
}

WResult WLocalController::StopAllRules()
{
	std::vector<WRule> Rules{};
	Store->GetRules(Rules);

	WResult FirstFailure = WResult::Success();
	for (WRule const& Rule : Rules)
	{
		if (WResult Stopped = Engine->StopRule(Rule.Id); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
		{
			if (FirstFailure.Ok())
			{
				FirstFailure = Stopped;
			}
			continue;
		}
		LogStoreFailure(Rule.Id, Store->UpdateRuleStatus(Rule.Id, RS_Stopped, {}));
	}
	return FirstFailure;
}

WResult WLocalController::GetChains(std::vector<WChain>& OutChains)
{
	Store->GetChains(OutChains);
	return WResult::Success();
}

WResult WLocalController::CreateChain(WChain& Chain)
{
	if (WResult Valid = Chain.Validate(); !Valid.Ok())
	{
		return Valid;
	}
	if (Chain.Id.empty())
	{
		Chain.Id = WRandom::GenerateId();
	}
	if (WResult Created = Store->CreateChain(Chain); !Created.Ok())
	{
		return Created;
	}
	SyncChains();
	return WResult::Success();
}

WResult WLocalController::UpdateChain(WChain& Chain)
{
	if (WResult Valid = Chain.Validate(); !Valid.Ok())
	{
		return Valid;
	}
	if (WResult Updated = Store->UpdateChain(Chain); !Updated.Ok())
	{
		return Updated;
	}
	SyncChains();
	return WResult::Success();
}

WResult WLocalController::DeleteChain(WChainId const& ChainId)
{
	if (WResult Deleted = Store->DeleteChain(ChainId); !Deleted.Ok())
	{
		return Deleted;
	}
	SyncChains();
	return WResult::Success();
}

WResult WLocalController::GetConfig(WAppConfig& OutConfig)
{
	Store->GetConfig(OutConfig);
	return WResult::Success();
}

WResult WLocalController::UpdateConfig(WAppConfig const& Config)
{
	return Store->UpdateConfig(Config);
}

WResult WLocalController::GetStatus(WServiceStatus& OutStatus)
{
	OutStatus.bRunning = true;
	OutStatus.Pid = getpid();
	OutStatus.StartTime = WTime::FormatRfc3339(StartTime);
	OutStatus.RulesActive = static_cast<int>(Engine->GetRunningCount());
	OutStatus.RulesTotal = static_cast<int>(Store->GetRuleCount());
	OutStatus.Version = WEICHE_VERSION;
	return WResult::Success();
}

WResult WLocalController::GetRuleStats(WRuleId const& RuleId, WRuleStats& OutStats)
{
	if (Engine->GetStatsTracker().GetStats(RuleId, OutStats))
	{
		return WResult::Success();
	}

	// Known rules that never ran report zeroes
	WRule Rule{};
	if (!Store->GetRule(RuleId, Rule).Ok())
	{
		return WResult::Error(EC_StatsNotFound, fmt::format("no statistics for rule {}", RuleId));
	}
	OutStats = WRuleStats{};
	OutStats.RuleId = RuleId;
	return WResult::Success();
}

WResult WLocalController::GetAllRuleStats(std::vector<WRuleStats>& OutStats)
{
	OutStats.clear();
	for (auto& [RuleId, Stats] : Engine->GetStatsTracker().GetAllStats())
	{
		OutStats.push_back(std::move(Stats));
	}
	return WResult::Success();
}

WResult WLocalController::ResetRuleStats(WRuleId const& RuleId)
{
	WStatsTracker& Tracker = Engine->GetStatsTracker();
	if (!Tracker.HasRule(RuleId))
	{
		return WResult::Error(EC_StatsNotFound, fmt::format("no statistics for rule {}", RuleId));
	}
	Tracker.ResetStats(RuleId);
	return WResult::Success();
}

WResult WLocalController::ResetAllRuleStats()
{
	Engine->GetStatsTracker().ResetAllStats();
	return WResult::Success();
}

WResult WLocalController::GetLogs(int Count, std::vector<WLogEntry>& OutLogs)
{
	OutLogs = Engine->GetLogManager().GetRecent(Count);
	return WResult::Success();
}

WResult WLocalController::GetLogsSince(WLogId SinceId, std::vector<WLogEntry>& OutLogs)
{
	OutLogs = Engine->GetLogManager().GetSince(SinceId);
	return WResult::Success();
}

WResult WLocalController::GetLogsByRule(WRuleId const& RuleId, std::vector<WLogEntry>& OutLogs)
{
	OutLogs = Engine->GetLogManager().GetByRule(RuleId);
	return WResult::Success();
}

WResult WLocalController::ClearLogs()
{
	Engine->GetLogManager().Clear();
	return WResult::Success();
}

WResult WLocalController::ImportData(std::string const& Json, bool bMerge)
{
	WAppData Imported{};
	if (WResult Parsed = WStore::ParseData(Json, Imported); !Parsed.Ok())
	{
		return Parsed;
	}

	if (!bMerge)
	{
		Engine->StopAll();
	}
	else
	{
		// Imported rules replace their running counterparts
		for (WRule const& Rule : Imported.Rules)
		{
			if (WResult Stopped = Engine->StopRule(Rule.Id); !Stopped.Ok() && Stopped.Code != EC_NotRunning)
			{
				return Stopped;
			}
		}
	}

	if (WResult Result = Store->ImportData(Imported, bMerge); !Result.Ok())
	{
		return Result;
	}
	SyncChains();

	int Started = 0;
	int Failed = 0;
	if (WResult Result = StartEnabledRules(Started, Failed); !Result.Ok())
	{
		spdlog::warn("Imported data, {} rules failed to start: {}", Failed, Result.Message);
	}
	spdlog::info("Imported {} rules and {} chains ({}), {} started", Imported.Rules.size(), Imported.Chains.size(),
		bMerge ? "merged" : "replaced", Started);
	return WResult::Success();
}

WResult WLocalController::ExportData(std::string& OutJson)
{
	return Store->ExportData(OutJson);
}

WResult WLocalController::ClearAllData()
{
	Engine->StopAll();

	WAppData Empty{};
	Store->GetConfig(Empty.Config);
	if (WResult Result = Store->ImportData(Empty, false); !Result.Ok())
	{
		return Result;
	}
	Engine->SetChains({});
	Engine->GetStatsTracker().ResetAllStats();
	spdlog::info("Cleared all rules and chains");
	return WResult::Success();
}
