/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RpcHandler.hpp"

#include <spdlog/spdlog.h>

#include "RpcArgs.hpp"

WRpcHandler::WRpcHandler(std::shared_ptr<IServiceController> Controller_)
	: Controller(std::move(Controller_))
{
	RegisterMethods();
}

void WRpcHandler::RegisterMethods()
{
	IServiceController* C = Controller.get();

	// Rules
	Register<WEmptyArgs, std::vector<WRule>>(
		"GetRules", [C](WEmptyArgs&, std::vector<WRule>& Out) { return C->GetRules(Out); });
	Register<WIdArgs, WRule>("GetRule", [C](WIdArgs& Args, WRule& Out) { return C->GetRule(Args.Id, Out); });
	Register<WCreateRuleArgs, WRule>("CreateRule", [C](WCreateRuleArgs& Args, WRule& Out) {
		WResult Result = C->CreateRule(Args.Rule);
		Out = Args.Rule;
		return Result;
	});
	Register<WCreateRuleArgs, WRule>("UpdateRule", [C](WCreateRuleArgs& Args, WRule& Out) {
		WResult Result = C->UpdateRule(Args.Rule);
		Out = Args.Rule;
		return Result;
	});
	Register<WIdArgs, WEmptyArgs>("DeleteRule", [C](WIdArgs& Args, WEmptyArgs&) { return C->DeleteRule(Args.Id); });
	Register<WIdArgs, WEmptyArgs>("StartRule", [C](WIdArgs& Args, WEmptyArgs&) { return C->StartRule(Args.Id); });
	Register<WIdArgs, WEmptyArgs>("StopRule", [C](WIdArgs& Args, WEmptyArgs&) { return C->StopRule(Args.Id); });
	Register<WEmptyArgs, WEmptyArgs>("StartAllRules", [C](WEmptyArgs&, WEmptyArgs&) { return C->StartAllRules(); });
	Register<WEmptyArgs, WEmptyArgs>("StopAllRules", [C](WEmptyArgs&, WEmptyArgs&) { return C->StopAllRules(); });

	// Chains
	Register<WEmptyArgs, std::vector<WChain>>(
		"GetChains", [C](WEmptyArgs&, std::vector<WChain>& Out) { return C->GetChains(Out); });
	Register<WCreateChainArgs, WChain>("CreateChain", [C](WCreateChainArgs& Args, WChain& Out) {
		WResult Result = C->CreateChain(Args.Chain);
		Out = Args.Chain;
		return Result;
	});
	Register<WCreateChainArgs, WChain>("UpdateChain", [C](WCreateChainArgs& Args, WChain& Out) {
		WResult Result = C->UpdateChain(Args.Chain);
		Out = Args.Chain;
		return Result;
	});
	Register<WIdArgs, WEmptyArgs>("DeleteChain", [C](WIdArgs& Args, WEmptyArgs&) { return C->DeleteChain(Args.Id); });

	// Config and status
	Register<WEmptyArgs, WAppConfig>("GetConfig", [C](WEmptyArgs&, WAppConfig& Out) { return C->GetConfig(Out); });
	Register<WAppConfig, WEmptyArgs>(
		"UpdateConfig", [C](WAppConfig& Config, WEmptyArgs&) { return C->UpdateConfig(Config); });
	Register<WEmptyArgs, WServiceStatus>(
		"GetStatus", [C](WEmptyArgs&, WServiceStatus& Out) { return C->GetStatus(Out); });

	// Stats
	Register<WIdArgs, WRuleStats>(
		"GetRuleStats", [C](WIdArgs& Args, WRuleStats& Out) { return C->GetRuleStats(Args.Id, Out); });
	Register<WEmptyArgs, std::vector<WRuleStats>>(
		"GetAllRuleStats", [C](WEmptyArgs&, std::vector<WRuleStats>& Out) { return C->GetAllRuleStats(Out); });
	Register<WIdArgs, WEmptyArgs>(
		"ResetRuleStats", [C](WIdArgs& Args, WEmptyArgs&) { return C->ResetRuleStats(Args.Id); });
	Register<WEmptyArgs, WEmptyArgs>(
		"ResetAllRuleStats", [C](WEmptyArgs&, WEmptyArgs&) { return C->ResetAllRuleStats(); });

	// Logs
	Register<WGetLogsArgs, std::vector<WLogEntry>>("GetLogs",
		[C](WGetLogsArgs& Args, std::vector<WLogEntry>& Out) { return C->GetLogs(Args.Count, Out); });
	Register<WGetLogsSinceArgs, std::vector<WLogEntry>>("GetLogsSince",
		[C](WGetLogsSinceArgs& Args, std::vector<WLogEntry>& Out) { return C->GetLogsSince(Args.SinceId, Out); });
	Register<WGetLogsByRuleArgs, std::vector<WLogEntry>>("GetLogsByRule",
		[C](WGetLogsByRuleArgs& Args, std::vector<WLogEntry>& Out) { return C->GetLogsByRule(Args.RuleId, Out); });
	Register<WEmptyArgs, WEmptyArgs>("ClearLogs", [C](WEmptyArgs&, WEmptyArgs&) { return C->ClearLogs(); });

	// Data
	Register<WImportDataArgs, WEmptyArgs>(
		"ImportData", [C](WImportDataArgs& Args, WEmptyArgs&) { return C->ImportData(Args.Data, Args.bMerge); });
	Register<WEmptyArgs, std::string>("ExportData", [C](WEmptyArgs&, std::string& Out) { return C->ExportData(Out); });
}

WRpcResponse WRpcHandler::Handle(WRpcRequest const& Request) const
{
	WRpcResponse Response{};
	Response.CallId = Request.CallId;

	if (Request.Version != WEICHE_PROTOCOL_VERSION)
	{
		spdlog::warn("Rejecting {} from protocol version {}, expected {}", Request.Method, Request.Version,
			WEICHE_PROTOCOL_VERSION);
		Response.ErrorCode = EC_Protocol;
		Response.Error = fmt::format("protocol version mismatch (client {}, server {})", Request.Version,
			WEICHE_PROTOCOL_VERSION);
		return Response;
	}

	auto It = Methods.find(Request.Method);
	if (It == Methods.end())
	{
		spdlog::warn("Unknown rpc method '{}'", Request.Method);
		Response.ErrorCode = EC_UnknownMethod;
		Response.Error = fmt::format("unknown method {}", Request.Method);
		return Response;
	}

	spdlog::debug("Handling {} ({})", Request.Method, Request.CallId);
	WResult Result = It->second(Request.Args, Response.Payload);
	Response.bSuccess = Result.Ok();
	Response.ErrorCode = Result.Code;
	Response.Error = Result.Message;
	if (!Result.Ok())
	{
		spdlog::debug("{} ({}) failed with {}: {}", Request.Method, Request.CallId, ErrorCodeToString(Result.Code),
			Result.Message);
		Response.Payload.clear();
	}
	return Response;
}
