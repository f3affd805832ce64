/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Cli.hpp"

#include <algorithm>
#include <charconv>
#include <getopt.h>
#include <mutex>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Format.hpp"
#include "SignalHandler.hpp"
#include "Time.hpp"
#include "Daemon/DaemonConfig.hpp"
#include "Rpc/RpcClient.hpp"
#include "Rpc/RpcHandler.hpp"
#include "Rpc/RpcServer.hpp"
#include "SingleInstance/SingleInstance.hpp"

#ifndef WEICHE_VERSION
	#define WEICHE_VERSION "unknown"
#endif

namespace
{
	enum ELongOption
	{
		LO_Type = 256,
		LO_Protocol,
		LO_Chain,
		LO_Enabled,
		LO_Disabled,
		LO_Description,
		LO_Remark,
		LO_Env,
		LO_Hop,
		LO_Since,
		LO_Rule,
		LO_Merge,
		LO_Tcp,
	};

	char const* const UsageText = R"(usage: weiche [options] <command> [args]

commands:
  status                              service status
  rule list|show <id>|delete <id>     inspect or remove rules
  rule create [rule flags]            create a rule
  rule update <id> [rule flags]       change a rule
  rule start|stop <id>                start or stop a rule
  rule start-all|stop-all             start or stop every rule
  chain list|show <id>|delete <id>    inspect or remove chains
  chain create --name n --hop a[,p]   create a chain, hops in order
  stats [id]                          traffic statistics
  stats reset [id]                    reset statistics
  logs [--count n] [--since id] [--rule id]
  logs clear
  export [file]                       print or write all data as json
  import <file> [--merge]             load data from a json file
  clear                               remove all rules and chains
  run                                 host the rules in this process
  version

rule flags:
  --name, --type forward|reverse|chain, --protocol tcp|udp|http|https|socks5|ss,
  --port n, --target host:port (repeatable), --chain id, --enabled, --disabled,
  --description, --remark, --env

options:
  -s, --socket path    rpc socket path
  -d, --data-dir dir   data directory for local mode
      --tcp            use the loopback tcp transport
  -v, --verbose        debug logging
)";

	bool ParseNumber(char const* Str, int64_t& Out)
	{
		std::string_view View(Str);
		auto [Ptr, Ec] = std::from_chars(View.data(), View.data() + View.size(), Out);
		return Ec == std::errc{} && Ptr == View.data() + View.size();
	}
} // namespace

bool WCli::ParseArgs(int Argc, char** Argv, WCliOptions& OutOptions, std::string& OutError)
{
	static option const LongOptions[] = {
		{ "socket", required_argument, nullptr, 's' },
		{ "data-dir", required_argument, nullptr, 'd' },
		{ "tcp", no_argument, nullptr, LO_Tcp },
		{ "verbose", no_argument, nullptr, 'v' },
		{ "help", no_argument, nullptr, 'h' },
		{ "count", required_argument, nullptr, 'n' },
		{ "since", required_argument, nullptr, LO_Since },
		{ "rule", required_argument, nullptr, LO_Rule },
		{ "merge", no_argument, nullptr, LO_Merge },
		{ "name", required_argument, nullptr, 'N' },
		{ "type", required_argument, nullptr, LO_Type },
		{ "protocol", required_argument, nullptr, LO_Protocol },
		{ "port", required_argument, nullptr, 'p' },
		{ "target", required_argument, nullptr, 't' },
		{ "chain", required_argument, nullptr, LO_Chain },
		{ "enabled", no_argument, nullptr, LO_Enabled },
		{ "disabled", no_argument, nullptr, LO_Disabled },
		{ "description", required_argument, nullptr, LO_Description },
		{ "remark", required_argument, nullptr, LO_Remark },
		{ "env", required_argument, nullptr, LO_Env },
		{ "hop", required_argument, nullptr, LO_Hop },
		{ nullptr, 0, nullptr, 0 },
	};

	OutOptions = WCliOptions{};
	opterr = 0;
	optind = 0; // full reset, ParseArgs may run more than once per process

	int C;
	while ((C = getopt_long(Argc, Argv, "s:d:vhn:N:p:t:", LongOptions, nullptr)) != -1)
	{
		int64_t Number = 0;
		switch (C)
		{
			case 's':
				OutOptions.SocketPath = optarg;
				break;
			case 'd':
				OutOptions.DataDir = optarg;
				break;
			case LO_Tcp:
				OutOptions.bTcp = true;
				break;
			case 'v':
				OutOptions.bVerbose = true;
				break;
			case 'h':
				OutOptions.bHelp = true;
				break;
			case 'n':
				if (!ParseNumber(optarg, Number))
				{
					OutError = fmt::format("invalid count '{}'", optarg);
					return false;
				}
				OutOptions.Count = static_cast<int>(Number);
				break;
			case LO_Since:
				if (!ParseNumber(optarg, Number))
				{
					OutError = fmt::format("invalid log id '{}'", optarg);
					return false;
				}
				OutOptions.SinceId = Number;
				break;
			case LO_Rule:
				OutOptions.RuleFilter = optarg;
				break;
			case LO_Merge:
				OutOptions.bMerge = true;
				break;
			case 'N':
				OutOptions.Name = optarg;
				break;
			case LO_Type:
				OutOptions.Type = optarg;
				break;
			case LO_Protocol:
				OutOptions.Protocol = optarg;
				break;
			case 'p':
				if (!ParseNumber(optarg, Number) || Number <= 0 || Number > 65535)
				{
					OutError = fmt::format("invalid port '{}'", optarg);
					return false;
				}
				OutOptions.Port = static_cast<int>(Number);
				break;
			case 't':
				OutOptions.Targets.emplace_back(optarg);
				break;
			case LO_Chain:
				OutOptions.ChainId = optarg;
				break;
			case LO_Enabled:
				OutOptions.bEnabled = true;
				break;
			case LO_Disabled:
				OutOptions.bEnabled = false;
				break;
			case LO_Description:
				OutOptions.Description = optarg;
				break;
			case LO_Remark:
				OutOptions.Remark = optarg;
				break;
			case LO_Env:
				OutOptions.Environment = optarg;
				break;
			case LO_Hop:
				OutOptions.Hops.emplace_back(optarg);
				break;
			case '?':
			default:
				OutError = optopt ? fmt::format("unknown or incomplete option -{}", static_cast<char>(optopt))
								  : fmt::format("unknown option {}", Argv[optind - 1]);
				return false;
		}
	}

	for (int i = optind; i < Argc; ++i)
	{
		OutOptions.Positionals.emplace_back(Argv[i]);
	}
	return true;
}

WControllerOptions WCli::GetControllerOptions() const
{
	WControllerOptions ControllerOptions = WDaemonConfig::GetInstance().GetControllerOptions();
	if (!Options.SocketPath.empty())
	{
		ControllerOptions.Transport.Kind = RK_Unix;
		ControllerOptions.Transport.SocketPath = Options.SocketPath;
	}
	if (Options.bTcp)
	{
		ControllerOptions.Transport.Kind = RK_Tcp;
	}
	if (!Options.DataDir.empty())
	{
		ControllerOptions.DataDir = Options.DataDir;
	}
	return ControllerOptions;
}

int WCli::Fail(WResult const& Result) const
{
	Err << Result.Message << "\n";
	return 1;
}

int WCli::Usage(std::string const& Message) const
{
	if (!Message.empty())
	{
		Err << Message << "\n";
	}
	(Message.empty() ? Out : Err) << UsageText;
	return Message.empty() ? 0 : 1;
}

int WCli::Run(WCliOptions const& Options_)
{
	Options = Options_;
	spdlog::set_level(Options.bVerbose ? spdlog::level::debug : spdlog::level::warn);

	std::string Command = Arg(0);
	if (Options.bHelp || Command == "help")
	{
		return Usage();
	}
	if (Command.empty())
	{
		return Usage("missing command");
	}
	if (Command == "version")
	{
		Out << "weiche " << WEICHE_VERSION << "\n";
		return 0;
	}
	if (Command == "run")
	{
		return CmdRun();
	}

	if (!Controller)
	{
		WControllerSelection Selection{};
		if (WResult Result = WControllerFactory::Create(GetControllerOptions(), Selection); !Result.Ok())
		{
			return Fail(Result);
		}
		Controller = Selection.Controller;
	}

	if (Command == "status")
		return CmdStatus();
	if (Command == "rule")
		return CmdRule();
	if (Command == "chain")
		return CmdChain();
	if (Command == "stats")
		return CmdStats();
	if (Command == "logs")
		return CmdLogs();
	if (Command == "export")
		return CmdExport();
	if (Command == "import")
		return CmdImport();
	if (Command == "clear")
		return CmdClear();
	return Usage(fmt::format("unknown command '{}'", Command));
}

int WCli::CmdStatus()
{
	WServiceStatus Status{};
	if (WResult Result = Controller->GetStatus(Status); !Result.Ok())
	{
		return Fail(Result);
	}
	Out << fmt::format("running:  {}\n", Status.bRunning ? "yes" : "no");
	Out << fmt::format("pid:      {}\n", Status.Pid);
	Out << fmt::format("started:  {}\n", Status.StartTime);
	Out << fmt::format("rules:    {} active / {} total\n", Status.RulesActive, Status.RulesTotal);
	Out << fmt::format("version:  {}\n", Status.Version);
	return 0;
}

WResult WCli::ApplyRuleFlags(WRule& Rule) const
{
	if (Options.Name)
		Rule.Name = *Options.Name;
	if (Options.Environment)
		Rule.Environment = *Options.Environment;
	if (Options.Description)
		Rule.Description = *Options.Description;
	if (Options.Remark)
		Rule.Remark = *Options.Remark;
	if (Options.ChainId)
		Rule.ChainId = *Options.ChainId;
	if (Options.bEnabled)
		Rule.bEnabled = *Options.bEnabled;
	if (Options.Port)
		Rule.LocalPort = *Options.Port;

	if (Options.Type && !ParseRuleType(*Options.Type, Rule.Type))
	{
		return WResult::Validation("type", -1, fmt::format("unknown rule type '{}'", *Options.Type));
	}
	if (Options.Protocol && !ParseProtocol(*Options.Protocol, Rule.Protocol))
	{
		return WResult::Validation("protocol", -1, fmt::format("unknown protocol '{}'", *Options.Protocol));
	}

	if (!Options.Targets.empty())
	{
		std::vector<WTarget> Targets{};
		for (size_t i = 0; i < Options.Targets.size(); ++i)
		{
			WTarget Target{};
			if (!WStringFormat::ParseHostPort(Options.Targets[i], Target.Host, Target.Port) || Target.Host.empty())
			{
				return WResult::Validation("targets", static_cast<int>(i), "expected host:port");
			}
			Targets.push_back(Target);
		}

		// A single target is the primary one
		if (Targets.size() == 1)
		{
			Rule.TargetHost = Targets.front().Host;
			Rule.TargetPort = Targets.front().Port;
			Rule.Targets.clear();
		}
		else
		{
			Rule.TargetHost.clear();
			Rule.TargetPort = 0;
			Rule.Targets = std::move(Targets);
		}
	}
	return WResult::Success();
}

void WCli::PrintRule(WRule const& Rule) const
{
	Out << fmt::format("id:          {}\n", Rule.Id);
	Out << fmt::format("name:        {}\n", Rule.Name);
	if (!Rule.Environment.empty())
		Out << fmt::format("environment: {}\n", Rule.Environment);
	Out << fmt::format("type:        {}\n", RuleTypeToString(Rule.Type));
	Out << fmt::format("protocol:    {}\n", ProtocolToString(Rule.Protocol));
	Out << fmt::format("listen:      :{}\n", Rule.LocalPort);
	for (auto const& Target : Rule.GetEffectiveTargets())
	{
		Out << fmt::format("target:      {}:{} (weight {})\n", Target.Host, Target.Port, Target.Weight);
	}
	if (!Rule.ChainId.empty())
		Out << fmt::format("chain:       {}\n", Rule.ChainId);
	Out << fmt::format("enabled:     {}\n", Rule.bEnabled ? "yes" : "no");
	Out << fmt::format("status:      {}\n", RuleStatusToString(Rule.Status));
	if (!Rule.ErrorMsg.empty())
		Out << fmt::format("error:       {}\n", Rule.ErrorMsg);
	if (!Rule.Description.empty())
		Out << fmt::format("description: {}\n", Rule.Description);
	if (!Rule.Remark.empty())
		Out << fmt::format("remark:      {}\n", Rule.Remark);
	Out << fmt::format("created:     {}\n", WTime::FormatRfc3339(Rule.CreatedAt));
	Out << fmt::format("updated:     {}\n", WTime::FormatRfc3339(Rule.UpdatedAt));
}

int WCli::CmdRule()
{
	std::string Sub = Arg(1);
	std::string Id = Arg(2);

	if (Sub.empty() || Sub == "list")
	{
		std::vector<WRule> Rules{};
		if (WResult Result = Controller->GetRules(Rules); !Result.Ok())
		{
			return Fail(Result);
		}
		Out << fmt::format("{:<18} {:<20} {:<8} {:<6} {:<7} {:<24} {}\n", "ID", "NAME", "TYPE", "PROTO", "LISTEN",
			"TARGET", "STATUS");
		for (auto const& Rule : Rules)
		{
			Out << fmt::format("{:<18} {:<20} {:<8} {:<6} {:<7} {:<24} {}\n", Rule.Id, Rule.Name,
				RuleTypeToString(Rule.Type), ProtocolToString(Rule.Protocol), fmt::format(":{}", Rule.LocalPort),
				Rule.GetTargetAddr(), RuleStatusToString(Rule.Status));
		}
		return 0;
	}

	if (Sub == "create")
	{
		WRule Rule{};
		Rule.bEnabled = false;
		if (WResult Result = ApplyRuleFlags(Rule); !Result.Ok())
		{
			return Fail(Result);
		}
		if (WResult Result = Controller->CreateRule(Rule); !Result.Ok())
		{
			return Fail(Result);
		}
		Out << Rule.Id << "\n";
		return 0;
	}

	if (Sub == "start-all")
	{
		WResult Result = Controller->StartAllRules();
		return Result.Ok() ? 0 : Fail(Result);
	}
	if (Sub == "stop-all")
	{
		WResult Result = Controller->StopAllRules();
		return Result.Ok() ? 0 : Fail(Result);
	}

	if (Id.empty())
	{
		return Usage(fmt::format("rule {} needs a rule id", Sub));
	}

	if (Sub == "show")
	{
		WRule Rule{};
		if (WResult Result = Controller->GetRule(Id, Rule); !Result.Ok())
		{
			return Fail(Result);
		}
		PrintRule(Rule);
		return 0;
	}
	if (Sub == "update")
	{
		WRule Rule{};
		if (WResult Result = Controller->GetRule(Id, Rule); !Result.Ok())
		{
			return Fail(Result);
		}
		if (WResult Result = ApplyRuleFlags(Rule); !Result.Ok())
		{
			return Fail(Result);
		}
		WResult Result = Controller->UpdateRule(Rule);
		return Result.Ok() ? 0 : Fail(Result);
	}
	if (Sub == "delete")
	{
		WResult Result = Controller->DeleteRule(Id);
		return Result.Ok() ? 0 : Fail(Result);
	}
	if (Sub == "start")
	{
		WResult Result = Controller->StartRule(Id);
		return Result.Ok() ? 0 : Fail(Result);
	}
	if (Sub == "stop")
	{
		WResult Result = Controller->StopRule(Id);
		return Result.Ok() ? 0 : Fail(Result);
	}
	return Usage(fmt::format("unknown rule command '{}'", Sub));
}

WResult WCli::BuildChain(WChain& OutChain) const
{
	OutChain.Name = Options.Name.value_or("");
	OutChain.Description = Options.Description.value_or("");
	for (size_t i = 0; i < Options.Hops.size(); ++i)
	{
		auto Parts = WStringFormat::Split(Options.Hops[i], ',');
		WHop Hop{};
		Hop.Addr = WStringFormat::Trim(Parts[0]);
		Hop.Name = fmt::format("hop-{}", i + 1);
		if (Parts.size() > 1 && !ParseProtocol(WStringFormat::Trim(Parts[1]), Hop.Protocol))
		{
			return WResult::Validation("hops", static_cast<int>(i), fmt::format("unknown protocol '{}'", Parts[1]));
		}
		OutChain.Hops.push_back(std::move(Hop));
	}
	return WResult::Success();
}

int WCli::CmdChain()
{
	std::string Sub = Arg(1);
	std::string Id = Arg(2);

	if (Sub.empty() || Sub == "list" || Sub == "show")
	{
		std::vector<WChain> Chains{};
		if (WResult Result = Controller->GetChains(Chains); !Result.Ok())
		{
			return Fail(Result);
		}

		if (Sub == "show")
		{
			auto It = std::ranges::find_if(Chains, [&](WChain const& Chain) { return Chain.Id == Id; });
			if (It == Chains.end())
			{
				return Fail(WResult::ChainNotFound());
			}
			Out << fmt::format("id:    {}\nname:  {}\n", It->Id, It->Name);
			if (!It->Description.empty())
				Out << fmt::format("description: {}\n", It->Description);
			for (size_t i = 0; i < It->Hops.size(); ++i)
			{
				Out << fmt::format("hop {}: {} ({})\n", i + 1, It->Hops[i].Addr, ProtocolToString(It->Hops[i].Protocol));
			}
			return 0;
		}

		Out << fmt::format("{:<18} {:<20} {}\n", "ID", "NAME", "HOPS");
		for (auto const& Chain : Chains)
		{
			Out << fmt::format("{:<18} {:<20} {}\n", Chain.Id, Chain.Name, Chain.Hops.size());
		}
		return 0;
	}

	if (Sub == "create")
	{
		WChain Chain{};
		if (WResult Result = BuildChain(Chain); !Result.Ok())
		{
			return Fail(Result);
		}
		if (WResult Result = Controller->CreateChain(Chain); !Result.Ok())
		{
			return Fail(Result);
		}
		Out << Chain.Id << "\n";
		return 0;
	}

	if (Sub == "delete")
	{
		if (Id.empty())
		{
			return Usage("chain delete needs a chain id");
		}
		WResult Result = Controller->DeleteChain(Id);
		return Result.Ok() ? 0 : Fail(Result);
	}
	return Usage(fmt::format("unknown chain command '{}'", Sub));
}

int WCli::CmdStats()
{
	if (Arg(1) == "reset")
	{
		std::string Id = Arg(2);
		WResult     Result = Id.empty() ? Controller->ResetAllRuleStats() : Controller->ResetRuleStats(Id);
		return Result.Ok() ? 0 : Fail(Result);
	}

	std::vector<WRuleStats> All{};
	if (std::string Id = Arg(1); !Id.empty())
	{
		WRuleStats Stats{};
		if (WResult Result = Controller->GetRuleStats(Id, Stats); !Result.Ok())
		{
			return Fail(Result);
		}
		All.push_back(Stats);
	}
	else if (WResult Result = Controller->GetAllRuleStats(All); !Result.Ok())
	{
		return Fail(Result);
	}

	Out << fmt::format("{:<18} {:>12} {:>12} {:>8} {:>7} {:>7}  {}\n", "RULE", "IN", "OUT", "CONNS", "ACTIVE",
		"ERRORS", "LAST ACTIVITY");
	for (auto const& Stats : All)
	{
		Out << fmt::format("{:<18} {:>12} {:>12} {:>8} {:>7} {:>7}  {}\n", Stats.RuleId,
			WStorageFormat::AutoFormat(static_cast<WBytes>(Stats.BytesIn)),
			WStorageFormat::AutoFormat(static_cast<WBytes>(Stats.BytesOut)), Stats.Connections, Stats.ActiveConns,
			Stats.Errors, Stats.LastActivity);
	}
	return 0;
}

void WCli::PrintLogs(std::vector<WLogEntry> const& Logs) const
{
	for (auto const& Entry : Logs)
	{
		std::string Rule = Entry.RuleName.empty() ? Entry.RuleId : Entry.RuleName;
		Out << fmt::format("{:>6} {} {:<5} {}{}{}\n", Entry.Id, Entry.Timestamp, LogLevelToString(Entry.Level),
			Rule.empty() ? "" : "[" + Rule + "] ", Entry.Message,
			Entry.Details.empty() ? "" : ": " + Entry.Details);
	}
}

int WCli::CmdLogs()
{
	if (Arg(1) == "clear")
	{
		WResult Result = Controller->ClearLogs();
		return Result.Ok() ? 0 : Fail(Result);
	}

	std::vector<WLogEntry> Logs{};
	WResult                Result = WResult::Success();
	if (!Options.RuleFilter.empty())
	{
		Result = Controller->GetLogsByRule(Options.RuleFilter, Logs);
	}
	else if (Options.SinceId)
	{
		Result = Controller->GetLogsSince(*Options.SinceId, Logs);
	}
	else
	{
		Result = Controller->GetLogs(Options.Count, Logs);
	}
	if (!Result.Ok())
	{
		return Fail(Result);
	}
	PrintLogs(Logs);
	return 0;
}

int WCli::CmdExport()
{
	std::string Json{};
	if (WResult Result = Controller->ExportData(Json); !Result.Ok())
	{
		return Fail(Result);
	}

	if (std::string File = Arg(1); !File.empty())
	{
		if (!WFilesystem::WriteFileAtomic(File, Json))
		{
			return Fail(WResult::Error(EC_Storage, fmt::format("failed to write {}", File)));
		}
		return 0;
	}
	Out << Json << "\n";
	return 0;
}

int WCli::CmdImport()
{
	std::string File = Arg(1);
	if (File.empty())
	{
		return Usage("import needs a file");
	}

	std::string Json{};
	if (!WFilesystem::ReadFile(File, Json))
	{
		return Fail(WResult::Error(EC_Storage, fmt::format("failed to read {}", File)));
	}
	WResult Result = Controller->ImportData(Json, Options.bMerge);
	return Result.Ok() ? 0 : Fail(Result);
}

int WCli::CmdClear()
{
	WResult Result = Controller->ClearAllData();
	return Result.Ok() ? 0 : Fail(Result);
}

int WCli::CmdRun()
{
	WSingleInstance Instance("weiche");
	switch (Instance.TryLock())
	{
		case LR_AlreadyRunning:
			if (!Instance.SendWakeup())
			{
				return Fail(WResult::Error(EC_Transport, "weiche is already running but did not answer the wake-up"));
			}
			Out << "weiche is already running, asked it to show itself\n";
			return 0;
		case LR_Error:
			return Fail(WResult::Error(EC_Storage, "failed to acquire the instance lock"));
		case LR_Acquired:
		default:
			break;
	}

	WControllerOptions ControllerOptions = GetControllerOptions();

	// The rules must not run twice
	WRpcClient Probe(WRpcTransportFactory::Create(ControllerOptions.Transport), ControllerOptions.PingTimeoutMs);
	if (Probe.Ping().Ok())
	{
		return Fail(WResult::AlreadyRunning());
	}

	WSignalHandler& SignalHandler = WSignalHandler::GetInstance();
	spdlog::set_level(Options.bVerbose ? spdlog::level::debug : spdlog::level::info);

	std::shared_ptr<WLocalController> Local{};
	if (WResult Result = WControllerFactory::CreateLocal(ControllerOptions, Local); !Result.Ok())
	{
		return Fail(Result);
	}

	// Log entries arrive from relay threads
	std::mutex   OutMutex{};
	WLogManager& Logs = Local->GetEngine()->GetLogManager();
	PrintLogs(Logs.GetAll());
	sigslot::scoped_connection LogConnection = Logs.OnEntryAdded.connect([this, &OutMutex](WLogEntry const& Entry) {
		std::lock_guard Lock(OutMutex);
		PrintLogs({ Entry });
	});

	Instance.StartWakeupListener([this, &OutMutex, Local] {
		WServiceStatus Status{};
		if (Local->GetStatus(Status).Ok())
		{
			std::lock_guard Lock(OutMutex);
			Out << fmt::format("{} of {} rules active\n", Status.RulesActive, Status.RulesTotal);
		}
	});

	WRpcServer Server(
		WRpcTransportFactory::Create(ControllerOptions.Transport), std::make_shared<WRpcHandler>(Local));
	if (!Server.Start())
	{
		spdlog::warn("Rpc server unavailable, other clients cannot reach this instance");
	}

	while (!SignalHandler.bStop)
	{
		SignalHandler.WaitFor(500);
	}

	Server.Stop();
	Instance.Unlock();
	LogConnection.disconnect();
	Local->GetEngine()->StopAll();
	return 0;
}
