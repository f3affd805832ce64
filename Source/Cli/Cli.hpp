/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Controller/ControllerFactory.hpp"

struct WCliOptions
{
	// Connection
	std::string SocketPath{};
	std::string DataDir{};
	bool        bTcp{ false };
	bool        bVerbose{ false };
	bool        bHelp{ false };

	// logs
	int                   Count{ 50 };
	std::optional<WLogId> SinceId{};
	std::string           RuleFilter{};

	// import
	bool bMerge{ false };

	// rule and chain fields, only what was given on the command line
	std::optional<std::string> Name{};
	std::optional<std::string> Type{};
	std::optional<std::string> Protocol{};
	std::optional<int>         Port{};
	std::vector<std::string>   Targets{};
	std::optional<std::string> ChainId{};
	std::optional<bool>        bEnabled{};
	std::optional<std::string> Description{};
	std::optional<std::string> Remark{};
	std::optional<std::string> Environment{};
	std::vector<std::string>   Hops{};

	std::vector<std::string> Positionals{};
};

class WCli
{
	std::ostream& Out;
	std::ostream& Err;

	WCliOptions                         Options{};
	std::shared_ptr<IServiceController> Controller{};

	int Fail(WResult const& Result) const;
	int Usage(std::string const& Message = {}) const;

	[[nodiscard]] std::string Arg(size_t Index) const
	{
		return Index < Options.Positionals.size() ? Options.Positionals[Index] : std::string{};
	}

	WResult ApplyRuleFlags(WRule& Rule) const;
	WResult BuildChain(WChain& OutChain) const;

	void PrintRule(WRule const& Rule) const;
	void PrintLogs(std::vector<WLogEntry> const& Logs) const;

	int CmdStatus();
	int CmdRule();
	int CmdChain();
	int CmdStats();
	int CmdLogs();
	int CmdExport();
	int CmdImport();
	int CmdClear();
	int CmdRun();

public:
	WCli(std::ostream& Out_, std::ostream& Err_) : Out(Out_), Err(Err_) {}

	// False with an error message on unknown flags or malformed values
	static bool ParseArgs(int Argc, char** Argv, WCliOptions& OutOptions, std::string& OutError);

	[[nodiscard]] WControllerOptions GetControllerOptions() const;

	// Used instead of the factory choice when set
	void SetController(std::shared_ptr<IServiceController> Controller_) { Controller = std::move(Controller_); }

	// Exit code of the command
	int Run(WCliOptions const& Options_);
};
