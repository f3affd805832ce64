/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonConfig.hpp"

#include <charconv>
#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Format.hpp"

WDaemonConfig::WDaemonConfig()
{
	if (WFilesystem::Exists("./weiched.ini"))
	{
		Load("./weiched.ini");
	}
	else if (WFilesystem::Exists("/etc/weiche/weiched.ini"))
	{
		Load("/etc/weiche/weiched.ini");
	}
	else
	{
		spdlog::debug("no configuration file found, using defaults");
	}
}

bool WDaemonConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}

	SafeGet("daemon", "data_dir", DataDir);
	SafeGet("daemon", "log_level", LogLevel);

	std::string TransportName{};
	SafeGet("rpc", "transport", TransportName);
	if (TransportName == "tcp")
	{
		Transport.Kind = RK_Tcp;
	}
	else if (TransportName == "unix")
	{
		Transport.Kind = RK_Unix;
	}
	else if (!TransportName.empty())
	{
		spdlog::warn("unknown rpc transport '{}', using the platform default", TransportName);
	}

	SafeGet("rpc", "socket_path", Transport.SocketPath);
	SafeGet("rpc", "port_file", Transport.MachinePortFile);
	SafeGet("rpc", "user_port_file", Transport.UserPortFile);
	Transport.SocketPermissions =
		static_cast<mode_t>(Reader.GetInteger("rpc", "socket_permissions", Transport.SocketPermissions));

	std::string Ports{};
	SafeGet("rpc", "ports", Ports);
	if (!Ports.empty())
	{
		std::vector<WPort> Parsed{};
		for (auto const& Item : WStringFormat::Split(Ports, ','))
		{
			std::string Trimmed = WStringFormat::Trim(Item);
			unsigned    Port = 0;
			auto [Ptr, Ec] = std::from_chars(Trimmed.data(), Trimmed.data() + Trimmed.size(), Port);
			if (Ec == std::errc{} && Port > 0 && Port <= 65535)
			{
				Parsed.push_back(static_cast<WPort>(Port));
				continue;
			}
			spdlog::warn("ignoring invalid rpc port '{}'", Item);
		}
		if (!Parsed.empty())
		{
			Transport.Ports = std::move(Parsed);
		}
	}

	StatsPollIntervalMs = static_cast<int>(Reader.GetInteger("stats", "poll_interval_ms", StatsPollIntervalMs));
	LogCapacity = static_cast<int>(Reader.GetInteger("logs", "capacity", LogCapacity));
	return true;
}

void WDaemonConfig::LogConfig() const
{
	spdlog::info("data dir={}", WStore::ResolveDataDir(DataDir).string());
	spdlog::info("log level={}", LogLevel);
	spdlog::info("rpc transport={}", WRpcTransportFactory::Create(Transport)->Describe());
	spdlog::info("stats poll interval={}ms", StatsPollIntervalMs);
}

void WDaemonConfig::ApplyLogLevel() const
{
	auto Level = spdlog::level::from_str(LogLevel);
	if (Level == spdlog::level::off && LogLevel != "off")
	{
		spdlog::warn("unknown log level '{}', keeping info", LogLevel);
		Level = spdlog::level::info;
	}
	spdlog::set_level(Level);
}

WControllerOptions WDaemonConfig::GetControllerOptions() const
{
	WControllerOptions Options{};
	Options.Transport = Transport;
	Options.DataDir = DataDir;
	Options.Engine.StatsPollIntervalMs = StatsPollIntervalMs > 0 ? StatsPollIntervalMs : 2000;
	Options.Engine.LogCapacity = LogCapacity;
	return Options;
}
