/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ControllerFactory.hpp"

#include <spdlog/spdlog.h>

#include "Engine/RelayServiceBuilder.hpp"

WResult WControllerFactory::Create(WControllerOptions const& Options, WControllerSelection& OutSelection)
{
	auto Transport = WRpcTransportFactory::Create(Options.Transport);

	auto Probe = std::make_shared<WRpcClient>(Transport, Options.PingTimeoutMs);
	if (WResult Ping = Probe->Ping(); Ping.Ok())
	{
		Probe->Close();
		spdlog::debug("Service answered on {}, using remote mode", Transport->Describe());
		OutSelection.Controller =
			std::make_shared<WRemoteController>(std::make_shared<WRpcClient>(Transport, Options.CallTimeoutMs));
		OutSelection.Local.reset();
		return WResult::Success();
	}
	else
	{
		spdlog::debug("Service not reachable ({}), using local mode", Ping.Message);
	}

	std::shared_ptr<WLocalController> Local{};
	if (WResult Result = CreateLocal(Options, Local); !Result.Ok())
	{
		return Result;
	}
	OutSelection.Controller = Local;
	OutSelection.Local = Local;
	return WResult::Success();
}

WResult WControllerFactory::CreateLocal(WControllerOptions const& Options, std::shared_ptr<WLocalController>& OutLocal)
{
	auto Store = std::make_shared<WStore>(WStore::ResolveDataDir(Options.DataDir));
	if (WResult Loaded = Store->Load(); !Loaded.Ok())
	{
		return Loaded;
	}

	auto Engine = std::make_shared<WEngine>(
		std::make_shared<WRelayServiceBuilder>(), std::make_shared<WStatsObserver>(), Options.Engine);
	auto Local = std::make_shared<WLocalController>(Store, Engine);
	if (WResult Init = Local->Init(); !Init.Ok())
	{
		return Init;
	}
	OutLocal = Local;
	return WResult::Success();
}
