//
// Created by usr on 19/11/2025.
//

#include "Daemon.hpp"

#include <chrono>
#include <spdlog/spdlog.h>

#include "DaemonConfig.hpp"
#include "SignalHandler.hpp"
#include "Controller/ControllerFactory.hpp"
#include "Rpc/RpcHandler.hpp"

bool WDaemon::InitController()
{
	if (WResult Result = WControllerFactory::CreateLocal(WDaemonConfig::GetInstance().GetControllerOptions(), Controller);
		!Result.Ok())
	{
		spdlog::critical("Failed to initialize rules: {}", Result.Message);
		return false;
	}
	return true;
}

bool WDaemon::InitRpcServer()
{
	auto Transport = WRpcTransportFactory::Create(WDaemonConfig::GetInstance().Transport);
	RpcServer = std::make_shared<WRpcServer>(Transport, std::make_shared<WRpcHandler>(Controller));

	if (!RpcServer->Start())
	{
		spdlog::warn("Rpc server could not listen on {}, running in degraded mode without remote control",
			Transport->Describe());
		RpcServer.reset();
		return false;
	}
	return true;
}

void WDaemon::RunLoop()
{
	WSignalHandler& SignalHandler = WSignalHandler::GetInstance();

	auto LastPrint = std::chrono::steady_clock::now();
	while (!SignalHandler.bStop)
	{
		SignalHandler.WaitFor(1000);

		auto Now = std::chrono::steady_clock::now();
		if (Now - LastPrint >= std::chrono::seconds(30))
		{
			WServiceStatus Status{};
			if (Controller->GetStatus(Status).Ok())
			{
				spdlog::info("{} of {} rules active", Status.RulesActive, Status.RulesTotal);
			}
			LastPrint = Now;
		}
	}
}

void WDaemon::Shutdown()
{
	if (RpcServer)
	{
		RpcServer->Stop();
		RpcServer.reset();
	}
	if (Controller)
	{
		Controller->GetEngine()->StopAll();
		Controller.reset();
	}
}
