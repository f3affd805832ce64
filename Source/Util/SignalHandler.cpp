//
// Created by usr on 09/10/2025.
//

#include "SignalHandler.hpp"

#include <chrono>
#include <csignal>
#include <thread>

static void OnStopSignal(int)
{
	WSignalHandler::GetInstance().bStop = true;
}

WSignalHandler::WSignalHandler()
{
	signal(SIGINT, OnStopSignal);
	signal(SIGTERM, OnStopSignal);
	// Relay and rpc sockets report broken pipes through send()
	signal(SIGPIPE, SIG_IGN);
}

void WSignalHandler::WaitFor(int Milliseconds) const
{
	for (int Waited = 0; Waited < Milliseconds && !bStop; Waited += 50)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
	}
}
