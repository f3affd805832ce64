/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SingleInstance.hpp"

#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

namespace
{
	constexpr int DialTimeoutMs{ 2000 };
	constexpr int PortAttemptMs{ 500 };
	constexpr int ReadDeadlineMs{ 1000 };
	constexpr int MaxTokenLength{ 16 };
} // namespace

WSingleInstance::WSingleInstance(std::string Name_, stdfs::path const& Dir, ERpcTransportKind Kind)
	: Name(std::move(Name_))
	, LockPath(Dir / (Name + ".lock"))
{
	WRpcTransportConfig Config{};
	Config.Kind = Kind;
	Config.SocketPath = (Dir / (Name + "-wakeup.sock")).string();
	Config.Ports = { 19847, 19857, 19867, 19877, 19887 };
	Config.bUsePortFiles = false;
	WakeupChannel = WRpcTransportFactory::Create(Config);
}

WSingleInstance::~WSingleInstance()
{
	Unlock();
}

ELockResult WSingleInstance::TryLock()
{
	if (LockFd >= 0)
	{
		return LR_Acquired;
	}

	int Fd = open(LockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
	if (Fd < 0)
	{
		spdlog::error("Failed to open lock file {}: {}", LockPath.string(), WErrnoUtil::StrError());
		return LR_Error;
	}

	if (flock(Fd, LOCK_EX | LOCK_NB) < 0)
	{
		int Error = errno;
		close(Fd);
		if (Error == EWOULDBLOCK)
		{
			return LR_AlreadyRunning;
		}
		spdlog::error("Failed to lock {}: {}", LockPath.string(), WErrnoUtil::StrError(Error));
		return LR_Error;
	}

	std::string Pid = std::to_string(getpid());
	if (ftruncate(Fd, 0) < 0 || write(Fd, Pid.data(), Pid.size()) < 0)
	{
		spdlog::warn("Failed to write pid to {}: {}", LockPath.string(), WErrnoUtil::StrError());
	}
	LockFd = Fd;
	spdlog::debug("Acquired instance lock {}", LockPath.string());
	return LR_Acquired;
}

bool WSingleInstance::SendWakeup()
{
	size_t Endpoints = WakeupChannel->GetEndpointCount();
	int    Timeout = Endpoints > 1 ? PortAttemptMs * static_cast<int>(Endpoints) : DialTimeoutMs;

	auto Socket = WakeupChannel->Dial(Timeout);
	if (!Socket)
	{
		spdlog::warn("Cannot reach the running instance on {}", WakeupChannel->Describe());
		return false;
	}

	if (Socket->Send(WakeupToken, std::strlen(WakeupToken)) < 0)
	{
		spdlog::warn("Failed to send wake-up signal: {}", WErrnoUtil::StrError());
		return false;
	}
	spdlog::info("Wake-up signal sent");
	return true;
}

bool WSingleInstance::StartWakeupListener(std::function<void()> Callback)
{
	std::lock_guard Lock(ListenerMutex);
	if (bListening)
	{
		return true;
	}

	Listener = WakeupChannel->Listen();
	if (!Listener)
	{
		spdlog::warn("Failed to create wake-up listener on {}, wake-up will not work", WakeupChannel->Describe());
		return false;
	}

	OnWakeup = std::move(Callback);
	bListening = true;
	ListenThread = std::thread(&WSingleInstance::ListenThreadFunction, this);
	spdlog::info("Wake-up listener started on {}", WakeupChannel->Describe());
	return true;
}

void WSingleInstance::ListenThreadFunction()
{
	using WClock = std::chrono::steady_clock;

	while (bListening)
	{
		bool bTimedOut = false;
		auto Client = Listener->Accept(250, &bTimedOut);
		if (!Client)
		{
			continue;
		}

		std::string Token{};
		char        Buf[MaxTokenLength];
		auto const  Deadline = WClock::now() + std::chrono::milliseconds(ReadDeadlineMs);
		while (Token.size() < MaxTokenLength)
		{
			auto Left = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - WClock::now()).count();
			if (Left <= 0)
			{
				break;
			}

			size_t Got = 0;
			if (Client->ReceiveSome(Buf, MaxTokenLength - Token.size(), Got, static_cast<int>(Left)) != RR_Data)
			{
				break;
			}
			Token.append(Buf, Got);
		}
		Client->Close();

		if (Token == WakeupToken)
		{
			spdlog::info("Received wake-up signal");
			if (OnWakeup)
			{
				OnWakeup();
			}
		}
		else
		{
			spdlog::debug("Ignoring {} bytes on the wake-up channel", Token.size());
		}
	}
}

void WSingleInstance::StopListener()
{
	std::lock_guard Lock(ListenerMutex);
	bListening = false;
	if (ListenThread.joinable())
	{
		ListenThread.join();
	}
	if (Listener)
	{
		Listener->Close();
		Listener.reset();
		WakeupChannel->Cleanup();
	}
}

void WSingleInstance::Unlock()
{
	StopListener();

	if (LockFd < 0)
	{
		return;
	}
	flock(LockFd, LOCK_UN);
	close(LockFd);
	LockFd = -1;
	WFilesystem::RemoveFile(LockPath);
	spdlog::debug("Released instance lock {}", LockPath.string());
}
