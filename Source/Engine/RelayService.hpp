/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ForwardService.hpp"
#include "Socket.hpp"

struct WRelayCounters
{
	std::atomic<uint64_t> TotalConns{ 0 };
	std::atomic<uint64_t> CurrentConns{ 0 };
	std::atomic<uint64_t> InputBytes{ 0 };
	std::atomic<uint64_t> OutputBytes{ 0 };
	std::atomic<uint64_t> TotalErrs{ 0 };

	[[nodiscard]] WServiceStats Snapshot() const
	{
		return WServiceStats{
			.TotalConns = TotalConns.load(),
			.CurrentConns = CurrentConns.load(),
			.InputBytes = InputBytes.load(),
			.OutputBytes = OutputBytes.load(),
			.TotalErrs = TotalErrs.load(),
		};
	}
};

// Common state of the built-in relays: listen port, target rotation, counters
class WRelayServiceBase : public IForwardService
{
protected:
	WRuleId              Name{};
	WPort                ListenPort{ 0 };
	std::vector<WTarget> Targets{};
	std::atomic<size_t>  NextTarget{ 0 };
	std::atomic<bool>    bClosed{ false };
	WRelayCounters       Counters{};

	static constexpr int PollIntervalMs{ 250 };

	WTarget const& PickTarget() { return Targets[NextTarget++ % Targets.size()]; }

	// Classifies a failed bind or listen
	WServeResult BindFailure(char const* Network, int Error) const;

public:
	WRelayServiceBase(WRuleId Name_, WPort ListenPort_, std::vector<WTarget> Targets_)
		: Name(std::move(Name_)), ListenPort(ListenPort_), Targets(std::move(Targets_))
	{
	}

	// Claims the listen port, a no-op when it is already held. Serve() calls it too.
	virtual bool Listen(WServeResult& OutFailure) = 0;

	[[nodiscard]] WServiceStats GetStats() const override { return Counters.Snapshot(); }

	[[nodiscard]] std::string GetAddr() const override { return ":" + std::to_string(ListenPort); }
};

class WTcpRelayService final : public WRelayServiceBase
{
	struct WConnection
	{
		std::shared_ptr<WClientSocket> Client{};
		std::shared_ptr<WClientSocket> Target{};
		std::thread                    Thread{};
		std::atomic<bool>              bDone{ false };
	};

	std::unique_ptr<WServerSocket>            Listener{};
	std::mutex                                ConnectionsMutex{};
	std::vector<std::unique_ptr<WConnection>> Connections{};

	void RelayThreadFunction(WConnection* Connection);
	void ReapConnections(bool bAll);

public:
	using WRelayServiceBase::WRelayServiceBase;

	~WTcpRelayService() override;

	bool Listen(WServeResult& OutFailure) override;

	WServeResult Serve() override;

	void Close() override;
};

class WUdpRelayService final : public WRelayServiceBase
{
	struct WSession
	{
		int                                   Fd{ -1 };
		sockaddr_in                           ClientAddr{};
		std::chrono::steady_clock::time_point LastActive{};
	};

	int                  ListenFd{ -1 };
	std::chrono::seconds SessionTimeout{ 60 };

	static std::string MakeClientKey(sockaddr_in const& Addr);

	bool OpenSession(sockaddr_in const& ClientAddr, WSession& OutSession);

public:
	using WRelayServiceBase::WRelayServiceBase;

	~WUdpRelayService() override;

	bool Listen(WServeResult& OutFailure) override;

	WServeResult Serve() override;

	void Close() override { bClosed = true; }

	void SetSessionTimeout(std::chrono::seconds Timeout) { SessionTimeout = Timeout; }
};
