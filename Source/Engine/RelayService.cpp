/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RelayService.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

WServeResult WRelayServiceBase::BindFailure(char const* Network, int Error) const
{
	std::string Message = fmt::format("listen {} {}: {}", Network, GetAddr(), WErrnoUtil::StrError(Error));
	if (WErrnoUtil::IsAddressInUse(Error))
	{
		return WServeResult::Fail(SE_BindFailed, Message);
	}
	if (WErrnoUtil::IsPermissionDenied(Error))
	{
		return WServeResult::Fail(SE_PermissionDenied, Message);
	}
	return WServeResult::Fail(SE_Other, Message);
}

WTcpRelayService::~WTcpRelayService()
{
	Close();
	ReapConnections(true);
}

bool WTcpRelayService::Listen(WServeResult& OutFailure)
{
	if (Listener && Listener->IsListening())
	{
		return true;
	}

	auto Socket = std::make_unique<WServerSocket>(WSocketAddress::Tcp("0.0.0.0", ListenPort));
	if (!Socket->BindAndListen(128))
	{
		OutFailure = BindFailure("tcp", Socket->GetLastError());
		return false;
	}
	Listener = std::move(Socket);
	spdlog::debug("Relay {} listening on tcp {}", Name, GetAddr());
	return true;
}

WServeResult WTcpRelayService::Serve()
{
	if (bClosed)
	{
		Listener.reset();
		return WServeResult::Closed();
	}

	if (WServeResult Failure{}; !Listen(Failure))
	{
		return Failure;
	}

	while (!bClosed)
	{
		bool bTimedOut = false;
		if (auto Client = Listener->Accept(PollIntervalMs, &bTimedOut))
		{
			auto         Connection = std::make_unique<WConnection>();
			WConnection* Raw = Connection.get();
			Connection->Client = std::move(Client);

			std::lock_guard Lock(ConnectionsMutex);
			Connections.push_back(std::move(Connection));
			Raw->Thread = std::thread(&WTcpRelayService::RelayThreadFunction, this, Raw);
		}
		else if (!bTimedOut && !bClosed)
		{
			// Per-connection failures never take the listener down
			++Counters.TotalErrs;
			spdlog::warn("Relay {} failed to accept: {} ({})", Name, WErrnoUtil::StrError(), errno);
		}
		ReapConnections(false);
	}

	Listener.reset();
	ReapConnections(true);
	return WServeResult::Closed();
}

void WTcpRelayService::Close()
{
	bClosed = true;

	std::lock_guard Lock(ConnectionsMutex);
	for (auto const& Connection : Connections)
	{
		if (Connection->Client)
		{
			Connection->Client->Shutdown();
		}
		if (Connection->Target)
		{
			Connection->Target->Shutdown();
		}
	}
}

void WTcpRelayService::ReapConnections(bool bAll)
{
	std::vector<std::unique_ptr<WConnection>> Finished{};
	{
		std::lock_guard Lock(ConnectionsMutex);
		for (auto It = Connections.begin(); It != Connections.end();)
		{
			if (bAll || (*It)->bDone)
			{
				Finished.push_back(std::move(*It));
				It = Connections.erase(It);
			}
			else
			{
				++It;
			}
		}
	}

	for (auto const& Connection : Finished)
	{
		if (Connection->Thread.joinable())
		{
			Connection->Thread.join();
		}
	}
}

void WTcpRelayService::RelayThreadFunction(WConnection* Connection)
{
	++Counters.TotalConns;
	++Counters.CurrentConns;

	WTarget const& Target = PickTarget();
	auto           TargetSocket = std::make_shared<WClientSocket>(WSocketAddress::Tcp(Target.Host, Target.Port));
	if (!TargetSocket->Connect(5000))
	{
		++Counters.TotalErrs;
		spdlog::warn("Relay {} could not reach {}:{}", Name, Target.Host, Target.Port);
	}
	else
	{
		{
			std::lock_guard Lock(ConnectionsMutex);
			Connection->Target = TargetSocket;
		}

		WClientSocket& Client = *Connection->Client;
		pollfd         Fds[2]{};
		Fds[0].fd = Client.GetFd();
		Fds[0].events = POLLIN;
		Fds[1].fd = TargetSocket->GetFd();
		Fds[1].events = POLLIN;

		// A side that reached EOF stops being polled, the other direction keeps flowing
		char Buf[16 WKiB];
		bool bFailed = false;
		int  OpenSides = 2;
		while (!bClosed && !bFailed && OpenSides > 0)
		{
			int Ret = poll(Fds, 2, PollIntervalMs);
			if (Ret < 0)
			{
				if (errno == EINTR)
					continue;
				++Counters.TotalErrs;
				break;
			}

			for (int i = 0; i < 2 && Ret > 0 && !bFailed; ++i)
			{
				if (Fds[i].fd < 0 || !(Fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
					continue;

				WClientSocket& From = i == 0 ? Client : *TargetSocket;
				WClientSocket& To = i == 0 ? *TargetSocket : Client;

				size_t         Got = 0;
				EReceiveResult Result = From.ReceiveSome(Buf, sizeof(Buf), Got, 0);
				if (Result == RR_Timeout)
					continue;
				if (Result == RR_Closed)
				{
					To.ShutdownWrite();
					Fds[i].fd = -1;
					--OpenSides;
					continue;
				}
				if (Result != RR_Data)
				{
					++Counters.TotalErrs;
					bFailed = true;
					break;
				}

				if (To.Send(Buf, Got) < 0)
				{
					bFailed = true;
					break;
				}
				(i == 0 ? Counters.InputBytes : Counters.OutputBytes) += Got;
			}
		}
	}

	{
		std::lock_guard Lock(ConnectionsMutex);
		Connection->Client->Close();
		TargetSocket->Close();
	}
	--Counters.CurrentConns;
	Connection->bDone = true;
}

std::string WUdpRelayService::MakeClientKey(sockaddr_in const& Addr)
{
	char Ip[INET_ADDRSTRLEN]{};
	inet_ntop(AF_INET, &Addr.sin_addr, Ip, sizeof(Ip));
	return fmt::format("{}:{}", Ip, ntohs(Addr.sin_port));
}

bool WUdpRelayService::OpenSession(sockaddr_in const& ClientAddr, WSession& OutSession)
{
	WTarget const& Target = PickTarget();
	sockaddr_in    TargetAddr{};
	if (!WSocketAddress::Tcp(Target.Host, static_cast<WPort>(Target.Port)).Resolve(TargetAddr))
	{
		spdlog::warn("Relay {} could not resolve {}", Name, Target.Host);
		return false;
	}

	int Fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
	if (Fd < 0)
	{
		spdlog::error("Relay {} failed to create session socket: {}", Name, WErrnoUtil::StrError());
		return false;
	}
	if (connect(Fd, reinterpret_cast<sockaddr*>(&TargetAddr), sizeof(TargetAddr)) < 0)
	{
		spdlog::warn("Relay {} failed to connect session to {}:{}: {}", Name, Target.Host, Target.Port,
			WErrnoUtil::StrError());
		close(Fd);
		return false;
	}

	OutSession.Fd = Fd;
	OutSession.ClientAddr = ClientAddr;
	OutSession.LastActive = std::chrono::steady_clock::now();
	return true;
}

WUdpRelayService::~WUdpRelayService()
{
	if (ListenFd >= 0)
	{
		close(ListenFd);
	}
}

bool WUdpRelayService::Listen(WServeResult& OutFailure)
{
	if (ListenFd >= 0)
	{
		return true;
	}

	int Sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
	if (Sock < 0)
	{
		OutFailure = WServeResult::Fail(SE_Other, fmt::format("socket udp: {}", WErrnoUtil::StrError()));
		return false;
	}

	sockaddr_in Addr{};
	Addr.sin_family = AF_INET;
	Addr.sin_port = htons(ListenPort);
	Addr.sin_addr.s_addr = htonl(INADDR_ANY);
	if (bind(Sock, reinterpret_cast<sockaddr*>(&Addr), sizeof(Addr)) < 0)
	{
		int Error = errno;
		close(Sock);
		OutFailure = BindFailure("udp", Error);
		return false;
	}
	ListenFd = Sock;
	spdlog::debug("Relay {} listening on udp {}", Name, GetAddr());
	return true;
}

WServeResult WUdpRelayService::Serve()
{
	if (bClosed)
	{
		if (ListenFd >= 0)
		{
			close(ListenFd);
			ListenFd = -1;
		}
		return WServeResult::Closed();
	}

	if (WServeResult Failure{}; !Listen(Failure))
	{
		return Failure;
	}
	int const Fd = ListenFd;

	std::map<std::string, WSession> Sessions{};
	std::vector<pollfd>             Fds{};
	std::vector<std::string>        Keys{};
	std::vector<char>               Buf(64 WKiB);

	while (!bClosed)
	{
		Fds.clear();
		Keys.clear();
		Fds.push_back(pollfd{ Fd, POLLIN, 0 });
		for (auto const& [Key, Session] : Sessions)
		{
			Fds.push_back(pollfd{ Session.Fd, POLLIN, 0 });
			Keys.push_back(Key);
		}

		int  Ret = poll(Fds.data(), Fds.size(), PollIntervalMs);
		auto Now = std::chrono::steady_clock::now();
		if (Ret < 0 && errno != EINTR)
		{
			++Counters.TotalErrs;
		}

		if (Ret > 0 && (Fds[0].revents & POLLIN))
		{
			sockaddr_in From{};
			socklen_t   FromLen = sizeof(From);
			ssize_t     Got = recvfrom(Fd, Buf.data(), Buf.size(), 0, reinterpret_cast<sockaddr*>(&From), &FromLen);
			if (Got >= 0)
			{
				std::string Key = MakeClientKey(From);
				auto        It = Sessions.find(Key);
				if (It == Sessions.end())
				{
					WSession Session{};
					if (OpenSession(From, Session))
					{
						It = Sessions.emplace(Key, Session).first;
						++Counters.TotalConns;
						++Counters.CurrentConns;
					}
					else
					{
						++Counters.TotalErrs;
					}
				}

				if (It != Sessions.end())
				{
					It->second.LastActive = Now;
					if (send(It->second.Fd, Buf.data(), static_cast<size_t>(Got), 0) < 0)
					{
						++Counters.TotalErrs;
					}
					else
					{
						Counters.InputBytes += static_cast<uint64_t>(Got);
					}
				}
			}
		}

		for (size_t i = 1; Ret > 0 && i < Fds.size(); ++i)
		{
			if (!(Fds[i].revents & (POLLIN | POLLERR)))
				continue;

			auto It = Sessions.find(Keys[i - 1]);
			if (It == Sessions.end())
				continue;

			ssize_t Got = recv(It->second.Fd, Buf.data(), Buf.size(), 0);
			if (Got < 0)
			{
				// Usually ECONNREFUSED relayed from an ICMP unreachable
				++Counters.TotalErrs;
				continue;
			}
			sendto(Fd, Buf.data(), static_cast<size_t>(Got), 0,
				reinterpret_cast<sockaddr const*>(&It->second.ClientAddr), sizeof(sockaddr_in));
			Counters.OutputBytes += static_cast<uint64_t>(Got);
			It->second.LastActive = Now;
		}

		for (auto It = Sessions.begin(); It != Sessions.end();)
		{
			if (Now - It->second.LastActive > SessionTimeout)
			{
				close(It->second.Fd);
				--Counters.CurrentConns;
				It = Sessions.erase(It);
			}
			else
			{
				++It;
			}
		}
	}

	for (auto const& [Key, Session] : Sessions)
	{
		close(Session.Fd);
		--Counters.CurrentConns;
	}
	close(ListenFd);
	ListenFd = -1;
	return WServeResult::Closed();
}
