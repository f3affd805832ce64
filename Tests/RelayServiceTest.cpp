/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <arpa/inet.h>
#include <future>
#include <gtest/gtest.h>
#include <poll.h>
#include <unistd.h>

#include "TestUtil.hpp"
#include "Socket.hpp"
#include "Engine/RelayService.hpp"
#include "Engine/Engine.hpp"
#include "Engine/RelayServiceBuilder.hpp"

namespace
{
	WPort FindFreePort()
	{
		WServerSocket Probe(WSocketAddress::Tcp("127.0.0.1", 0));
		if (!Probe.BindAndListen())
		{
			return 0;
		}
		return Probe.GetBoundPort();
	}

	WPort FindFreeUdpPort()
	{
		int Fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
		if (Fd < 0)
		{
			return 0;
		}
		sockaddr_in Addr{};
		Addr.sin_family = AF_INET;
		Addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		socklen_t Len = sizeof(Addr);
		WPort     Port = 0;
		if (bind(Fd, reinterpret_cast<sockaddr*>(&Addr), sizeof(Addr)) == 0
			&& getsockname(Fd, reinterpret_cast<sockaddr*>(&Addr), &Len) == 0)
		{
			Port = ntohs(Addr.sin_port);
		}
		close(Fd);
		return Port;
	}

	sockaddr_in Loopback(WPort Port)
	{
		sockaddr_in Addr{};
		Addr.sin_family = AF_INET;
		Addr.sin_port = htons(Port);
		Addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		return Addr;
	}

	// Receives one datagram, empty on timeout
	std::string ReceiveDatagram(int Fd, int TimeoutMs)
	{
		pollfd Pfd{ Fd, POLLIN, 0 };
		if (poll(&Pfd, 1, TimeoutMs) <= 0)
		{
			return {};
		}
		char    Buf[512];
		ssize_t Got = recv(Fd, Buf, sizeof(Buf), 0);
		return Got > 0 ? std::string(Buf, static_cast<size_t>(Got)) : std::string{};
	}

	// Sends every datagram back to where it came from
	class WUdpEchoServer
	{
		int               Fd{ -1 };
		WPort             Port{ 0 };
		std::atomic<bool> bRunning{ true };
		std::thread       Thread{};

	public:
		WUdpEchoServer()
		{
			Fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
			sockaddr_in Addr = Loopback(0);
			socklen_t   Len = sizeof(Addr);
			if (Fd < 0 || bind(Fd, reinterpret_cast<sockaddr*>(&Addr), sizeof(Addr)) != 0
				|| getsockname(Fd, reinterpret_cast<sockaddr*>(&Addr), &Len) != 0)
			{
				return;
			}
			Port = ntohs(Addr.sin_port);
			Thread = std::thread([this] {
				char Buf[512];
				while (bRunning)
				{
					pollfd Pfd{ Fd, POLLIN, 0 };
					if (poll(&Pfd, 1, 50) <= 0)
						continue;
					sockaddr_in From{};
					socklen_t   FromLen = sizeof(From);
					ssize_t     Got = recvfrom(Fd, Buf, sizeof(Buf), 0, reinterpret_cast<sockaddr*>(&From), &FromLen);
					if (Got > 0)
					{
						sendto(Fd, Buf, static_cast<size_t>(Got), 0, reinterpret_cast<sockaddr*>(&From), FromLen);
					}
				}
			});
		}

		~WUdpEchoServer()
		{
			bRunning = false;
			if (Thread.joinable())
			{
				Thread.join();
			}
			if (Fd >= 0)
			{
				close(Fd);
			}
		}

		[[nodiscard]] WPort GetPort() const { return Port; }
	};

	// Echoes everything back on each accepted connection until stopped
	class WEchoServer
	{
		WServerSocket     Listener{ WSocketAddress::Tcp("127.0.0.1", 0) };
		std::atomic<bool> bRunning{ true };
		std::thread       Thread{};

	public:
		WEchoServer()
		{
			if (!Listener.BindAndListen())
			{
				bRunning = false;
				return;
			}
			Thread = std::thread([this] {
				while (bRunning)
				{
					auto Client = Listener.Accept(50);
					if (!Client)
						continue;
					char   Buf[256];
					size_t Got = 0;
					while (bRunning)
					{
						EReceiveResult Result = Client->ReceiveSome(Buf, sizeof(Buf), Got, 50);
						if (Result == RR_Timeout)
							continue;
						if (Result != RR_Data || Client->Send(Buf, Got) < 0)
							break;
					}
				}
			});
		}

		~WEchoServer()
		{
			bRunning = false;
			if (Thread.joinable())
			{
				Thread.join();
			}
		}

		[[nodiscard]] WPort GetPort() const { return Listener.GetBoundPort(); }
	};
} // namespace

TEST(TcpRelayTest, RelaysBothDirections)
{
	WEchoServer Echo{};
	ASSERT_NE(Echo.GetPort(), 0);
	WPort const Port = FindFreePort();
	ASSERT_NE(Port, 0);

	auto Relay = std::make_shared<WTcpRelayService>("relay", Port, std::vector<WTarget>{ { "127.0.0.1", Echo.GetPort(), 1 } });
	auto Served = std::async(std::launch::async, [Relay] { return Relay->Serve(); });

	WClientSocket Client(WSocketAddress::Tcp("127.0.0.1", Port));
	ASSERT_TRUE(WaitUntil([&] { return Client.Connect(200); }));

	std::string const Message = "hello relay";
	ASSERT_EQ(Client.Send(Message.data(), Message.size()), static_cast<ssize_t>(Message.size()));

	std::string Received{};
	char        Buf[64];
	while (Received.size() < Message.size())
	{
		size_t Got = 0;
		ASSERT_EQ(Client.ReceiveSome(Buf, sizeof(Buf), Got, 2000), RR_Data);
		Received.append(Buf, Got);
	}
	EXPECT_EQ(Received, Message);

	// The relay counts a chunk right after forwarding it
	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().OutputBytes == Message.size(); }));
	WServiceStats Stats = Relay->GetStats();
	EXPECT_EQ(Stats.TotalConns, 1u);
	EXPECT_EQ(Stats.CurrentConns, 1u);
	EXPECT_EQ(Stats.InputBytes, Message.size());

	Client.Close();
	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().CurrentConns == 0; }));

	Relay->Close();
	ASSERT_EQ(Served.wait_for(std::chrono::seconds(3)), std::future_status::ready);
	EXPECT_EQ(Served.get().Exit, SE_Closed);
}

TEST(TcpRelayTest, ReplyAfterClientHalfCloseIsDelivered)
{
	// Upstream answers only once the request stream has ended
	WServerSocket Upstream(WSocketAddress::Tcp("127.0.0.1", 0));
	ASSERT_TRUE(Upstream.BindAndListen());
	auto Answered = std::async(std::launch::async, [&Upstream] {
		auto Conn = Upstream.Accept(3000);
		if (!Conn)
		{
			return false;
		}
		std::string Request{};
		char        Buf[64];
		for (;;)
		{
			size_t         Got = 0;
			EReceiveResult Result = Conn->ReceiveSome(Buf, sizeof(Buf), Got, 3000);
			if (Result == RR_Data)
			{
				Request.append(Buf, Got);
				continue;
			}
			if (Result != RR_Closed)
			{
				return false;
			}
			break;
		}
		std::string const Reply = "REPLY:" + Request;
		return Conn->Send(Reply.data(), Reply.size()) == static_cast<ssize_t>(Reply.size());
	});

	WPort const Port = FindFreePort();
	ASSERT_NE(Port, 0);
	auto Relay = std::make_shared<WTcpRelayService>(
		"relay", Port, std::vector<WTarget>{ { "127.0.0.1", Upstream.GetBoundPort(), 1 } });
	auto Served = std::async(std::launch::async, [Relay] { return Relay->Serve(); });

	WClientSocket Client(WSocketAddress::Tcp("127.0.0.1", Port));
	ASSERT_TRUE(WaitUntil([&] { return Client.Connect(200); }));
	ASSERT_EQ(Client.Send("hello", 5), 5);
	Client.ShutdownWrite();

	std::string Received{};
	char        Buf[64];
	for (;;)
	{
		size_t         Got = 0;
		EReceiveResult Result = Client.ReceiveSome(Buf, sizeof(Buf), Got, 3000);
		if (Result != RR_Data)
		{
			EXPECT_EQ(Result, RR_Closed);
			break;
		}
		Received.append(Buf, Got);
	}
	EXPECT_EQ(Received, "REPLY:hello");
	EXPECT_TRUE(Answered.get());
	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().CurrentConns == 0; }));
	EXPECT_EQ(Relay->GetStats().OutputBytes, 11u);

	Relay->Close();
	EXPECT_EQ(Served.get().Exit, SE_Closed);
}

TEST(TcpRelayTest, UnreachableTargetCountsError)
{
	WPort const Dead = FindFreePort();
	WPort const Port = FindFreePort();
	ASSERT_NE(Port, 0);

	auto Relay = std::make_shared<WTcpRelayService>("relay", Port, std::vector<WTarget>{ { "127.0.0.1", Dead, 1 } });
	auto Served = std::async(std::launch::async, [Relay] { return Relay->Serve(); });

	WClientSocket Client(WSocketAddress::Tcp("127.0.0.1", Port));
	ASSERT_TRUE(WaitUntil([&] { return Client.Connect(200); }));
	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().TotalErrs == 1; }));

	Relay->Close();
	EXPECT_EQ(Served.get().Exit, SE_Closed);
}

TEST(TcpRelayTest, PortInUseIsFatal)
{
	WServerSocket Holder(WSocketAddress::Tcp("0.0.0.0", 0));
	ASSERT_TRUE(Holder.BindAndListen());

	WTcpRelayService Relay("relay", Holder.GetBoundPort(), { { "127.0.0.1", 9, 1 } });
	WServeResult     Result = Relay.Serve();
	EXPECT_EQ(Result.Exit, SE_BindFailed);
	EXPECT_TRUE(Result.IsFatal());
}

TEST(TcpRelayTest, ClosedBeforeServeReturnsAtOnce)
{
	WTcpRelayService Relay("relay", 1, { { "127.0.0.1", 9, 1 } });
	Relay.Close();
	EXPECT_EQ(Relay.Serve().Exit, SE_Closed);
}

TEST(RelayServiceBuilderTest, BuildsAndRegisters)
{
	WRelayServiceBuilder Builder{};

	WPort const Port = FindFreePort();
	ASSERT_NE(Port, 0);

	std::shared_ptr<IForwardService> Service{};
	WRule                            Rule = MakeRule("r1", "test", Port);
	ASSERT_TRUE(Builder.Build(Rule, {}, Service).Ok());
	ASSERT_NE(Service, nullptr);
	EXPECT_EQ(Builder.Lookup("r1"), Service);
	EXPECT_EQ(Service->GetAddr(), fmt::format(":{}", Port));

	// One service per rule id
	std::shared_ptr<IForwardService> Second{};
	EXPECT_EQ(Builder.Build(Rule, {}, Second).Code, EC_Build);

	Builder.Unregister("r1");
	EXPECT_EQ(Builder.Lookup("r1"), nullptr);
}

TEST(RelayServiceBuilderTest, RejectsUnsupportedRules)
{
	WRelayServiceBuilder             Builder{};
	std::shared_ptr<IForwardService> Service{};

	WRule Proxy = MakeRule("r1");
	Proxy.Protocol = P_Socks5;
	EXPECT_EQ(Builder.Build(Proxy, {}, Service).Code, EC_Build);

	WRule Chained = MakeRule("r2");
	Chained.ChainId = "missing";
	WResult Result = Builder.Build(Chained, {}, Service);
	EXPECT_EQ(Result.Code, EC_Build);
	EXPECT_NE(Result.Message.find("chain missing not found"), std::string::npos);

	EXPECT_EQ(Service, nullptr);
}

TEST(RelayServiceBuilderTest, OccupiedPortFailsTheBuild)
{
	WServerSocket Holder(WSocketAddress::Tcp("0.0.0.0", 0));
	ASSERT_TRUE(Holder.BindAndListen());

	WRelayServiceBuilder             Builder{};
	std::shared_ptr<IForwardService> Service{};
	WResult Result = Builder.Build(MakeRule("r1", "test", Holder.GetBoundPort()), {}, Service);
	EXPECT_EQ(Result.Code, EC_Build);
	EXPECT_NE(Result.Message.find("Address already in use"), std::string::npos) << Result.Message;
	EXPECT_EQ(Service, nullptr);
	EXPECT_EQ(Builder.Lookup("r1"), nullptr);
}

TEST(RelayEngineTest, StartOnOccupiedPortFails)
{
	WServerSocket Holder(WSocketAddress::Tcp("0.0.0.0", 0));
	ASSERT_TRUE(Holder.BindAndListen());

	WEngine Engine(std::make_shared<WRelayServiceBuilder>(), std::make_shared<WStatsObserver>(), WEngineOptions{});
	WResult Result = Engine.StartRule(MakeRule("r1", "test", Holder.GetBoundPort()));
	EXPECT_EQ(Result.Code, EC_Build);
	EXPECT_FALSE(Engine.IsRunning("r1"));

	// Once the port is free the same rule starts
	WPort const Port = Holder.GetBoundPort();
	Holder.Close();
	EXPECT_TRUE(Engine.StartRule(MakeRule("r1", "test", Port)).Ok());
	EXPECT_TRUE(Engine.IsRunning("r1"));
	Engine.StopAll();
}

TEST(UdpRelayTest, RelaysDatagramsAndExpiresIdleSessions)
{
	WUdpEchoServer Echo{};
	ASSERT_NE(Echo.GetPort(), 0);
	WPort const Port = FindFreeUdpPort();
	ASSERT_NE(Port, 0);

	auto Relay = std::make_shared<WUdpRelayService>("udp", Port, std::vector<WTarget>{ { "127.0.0.1", Echo.GetPort(), 1 } });
	Relay->SetSessionTimeout(std::chrono::seconds(1));
	WServeResult Failure{};
	ASSERT_TRUE(Relay->Listen(Failure)) << Failure.Message;
	auto Served = std::async(std::launch::async, [Relay] { return Relay->Serve(); });

	int Client = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
	ASSERT_GE(Client, 0);
	sockaddr_in const To = Loopback(Port);
	ASSERT_EQ(sendto(Client, "ping", 4, 0, reinterpret_cast<sockaddr const*>(&To), sizeof(To)), 4);
	EXPECT_EQ(ReceiveDatagram(Client, 2000), "ping");

	// Same client, same session
	ASSERT_EQ(sendto(Client, "again", 5, 0, reinterpret_cast<sockaddr const*>(&To), sizeof(To)), 5);
	EXPECT_EQ(ReceiveDatagram(Client, 2000), "again");

	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().OutputBytes == 9; }));
	WServiceStats Stats = Relay->GetStats();
	EXPECT_EQ(Stats.InputBytes, 9u);
	EXPECT_EQ(Stats.TotalConns, 1u);
	EXPECT_EQ(Stats.CurrentConns, 1u);

	EXPECT_TRUE(WaitUntil([&] { return Relay->GetStats().CurrentConns == 0; }, 5000));
	EXPECT_EQ(Relay->GetStats().TotalConns, 1u);
	close(Client);

	Relay->Close();
	ASSERT_EQ(Served.wait_for(std::chrono::seconds(3)), std::future_status::ready);
	EXPECT_EQ(Served.get().Exit, SE_Closed);
}

TEST(UdpRelayTest, PortInUseIsFatal)
{
	WPort const Port = FindFreeUdpPort();
	ASSERT_NE(Port, 0);
	WUdpRelayService First("first", Port, { { "127.0.0.1", 9, 1 } });
	WServeResult     Failure{};
	ASSERT_TRUE(First.Listen(Failure));

	WUdpRelayService Second("second", Port, { { "127.0.0.1", 9, 1 } });
	WServeResult     Result = Second.Serve();
	EXPECT_EQ(Result.Exit, SE_BindFailed);
	EXPECT_TRUE(Result.IsFatal());
}
