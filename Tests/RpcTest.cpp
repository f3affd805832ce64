/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "Controller/ControllerFactory.hpp"
#include "Rpc/RpcArgs.hpp"
#include "Rpc/RpcHandler.hpp"
#include "Rpc/RpcServer.hpp"

// A daemon in a box: local controller behind an rpc server
class RpcTest : public ::testing::TestWithParam<ERpcTransportKind>
{
protected:
	WTempDir                          Dir{};
	std::shared_ptr<WFakeBuilder>     Builder = std::make_shared<WFakeBuilder>();
	std::shared_ptr<WEngine>          Engine{};
	std::shared_ptr<WLocalController> Local{};
	std::unique_ptr<WRpcServer>       Server{};
	std::shared_ptr<WRemoteController> Remote{};

	[[nodiscard]] WRpcTransportConfig MakeConfig() const
	{
		WRpcTransportConfig Config{};
		Config.Kind = GetParam();
		Config.SocketPath = Dir / "weiche.sock";
		Config.Ports = { 0 };
		Config.MachinePortFile = Dir / "run/ipc_port";
		Config.UserPortFile = Dir / "user/ipc_port";
		return Config;
	}

	void SetUp() override
	{
		auto Store = std::make_shared<WStore>(Dir.Get() / "data");
		ASSERT_TRUE(Store->Load().Ok());
		Engine = std::make_shared<WEngine>(Builder, std::make_shared<WStatsObserver>());
		Local = std::make_shared<WLocalController>(Store, Engine);
		ASSERT_TRUE(Local->Init().Ok());

		Server = std::make_unique<WRpcServer>(
			WRpcTransportFactory::Create(MakeConfig()), std::make_shared<WRpcHandler>(Local));
		ASSERT_TRUE(Server->Start());

		Remote = std::make_shared<WRemoteController>(
			std::make_shared<WRpcClient>(WRpcTransportFactory::Create(MakeConfig()), 2000));
	}

	void TearDown() override
	{
		Remote.reset();
		Server.reset();
		Local.reset();
		Engine.reset();
	}
};

TEST_P(RpcTest, RulesRoundTrip)
{
	WRule Rule = MakeRule("");
	Rule.bEnabled = true;
	ASSERT_TRUE(Remote->CreateRule(Rule).Ok());
	EXPECT_FALSE(Rule.Id.empty());
	EXPECT_EQ(Rule.Status, RS_Running);
	EXPECT_TRUE(Engine->IsRunning(Rule.Id));

	std::vector<WRule> Rules{};
	ASSERT_TRUE(Remote->GetRules(Rules).Ok());
	ASSERT_EQ(Rules.size(), 1u);
	EXPECT_EQ(Rules[0].Name, "test");

	Rule.Remark = "changed";
	ASSERT_TRUE(Remote->UpdateRule(Rule).Ok());
	WRule Loaded{};
	ASSERT_TRUE(Remote->GetRule(Rule.Id, Loaded).Ok());
	EXPECT_EQ(Loaded.Remark, "changed");

	ASSERT_TRUE(Remote->StopRule(Rule.Id).Ok());
	EXPECT_FALSE(Engine->IsRunning(Rule.Id));
	ASSERT_TRUE(Remote->StartAllRules().Ok());
	EXPECT_TRUE(Engine->IsRunning(Rule.Id));
	ASSERT_TRUE(Remote->StopAllRules().Ok());
	ASSERT_TRUE(Remote->DeleteRule(Rule.Id).Ok());
}

TEST_P(RpcTest, BusinessErrorsKeepTheirCode)
{
	WRule Missing{};
	WResult Result = Remote->GetRule("missing", Missing);
	EXPECT_EQ(Result.Code, EC_RuleNotFound);
	EXPECT_EQ(Result.Message, "rule not found");
	EXPECT_FALSE(Result.IsTransportError());

	WRule Invalid = MakeRule("r1");
	Invalid.Name.clear();
	EXPECT_EQ(Remote->CreateRule(Invalid).Code, EC_Validation);

	// The connection survives a failed call
	WServiceStatus Status{};
	EXPECT_TRUE(Remote->GetStatus(Status).Ok());
	EXPECT_EQ(Status.Pid, getpid());
}

TEST_P(RpcTest, UnknownMethodAndMalformedArgs)
{
	auto const& Client = Remote->GetClient();

	std::string Payload{};
	WResult     Unknown = Client->CallRaw("Weiche.DoesNotExist", PackRecord(WEmptyArgs{}), Payload);
	EXPECT_EQ(Unknown.Code, EC_UnknownMethod);
	EXPECT_EQ(Unknown.Message, "unknown method Weiche.DoesNotExist");

	WResult Malformed = Client->CallRaw("Weiche.GetRule", "x", Payload);
	EXPECT_EQ(Malformed.Code, EC_Protocol);

	// ClearAllData is composed on the client side
	WIdArgs Args{};
	Args.Id = "x";
	EXPECT_EQ(Client->CallRaw("Weiche.ClearAllData", PackRecord(Args), Payload).Code, EC_UnknownMethod);
}

TEST_P(RpcTest, OtherProtocolVersionIsRejected)
{
	WRpcHandler Handler(Local);

	WRpcRequest Request{};
	Request.CallId = 7;
	Request.Method = WEICHE_METHOD_PREFIX "GetStatus";
	Request.Args = PackRecord(WEmptyArgs{});
	EXPECT_TRUE(Handler.Handle(Request).bSuccess);

	Request.Version = WEICHE_PROTOCOL_VERSION + 1;
	WRpcResponse Response = Handler.Handle(Request);
	EXPECT_FALSE(Response.bSuccess);
	EXPECT_EQ(Response.CallId, 7u);
	EXPECT_EQ(Response.ErrorCode, EC_Protocol);
	EXPECT_NE(Response.Error.find("protocol version mismatch"), std::string::npos);
}

TEST_P(RpcTest, StatsLogsAndChains)
{
	WChain Chain{};
	Chain.Name = "exit";
	Chain.Hops.push_back(WHop{ .Name = "hop-1", .Addr = "10.0.0.1:1080" });
	ASSERT_TRUE(Remote->CreateChain(Chain).Ok());
	EXPECT_FALSE(Chain.Id.empty());

	std::vector<WChain> Chains{};
	ASSERT_TRUE(Remote->GetChains(Chains).Ok());
	ASSERT_EQ(Chains.size(), 1u);
	ASSERT_TRUE(Remote->DeleteChain(Chain.Id).Ok());

	WRule Rule = MakeRule("r1");
	Rule.bEnabled = true;
	ASSERT_TRUE(Remote->CreateRule(Rule).Ok());
	Builder->GetFake("r1")->SetStats({ .TotalConns = 4, .InputBytes = 42 });
	Engine->PollStats();

	WRuleStats Stats{};
	ASSERT_TRUE(Remote->GetRuleStats("r1", Stats).Ok());
	EXPECT_EQ(Stats.BytesIn, 42);
	EXPECT_EQ(Remote->GetRuleStats("missing", Stats).Code, EC_StatsNotFound);
	ASSERT_TRUE(Remote->ResetRuleStats("r1").Ok());
	std::vector<WRuleStats> All{};
	ASSERT_TRUE(Remote->GetAllRuleStats(All).Ok());
	ASSERT_EQ(All.size(), 1u);
	EXPECT_EQ(All[0].BytesIn, 0);
	ASSERT_TRUE(Remote->ResetAllRuleStats().Ok());

	std::vector<WLogEntry> Logs{};
	ASSERT_TRUE(Remote->GetLogs(10, Logs).Ok());
	ASSERT_FALSE(Logs.empty());
	std::vector<WLogEntry> ByRule{};
	ASSERT_TRUE(Remote->GetLogsByRule("r1", ByRule).Ok());
	EXPECT_FALSE(ByRule.empty());
	std::vector<WLogEntry> Since{};
	ASSERT_TRUE(Remote->GetLogsSince(Logs.back().Id, Since).Ok());
	EXPECT_TRUE(Since.empty());
	ASSERT_TRUE(Remote->ClearLogs().Ok());
}

TEST_P(RpcTest, ClearAllDataKeepsConfig)
{
	WAppConfig Config{};
	Config.LogLevel = "warn";
	ASSERT_TRUE(Remote->UpdateConfig(Config).Ok());

	WRule Rule = MakeRule("r1");
	Rule.bEnabled = true;
	ASSERT_TRUE(Remote->CreateRule(Rule).Ok());

	std::string Json{};
	ASSERT_TRUE(Remote->ExportData(Json).Ok());
	EXPECT_NE(Json.find("\"r1\""), std::string::npos);

	ASSERT_TRUE(Remote->ClearAllData().Ok());
	std::vector<WRule> Rules{};
	ASSERT_TRUE(Remote->GetRules(Rules).Ok());
	EXPECT_TRUE(Rules.empty());
	EXPECT_EQ(Engine->GetRunningCount(), 0u);

	WAppConfig After{};
	ASSERT_TRUE(Remote->GetConfig(After).Ok());
	EXPECT_EQ(After.LogLevel, "warn");

	// Importing the export brings the rule back, running
	ASSERT_TRUE(Remote->ImportData(Json, true).Ok());
	EXPECT_TRUE(Engine->IsRunning("r1"));
}

TEST_P(RpcTest, ServerGoneIsTransportError)
{
	WServiceStatus Status{};
	ASSERT_TRUE(Remote->GetStatus(Status).Ok());

	Server->Stop();
	EXPECT_FALSE(Server->IsRunning());

	WResult Result = Remote->GetStatus(Status);
	EXPECT_EQ(Result.Code, EC_Transport);
	EXPECT_TRUE(Result.IsTransportError());
}

TEST_P(RpcTest, FactoryPicksRemoteWhenServerAnswers)
{
	unsetenv("WEICHE_DATA_DIR");
	WControllerOptions Options{};
	Options.Transport = MakeConfig();
	Options.DataDir = Dir / "client-data";

	WControllerSelection Selection{};
	ASSERT_TRUE(WControllerFactory::Create(Options, Selection).Ok());
	EXPECT_TRUE(Selection.IsRemote());

	Server->Stop();
	WControllerSelection Fallback{};
	ASSERT_TRUE(WControllerFactory::Create(Options, Fallback).Ok());
	EXPECT_FALSE(Fallback.IsRemote());
	ASSERT_NE(Fallback.Local, nullptr);
	EXPECT_EQ(Fallback.Local->GetStore()->GetDataDir(), Dir.Get() / "client-data");
}

INSTANTIATE_TEST_SUITE_P(Transports, RpcTest, ::testing::Values(RK_Unix, RK_Tcp),
	[](::testing::TestParamInfo<ERpcTransportKind> const& Info) { return Info.param == RK_Unix ? "Unix" : "Tcp"; });

class RpcTransportTest : public ::testing::Test
{
protected:
	WTempDir Dir{};
};

TEST_F(RpcTransportTest, UnixRemovesStaleSocketFile)
{
	std::string const Path = Dir / "stale.sock";
	ASSERT_TRUE(WFilesystem::WriteFileAtomic(Path, "left over"));

	WUnixRpcTransport Transport(Path, 0600);
	auto              Listener = Transport.Listen();
	ASSERT_NE(Listener, nullptr);
	EXPECT_NE(Transport.Dial(500), nullptr);

	Listener->Close();
	Transport.Cleanup();
	EXPECT_FALSE(WFilesystem::Exists(Path));
}

TEST_F(RpcTransportTest, UnixRefusesLiveServer)
{
	std::string const Path = Dir / "live.sock";
	WUnixRpcTransport First(Path, 0600);
	auto              Listener = First.Listen();
	ASSERT_NE(Listener, nullptr);

	// The dial probe is accepted by the kernel backlog
	WUnixRpcTransport Second(Path, 0600);
	EXPECT_EQ(Second.Listen(), nullptr);
	EXPECT_TRUE(WFilesystem::Exists(Path));
}

TEST_F(RpcTransportTest, TcpPublishesAndRemovesPortFiles)
{
	std::string const Machine = Dir / "run/ipc_port";
	std::string const User = Dir / "user/ipc_port";

	WTcpRpcTransport Server({ 0 }, { Machine, User });
	auto             Listener = Server.Listen();
	ASSERT_NE(Listener, nullptr);
	WPort const Port = Server.GetListeningPort();
	ASSERT_NE(Port, 0);

	std::string Content{};
	ASSERT_TRUE(WFilesystem::ReadFile(User, Content));
	EXPECT_EQ(Content, std::to_string(Port));
	EXPECT_EQ(Server.Describe(), fmt::format("tcp:127.0.0.1:{}", Port));

	// A client only knows the discovery files
	WTcpRpcTransport Client({ 0 }, { "", User });
	EXPECT_NE(Client.Dial(1000), nullptr);

	Server.Cleanup();
	EXPECT_FALSE(WFilesystem::Exists(Machine));
	EXPECT_FALSE(WFilesystem::Exists(User));
}

TEST_F(RpcTransportTest, TcpKeepsForeignPortFile)
{
	std::string const User = Dir / "ipc_port";
	WTcpRpcTransport  Server({ 0 }, { User });
	auto              Listener = Server.Listen();
	ASSERT_NE(Listener, nullptr);

	// Another server took over the file in the meantime
	ASSERT_TRUE(WFilesystem::WriteFileAtomic(User, "1"));
	Server.Cleanup();
	EXPECT_TRUE(WFilesystem::Exists(User));
}

TEST_F(RpcTransportTest, TcpFallsBackToNextCandidate)
{
	WServerSocket Holder(WSocketAddress::Tcp("127.0.0.1", 0));
	ASSERT_TRUE(Holder.BindAndListen());

	WTcpRpcTransport Server({ Holder.GetBoundPort(), 0 }, {});
	auto             Listener = Server.Listen();
	ASSERT_NE(Listener, nullptr);
	EXPECT_NE(Server.GetListeningPort(), Holder.GetBoundPort());
	EXPECT_EQ(Server.GetEndpointCount(), 2u);
}

TEST_F(RpcTransportTest, NothingListeningFailsFast)
{
	WTcpRpcTransport Client({ 0 }, { Dir / "missing" });
	EXPECT_EQ(Client.Dial(200), nullptr);

	WRpcClient RpcClient(std::make_shared<WUnixRpcTransport>(Dir / "none.sock", 0600), 200);
	WResult    Result = RpcClient.Ping();
	EXPECT_EQ(Result.Code, EC_Transport);
	EXPECT_FALSE(RpcClient.IsConnected());
}
