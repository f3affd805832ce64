/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "Engine/Engine.hpp"

class EngineTest : public ::testing::Test
{
protected:
	std::shared_ptr<WFakeBuilder>   Builder = std::make_shared<WFakeBuilder>();
	std::shared_ptr<WStatsObserver> Observer = std::make_shared<WStatsObserver>();
	std::unique_ptr<WEngine>        Engine{};

	void SetUp() override
	{
		WEngineOptions Options{};
		Options.StatsPollIntervalMs = 50;
		Options.ServeRetryDelayMs = 10;
		Engine = std::make_unique<WEngine>(Builder, Observer, Options);
	}

	void TearDown() override { Engine.reset(); }
};

TEST_F(EngineTest, StartAndStop)
{
	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	EXPECT_TRUE(Engine->IsRunning("r1"));
	EXPECT_EQ(Engine->GetRunningCount(), 1u);

	EXPECT_EQ(Engine->StartRule(MakeRule("r1")).Code, EC_AlreadyRunning);

	ASSERT_TRUE(Engine->StopRule("r1").Ok());
	EXPECT_FALSE(Engine->IsRunning("r1"));
	EXPECT_EQ(Engine->StopRule("r1").Code, EC_NotRunning);
	EXPECT_EQ(Builder->Lookup("r1"), nullptr);
}

TEST_F(EngineTest, InvalidRuleIsNotBuilt)
{
	WRule Rule = MakeRule("r1");
	Rule.LocalPort = 0;
	EXPECT_EQ(Engine->StartRule(Rule).Code, EC_Validation);
	EXPECT_FALSE(Engine->IsRunning("r1"));
}

TEST_F(EngineTest, BuildFailureIsLogged)
{
	WRule Rule = MakeRule("r1", "proxy");
	Rule.Protocol = P_Http;

	WResult Result = Engine->StartRule(Rule);
	EXPECT_EQ(Result.Code, EC_Build);
	EXPECT_FALSE(Engine->IsRunning("r1"));

	auto Logs = Engine->GetLogManager().GetByRule("r1");
	ASSERT_FALSE(Logs.empty());
	EXPECT_EQ(Logs.back().Level, LL_Error);
}

TEST_F(EngineTest, FatalServeErrorRemovesRule)
{
	std::mutex                                   Mutex{};
	std::vector<std::pair<WRuleId, ERuleStatus>> Changes{};
	std::string                                  LastError{};
	sigslot::scoped_connection Connection = Engine->OnStatusChanged.connect(
		[&](WRuleId const& RuleId, ERuleStatus Status, std::string const& Error) {
			std::lock_guard Lock(Mutex);
			Changes.emplace_back(RuleId, Status);
			LastError = Error;
		});

	ASSERT_TRUE(Engine->StartRule(MakeRule("r1", "bind-fail")).Ok());
	ASSERT_TRUE(WaitUntil([&] {
		std::lock_guard Lock(Mutex);
		return !Changes.empty();
	}));

	EXPECT_FALSE(Engine->IsRunning("r1"));
	std::lock_guard Lock(Mutex);
	ASSERT_EQ(Changes.size(), 1u);
	EXPECT_EQ(Changes[0].second, RS_Error);
	EXPECT_EQ(LastError, "address already in use");
}

TEST_F(EngineTest, NonFatalServeErrorRetries)
{
	Builder->Script = [](WRule const&) {
		return std::deque<WServeResult>{ WServeResult::Fail(SE_Other, "temporary"),
			WServeResult::Fail(SE_Other, "temporary") };
	};

	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	auto Fake = Builder->GetFake("r1");
	ASSERT_NE(Fake, nullptr);
	ASSERT_TRUE(WaitUntil([&] { return Fake->GetServeCalls() >= 3; }));
	EXPECT_TRUE(Engine->IsRunning("r1"));

	WRuleStats Stats{};
	ASSERT_TRUE(Engine->GetStatsTracker().GetStats("r1", Stats));
	EXPECT_EQ(Stats.Errors, 2);
}

TEST_F(EngineTest, ClosedServiceReportsStopped)
{
	std::atomic<int> Stopped{ 0 };
	sigslot::scoped_connection Connection = Engine->OnStatusChanged.connect(
		[&](WRuleId const&, ERuleStatus Status, std::string const&) {
			if (Status == RS_Stopped)
				++Stopped;
		});

	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	Builder->GetFake("r1")->Close();

	ASSERT_TRUE(WaitUntil([&] { return Stopped == 1; }));
	EXPECT_FALSE(Engine->IsRunning("r1"));

	// Stopping on purpose is not reported
	ASSERT_TRUE(Engine->StartRule(MakeRule("r2")).Ok());
	ASSERT_TRUE(Engine->StopRule("r2").Ok());
	EXPECT_EQ(Stopped, 1);
}

TEST_F(EngineTest, StatsSurviveStop)
{
	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	Builder->GetFake("r1")->SetStats({ .TotalConns = 7, .CurrentConns = 1, .InputBytes = 512, .OutputBytes = 256 });
	Engine->PollStats();
	ASSERT_TRUE(Engine->StopRule("r1").Ok());

	WRuleStats Stats{};
	ASSERT_TRUE(Engine->GetStatsTracker().GetStats("r1", Stats));
	EXPECT_EQ(Stats.Connections, 7);
	EXPECT_EQ(Stats.BytesIn, 512);
	EXPECT_EQ(Observer->GetStats("r1").OutputBytes, 256u);
}

TEST_F(EngineTest, PollingPicksUpStats)
{
	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	Builder->GetFake("r1")->SetStats({ .TotalConns = 3 });

	EXPECT_TRUE(WaitUntil([&] {
		WRuleStats Stats{};
		return Engine->GetStatsTracker().GetStats("r1", Stats) && Stats.Connections == 3;
	}));
}

TEST_F(EngineTest, RestartRunsAgain)
{
	ASSERT_TRUE(Engine->StartRule(MakeRule("r1")).Ok());
	auto First = Builder->GetFake("r1");
	ASSERT_TRUE(Engine->RestartRule(MakeRule("r1")).Ok());
	EXPECT_TRUE(Engine->IsRunning("r1"));
	EXPECT_NE(Builder->GetFake("r1"), First);

	// Restarting a stopped rule starts it
	ASSERT_TRUE(Engine->StopRule("r1").Ok());
	EXPECT_TRUE(Engine->RestartRule(MakeRule("r1")).Ok());
}

TEST_F(EngineTest, ConcurrentStartsAndStops)
{
	constexpr int Count = 16;

	std::vector<std::thread> Threads{};
	for (int i = 0; i < Count; ++i)
	{
		Threads.emplace_back([this, i] {
			std::string Id = fmt::format("r{}", i);
			EXPECT_TRUE(Engine->StartRule(MakeRule(Id)).Ok());
			if (i % 2 == 0)
			{
				EXPECT_TRUE(Engine->StopRule(Id).Ok());
			}
		});
	}
	for (auto& Thread : Threads)
	{
		Thread.join();
	}

	EXPECT_EQ(Engine->GetRunningCount(), static_cast<size_t>(Count / 2));
	auto Ids = Engine->GetRunningRuleIds();
	EXPECT_TRUE(std::is_sorted(Ids.begin(), Ids.end()));

	Engine->StopAll();
	EXPECT_EQ(Engine->GetRunningCount(), 0u);
	Engine->StopAll();
}

TEST_F(EngineTest, ConcurrentStartsOfOneRuleRunItOnce)
{
	constexpr int Count = 16;

	std::atomic<int>         Started{ 0 };
	std::atomic<int>         Refused{ 0 };
	std::atomic<bool>        bGo{ false };
	std::vector<std::thread> Threads{};
	for (int i = 0; i < Count; ++i)
	{
		Threads.emplace_back([&] {
			while (!bGo)
			{
				std::this_thread::yield();
			}
			WResult Result = Engine->StartRule(MakeRule("same"));
			if (Result.Ok())
			{
				++Started;
			}
			else if (Result.Code == EC_AlreadyRunning)
			{
				++Refused;
			}
		});
	}
	bGo = true;
	for (auto& Thread : Threads)
	{
		Thread.join();
	}

	EXPECT_EQ(Started.load(), 1);
	EXPECT_EQ(Refused.load(), Count - 1);
	auto Ids = Engine->GetRunningRuleIds();
	EXPECT_EQ(std::ranges::count(Ids, WRuleId("same")), 1);
	EXPECT_EQ(Builder->GetBuildCount(), 1);
}
