/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Engine/StatsObserver.hpp"
#include "Engine/StatsTracker.hpp"

class StatsTrackerTest : public ::testing::Test
{
protected:
	WStatsTracker Tracker{};

	WRuleStats Get(WRuleId const& RuleId) const
	{
		WRuleStats Stats{};
		EXPECT_TRUE(Tracker.GetStats(RuleId, Stats));
		return Stats;
	}
};

TEST_F(StatsTrackerTest, CountsOnlyKnownRules)
{
	Tracker.AddBytesIn("unknown", 10);
	EXPECT_FALSE(Tracker.HasRule("unknown"));

	Tracker.InitRule("r1");
	Tracker.AddBytesIn("r1", 10);
	Tracker.AddBytesOut("r1", 20);
	Tracker.IncrementConnections("r1");
	Tracker.IncrementConnections("r1");
	Tracker.DecrementActiveConnections("r1");
	Tracker.IncrementErrors("r1");

	WRuleStats Stats = Get("r1");
	EXPECT_EQ(Stats.RuleId, "r1");
	EXPECT_EQ(Stats.BytesIn, 10);
	EXPECT_EQ(Stats.BytesOut, 20);
	EXPECT_EQ(Stats.Connections, 2);
	EXPECT_EQ(Stats.ActiveConns, 1);
	EXPECT_EQ(Stats.Errors, 1);
	EXPECT_FALSE(Stats.LastActivity.empty());
}

TEST_F(StatsTrackerTest, ObserverUpdatesOverwrite)
{
	Tracker.UpdateFromObserver("r1", { .TotalConns = 3, .CurrentConns = 1, .InputBytes = 100, .OutputBytes = 50 });
	Tracker.UpdateFromObserver("r1", { .TotalConns = 4, .CurrentConns = 2, .InputBytes = 150, .OutputBytes = 70 });

	WRuleStats Stats = Get("r1");
	EXPECT_EQ(Stats.Connections, 4);
	EXPECT_EQ(Stats.ActiveConns, 2);
	EXPECT_EQ(Stats.BytesIn, 150);
	EXPECT_EQ(Stats.BytesOut, 70);
}

TEST_F(StatsTrackerTest, ResetSurvivesNextPoll)
{
	Tracker.UpdateFromObserver("r1", { .TotalConns = 5, .CurrentConns = 2, .InputBytes = 1000, .OutputBytes = 500 });
	Tracker.ResetStats("r1");

	WRuleStats Reset = Get("r1");
	EXPECT_EQ(Reset.BytesIn, 0);
	EXPECT_EQ(Reset.Connections, 0);
	EXPECT_EQ(Reset.ActiveConns, 2);

	// Cumulative counters keep growing on the service side
	Tracker.UpdateFromObserver("r1", { .TotalConns = 6, .CurrentConns = 1, .InputBytes = 1200, .OutputBytes = 500 });
	WRuleStats After = Get("r1");
	EXPECT_EQ(After.Connections, 1);
	EXPECT_EQ(After.BytesIn, 200);
	EXPECT_EQ(After.BytesOut, 0);
	EXPECT_EQ(After.ActiveConns, 1);
}

TEST_F(StatsTrackerTest, ResetAllAndRemove)
{
	Tracker.InitRule("a");
	Tracker.InitRule("b");
	Tracker.AddBytesIn("a", 1);
	Tracker.AddBytesIn("b", 2);
	Tracker.ResetAllStats();

	auto All = Tracker.GetAllStats();
	ASSERT_EQ(All.size(), 2u);
	EXPECT_EQ(All["a"].BytesIn, 0);
	EXPECT_EQ(All["b"].BytesIn, 0);

	Tracker.RemoveRule("a");
	EXPECT_FALSE(Tracker.HasRule("a"));
	WRuleStats Missing{};
	EXPECT_FALSE(Tracker.GetStats("a", Missing));
}

TEST_F(StatsTrackerTest, InitRuleZeroesExistingEntry)
{
	Tracker.UpdateFromObserver("r1", { .TotalConns = 5, .InputBytes = 10 });
	Tracker.InitRule("r1");
	Tracker.UpdateFromObserver("r1", { .TotalConns = 1, .InputBytes = 3 });

	WRuleStats Stats = Get("r1");
	EXPECT_EQ(Stats.Connections, 1);
	EXPECT_EQ(Stats.BytesIn, 3);
}

TEST(StatsObserverTest, RepublishesAndResets)
{
	WStatsObserver Observer{};
	WStatsTracker  Tracker{};
	sigslot::scoped_connection Connection = Observer.OnUpdate.connect(
		[&](std::string const& Name, WServiceStats const& Stats) { Tracker.UpdateFromObserver(Name, Stats); });

	Observer.Observe("", { .TotalConns = 1 });
	EXPECT_TRUE(Observer.GetAllStats().empty());

	Observer.Observe("svc", { .TotalConns = 2, .InputBytes = 64 });
	EXPECT_EQ(Observer.GetStats("svc").TotalConns, 2u);
	EXPECT_EQ(Observer.GetStats("other"), WServiceStats{});

	WRuleStats Stats{};
	ASSERT_TRUE(Tracker.GetStats("svc", Stats));
	EXPECT_EQ(Stats.BytesIn, 64);

	Observer.ResetStats("svc");
	EXPECT_EQ(Observer.GetStats("svc"), WServiceStats{});

	Observer.Observe("svc2", { .TotalErrs = 1 });
	Observer.ResetAllStats();
	EXPECT_EQ(Observer.GetStats("svc2"), WServiceStats{});

	Observer.RemoveStats("svc2");
	EXPECT_EQ(Observer.GetAllStats().size(), 1u);
}
