/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Engine/LogManager.hpp"

class LogManagerTest : public ::testing::Test
{
protected:
	WLogManager Logs{ 3 };
};

TEST_F(LogManagerTest, DropsOldestBeyondCapacity)
{
	for (int i = 0; i < 5; ++i)
	{
		Logs.Info("r1", "rule", fmt::format("message {}", i));
	}

	auto All = Logs.GetAll();
	ASSERT_EQ(All.size(), 3u);
	EXPECT_EQ(All.front().Id, 3);
	EXPECT_EQ(All.back().Id, 5);
	EXPECT_EQ(All.back().Message, "message 4");
}

TEST_F(LogManagerTest, IdsAreNotReusedAfterClear)
{
	Logs.Info("", "", "one");
	Logs.Info("", "", "two");
	Logs.Clear();
	EXPECT_EQ(Logs.Size(), 0u);

	Logs.Warn("", "", "three");
	auto All = Logs.GetAll();
	ASSERT_EQ(All.size(), 1u);
	EXPECT_EQ(All[0].Id, 3);
	EXPECT_EQ(All[0].Level, LL_Warn);
}

TEST_F(LogManagerTest, RecentReturnsTailInOrder)
{
	Logs.Info("", "", "a");
	Logs.Info("", "", "b");
	Logs.Info("", "", "c");

	auto Recent = Logs.GetRecent(2);
	ASSERT_EQ(Recent.size(), 2u);
	EXPECT_EQ(Recent[0].Message, "b");
	EXPECT_EQ(Recent[1].Message, "c");

	EXPECT_EQ(Logs.GetRecent(0).size(), 3u);
	EXPECT_EQ(Logs.GetRecent(10).size(), 3u);
}

TEST_F(LogManagerTest, SinceIsStrictlyGreater)
{
	Logs.Info("", "", "a");
	Logs.Info("", "", "b");
	Logs.Info("", "", "c");

	auto Since = Logs.GetSince(1);
	ASSERT_EQ(Since.size(), 2u);
	EXPECT_EQ(Since[0].Id, 2);
	EXPECT_TRUE(Logs.GetSince(3).empty());
	EXPECT_EQ(Logs.GetSince(0).size(), 3u);
}

TEST_F(LogManagerTest, FiltersByRule)
{
	Logs.Info("r1", "one", "a");
	Logs.Error("r2", "two", "b", "details");
	Logs.Info("r1", "one", "c");

	auto ByRule = Logs.GetByRule("r2");
	ASSERT_EQ(ByRule.size(), 1u);
	EXPECT_EQ(ByRule[0].RuleName, "two");
	EXPECT_EQ(ByRule[0].Details, "details");
	EXPECT_EQ(ByRule[0].Level, LL_Error);
	EXPECT_TRUE(Logs.GetByRule("r3").empty());
}

TEST_F(LogManagerTest, NotifiesNewEntries)
{
	std::vector<WLogId> Seen{};
	sigslot::scoped_connection Connection =
		Logs.OnEntryAdded.connect([&](WLogEntry const& Entry) {
			// The ring is unlocked while listeners run
			EXPECT_EQ(Logs.GetAll().back().Id, Entry.Id);
			Seen.push_back(Entry.Id);
		});

	Logs.Debug("", "", "a");
	Logs.Info("", "", "b");
	EXPECT_EQ(Seen, (std::vector<WLogId>{ 1, 2 }));
}

TEST(LogManagerCapacityTest, NonPositiveCapacityUsesDefault)
{
	WLogManager Logs{ 0 };
	EXPECT_EQ(Logs.GetCapacity(), WLogManager::DefaultCapacity);
}
