/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "Data/Chain.hpp"

TEST(RuleTest, PrimaryTargetIsEnough)
{
	WRule Rule = MakeRule("r1");
	EXPECT_TRUE(Rule.Validate().Ok());
	ASSERT_EQ(Rule.GetEffectiveTargets().size(), 1u);
	EXPECT_EQ(Rule.GetTargetAddr(), "127.0.0.1:9");
	EXPECT_EQ(Rule.GetListenAddr(), ":18080");
}

TEST(RuleTest, RejectsMissingFields)
{
	WRule Rule = MakeRule("r1");
	Rule.Name.clear();
	EXPECT_EQ(Rule.Validate().Code, EC_Validation);

	Rule = MakeRule("r1");
	Rule.LocalPort = 0;
	EXPECT_EQ(Rule.Validate().Code, EC_Validation);

	Rule = MakeRule("r1");
	Rule.TargetHost.clear();
	EXPECT_EQ(Rule.Validate().Message, "at least one target is required");
}

TEST(RuleTest, ReportsTargetIndex)
{
	WRule Rule = MakeRule("r1");
	Rule.TargetHost.clear();
	Rule.Targets = { { "a", 1, 1 }, { "", 2, 1 } };

	WResult Result = Rule.Validate();
	EXPECT_EQ(Result.Code, EC_Validation);
	EXPECT_EQ(Result.Message, "validation error on targets[1]: host and port are required");
}

TEST(RuleTest, ChainRulesMayHaveNoTarget)
{
	WRule Rule = MakeRule("r1");
	Rule.TargetHost.clear();
	Rule.Type = RT_Chain;
	Rule.Protocol = P_Socks5;
	EXPECT_TRUE(Rule.Validate().Ok());
	EXPECT_TRUE(Rule.GetTargetAddr().empty());
}

TEST(RuleTest, NamesRoundTrip)
{
	ERuleType Type{};
	EXPECT_TRUE(ParseRuleType("reverse", Type));
	EXPECT_EQ(Type, RT_Reverse);
	EXPECT_FALSE(ParseRuleType("sideways", Type));

	EProtocol Protocol{};
	EXPECT_TRUE(ParseProtocol("ss", Protocol));
	EXPECT_EQ(Protocol, P_Shadowsocks);
	EXPECT_FALSE(ParseProtocol("quic", Protocol));
	EXPECT_STREQ(RuleStatusToString(RS_Error), "error");
}

TEST(ChainTest, Validation)
{
	WChain Chain{};
	EXPECT_EQ(Chain.Validate().Message, "chain name cannot be empty");

	Chain.Name = "exit";
	EXPECT_EQ(Chain.Validate().Message, "at least one hop is required");

	Chain.Hops.push_back(WHop{ .Name = "a", .Addr = "" });
	EXPECT_EQ(Chain.Validate().Message, "validation error on hops[0]: address is required");

	Chain.Hops[0].Addr = "10.0.0.1:1080";
	EXPECT_TRUE(Chain.Validate().Ok());
}

TEST(ResultTest, EngineErrorsNameRuleAndOperation)
{
	WResult Result = WResult::Engine("r1", "config", "failed to build configuration", "chain c1 not found");
	EXPECT_EQ(Result.Code, EC_Build);
	EXPECT_EQ(Result.Message, "engine error [config] on rule r1: failed to build configuration (chain c1 not found)");
	EXPECT_FALSE(Result.IsTransportError());
	EXPECT_TRUE(WResult::Error(EC_Transport, "x").IsTransportError());
}
