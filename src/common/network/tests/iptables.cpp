/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>

#include <common/network/iptables.hpp>

using namespace testing;

namespace vpcctl::common::network {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class IPTablesTest : public Test {
protected:
    void SetUp() override { aos::tests::utils::InitLog(); }

    IPTables::Executor Executor()
    {
        return [this](const std::vector<std::string>& args) -> RetWithError<std::string> {
            mCommands.push_back(args);

            return {mOutput, mResult};
        };
    }

    std::vector<std::vector<std::string>> mCommands;
    std::string                           mOutput;
    Error                                 mResult;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(IPTablesTest, AppendInHostNamespace)
{
    IPTables iptables("nat", "", Executor());

    auto rule = RuleBuilder().Source("10.0.1.0/24").OutInterface("eth0").Jump("MASQUERADE");

    ASSERT_TRUE(iptables.Append("POSTROUTING", rule).IsNone());

    ASSERT_EQ(mCommands.size(), 1u);
    EXPECT_EQ(mCommands[0],
        std::vector<std::string>({"iptables", "-w", "-t", "nat", "-A", "POSTROUTING", "-s", "10.0.1.0/24", "-o",
            "eth0", "-j", "MASQUERADE"}));
}

TEST_F(IPTablesTest, DeleteInNamespace)
{
    IPTables iptables("filter", "ns-prod-public", Executor());

    auto rule = RuleBuilder().Protocol("tcp").DestinationPort(80).Jump("ACCEPT");

    ASSERT_TRUE(iptables.DeleteRule("INPUT", rule).IsNone());

    ASSERT_EQ(mCommands.size(), 1u);
    EXPECT_EQ(mCommands[0],
        std::vector<std::string>({"ip", "netns", "exec", "ns-prod-public", "iptables", "-w", "-t", "filter", "-D",
            "INPUT", "-p", "tcp", "--dport", "80", "-j", "ACCEPT"}));
}

TEST_F(IPTablesTest, CheckMissingRule)
{
    IPTables iptables("filter", "", Executor());

    auto rule = RuleBuilder().InInterface("br-prod").OutInterface("br-prod").Jump("ACCEPT");

    auto [exists, err] = iptables.Check("FORWARD", rule);

    ASSERT_TRUE(err.IsNone());
    EXPECT_TRUE(exists);

    mResult = Error(ErrorEnum::eRuntime, "Bad rule");

    auto result = iptables.Check("FORWARD", rule);

    ASSERT_TRUE(result.mError.IsNone());
    EXPECT_FALSE(result.mValue);

    EXPECT_EQ(mCommands.back()[4], "-C");
}

TEST_F(IPTablesTest, ListRules)
{
    IPTables iptables("filter", "", Executor());

    mOutput = "-P FORWARD DROP\n"
              "-A FORWARD -s 10.0.1.0/24 -o eth0 -j ACCEPT\n"
              "-A FORWARD -d 10.0.1.0/24 -i eth0 -m state --state RELATED,ESTABLISHED -j ACCEPT\n";

    auto [rules, err] = iptables.ListRules("FORWARD");

    ASSERT_TRUE(err.IsNone());
    ASSERT_EQ(rules.size(), 2u);

    EXPECT_EQ(rules[0].mChain, "FORWARD");
    EXPECT_EQ(rules[0].mRule, RuleBuilder().Source("10.0.1.0/24").OutInterface("eth0").Jump("ACCEPT"));
    EXPECT_EQ(rules[1].mRule.Build().size(), 11u);

    EXPECT_EQ(mCommands[0], std::vector<std::string>({"iptables", "-w", "-t", "filter", "-S", "FORWARD"}));
}

TEST_F(IPTablesTest, ListRulesError)
{
    IPTables iptables("filter", "ns-absent-public", Executor());

    mResult = Error(ErrorEnum::eRuntime, "Cannot open network namespace");

    EXPECT_TRUE(iptables.ListRules("").mError.Is(ErrorEnum::eRuntime));
}

TEST_F(IPTablesTest, ParseListedRule)
{
    auto rule = IPTables::ParseListedRule(R"(-A INPUT -p tcp -m comment --comment "allow web" -j ACCEPT)");

    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->mChain, "INPUT");
    EXPECT_EQ(rule->mRule.Build(),
        std::vector<std::string>({"-p", "tcp", "-m", "comment", "--comment", "allow web", "-j", "ACCEPT"}));

    EXPECT_FALSE(IPTables::ParseListedRule("-P INPUT ACCEPT").has_value());
    EXPECT_FALSE(IPTables::ParseListedRule("-N CUSTOM").has_value());
    EXPECT_FALSE(IPTables::ParseListedRule("").has_value());
}

TEST_F(IPTablesTest, ResetCommands)
{
    IPTables iptables("filter", "ns-prod-private", Executor());

    ASSERT_TRUE(iptables.Flush().IsNone());
    ASSERT_TRUE(iptables.DeleteChains().IsNone());
    ASSERT_TRUE(iptables.ZeroCounters().IsNone());
    ASSERT_TRUE(iptables.SetPolicy("INPUT", "ACCEPT").IsNone());

    ASSERT_EQ(mCommands.size(), 4u);
    EXPECT_EQ(mCommands[0].back(), "-F");
    EXPECT_EQ(mCommands[1].back(), "-X");
    EXPECT_EQ(mCommands[2].back(), "-Z");
    EXPECT_EQ(mCommands[3],
        std::vector<std::string>(
            {"ip", "netns", "exec", "ns-prod-private", "iptables", "-w", "-t", "filter", "-P", "INPUT", "ACCEPT"}));
}

} // namespace vpcctl::common::network
