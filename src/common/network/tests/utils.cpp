/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/network/utils.hpp>

using namespace testing;

namespace vpcctl::common::network {

class NetworkUtilsTest : public Test { };

TEST_F(NetworkUtilsTest, ParseCIDR)
{
    auto [network, err] = ParseCIDR("10.0.1.0/24");

    ASSERT_TRUE(err.IsNone());
    EXPECT_EQ(network.mAddress, 0x0A000100u);
    EXPECT_EQ(network.mPrefix, 24);

    for (const auto& invalid : {"10.0.1.0", "10.0.1.0/33", "10.0.1/24", "10.0.1.0/x", "300.0.0.0/8", ""}) {
        EXPECT_TRUE(ParseCIDR(invalid).mError.Is(ErrorEnum::eInvalidArgument)) << invalid;
    }
}

TEST_F(NetworkUtilsTest, PrefixToMask)
{
    EXPECT_EQ(PrefixToMask(0), 0u);
    EXPECT_EQ(PrefixToMask(8), 0xFF000000u);
    EXPECT_EQ(PrefixToMask(24), 0xFFFFFF00u);
    EXPECT_EQ(PrefixToMask(32), 0xFFFFFFFFu);
}

TEST_F(NetworkUtilsTest, NetworkOf)
{
    auto [network, err] = NetworkOf("10.0.1.2/24");

    ASSERT_TRUE(err.IsNone());
    EXPECT_EQ(network, "10.0.1.0/24");

    EXPECT_EQ(NetworkOf("172.16.5.77/16").mValue, "172.16.0.0/16");
    EXPECT_FALSE(NetworkOf("10.0.1.2").mError.IsNone());
}

TEST_F(NetworkUtilsTest, NetworkContains)
{
    EXPECT_TRUE(NetworkContainsIP("10.0.1.0/24", "10.0.1.2"));
    EXPECT_TRUE(NetworkContainsIP("10.0.1.0/24", "10.0.1.2/24"));
    EXPECT_FALSE(NetworkContainsIP("10.0.1.0/24", "10.0.2.2"));
    EXPECT_FALSE(NetworkContainsIP("garbage", "10.0.1.2"));
    EXPECT_FALSE(NetworkContainsIP("10.0.1.0/24", "garbage"));

    EXPECT_TRUE(NetworkContainsNetwork("10.0.0.0/16", "10.0.1.0/24"));
    EXPECT_TRUE(NetworkContainsNetwork("10.0.0.0/16", "10.0.0.0/16"));
    EXPECT_FALSE(NetworkContainsNetwork("10.0.1.0/24", "10.0.0.0/16"));
    EXPECT_FALSE(NetworkContainsNetwork("10.0.0.0/16", "10.1.0.0/24"));
}

TEST_F(NetworkUtilsTest, StripPrefix)
{
    EXPECT_EQ(StripPrefix("10.0.1.2/24"), "10.0.1.2");
    EXPECT_EQ(StripPrefix("10.0.1.2"), "10.0.1.2");
    EXPECT_EQ(IPToString(0x0A000102u), "10.0.1.2");
}

} // namespace vpcctl::common::network
