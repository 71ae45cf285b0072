/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

using namespace testing;

namespace vpcctl::common::utils::test {

class JsonTest : public Test { };

TEST_F(JsonTest, ParseInvalidJson)
{
    auto [_, err] = ParseJson("{\"key\": ");

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(JsonTest, CaseInsensitiveAccess)
{
    auto [var, err] = ParseJson(R"({"WorkingDir": "/tmp/vpc", "Probe": {"Retries": 3, "Ports": [80, 443]}})");
    ASSERT_TRUE(err.IsNone());

    CaseInsensitiveObjectWrapper object(var);

    EXPECT_TRUE(object.Has("workingdir"));
    EXPECT_EQ(object.GetValue<std::string>("workingDir"), "/tmp/vpc");
    EXPECT_EQ(object.GetValue<std::string>("netnsDir", "/run/netns"), "/run/netns");
    EXPECT_FALSE(object.GetOptionalValue<std::string>("logLevel").has_value());

    auto probe = object.GetObject("probe");

    EXPECT_EQ(probe.GetValue<int>("retries"), 3);
    EXPECT_EQ(probe.GetArrayValue<int>("ports"), std::vector<int>({80, 443}));
    EXPECT_TRUE(probe.GetArrayValue<int>("missing").empty());
}

TEST_F(JsonTest, MissingKeyThrows)
{
    auto [var, err] = ParseJson(R"({"name": "vpc"})");
    ASSERT_TRUE(err.IsNone());

    CaseInsensitiveObjectWrapper object(var);

    try {
        object.Get("cidr");
        FAIL() << "VPCException expected";
    } catch (const VPCException& e) {
        EXPECT_TRUE(e.GetError().Is(ErrorEnum::eNotFound));
    }
}

TEST_F(JsonTest, NonObjectThrows)
{
    auto [var, err] = ParseJson("[1, 2, 3]");
    ASSERT_TRUE(err.IsNone());

    EXPECT_THROW(CaseInsensitiveObjectWrapper {var}, std::exception);
}

} // namespace vpcctl::common::utils::test
