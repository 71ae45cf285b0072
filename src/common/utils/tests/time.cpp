/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/utils/time.hpp>

using namespace testing;

namespace vpcctl::common::utils::test {

class TimeTest : public Test { };

TEST_F(TimeTest, ParseDuration)
{
    struct TestCase {
        std::string mInput;
        int64_t     mExpected;
    };

    std::vector<TestCase> testCases = {
        {"1s", 1000000000LL},
        {"500ms", 500000000LL},
        {"2m", 120000000000LL},
        {"1h", 3600000000000LL},
        {"1m30s", 90000000000LL},
        {"250us", 250000LL},
        {"10ns", 10LL},
    };

    for (const auto& testCase : testCases) {
        auto [duration, err] = ParseDuration(testCase.mInput);

        ASSERT_TRUE(err.IsNone()) << testCase.mInput;
        EXPECT_EQ(duration.Nanoseconds(), testCase.mExpected) << testCase.mInput;
    }
}

TEST_F(TimeTest, ParseInvalidDuration)
{
    for (const auto& input : {"", "s", "10", "10x", "1.5s", "-1s", "99999999999999999999s", "9223372036854775807h",
             "9223372037s", "9223372036s1s"}) {
        auto [_, err] = ParseDuration(input);

        EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument)) << input;
    }
}

TEST_F(TimeTest, ToUTCString)
{
    EXPECT_EQ(ToUTCString(Time::Unix(0, 0)), "1970-01-01T00:00:00Z");
}

} // namespace vpcctl::common::utils::test
