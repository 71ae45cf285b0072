/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>

#include <common/network/namespacemanager.hpp>

using namespace testing;

namespace vpcctl::common::network {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class NamespaceManagerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        TearDown();

        std::filesystem::create_directories(cNetnsDir);

        ASSERT_TRUE(mManager
                        .Init(cNetnsDir,
                            [this](const std::vector<std::string>& args) -> RetWithError<std::string> {
                                mCommands.push_back(args);

                                if (!mOutputs.empty()) {
                                    auto result = mOutputs.front();

                                    mOutputs.erase(mOutputs.begin());

                                    return result;
                                }

                                return std::string();
                            })
                        .IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cNetnsDir); }

    void CreateNamespaceFile(const std::string& ns) { std::ofstream(std::filesystem::path(cNetnsDir) / ns); }

    static constexpr auto cNetnsDir = "namespacemanager_test";

    NamespaceManager                          mManager;
    std::vector<std::vector<std::string>>     mCommands;
    std::vector<RetWithError<std::string>>    mOutputs;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(NamespaceManagerTest, CreateNamespace)
{
    ASSERT_TRUE(mManager.CreateNamespace("ns-prod-public").IsNone());

    ASSERT_EQ(mCommands.size(), 1u);
    EXPECT_EQ(mCommands[0], std::vector<std::string>({"ip", "netns", "add", "ns-prod-public"}));

    CreateNamespaceFile("ns-prod-public");

    EXPECT_TRUE(mManager.CreateNamespace("ns-prod-public").Is(ErrorEnum::eAlreadyExist));
    EXPECT_EQ(mCommands.size(), 1u);
}

TEST_F(NamespaceManagerTest, DeleteNamespace)
{
    EXPECT_TRUE(mManager.DeleteNamespace("ns-prod-public").Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(mCommands.empty());

    CreateNamespaceFile("ns-prod-public");

    ASSERT_TRUE(mManager.DeleteNamespace("ns-prod-public").IsNone());
    EXPECT_EQ(mCommands[0], std::vector<std::string>({"ip", "netns", "delete", "ns-prod-public"}));
}

TEST_F(NamespaceManagerTest, ListNamespaces)
{
    CreateNamespaceFile("ns-prod-public");
    CreateNamespaceFile("ns-prod-private");

    std::vector<std::string> namespaces;

    ASSERT_TRUE(mManager.ListNamespaces(namespaces).IsNone());

    std::sort(namespaces.begin(), namespaces.end());

    EXPECT_EQ(namespaces, std::vector<std::string>({"ns-prod-private", "ns-prod-public"}));
}

TEST_F(NamespaceManagerTest, GetAddrList)
{
    mOutputs.push_back(std::string(
        "1: lo    inet 127.0.0.1/8 scope host lo\\       valid_lft forever preferred_lft forever\n"
        "5: vnprodpub    inet 10.0.1.2/24 scope global vnprodpub\\       valid_lft forever preferred_lft forever\n"));

    std::vector<std::string> addresses;

    ASSERT_TRUE(mManager.GetAddrList("ns-prod-public", "", addresses).IsNone());

    EXPECT_EQ(addresses, std::vector<std::string>({"10.0.1.2/24"}));
    EXPECT_EQ(mCommands[0], std::vector<std::string>({"ip", "-n", "ns-prod-public", "-4", "-o", "addr", "show"}));
}

TEST_F(NamespaceManagerTest, AddAddrIsIdempotent)
{
    mOutputs.push_back(std::string("5: vnprodpub    inet 10.0.1.2/24 scope global vnprodpub\n"));

    ASSERT_TRUE(mManager.AddAddr("ns-prod-public", "vnprodpub", "10.0.1.2/24").IsNone());
    ASSERT_EQ(mCommands.size(), 1u);

    ASSERT_TRUE(mManager.AddAddr("ns-prod-public", "vnprodpub", "10.0.1.3/24").IsNone());
    ASSERT_EQ(mCommands.size(), 3u);
    EXPECT_EQ(mCommands[2],
        std::vector<std::string>({"ip", "-n", "ns-prod-public", "addr", "add", "10.0.1.3/24", "dev", "vnprodpub"}));
}

TEST_F(NamespaceManagerTest, AddRoute)
{
    Route route {"10.1.0.0/16", "10.0.0.1", "vnprodpub", true};

    ASSERT_TRUE(mManager.AddRoute("ns-prod-public", route).IsNone());

    EXPECT_EQ(mCommands[0],
        std::vector<std::string>({"ip", "-n", "ns-prod-public", "route", "replace", "10.1.0.0/16", "via", "10.0.0.1",
            "dev", "vnprodpub", "onlink"}));

    ASSERT_TRUE(mManager.AddRoute("ns-prod-public", Route {"default", "10.0.1.1", "", false}).IsNone());

    EXPECT_EQ(mCommands[1],
        std::vector<std::string>({"ip", "-n", "ns-prod-public", "route", "replace", "default", "via", "10.0.1.1"}));
}

TEST_F(NamespaceManagerTest, DeleteMissingRoute)
{
    mOutputs.push_back({"", Error(ErrorEnum::eRuntime, "RTNETLINK answers: No such process")});

    EXPECT_TRUE(mManager.DeleteRoute("ns-prod-public", "10.1.0.0/16").Is(ErrorEnum::eNotFound));

    mOutputs.push_back({"", Error(ErrorEnum::eRuntime, "permission denied")});

    EXPECT_TRUE(mManager.DeleteRoute("ns-prod-public", "10.1.0.0/16").Is(ErrorEnum::eRuntime));
}

TEST_F(NamespaceManagerTest, SetForwarding)
{
    ASSERT_TRUE(mManager.SetForwarding("ns-prod-public", true).IsNone());

    EXPECT_EQ(mCommands[0],
        std::vector<std::string>({"ip", "netns", "exec", "ns-prod-public", "sysctl", "-w", "net.ipv4.ip_forward=1"}));
}

} // namespace vpcctl::common::network
