/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>

#include <database/database.hpp>

using namespace testing;

namespace vpcctl::database {

namespace {

/***********************************************************************************************************************
 * Utils
 **********************************************************************************************************************/

vpc::VPCInfo CreateVPCInfo(const char* name, const char* cidr, const char* gateway)
{
    vpc::VPCInfo info;

    info.mName    = name;
    info.mCIDR    = cidr;
    info.mBridge  = std::string("br-") + name;
    info.mGateway = gateway;
    info.mCreated = Time::Now();
    info.mStatus  = vpc::VPCStatusEnum::eActive;

    return info;
}

peering::PeeringInfo CreatePeeringInfo(const char* vpc1, const char* vpc2)
{
    peering::PeeringInfo info;

    info.mVPC1    = vpc1;
    info.mVPC2    = vpc2;
    info.mLink1   = std::string("pr") + vpc1;
    info.mLink2   = std::string("pr") + vpc2;
    info.mCreated = Time::Now();

    return info;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DatabaseTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        std::filesystem::remove_all(cWorkingDir);

        mConfig.mWorkingDir = cWorkingDir;

        ASSERT_TRUE(mDB.Init(mConfig).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cWorkingDir); }

    static constexpr auto cWorkingDir = "vpcctl_database_test";

    Config   mConfig;
    Database mDB;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DatabaseTest, AddGetVPC)
{
    auto prod = CreateVPCInfo("prod", "10.0.0.0/16", "10.0.0.1");

    ASSERT_TRUE(mDB.AddVPC(prod).IsNone());
    EXPECT_TRUE(mDB.AddVPC(prod).Is(ErrorEnum::eAlreadyExist));

    vpc::VPCInfo result;

    ASSERT_TRUE(mDB.GetVPC("prod", result).IsNone());
    EXPECT_EQ(result, prod);

    EXPECT_TRUE(mDB.GetVPC("dev", result).Is(ErrorEnum::eNotFound));
}

TEST_F(DatabaseTest, UpdateVPC)
{
    auto prod = CreateVPCInfo("prod", "10.0.0.0/16", "10.0.0.1");

    EXPECT_TRUE(mDB.UpdateVPC(prod).Is(ErrorEnum::eNotFound));

    ASSERT_TRUE(mDB.AddVPC(prod).IsNone());

    prod.mStatus = vpc::VPCStatusEnum::eDeleted;

    ASSERT_TRUE(mDB.UpdateVPC(prod).IsNone());

    vpc::VPCInfo result;

    ASSERT_TRUE(mDB.GetVPC("prod", result).IsNone());
    EXPECT_EQ(result.mStatus, vpc::VPCStatusEnum::eDeleted);
}

TEST_F(DatabaseTest, GetAllVPCs)
{
    std::vector<vpc::VPCInfo> vpcs;

    ASSERT_TRUE(mDB.GetAllVPCs(vpcs).IsNone());
    EXPECT_TRUE(vpcs.empty());

    auto staging = CreateVPCInfo("staging", "10.2.0.0/16", "10.2.0.1");
    auto dev     = CreateVPCInfo("dev", "10.1.0.0/16", "10.1.0.1");

    ASSERT_TRUE(mDB.AddVPC(staging).IsNone());
    ASSERT_TRUE(mDB.AddVPC(dev).IsNone());

    ASSERT_TRUE(mDB.GetAllVPCs(vpcs).IsNone());
    EXPECT_THAT(vpcs, ElementsAre(dev, staging));
}

TEST_F(DatabaseTest, RemoveVPC)
{
    ASSERT_TRUE(mDB.AddVPC(CreateVPCInfo("prod", "10.0.0.0/16", "10.0.0.1")).IsNone());

    ASSERT_TRUE(mDB.RemoveVPC("prod").IsNone());
    EXPECT_TRUE(mDB.RemoveVPC("prod").Is(ErrorEnum::eNotFound));

    vpc::VPCInfo result;

    EXPECT_TRUE(mDB.GetVPC("prod", result).Is(ErrorEnum::eNotFound));
}

TEST_F(DatabaseTest, Peerings)
{
    auto devProd     = CreatePeeringInfo("dev", "prod");
    auto prodStaging = CreatePeeringInfo("prod", "staging");

    ASSERT_TRUE(mDB.AddPeering(prodStaging).IsNone());
    ASSERT_TRUE(mDB.AddPeering(devProd).IsNone());
    EXPECT_TRUE(mDB.AddPeering(devProd).Is(ErrorEnum::eAlreadyExist));

    peering::PeeringInfo result;

    ASSERT_TRUE(mDB.GetPeering("dev", "prod", result).IsNone());
    EXPECT_EQ(result, devProd);

    std::vector<peering::PeeringInfo> peerings;

    ASSERT_TRUE(mDB.GetAllPeerings(peerings).IsNone());
    EXPECT_THAT(peerings, ElementsAre(devProd, prodStaging));

    ASSERT_TRUE(mDB.RemovePeering("dev", "prod").IsNone());
    EXPECT_TRUE(mDB.RemovePeering("dev", "prod").Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(mDB.GetPeering("dev", "prod", result).Is(ErrorEnum::eNotFound));
}

TEST_F(DatabaseTest, StatePersistsAcrossSessions)
{
    auto prod = CreateVPCInfo("prod", "10.0.0.0/16", "10.0.0.1");

    ASSERT_TRUE(mDB.AddVPC(prod).IsNone());

    Database     other;
    vpc::VPCInfo result;

    ASSERT_TRUE(other.Init(mConfig).IsNone());
    ASSERT_TRUE(other.GetVPC("prod", result).IsNone());
    EXPECT_EQ(result, prod);
}

} // namespace vpcctl::database
