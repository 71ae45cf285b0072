/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>

#include <driver/tests/stubs/networkdriverstub.hpp>
#include <subnet/subnetmanager.hpp>
#include <vpc/tests/stubs/storagestub.hpp>
#include <vpc/vpcregistry.hpp>

using namespace testing;

namespace vpcctl::subnet::tests {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class SubnetManagerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        ASSERT_TRUE(mRegistry.Init(mStorage, mDriver).IsNone());
        ASSERT_TRUE(mSubnetManager.Init(mRegistry, mDriver).IsNone());

        ASSERT_TRUE(mRegistry.CreateVPC("prod", "10.0.0.0/16", mReport).IsNone());
    }

    vpc::tests::StorageStub          mStorage;
    driver::tests::NetworkDriverStub mDriver;
    vpc::VPCRegistry                 mRegistry;
    SubnetManager                    mSubnetManager;
    common::utils::OperationReport   mReport;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(SubnetManagerTest, AddPublicSubnet)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).IsNone());

    ASSERT_TRUE(mDriver.HasNamespace("ns-prod-public"));

    const auto& ns = mDriver.GetNamespace("ns-prod-public");

    ASSERT_EQ(ns.mLinks.count("vnprodpub"), 1);
    EXPECT_TRUE(ns.mLinks.at("vnprodpub").mUp);
    EXPECT_TRUE(ns.mLinks.at("lo").mUp);
    EXPECT_EQ(ns.mLinks.at("vnprodpub").mAddresses, std::vector<std::string>({"10.0.1.2/24"}));
    EXPECT_EQ(ns.mRoutes, std::vector<Route>({Route {"default", "10.0.1.1", "vnprodpub", false}}));
    EXPECT_TRUE(ns.mForwarding);

    ASSERT_TRUE(mDriver.HasLink("vhprodpub"));
    EXPECT_EQ(mDriver.GetLink("vhprodpub").mMaster, "br-prod");
    EXPECT_TRUE(mDriver.GetLink("vhprodpub").mUp);
    EXPECT_EQ(mDriver.GetLink("br-prod").mAddresses, std::vector<std::string>({"10.0.0.1/16", "10.0.1.1/24"}));
}

TEST_F(SubnetManagerTest, AddPrivateSubnetKeepsForwardingDisabled)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "private", "10.0.2.0/24", mReport).IsNone());

    ASSERT_TRUE(mDriver.HasNamespace("ns-prod-private"));
    EXPECT_FALSE(mDriver.GetNamespace("ns-prod-private").mForwarding);
}

TEST_F(SubnetManagerTest, AddSubnetSharingVPCGateway)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.0.0/24", mReport).IsNone());

    EXPECT_EQ(mDriver.GetLink("br-prod").mAddresses, std::vector<std::string>({"10.0.0.1/16"}));

    mReport = {};

    ASSERT_TRUE(mSubnetManager.DeleteSubnet("prod", "public", mReport).IsNone());

    EXPECT_EQ(mDriver.GetLink("br-prod").mAddresses, std::vector<std::string>({"10.0.0.1/16"}));
    EXPECT_EQ(mReport.mSkipped.size(), 1);
}

TEST_F(SubnetManagerTest, AddSubnetInvalidArguments)
{
    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "dmz", "10.0.1.0/24", mReport).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.5/24", mReport).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.1.1.0/24", mReport).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(mSubnetManager.AddSubnet("dev", "public", "10.0.1.0/24", mReport).Is(ErrorEnum::eNotFound));

    EXPECT_FALSE(mDriver.HasNamespace("ns-prod-public"));
}

TEST_F(SubnetManagerTest, AddSubnetTwice)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).IsNone());
    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.3.0/24", mReport).Is(ErrorEnum::eAlreadyExist));
    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "private", "10.0.1.0/24", mReport).Is(ErrorEnum::eAlreadyExist));
}

TEST_F(SubnetManagerTest, AddSubnetLinkNameCollision)
{
    ASSERT_TRUE(mDriver.CreateBridge("vhprodpub").IsNone());

    auto err = mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport);

    EXPECT_TRUE(err.Is(ErrorEnum::eAlreadyExist));
    EXPECT_NE(std::string(err.Message()).find("name collision"), std::string::npos);
    EXPECT_FALSE(mDriver.HasNamespace("ns-prod-public"));
}

TEST_F(SubnetManagerTest, AddSubnetStepFailureKeepsCompletedSteps)
{
    mDriver.FailOn("SetMaster", ErrorEnum::eRuntime);

    mReport = {};

    EXPECT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).Is(ErrorEnum::eRuntime));

    EXPECT_TRUE(mDriver.HasNamespace("ns-prod-public"));
    EXPECT_TRUE(mDriver.HasLink("vhprodpub"));
    EXPECT_TRUE(mReport.mSucceeded.empty());

    mDriver.FailOn("SetMaster", ErrorEnum::eNone);

    ASSERT_TRUE(mSubnetManager.DeleteSubnet("prod", "public", mReport).IsNone());

    EXPECT_FALSE(mDriver.HasNamespace("ns-prod-public"));
    EXPECT_FALSE(mDriver.HasLink("vhprodpub"));
}

TEST_F(SubnetManagerTest, DeleteSubnet)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).IsNone());

    mReport = {};

    ASSERT_TRUE(mSubnetManager.DeleteSubnet("prod", "public", mReport).IsNone());

    EXPECT_FALSE(mDriver.HasNamespace("ns-prod-public"));
    EXPECT_FALSE(mDriver.HasLink("vhprodpub"));
    EXPECT_EQ(mDriver.GetLink("br-prod").mAddresses, std::vector<std::string>({"10.0.0.1/16"}));
    EXPECT_TRUE(mReport.mWarnings.empty());

    EXPECT_TRUE(mSubnetManager.DeleteSubnet("prod", "public", mReport).Is(ErrorEnum::eNotFound));
}

TEST_F(SubnetManagerTest, ListSubnets)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).IsNone());
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "private", "10.0.2.0/24", mReport).IsNone());
    ASSERT_TRUE(mDriver.CreateNamespace("unrelated").IsNone());

    std::vector<SubnetInfo> subnets;

    ASSERT_TRUE(mSubnetManager.ListSubnets(subnets).IsNone());
    ASSERT_EQ(subnets.size(), 2);

    EXPECT_EQ(subnets[0].mNamespace, "ns-prod-private");
    EXPECT_EQ(subnets[0].mType, SubnetTypeEnum::ePrivate);
    EXPECT_EQ(subnets[0].mCIDR, "10.0.2.0/24");
    EXPECT_EQ(subnets[0].mGateway, "10.0.2.1");

    EXPECT_EQ(subnets[1].mNamespace, "ns-prod-public");
    EXPECT_EQ(subnets[1].mAddress, "10.0.1.2/24");
    EXPECT_EQ(subnets[1].mRoutes, std::vector<std::string>({"default via 10.0.1.1 dev vnprodpub"}));
}

TEST_F(SubnetManagerTest, GetSubnet)
{
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "private", "10.0.2.0/24", mReport).IsNone());

    SubnetInfo subnet;

    ASSERT_TRUE(mSubnetManager.GetSubnet("prod", SubnetTypeEnum::ePrivate, subnet).IsNone());

    EXPECT_EQ(subnet.mHostLink, "vhprodpri");
    EXPECT_EQ(subnet.mNamespaceLink, "vnprodpri");
    EXPECT_EQ(mSubnetManager.GetNamespaceAddress("ns-prod-private"), "10.0.2.2/24");
    EXPECT_EQ(mSubnetManager.GetNamespaceAddress("ns-prod-public"), "");

    EXPECT_TRUE(mSubnetManager.GetSubnet("prod", SubnetTypeEnum::ePublic, subnet).Is(ErrorEnum::eNotFound));
}

TEST_F(SubnetManagerTest, VerifySubnetConnectivity)
{
    std::vector<ReachabilityCheck> checks;

    EXPECT_TRUE(mSubnetManager.VerifySubnetConnectivity("prod", checks).Is(ErrorEnum::eWrongState));
    EXPECT_TRUE(mSubnetManager.VerifySubnetConnectivity("dev", checks).Is(ErrorEnum::eNotFound));

    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "public", "10.0.1.0/24", mReport).IsNone());
    ASSERT_TRUE(mSubnetManager.AddSubnet("prod", "private", "10.0.2.0/24", mReport).IsNone());

    ASSERT_TRUE(mSubnetManager.VerifySubnetConnectivity("prod", checks).IsNone());
    ASSERT_EQ(checks.size(), 4);

    for (const auto& check : checks) {
        EXPECT_TRUE(check.mReachable) << check.mSource << " -> " << check.mTarget;
    }

    EXPECT_EQ(checks[1].mSource, "ns-prod-private");
    EXPECT_EQ(checks[1].mTarget, "ns-prod-public");
    EXPECT_EQ(checks[1].mAddress, "10.0.1.2");
}

} // namespace vpcctl::subnet::tests
