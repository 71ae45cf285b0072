/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>

#include <driver/tests/mocks/networkdrivermock.hpp>
#include <driver/tests/stubs/networkdriverstub.hpp>
#include <peering/peeringmanager.hpp>
#include <subnet/subnetmanager.hpp>
#include <vpc/isolation.hpp>
#include <vpc/tests/stubs/storagestub.hpp>
#include <vpc/vpcregistry.hpp>

#include "mocks/storagemock.hpp"
#include "stubs/storagestub.hpp"

using namespace testing;

namespace vpcctl::peering::tests {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class PeeringManagerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        ASSERT_TRUE(mRegistry.Init(mVPCStorage, mDriver).IsNone());
        ASSERT_TRUE(mSubnetManager.Init(mRegistry, mDriver).IsNone());
        ASSERT_TRUE(mPeeringManager.Init(mStorage, mRegistry, mSubnetManager, mDriver).IsNone());

        mRegistry.Subscribe(mPeeringManager);

        ASSERT_TRUE(mRegistry.CreateVPC("alpha", "10.0.0.0/16", mReport).IsNone());
        ASSERT_TRUE(mRegistry.CreateVPC("beta", "10.1.0.0/16", mReport).IsNone());
        ASSERT_TRUE(mSubnetManager.AddSubnet("alpha", "public", "10.0.1.0/24", mReport).IsNone());
        ASSERT_TRUE(mSubnetManager.AddSubnet("beta", "private", "10.1.1.0/24", mReport).IsNone());

        mReport = {};
    }

    bool HasIsolation(const std::string& inBridge, const std::string& outBridge)
    {
        return mDriver.HasRule(driver::cHostNamespace, "filter", "FORWARD", vpc::IsolationRule(inBridge, outBridge))
            .mValue;
    }

    bool HasRoute(const std::string& ns, const std::string& destination)
    {
        const auto& routes = mDriver.GetNamespace(ns).mRoutes;

        return std::any_of(routes.begin(), routes.end(),
            [&destination](const Route& route) { return route.mDestination == destination; });
    }

    vpc::tests::StorageStub          mVPCStorage;
    StorageStub                      mStorage;
    driver::tests::NetworkDriverStub mDriver;
    vpc::VPCRegistry                 mRegistry;
    subnet::SubnetManager            mSubnetManager;
    PeeringManager                   mPeeringManager;
    common::utils::OperationReport   mReport;
    naming::PeeringLinkNames         mLinks = naming::PeeringLinks("beta", "alpha");
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(PeeringManagerTest, PeeringControlsReachability)
{
    IsolationResult result;

    ASSERT_TRUE(mPeeringManager.CheckIsolation("alpha", "beta", result).IsNone());

    EXPECT_EQ(result.mSourceNamespace, "ns-alpha-public");
    EXPECT_EQ(result.mSourceIP, "10.0.1.2");
    EXPECT_EQ(result.mTargetNamespace, "ns-beta-private");
    EXPECT_EQ(result.mTargetIP, "10.1.1.2");
    EXPECT_FALSE(result.mReachable);
    EXPECT_FALSE(result.mPeered);

    ASSERT_TRUE(mPeeringManager.CreatePeering("beta", "alpha", mReport).IsNone());

    EXPECT_TRUE(mReport.mWarnings.empty());
    EXPECT_EQ(mDriver.GetNamespace("ns-alpha-public").mRoutes.back(),
        (Route {"10.1.0.0/16", "10.1.0.1", "vnalphapub", true}));
    EXPECT_EQ(mDriver.GetNamespace("ns-beta-private").mRoutes.back(),
        (Route {"10.0.0.0/16", "10.0.0.1", "vnbetapri", true}));
    ASSERT_TRUE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_EQ(mDriver.GetLink(mLinks.mFirstLink).mMaster, "br-alpha");
    EXPECT_EQ(mDriver.GetLink(mLinks.mSecondLink).mMaster, "br-beta");

    result = {};

    ASSERT_TRUE(mPeeringManager.CheckIsolation("alpha", "beta", result).IsNone());

    EXPECT_TRUE(result.mReachable);
    EXPECT_TRUE(result.mPeered);
    EXPECT_TRUE(result.mPeeringWorking);

    ASSERT_TRUE(mPeeringManager.DeletePeering("alpha", "beta", mReport).IsNone());

    EXPECT_FALSE(HasRoute("ns-alpha-public", "10.1.0.0/16"));
    EXPECT_FALSE(HasRoute("ns-beta-private", "10.0.0.0/16"));
    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_FALSE(mDriver.HasLink(mLinks.mSecondLink));

    result = {};

    ASSERT_TRUE(mPeeringManager.CheckIsolation("alpha", "beta", result).IsNone());

    EXPECT_FALSE(result.mReachable);
    EXPECT_FALSE(result.mPeered);
}

TEST_F(PeeringManagerTest, CreatePeeringIsIdempotent)
{
    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());

    mReport = {};

    ASSERT_TRUE(mPeeringManager.CreatePeering("beta", "alpha", mReport).IsNone());

    EXPECT_TRUE(mReport.mSucceeded.empty());
    EXPECT_EQ(mReport.mSkipped.size(), 1);

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    ASSERT_EQ(peerings.size(), 1);

    EXPECT_EQ(peerings[0].mInfo.mVPC1, "alpha");
    EXPECT_EQ(peerings[0].mInfo.mVPC2, "beta");
    EXPECT_EQ(peerings[0].mInfo.mLink1, mLinks.mFirstLink);
    EXPECT_EQ(peerings[0].mStatus, PeeringStatusEnum::eActive);
}

TEST_F(PeeringManagerTest, CreatePeeringInvalidArguments)
{
    EXPECT_TRUE(mPeeringManager.CreatePeering("alpha", "alpha", mReport).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(mPeeringManager.CreatePeering("alpha", "gamma", mReport).Is(ErrorEnum::eNotFound));

    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
}

TEST_F(PeeringManagerTest, CreatePeeringLinkNameCollision)
{
    ASSERT_TRUE(mDriver.CreateBridge(mLinks.mSecondLink).IsNone());

    auto err = mPeeringManager.CreatePeering("alpha", "beta", mReport);

    EXPECT_TRUE(err.Is(ErrorEnum::eAlreadyExist));
    EXPECT_NE(std::string(err.Message()).find("name collision"), std::string::npos);
    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
}

TEST_F(PeeringManagerTest, CreatePeeringRollsBackLinksOnAttachFailure)
{
    mDriver.FailOn("SetMaster", ErrorEnum::eRuntime);

    EXPECT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).Is(ErrorEnum::eRuntime));

    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_FALSE(mDriver.HasLink(mLinks.mSecondLink));

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    EXPECT_TRUE(peerings.empty());
}

TEST_F(PeeringManagerTest, CreatePeeringFailsWhenNoRouteInstalled)
{
    mDriver.FailOn("AddNamespaceRoute", ErrorEnum::eRuntime);

    EXPECT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).Is(ErrorEnum::eFailed));

    EXPECT_EQ(mReport.mWarnings.size(), 2);
    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_FALSE(mDriver.HasLink(mLinks.mSecondLink));
    EXPECT_TRUE(HasIsolation("br-alpha", "br-beta"));
    EXPECT_TRUE(HasIsolation("br-beta", "br-alpha"));

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    EXPECT_TRUE(peerings.empty());

    IsolationResult result;

    ASSERT_TRUE(mPeeringManager.CheckIsolation("alpha", "beta", result).IsNone());

    EXPECT_FALSE(result.mReachable);
    EXPECT_FALSE(result.mPeered);
}

TEST_F(PeeringManagerTest, PartialRouteFailureIsWarning)
{
    mDriver.FailOn("AddNamespaceRoute", ErrorEnum::eRuntime, "ns-beta-private");

    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());

    ASSERT_EQ(mReport.mWarnings.size(), 1);
    EXPECT_NE(mReport.mWarnings[0].find("ns-beta-private"), std::string::npos) << mReport.mWarnings[0];
    EXPECT_TRUE(HasRoute("ns-alpha-public", "10.1.0.0/16"));

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    EXPECT_EQ(peerings.size(), 1);
}

TEST_F(PeeringManagerTest, HostForwardingDoesNotBypassIsolation)
{
    ASSERT_TRUE(mDriver.IsHostForwardingEnabled());

    EXPECT_TRUE(HasIsolation("br-alpha", "br-beta"));
    EXPECT_TRUE(HasIsolation("br-beta", "br-alpha"));
    EXPECT_FALSE(mDriver.Ping("ns-alpha-public", "10.1.1.2"));
    EXPECT_FALSE(mDriver.Ping("ns-beta-private", "10.0.1.2"));

    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());

    EXPECT_FALSE(HasIsolation("br-alpha", "br-beta"));
    EXPECT_FALSE(HasIsolation("br-beta", "br-alpha"));
    EXPECT_TRUE(mDriver.Ping("ns-alpha-public", "10.1.1.2"));

    ASSERT_TRUE(mPeeringManager.DeletePeering("beta", "alpha", mReport).IsNone());

    EXPECT_TRUE(HasIsolation("br-alpha", "br-beta"));
    EXPECT_TRUE(HasIsolation("br-beta", "br-alpha"));
    EXPECT_FALSE(mDriver.Ping("ns-alpha-public", "10.1.1.2"));
}

TEST_F(PeeringManagerTest, CreatePeeringRollsBackOnDriverFailure)
{
    StrictMock<driver::tests::MockNetworkDriver> driver;
    PeeringManager                               peeringManager;

    ASSERT_TRUE(peeringManager.Init(mStorage, mRegistry, mSubnetManager, driver).IsNone());

    RetWithError<LinkState> absent {LinkState(LinkStateEnum::eAbsent)};

    InSequence sequence;

    EXPECT_CALL(driver, GetLinkState(mLinks.mFirstLink)).WillOnce(Return(absent));
    EXPECT_CALL(driver, GetLinkState(mLinks.mSecondLink)).WillOnce(Return(absent));
    EXPECT_CALL(driver, CreateVethPair(mLinks.mFirstLink, mLinks.mSecondLink))
        .WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(driver, SetMaster(mLinks.mFirstLink, "br-alpha")).WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(driver, SetMaster(mLinks.mSecondLink, "br-beta"))
        .WillOnce(Return(Error(ErrorEnum::eRuntime, "no such device")));
    EXPECT_CALL(driver, DeleteLink(mLinks.mFirstLink)).WillOnce(Return(ErrorEnum::eNone));

    EXPECT_TRUE(peeringManager.CreatePeering("alpha", "beta", mReport).Is(ErrorEnum::eRuntime));

    PeeringInfo peering;

    EXPECT_TRUE(mStorage.GetPeering("alpha", "beta", peering).Is(ErrorEnum::eNotFound));
}

TEST_F(PeeringManagerTest, ListPeeringsReportsBrokenLinks)
{
    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());

    mDriver.RemoveLinkOutOfBand(mLinks.mFirstLink);

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    ASSERT_EQ(peerings.size(), 1);
    EXPECT_EQ(peerings[0].mStatus, PeeringStatusEnum::eBroken);

    ASSERT_TRUE(mPeeringManager.DeletePeering("alpha", "beta", mReport).IsNone());
    EXPECT_FALSE(mDriver.HasLink(mLinks.mSecondLink));

    EXPECT_TRUE(mPeeringManager.DeletePeering("alpha", "beta", mReport).Is(ErrorEnum::eNotFound));
}

TEST_F(PeeringManagerTest, CheckIsolationWithoutSubnets)
{
    ASSERT_TRUE(mRegistry.CreateVPC("gamma", "10.2.0.0/16", mReport).IsNone());

    IsolationResult result;

    EXPECT_TRUE(mPeeringManager.CheckIsolation("alpha", "gamma", result).Is(ErrorEnum::eWrongState));
    EXPECT_TRUE(mPeeringManager.CheckIsolation("alpha", "delta", result).Is(ErrorEnum::eNotFound));
}

TEST_F(PeeringManagerTest, DeleteVPCRemovesItsPeerings)
{
    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());
    ASSERT_TRUE(mRegistry.DeleteVPC("beta", mReport).IsNone());

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());

    EXPECT_TRUE(peerings.empty());
    EXPECT_FALSE(HasRoute("ns-alpha-public", "10.1.0.0/16"));
    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_TRUE(mDriver.GetRules(driver::cHostNamespace, "filter", "FORWARD").empty());
}

TEST_F(PeeringManagerTest, DeleteAllPeerings)
{
    ASSERT_TRUE(mRegistry.CreateVPC("gamma", "10.2.0.0/16", mReport).IsNone());
    ASSERT_TRUE(mSubnetManager.AddSubnet("gamma", "public", "10.2.1.0/24", mReport).IsNone());
    ASSERT_TRUE(mPeeringManager.CreatePeering("alpha", "beta", mReport).IsNone());
    ASSERT_TRUE(mPeeringManager.CreatePeering("gamma", "alpha", mReport).IsNone());

    auto gammaLinks = naming::PeeringLinks("alpha", "gamma");

    mDriver.FailOn("DeleteLink", Error(ErrorEnum::eRuntime, "device busy"));
    mReport = {};

    EXPECT_TRUE(mPeeringManager.DeleteAllPeerings(mReport).Is(ErrorEnum::eRuntime));
    EXPECT_EQ(mReport.mWarnings.size(), 2);

    std::vector<PeeringSummary> peerings;

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    EXPECT_EQ(peerings.size(), 2);

    mDriver.FailOn("DeleteLink", ErrorEnum::eNone);
    mReport = {};

    ASSERT_TRUE(mPeeringManager.DeleteAllPeerings(mReport).IsNone());
    EXPECT_TRUE(mReport.mWarnings.empty());

    peerings.clear();

    ASSERT_TRUE(mPeeringManager.ListPeerings(peerings).IsNone());
    EXPECT_TRUE(peerings.empty());
    EXPECT_FALSE(mDriver.HasLink(mLinks.mFirstLink));
    EXPECT_FALSE(mDriver.HasLink(gammaLinks.mFirstLink));
    EXPECT_FALSE(HasRoute("ns-alpha-public", "10.1.0.0/16"));
    EXPECT_FALSE(HasRoute("ns-alpha-public", "10.2.0.0/16"));
    EXPECT_TRUE(HasIsolation("br-alpha", "br-beta"));
    EXPECT_TRUE(HasIsolation("br-gamma", "br-alpha"));

    mReport = {};

    ASSERT_TRUE(mPeeringManager.DeleteAllPeerings(mReport).IsNone());
    EXPECT_EQ(mReport.mSkipped, std::vector<std::string>({"no peerings"}));
}

TEST_F(PeeringManagerTest, StorageErrorIsPropagated)
{
    MockStorage    storage;
    PeeringManager peeringManager;

    ASSERT_TRUE(peeringManager.Init(storage, mRegistry, mSubnetManager, mDriver).IsNone());

    EXPECT_CALL(storage, GetPeering("alpha", "beta", _)).WillOnce(Return(ErrorEnum::eFailed));
    EXPECT_CALL(storage, AddPeering(_)).Times(0);

    EXPECT_TRUE(peeringManager.CreatePeering("alpha", "beta", mReport).Is(ErrorEnum::eFailed));
}

} // namespace vpcctl::peering::tests
