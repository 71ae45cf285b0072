/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <sstream>

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>

#include <app/commandhandler.hpp>
#include <driver/tests/stubs/networkdriverstub.hpp>
#include <peering/tests/stubs/storagestub.hpp>
#include <vpc/tests/stubs/storagestub.hpp>

using namespace testing;

namespace vpcctl::app {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class CommandHandlerTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        std::filesystem::remove_all(cRootDir);

        ASSERT_TRUE(mRegistry.Init(mVPCStorage, mDriver).IsNone());
        ASSERT_TRUE(mSubnetManager.Init(mRegistry, mDriver).IsNone());
        ASSERT_TRUE(mPeeringManager.Init(mPeeringStorage, mRegistry, mSubnetManager, mDriver).IsNone());
        ASSERT_TRUE(mNATManager.Init(mRegistry, mSubnetManager, mDriver, "8.8.8.8").IsNone());
        ASSERT_TRUE(mFirewallManager.Init(mRegistry, mSubnetManager, mDriver, {80, 8080}).IsNone());
        ASSERT_TRUE(mWorkloadManager.Init(cRootDir, mSubnetManager, mDriver).IsNone());

        mRegistry.Subscribe(mPeeringManager);
        mRegistry.Subscribe(mNATManager);

        ASSERT_TRUE(mHandler
                        .Init(mRegistry, mSubnetManager, mPeeringManager, mNATManager, mFirewallManager,
                            mWorkloadManager)
                        .IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cRootDir); }

    Error Run(const std::vector<std::string>& args)
    {
        mOutput.str("");

        return mHandler.Execute(args, mOutput);
    }

    std::string Output() const { return mOutput.str(); }

    static constexpr auto cRootDir = "vpcctl_commandhandler_test";

    vpc::tests::StorageStub          mVPCStorage;
    peering::tests::StorageStub      mPeeringStorage;
    driver::tests::NetworkDriverStub mDriver;
    vpc::VPCRegistry                 mRegistry;
    subnet::SubnetManager            mSubnetManager;
    peering::PeeringManager          mPeeringManager;
    nat::NATManager                  mNATManager;
    firewall::FirewallManager        mFirewallManager;
    workload::WorkloadManager        mWorkloadManager;
    CommandHandler                   mHandler;
    std::ostringstream               mOutput;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(CommandHandlerTest, CommandValidation)
{
    EXPECT_TRUE(Run({}).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(Run({"bogus"}).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(Run({"create-vpc", "prod"}).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(Run({"list-vpcs", "extra"}).Is(ErrorEnum::eInvalidArgument));

    EXPECT_TRUE(CommandHandler::IsMutating("create-vpc"));
    EXPECT_TRUE(CommandHandler::IsMutating("apply-firewall"));
    EXPECT_FALSE(CommandHandler::IsMutating("list-peerings"));
    EXPECT_FALSE(CommandHandler::IsMutating("test-isolation"));
    EXPECT_TRUE(CommandHandler::IsMutating("reset-nat"));
    EXPECT_TRUE(CommandHandler::IsMutating("delete-all-peerings"));
    EXPECT_FALSE(CommandHandler::IsMutating("list-nat-rules"));
    EXPECT_FALSE(CommandHandler::IsMutating("bogus"));

    std::ostringstream commands;

    CommandHandler::PrintCommands(commands);

    EXPECT_THAT(commands.str(), HasSubstr("add-subnet <vpc> <public|private> <cidr>"));
    EXPECT_THAT(commands.str(), HasSubstr("deploy-app <vpc> <public|private> <nginx|python>"));
}

TEST_F(CommandHandlerTest, VPCLifecycle)
{
    ASSERT_TRUE(Run({"list-vpcs"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("No VPCs"));

    ASSERT_TRUE(Run({"create-vpc", "prod", "10.0.0.0/16"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("VPC prod created with CIDR 10.0.0.0/16"));

    EXPECT_TRUE(Run({"create-vpc", "prod", "10.0.0.0/16"}).Is(ErrorEnum::eAlreadyExist));

    ASSERT_TRUE(Run({"list-vpcs"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("br-prod"));
    EXPECT_THAT(Output(), HasSubstr("10.0.0.1"));
    EXPECT_THAT(Output(), HasSubstr("active"));

    ASSERT_TRUE(Run({"add-subnet", "prod", "public", "10.0.1.0/24"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("public subnet 10.0.1.0/24 added to VPC prod"));

    ASSERT_TRUE(Run({"list-subnets"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("ns-prod-public"));
    EXPECT_THAT(Output(), HasSubstr("10.0.1.2/24"));

    ASSERT_TRUE(Run({"delete-vpc", "prod"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("VPC prod deleted"));

    ASSERT_TRUE(Run({"list-vpcs"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("No VPCs"));

    EXPECT_TRUE(Run({"delete-vpc", "prod"}).Is(ErrorEnum::eNotFound));
}

TEST_F(CommandHandlerTest, PeeringAndNAT)
{
    ASSERT_TRUE(Run({"create-vpc", "prod", "10.0.0.0/16"}).IsNone());
    ASSERT_TRUE(Run({"create-vpc", "dev", "10.1.0.0/16"}).IsNone());
    ASSERT_TRUE(Run({"add-subnet", "prod", "public", "10.0.1.0/24"}).IsNone());
    ASSERT_TRUE(Run({"add-subnet", "dev", "private", "10.1.1.0/24"}).IsNone());

    ASSERT_TRUE(Run({"test-isolation", "prod", "dev"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("Result: isolated"));
    EXPECT_THAT(Output(), HasSubstr("create-peering prod dev"));

    ASSERT_TRUE(Run({"create-peering", "prod", "dev"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("Peering prod <-> dev established"));

    ASSERT_TRUE(Run({"list-peerings"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("active"));

    ASSERT_TRUE(Run({"test-isolation", "prod", "dev"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("Result: peering working"));

    EXPECT_TRUE(Run({"enable-nat", "dev"}).Is(ErrorEnum::eWrongState));

    ASSERT_TRUE(Run({"enable-nat", "prod"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("NAT enabled for VPC prod"));

    ASSERT_TRUE(Run({"test-connectivity", "prod"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("ns-prod-public (public): external ok, gateway ok: PASS"));

    ASSERT_TRUE(Run({"diagnose-nat", "prod"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("No issues found"));

    ASSERT_TRUE(Run({"delete-peering", "dev", "prod"}).IsNone());

    ASSERT_TRUE(Run({"list-peerings"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("No peerings"));
}

TEST_F(CommandHandlerTest, HostRuleMaintenance)
{
    ASSERT_TRUE(Run({"create-vpc", "prod", "10.0.0.0/16"}).IsNone());
    ASSERT_TRUE(Run({"create-vpc", "dev", "10.1.0.0/16"}).IsNone());
    ASSERT_TRUE(Run({"add-subnet", "prod", "public", "10.0.1.0/24"}).IsNone());
    ASSERT_TRUE(Run({"add-subnet", "dev", "private", "10.1.1.0/24"}).IsNone());

    ASSERT_TRUE(Run({"list-nat-rules"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("POSTROUTING rules: none"));
    EXPECT_THAT(Output(), HasSubstr("-A FORWARD -i br-prod -o br-dev -j DROP"));

    ASSERT_TRUE(Run({"reset-nat", "prod"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("NAT reset for VPC prod"));

    ASSERT_TRUE(Run({"list-nat-rules"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("Host forwarding: enabled"));
    EXPECT_THAT(Output(), HasSubstr("-A POSTROUTING -s 10.0.1.0/24 -o eth0 -j MASQUERADE"));

    EXPECT_TRUE(Run({"reset-nat", "dev"}).Is(ErrorEnum::eWrongState));

    ASSERT_TRUE(Run({"create-peering", "prod", "dev"}).IsNone());
    ASSERT_TRUE(Run({"delete-all-peerings"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("All peerings deleted"));

    ASSERT_TRUE(Run({"list-peerings"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("No peerings"));

    ASSERT_TRUE(Run({"delete-all-peerings"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("skipped: no peerings"));
}

TEST_F(CommandHandlerTest, Workloads)
{
    ASSERT_TRUE(Run({"create-vpc", "prod", "10.0.0.0/16"}).IsNone());
    ASSERT_TRUE(Run({"add-subnet", "prod", "public", "10.0.1.0/24"}).IsNone());

    EXPECT_TRUE(Run({"deploy-app", "prod", "public", "tomcat"}).Is(ErrorEnum::eInvalidArgument));

    ASSERT_TRUE(Run({"deploy-app", "prod", "public", "python"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("http://10.0.1.2:8080"));

    ASSERT_TRUE(Run({"describe-app", "prod", "public"}).IsNone());
    EXPECT_THAT(Output(), HasSubstr("port 8080: open"));
    EXPECT_THAT(Output(), HasSubstr("port 80: closed"));
}

} // namespace vpcctl::app
