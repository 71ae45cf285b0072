/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/exception.hpp>

#include "vpccore.hpp"

namespace vpcctl::app {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void VPCCore::Init(const std::string& configFile)
{
    const auto& path = configFile.empty() ? cDefaultConfigFile : configFile;

    auto err = config::ParseConfig(path, mConfig);
    if (err.Is(ErrorEnum::eNotFound)) {
        LOG_DBG() << "Config file not found, use defaults" << Log::Field("path", path.c_str());
    } else {
        VPCCTL_ERROR_CHECK_AND_THROW(err, "can't parse config");
    }

    InitDatabase();
    InitDriver();
    InitManagers();
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void VPCCore::InitDatabase()
{
    auto err = mDatabase.Init(mConfig.mDatabase);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize database");
}

void VPCCore::InitDriver()
{
    auto err = mDriver.Init(mConfig.mDriver);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize network driver");
}

void VPCCore::InitManagers()
{
    auto err = mVPCRegistry.Init(mDatabase, mDriver);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize VPC registry");

    err = mSubnetManager.Init(mVPCRegistry, mDriver);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize subnet manager");

    err = mPeeringManager.Init(mDatabase, mVPCRegistry, mSubnetManager, mDriver);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize peering manager");

    err = mNATManager.Init(mVPCRegistry, mSubnetManager, mDriver, mConfig.mProbe.mExternalAddress);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize NAT manager");

    err = mFirewallManager.Init(mVPCRegistry, mSubnetManager, mDriver, mConfig.mProbe.mPorts);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize firewall manager");

    err = mWorkloadManager.Init(mConfig.mWorkload.mRootDir, mSubnetManager, mDriver);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize workload manager");

    // Peering teardown needs VPC namespaces, so it is notified first.
    mVPCRegistry.Subscribe(mPeeringManager);
    mVPCRegistry.Subscribe(mNATManager);

    err = mCommandHandler.Init(
        mVPCRegistry, mSubnetManager, mPeeringManager, mNATManager, mFirewallManager, mWorkloadManager);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize command handler");
}

} // namespace vpcctl::app
