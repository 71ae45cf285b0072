/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_APP_VPCCORE_HPP_
#define VPCCTL_APP_VPCCORE_HPP_

#include <string>

#include <config/config.hpp>
#include <database/database.hpp>
#include <driver/networkdriver.hpp>
#include <firewall/firewallmanager.hpp>
#include <nat/natmanager.hpp>
#include <peering/peeringmanager.hpp>
#include <subnet/subnetmanager.hpp>
#include <vpc/vpcregistry.hpp>
#include <workload/workloadmanager.hpp>

#include "commandhandler.hpp"

namespace vpcctl::app {

/**
 * Control plane components.
 */
class VPCCore {
public:
    /**
     * Initializes control plane components.
     *
     * @param configFile config file path.
     */
    void Init(const std::string& configFile);

    /**
     * Returns parsed config.
     *
     * @return const config::Config&.
     */
    const config::Config& GetConfig() const { return mConfig; }

    /**
     * Returns command handler.
     *
     * @return CommandHandler&.
     */
    CommandHandler& GetCommandHandler() { return mCommandHandler; }

private:
    static constexpr auto cDefaultConfigFile = "/etc/vpcctl/vpcctl.cfg";

    void InitDatabase();
    void InitDriver();
    void InitManagers();

    config::Config            mConfig;
    database::Database        mDatabase;
    driver::NetworkDriver     mDriver;
    vpc::VPCRegistry          mVPCRegistry;
    subnet::SubnetManager     mSubnetManager;
    peering::PeeringManager   mPeeringManager;
    nat::NATManager           mNATManager;
    firewall::FirewallManager mFirewallManager;
    workload::WorkloadManager mWorkloadManager;
    CommandHandler            mCommandHandler;
};

} // namespace vpcctl::app

#endif
