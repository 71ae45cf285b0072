/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_APP_COMMANDHANDLER_HPP_
#define VPCCTL_APP_COMMANDHANDLER_HPP_

#include <ostream>
#include <string>
#include <vector>

#include <common/utils/report.hpp>
#include <firewall/firewallmanager.hpp>
#include <nat/natmanager.hpp>
#include <peering/peeringmanager.hpp>
#include <subnet/subnetmanager.hpp>
#include <vpc/vpcregistry.hpp>
#include <workload/workloadmanager.hpp>

namespace vpcctl::app {

/**
 * Dispatches command line commands to control plane components.
 */
class CommandHandler {
public:
    /**
     * Initializes command handler.
     *
     * @param vpcRegistry VPC registry.
     * @param subnetManager subnet manager.
     * @param peeringManager peering manager.
     * @param natManager NAT manager.
     * @param firewallManager firewall manager.
     * @param workloadManager workload manager.
     * @return Error.
     */
    Error Init(vpc::VPCRegistry& vpcRegistry, subnet::SubnetManager& subnetManager,
        peering::PeeringManager& peeringManager, nat::NATManager& natManager,
        firewall::FirewallManager& firewallManager, workload::WorkloadManager& workloadManager);

    /**
     * Executes command.
     *
     * @param args command name followed by its arguments.
     * @param out output stream for command results.
     * @return Error.
     */
    Error Execute(const std::vector<std::string>& args, std::ostream& out);

    /**
     * Checks if command changes host state.
     *
     * @param command command name.
     * @return bool.
     */
    static bool IsMutating(const std::string& command);

    /**
     * Prints supported commands.
     *
     * @param out output stream.
     */
    static void PrintCommands(std::ostream& out);

private:
    using Args    = std::vector<std::string>;
    using Handler = Error (CommandHandler::*)(const Args& args, std::ostream& out);

    struct Command {
        const char* mName;
        const char* mArgs;
        size_t      mArgCount;
        bool        mMutating;
        Handler     mHandler;
    };

    static const std::vector<Command>& GetCommands();
    static const Command*              FindCommand(const std::string& name);
    static void                        PrintReport(const common::utils::OperationReport& report, std::ostream& out);

    Error CreateVPC(const Args& args, std::ostream& out);
    Error DeleteVPC(const Args& args, std::ostream& out);
    Error ListVPCs(const Args& args, std::ostream& out);
    Error AddSubnet(const Args& args, std::ostream& out);
    Error DeleteSubnet(const Args& args, std::ostream& out);
    Error ListSubnets(const Args& args, std::ostream& out);
    Error VerifySubnets(const Args& args, std::ostream& out);
    Error CreatePeering(const Args& args, std::ostream& out);
    Error DeletePeering(const Args& args, std::ostream& out);
    Error DeleteAllPeerings(const Args& args, std::ostream& out);
    Error ListPeerings(const Args& args, std::ostream& out);
    Error TestIsolation(const Args& args, std::ostream& out);
    Error EnableNAT(const Args& args, std::ostream& out);
    Error DisableNAT(const Args& args, std::ostream& out);
    Error ResetNAT(const Args& args, std::ostream& out);
    Error ListNATRules(const Args& args, std::ostream& out);
    Error TestConnectivity(const Args& args, std::ostream& out);
    Error VerifyNAT(const Args& args, std::ostream& out);
    Error DiagnoseNAT(const Args& args, std::ostream& out);
    Error ApplyFirewall(const Args& args, std::ostream& out);
    Error TestFirewall(const Args& args, std::ostream& out);
    Error CleanupFirewall(const Args& args, std::ostream& out);
    Error DeployApp(const Args& args, std::ostream& out);
    Error DescribeApp(const Args& args, std::ostream& out);

    vpc::VPCRegistry*          mVPCRegistry {};
    subnet::SubnetManager*     mSubnetManager {};
    peering::PeeringManager*   mPeeringManager {};
    nat::NATManager*           mNATManager {};
    firewall::FirewallManager* mFirewallManager {};
    workload::WorkloadManager* mWorkloadManager {};
};

} // namespace vpcctl::app

#endif
