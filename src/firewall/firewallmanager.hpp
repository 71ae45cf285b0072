/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_FIREWALL_FIREWALLMANAGER_HPP_
#define VPCCTL_FIREWALL_FIREWALLMANAGER_HPP_

#include <mutex>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>
#include <subnet/itf/subnetprovider.hpp>
#include <vpc/itf/vpcprovider.hpp>

#include "ruleset.hpp"

namespace vpcctl::firewall {

/**
 * Probe of a subnet port from the host.
 */
struct FirewallProbe {
    std::string mNamespace;
    std::string mAddress;
    Protocol    mProtocol;
    uint16_t    mPort {};
    PortState   mState;
};

/**
 * Firewall manager.
 */
class FirewallManager {
public:
    /**
     * Initializes firewall manager.
     *
     * @param vpcProvider VPC provider.
     * @param subnetProvider subnet provider.
     * @param driver network driver.
     * @param probePorts TCP ports probed by TestFirewall.
     * @return Error.
     */
    Error Init(vpc::VPCProviderItf& vpcProvider, subnet::SubnetProviderItf& subnetProvider,
        driver::NetworkDriverItf& driver, const std::vector<uint16_t>& probePorts);

    /**
     * Replaces packet filter of every declared subnet with the baseline policy followed by its ingress rules.
     *
     * Rules are appended in declaration order. Subnets without a matching namespace are skipped with a warning.
     *
     * @param vpcName VPC name.
     * @param ruleSet rule set.
     * @param[out] report operation report.
     * @return Error.
     */
    Error ApplyFirewall(const std::string& vpcName, const RuleSet& ruleSet, common::utils::OperationReport& report);

    /**
     * Loads rule set file and applies it.
     *
     * @param vpcName VPC name.
     * @param path rule set file.
     * @param[out] report operation report.
     * @return Error.
     */
    Error ApplyFirewall(const std::string& vpcName, const std::string& path, common::utils::OperationReport& report);

    /**
     * Probes configured TCP ports and ICMP of every VPC subnet from the host.
     *
     * @param vpcName VPC name.
     * @param[out] probes probe results.
     * @return Error.
     */
    Error TestFirewall(const std::string& vpcName, std::vector<FirewallProbe>& probes);

    /**
     * Resets packet filter of every VPC subnet to accept all.
     *
     * @param vpcName VPC name.
     * @param[out] report operation report.
     * @return Error.
     */
    Error CleanupFirewall(const std::string& vpcName, common::utils::OperationReport& report);

private:
    struct Subnet {
        std::string mNamespace;
        std::string mAddress;
    };

    Error GetSubnets(const std::string& vpcName, std::vector<Subnet>& subnets);
    Error ApplyRules(const std::string& ns, const std::vector<IngressRule>& rules);
    Error ResetRules(const std::string& ns);

    vpc::VPCProviderItf*       mVPCProvider {};
    subnet::SubnetProviderItf* mSubnetProvider {};
    driver::NetworkDriverItf*  mDriver {};
    std::vector<uint16_t>      mProbePorts;
    std::mutex                 mMutex;
};

} // namespace vpcctl::firewall

#endif
