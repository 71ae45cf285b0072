/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_SUBNET_SUBNETMANAGER_HPP_
#define VPCCTL_SUBNET_SUBNETMANAGER_HPP_

#include <mutex>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>
#include <naming/naming.hpp>
#include <vpc/itf/vpcprovider.hpp>

#include "itf/subnetprovider.hpp"

namespace vpcctl::subnet {

/**
 * Reachability check result.
 */
struct ReachabilityCheck {
    std::string mSource;
    std::string mTarget;
    std::string mAddress;
    bool        mReachable {};
};

/**
 * Subnet manager.
 */
class SubnetManager : public SubnetProviderItf {
public:
    /**
     * Initializes subnet manager.
     *
     * @param vpcProvider VPC provider.
     * @param driver network driver.
     * @return Error.
     */
    Error Init(vpc::VPCProviderItf& vpcProvider, driver::NetworkDriverItf& driver);

    /**
     * Adds subnet to VPC.
     *
     * The subnet namespace is connected to the VPC bridge, gets the .2 address and the default route via the .1
     * gateway. Steps run forward-only: on failure completed steps are kept for explicit cleanup.
     *
     * @param vpcName VPC name.
     * @param type subnet type: public or private.
     * @param cidr subnet CIDR inside VPC CIDR.
     * @param[out] report operation report.
     * @return Error.
     */
    Error AddSubnet(const std::string& vpcName, const std::string& type, const std::string& cidr,
        common::utils::OperationReport& report);

    /**
     * Deletes subnet including partially created one.
     *
     * @param vpcName VPC name.
     * @param type subnet type: public or private.
     * @param[out] report operation report.
     * @return Error eNotFound if neither namespace nor host link exist.
     */
    Error DeleteSubnet(const std::string& vpcName, const std::string& type, common::utils::OperationReport& report);

    /**
     * Lists all subnets.
     *
     * @param[out] subnets subnets.
     * @return Error.
     */
    Error ListSubnets(std::vector<SubnetInfo>& subnets);

    /**
     * Pings gateways and peer subnets from every subnet of VPC.
     *
     * @param vpcName VPC name.
     * @param[out] checks check results.
     * @return Error.
     */
    Error VerifySubnetConnectivity(const std::string& vpcName, std::vector<ReachabilityCheck>& checks);

    Error       GetVPCNamespaces(const std::string& vpcName, std::vector<std::string>& namespaces) override;
    std::string GetNamespaceAddress(const std::string& ns) override;
    Error       GetSubnet(const std::string& vpcName, SubnetType type, SubnetInfo& subnet) override;

private:
    RetWithError<bool> NamespaceExists(const std::string& ns);
    Error              ListVPCNamespaces(const std::string& vpcName, std::vector<std::string>& namespaces);
    Error              CheckAvailable(const naming::SubnetKey& key, const std::string& cidr);
    Error              EnsureBridgeAddress(
                     const std::string& bridge, const std::string& gateway, const std::string& address);
    std::string        FindNamespaceAddress(const std::string& ns);
    SubnetInfo         DescribeSubnet(const naming::SubnetKey& key);

    vpc::VPCProviderItf*      mVPCProvider {};
    driver::NetworkDriverItf* mDriver {};
    std::mutex                mMutex;
};

} // namespace vpcctl::subnet

#endif
