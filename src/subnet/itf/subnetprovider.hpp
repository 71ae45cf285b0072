/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_SUBNET_ITF_SUBNETPROVIDER_HPP_
#define VPCCTL_SUBNET_ITF_SUBNETPROVIDER_HPP_

#include <string>
#include <vector>

#include <common/types/network.hpp>

namespace vpcctl::subnet {

/**
 * Subnet info.
 */
struct SubnetInfo {
    std::string              mVPCName;
    SubnetType               mType;
    std::string              mNamespace;
    std::string              mHostLink;
    std::string              mNamespaceLink;
    std::string              mAddress;
    std::string              mCIDR;
    std::string              mGateway;
    std::vector<std::string> mRoutes;
};

/**
 * Gives read access to subnets.
 */
class SubnetProviderItf {
public:
    /**
     * Destructor.
     */
    virtual ~SubnetProviderItf() = default;

    /**
     * Returns namespaces of VPC subnets.
     *
     * @param vpcName VPC name.
     * @param[out] namespaces namespace names.
     * @return Error.
     */
    virtual Error GetVPCNamespaces(const std::string& vpcName, std::vector<std::string>& namespaces) = 0;

    /**
     * Returns address with prefix length assigned inside namespace.
     *
     * @param ns namespace name.
     * @return std::string empty if address is not assigned or namespace is unreachable.
     */
    virtual std::string GetNamespaceAddress(const std::string& ns) = 0;

    /**
     * Returns subnet info.
     *
     * @param vpcName VPC name.
     * @param type subnet type.
     * @param[out] subnet subnet info.
     * @return Error eNotFound if subnet doesn't exist.
     */
    virtual Error GetSubnet(const std::string& vpcName, SubnetType type, SubnetInfo& subnet) = 0;
};

} // namespace vpcctl::subnet

#endif
