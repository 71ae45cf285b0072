/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_NAMING_NAMING_HPP_
#define VPCCTL_NAMING_NAMING_HPP_

#include <optional>
#include <string>

#include <common/types/network.hpp>

namespace vpcctl::naming {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

/**
 * Max VPC name length.
 */
constexpr auto cMaxVPCNameLen = 32;

/**
 * Min supported CIDR prefix length.
 */
constexpr auto cMinPrefixLen = 8;

/**
 * Max supported CIDR prefix length.
 */
constexpr auto cMaxPrefixLen = 24;

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Subnet identity.
 */
struct SubnetKey {
    std::string mVPCName;
    SubnetType  mType;

    /**
     * Compares subnet keys.
     *
     * @param rhs key to compare with.
     * @return bool.
     */
    bool operator==(const SubnetKey& rhs) const { return mVPCName == rhs.mVPCName && mType == rhs.mType; }
};

/**
 * Subnet link pair names.
 */
struct SubnetLinkNames {
    std::string mHost;
    std::string mNamespace;
};

/**
 * Peering link pair names. First VPC is the lexicographically smaller one.
 */
struct PeeringLinkNames {
    std::string mFirstVPC;
    std::string mSecondVPC;
    std::string mFirstLink;
    std::string mSecondLink;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Validates VPC name: 1..32 characters of [A-Za-z0-9-] starting with alphanumeric.
 *
 * @param name VPC name.
 * @return Error.
 */
Error ValidateVPCName(const std::string& name);

/**
 * Validates CIDR: prefix length 8..24, host bits and last octet zero.
 *
 * @param cidr CIDR.
 * @return Error.
 */
Error ValidateCIDR(const std::string& cidr);

/**
 * Parses subnet type.
 *
 * @param type type string.
 * @return RetWithError<SubnetType>.
 */
RetWithError<SubnetType> ParseSubnetType(const std::string& type);

/**
 * Returns gateway address (.1) of the network.
 *
 * @param cidr network CIDR.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> GatewayAddress(const std::string& cidr);

/**
 * Returns namespace host address (.2) of the network.
 *
 * @param cidr network CIDR.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> HostAddress(const std::string& cidr);

/**
 * Appends network prefix length to the address.
 *
 * @param ip address.
 * @param cidr network CIDR.
 * @return std::string.
 */
std::string WithPrefix(const std::string& ip, const std::string& cidr);

/**
 * Returns bridge name of the VPC.
 *
 * @param vpcName VPC name.
 * @return std::string.
 */
std::string BridgeName(const std::string& vpcName);

/**
 * Returns namespace name of the subnet.
 *
 * @param vpcName VPC name.
 * @param type subnet type.
 * @return std::string.
 */
std::string NamespaceName(const std::string& vpcName, SubnetType type);

/**
 * Parses namespace name created by NamespaceName.
 *
 * @param ns namespace name.
 * @return std::optional<SubnetKey>.
 */
std::optional<SubnetKey> ParseNamespaceName(const std::string& ns);

/**
 * Returns subnet link pair names.
 *
 * @param vpcName VPC name.
 * @param type subnet type.
 * @return SubnetLinkNames.
 */
SubnetLinkNames SubnetLinks(const std::string& vpcName, SubnetType type);

/**
 * Returns peering link pair names.
 *
 * @param vpcA first VPC name.
 * @param vpcB second VPC name.
 * @return PeeringLinkNames.
 */
PeeringLinkNames PeeringLinks(const std::string& vpcA, const std::string& vpcB);

} // namespace vpcctl::naming

#endif
