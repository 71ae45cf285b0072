/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>

#include <common/network/utils.hpp>
#include <common/utils/utils.hpp>

#include "naming.hpp"

namespace vpcctl::naming {

namespace {

constexpr auto cBridgePrefix    = "br-";
constexpr auto cNamespacePrefix = "ns-";
constexpr auto cHostRole        = "vh";
constexpr auto cNamespaceRole   = "vn";
constexpr auto cPeeringRole     = "vp";

// "vh" + key + "pub" fits cMaxIfNameLen
constexpr size_t cLinkKeyLen      = 10;
constexpr size_t cLinkKeyHashLen  = 5;
constexpr size_t cBridgeHashLen   = 4;
constexpr size_t cPeerNamePartLen = 4;
constexpr size_t cPeerHashLen     = 4;

std::string TypeTag(SubnetType type)
{
    return type == SubnetTypeEnum::ePublic ? "pub" : "pri";
}

std::string LinkKey(const std::string& vpcName)
{
    if (vpcName.size() <= cLinkKeyLen) {
        return vpcName;
    }

    return vpcName.substr(0, cLinkKeyLen - cLinkKeyHashLen) + common::utils::ShortHash(vpcName, cLinkKeyHashLen);
}

RetWithError<std::string> AddressWithLastOctet(const std::string& cidr, uint32_t lastOctet)
{
    if (auto err = ValidateCIDR(cidr); !err.IsNone()) {
        return {"", err};
    }

    auto [network, err] = common::network::ParseCIDR(cidr);
    if (!err.IsNone()) {
        return {"", err};
    }

    return common::network::IPToString((network.mAddress & 0xFFFFFF00u) | lastOctet);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ValidateVPCName(const std::string& name)
{
    if (name.empty() || name.size() > cMaxVPCNameLen) {
        return Error(ErrorEnum::eInvalidArgument,
            ("VPC name must be 1.." + std::to_string(cMaxVPCNameLen) + " characters: " + name).c_str());
    }

    if (!std::isalnum(static_cast<unsigned char>(name.front()))) {
        return Error(ErrorEnum::eInvalidArgument, ("VPC name must start with a letter or digit: " + name).c_str());
    }

    for (auto ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-') {
            return Error(ErrorEnum::eInvalidArgument, ("invalid character in VPC name: " + name).c_str());
        }
    }

    return ErrorEnum::eNone;
}

Error ValidateCIDR(const std::string& cidr)
{
    auto [network, err] = common::network::ParseCIDR(cidr);
    if (!err.IsNone()) {
        return err;
    }

    if (network.mPrefix < cMinPrefixLen || network.mPrefix > cMaxPrefixLen) {
        return Error(ErrorEnum::eInvalidArgument,
            ("prefix length must be " + std::to_string(cMinPrefixLen) + ".." + std::to_string(cMaxPrefixLen) + ": "
                + cidr)
                .c_str());
    }

    if ((network.mAddress & ~common::network::PrefixToMask(network.mPrefix)) != 0) {
        return Error(ErrorEnum::eInvalidArgument, ("CIDR has host bits set: " + cidr).c_str());
    }

    return ErrorEnum::eNone;
}

RetWithError<SubnetType> ParseSubnetType(const std::string& type)
{
    SubnetType subnetType;

    if (auto err = subnetType.FromString(String(type.c_str())); !err.IsNone()) {
        return {subnetType,
            Error(ErrorEnum::eInvalidArgument, ("subnet type must be public or private: " + type).c_str())};
    }

    return subnetType;
}

RetWithError<std::string> GatewayAddress(const std::string& cidr)
{
    return AddressWithLastOctet(cidr, 1);
}

RetWithError<std::string> HostAddress(const std::string& cidr)
{
    return AddressWithLastOctet(cidr, 2);
}

std::string WithPrefix(const std::string& ip, const std::string& cidr)
{
    auto slashPos = cidr.find('/');

    return ip + (slashPos != std::string::npos ? cidr.substr(slashPos) : "/32");
}

std::string BridgeName(const std::string& vpcName)
{
    const std::string prefix = cBridgePrefix;

    if (prefix.size() + vpcName.size() <= cMaxIfNameLen) {
        return prefix + vpcName;
    }

    auto keep = cMaxIfNameLen - prefix.size() - cBridgeHashLen - 1;

    return prefix + vpcName.substr(0, keep) + "-" + common::utils::ShortHash(vpcName, cBridgeHashLen);
}

std::string NamespaceName(const std::string& vpcName, SubnetType type)
{
    return cNamespacePrefix + vpcName + "-" + type.ToString().CStr();
}

std::optional<SubnetKey> ParseNamespaceName(const std::string& ns)
{
    const std::string prefix = cNamespacePrefix;

    if (ns.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }

    for (auto type : {SubnetTypeEnum::ePublic, SubnetTypeEnum::ePrivate}) {
        auto suffix = std::string("-") + SubnetType(type).ToString().CStr();

        if (ns.size() <= prefix.size() + suffix.size()
            || ns.compare(ns.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        auto vpcName = ns.substr(prefix.size(), ns.size() - prefix.size() - suffix.size());

        if (!ValidateVPCName(vpcName).IsNone()) {
            return std::nullopt;
        }

        return SubnetKey {vpcName, type};
    }

    return std::nullopt;
}

SubnetLinkNames SubnetLinks(const std::string& vpcName, SubnetType type)
{
    auto key = LinkKey(vpcName) + TypeTag(type);

    return {cHostRole + key, cNamespaceRole + key};
}

PeeringLinkNames PeeringLinks(const std::string& vpcA, const std::string& vpcB)
{
    const auto& first  = vpcA < vpcB ? vpcA : vpcB;
    const auto& second = vpcA < vpcB ? vpcB : vpcA;

    auto hash        = common::utils::ShortHash(first + "/" + second, cPeerHashLen);
    auto firstShort  = first.substr(0, cPeerNamePartLen);
    auto secondShort = second.substr(0, cPeerNamePartLen);

    return {first, second, cPeeringRole + firstShort + secondShort + "a" + hash,
        cPeeringRole + secondShort + firstShort + "b" + hash};
}

} // namespace vpcctl::naming
