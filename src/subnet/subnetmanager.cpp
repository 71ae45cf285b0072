/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <common/network/utils.hpp>
#include <common/utils/steprunner.hpp>

#include "subnetmanager.hpp"

namespace vpcctl::subnet {

namespace {

constexpr auto cLoopback = "lo";

SubnetType OtherType(SubnetType type)
{
    return type == SubnetTypeEnum::ePublic ? SubnetTypeEnum::ePrivate : SubnetTypeEnum::ePublic;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error SubnetManager::Init(vpc::VPCProviderItf& vpcProvider, driver::NetworkDriverItf& driver)
{
    mVPCProvider = &vpcProvider;
    mDriver      = &driver;

    return ErrorEnum::eNone;
}

Error SubnetManager::AddSubnet(const std::string& vpcName, const std::string& type, const std::string& cidr,
    common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Add subnet" << Log::Field("vpc", vpcName.c_str()) << Log::Field("type", type.c_str())
              << Log::Field("cidr", cidr.c_str());

    SubnetType subnetType;
    Error      err;

    if (Tie(subnetType, err) = naming::ParseSubnetType(type); !err.IsNone()) {
        return err;
    }

    if (err = naming::ValidateCIDR(cidr); !err.IsNone()) {
        return err;
    }

    vpc::VPCInfo vpc;

    if (err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    if (!common::network::NetworkContainsNetwork(vpc.mCIDR, cidr)) {
        return Error(ErrorEnum::eInvalidArgument, ("subnet " + cidr + " is outside VPC CIDR " + vpc.mCIDR).c_str());
    }

    naming::SubnetKey key {vpcName, subnetType};

    if (err = CheckAvailable(key, cidr); !err.IsNone()) {
        return err;
    }

    std::string gateway, host;

    if (Tie(gateway, err) = naming::GatewayAddress(cidr); !err.IsNone()) {
        return err;
    }

    if (Tie(host, err) = naming::HostAddress(cidr); !err.IsNone()) {
        return err;
    }

    const auto ns             = naming::NamespaceName(vpcName, subnetType);
    const auto links          = naming::SubnetLinks(vpcName, subnetType);
    const auto gatewayAddress = naming::WithPrefix(gateway, cidr);
    const auto hostAddress    = naming::WithPrefix(host, cidr);

    common::utils::StepRunner steps("add " + std::string(subnetType.ToString().CStr()) + " subnet to " + vpcName);

    steps.AddStep(
        "create namespace " + ns, [&]() { return mDriver->CreateNamespace(ns); },
        [&]() { return mDriver->DeleteNamespace(ns); });
    steps.AddStep(
        "create link pair " + links.mHost + "/" + links.mNamespace,
        [&]() { return mDriver->CreateVethPair(links.mHost, links.mNamespace); },
        [&]() { return mDriver->DeleteLink(links.mHost); });
    steps.AddStep("move " + links.mNamespace + " to " + ns,
        [&]() { return mDriver->MoveLinkToNamespace(links.mNamespace, ns); });
    steps.AddStep(
        "attach " + links.mHost + " to " + vpc.mBridge, [&]() { return mDriver->SetMaster(links.mHost, vpc.mBridge); });
    steps.AddStep("bring up " + links.mHost, [&]() { return mDriver->SetLinkUp(links.mHost); });
    steps.AddStep("bring up " + links.mNamespace, [&]() { return mDriver->SetNamespaceLinkUp(ns, links.mNamespace); });
    steps.AddStep("bring up loopback", [&]() { return mDriver->SetNamespaceLinkUp(ns, cLoopback); });
    steps.AddStep(
        "add gateway " + gatewayAddress + " to " + vpc.mBridge,
        [&]() { return EnsureBridgeAddress(vpc.mBridge, gateway, gatewayAddress); },
        [&]() { return mDriver->DeleteAddress(vpc.mBridge, gatewayAddress); });
    steps.AddStep("assign " + hostAddress + " to " + links.mNamespace,
        [&]() { return mDriver->AddNamespaceAddress(ns, links.mNamespace, hostAddress); });
    steps.AddStep("add default route via " + gateway, [&]() {
        return mDriver->AddNamespaceRoute(ns, Route {"default", gateway, links.mNamespace, false});
    });

    if (subnetType == SubnetTypeEnum::ePublic) {
        steps.AddStep("enable forwarding in " + ns, [&]() { return mDriver->SetNamespaceForwarding(ns, true); });
    }

    if (err = steps.Run(); !err.IsNone()) {
        LOG_ERR() << "Add subnet failed" << Log::Field("ns", ns.c_str()) << Log::Field(err);

        return AOS_ERROR_WRAP(err);
    }

    for (const auto& step : steps.GetCompleted()) {
        report.Succeeded(step);
    }

    LOG_INF() << "Subnet added" << Log::Field("ns", ns.c_str()) << Log::Field("address", hostAddress.c_str());

    return ErrorEnum::eNone;
}

Error SubnetManager::DeleteSubnet(
    const std::string& vpcName, const std::string& type, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Delete subnet" << Log::Field("vpc", vpcName.c_str()) << Log::Field("type", type.c_str());

    SubnetType subnetType;
    Error      err;

    if (Tie(subnetType, err) = naming::ParseSubnetType(type); !err.IsNone()) {
        return err;
    }

    const auto ns    = naming::NamespaceName(vpcName, subnetType);
    const auto links = naming::SubnetLinks(vpcName, subnetType);

    bool      nsExists = false;
    LinkState hostState;

    if (Tie(nsExists, err) = NamespaceExists(ns); !err.IsNone()) {
        return err;
    }

    if (Tie(hostState, err) = mDriver->GetLinkState(links.mHost); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (!nsExists && hostState == LinkStateEnum::eAbsent) {
        return Error(ErrorEnum::eNotFound, ("subnet not found: " + ns).c_str());
    }

    auto address = nsExists ? FindNamespaceAddress(ns) : std::string();

    if (nsExists) {
        if (err = mDriver->DeleteNamespace(ns); !err.IsNone() && !err.Is(ErrorEnum::eNotFound)) {
            return AOS_ERROR_WRAP(err);
        }

        report.Succeeded("delete namespace " + ns);
    }

    if (err = mDriver->DeleteLink(links.mHost); err.IsNone()) {
        report.Succeeded("delete link " + links.mHost);
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        return AOS_ERROR_WRAP(err);
    }

    vpc::VPCInfo vpc;

    if (address.empty() || !mVPCProvider->GetVPC(vpcName, vpc).IsNone()) {
        report.Skipped("subnet gateway on bridge: address unknown");

        return ErrorEnum::eNone;
    }

    auto cidr    = common::network::NetworkOf(address).mValue;
    auto gateway = naming::GatewayAddress(cidr);

    if (!gateway.mError.IsNone() || gateway.mValue == vpc.mGateway) {
        report.Skipped("subnet gateway on bridge: shared with VPC gateway");

        return ErrorEnum::eNone;
    }

    auto gatewayAddress = naming::WithPrefix(gateway.mValue, cidr);

    if (err = mDriver->DeleteAddress(vpc.mBridge, gatewayAddress); err.IsNone()) {
        report.Succeeded("remove gateway " + gatewayAddress + " from " + vpc.mBridge);
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        LOG_WRN() << "Can't remove subnet gateway" << Log::Field("address", gatewayAddress.c_str()) << Log::Field(err);

        report.Warning("can't remove gateway " + gatewayAddress + ": " + err.Message());
    }

    return ErrorEnum::eNone;
}

Error SubnetManager::ListSubnets(std::vector<SubnetInfo>& subnets)
{
    std::lock_guard lock {mMutex};

    std::vector<std::string> namespaces;

    if (auto err = mDriver->ListNamespaces(namespaces); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    std::sort(namespaces.begin(), namespaces.end());

    for (const auto& ns : namespaces) {
        if (auto key = naming::ParseNamespaceName(ns); key.has_value()) {
            subnets.push_back(DescribeSubnet(*key));
        }
    }

    return ErrorEnum::eNone;
}

Error SubnetManager::VerifySubnetConnectivity(const std::string& vpcName, std::vector<ReachabilityCheck>& checks)
{
    std::lock_guard lock {mMutex};

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    std::vector<std::string> namespaces;

    if (auto err = ListVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        return err;
    }

    if (namespaces.empty()) {
        return Error(ErrorEnum::eWrongState, ("VPC has no subnets: " + vpcName).c_str());
    }

    std::vector<std::pair<std::string, std::string>> addresses;

    for (const auto& ns : namespaces) {
        addresses.emplace_back(ns, FindNamespaceAddress(ns));
    }

    for (const auto& [source, sourceAddress] : addresses) {
        if (sourceAddress.empty()) {
            checks.push_back({source, "gateway", "", false});

            continue;
        }

        auto gateway = naming::GatewayAddress(common::network::NetworkOf(sourceAddress).mValue).mValue;

        checks.push_back({source, "gateway", gateway, mDriver->Ping(source, gateway)});

        for (const auto& [target, targetAddress] : addresses) {
            if (target == source || targetAddress.empty()) {
                continue;
            }

            auto ip = common::network::StripPrefix(targetAddress);

            checks.push_back({source, target, ip, mDriver->Ping(source, ip)});
        }
    }

    return ErrorEnum::eNone;
}

Error SubnetManager::GetVPCNamespaces(const std::string& vpcName, std::vector<std::string>& namespaces)
{
    std::lock_guard lock {mMutex};

    return ListVPCNamespaces(vpcName, namespaces);
}

std::string SubnetManager::GetNamespaceAddress(const std::string& ns)
{
    std::lock_guard lock {mMutex};

    return FindNamespaceAddress(ns);
}

Error SubnetManager::GetSubnet(const std::string& vpcName, SubnetType type, SubnetInfo& subnet)
{
    std::lock_guard lock {mMutex};

    naming::SubnetKey key {vpcName, type};

    auto [exists, err] = NamespaceExists(naming::NamespaceName(vpcName, type));
    if (!err.IsNone()) {
        return err;
    }

    if (!exists) {
        return Error(ErrorEnum::eNotFound, ("subnet not found: " + naming::NamespaceName(vpcName, type)).c_str());
    }

    subnet = DescribeSubnet(key);

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<bool> SubnetManager::NamespaceExists(const std::string& ns)
{
    std::vector<std::string> namespaces;

    if (auto err = mDriver->ListNamespaces(namespaces); !err.IsNone()) {
        return {false, AOS_ERROR_WRAP(err)};
    }

    return {std::find(namespaces.begin(), namespaces.end(), ns) != namespaces.end(), ErrorEnum::eNone};
}

Error SubnetManager::ListVPCNamespaces(const std::string& vpcName, std::vector<std::string>& namespaces)
{
    std::vector<std::string> all;

    if (auto err = mDriver->ListNamespaces(all); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& ns : all) {
        if (auto key = naming::ParseNamespaceName(ns); key.has_value() && key->mVPCName == vpcName) {
            namespaces.push_back(ns);
        }
    }

    std::sort(namespaces.begin(), namespaces.end());

    return ErrorEnum::eNone;
}

Error SubnetManager::CheckAvailable(const naming::SubnetKey& key, const std::string& cidr)
{
    const auto ns = naming::NamespaceName(key.mVPCName, key.mType);

    auto [exists, err] = NamespaceExists(ns);
    if (!err.IsNone()) {
        return err;
    }

    if (exists) {
        return Error(ErrorEnum::eAlreadyExist, ("subnet already exists: " + ns).c_str());
    }

    const auto otherNs = naming::NamespaceName(key.mVPCName, OtherType(key.mType));

    if (auto otherAddress = FindNamespaceAddress(otherNs); !otherAddress.empty()) {
        auto otherCIDR = common::network::NetworkOf(otherAddress).mValue;

        if (common::network::NetworkContainsNetwork(otherCIDR, cidr)
            || common::network::NetworkContainsNetwork(cidr, otherCIDR)) {
            return Error(ErrorEnum::eAlreadyExist, ("subnet " + cidr + " overlaps " + otherNs).c_str());
        }
    }

    const auto links = naming::SubnetLinks(key.mVPCName, key.mType);

    for (const auto& link : {links.mHost, links.mNamespace}) {
        LinkState state;

        if (Tie(state, err) = mDriver->GetLinkState(link); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        if (state != LinkStateEnum::eAbsent) {
            return Error(ErrorEnum::eAlreadyExist, ("name collision: link " + link + " already exists").c_str());
        }
    }

    return ErrorEnum::eNone;
}

Error SubnetManager::EnsureBridgeAddress(
    const std::string& bridge, const std::string& gateway, const std::string& address)
{
    std::vector<std::string> addresses;

    if (auto err = mDriver->GetAddresses(bridge, addresses); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    auto assigned = std::any_of(addresses.begin(), addresses.end(),
        [&gateway](const std::string& item) { return common::network::StripPrefix(item) == gateway; });

    if (assigned) {
        return ErrorEnum::eNone;
    }

    return mDriver->AddAddress(bridge, address);
}

std::string SubnetManager::FindNamespaceAddress(const std::string& ns)
{
    std::vector<std::string> addresses;

    if (auto err = mDriver->GetNamespaceAddresses(ns, "", addresses); !err.IsNone()) {
        LOG_DBG() << "Can't get namespace addresses" << Log::Field("ns", ns.c_str()) << Log::Field(err);

        return "";
    }

    return addresses.empty() ? "" : addresses.front();
}

SubnetInfo SubnetManager::DescribeSubnet(const naming::SubnetKey& key)
{
    SubnetInfo info;
    auto       links = naming::SubnetLinks(key.mVPCName, key.mType);

    info.mVPCName       = key.mVPCName;
    info.mType          = key.mType;
    info.mNamespace     = naming::NamespaceName(key.mVPCName, key.mType);
    info.mHostLink      = links.mHost;
    info.mNamespaceLink = links.mNamespace;
    info.mAddress       = FindNamespaceAddress(info.mNamespace);

    if (!info.mAddress.empty()) {
        info.mCIDR    = common::network::NetworkOf(info.mAddress).mValue;
        info.mGateway = naming::GatewayAddress(info.mCIDR).mValue;
    }

    if (auto err = mDriver->GetNamespaceRoutes(info.mNamespace, info.mRoutes); !err.IsNone()) {
        LOG_WRN() << "Can't get namespace routes" << Log::Field("ns", info.mNamespace.c_str()) << Log::Field(err);
    }

    return info;
}

} // namespace vpcctl::subnet
