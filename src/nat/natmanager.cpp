/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <common/network/utils.hpp>
#include <naming/naming.hpp>

#include "natmanager.hpp"

namespace vpcctl::nat {

namespace {

constexpr auto cNATTable      = "nat";
constexpr auto cFilterTable   = "filter";
constexpr auto cPostRouting   = "POSTROUTING";
constexpr auto cForward       = "FORWARD";
constexpr auto cMasquerade    = "MASQUERADE";
constexpr auto cAccept        = "ACCEPT";
constexpr auto cReturnTraffic = "ESTABLISHED,RELATED";

std::string FormatRule(const std::string& chain, const common::network::RuleBuilder& rule)
{
    return "-A " + chain + " " + rule.ToString();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error NATManager::Init(vpc::VPCProviderItf& vpcProvider, subnet::SubnetProviderItf& subnetProvider,
    driver::NetworkDriverItf& driver, const std::string& externalAddress)
{
    mVPCProvider     = &vpcProvider;
    mSubnetProvider  = &subnetProvider;
    mDriver          = &driver;
    mExternalAddress = externalAddress;

    return ErrorEnum::eNone;
}

Error NATManager::EnableNAT(const std::string& vpcName, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Enable NAT" << Log::Field("vpc", vpcName.c_str());

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    return InstallRules(vpc, report);
}

Error NATManager::DisableNAT(const std::string& vpcName, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Disable NAT" << Log::Field("vpc", vpcName.c_str());

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    return RemoveRules(vpc, report);
}

Error NATManager::ResetNAT(const std::string& vpcName, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Reset NAT" << Log::Field("vpc", vpcName.c_str());

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    if (auto err = RemoveRules(vpc, report); !err.IsNone()) {
        return err;
    }

    return InstallRules(vpc, report);
}

Error NATManager::ListNATRules(HostRuleListing& listing)
{
    std::lock_guard lock {mMutex};

    if (auto [forwarding, err] = mDriver->GetHostForwarding(); err.IsNone()) {
        listing.mForwarding = forwarding;
    } else {
        LOG_WRN() << "Can't read host forwarding" << Log::Field(err);
    }

    std::vector<common::network::ListedRule> natRules, forwardRules;

    if (auto err = mDriver->ListRules(cHostNamespace, cNATTable, cPostRouting, natRules); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mDriver->ListRules(cHostNamespace, cFilterTable, cForward, forwardRules); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& listed : natRules) {
        listing.mPostRoutingRules.push_back(FormatRule(listed.mChain, listed.mRule));
    }

    for (const auto& listed : forwardRules) {
        listing.mForwardRules.push_back(FormatRule(listed.mChain, listed.mRule));
    }

    return ErrorEnum::eNone;
}

Error NATManager::TestConnectivity(const std::string& vpcName, std::vector<ConnectivityCheck>& checks)
{
    std::lock_guard lock {mMutex};

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    std::vector<std::string> namespaces;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (namespaces.empty()) {
        return Error(ErrorEnum::eWrongState, ("VPC has no subnets: " + vpcName).c_str());
    }

    for (const auto& ns : namespaces) {
        auto key = naming::ParseNamespaceName(ns);
        if (!key.has_value()) {
            continue;
        }

        ConnectivityCheck check {ns, key->mType};

        if (auto address = mSubnetProvider->GetNamespaceAddress(ns); !address.empty()) {
            auto gateway = naming::GatewayAddress(common::network::NetworkOf(address).mValue).mValue;

            check.mExternal = mDriver->Ping(ns, mExternalAddress);
            check.mGateway  = mDriver->Ping(ns, gateway);
        }

        // private subnet passes when it can't reach outside
        check.mPassed = check.mGateway && (key->mType == SubnetTypeEnum::ePublic ? check.mExternal : !check.mExternal);

        LOG_DBG() << "Connectivity checked" << Log::Field("ns", ns.c_str()) << Log::Field("external", check.mExternal)
                  << Log::Field("gateway", check.mGateway);

        checks.push_back(check);
    }

    return ErrorEnum::eNone;
}

Error NATManager::VerifyNATSetup(const std::string& vpcName, NATSetup& setup)
{
    std::lock_guard lock {mMutex};

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    return CollectSetup(vpc, setup);
}

Error NATManager::DiagnoseNATIssues(const std::string& vpcName, NATDiagnosis& diagnosis)
{
    std::lock_guard lock {mMutex};

    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    auto& setup = diagnosis.mSetup;

    if (auto err = CollectSetup(vpc, setup); !err.IsNone()) {
        return err;
    }

    auto& findings = diagnosis.mFindings;

    if (!setup.mForwarding) {
        findings.push_back("host forwarding is disabled");
    }

    if (setup.mEgress.empty()) {
        findings.push_back("host has no default route");
    }

    if (setup.mPublicCIDRs.empty()) {
        findings.push_back("VPC has no public subnets");
    }

    if (!setup.mEgress.empty()) {
        for (const auto& hostRule : ExpectedRules(vpc, setup.mPublicCIDRs, setup.mEgress)) {
            auto [present, err] = mDriver->HasRule(cHostNamespace, hostRule.mTable, hostRule.mChain, hostRule.mRule);
            if (!err.IsNone()) {
                return AOS_ERROR_WRAP(err);
            }

            if (!present) {
                findings.push_back(
                    "missing rule: " + hostRule.mTable + " " + FormatRule(hostRule.mChain, hostRule.mRule));
            }
        }
    }

    for (const auto& ns : setup.mPublicNamespaces) {
        std::vector<std::string> routes;

        if (auto err = mDriver->GetNamespaceRoutes(ns, routes); !err.IsNone()) {
            findings.push_back("can't read routes of " + ns + ": " + err.Message());

            continue;
        }

        auto hasDefault = std::any_of(
            routes.begin(), routes.end(), [](const std::string& route) { return route.rfind("default", 0) == 0; });

        if (!hasDefault) {
            findings.push_back("namespace " + ns + " has no default route");
        }
    }

    diagnosis.mHostExternalReachable = mDriver->Ping(cHostNamespace, mExternalAddress);

    if (!diagnosis.mHostExternalReachable) {
        findings.push_back("host can't reach " + mExternalAddress);
    }

    LOG_INF() << "NAT diagnosed" << Log::Field("vpc", vpcName.c_str()) << Log::Field("findings", findings.size());

    return ErrorEnum::eNone;
}

Error NATManager::OnVPCDelete(const vpc::VPCInfo& vpc, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    return RemoveRules(vpc, report);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error NATManager::GetPublicSubnets(
    const std::string& vpcName, std::vector<std::string>& namespaces, std::vector<std::string>& cidrs)
{
    std::vector<std::string> all;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, all); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& ns : all) {
        auto key = naming::ParseNamespaceName(ns);
        if (!key.has_value() || key->mType != SubnetTypeEnum::ePublic) {
            continue;
        }

        namespaces.push_back(ns);

        auto address = mSubnetProvider->GetNamespaceAddress(ns);
        if (address.empty()) {
            LOG_WRN() << "Public subnet has no address" << Log::Field("ns", ns.c_str());

            continue;
        }

        auto [cidr, err] = common::network::NetworkOf(address);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        cidrs.push_back(cidr);
    }

    return ErrorEnum::eNone;
}

std::vector<NATManager::HostRule> NATManager::ExpectedRules(
    const vpc::VPCInfo& vpc, const std::vector<std::string>& cidrs, const std::string& egress)
{
    std::vector<HostRule> rules;

    for (const auto& cidr : cidrs) {
        rules.push_back({cNATTable, cPostRouting,
            common::network::RuleBuilder().Source(cidr).OutInterface(egress).Jump(cMasquerade)});
        rules.push_back(
            {cFilterTable, cForward, common::network::RuleBuilder().Source(cidr).OutInterface(egress).Jump(cAccept)});
        rules.push_back({cFilterTable, cForward,
            common::network::RuleBuilder().Destination(cidr).InInterface(egress).State(cReturnTraffic).Jump(cAccept)});
    }

    rules.push_back({cFilterTable, cForward,
        common::network::RuleBuilder().InInterface(vpc.mBridge).OutInterface(vpc.mBridge).Jump(cAccept)});

    return rules;
}

Error NATManager::CollectSetup(const vpc::VPCInfo& vpc, NATSetup& setup)
{
    if (auto [forwarding, err] = mDriver->GetHostForwarding(); err.IsNone()) {
        setup.mForwarding = forwarding;
    } else {
        LOG_WRN() << "Can't read host forwarding" << Log::Field(err);
    }

    if (auto [egress, err] = mDriver->GetDefaultEgressInterface(); err.IsNone()) {
        setup.mEgress = egress;
    }

    if (auto err = GetPublicSubnets(vpc.mName, setup.mPublicNamespaces, setup.mPublicCIDRs); !err.IsNone()) {
        return err;
    }

    std::vector<common::network::ListedRule> natRules, forwardRules;

    if (auto err = mDriver->ListRules(cHostNamespace, cNATTable, cPostRouting, natRules); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mDriver->ListRules(cHostNamespace, cFilterTable, cForward, forwardRules); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& listed : natRules) {
        if (BelongsToVPC(vpc, setup.mPublicCIDRs, listed.mRule)) {
            setup.mPostRoutingRules.push_back(FormatRule(listed.mChain, listed.mRule));
        }
    }

    for (const auto& listed : forwardRules) {
        if (BelongsToVPC(vpc, setup.mPublicCIDRs, listed.mRule)) {
            setup.mForwardRules.push_back(FormatRule(listed.mChain, listed.mRule));
        }
    }

    return ErrorEnum::eNone;
}

Error NATManager::InstallRules(const vpc::VPCInfo& vpc, common::utils::OperationReport& report)
{
    const auto& vpcName = vpc.mName;

    if (auto err = mDriver->SetHostForwarding(true); !err.IsNone()) {
        return AOS_ERROR_WRAP(Error(err, "can't enable host forwarding"));
    }

    report.Succeeded("enable host forwarding");

    auto [egress, err] = mDriver->GetDefaultEgressInterface();
    if (!err.IsNone()) {
        return Error(ErrorEnum::eWrongState, "no default route on host: can't detect egress interface");
    }

    std::vector<std::string> namespaces, cidrs;

    if (err = GetPublicSubnets(vpcName, namespaces, cidrs); !err.IsNone()) {
        return err;
    }

    if (cidrs.empty()) {
        return Error(ErrorEnum::eWrongState,
            ("no public subnets in VPC " + vpcName + ", add one with: add-subnet " + vpcName + " public <cidr>")
                .c_str());
    }

    for (const auto& hostRule : ExpectedRules(vpc, cidrs, egress)) {
        auto description = hostRule.mTable + " " + FormatRule(hostRule.mChain, hostRule.mRule);

        auto [present, checkErr] = mDriver->HasRule(cHostNamespace, hostRule.mTable, hostRule.mChain, hostRule.mRule);
        if (!checkErr.IsNone()) {
            return AOS_ERROR_WRAP(checkErr);
        }

        if (present) {
            report.Skipped("rule already present: " + description);

            continue;
        }

        if (err = mDriver->AppendRule(cHostNamespace, hostRule.mTable, hostRule.mChain, hostRule.mRule);
            !err.IsNone()) {
            return AOS_ERROR_WRAP(Error(err, ("can't add rule: " + description).c_str()));
        }

        report.Succeeded("add rule: " + description);
    }

    LOG_INF() << "NAT enabled" << Log::Field("vpc", vpcName.c_str()) << Log::Field("egress", egress.c_str());

    return ErrorEnum::eNone;
}

Error NATManager::RemoveRules(const vpc::VPCInfo& vpc, common::utils::OperationReport& report)
{
    std::vector<std::string> namespaces, cidrs;

    if (auto err = GetPublicSubnets(vpc.mName, namespaces, cidrs); !err.IsNone()) {
        return err;
    }

    size_t removed = 0;

    const std::pair<const char*, const char*> chains[]
        = {std::make_pair(cNATTable, cPostRouting), std::make_pair(cFilterTable, cForward)};

    for (const auto& [table, chain] : chains) {
        std::vector<common::network::ListedRule> rules;

        if (auto err = mDriver->ListRules(cHostNamespace, table, chain, rules); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        for (const auto& listed : rules) {
            if (!BelongsToVPC(vpc, cidrs, listed.mRule)) {
                continue;
            }

            auto description = std::string(table) + " " + FormatRule(listed.mChain, listed.mRule);

            if (auto err = mDriver->DeleteRule(cHostNamespace, table, listed.mChain, listed.mRule); !err.IsNone()) {
                LOG_WRN() << "Can't delete rule" << Log::Field("rule", description.c_str()) << Log::Field(err);

                report.Warning("can't remove rule " + description + ": " + err.Message());

                continue;
            }

            report.Succeeded("remove rule: " + description);
            removed++;
        }
    }

    if (removed == 0) {
        report.Skipped("no NAT rules of VPC " + vpc.mName);
    }

    LOG_DBG() << "NAT rules removed" << Log::Field("vpc", vpc.mName.c_str()) << Log::Field("count", removed);

    return ErrorEnum::eNone;
}

bool NATManager::BelongsToVPC(
    const vpc::VPCInfo& vpc, const std::vector<std::string>& publicCIDRs, const common::network::RuleBuilder& rule)
{
    const auto& args = rule.Build();

    if (args.size() < 2 || args[args.size() - 2] != "-j"
        || (args.back() != cMasquerade && args.back() != cAccept)) {
        return false;
    }

    for (size_t i = 0; i + 1 < args.size(); i++) {
        const auto& option = args[i];
        const auto& value  = args[i + 1];

        if ((option == "-i" || option == "-o") && value == vpc.mBridge) {
            return true;
        }

        if ((option == "-s" || option == "-d")
            && std::find(publicCIDRs.begin(), publicCIDRs.end(), value) != publicCIDRs.end()) {
            return true;
        }
    }

    return false;
}

} // namespace vpcctl::nat
