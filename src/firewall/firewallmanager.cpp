/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <common/network/utils.hpp>

#include "firewallmanager.hpp"

namespace vpcctl::firewall {

namespace {

constexpr auto cInput   = "INPUT";
constexpr auto cForward = "FORWARD";
constexpr auto cOutput  = "OUTPUT";
constexpr auto cAccept  = "ACCEPT";
constexpr auto cDrop    = "DROP";
constexpr auto cFilter  = "filter";

common::network::RuleBuilder ToRuleBuilder(const IngressRule& rule)
{
    common::network::RuleBuilder builder;

    builder.Protocol(rule.mProtocol.ToString().CStr());

    if (rule.mProtocol != ProtocolEnum::eICMP && rule.mPort.has_value()) {
        builder.DestinationPort(*rule.mPort);
    }

    return builder.Jump(rule.mAction == ActionEnum::eAllow ? cAccept : cDrop);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error FirewallManager::Init(vpc::VPCProviderItf& vpcProvider, subnet::SubnetProviderItf& subnetProvider,
    driver::NetworkDriverItf& driver, const std::vector<uint16_t>& probePorts)
{
    mVPCProvider    = &vpcProvider;
    mSubnetProvider = &subnetProvider;
    mDriver         = &driver;
    mProbePorts     = probePorts;

    return ErrorEnum::eNone;
}

Error FirewallManager::ApplyFirewall(
    const std::string& vpcName, const RuleSet& ruleSet, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Apply firewall" << Log::Field("vpc", vpcName.c_str()) << Log::Field("groups", ruleSet.mRules.size());

    std::vector<Subnet> subnets;

    if (auto err = GetSubnets(vpcName, subnets); !err.IsNone()) {
        return err;
    }

    size_t applied = 0, failed = 0;

    for (const auto& group : ruleSet.mRules) {
        auto subnet = std::find_if(subnets.begin(), subnets.end(), [&group](const Subnet& item) {
            return !item.mAddress.empty()
                && common::network::NetworkContainsIP(group.mSubnet, common::network::StripPrefix(item.mAddress));
        });

        if (subnet == subnets.end()) {
            LOG_WRN() << "No namespace matches subnet" << Log::Field("subnet", group.mSubnet.c_str());

            report.Warning("subnet " + group.mSubnet + " not found in VPC " + vpcName + ", skipped");

            continue;
        }

        if (auto err = ApplyRules(subnet->mNamespace, group.mIngress); !err.IsNone()) {
            LOG_ERR() << "Can't apply firewall" << Log::Field("ns", subnet->mNamespace.c_str()) << Log::Field(err);

            report.Warning("can't apply firewall to " + subnet->mNamespace + ": " + err.Message());
            failed++;

            continue;
        }

        report.Succeeded(
            "apply " + std::to_string(group.mIngress.size()) + " ingress rules to " + subnet->mNamespace);
        applied++;
    }

    if (applied == 0 && failed != 0) {
        return Error(ErrorEnum::eFailed, "firewall is not applied to any subnet");
    }

    return ErrorEnum::eNone;
}

Error FirewallManager::ApplyFirewall(
    const std::string& vpcName, const std::string& path, common::utils::OperationReport& report)
{
    RuleSet ruleSet;

    if (auto err = LoadRuleSet(path, ruleSet); !err.IsNone()) {
        return err;
    }

    return ApplyFirewall(vpcName, ruleSet, report);
}

Error FirewallManager::TestFirewall(const std::string& vpcName, std::vector<FirewallProbe>& probes)
{
    std::lock_guard lock {mMutex};

    std::vector<Subnet> subnets;

    if (auto err = GetSubnets(vpcName, subnets); !err.IsNone()) {
        return err;
    }

    if (subnets.empty()) {
        return Error(ErrorEnum::eWrongState, ("VPC has no subnets: " + vpcName).c_str());
    }

    for (const auto& subnet : subnets) {
        auto ip = common::network::StripPrefix(subnet.mAddress);
        if (ip.empty()) {
            continue;
        }

        for (auto port : mProbePorts) {
            probes.push_back({subnet.mNamespace, ip, ProtocolEnum::eTCP, port, mDriver->ProbePort(ip, port)});
        }

        auto reachable = mDriver->Ping(driver::cHostNamespace, ip);

        probes.push_back({subnet.mNamespace, ip, ProtocolEnum::eICMP, 0,
            reachable ? PortState(PortStateEnum::eOpen) : PortState(PortStateEnum::eFiltered)});
    }

    return ErrorEnum::eNone;
}

Error FirewallManager::CleanupFirewall(const std::string& vpcName, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Cleanup firewall" << Log::Field("vpc", vpcName.c_str());

    std::vector<Subnet> subnets;

    if (auto err = GetSubnets(vpcName, subnets); !err.IsNone()) {
        return err;
    }

    for (const auto& subnet : subnets) {
        if (auto err = ResetRules(subnet.mNamespace); !err.IsNone()) {
            report.Warning("can't reset firewall of " + subnet.mNamespace + ": " + err.Message());

            continue;
        }

        report.Succeeded("reset firewall of " + subnet.mNamespace);
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error FirewallManager::GetSubnets(const std::string& vpcName, std::vector<Subnet>& subnets)
{
    vpc::VPCInfo vpc;

    if (auto err = mVPCProvider->GetVPC(vpcName, vpc); !err.IsNone()) {
        return err;
    }

    std::vector<std::string> namespaces;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& ns : namespaces) {
        subnets.push_back({ns, mSubnetProvider->GetNamespaceAddress(ns)});
    }

    return ErrorEnum::eNone;
}

Error FirewallManager::ApplyRules(const std::string& ns, const std::vector<IngressRule>& rules)
{
    if (auto err = mDriver->ResetFilter(ns); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& [chain, policy] : {std::make_pair(cInput, cDrop), std::make_pair(cForward, cDrop),
             std::make_pair(cOutput, cAccept)}) {
        if (auto err = mDriver->SetPolicy(ns, chain, policy); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }
    }

    std::vector<common::network::RuleBuilder> builders {
        common::network::RuleBuilder().State("ESTABLISHED,RELATED").Jump(cAccept),
        common::network::RuleBuilder().InInterface("lo").Jump(cAccept),
    };

    for (const auto& rule : rules) {
        builders.push_back(ToRuleBuilder(rule));
    }

    for (const auto& builder : builders) {
        if (auto err = mDriver->AppendRule(ns, cFilter, cInput, builder); !err.IsNone()) {
            return AOS_ERROR_WRAP(Error(err, ("can't append rule " + builder.ToString()).c_str()));
        }
    }

    LOG_DBG() << "Firewall applied" << Log::Field("ns", ns.c_str()) << Log::Field("rules", builders.size());

    return ErrorEnum::eNone;
}

Error FirewallManager::ResetRules(const std::string& ns)
{
    if (auto err = mDriver->ResetFilter(ns); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& chain : {cInput, cForward, cOutput}) {
        if (auto err = mDriver->SetPolicy(ns, chain, cAccept); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }
    }

    return ErrorEnum::eNone;
}

} // namespace vpcctl::firewall
