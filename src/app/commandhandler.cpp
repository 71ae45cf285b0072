/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <iomanip>

#include <common/utils/time.hpp>

#include "commandhandler.hpp"

namespace vpcctl::app {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

constexpr auto cNameWidth    = 16;
constexpr auto cCIDRWidth    = 19;
constexpr auto cLinkWidth    = 16;
constexpr auto cNSWidth      = 24;
constexpr auto cAddressWidth = 19;
constexpr auto cStatusWidth  = 9;

const char* YesNo(bool value)
{
    return value ? "yes" : "no";
}

const char* OkFailed(bool value)
{
    return value ? "ok" : "failed";
}

void PrintList(const char* title, const std::vector<std::string>& items, std::ostream& out)
{
    out << title << ":" << (items.empty() ? " none" : "") << "\n";

    for (const auto& item : items) {
        out << "  " << item << "\n";
    }
}

void PrintNATSetup(const nat::NATSetup& setup, std::ostream& out)
{
    out << "Host forwarding: " << (setup.mForwarding ? "enabled" : "disabled") << "\n";
    out << "Egress interface: " << (setup.mEgress.empty() ? "unknown" : setup.mEgress) << "\n";

    PrintList("Public subnets", setup.mPublicNamespaces, out);
    PrintList("Public CIDRs", setup.mPublicCIDRs, out);
    PrintList("POSTROUTING rules", setup.mPostRoutingRules, out);
    PrintList("FORWARD rules", setup.mForwardRules, out);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error CommandHandler::Init(vpc::VPCRegistry& vpcRegistry, subnet::SubnetManager& subnetManager,
    peering::PeeringManager& peeringManager, nat::NATManager& natManager, firewall::FirewallManager& firewallManager,
    workload::WorkloadManager& workloadManager)
{
    mVPCRegistry     = &vpcRegistry;
    mSubnetManager   = &subnetManager;
    mPeeringManager  = &peeringManager;
    mNATManager      = &natManager;
    mFirewallManager = &firewallManager;
    mWorkloadManager = &workloadManager;

    return ErrorEnum::eNone;
}

Error CommandHandler::Execute(const std::vector<std::string>& args, std::ostream& out)
{
    if (args.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "command is required");
    }

    const auto* command = FindCommand(args[0]);
    if (command == nullptr) {
        return Error(ErrorEnum::eInvalidArgument, ("unknown command: " + args[0]).c_str());
    }

    if (args.size() != command->mArgCount + 1) {
        return Error(ErrorEnum::eInvalidArgument,
            ("usage: " + std::string(command->mName) + " " + std::string(command->mArgs)).c_str());
    }

    LOG_DBG() << "Execute command" << Log::Field("command", command->mName);

    return (this->*command->mHandler)(Args(args.begin() + 1, args.end()), out);
}

bool CommandHandler::IsMutating(const std::string& command)
{
    const auto* found = FindCommand(command);

    return found != nullptr && found->mMutating;
}

void CommandHandler::PrintCommands(std::ostream& out)
{
    out << "Commands:\n";

    for (const auto& command : GetCommands()) {
        out << "  " << command.mName << " " << command.mArgs << "\n";
    }
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

const std::vector<CommandHandler::Command>& CommandHandler::GetCommands()
{
    static const std::vector<Command> sCommands = {
        {"create-vpc", "<name> <cidr>", 2, true, &CommandHandler::CreateVPC},
        {"delete-vpc", "<name>", 1, true, &CommandHandler::DeleteVPC},
        {"list-vpcs", "", 0, false, &CommandHandler::ListVPCs},
        {"add-subnet", "<vpc> <public|private> <cidr>", 3, true, &CommandHandler::AddSubnet},
        {"delete-subnet", "<vpc> <public|private>", 2, true, &CommandHandler::DeleteSubnet},
        {"list-subnets", "", 0, false, &CommandHandler::ListSubnets},
        {"verify-subnets", "<vpc>", 1, false, &CommandHandler::VerifySubnets},
        {"create-peering", "<vpc1> <vpc2>", 2, true, &CommandHandler::CreatePeering},
        {"delete-peering", "<vpc1> <vpc2>", 2, true, &CommandHandler::DeletePeering},
        {"delete-all-peerings", "", 0, true, &CommandHandler::DeleteAllPeerings},
        {"list-peerings", "", 0, false, &CommandHandler::ListPeerings},
        {"test-isolation", "<vpc1> <vpc2>", 2, false, &CommandHandler::TestIsolation},
        {"enable-nat", "<vpc>", 1, true, &CommandHandler::EnableNAT},
        {"disable-nat", "<vpc>", 1, true, &CommandHandler::DisableNAT},
        {"reset-nat", "<vpc>", 1, true, &CommandHandler::ResetNAT},
        {"list-nat-rules", "", 0, false, &CommandHandler::ListNATRules},
        {"test-connectivity", "<vpc>", 1, false, &CommandHandler::TestConnectivity},
        {"verify-nat", "<vpc>", 1, false, &CommandHandler::VerifyNAT},
        {"diagnose-nat", "<vpc>", 1, false, &CommandHandler::DiagnoseNAT},
        {"apply-firewall", "<vpc> <rules.json>", 2, true, &CommandHandler::ApplyFirewall},
        {"test-firewall", "<vpc>", 1, false, &CommandHandler::TestFirewall},
        {"cleanup-firewall", "<vpc>", 1, true, &CommandHandler::CleanupFirewall},
        {"deploy-app", "<vpc> <public|private> <nginx|python>", 3, true, &CommandHandler::DeployApp},
        {"describe-app", "<vpc> <public|private>", 2, false, &CommandHandler::DescribeApp},
    };

    return sCommands;
}

const CommandHandler::Command* CommandHandler::FindCommand(const std::string& name)
{
    const auto& commands = GetCommands();

    auto it = std::find_if(
        commands.begin(), commands.end(), [&name](const Command& command) { return name == command.mName; });

    return it != commands.end() ? &*it : nullptr;
}

void CommandHandler::PrintReport(const common::utils::OperationReport& report, std::ostream& out)
{
    for (const auto& item : report.mSucceeded) {
        out << "  done: " << item << "\n";
    }

    for (const auto& item : report.mSkipped) {
        out << "  skipped: " << item << "\n";
    }

    for (const auto& item : report.mWarnings) {
        out << "  warning: " << item << "\n";
    }
}

Error CommandHandler::CreateVPC(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mVPCRegistry->CreateVPC(args[0], args[1], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "VPC " << args[0] << " created with CIDR " << args[1] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DeleteVPC(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mVPCRegistry->DeleteVPC(args[0], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "VPC " << args[0] << " deleted\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::ListVPCs(const Args& args, std::ostream& out)
{
    (void)args;

    std::vector<vpc::VPCSummary> vpcs;

    if (auto err = mVPCRegistry->ListVPCs(vpcs); !err.IsNone()) {
        return err;
    }

    if (vpcs.empty()) {
        out << "No VPCs\n";

        return ErrorEnum::eNone;
    }

    out << std::left << std::setw(cNameWidth) << "NAME" << std::setw(cCIDRWidth) << "CIDR" << std::setw(cLinkWidth)
        << "BRIDGE" << std::setw(cAddressWidth) << "GATEWAY" << std::setw(cStatusWidth) << "STATUS"
        << std::setw(cStatusWidth) << "LINK"
        << "CREATED\n";

    for (const auto& summary : vpcs) {
        out << std::left << std::setw(cNameWidth) << summary.mInfo.mName << std::setw(cCIDRWidth)
            << summary.mInfo.mCIDR << std::setw(cLinkWidth) << summary.mInfo.mBridge << std::setw(cAddressWidth)
            << summary.mInfo.mGateway << std::setw(cStatusWidth) << summary.mInfo.mStatus.ToString().CStr()
            << std::setw(cStatusWidth) << summary.mBridgeState.ToString().CStr()
            << common::utils::ToUTCString(summary.mInfo.mCreated) << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::AddSubnet(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mSubnetManager->AddSubnet(args[0], args[1], args[2], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << args[1] << " subnet " << args[2] << " added to VPC " << args[0] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DeleteSubnet(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mSubnetManager->DeleteSubnet(args[0], args[1], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << args[1] << " subnet of VPC " << args[0] << " deleted\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::ListSubnets(const Args& args, std::ostream& out)
{
    (void)args;

    std::vector<subnet::SubnetInfo> subnets;

    if (auto err = mSubnetManager->ListSubnets(subnets); !err.IsNone()) {
        return err;
    }

    if (subnets.empty()) {
        out << "No subnets\n";

        return ErrorEnum::eNone;
    }

    out << std::left << std::setw(cNameWidth) << "VPC" << std::setw(cStatusWidth) << "TYPE" << std::setw(cNSWidth)
        << "NAMESPACE" << std::setw(cAddressWidth) << "ADDRESS" << std::setw(cCIDRWidth) << "CIDR"
        << std::setw(cLinkWidth) << "GATEWAY"
        << "LINKS\n";

    for (const auto& subnet : subnets) {
        out << std::left << std::setw(cNameWidth) << subnet.mVPCName << std::setw(cStatusWidth)
            << subnet.mType.ToString().CStr() << std::setw(cNSWidth) << subnet.mNamespace << std::setw(cAddressWidth)
            << (subnet.mAddress.empty() ? "-" : subnet.mAddress) << std::setw(cCIDRWidth)
            << (subnet.mCIDR.empty() ? "-" : subnet.mCIDR) << std::setw(cLinkWidth)
            << (subnet.mGateway.empty() ? "-" : subnet.mGateway) << subnet.mHostLink << "/" << subnet.mNamespaceLink
            << "\n";

        for (const auto& route : subnet.mRoutes) {
            out << "  route: " << route << "\n";
        }
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::VerifySubnets(const Args& args, std::ostream& out)
{
    std::vector<subnet::ReachabilityCheck> checks;

    if (auto err = mSubnetManager->VerifySubnetConnectivity(args[0], checks); !err.IsNone()) {
        return err;
    }

    out << "Subnet connectivity of VPC " << args[0] << ":\n";

    for (const auto& check : checks) {
        out << "  " << check.mSource << " -> " << check.mTarget << " (" << check.mAddress
            << "): " << (check.mReachable ? "reachable" : "unreachable") << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::CreatePeering(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mPeeringManager->CreatePeering(args[0], args[1], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "Peering " << args[0] << " <-> " << args[1] << " established\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DeletePeering(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mPeeringManager->DeletePeering(args[0], args[1], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "Peering " << args[0] << " <-> " << args[1] << " deleted\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DeleteAllPeerings(const Args& args, std::ostream& out)
{
    (void)args;

    common::utils::OperationReport report;

    auto err = mPeeringManager->DeleteAllPeerings(report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "All peerings deleted\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::ListPeerings(const Args& args, std::ostream& out)
{
    (void)args;

    std::vector<peering::PeeringSummary> peerings;

    if (auto err = mPeeringManager->ListPeerings(peerings); !err.IsNone()) {
        return err;
    }

    if (peerings.empty()) {
        out << "No peerings\n";

        return ErrorEnum::eNone;
    }

    out << std::left << std::setw(cNameWidth) << "VPC1" << std::setw(cNameWidth) << "VPC2" << std::setw(cLinkWidth)
        << "LINK1" << std::setw(cLinkWidth) << "LINK2" << std::setw(cStatusWidth) << "STATUS"
        << "CREATED\n";

    for (const auto& summary : peerings) {
        out << std::left << std::setw(cNameWidth) << summary.mInfo.mVPC1 << std::setw(cNameWidth)
            << summary.mInfo.mVPC2 << std::setw(cLinkWidth) << summary.mInfo.mLink1 << std::setw(cLinkWidth)
            << summary.mInfo.mLink2 << std::setw(cStatusWidth) << summary.mStatus.ToString().CStr()
            << common::utils::ToUTCString(summary.mInfo.mCreated) << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::TestIsolation(const Args& args, std::ostream& out)
{
    peering::IsolationResult result;

    if (auto err = mPeeringManager->CheckIsolation(args[0], args[1], result); !err.IsNone()) {
        return err;
    }

    out << "From: " << result.mSourceNamespace << " (" << result.mSourceIP << ")\n";
    out << "To:   " << result.mTargetNamespace << " (" << result.mTargetIP << ")\n";
    out << "Reachable: " << YesNo(result.mReachable) << "\n";
    out << "Peered: " << YesNo(result.mPeered) << "\n";

    if (!result.mPeered) {
        out << "Result: " << (result.mReachable ? "isolation broken" : "isolated") << "\n";
        out << "Peering not established, use: create-peering " << args[0] << " " << args[1] << "\n";
    } else {
        out << "Result: " << (result.mPeeringWorking ? "peering working" : "peering broken") << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::EnableNAT(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mNATManager->EnableNAT(args[0], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "NAT enabled for VPC " << args[0] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DisableNAT(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mNATManager->DisableNAT(args[0], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "NAT disabled for VPC " << args[0] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::ResetNAT(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mNATManager->ResetNAT(args[0], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "NAT reset for VPC " << args[0] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::ListNATRules(const Args& args, std::ostream& out)
{
    (void)args;

    nat::HostRuleListing listing;

    if (auto err = mNATManager->ListNATRules(listing); !err.IsNone()) {
        return err;
    }

    out << "Host forwarding: " << (listing.mForwarding ? "enabled" : "disabled") << "\n";

    PrintList("POSTROUTING rules", listing.mPostRoutingRules, out);
    PrintList("FORWARD rules", listing.mForwardRules, out);

    return ErrorEnum::eNone;
}

Error CommandHandler::TestConnectivity(const Args& args, std::ostream& out)
{
    std::vector<nat::ConnectivityCheck> checks;

    if (auto err = mNATManager->TestConnectivity(args[0], checks); !err.IsNone()) {
        return err;
    }

    out << "Connectivity of VPC " << args[0] << ":\n";

    for (const auto& check : checks) {
        out << "  " << check.mNamespace << " (" << check.mType.ToString().CStr()
            << "): external " << OkFailed(check.mExternal) << ", gateway " << OkFailed(check.mGateway) << ": "
            << (check.mPassed ? "PASS" : "FAIL") << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::VerifyNAT(const Args& args, std::ostream& out)
{
    nat::NATSetup setup;

    if (auto err = mNATManager->VerifyNATSetup(args[0], setup); !err.IsNone()) {
        return err;
    }

    out << "NAT setup of VPC " << args[0] << ":\n";

    PrintNATSetup(setup, out);

    return ErrorEnum::eNone;
}

Error CommandHandler::DiagnoseNAT(const Args& args, std::ostream& out)
{
    nat::NATDiagnosis diagnosis;

    if (auto err = mNATManager->DiagnoseNATIssues(args[0], diagnosis); !err.IsNone()) {
        return err;
    }

    out << "NAT diagnosis of VPC " << args[0] << ":\n";

    PrintNATSetup(diagnosis.mSetup, out);

    out << "Host external reachability: " << YesNo(diagnosis.mHostExternalReachable) << "\n";

    if (diagnosis.mFindings.empty()) {
        out << "No issues found\n";
    } else {
        PrintList("Issues", diagnosis.mFindings, out);
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::ApplyFirewall(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mFirewallManager->ApplyFirewall(args[0], args[1], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "Firewall rules from " << args[1] << " applied to VPC " << args[0] << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::TestFirewall(const Args& args, std::ostream& out)
{
    std::vector<firewall::FirewallProbe> probes;

    if (auto err = mFirewallManager->TestFirewall(args[0], probes); !err.IsNone()) {
        return err;
    }

    out << "Firewall probes of VPC " << args[0] << ":\n";

    for (const auto& probe : probes) {
        out << "  " << probe.mNamespace << " " << probe.mAddress << " " << probe.mProtocol.ToString().CStr();

        if (probe.mPort != 0) {
            out << "/" << probe.mPort;
        }

        out << ": " << probe.mState.ToString().CStr() << "\n";
    }

    return ErrorEnum::eNone;
}

Error CommandHandler::CleanupFirewall(const Args& args, std::ostream& out)
{
    common::utils::OperationReport report;

    auto err = mFirewallManager->CleanupFirewall(args[0], report);

    PrintReport(report, out);

    if (!err.IsNone()) {
        return err;
    }

    out << "Firewall rules of VPC " << args[0] << " removed\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DeployApp(const Args& args, std::ostream& out)
{
    workload::AppInfo info;

    if (auto err = mWorkloadManager->DeployApp(args[0], args[1], args[2], info); !err.IsNone()) {
        return err;
    }

    out << "Deployed " << args[2] << " in " << info.mNamespace << ": http://" << info.mAddress << ":" << info.mPort
        << "\n";
    out << "Document root: " << info.mDocumentRoot << "\n";

    return ErrorEnum::eNone;
}

Error CommandHandler::DescribeApp(const Args& args, std::ostream& out)
{
    workload::AppDescription description;

    if (auto err = mWorkloadManager->DescribeApp(args[0], args[1], description); !err.IsNone()) {
        return err;
    }

    out << "Namespace: " << description.mNamespace << "\n";
    out << "Address: " << (description.mAddress.empty() ? "-" : description.mAddress) << "\n";

    for (const auto& port : description.mPorts) {
        out << "  port " << port.mPort << ": " << port.mState.ToString().CStr() << "\n";
    }

    return ErrorEnum::eNone;
}

} // namespace vpcctl::app
