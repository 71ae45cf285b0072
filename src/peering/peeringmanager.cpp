/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/network/utils.hpp>
#include <common/utils/steprunner.hpp>
#include <vpc/isolation.hpp>

#include "peeringmanager.hpp"

namespace vpcctl::peering {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error PeeringManager::Init(StorageItf& storage, vpc::VPCProviderItf& vpcProvider,
    subnet::SubnetProviderItf& subnetProvider, driver::NetworkDriverItf& driver)
{
    mStorage        = &storage;
    mVPCProvider    = &vpcProvider;
    mSubnetProvider = &subnetProvider;
    mDriver         = &driver;

    return ErrorEnum::eNone;
}

Error PeeringManager::CreatePeering(
    const std::string& vpcA, const std::string& vpcB, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Create peering" << Log::Field("vpcA", vpcA.c_str()) << Log::Field("vpcB", vpcB.c_str());

    if (vpcA == vpcB) {
        return Error(ErrorEnum::eInvalidArgument, "can't peer VPC with itself");
    }

    auto         links = naming::PeeringLinks(vpcA, vpcB);
    vpc::VPCInfo first, second;

    if (auto err = mVPCProvider->GetVPC(links.mFirstVPC, first); !err.IsNone()) {
        return err;
    }

    if (auto err = mVPCProvider->GetVPC(links.mSecondVPC, second); !err.IsNone()) {
        return err;
    }

    for (const auto& info : {first, second}) {
        if (info.mStatus != vpc::VPCStatusEnum::eActive) {
            return Error(ErrorEnum::eWrongState, ("VPC is being deleted: " + info.mName).c_str());
        }
    }

    PeeringInfo existing;

    if (auto err = mStorage->GetPeering(links.mFirstVPC, links.mSecondVPC, existing); err.IsNone()) {
        LOG_DBG() << "Peering already exists" << Log::Field("link", existing.mLink1.c_str());

        report.Skipped("peering " + links.mFirstVPC + " <-> " + links.mSecondVPC + " already exists");

        return ErrorEnum::eNone;
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = CheckLinksFree(links); !err.IsNone()) {
        return err;
    }

    if (auto err = AttachLinks(links, first, second, report); !err.IsNone()) {
        return err;
    }

    std::string firstCIDR, secondCIDR;
    Error       err;

    if (Tie(firstCIDR, err) = mVPCProvider->GetCIDR(first.mName); !err.IsNone()) {
        return Error(ErrorEnum::eWrongState, ("CIDR of VPC " + first.mName + " is unavailable").c_str());
    }

    if (Tie(secondCIDR, err) = mVPCProvider->GetCIDR(second.mName); !err.IsNone()) {
        return Error(ErrorEnum::eWrongState, ("CIDR of VPC " + second.mName + " is unavailable").c_str());
    }

    if (err = vpc::JoinBridges(*mDriver, first.mBridge, second.mBridge, report); !err.IsNone()) {
        DetachLinks(links, first, second, report);

        return err;
    }

    RouteStats stats;

    AddRoutes(first.mName, secondCIDR, second.mGateway, stats, report);
    AddRoutes(second.mName, firstCIDR, first.mGateway, stats, report);

    if (stats.mAttempted != 0 && stats.mInstalled == 0) {
        LOG_ERR() << "No peering route installed, rolling back" << Log::Field("link1", links.mFirstLink.c_str());

        DetachLinks(links, first, second, report);

        return Error(ErrorEnum::eFailed,
            ("no peering route installed for " + first.mName + " <-> " + second.mName).c_str());
    }

    if (err = mStorage->AddPeering({first.mName, second.mName, links.mFirstLink, links.mSecondLink, Time::Now()});
        !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    report.Succeeded("store peering record " + first.mName + " <-> " + second.mName);

    LOG_INF() << "Peering created" << Log::Field("link1", links.mFirstLink.c_str())
              << Log::Field("link2", links.mSecondLink.c_str());

    return ErrorEnum::eNone;
}

Error PeeringManager::DeletePeering(
    const std::string& vpcA, const std::string& vpcB, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Delete peering" << Log::Field("vpcA", vpcA.c_str()) << Log::Field("vpcB", vpcB.c_str());

    if (vpcA == vpcB) {
        return Error(ErrorEnum::eInvalidArgument, "can't peer VPC with itself");
    }

    return RemovePeering(naming::PeeringLinks(vpcA, vpcB), report);
}

Error PeeringManager::DeleteAllPeerings(common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    std::vector<PeeringInfo> records;

    if (auto err = mStorage->GetAllPeerings(records); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    LOG_INF() << "Delete all peerings" << Log::Field("count", records.size());

    if (records.empty()) {
        report.Skipped("no peerings");

        return ErrorEnum::eNone;
    }

    Error firstErr;

    for (const auto& record : records) {
        if (auto err = RemovePeering({record.mVPC1, record.mVPC2, record.mLink1, record.mLink2}, report);
            !err.IsNone()) {
            LOG_ERR() << "Can't delete peering" << Log::Field("vpc1", record.mVPC1.c_str())
                      << Log::Field("vpc2", record.mVPC2.c_str()) << Log::Field(err);

            report.Warning("can't remove peering " + record.mVPC1 + " <-> " + record.mVPC2 + ": " + err.Message());

            if (firstErr.IsNone()) {
                firstErr = err;
            }
        }
    }

    return firstErr;
}

Error PeeringManager::ListPeerings(std::vector<PeeringSummary>& peerings)
{
    std::lock_guard lock {mMutex};

    std::vector<PeeringInfo> records;

    if (auto err = mStorage->GetAllPeerings(records); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& record : records) {
        peerings.push_back({record, Reconcile(record)});
    }

    return ErrorEnum::eNone;
}

Error PeeringManager::CheckIsolation(const std::string& vpcA, const std::string& vpcB, IsolationResult& result)
{
    std::lock_guard lock {mMutex};

    vpc::VPCInfo source, target;

    if (auto err = mVPCProvider->GetVPC(vpcA, source); !err.IsNone()) {
        return err;
    }

    if (auto err = mVPCProvider->GetVPC(vpcB, target); !err.IsNone()) {
        return err;
    }

    result.mSourceNamespace = PickNamespace(vpcA);
    result.mTargetNamespace = PickNamespace(vpcB);

    if (result.mSourceNamespace.empty() || result.mTargetNamespace.empty()) {
        return Error(ErrorEnum::eWrongState, "both VPCs need at least one subnet");
    }

    result.mSourceIP = common::network::StripPrefix(mSubnetProvider->GetNamespaceAddress(result.mSourceNamespace));
    result.mTargetIP = common::network::StripPrefix(mSubnetProvider->GetNamespaceAddress(result.mTargetNamespace));

    if (result.mSourceIP.empty() || result.mTargetIP.empty()) {
        return Error(ErrorEnum::eWrongState, "can't resolve subnet addresses");
    }

    result.mReachable = mDriver->Ping(result.mSourceNamespace, result.mTargetIP);

    auto        links = naming::PeeringLinks(vpcA, vpcB);
    PeeringInfo peering;

    if (auto err = mStorage->GetPeering(links.mFirstVPC, links.mSecondVPC, peering); err.IsNone()) {
        result.mPeered = true;
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        return AOS_ERROR_WRAP(err);
    }

    result.mPeeringWorking = result.mPeered && result.mReachable;

    LOG_INF() << "Isolation checked" << Log::Field("source", result.mSourceNamespace.c_str())
              << Log::Field("target", result.mTargetIP.c_str()) << Log::Field("reachable", result.mReachable)
              << Log::Field("peered", result.mPeered);

    return ErrorEnum::eNone;
}

Error PeeringManager::OnVPCDelete(const vpc::VPCInfo& vpc, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    std::vector<PeeringInfo> records;

    if (auto err = mStorage->GetAllPeerings(records); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& record : records) {
        if (record.mVPC1 != vpc.mName && record.mVPC2 != vpc.mName) {
            continue;
        }

        LOG_DBG() << "Remove peering of deleted VPC" << Log::Field("vpc1", record.mVPC1.c_str())
                  << Log::Field("vpc2", record.mVPC2.c_str());

        if (auto err = RemovePeering({record.mVPC1, record.mVPC2, record.mLink1, record.mLink2}, report);
            !err.IsNone()) {
            report.Warning("can't remove peering " + record.mVPC1 + " <-> " + record.mVPC2 + ": " + err.Message());
        }
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

PeeringStatus PeeringManager::Reconcile(const PeeringInfo& peering)
{
    for (const auto& link : {peering.mLink1, peering.mLink2}) {
        auto [state, err] = mDriver->GetLinkState(link);
        if (!err.IsNone()) {
            LOG_WRN() << "Can't get link state" << Log::Field("link", link.c_str()) << Log::Field(err);

            return PeeringStatus(PeeringStatusEnum::eBroken);
        }

        if (state == LinkStateEnum::eAbsent) {
            return PeeringStatus(PeeringStatusEnum::eBroken);
        }
    }

    return PeeringStatus(PeeringStatusEnum::eActive);
}

Error PeeringManager::CheckLinksFree(const naming::PeeringLinkNames& links)
{
    for (const auto& link : {links.mFirstLink, links.mSecondLink}) {
        auto [state, err] = mDriver->GetLinkState(link);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        if (state != LinkStateEnum::eAbsent) {
            return Error(ErrorEnum::eAlreadyExist, ("name collision: link " + link + " already exists").c_str());
        }
    }

    return ErrorEnum::eNone;
}

Error PeeringManager::AttachLinks(const naming::PeeringLinkNames& links, const vpc::VPCInfo& first,
    const vpc::VPCInfo& second, common::utils::OperationReport& report)
{
    common::utils::StepRunner steps("attach peering links " + links.mFirstLink + "/" + links.mSecondLink);

    steps.AddStep(
        "create link pair " + links.mFirstLink + "/" + links.mSecondLink,
        [&]() { return mDriver->CreateVethPair(links.mFirstLink, links.mSecondLink); },
        [&]() { return mDriver->DeleteLink(links.mFirstLink); });
    steps.AddStep("attach " + links.mFirstLink + " to " + first.mBridge,
        [&]() { return mDriver->SetMaster(links.mFirstLink, first.mBridge); });
    steps.AddStep("attach " + links.mSecondLink + " to " + second.mBridge,
        [&]() { return mDriver->SetMaster(links.mSecondLink, second.mBridge); });
    steps.AddStep("bring up " + links.mFirstLink, [&]() { return mDriver->SetLinkUp(links.mFirstLink); });
    steps.AddStep("bring up " + links.mSecondLink, [&]() { return mDriver->SetLinkUp(links.mSecondLink); });

    if (auto err = steps.Run(); !err.IsNone()) {
        LOG_ERR() << "Can't attach peering links, rolling back" << Log::Field(err);

        if (auto rollbackErr = steps.Rollback(); !rollbackErr.IsNone()) {
            LOG_WRN() << "Peering links rollback failed" << Log::Field(rollbackErr);

            report.Warning("rollback of " + links.mFirstLink + " failed: " + rollbackErr.Message());
        }

        return AOS_ERROR_WRAP(err);
    }

    for (const auto& step : steps.GetCompleted()) {
        report.Succeeded(step);
    }

    return ErrorEnum::eNone;
}

void PeeringManager::DetachLinks(const naming::PeeringLinkNames& links, const vpc::VPCInfo& first,
    const vpc::VPCInfo& second, common::utils::OperationReport& report)
{
    if (auto err = mDriver->DeleteLink(links.mFirstLink); !err.IsNone() && !err.Is(ErrorEnum::eNotFound)) {
        LOG_WRN() << "Can't delete peering link" << Log::Field("link", links.mFirstLink.c_str()) << Log::Field(err);

        report.Warning("can't delete link " + links.mFirstLink + ": " + err.Message());
    }

    if (auto err = vpc::IsolateBridges(*mDriver, first.mBridge, second.mBridge, report); !err.IsNone()) {
        LOG_WRN() << "Can't restore bridge isolation" << Log::Field(err);

        report.Warning("can't restore isolation of " + first.mBridge + " and " + second.mBridge + ": "
            + err.Message());
    }
}

void PeeringManager::AddRoutes(const std::string& vpcName, const std::string& peerCIDR,
    const std::string& peerGateway, RouteStats& stats, common::utils::OperationReport& report)
{
    std::vector<std::string> namespaces;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        report.Warning("can't list subnets of " + vpcName + ": " + err.Message());

        return;
    }

    if (namespaces.empty()) {
        report.Skipped("routes to " + peerCIDR + ": VPC " + vpcName + " has no subnets");

        return;
    }

    for (const auto& ns : namespaces) {
        auto key = naming::ParseNamespaceName(ns);
        if (!key.has_value()) {
            continue;
        }

        Route route {peerCIDR, peerGateway, naming::SubnetLinks(key->mVPCName, key->mType).mNamespace, true};

        stats.mAttempted++;

        if (auto err = mDriver->AddNamespaceRoute(ns, route); !err.IsNone()) {
            LOG_WRN() << "Can't add peering route" << Log::Field("ns", ns.c_str())
                      << Log::Field("destination", peerCIDR.c_str()) << Log::Field(err);

            report.Warning("can't add route to " + peerCIDR + " in " + ns + ": " + err.Message());

            continue;
        }

        report.Succeeded("route " + peerCIDR + " via " + peerGateway + " in " + ns);
        stats.mInstalled++;
    }
}

void PeeringManager::DeleteRoutes(
    const std::string& vpcName, const std::string& peerCIDR, common::utils::OperationReport& report)
{
    std::vector<std::string> namespaces;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        report.Warning("can't list subnets of " + vpcName + ": " + err.Message());

        return;
    }

    for (const auto& ns : namespaces) {
        auto err = mDriver->DeleteNamespaceRoute(ns, peerCIDR);

        if (err.IsNone()) {
            report.Succeeded("remove route " + peerCIDR + " from " + ns);
        } else if (!err.Is(ErrorEnum::eNotFound)) {
            LOG_WRN() << "Can't delete peering route" << Log::Field("ns", ns.c_str())
                      << Log::Field("destination", peerCIDR.c_str()) << Log::Field(err);

            report.Warning("can't remove route " + peerCIDR + " from " + ns + ": " + err.Message());
        }
    }
}

Error PeeringManager::RemovePeering(const naming::PeeringLinkNames& links, common::utils::OperationReport& report)
{
    PeeringInfo peering {links.mFirstVPC, links.mSecondVPC, links.mFirstLink, links.mSecondLink, {}};
    bool        recorded = false;

    if (auto err = mStorage->GetPeering(links.mFirstVPC, links.mSecondVPC, peering); err.IsNone()) {
        recorded = true;
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        return AOS_ERROR_WRAP(err);
    }

    std::vector<std::string> liveLinks;

    for (const auto& link : {peering.mLink1, peering.mLink2}) {
        auto [state, err] = mDriver->GetLinkState(link);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        if (state != LinkStateEnum::eAbsent) {
            liveLinks.push_back(link);
        }
    }

    if (!recorded && liveLinks.empty()) {
        return Error(
            ErrorEnum::eNotFound, ("peering not found: " + links.mFirstVPC + " <-> " + links.mSecondVPC).c_str());
    }

    for (const auto& link : liveLinks) {
        if (auto err = mDriver->DeleteLink(link); err.IsNone()) {
            report.Succeeded("delete link " + link);
        } else if (!err.Is(ErrorEnum::eNotFound)) {
            return AOS_ERROR_WRAP(Error(err, ("can't delete link " + link).c_str()));
        }
    }

    vpc::VPCInfo first, second;

    if (mVPCProvider->GetVPC(peering.mVPC1, first).IsNone() && mVPCProvider->GetVPC(peering.mVPC2, second).IsNone()) {
        DeleteRoutes(first.mName, second.mCIDR, report);
        DeleteRoutes(second.mName, first.mCIDR, report);

        // Isolation of a VPC being deleted goes away with its bridge.
        if (first.mStatus == vpc::VPCStatusEnum::eActive && second.mStatus == vpc::VPCStatusEnum::eActive) {
            if (auto err = vpc::IsolateBridges(*mDriver, first.mBridge, second.mBridge, report); !err.IsNone()) {
                return err;
            }
        }
    } else {
        report.Skipped("peering routes: VPC record missing");
    }

    if (recorded) {
        if (auto err = mStorage->RemovePeering(peering.mVPC1, peering.mVPC2);
            !err.IsNone() && !err.Is(ErrorEnum::eNotFound)) {
            return AOS_ERROR_WRAP(err);
        }

        report.Succeeded("remove peering record " + peering.mVPC1 + " <-> " + peering.mVPC2);
    }

    LOG_INF() << "Peering deleted" << Log::Field("vpc1", peering.mVPC1.c_str())
              << Log::Field("vpc2", peering.mVPC2.c_str());

    return ErrorEnum::eNone;
}

std::string PeeringManager::PickNamespace(const std::string& vpcName)
{
    std::vector<std::string> namespaces;

    if (auto err = mSubnetProvider->GetVPCNamespaces(vpcName, namespaces); !err.IsNone()) {
        LOG_WRN() << "Can't list subnets" << Log::Field("vpc", vpcName.c_str()) << Log::Field(err);

        return "";
    }

    return namespaces.empty() ? "" : namespaces.front();
}

} // namespace vpcctl::peering
