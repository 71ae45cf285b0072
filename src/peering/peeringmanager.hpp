/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_PEERING_PEERINGMANAGER_HPP_
#define VPCCTL_PEERING_PEERINGMANAGER_HPP_

#include <mutex>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>
#include <naming/naming.hpp>
#include <subnet/itf/subnetprovider.hpp>
#include <vpc/itf/vpclistener.hpp>
#include <vpc/itf/vpcprovider.hpp>

#include "itf/storage.hpp"

namespace vpcctl::peering {

/**
 * Peering status type.
 */
class PeeringStatusType {
public:
    enum class Enum {
        eActive,
        eBroken,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "active",
            "broken",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using PeeringStatusEnum = PeeringStatusType::Enum;
using PeeringStatus     = EnumStringer<PeeringStatusType>;

/**
 * Peering record with live status.
 */
struct PeeringSummary {
    PeeringInfo   mInfo;
    PeeringStatus mStatus;
};

/**
 * Isolation check result.
 */
struct IsolationResult {
    std::string mSourceNamespace;
    std::string mSourceIP;
    std::string mTargetNamespace;
    std::string mTargetIP;
    bool        mReachable {};
    bool        mPeered {};
    bool        mPeeringWorking {};
};

/**
 * Peering manager.
 */
class PeeringManager : public vpc::VPCListenerItf {
public:
    /**
     * Initializes peering manager.
     *
     * @param storage peering storage.
     * @param vpcProvider VPC provider.
     * @param subnetProvider subnet provider.
     * @param driver network driver.
     * @return Error.
     */
    Error Init(StorageItf& storage, vpc::VPCProviderItf& vpcProvider, subnet::SubnetProviderItf& subnetProvider,
        driver::NetworkDriverItf& driver);

    /**
     * Connects bridges of two VPCs, lifts their isolation and installs cross-CIDR routes in all their subnets.
     *
     * @param vpcA first VPC name.
     * @param vpcB second VPC name.
     * @param[out] report operation report.
     * @return Error eFailed if subnets exist but no route could be installed.
     */
    Error CreatePeering(const std::string& vpcA, const std::string& vpcB, common::utils::OperationReport& report);

    /**
     * Removes peering links, routes and record.
     *
     * @param vpcA first VPC name.
     * @param vpcB second VPC name.
     * @param[out] report operation report.
     * @return Error eNotFound if neither record nor links exist.
     */
    Error DeletePeering(const std::string& vpcA, const std::string& vpcB, common::utils::OperationReport& report);

    /**
     * Removes every recorded peering. Remaining peerings are processed when one fails.
     *
     * @param[out] report operation report.
     * @return Error first failure.
     */
    Error DeleteAllPeerings(common::utils::OperationReport& report);

    /**
     * Lists peerings with status reconciled against live links.
     *
     * @param[out] peerings peerings.
     * @return Error.
     */
    Error ListPeerings(std::vector<PeeringSummary>& peerings);

    /**
     * Probes reachability between subnets of two VPCs.
     *
     * @param vpcA source VPC name.
     * @param vpcB target VPC name.
     * @param[out] result check result.
     * @return Error eWrongState if a VPC has no addressed subnet.
     */
    Error CheckIsolation(const std::string& vpcA, const std::string& vpcB, IsolationResult& result);

    Error OnVPCDelete(const vpc::VPCInfo& vpc, common::utils::OperationReport& report) override;

private:
    struct RouteStats {
        size_t mAttempted {};
        size_t mInstalled {};
    };

    PeeringStatus Reconcile(const PeeringInfo& peering);
    Error         CheckLinksFree(const naming::PeeringLinkNames& links);
    Error         AttachLinks(const naming::PeeringLinkNames& links, const vpc::VPCInfo& first,
                const vpc::VPCInfo& second, common::utils::OperationReport& report);
    void          DetachLinks(const naming::PeeringLinkNames& links, const vpc::VPCInfo& first,
                 const vpc::VPCInfo& second, common::utils::OperationReport& report);
    void          AddRoutes(const std::string& vpcName, const std::string& peerCIDR, const std::string& peerGateway,
                 RouteStats& stats, common::utils::OperationReport& report);
    void          DeleteRoutes(
                 const std::string& vpcName, const std::string& peerCIDR, common::utils::OperationReport& report);
    Error         RemovePeering(const naming::PeeringLinkNames& links, common::utils::OperationReport& report);
    std::string   PickNamespace(const std::string& vpcName);

    StorageItf*                mStorage {};
    vpc::VPCProviderItf*       mVPCProvider {};
    subnet::SubnetProviderItf* mSubnetProvider {};
    driver::NetworkDriverItf*  mDriver {};
    std::mutex                 mMutex;
};

} // namespace vpcctl::peering

#endif
