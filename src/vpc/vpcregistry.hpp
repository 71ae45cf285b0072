/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_VPCREGISTRY_HPP_
#define VPCCTL_VPC_VPCREGISTRY_HPP_

#include <mutex>
#include <vector>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>

#include "itf/storage.hpp"
#include "itf/vpclistener.hpp"
#include "itf/vpcprovider.hpp"

namespace vpcctl::vpc {

/**
 * VPC summary.
 */
struct VPCSummary {
    VPCInfo   mInfo;
    LinkState mBridgeState;
};

/**
 * VPC registry.
 */
class VPCRegistry : public VPCProviderItf {
public:
    /**
     * Initializes VPC registry.
     *
     * @param storage VPC storage.
     * @param driver network driver.
     * @return Error.
     */
    Error Init(StorageItf& storage, driver::NetworkDriverItf& driver);

    /**
     * Subscribes listener to VPC lifecycle notifications.
     *
     * @param listener listener.
     */
    void Subscribe(VPCListenerItf& listener);

    /**
     * Creates VPC: bridge with gateway address and VPC record.
     *
     * @param name VPC name.
     * @param cidr VPC CIDR.
     * @param[out] report operation report.
     * @return Error.
     */
    Error CreateVPC(const std::string& name, const std::string& cidr, common::utils::OperationReport& report);

    /**
     * Deletes VPC with its subnets, peerings and NAT rules.
     *
     * @param name VPC name.
     * @param[out] report operation report.
     * @return Error eNotFound if VPC doesn't exist.
     */
    Error DeleteVPC(const std::string& name, common::utils::OperationReport& report);

    /**
     * Lists VPCs with live bridge state.
     *
     * @param[out] vpcs VPC summaries.
     * @return Error.
     */
    Error ListVPCs(std::vector<VPCSummary>& vpcs);

    Error                     GetVPC(const std::string& name, VPCInfo& vpc) override;
    RetWithError<std::string> GetCIDR(const std::string& name) override;

private:
    Error CheckNameCollision(const std::string& name, const std::string& bridge);
    Error DeleteNamespaces(const std::string& name, common::utils::OperationReport& report);

    StorageItf*                  mStorage {};
    driver::NetworkDriverItf*    mDriver {};
    std::vector<VPCListenerItf*> mListeners;
    std::mutex                   mMutex;
};

} // namespace vpcctl::vpc

#endif
