/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_NAT_NATMANAGER_HPP_
#define VPCCTL_NAT_NATMANAGER_HPP_

#include <mutex>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>
#include <subnet/itf/subnetprovider.hpp>
#include <vpc/itf/vpclistener.hpp>
#include <vpc/itf/vpcprovider.hpp>

namespace vpcctl::nat {

/**
 * Per subnet connectivity check.
 */
struct ConnectivityCheck {
    std::string mNamespace;
    SubnetType  mType;
    bool        mExternal {};
    bool        mGateway {};
    bool        mPassed {};
};

/**
 * Installed NAT state of a VPC.
 */
struct NATSetup {
    bool                     mForwarding {};
    std::string              mEgress;
    std::vector<std::string> mPublicNamespaces;
    std::vector<std::string> mPublicCIDRs;
    std::vector<std::string> mPostRoutingRules;
    std::vector<std::string> mForwardRules;
};

/**
 * Host NAT and forward rules of all VPCs.
 */
struct HostRuleListing {
    bool                     mForwarding {};
    std::vector<std::string> mPostRoutingRules;
    std::vector<std::string> mForwardRules;
};

/**
 * NAT diagnosis.
 */
struct NATDiagnosis {
    NATSetup                 mSetup;
    bool                     mHostExternalReachable {};
    std::vector<std::string> mFindings;
};

/**
 * NAT manager.
 */
class NATManager : public vpc::VPCListenerItf {
public:
    /**
     * Initializes NAT manager.
     *
     * @param vpcProvider VPC provider.
     * @param subnetProvider subnet provider.
     * @param driver network driver.
     * @param externalAddress address probed to check external reachability.
     * @return Error.
     */
    Error Init(vpc::VPCProviderItf& vpcProvider, subnet::SubnetProviderItf& subnetProvider,
        driver::NetworkDriverItf& driver, const std::string& externalAddress);

    /**
     * Grants public subnets of VPC outbound access through the host default route interface.
     *
     * Every rule is checked before it is appended, so repeated calls keep the rule set unchanged.
     *
     * @param vpcName VPC name.
     * @param[out] report operation report.
     * @return Error eWrongState if there is no default route or no public subnet.
     */
    Error EnableNAT(const std::string& vpcName, common::utils::OperationReport& report);

    /**
     * Removes host NAT and forward rules of VPC.
     *
     * @param vpcName VPC name.
     * @param[out] report operation report.
     * @return Error.
     */
    Error DisableNAT(const std::string& vpcName, common::utils::OperationReport& report);

    /**
     * Removes host NAT and forward rules of VPC and installs them again.
     *
     * @param vpcName VPC name.
     * @param[out] report operation report.
     * @return Error.
     */
    Error ResetNAT(const std::string& vpcName, common::utils::OperationReport& report);

    /**
     * Lists host POSTROUTING and FORWARD rules regardless of owner.
     *
     * @param[out] listing host rules.
     * @return Error.
     */
    Error ListNATRules(HostRuleListing& listing);

    /**
     * Probes external and gateway reachability of every VPC subnet.
     *
     * @param vpcName VPC name.
     * @param[out] checks check results.
     * @return Error.
     */
    Error TestConnectivity(const std::string& vpcName, std::vector<ConnectivityCheck>& checks);

    /**
     * Returns installed NAT state of VPC.
     *
     * @param vpcName VPC name.
     * @param[out] setup NAT state.
     * @return Error.
     */
    Error VerifyNATSetup(const std::string& vpcName, NATSetup& setup);

    /**
     * Returns NAT state of VPC with detected problems.
     *
     * @param vpcName VPC name.
     * @param[out] diagnosis diagnosis.
     * @return Error.
     */
    Error DiagnoseNATIssues(const std::string& vpcName, NATDiagnosis& diagnosis);

    Error OnVPCDelete(const vpc::VPCInfo& vpc, common::utils::OperationReport& report) override;

private:
    struct HostRule {
        std::string                  mTable;
        std::string                  mChain;
        common::network::RuleBuilder mRule;
    };

    Error                 GetPublicSubnets(const std::string& vpcName, std::vector<std::string>& namespaces,
                        std::vector<std::string>& cidrs);
    std::vector<HostRule> ExpectedRules(
        const vpc::VPCInfo& vpc, const std::vector<std::string>& cidrs, const std::string& egress);
    Error CollectSetup(const vpc::VPCInfo& vpc, NATSetup& setup);
    Error InstallRules(const vpc::VPCInfo& vpc, common::utils::OperationReport& report);
    Error RemoveRules(const vpc::VPCInfo& vpc, common::utils::OperationReport& report);
    bool  BelongsToVPC(const vpc::VPCInfo& vpc, const std::vector<std::string>& publicCIDRs,
         const common::network::RuleBuilder& rule);

    vpc::VPCProviderItf*       mVPCProvider {};
    subnet::SubnetProviderItf* mSubnetProvider {};
    driver::NetworkDriverItf*  mDriver {};
    std::string                mExternalAddress;
    std::mutex                 mMutex;
};

} // namespace vpcctl::nat

#endif
