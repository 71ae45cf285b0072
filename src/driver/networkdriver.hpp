/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_DRIVER_NETWORKDRIVER_HPP_
#define VPCCTL_DRIVER_NETWORKDRIVER_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include <common/network/interfacemanager.hpp>
#include <common/network/iptables.hpp>
#include <common/network/namespacemanager.hpp>
#include <common/network/prober.hpp>

#include "itf/networkdriver.hpp"

namespace vpcctl::driver {

/**
 * Network driver config.
 */
struct Config {
    std::string                   mNetnsDir      = "/run/netns";
    std::string                   mIPForwardPath = "/proc/sys/net/ipv4/ip_forward";
    common::network::ProberConfig mProber;
};

/**
 * Network driver.
 */
class NetworkDriver : public NetworkDriverItf {
public:
    using Executor = std::function<RetWithError<std::string>(const std::vector<std::string>&)>;

    /**
     * Initializes network driver.
     *
     * @param config driver config.
     * @param executor command executor, system executor is used if not set.
     * @return Error.
     */
    Error Init(const Config& config, Executor executor = nullptr);

    Error                     CreateBridge(const std::string& name) override;
    Error                     CreateVethPair(const std::string& name, const std::string& peer) override;
    Error                     DeleteLink(const std::string& name) override;
    RetWithError<LinkState>   GetLinkState(const std::string& name) override;
    Error                     SetLinkUp(const std::string& name) override;
    Error                     SetMaster(const std::string& name, const std::string& bridge) override;
    Error                     MoveLinkToNamespace(const std::string& name, const std::string& ns) override;
    Error                     AddAddress(const std::string& name, const std::string& addr) override;
    Error                     DeleteAddress(const std::string& name, const std::string& addr) override;
    Error                     GetAddresses(const std::string& name, std::vector<std::string>& addresses) override;
    RetWithError<std::string> GetDefaultEgressInterface() override;
    Error                     SetHostForwarding(bool enable) override;
    RetWithError<bool>        GetHostForwarding() override;

    Error CreateNamespace(const std::string& ns) override;
    Error DeleteNamespace(const std::string& ns) override;
    Error ListNamespaces(std::vector<std::string>& namespaces) override;
    Error SetNamespaceLinkUp(const std::string& ns, const std::string& name) override;
    Error AddNamespaceAddress(const std::string& ns, const std::string& name, const std::string& addr) override;
    Error GetNamespaceAddresses(
        const std::string& ns, const std::string& name, std::vector<std::string>& addresses) override;
    Error AddNamespaceRoute(const std::string& ns, const Route& route) override;
    Error DeleteNamespaceRoute(const std::string& ns, const std::string& destination) override;
    Error GetNamespaceRoutes(const std::string& ns, std::vector<std::string>& routes) override;
    Error SetNamespaceForwarding(const std::string& ns, bool enable) override;
    Error RunInNamespace(const std::string& ns, const std::vector<std::string>& args) override;

    RetWithError<bool> HasRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule) override;
    Error AppendRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule) override;
    Error DeleteRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule) override;
    Error ListRules(const std::string& ns, const std::string& table, const std::string& chain,
        std::vector<common::network::ListedRule>& rules) override;
    Error SetPolicy(const std::string& ns, const std::string& chain, const std::string& policy) override;
    Error ResetFilter(const std::string& ns) override;

    bool      Ping(const std::string& ns, const std::string& address) override;
    PortState ProbePort(const std::string& address, uint16_t port) override;

private:
    common::network::IPTablesItf& GetIPTables(const std::string& ns, const std::string& table);

    Config                            mConfig;
    Executor                          mExecutor;
    common::network::InterfaceManager mInterfaceManager;
    common::network::NamespaceManager mNamespaceManager;
    common::network::Prober           mProber;

    std::mutex                                                                        mMutex;
    std::map<std::pair<std::string, std::string>, std::unique_ptr<common::network::IPTables>> mIPTables;
};

} // namespace vpcctl::driver

#endif
