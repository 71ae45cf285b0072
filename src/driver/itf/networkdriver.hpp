/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_DRIVER_ITF_NETWORKDRIVER_HPP_
#define VPCCTL_DRIVER_ITF_NETWORKDRIVER_HPP_

#include <string>
#include <vector>

#include <common/network/itf/iptables.hpp>
#include <common/types/network.hpp>

namespace vpcctl::driver {

/**
 * Host namespace marker for namespace scoped operations.
 */
constexpr auto cHostNamespace = "";

/**
 * Adapter over kernel networking control surface.
 */
class NetworkDriverItf {
public:
    /**
     * Destructor.
     */
    virtual ~NetworkDriverItf() = default;

    /**
     * Creates bridge.
     *
     * @param name bridge name.
     * @return Error.
     */
    virtual Error CreateBridge(const std::string& name) = 0;

    /**
     * Creates veth pair in the host namespace.
     *
     * @param name link name.
     * @param peer peer link name.
     * @return Error.
     */
    virtual Error CreateVethPair(const std::string& name, const std::string& peer) = 0;

    /**
     * Deletes host link.
     *
     * @param name link name.
     * @return Error eNotFound if link doesn't exist.
     */
    virtual Error DeleteLink(const std::string& name) = 0;

    /**
     * Returns host link state.
     *
     * @param name link name.
     * @return RetWithError<LinkState>.
     */
    virtual RetWithError<LinkState> GetLinkState(const std::string& name) = 0;

    /**
     * Brings host link up.
     *
     * @param name link name.
     * @return Error.
     */
    virtual Error SetLinkUp(const std::string& name) = 0;

    /**
     * Attaches host link to the bridge.
     *
     * @param name link name.
     * @param bridge bridge name.
     * @return Error.
     */
    virtual Error SetMaster(const std::string& name, const std::string& bridge) = 0;

    /**
     * Moves host link into the namespace.
     *
     * @param name link name.
     * @param ns namespace name.
     * @return Error.
     */
    virtual Error MoveLinkToNamespace(const std::string& name, const std::string& ns) = 0;

    /**
     * Adds address to the host link.
     *
     * @param name link name.
     * @param addr address with prefix length.
     * @return Error.
     */
    virtual Error AddAddress(const std::string& name, const std::string& addr) = 0;

    /**
     * Deletes address from the host link.
     *
     * @param name link name.
     * @param addr address with prefix length.
     * @return Error.
     */
    virtual Error DeleteAddress(const std::string& name, const std::string& addr) = 0;

    /**
     * Returns addresses of the host link.
     *
     * @param name link name.
     * @param[out] addresses addresses with prefix length.
     * @return Error.
     */
    virtual Error GetAddresses(const std::string& name, std::vector<std::string>& addresses) = 0;

    /**
     * Returns default route egress interface.
     *
     * @return RetWithError<std::string> eNotFound if there is no default route.
     */
    virtual RetWithError<std::string> GetDefaultEgressInterface() = 0;

    /**
     * Sets host IPv4 forwarding.
     *
     * @param enable enable flag.
     * @return Error.
     */
    virtual Error SetHostForwarding(bool enable) = 0;

    /**
     * Returns host IPv4 forwarding state.
     *
     * @return RetWithError<bool>.
     */
    virtual RetWithError<bool> GetHostForwarding() = 0;

    /**
     * Creates named namespace.
     *
     * @param ns namespace name.
     * @return Error eAlreadyExist if namespace exists.
     */
    virtual Error CreateNamespace(const std::string& ns) = 0;

    /**
     * Deletes named namespace.
     *
     * @param ns namespace name.
     * @return Error eNotFound if namespace doesn't exist.
     */
    virtual Error DeleteNamespace(const std::string& ns) = 0;

    /**
     * Lists named namespaces.
     *
     * @param[out] namespaces namespace names.
     * @return Error.
     */
    virtual Error ListNamespaces(std::vector<std::string>& namespaces) = 0;

    /**
     * Brings link inside namespace up.
     *
     * @param ns namespace name.
     * @param name link name.
     * @return Error.
     */
    virtual Error SetNamespaceLinkUp(const std::string& ns, const std::string& name) = 0;

    /**
     * Adds address to link inside namespace.
     *
     * @param ns namespace name.
     * @param name link name.
     * @param addr address with prefix length.
     * @return Error.
     */
    virtual Error AddNamespaceAddress(const std::string& ns, const std::string& name, const std::string& addr) = 0;

    /**
     * Returns addresses of link inside namespace.
     *
     * @param ns namespace name.
     * @param name link name.
     * @param[out] addresses addresses with prefix length.
     * @return Error.
     */
    virtual Error GetNamespaceAddresses(
        const std::string& ns, const std::string& name, std::vector<std::string>& addresses)
        = 0;

    /**
     * Adds or replaces route inside namespace.
     *
     * @param ns namespace name.
     * @param route route.
     * @return Error.
     */
    virtual Error AddNamespaceRoute(const std::string& ns, const Route& route) = 0;

    /**
     * Deletes route inside namespace.
     *
     * @param ns namespace name.
     * @param destination route destination.
     * @return Error eNotFound if route doesn't exist.
     */
    virtual Error DeleteNamespaceRoute(const std::string& ns, const std::string& destination) = 0;

    /**
     * Returns routes of namespace.
     *
     * @param ns namespace name.
     * @param[out] routes routes.
     * @return Error.
     */
    virtual Error GetNamespaceRoutes(const std::string& ns, std::vector<std::string>& routes) = 0;

    /**
     * Sets IPv4 forwarding inside namespace.
     *
     * @param ns namespace name.
     * @param enable enable flag.
     * @return Error.
     */
    virtual Error SetNamespaceForwarding(const std::string& ns, bool enable) = 0;

    /**
     * Runs command inside namespace.
     *
     * @param ns namespace name.
     * @param args command with arguments.
     * @return Error.
     */
    virtual Error RunInNamespace(const std::string& ns, const std::vector<std::string>& args) = 0;

    /**
     * Checks if packet filter rule exists.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @param table table name.
     * @param chain chain name.
     * @param rule rule.
     * @return RetWithError<bool>.
     */
    virtual RetWithError<bool> HasRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule)
        = 0;

    /**
     * Appends packet filter rule.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @param table table name.
     * @param chain chain name.
     * @param rule rule.
     * @return Error.
     */
    virtual Error AppendRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule)
        = 0;

    /**
     * Deletes packet filter rule.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @param table table name.
     * @param chain chain name.
     * @param rule rule.
     * @return Error.
     */
    virtual Error DeleteRule(const std::string& ns, const std::string& table, const std::string& chain,
        const common::network::RuleBuilder& rule)
        = 0;

    /**
     * Lists packet filter rules.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @param table table name.
     * @param chain chain name, all chains if empty.
     * @param[out] rules rules.
     * @return Error.
     */
    virtual Error ListRules(const std::string& ns, const std::string& table, const std::string& chain,
        std::vector<common::network::ListedRule>& rules)
        = 0;

    /**
     * Sets filter table chain policy.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @param chain chain name.
     * @param policy policy target.
     * @return Error.
     */
    virtual Error SetPolicy(const std::string& ns, const std::string& chain, const std::string& policy) = 0;

    /**
     * Flushes filter table rules, deletes custom chains and zeroes counters.
     *
     * @param ns namespace name, cHostNamespace for host.
     * @return Error.
     */
    virtual Error ResetFilter(const std::string& ns) = 0;

    /**
     * Sends ICMP echo with bounded timeout.
     *
     * @param ns source namespace, cHostNamespace for host.
     * @param address destination.
     * @return bool.
     */
    virtual bool Ping(const std::string& ns, const std::string& address) = 0;

    /**
     * Probes TCP port from the host with bounded timeout.
     *
     * @param address destination.
     * @param port port.
     * @return PortState.
     */
    virtual PortState ProbePort(const std::string& address, uint16_t port) = 0;
};

} // namespace vpcctl::driver

#endif
