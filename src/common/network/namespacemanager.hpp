/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_NAMESPACEMANAGER_HPP_
#define VPCCTL_COMMON_NETWORK_NAMESPACEMANAGER_HPP_

#include <functional>
#include <string>
#include <vector>

#include <common/types/network.hpp>

namespace vpcctl::common::network {

/**
 * Named network namespace manager based on iproute2.
 */
class NamespaceManager {
public:
    using Executor = std::function<RetWithError<std::string>(const std::vector<std::string>&)>;

    /**
     * Initializes namespace manager.
     *
     * @param netnsDir directory where named namespaces are published.
     * @param executor command executor.
     * @return Error.
     */
    Error Init(const std::string& netnsDir, Executor executor = nullptr);

    /**
     * Creates named namespace.
     *
     * @param ns namespace name.
     * @return Error.
     */
    Error CreateNamespace(const std::string& ns);

    /**
     * Deletes named namespace.
     *
     * @param ns namespace name.
     * @return Error.
     */
    Error DeleteNamespace(const std::string& ns);

    /**
     * Lists named namespaces.
     *
     * @param[out] namespaces namespace names.
     * @return Error.
     */
    Error ListNamespaces(std::vector<std::string>& namespaces) const;

    /**
     * Checks if namespace exists.
     *
     * @param ns namespace name.
     * @return bool.
     */
    bool NamespaceExists(const std::string& ns) const;

    /**
     * Returns namespace file path.
     *
     * @param ns namespace name.
     * @return std::string.
     */
    std::string GetNamespacePath(const std::string& ns) const;

    /**
     * Brings up link inside namespace.
     *
     * @param ns namespace name.
     * @param link link name.
     * @return Error.
     */
    Error SetLinkUp(const std::string& ns, const std::string& link);

    /**
     * Adds address to link inside namespace.
     *
     * @param ns namespace name.
     * @param link link name.
     * @param addr address with prefix length.
     * @return Error.
     */
    Error AddAddr(const std::string& ns, const std::string& link, const std::string& addr);

    /**
     * Returns IPv4 addresses of link inside namespace.
     *
     * @param ns namespace name.
     * @param link link name, all links if empty.
     * @param[out] addresses addresses with prefix length.
     * @return Error.
     */
    Error GetAddrList(const std::string& ns, const std::string& link, std::vector<std::string>& addresses);

    /**
     * Adds or replaces route inside namespace.
     *
     * @param ns namespace name.
     * @param route route.
     * @return Error.
     */
    Error AddRoute(const std::string& ns, const Route& route);

    /**
     * Deletes route inside namespace.
     *
     * @param ns namespace name.
     * @param destination route destination.
     * @return Error.
     */
    Error DeleteRoute(const std::string& ns, const std::string& destination);

    /**
     * Returns routing table of namespace.
     *
     * @param ns namespace name.
     * @param[out] routes routes as printed by iproute2.
     * @return Error.
     */
    Error GetRoutes(const std::string& ns, std::vector<std::string>& routes);

    /**
     * Sets IPv4 forwarding inside namespace.
     *
     * @param ns namespace name.
     * @param enable enable flag.
     * @return Error.
     */
    Error SetForwarding(const std::string& ns, bool enable);

    /**
     * Runs command inside namespace.
     *
     * @param ns namespace name.
     * @param args command with arguments.
     * @return RetWithError<std::string> command output.
     */
    RetWithError<std::string> Exec(const std::string& ns, const std::vector<std::string>& args);

private:
    std::string mNetnsDir;
    Executor    mExecutor;
};

} // namespace vpcctl::common::network

#endif
