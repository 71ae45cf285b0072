/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_INTERFACEMANAGER_HPP_
#define VPCCTL_COMMON_NETWORK_INTERFACEMANAGER_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <common/types/network.hpp>

#include "utils.hpp"

// Forward declarations
struct nl_sock;
struct rtnl_link;

namespace vpcctl::common::network {

/**
 * Host network interface manager based on rtnetlink.
 */
class InterfaceManager {
public:
    /**
     * Creates bridge.
     *
     * @param name bridge name.
     * @return Error.
     */
    Error CreateBridge(const std::string& name);

    /**
     * Creates veth pair.
     *
     * @param name link name.
     * @param peer peer link name.
     * @return Error.
     */
    Error CreateVethPair(const std::string& name, const std::string& peer);

    /**
     * Removes interface.
     *
     * @param ifname interface name.
     * @return Error.
     */
    Error DeleteLink(const std::string& ifname);

    /**
     * Brings up interface.
     *
     * @param ifname interface name.
     * @return Error.
     */
    Error SetupLink(const std::string& ifname);

    /**
     * Sets master.
     *
     * @param ifname interface name.
     * @param master master.
     * @return Error.
     */
    Error SetMasterLink(const std::string& ifname, const std::string& master);

    /**
     * Moves interface into the network namespace.
     *
     * @param ifname interface name.
     * @param nsPath path of the namespace file.
     * @return Error.
     */
    Error MoveLinkToNamespace(const std::string& ifname, const std::string& nsPath);

    /**
     * Returns link state.
     *
     * @param ifname interface name.
     * @return RetWithError<LinkState>.
     */
    RetWithError<LinkState> GetLinkState(const std::string& ifname) const;

    /**
     * Adds address.
     *
     * @param ifname interface name.
     * @param addr address with prefix length.
     * @return Error.
     */
    Error AddAddr(const std::string& ifname, const std::string& addr);

    /**
     * Deletes address.
     *
     * @param ifname interface name.
     * @param addr address with prefix length.
     * @return Error.
     */
    Error DeleteAddr(const std::string& ifname, const std::string& addr);

    /**
     * Gets IPv4 address list.
     *
     * @param ifname interface name.
     * @param[out] addresses addresses with prefix length.
     * @return Error.
     */
    Error GetAddrList(const std::string& ifname, std::vector<std::string>& addresses) const;

    /**
     * Returns name of the interface used by the default route.
     *
     * @return RetWithError<std::string>.
     */
    RetWithError<std::string> GetDefaultRouteInterface() const;

private:
    using LinkDeleter = std::function<void(rtnl_link*)>;
    using UniqueLink  = std::unique_ptr<rtnl_link, LinkDeleter>;

    RetWithError<UniqueLink> CreateLink() const;
    RetWithError<UniqueLink> GetLink(nl_sock* sock, const std::string& ifname) const;
};

} // namespace vpcctl::common::network

#endif
