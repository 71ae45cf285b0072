/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_UTILS_HPP_
#define VPCCTL_COMMON_NETWORK_UTILS_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <netlink/addr.h>
#include <netlink/netlink.h>

#include <common/types/common.hpp>

namespace vpcctl::common::network {

/**
 * Route info.
 */
struct RouteInfo {
    std::optional<std::string> mDestination;
    std::optional<std::string> mGateway;
    int                        mLinkIndex {};
};

/**
 * IPv4 network.
 */
struct IPv4Network {
    uint32_t mAddress {};
    int      mPrefix {};
};

using NetlinkSocketDeleter = std::function<void(nl_sock*)>;
using UniqueNetlinkSocket  = std::unique_ptr<nl_sock, NetlinkSocketDeleter>;

/**
 * Gets main table IPv4 route list.
 *
 * @param[out] routes routes.
 * @return Error.
 */
Error GetRouteList(std::vector<RouteInfo>& routes);

/**
 * Creates netlink socket.
 *
 * @return netlink socket.
 */
RetWithError<UniqueNetlinkSocket> CreateNetlinkSocket();

/**
 * Parses netlink address from CIDR.
 *
 * @param cidr CIDR to parse.
 * @return parsed address, should be released with nl_addr_put.
 */
RetWithError<nl_addr*> ParseAddress(const std::string& cidr);

/**
 * Converts netlink error to error.
 *
 * @param nlError netlink error.
 * @param message error message.
 * @return Error.
 */
Error NLToAosErr(int nlError, const std::string& message);

/**
 * Parses dotted IPv4 address.
 *
 * @param ip address.
 * @return address in host byte order.
 */
RetWithError<uint32_t> ParseIP(const std::string& ip);

/**
 * Parses IPv4 address with prefix: a.b.c.d/p.
 *
 * @param cidr CIDR.
 * @return IPv4Network.
 */
RetWithError<IPv4Network> ParseCIDR(const std::string& cidr);

/**
 * Converts address in host byte order to dotted string.
 *
 * @param ip address.
 * @return std::string.
 */
std::string IPToString(uint32_t ip);

/**
 * Returns netmask for the prefix length.
 *
 * @param prefix prefix length.
 * @return uint32_t.
 */
uint32_t PrefixToMask(int prefix);

/**
 * Returns network CIDR of an address with prefix, e.g. 10.0.1.2/24 -> 10.0.1.0/24.
 *
 * @param addr address with prefix.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> NetworkOf(const std::string& addr);

/**
 * Checks if network contains IP.
 *
 * @param networkCIDR network CIDR.
 * @param ipAddr IP address.
 * @return true if contains, false otherwise or on malformed input.
 */
bool NetworkContainsIP(const std::string& networkCIDR, const std::string& ipAddr);

/**
 * Checks if outer network fully contains inner network.
 *
 * @param outerCIDR outer network.
 * @param innerCIDR inner network.
 * @return bool.
 */
bool NetworkContainsNetwork(const std::string& outerCIDR, const std::string& innerCIDR);

/**
 * Strips prefix length from address.
 *
 * @param cidr address with optional prefix.
 * @return std::string.
 */
std::string StripPrefix(const std::string& cidr);

} // namespace vpcctl::common::network

#endif
