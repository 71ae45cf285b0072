/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <arpa/inet.h>
#include <netlink/route/route.h>

#include <Poco/NumberParser.h>

#include "utils.hpp"

namespace vpcctl::common::network {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error NLToAosErr(int nlError, const std::string& message)
{
    return Error(ErrorEnum::eFailed, (message + ": " + std::string(nl_geterror(nlError))).c_str());
}

Error GetRouteList(std::vector<RouteInfo>& routes)
{
    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    nl_cache* cacheRaw;

    if (auto errRouteCache = rtnl_route_alloc_cache(sock.get(), AF_INET, 0, &cacheRaw); errRouteCache < 0) {
        return NLToAosErr(errRouteCache, "failed to allocate route cache");
    }

    [[maybe_unused]] auto cleanupCache = DeferRelease(cacheRaw, [](nl_cache* cache) { nl_cache_free(cache); });

    for (auto obj = nl_cache_get_first(cacheRaw); obj != nullptr; obj = nl_cache_get_next(obj)) {
        auto route = reinterpret_cast<struct rtnl_route*>(obj);

        if (rtnl_route_get_table(route) != RT_TABLE_MAIN) {
            continue;
        }

        auto* nh = rtnl_route_nexthop_n(route, 0);
        if (!nh) {
            continue;
        }

        RouteInfo info;

        info.mLinkIndex = rtnl_route_nh_get_ifindex(nh);

        if (const auto* dst = rtnl_route_get_dst(route); dst && nl_addr_get_prefixlen(dst) > 0) {
            char buf[INET6_ADDRSTRLEN];

            nl_addr2str(dst, buf, sizeof(buf));
            info.mDestination = buf;
        }

        if (const auto* gw = rtnl_route_nh_get_gateway(nh); gw) {
            char buf[INET6_ADDRSTRLEN];

            nl_addr2str(gw, buf, sizeof(buf));
            info.mGateway = buf;
        }

        routes.push_back(info);
    }

    return ErrorEnum::eNone;
}

RetWithError<UniqueNetlinkSocket> CreateNetlinkSocket()
{
    auto sock = UniqueNetlinkSocket(nl_socket_alloc(), nl_socket_free);
    if (!sock) {
        return {nullptr, NLToAosErr(errno, "failed to allocate netlink socket")};
    }

    if (auto errConnect = nl_connect(sock.get(), NETLINK_ROUTE); errConnect < 0) {
        return {nullptr, NLToAosErr(errConnect, "failed to connect to netlink")};
    }

    return {std::move(sock), ErrorEnum::eNone};
}

RetWithError<nl_addr*> ParseAddress(const std::string& cidr)
{
    nl_addr* addr;

    if (auto err = nl_addr_parse(cidr.c_str(), AF_INET, &addr); err < 0) {
        return {nullptr, NLToAosErr(err, "failed to parse " + cidr)};
    }

    return addr;
}

RetWithError<uint32_t> ParseIP(const std::string& ip)
{
    in_addr addr {};

    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return {0, Error(ErrorEnum::eInvalidArgument, ("invalid IPv4 address: " + ip).c_str())};
    }

    return ntohl(addr.s_addr);
}

RetWithError<IPv4Network> ParseCIDR(const std::string& cidr)
{
    auto slashPos = cidr.find('/');
    if (slashPos == std::string::npos) {
        return {{}, Error(ErrorEnum::eInvalidArgument, ("missing prefix length: " + cidr).c_str())};
    }

    auto [ip, err] = ParseIP(cidr.substr(0, slashPos));
    if (!err.IsNone()) {
        return {{}, err};
    }

    unsigned prefix = 0;

    if (!Poco::NumberParser::tryParseUnsigned(cidr.substr(slashPos + 1), prefix) || prefix > 32) {
        return {{}, Error(ErrorEnum::eInvalidArgument, ("invalid prefix length: " + cidr).c_str())};
    }

    return IPv4Network {ip, static_cast<int>(prefix)};
}

std::string IPToString(uint32_t ip)
{
    in_addr addr {};
    char    buf[INET_ADDRSTRLEN] {};

    addr.s_addr = htonl(ip);
    inet_ntop(AF_INET, &addr, buf, sizeof(buf));

    return buf;
}

uint32_t PrefixToMask(int prefix)
{
    if (prefix <= 0) {
        return 0;
    }

    return 0xFFFFFFFFu << (32 - prefix);
}

RetWithError<std::string> NetworkOf(const std::string& addr)
{
    auto [network, err] = ParseCIDR(addr);
    if (!err.IsNone()) {
        return {"", err};
    }

    return IPToString(network.mAddress & PrefixToMask(network.mPrefix)) + "/" + std::to_string(network.mPrefix);
}

bool NetworkContainsIP(const std::string& networkCIDR, const std::string& ipAddr)
{
    auto [network, err] = ParseCIDR(networkCIDR);
    if (!err.IsNone()) {
        return false;
    }

    auto [ip, ipErr] = ParseIP(StripPrefix(ipAddr));
    if (!ipErr.IsNone()) {
        return false;
    }

    auto mask = PrefixToMask(network.mPrefix);

    return (network.mAddress & mask) == (ip & mask);
}

bool NetworkContainsNetwork(const std::string& outerCIDR, const std::string& innerCIDR)
{
    auto [outer, err] = ParseCIDR(outerCIDR);
    if (!err.IsNone()) {
        return false;
    }

    auto [inner, innerErr] = ParseCIDR(innerCIDR);
    if (!innerErr.IsNone()) {
        return false;
    }

    auto mask = PrefixToMask(outer.mPrefix);

    return inner.mPrefix >= outer.mPrefix && (outer.mAddress & mask) == (inner.mAddress & mask);
}

std::string StripPrefix(const std::string& cidr)
{
    auto slashPos = cidr.find('/');

    return slashPos != std::string::npos ? cidr.substr(0, slashPos) : cidr;
}

} // namespace vpcctl::common::network
