/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <arpa/inet.h>
#include <fcntl.h>
#include <linux/if.h>
#include <netlink/netlink.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/link/veth.h>
#include <unistd.h>

#include "interfacemanager.hpp"

namespace vpcctl::common::network {

namespace {

bool IsNotFound(int nlError)
{
    return nlError == -NLE_OBJ_NOTFOUND || nlError == -NLE_NODEV;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error InterfaceManager::CreateBridge(const std::string& name)
{
    LOG_DBG() << "Create bridge" << Log::Field("name", name.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [link, linkErr] = CreateLink();
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    rtnl_link_set_name(link.get(), name.c_str());

    if (auto errType = rtnl_link_set_type(link.get(), "bridge"); errType < 0) {
        return NLToAosErr(errType, "failed to set bridge type");
    }

    if (auto errLinkAdd = rtnl_link_add(sock.get(), link.get(), NLM_F_CREATE | NLM_F_EXCL); errLinkAdd < 0) {
        if (errLinkAdd == -NLE_EXIST) {
            return Error(ErrorEnum::eAlreadyExist, ("link already exists: " + name).c_str());
        }

        return NLToAosErr(errLinkAdd, "failed to add bridge " + name);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::CreateVethPair(const std::string& name, const std::string& peer)
{
    LOG_DBG() << "Create veth pair" << Log::Field("name", name.c_str()) << Log::Field("peer", peer.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto link = DeferRelease(rtnl_link_veth_alloc(), rtnl_link_put);
    if (!link) {
        return NLToAosErr(-NLE_NOMEM, "failed to allocate veth object");
    }

    auto peerLink = DeferRelease(rtnl_link_veth_get_peer(link.Get()), rtnl_link_put);
    if (!peerLink) {
        return NLToAosErr(-NLE_NOMEM, "failed to get veth peer object");
    }

    rtnl_link_set_name(link.Get(), name.c_str());
    rtnl_link_set_name(peerLink.Get(), peer.c_str());

    if (auto errLinkAdd = rtnl_link_add(sock.get(), link.Get(), NLM_F_CREATE | NLM_F_EXCL); errLinkAdd < 0) {
        if (errLinkAdd == -NLE_EXIST) {
            return Error(ErrorEnum::eAlreadyExist, ("link already exists: " + name + " or " + peer).c_str());
        }

        return NLToAosErr(errLinkAdd, "failed to add veth pair " + name);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::DeleteLink(const std::string& ifname)
{
    LOG_DBG() << "Remove interface" << Log::Field("ifname", ifname.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [link, linkErr] = CreateLink();
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    rtnl_link_set_name(link.get(), ifname.c_str());

    if (auto errLinkDel = rtnl_link_delete(sock.get(), link.get()); errLinkDel < 0) {
        if (IsNotFound(errLinkDel)) {
            return Error(ErrorEnum::eNotFound, ("link not found: " + ifname).c_str());
        }

        return NLToAosErr(errLinkDel, "failed to delete link " + ifname);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::SetupLink(const std::string& ifname)
{
    LOG_DBG() << "Bring up interface" << Log::Field("ifname", ifname.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    auto [change, changeErr] = CreateLink();
    if (!changeErr.IsNone()) {
        return changeErr;
    }

    rtnl_link_set_flags(change.get(), IFF_UP);

    if (auto errLinkChange = rtnl_link_change(sock.get(), link.get(), change.get(), 0); errLinkChange < 0) {
        return NLToAosErr(errLinkChange, "failed to set link up " + ifname);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::SetMasterLink(const std::string& ifname, const std::string& master)
{
    LOG_DBG() << "Set master for interface" << Log::Field("ifname", ifname.c_str())
              << Log::Field("master", master.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [masterLink, masterErr] = GetLink(sock.get(), master);
    if (!masterErr.IsNone()) {
        return masterErr;
    }

    auto [slaveLink, slaveErr] = GetLink(sock.get(), ifname);
    if (!slaveErr.IsNone()) {
        return slaveErr;
    }

    auto [change, changeErr] = CreateLink();
    if (!changeErr.IsNone()) {
        return changeErr;
    }

    rtnl_link_set_master(change.get(), rtnl_link_get_ifindex(masterLink.get()));

    if (auto errLinkChange = rtnl_link_change(sock.get(), slaveLink.get(), change.get(), 0); errLinkChange < 0) {
        return NLToAosErr(errLinkChange, "failed to set master for " + ifname + " to bridge " + master);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::MoveLinkToNamespace(const std::string& ifname, const std::string& nsPath)
{
    LOG_DBG() << "Move interface to namespace" << Log::Field("ifname", ifname.c_str())
              << Log::Field("ns", nsPath.c_str());

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    int nsFd = open(nsPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (nsFd < 0) {
        return Error(errno, ("can't open namespace " + nsPath).c_str());
    }

    [[maybe_unused]] auto closeFd = DeferRelease(&nsFd, [](int* fd) { close(*fd); });

    auto [change, changeErr] = CreateLink();
    if (!changeErr.IsNone()) {
        return changeErr;
    }

    rtnl_link_set_ns_fd(change.get(), nsFd);

    if (auto errLinkChange = rtnl_link_change(sock.get(), link.get(), change.get(), 0); errLinkChange < 0) {
        return NLToAosErr(errLinkChange, "failed to move " + ifname + " to " + nsPath);
    }

    return ErrorEnum::eNone;
}

RetWithError<LinkState> InterfaceManager::GetLinkState(const std::string& ifname) const
{
    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return {LinkStateEnum::eAbsent, err};
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (linkErr.Is(ErrorEnum::eNotFound)) {
        return LinkState(LinkStateEnum::eAbsent);
    }

    if (!linkErr.IsNone()) {
        return {LinkStateEnum::eAbsent, linkErr};
    }

    if (rtnl_link_get_flags(link.get()) & IFF_UP) {
        return LinkState(LinkStateEnum::eUp);
    }

    return LinkState(LinkStateEnum::eDown);
}

Error InterfaceManager::AddAddr(const std::string& ifname, const std::string& addr)
{
    LOG_DBG() << "Add address to interface" << Log::Field("ifname", ifname.c_str()) << Log::Field("addr", addr.c_str());

    auto [network, err] = ParseCIDR(addr);
    if (!err.IsNone()) {
        return err;
    }

    auto [sock, sockErr] = CreateNetlinkSocket();
    if (!sockErr.IsNone()) {
        return sockErr;
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    auto addrObj = DeferRelease(rtnl_addr_alloc(), rtnl_addr_put);
    if (!addrObj) {
        return NLToAosErr(-NLE_NOMEM, "failed to allocate address object");
    }

    rtnl_addr_set_ifindex(addrObj.Get(), rtnl_link_get_ifindex(link.get()));

    auto [local, localErr] = ParseAddress(addr);
    if (!localErr.IsNone()) {
        return localErr;
    }

    [[maybe_unused]] auto cleanupLocal = DeferRelease(local, [](nl_addr* addr) { nl_addr_put(addr); });

    rtnl_addr_set_local(addrObj.Get(), local);
    rtnl_addr_set_prefixlen(addrObj.Get(), network.mPrefix);

    // Broadcast: ip | ~netmask
    auto broadcast = IPToString(network.mAddress | ~PrefixToMask(network.mPrefix));

    if (auto [brd, brdErr] = ParseAddress(broadcast); brdErr.IsNone()) {
        [[maybe_unused]] auto cleanupBrd = DeferRelease(brd, [](nl_addr* addr) { nl_addr_put(addr); });

        rtnl_addr_set_broadcast(addrObj.Get(), brd);
    }

    if (auto errAddrAdd = rtnl_addr_add(sock.get(), addrObj.Get(), 0); errAddrAdd < 0 && errAddrAdd != -NLE_EXIST) {
        return NLToAosErr(errAddrAdd, "failed to add address " + addr + " to " + ifname);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::DeleteAddr(const std::string& ifname, const std::string& addr)
{
    LOG_DBG() << "Delete address from interface" << Log::Field("ifname", ifname.c_str())
              << Log::Field("addr", addr.c_str());

    auto [network, err] = ParseCIDR(addr);
    if (!err.IsNone()) {
        return err;
    }

    auto [sock, sockErr] = CreateNetlinkSocket();
    if (!sockErr.IsNone()) {
        return sockErr;
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    auto addrObj = DeferRelease(rtnl_addr_alloc(), rtnl_addr_put);
    if (!addrObj) {
        return NLToAosErr(-NLE_NOMEM, "failed to allocate address object");
    }

    rtnl_addr_set_ifindex(addrObj.Get(), rtnl_link_get_ifindex(link.get()));

    auto [local, localErr] = ParseAddress(addr);
    if (!localErr.IsNone()) {
        return localErr;
    }

    [[maybe_unused]] auto cleanupLocal = DeferRelease(local, [](nl_addr* addr) { nl_addr_put(addr); });

    rtnl_addr_set_local(addrObj.Get(), local);
    rtnl_addr_set_prefixlen(addrObj.Get(), network.mPrefix);

    if (auto errAddrDelete = rtnl_addr_delete(sock.get(), addrObj.Get(), 0); errAddrDelete < 0) {
        if (errAddrDelete == -NLE_NOADDR || IsNotFound(errAddrDelete)) {
            return Error(ErrorEnum::eNotFound, ("address not found: " + addr).c_str());
        }

        return NLToAosErr(errAddrDelete, "failed to delete address " + addr + " from " + ifname);
    }

    return ErrorEnum::eNone;
}

Error InterfaceManager::GetAddrList(const std::string& ifname, std::vector<std::string>& addresses) const
{
    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return err;
    }

    auto [link, linkErr] = GetLink(sock.get(), ifname);
    if (!linkErr.IsNone()) {
        return linkErr;
    }

    nl_cache* cacheRaw;

    if (auto errAddrCache = rtnl_addr_alloc_cache(sock.get(), &cacheRaw); errAddrCache < 0) {
        return NLToAosErr(errAddrCache, "failed to allocate address cache");
    }

    [[maybe_unused]] auto cleanupCache = DeferRelease(cacheRaw, [](nl_cache* cache) { nl_cache_free(cache); });

    auto ifindex = rtnl_link_get_ifindex(link.get());

    for (auto obj = nl_cache_get_first(cacheRaw); obj != nullptr; obj = nl_cache_get_next(obj)) {
        auto addr = reinterpret_cast<struct rtnl_addr*>(obj);

        if (rtnl_addr_get_ifindex(addr) != ifindex || rtnl_addr_get_family(addr) != AF_INET) {
            continue;
        }

        if (const auto* local = rtnl_addr_get_local(addr); local) {
            char buf[INET_ADDRSTRLEN];

            nl_addr2str(local, buf, sizeof(buf));

            addresses.push_back(StripPrefix(buf) + "/" + std::to_string(rtnl_addr_get_prefixlen(addr)));
        }
    }

    return ErrorEnum::eNone;
}

RetWithError<std::string> InterfaceManager::GetDefaultRouteInterface() const
{
    std::vector<RouteInfo> routes;

    if (auto err = GetRouteList(routes); !err.IsNone()) {
        return {"", err};
    }

    auto it = std::find_if(
        routes.begin(), routes.end(), [](const RouteInfo& route) { return !route.mDestination.has_value(); });

    if (it == routes.end()) {
        return {"", Error(ErrorEnum::eNotFound, "no default route found")};
    }

    auto [sock, err] = CreateNetlinkSocket();
    if (!err.IsNone()) {
        return {"", err};
    }

    rtnl_link* linkRaw = nullptr;

    if (auto errGet = rtnl_link_get_kernel(sock.get(), it->mLinkIndex, nullptr, &linkRaw); errGet < 0) {
        return {"", NLToAosErr(errGet, "failed to get default route interface")};
    }

    auto link = DeferRelease(linkRaw, rtnl_link_put);

    return std::string(rtnl_link_get_name(link.Get()));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<InterfaceManager::UniqueLink> InterfaceManager::CreateLink() const
{
    auto link = UniqueLink(rtnl_link_alloc(), rtnl_link_put);
    if (!link) {
        return {nullptr, NLToAosErr(-NLE_NOMEM, "failed to allocate link object")};
    }

    return {std::move(link), ErrorEnum::eNone};
}

RetWithError<InterfaceManager::UniqueLink> InterfaceManager::GetLink(nl_sock* sock, const std::string& ifname) const
{
    rtnl_link* linkRaw = nullptr;

    if (auto errGet = rtnl_link_get_kernel(sock, 0, ifname.c_str(), &linkRaw); errGet < 0) {
        if (IsNotFound(errGet)) {
            return {nullptr, Error(ErrorEnum::eNotFound, ("link not found: " + ifname).c_str())};
        }

        return {nullptr, NLToAosErr(errGet, "failed to get link " + ifname)};
    }

    return {UniqueLink(linkRaw, rtnl_link_put), ErrorEnum::eNone};
}

} // namespace vpcctl::common::network
