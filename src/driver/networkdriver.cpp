/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include "networkdriver.hpp"

namespace vpcctl::driver {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error NetworkDriver::Init(const Config& config, Executor executor)
{
    LOG_DBG() << "Init network driver" << Log::Field("netnsDir", config.mNetnsDir.c_str());

    mConfig   = config;
    mExecutor = std::move(executor);

    if (auto err = mNamespaceManager.Init(mConfig.mNetnsDir, mExecutor); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mProber.Init(mConfig.mProber, mExecutor); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NetworkDriver::CreateBridge(const std::string& name)
{
    return mInterfaceManager.CreateBridge(name);
}

Error NetworkDriver::CreateVethPair(const std::string& name, const std::string& peer)
{
    return mInterfaceManager.CreateVethPair(name, peer);
}

Error NetworkDriver::DeleteLink(const std::string& name)
{
    return mInterfaceManager.DeleteLink(name);
}

RetWithError<LinkState> NetworkDriver::GetLinkState(const std::string& name)
{
    return mInterfaceManager.GetLinkState(name);
}

Error NetworkDriver::SetLinkUp(const std::string& name)
{
    return mInterfaceManager.SetupLink(name);
}

Error NetworkDriver::SetMaster(const std::string& name, const std::string& bridge)
{
    return mInterfaceManager.SetMasterLink(name, bridge);
}

Error NetworkDriver::MoveLinkToNamespace(const std::string& name, const std::string& ns)
{
    if (!mNamespaceManager.NamespaceExists(ns)) {
        return Error(ErrorEnum::eNotFound, ("namespace not found: " + ns).c_str());
    }

    return mInterfaceManager.MoveLinkToNamespace(name, mNamespaceManager.GetNamespacePath(ns));
}

Error NetworkDriver::AddAddress(const std::string& name, const std::string& addr)
{
    return mInterfaceManager.AddAddr(name, addr);
}

Error NetworkDriver::DeleteAddress(const std::string& name, const std::string& addr)
{
    return mInterfaceManager.DeleteAddr(name, addr);
}

Error NetworkDriver::GetAddresses(const std::string& name, std::vector<std::string>& addresses)
{
    return mInterfaceManager.GetAddrList(name, addresses);
}

RetWithError<std::string> NetworkDriver::GetDefaultEgressInterface()
{
    return mInterfaceManager.GetDefaultRouteInterface();
}

Error NetworkDriver::SetHostForwarding(bool enable)
{
    LOG_DBG() << "Set host forwarding" << Log::Field("enable", enable ? "true" : "false");

    std::ofstream file(mConfig.mIPForwardPath);
    if (!file.is_open()) {
        return Error(ErrorEnum::eRuntime, ("can't open " + mConfig.mIPForwardPath).c_str());
    }

    file << (enable ? "1" : "0") << std::endl;

    if (!file) {
        return Error(ErrorEnum::eRuntime, ("can't write " + mConfig.mIPForwardPath).c_str());
    }

    return ErrorEnum::eNone;
}

RetWithError<bool> NetworkDriver::GetHostForwarding()
{
    std::ifstream file(mConfig.mIPForwardPath);
    if (!file.is_open()) {
        return {false, Error(ErrorEnum::eRuntime, ("can't open " + mConfig.mIPForwardPath).c_str())};
    }

    std::string value;

    file >> value;

    return {value == "1", ErrorEnum::eNone};
}

Error NetworkDriver::CreateNamespace(const std::string& ns)
{
    return mNamespaceManager.CreateNamespace(ns);
}

Error NetworkDriver::DeleteNamespace(const std::string& ns)
{
    return mNamespaceManager.DeleteNamespace(ns);
}

Error NetworkDriver::ListNamespaces(std::vector<std::string>& namespaces)
{
    return mNamespaceManager.ListNamespaces(namespaces);
}

Error NetworkDriver::SetNamespaceLinkUp(const std::string& ns, const std::string& name)
{
    return mNamespaceManager.SetLinkUp(ns, name);
}

Error NetworkDriver::AddNamespaceAddress(const std::string& ns, const std::string& name, const std::string& addr)
{
    return mNamespaceManager.AddAddr(ns, name, addr);
}

Error NetworkDriver::GetNamespaceAddresses(
    const std::string& ns, const std::string& name, std::vector<std::string>& addresses)
{
    return mNamespaceManager.GetAddrList(ns, name, addresses);
}

Error NetworkDriver::AddNamespaceRoute(const std::string& ns, const Route& route)
{
    return mNamespaceManager.AddRoute(ns, route);
}

Error NetworkDriver::DeleteNamespaceRoute(const std::string& ns, const std::string& destination)
{
    return mNamespaceManager.DeleteRoute(ns, destination);
}

Error NetworkDriver::GetNamespaceRoutes(const std::string& ns, std::vector<std::string>& routes)
{
    return mNamespaceManager.GetRoutes(ns, routes);
}

Error NetworkDriver::SetNamespaceForwarding(const std::string& ns, bool enable)
{
    return mNamespaceManager.SetForwarding(ns, enable);
}

Error NetworkDriver::RunInNamespace(const std::string& ns, const std::vector<std::string>& args)
{
    if (auto [_, err] = mNamespaceManager.Exec(ns, args); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<bool> NetworkDriver::HasRule(const std::string& ns, const std::string& table, const std::string& chain,
    const common::network::RuleBuilder& rule)
{
    return GetIPTables(ns, table).Check(chain, rule);
}

Error NetworkDriver::AppendRule(const std::string& ns, const std::string& table, const std::string& chain,
    const common::network::RuleBuilder& rule)
{
    return GetIPTables(ns, table).Append(chain, rule);
}

Error NetworkDriver::DeleteRule(const std::string& ns, const std::string& table, const std::string& chain,
    const common::network::RuleBuilder& rule)
{
    return GetIPTables(ns, table).DeleteRule(chain, rule);
}

Error NetworkDriver::ListRules(const std::string& ns, const std::string& table, const std::string& chain,
    std::vector<common::network::ListedRule>& rules)
{
    auto [listed, err] = GetIPTables(ns, table).ListRules(chain);
    if (!err.IsNone()) {
        return err;
    }

    rules.insert(rules.end(), listed.begin(), listed.end());

    return ErrorEnum::eNone;
}

Error NetworkDriver::SetPolicy(const std::string& ns, const std::string& chain, const std::string& policy)
{
    return GetIPTables(ns, "filter").SetPolicy(chain, policy);
}

Error NetworkDriver::ResetFilter(const std::string& ns)
{
    auto& iptables = GetIPTables(ns, "filter");

    if (auto err = iptables.Flush(); !err.IsNone()) {
        return err;
    }

    if (auto err = iptables.DeleteChains(); !err.IsNone()) {
        return err;
    }

    return iptables.ZeroCounters();
}

bool NetworkDriver::Ping(const std::string& ns, const std::string& address)
{
    return mProber.Ping(ns, address);
}

PortState NetworkDriver::ProbePort(const std::string& address, uint16_t port)
{
    return mProber.ProbePort(address, port);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

common::network::IPTablesItf& NetworkDriver::GetIPTables(const std::string& ns, const std::string& table)
{
    std::lock_guard lock {mMutex};

    auto& iptables = mIPTables[{ns, table}];
    if (!iptables) {
        iptables = std::make_unique<common::network::IPTables>(table, ns, mExecutor);
    }

    return *iptables;
}

} // namespace vpcctl::driver
