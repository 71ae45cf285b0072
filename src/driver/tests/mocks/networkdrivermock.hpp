/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_DRIVER_TESTS_MOCKS_NETWORKDRIVERMOCK_HPP_
#define VPCCTL_DRIVER_TESTS_MOCKS_NETWORKDRIVERMOCK_HPP_

#include <gmock/gmock.h>

#include <driver/itf/networkdriver.hpp>

namespace vpcctl::driver::tests {

class MockNetworkDriver : public NetworkDriverItf {
public:
    MOCK_METHOD(Error, CreateBridge, (const std::string& name), (override));
    MOCK_METHOD(Error, CreateVethPair, (const std::string& name, const std::string& peer), (override));
    MOCK_METHOD(Error, DeleteLink, (const std::string& name), (override));
    MOCK_METHOD(RetWithError<LinkState>, GetLinkState, (const std::string& name), (override));
    MOCK_METHOD(Error, SetLinkUp, (const std::string& name), (override));
    MOCK_METHOD(Error, SetMaster, (const std::string& name, const std::string& bridge), (override));
    MOCK_METHOD(Error, MoveLinkToNamespace, (const std::string& name, const std::string& ns), (override));
    MOCK_METHOD(Error, AddAddress, (const std::string& name, const std::string& addr), (override));
    MOCK_METHOD(Error, DeleteAddress, (const std::string& name, const std::string& addr), (override));
    MOCK_METHOD(Error, GetAddresses, (const std::string& name, std::vector<std::string>& addresses), (override));
    MOCK_METHOD(RetWithError<std::string>, GetDefaultEgressInterface, (), (override));
    MOCK_METHOD(Error, SetHostForwarding, (bool enable), (override));
    MOCK_METHOD(RetWithError<bool>, GetHostForwarding, (), (override));
    MOCK_METHOD(Error, CreateNamespace, (const std::string& ns), (override));
    MOCK_METHOD(Error, DeleteNamespace, (const std::string& ns), (override));
    MOCK_METHOD(Error, ListNamespaces, (std::vector<std::string> & namespaces), (override));
    MOCK_METHOD(Error, SetNamespaceLinkUp, (const std::string& ns, const std::string& name), (override));
    MOCK_METHOD(Error, AddNamespaceAddress, (const std::string& ns, const std::string& name, const std::string& addr),
        (override));
    MOCK_METHOD(Error, GetNamespaceAddresses,
        (const std::string& ns, const std::string& name, std::vector<std::string>& addresses), (override));
    MOCK_METHOD(Error, AddNamespaceRoute, (const std::string& ns, const Route& route), (override));
    MOCK_METHOD(Error, DeleteNamespaceRoute, (const std::string& ns, const std::string& destination), (override));
    MOCK_METHOD(Error, GetNamespaceRoutes, (const std::string& ns, std::vector<std::string>& routes), (override));
    MOCK_METHOD(Error, SetNamespaceForwarding, (const std::string& ns, bool enable), (override));
    MOCK_METHOD(Error, RunInNamespace, (const std::string& ns, const std::vector<std::string>& args), (override));
    MOCK_METHOD(RetWithError<bool>, HasRule,
        (const std::string& ns, const std::string& table, const std::string& chain,
            const common::network::RuleBuilder& rule),
        (override));
    MOCK_METHOD(Error, AppendRule,
        (const std::string& ns, const std::string& table, const std::string& chain,
            const common::network::RuleBuilder& rule),
        (override));
    MOCK_METHOD(Error, DeleteRule,
        (const std::string& ns, const std::string& table, const std::string& chain,
            const common::network::RuleBuilder& rule),
        (override));
    MOCK_METHOD(Error, ListRules,
        (const std::string& ns, const std::string& table, const std::string& chain,
            std::vector<common::network::ListedRule>& rules),
        (override));
    MOCK_METHOD(Error, SetPolicy, (const std::string& ns, const std::string& chain, const std::string& policy),
        (override));
    MOCK_METHOD(Error, ResetFilter, (const std::string& ns), (override));
    MOCK_METHOD(bool, Ping, (const std::string& ns, const std::string& address), (override));
    MOCK_METHOD(PortState, ProbePort, (const std::string& address, uint16_t port), (override));
};

} // namespace vpcctl::driver::tests

#endif
