/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_IPTABLES_HPP_
#define VPCCTL_COMMON_NETWORK_IPTABLES_HPP_

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <core/common/tools/noncopyable.hpp>

#include "itf/iptables.hpp"

namespace vpcctl::common::network {

/**
 * Implementation of iptables, optionally bound to a named network namespace.
 */
class IPTables : public IPTablesItf, private aos::NonCopyable {
public:
    using Executor = std::function<RetWithError<std::string>(const std::vector<std::string>&)>;

    /**
     * Constructor.
     *
     * @param table table name.
     * @param ns network namespace name, empty for host.
     * @param executor command executor.
     */
    explicit IPTables(const std::string& table = "filter", const std::string& ns = "", Executor executor = nullptr);

    RetWithError<bool> Check(const std::string& chain, const RuleBuilder& builder) override;
    Error              Append(const std::string& chain, const RuleBuilder& builder) override;
    Error              DeleteRule(const std::string& chain, const RuleBuilder& builder) override;
    RetWithError<std::vector<ListedRule>> ListRules(const std::string& chain) override;
    Error                                 SetPolicy(const std::string& chain, const std::string& policy) override;
    Error                                 Flush() override;
    Error                                 DeleteChains() override;
    Error                                 ZeroCounters() override;

    /**
     * Parses rule printed by iptables -S.
     *
     * @param line rule line.
     * @return std::optional<ListedRule>.
     */
    static std::optional<ListedRule> ParseListedRule(const std::string& line);

private:
    std::vector<std::string>  Command(const std::vector<std::string>& args) const;
    RetWithError<std::string> Execute(const std::vector<std::string>& args);

    std::string mTable;
    std::string mNamespace;
    Executor    mExecutor;
    std::mutex  mMutex;
};

} // namespace vpcctl::common::network

#endif
