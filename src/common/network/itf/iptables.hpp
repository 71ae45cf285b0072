/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_ITF_IPTABLES_HPP_
#define VPCCTL_COMMON_NETWORK_ITF_IPTABLES_HPP_

#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::common::network {

/**
 * Builds iptables rule specification.
 */
class RuleBuilder {
public:
    /**
     * Matches source address.
     *
     * @param source source CIDR.
     * @return RuleBuilder&.
     */
    RuleBuilder& Source(const std::string& source) { return Add({"-s", source}); }

    /**
     * Matches destination address.
     *
     * @param destination destination CIDR.
     * @return RuleBuilder&.
     */
    RuleBuilder& Destination(const std::string& destination) { return Add({"-d", destination}); }

    /**
     * Matches input interface.
     *
     * @param iface interface name.
     * @return RuleBuilder&.
     */
    RuleBuilder& InInterface(const std::string& iface) { return Add({"-i", iface}); }

    /**
     * Matches output interface.
     *
     * @param iface interface name.
     * @return RuleBuilder&.
     */
    RuleBuilder& OutInterface(const std::string& iface) { return Add({"-o", iface}); }

    /**
     * Matches protocol.
     *
     * @param protocol protocol.
     * @return RuleBuilder&.
     */
    RuleBuilder& Protocol(const std::string& protocol) { return Add({"-p", protocol}); }

    /**
     * Matches destination port, requires protocol.
     *
     * @param port port.
     * @return RuleBuilder&.
     */
    RuleBuilder& DestinationPort(uint16_t port) { return Add({"--dport", std::to_string(port)}); }

    /**
     * Matches connection state.
     *
     * @param states comma separated states.
     * @return RuleBuilder&.
     */
    RuleBuilder& State(const std::string& states) { return Add({"-m", "state", "--state", states}); }

    /**
     * Sets rule target.
     *
     * @param target target.
     * @return RuleBuilder&.
     */
    RuleBuilder& Jump(const std::string& target) { return Add({"-j", target}); }

    /**
     * Appends raw arguments.
     *
     * @param args arguments.
     * @return RuleBuilder&.
     */
    RuleBuilder& Add(const std::vector<std::string>& args)
    {
        mArgs.insert(mArgs.end(), args.begin(), args.end());

        return *this;
    }

    /**
     * Returns rule arguments.
     *
     * @return const std::vector<std::string>&.
     */
    const std::vector<std::string>& Build() const { return mArgs; }

    /**
     * Returns rule as printable string.
     *
     * @return std::string.
     */
    std::string ToString() const
    {
        std::string result;

        for (const auto& arg : mArgs) {
            result += result.empty() ? arg : " " + arg;
        }

        return result;
    }

    /**
     * Compares rules.
     *
     * @param rhs rule to compare with.
     * @return bool.
     */
    bool operator==(const RuleBuilder& rhs) const { return mArgs == rhs.mArgs; }

    /**
     * Compares rules.
     *
     * @param rhs rule to compare with.
     * @return bool.
     */
    bool operator!=(const RuleBuilder& rhs) const { return !operator==(rhs); }

private:
    std::vector<std::string> mArgs;
};

/**
 * Rule listed by iptables -S.
 */
struct ListedRule {
    std::string mChain;
    RuleBuilder mRule;
};

/**
 * Packet filter table interface.
 */
class IPTablesItf {
public:
    /**
     * Destructor.
     */
    virtual ~IPTablesItf() = default;

    /**
     * Checks if rule exists in the chain.
     *
     * @param chain chain name.
     * @param builder rule builder.
     * @return RetWithError<bool>.
     */
    virtual RetWithError<bool> Check(const std::string& chain, const RuleBuilder& builder) = 0;

    /**
     * Appends rule to the chain.
     *
     * @param chain chain name.
     * @param builder rule builder.
     * @return Error.
     */
    virtual Error Append(const std::string& chain, const RuleBuilder& builder) = 0;

    /**
     * Deletes rule from the chain.
     *
     * @param chain chain name.
     * @param builder rule builder.
     * @return Error.
     */
    virtual Error DeleteRule(const std::string& chain, const RuleBuilder& builder) = 0;

    /**
     * Lists rules of the chain, all chains if chain is empty.
     *
     * @param chain chain name.
     * @return RetWithError<std::vector<ListedRule>>.
     */
    virtual RetWithError<std::vector<ListedRule>> ListRules(const std::string& chain) = 0;

    /**
     * Sets chain policy.
     *
     * @param chain chain name.
     * @param policy policy target.
     * @return Error.
     */
    virtual Error SetPolicy(const std::string& chain, const std::string& policy) = 0;

    /**
     * Flushes all chains.
     *
     * @return Error.
     */
    virtual Error Flush() = 0;

    /**
     * Deletes all custom chains.
     *
     * @return Error.
     */
    virtual Error DeleteChains() = 0;

    /**
     * Zeroes all counters.
     *
     * @return Error.
     */
    virtual Error ZeroCounters() = 0;
};

} // namespace vpcctl::common::network

#endif
