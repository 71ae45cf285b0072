/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_FIREWALL_RULESET_HPP_
#define VPCCTL_FIREWALL_RULESET_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::firewall {

/**
 * Rule protocol type.
 */
class ProtocolType {
public:
    enum class Enum {
        eTCP,
        eUDP,
        eICMP,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "tcp",
            "udp",
            "icmp",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using ProtocolEnum = ProtocolType::Enum;
using Protocol     = EnumStringer<ProtocolType>;

/**
 * Rule action type.
 */
class ActionType {
public:
    enum class Enum {
        eAllow,
        eDeny,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "allow",
            "deny",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using ActionEnum = ActionType::Enum;
using Action     = EnumStringer<ActionType>;

/**
 * Ingress rule. Port is set for tcp and udp only.
 */
struct IngressRule {
    Protocol                mProtocol;
    std::optional<uint16_t> mPort;
    Action                  mAction;
};

/**
 * Rules of one subnet.
 */
struct SubnetRules {
    std::string              mSubnet;
    std::vector<IngressRule> mIngress;
};

/**
 * Firewall rule set.
 */
struct RuleSet {
    std::vector<SubnetRules> mRules;
};

/**
 * Parses rule set JSON document.
 *
 * @param json JSON document.
 * @param[out] ruleSet rule set.
 * @return Error eInvalidArgument on malformed document.
 */
Error ParseRuleSet(const std::string& json, RuleSet& ruleSet);

/**
 * Loads rule set from file.
 *
 * @param path file path.
 * @param[out] ruleSet rule set.
 * @return Error eNotFound if file can't be opened.
 */
Error LoadRuleSet(const std::string& path, RuleSet& ruleSet);

} // namespace vpcctl::firewall

#endif
