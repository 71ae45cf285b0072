/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>
#include <sstream>

#include <Poco/String.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <naming/naming.hpp>

#include "ruleset.hpp"

namespace vpcctl::firewall {

namespace {

constexpr auto cMaxPort = 65535;

template <typename T>
T ParseEnum(const std::string& value, const char* name)
{
    T result;

    if (auto err = result.FromString(Poco::toLower(value).c_str()); !err.IsNone()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, std::string("unknown ") + name + ": " + value);
    }

    return result;
}

uint16_t ParsePort(const Poco::Dynamic::Var& value)
{
    int port = 0;

    try {
        port = value.convert<int>();
    } catch (const Poco::Exception&) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "port is not a number: " + value.toString());
    }

    if (port < 1 || port > cMaxPort) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "port out of range: " + std::to_string(port));
    }

    return static_cast<uint16_t>(port);
}

IngressRule ParseIngressRule(const common::utils::CaseInsensitiveObjectWrapper& object)
{
    IngressRule rule;

    rule.mProtocol = ParseEnum<Protocol>(object.GetValue<std::string>("protocol"), "protocol");
    rule.mAction   = ParseEnum<Action>(object.GetValue<std::string>("action"), "action");

    if (rule.mProtocol == ProtocolEnum::eICMP) {
        return rule;
    }

    if (!object.Has("port")) {
        VPCCTL_ERROR_THROW(
            ErrorEnum::eInvalidArgument, "port is required for " + std::string(rule.mProtocol.ToString().CStr()));
    }

    rule.mPort = ParsePort(object.Get("port"));

    return rule;
}

SubnetRules ParseSubnetRules(const common::utils::CaseInsensitiveObjectWrapper& object)
{
    SubnetRules rules;

    rules.mSubnet = object.GetValue<std::string>("subnet");

    auto err = naming::ValidateCIDR(rules.mSubnet);
    VPCCTL_ERROR_CHECK_AND_THROW(err, "invalid subnet " + rules.mSubnet);

    if (!object.Has("ingress")) {
        return rules;
    }

    for (const auto& item : *object.GetArray("ingress")) {
        rules.mIngress.push_back(ParseIngressRule(common::utils::CaseInsensitiveObjectWrapper(item)));
    }

    return rules;
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Error ParseRuleSet(const std::string& json, RuleSet& ruleSet)
{
    auto [document, err] = common::utils::ParseJson(json);
    if (!err.IsNone()) {
        return Error(ErrorEnum::eInvalidArgument, "malformed rule set JSON");
    }

    try {
        common::utils::CaseInsensitiveObjectWrapper object(document);

        for (const auto& item : *object.GetArray("rules")) {
            ruleSet.mRules.push_back(ParseSubnetRules(common::utils::CaseInsensitiveObjectWrapper(item)));
        }
    } catch (const std::exception& e) {
        auto cause = common::utils::ToAosError(e, ErrorEnum::eInvalidArgument);

        return Error(ErrorEnum::eInvalidArgument, cause.Message());
    }

    return ErrorEnum::eNone;
}

Error LoadRuleSet(const std::string& path, RuleSet& ruleSet)
{
    LOG_DBG() << "Load rule set" << Log::Field("file", path.c_str());

    std::ifstream file(path);

    if (!file.is_open()) {
        return Error(ErrorEnum::eNotFound, ("can't open rule set file " + path).c_str());
    }

    std::stringstream content;

    content << file.rdbuf();

    return ParseRuleSet(content.str(), ruleSet);
}

} // namespace vpcctl::firewall
