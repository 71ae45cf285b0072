/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "isolation.hpp"

namespace vpcctl::vpc {

namespace {

constexpr auto cFilterTable = "filter";
constexpr auto cForward     = "FORWARD";
constexpr auto cDrop        = "DROP";

std::string Describe(const std::string& inBridge, const std::string& outBridge)
{
    return "isolation " + inBridge + " -> " + outBridge;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

common::network::RuleBuilder IsolationRule(const std::string& inBridge, const std::string& outBridge)
{
    return common::network::RuleBuilder().InInterface(inBridge).OutInterface(outBridge).Jump(cDrop);
}

Error IsolateBridges(driver::NetworkDriverItf& driver, const std::string& bridgeA, const std::string& bridgeB,
    common::utils::OperationReport& report)
{
    const std::pair<std::string, std::string> directions[] = {{bridgeA, bridgeB}, {bridgeB, bridgeA}};

    for (const auto& direction : directions) {
        auto rule = IsolationRule(direction.first, direction.second);

        auto [present, err] = driver.HasRule(driver::cHostNamespace, cFilterTable, cForward, rule);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        if (present) {
            report.Skipped(Describe(direction.first, direction.second) + " already present");

            continue;
        }

        if (err = driver.AppendRule(driver::cHostNamespace, cFilterTable, cForward, rule); !err.IsNone()) {
            return AOS_ERROR_WRAP(
                Error(err, ("can't add " + Describe(direction.first, direction.second)).c_str()));
        }

        report.Succeeded("add " + Describe(direction.first, direction.second));
    }

    return ErrorEnum::eNone;
}

Error JoinBridges(driver::NetworkDriverItf& driver, const std::string& bridgeA, const std::string& bridgeB,
    common::utils::OperationReport& report)
{
    const std::pair<std::string, std::string> directions[] = {{bridgeA, bridgeB}, {bridgeB, bridgeA}};

    for (const auto& direction : directions) {
        auto rule = IsolationRule(direction.first, direction.second);

        auto [present, err] = driver.HasRule(driver::cHostNamespace, cFilterTable, cForward, rule);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        if (!present) {
            continue;
        }

        if (err = driver.DeleteRule(driver::cHostNamespace, cFilterTable, cForward, rule); !err.IsNone()) {
            return AOS_ERROR_WRAP(
                Error(err, ("can't remove " + Describe(direction.first, direction.second)).c_str()));
        }

        report.Succeeded("remove " + Describe(direction.first, direction.second));
    }

    return ErrorEnum::eNone;
}

Error RemoveBridgeIsolation(
    driver::NetworkDriverItf& driver, const std::string& bridge, common::utils::OperationReport& report)
{
    std::vector<common::network::ListedRule> rules;

    if (auto err = driver.ListRules(driver::cHostNamespace, cFilterTable, cForward, rules); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& listed : rules) {
        const auto& args = listed.mRule.Build();

        if (args.size() != 6 || args[1] == args[3] || (args[1] != bridge && args[3] != bridge)
            || listed.mRule != IsolationRule(args[1], args[3])) {
            continue;
        }

        if (auto err = driver.DeleteRule(driver::cHostNamespace, cFilterTable, listed.mChain, listed.mRule);
            !err.IsNone()) {
            LOG_WRN() << "Can't delete isolation rule" << Log::Field("bridge", bridge.c_str()) << Log::Field(err);

            report.Warning("can't remove " + Describe(args[1], args[3]) + ": " + err.Message());

            continue;
        }

        report.Succeeded("remove " + Describe(args[1], args[3]));
    }

    return ErrorEnum::eNone;
}

} // namespace vpcctl::vpc
