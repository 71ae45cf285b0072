/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <common/utils/utils.hpp>

#include "iptables.hpp"

namespace vpcctl::common::network {

namespace {

std::vector<std::string> Tokenize(const std::string& line)
{
    std::vector<std::string> tokens;
    std::string              token;
    bool                     quoted = false;

    for (auto ch : line) {
        if (ch == '"') {
            quoted = !quoted;

            continue;
        }

        if (!quoted && (ch == ' ' || ch == '\t')) {
            if (!token.empty()) {
                tokens.push_back(token);
                token.clear();
            }

            continue;
        }

        token += ch;
    }

    if (!token.empty()) {
        tokens.push_back(token);
    }

    return tokens;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

IPTables::IPTables(const std::string& table, const std::string& ns, Executor executor)
    : mTable(table)
    , mNamespace(ns)
    , mExecutor(executor ? std::move(executor) : Executor(utils::ExecCommand))
{
}

RetWithError<bool> IPTables::Check(const std::string& chain, const RuleBuilder& builder)
{
    std::lock_guard lock {mMutex};

    std::vector<std::string> args {"-C", chain};

    args.insert(args.end(), builder.Build().begin(), builder.Build().end());

    auto [_, err] = Execute(args);

    // iptables -C exits with non zero code when rule is absent
    if (err.Is(ErrorEnum::eRuntime)) {
        return false;
    }

    if (!err.IsNone()) {
        return {false, err};
    }

    return true;
}

Error IPTables::Append(const std::string& chain, const RuleBuilder& builder)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Append rule" << Log::Field("table", mTable.c_str()) << Log::Field("chain", chain.c_str())
              << Log::Field("rule", builder.ToString().c_str());

    std::vector<std::string> args {"-A", chain};

    args.insert(args.end(), builder.Build().begin(), builder.Build().end());

    return Execute(args).mError;
}

Error IPTables::DeleteRule(const std::string& chain, const RuleBuilder& builder)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Delete rule" << Log::Field("table", mTable.c_str()) << Log::Field("chain", chain.c_str())
              << Log::Field("rule", builder.ToString().c_str());

    std::vector<std::string> args {"-D", chain};

    args.insert(args.end(), builder.Build().begin(), builder.Build().end());

    return Execute(args).mError;
}

RetWithError<std::vector<ListedRule>> IPTables::ListRules(const std::string& chain)
{
    std::lock_guard lock {mMutex};

    std::vector<std::string> args {"-S"};

    if (!chain.empty()) {
        args.push_back(chain);
    }

    auto [output, err] = Execute(args);
    if (!err.IsNone()) {
        return {{}, err};
    }

    std::vector<ListedRule> rules;

    for (const auto& line : utils::SplitLines(output)) {
        if (auto rule = ParseListedRule(line); rule.has_value()) {
            rules.push_back(std::move(*rule));
        }
    }

    return rules;
}

Error IPTables::SetPolicy(const std::string& chain, const std::string& policy)
{
    std::lock_guard lock {mMutex};

    return Execute({"-P", chain, policy}).mError;
}

Error IPTables::Flush()
{
    std::lock_guard lock {mMutex};

    return Execute({"-F"}).mError;
}

Error IPTables::DeleteChains()
{
    std::lock_guard lock {mMutex};

    return Execute({"-X"}).mError;
}

Error IPTables::ZeroCounters()
{
    std::lock_guard lock {mMutex};

    return Execute({"-Z"}).mError;
}

std::optional<ListedRule> IPTables::ParseListedRule(const std::string& line)
{
    auto tokens = Tokenize(line);

    if (tokens.size() < 2 || tokens[0] != "-A") {
        return std::nullopt;
    }

    ListedRule rule;

    rule.mChain = tokens[1];
    rule.mRule.Add(std::vector<std::string>(tokens.begin() + 2, tokens.end()));

    return rule;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::vector<std::string> IPTables::Command(const std::vector<std::string>& args) const
{
    std::vector<std::string> command;

    if (!mNamespace.empty()) {
        command = {"ip", "netns", "exec", mNamespace};
    }

    command.insert(command.end(), {"iptables", "-w", "-t", mTable});
    command.insert(command.end(), args.begin(), args.end());

    return command;
}

RetWithError<std::string> IPTables::Execute(const std::vector<std::string>& args)
{
    auto [output, err] = mExecutor(Command(args));
    if (!err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    return output;
}

} // namespace vpcctl::common::network
