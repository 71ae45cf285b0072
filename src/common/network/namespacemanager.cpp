/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <filesystem>

#include <common/utils/exception.hpp>
#include <common/utils/utils.hpp>

#include "namespacemanager.hpp"

namespace vpcctl::common::network {

namespace {

bool IsMissingObject(const Error& err)
{
    const std::string message = err.Message();

    return message.find("No such file") != std::string::npos || message.find("No such process") != std::string::npos
        || message.find("Cannot find device") != std::string::npos;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error NamespaceManager::Init(const std::string& netnsDir, Executor executor)
{
    mNetnsDir = netnsDir;
    mExecutor = executor ? std::move(executor) : Executor(utils::ExecCommand);

    return ErrorEnum::eNone;
}

Error NamespaceManager::CreateNamespace(const std::string& ns)
{
    LOG_DBG() << "Create namespace" << Log::Field("ns", ns.c_str());

    if (NamespaceExists(ns)) {
        return Error(ErrorEnum::eAlreadyExist, ("namespace already exists: " + ns).c_str());
    }

    if (auto [_, err] = mExecutor({"ip", "netns", "add", ns}); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::DeleteNamespace(const std::string& ns)
{
    LOG_DBG() << "Delete namespace" << Log::Field("ns", ns.c_str());

    if (!NamespaceExists(ns)) {
        return Error(ErrorEnum::eNotFound, ("namespace not found: " + ns).c_str());
    }

    if (auto [_, err] = mExecutor({"ip", "netns", "delete", ns}); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::ListNamespaces(std::vector<std::string>& namespaces) const
{
    try {
        if (!std::filesystem::exists(mNetnsDir)) {
            return ErrorEnum::eNone;
        }

        for (const auto& entry : std::filesystem::directory_iterator(mNetnsDir)) {
            namespaces.push_back(entry.path().filename().string());
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

bool NamespaceManager::NamespaceExists(const std::string& ns) const
{
    std::error_code ec;

    return std::filesystem::exists(GetNamespacePath(ns), ec);
}

std::string NamespaceManager::GetNamespacePath(const std::string& ns) const
{
    return (std::filesystem::path(mNetnsDir) / ns).string();
}

Error NamespaceManager::SetLinkUp(const std::string& ns, const std::string& link)
{
    if (auto [_, err] = mExecutor({"ip", "-n", ns, "link", "set", "dev", link, "up"}); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::AddAddr(const std::string& ns, const std::string& link, const std::string& addr)
{
    LOG_DBG() << "Add namespace address" << Log::Field("ns", ns.c_str()) << Log::Field("link", link.c_str())
              << Log::Field("addr", addr.c_str());

    std::vector<std::string> current;

    if (auto err = GetAddrList(ns, link, current); !err.IsNone()) {
        return err;
    }

    if (std::find(current.begin(), current.end(), addr) != current.end()) {
        return ErrorEnum::eNone;
    }

    if (auto [_, err] = mExecutor({"ip", "-n", ns, "addr", "add", addr, "dev", link}); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::GetAddrList(const std::string& ns, const std::string& link, std::vector<std::string>& addresses)
{
    std::vector<std::string> args {"ip", "-n", ns, "-4", "-o", "addr", "show"};

    if (!link.empty()) {
        args.insert(args.end(), {"dev", link});
    }

    auto [output, err] = mExecutor(args);
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    // 2: vnweb1pub    inet 10.0.1.2/24 brd 10.0.1.255 scope global vnweb1pub\       valid_lft forever ...
    for (const auto& line : utils::SplitLines(output)) {
        auto pos = line.find(" inet ");
        if (pos == std::string::npos) {
            continue;
        }

        auto start = pos + 6;
        auto end   = line.find(' ', start);
        auto addr  = line.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (addr.rfind("127.", 0) == 0) {
            continue;
        }

        addresses.push_back(addr);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::AddRoute(const std::string& ns, const Route& route)
{
    LOG_DBG() << "Add namespace route" << Log::Field("ns", ns.c_str())
              << Log::Field("destination", route.mDestination.c_str()) << Log::Field("gateway", route.mGateway.c_str());

    std::vector<std::string> args {"ip", "-n", ns, "route", "replace", route.mDestination};

    if (!route.mGateway.empty()) {
        args.insert(args.end(), {"via", route.mGateway});
    }

    if (!route.mDevice.empty()) {
        args.insert(args.end(), {"dev", route.mDevice});
    }

    if (route.mOnLink) {
        args.push_back("onlink");
    }

    if (auto [_, err] = mExecutor(args); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::DeleteRoute(const std::string& ns, const std::string& destination)
{
    LOG_DBG() << "Delete namespace route" << Log::Field("ns", ns.c_str())
              << Log::Field("destination", destination.c_str());

    if (auto [_, err] = mExecutor({"ip", "-n", ns, "route", "del", destination}); !err.IsNone()) {
        if (IsMissingObject(err)) {
            return Error(ErrorEnum::eNotFound, ("route not found: " + destination).c_str());
        }

        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error NamespaceManager::GetRoutes(const std::string& ns, std::vector<std::string>& routes)
{
    auto [output, err] = mExecutor({"ip", "-n", ns, "-4", "route", "show"});
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    auto lines = utils::SplitLines(output);

    routes.insert(routes.end(), lines.begin(), lines.end());

    return ErrorEnum::eNone;
}

Error NamespaceManager::SetForwarding(const std::string& ns, bool enable)
{
    auto value = std::string("net.ipv4.ip_forward=") + (enable ? "1" : "0");

    if (auto [_, err] = Exec(ns, {"sysctl", "-w", value}); !err.IsNone()) {
        return err;
    }

    return ErrorEnum::eNone;
}

RetWithError<std::string> NamespaceManager::Exec(const std::string& ns, const std::vector<std::string>& args)
{
    std::vector<std::string> command {"ip", "netns", "exec", ns};

    command.insert(command.end(), args.begin(), args.end());

    auto [output, err] = mExecutor(command);
    if (!err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    return output;
}

} // namespace vpcctl::common::network
