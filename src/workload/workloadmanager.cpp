/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <common/network/utils.hpp>
#include <common/utils/time.hpp>
#include <naming/naming.hpp>

#include "workloadmanager.hpp"

namespace vpcctl::workload {

namespace {

constexpr uint16_t cNginxPort  = 80;
constexpr uint16_t cPythonPort = 8080;

uint16_t AppPortNumber(AppType app)
{
    return app == AppTypeEnum::eNginx ? cNginxPort : cPythonPort;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error WorkloadManager::Init(
    const std::string& rootDir, subnet::SubnetProviderItf& subnetProvider, driver::NetworkDriverItf& driver)
{
    mRootDir        = rootDir;
    mSubnetProvider = &subnetProvider;
    mDriver         = &driver;

    return ErrorEnum::eNone;
}

Error WorkloadManager::DeployApp(
    const std::string& vpcName, const std::string& type, const std::string& app, AppInfo& info)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Deploy app" << Log::Field("vpc", vpcName.c_str()) << Log::Field("type", type.c_str())
              << Log::Field("app", app.c_str());

    SubnetType subnetType;
    AppType    appType;
    Error      err;

    if (Tie(subnetType, err) = naming::ParseSubnetType(type); !err.IsNone()) {
        return err;
    }

    if (err = appType.FromString(app.c_str()); !err.IsNone()) {
        return Error(ErrorEnum::eInvalidArgument, ("unknown app " + app + ", use nginx or python").c_str());
    }

    subnet::SubnetInfo subnet;

    if (err = mSubnetProvider->GetSubnet(vpcName, subnetType, subnet); !err.IsNone()) {
        return err;
    }

    if (subnet.mAddress.empty()) {
        return Error(ErrorEnum::eWrongState, ("subnet has no address: " + subnet.mNamespace).c_str());
    }

    auto port = AppPortNumber(appType);
    auto dir  = (std::filesystem::path(mRootDir) / subnet.mNamespace).string();

    if (err = WriteIndexPage(dir, subnet, appType, port); !err.IsNone()) {
        return err;
    }

    auto command = "cd '" + dir + "' && nohup python3 -m http.server " + std::to_string(port) + " > '" + dir
        + "/server.log' 2>&1 &";

    if (err = mDriver->RunInNamespace(subnet.mNamespace, {"sh", "-c", command}); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    info.mNamespace    = subnet.mNamespace;
    info.mAddress      = common::network::StripPrefix(subnet.mAddress);
    info.mPort         = port;
    info.mDocumentRoot = dir;

    LOG_INF() << "App deployed" << Log::Field("ns", info.mNamespace.c_str())
              << Log::Field("address", info.mAddress.c_str()) << Log::Field("port", port);

    return ErrorEnum::eNone;
}

Error WorkloadManager::DescribeApp(const std::string& vpcName, const std::string& type, AppDescription& description)
{
    std::lock_guard lock {mMutex};

    auto [subnetType, err] = naming::ParseSubnetType(type);
    if (!err.IsNone()) {
        return err;
    }

    subnet::SubnetInfo subnet;

    if (err = mSubnetProvider->GetSubnet(vpcName, subnetType, subnet); !err.IsNone()) {
        return err;
    }

    description.mNamespace = subnet.mNamespace;
    description.mAddress   = common::network::StripPrefix(subnet.mAddress);

    if (description.mAddress.empty()) {
        return ErrorEnum::eNone;
    }

    for (auto port : {cNginxPort, cPythonPort}) {
        description.mPorts.push_back({port, mDriver->ProbePort(description.mAddress, port)});
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error WorkloadManager::WriteIndexPage(
    const std::string& dir, const subnet::SubnetInfo& subnet, AppType app, uint16_t port)
{
    std::error_code ec;

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error(ErrorEnum::eFailed, ("can't create " + dir + ": " + ec.message()).c_str());
    }

    std::ofstream file(std::filesystem::path(dir) / "index.html");
    if (!file.is_open()) {
        return Error(ErrorEnum::eFailed, ("can't write index page in " + dir).c_str());
    }

    file << "<!DOCTYPE html>\n<html>\n<head><title>VPC " << app.ToString().CStr() << " server</title></head>\n<body>\n"
         << "<h1>Hello from " << subnet.mVPCName << " " << subnet.mType.ToString().CStr() << " subnet</h1>\n"
         << "<p>Namespace: " << subnet.mNamespace << "</p>\n"
         << "<p>Address: " << common::network::StripPrefix(subnet.mAddress) << ":" << port << "</p>\n"
         << "<p>Deployed: " << common::utils::ToUTCString(Time::Now()) << "</p>\n"
         << "</body>\n</html>\n";

    return ErrorEnum::eNone;
}

} // namespace vpcctl::workload
