/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_WORKLOAD_WORKLOADMANAGER_HPP_
#define VPCCTL_WORKLOAD_WORKLOADMANAGER_HPP_

#include <mutex>

#include <driver/itf/networkdriver.hpp>
#include <subnet/itf/subnetprovider.hpp>

namespace vpcctl::workload {

/**
 * Demo application type.
 */
class AppTypeType {
public:
    enum class Enum {
        eNginx,
        ePython,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "nginx",
            "python",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using AppTypeEnum = AppTypeType::Enum;
using AppType     = EnumStringer<AppTypeType>;

/**
 * Deployed application.
 */
struct AppInfo {
    std::string mNamespace;
    std::string mAddress;
    uint16_t    mPort {};
    std::string mDocumentRoot;
};

/**
 * Application port state.
 */
struct AppPort {
    uint16_t  mPort {};
    PortState mState;
};

/**
 * Application description.
 */
struct AppDescription {
    std::string          mNamespace;
    std::string          mAddress;
    std::vector<AppPort> mPorts;
};

/**
 * Deploys demo web servers into subnets.
 */
class WorkloadManager {
public:
    /**
     * Initializes workload manager.
     *
     * @param rootDir document root directory.
     * @param subnetProvider subnet provider.
     * @param driver network driver.
     * @return Error.
     */
    Error Init(const std::string& rootDir, subnet::SubnetProviderItf& subnetProvider, driver::NetworkDriverItf& driver);

    /**
     * Starts web server inside subnet namespace.
     *
     * @param vpcName VPC name.
     * @param type subnet type.
     * @param app application type: nginx or python.
     * @param[out] info deployed application.
     * @return Error.
     */
    Error DeployApp(const std::string& vpcName, const std::string& type, const std::string& app, AppInfo& info);

    /**
     * Probes application ports of subnet.
     *
     * @param vpcName VPC name.
     * @param type subnet type.
     * @param[out] description application description.
     * @return Error.
     */
    Error DescribeApp(const std::string& vpcName, const std::string& type, AppDescription& description);

private:
    Error WriteIndexPage(const std::string& dir, const subnet::SubnetInfo& subnet, AppType app, uint16_t port);

    std::string                mRootDir;
    subnet::SubnetProviderItf* mSubnetProvider {};
    driver::NetworkDriverItf*  mDriver {};
    std::mutex                 mMutex;
};

} // namespace vpcctl::workload

#endif
