/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_CONFIG_CONFIG_HPP_
#define VPCCTL_CONFIG_CONFIG_HPP_

#include <string>
#include <vector>

#include <common/types/common.hpp>
#include <database/config.hpp>
#include <driver/networkdriver.hpp>

namespace vpcctl::config {

/**
 * Probe configuration.
 */
struct ProbeConfig {
    std::string           mExternalAddress;
    std::vector<uint16_t> mPorts;
};

/**
 * Workload configuration.
 */
struct WorkloadConfig {
    std::string mRootDir;
};

/**
 * vpcctl configuration.
 */
struct Config {
    std::string      mWorkingDir;
    std::string      mLogLevel;
    database::Config mDatabase;
    driver::Config   mDriver;
    ProbeConfig      mProbe;
    WorkloadConfig   mWorkload;
};

/**
 * Parses configuration from the file. Config is filled with default values if the file doesn't exist.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return Error eNotFound if the file doesn't exist.
 */
Error ParseConfig(const std::string& filename, Config& config);

} // namespace vpcctl::config

#endif
