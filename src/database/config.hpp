/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_DATABASE_CONFIG_HPP_
#define VPCCTL_DATABASE_CONFIG_HPP_

#include <string>

namespace vpcctl::database {

/**
 * Database configuration.
 */
struct Config {
    std::string mWorkingDir;
};

} // namespace vpcctl::database

#endif
