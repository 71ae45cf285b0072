/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_TIME_HPP_
#define VPCCTL_COMMON_UTILS_TIME_HPP_

#include <string>

#include <common/types/common.hpp>

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses duration from string, e.g. "1s", "500ms", "1m30s".
 *
 * @param duration duration string.
 * @return parsed duration.
 */
RetWithError<Duration> ParseDuration(const std::string& duration);

/**
 * Converts time into a UTC string.
 *
 * @param time time object.
 * @return std::string.
 */
std::string ToUTCString(const Time& time);

} // namespace vpcctl::common::utils

#endif
