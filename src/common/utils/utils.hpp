/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_UTILS_HPP_
#define VPCCTL_COMMON_UTILS_UTILS_HPP_

#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::common::utils {

/**
 * Runs external command and collects its combined output.
 *
 * @param args program followed by its arguments.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> ExecCommand(const std::vector<std::string>& args);

/**
 * Joins command arguments into printable command line.
 *
 * @param args arguments.
 * @return std::string.
 */
std::string JoinArgs(const std::vector<std::string>& args);

/**
 * Splits command output into non-empty trimmed lines.
 *
 * @param output output.
 * @return std::vector<std::string>.
 */
std::vector<std::string> SplitLines(const std::string& output);

/**
 * Returns first hex characters of SHA1 digest of the value.
 *
 * @param value value to hash.
 * @param len number of hex characters.
 * @return std::string.
 */
std::string ShortHash(const std::string& value, size_t len);

} // namespace vpcctl::common::utils

#endif
