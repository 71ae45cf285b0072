/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_REPORT_HPP_
#define VPCCTL_COMMON_UTILS_REPORT_HPP_

#include <string>
#include <vector>

namespace vpcctl::common::utils {

/**
 * Outcome of a multi-target operation.
 */
struct OperationReport {
    std::vector<std::string> mSucceeded;
    std::vector<std::string> mSkipped;
    std::vector<std::string> mWarnings;

    /**
     * Adds succeeded item.
     *
     * @param item item.
     */
    void Succeeded(const std::string& item) { mSucceeded.push_back(item); }

    /**
     * Adds skipped item.
     *
     * @param item item.
     */
    void Skipped(const std::string& item) { mSkipped.push_back(item); }

    /**
     * Adds warning.
     *
     * @param warning warning.
     */
    void Warning(const std::string& warning) { mWarnings.push_back(warning); }

    /**
     * Appends other report.
     *
     * @param other report to append.
     */
    void Merge(const OperationReport& other)
    {
        mSucceeded.insert(mSucceeded.end(), other.mSucceeded.begin(), other.mSucceeded.end());
        mSkipped.insert(mSkipped.end(), other.mSkipped.begin(), other.mSkipped.end());
        mWarnings.insert(mWarnings.end(), other.mWarnings.begin(), other.mWarnings.end());
    }
};

} // namespace vpcctl::common::utils

#endif
