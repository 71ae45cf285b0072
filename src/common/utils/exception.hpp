/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_EXCEPTION_HPP_
#define VPCCTL_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <common/types/common.hpp>

/**
 * Helper macros for argument counting
 */
#define VPCCTL_GET_NTH_ARG(_1, _2, NAME, ...) NAME

/**
 * Error throw with and without message
 */
#define VPCCTL_ERROR_THROW_1(err)          throw vpcctl::common::utils::VPCException(AOS_ERROR_WRAP(err))
#define VPCCTL_ERROR_THROW_2(err, message) throw vpcctl::common::utils::VPCException(AOS_ERROR_WRAP(err), message)
#define VPCCTL_ERROR_THROW(...)                                                                                        \
    VPCCTL_GET_NTH_ARG(__VA_ARGS__, VPCCTL_ERROR_THROW_2, VPCCTL_ERROR_THROW_1)(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define VPCCTL_ERROR_CHECK_AND_THROW_1(err)                                                                            \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        VPCCTL_ERROR_THROW_1(err);                                                                                     \
    }
#define VPCCTL_ERROR_CHECK_AND_THROW_2(err, message)                                                                   \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        VPCCTL_ERROR_THROW_2(err, message);                                                                            \
    }
#define VPCCTL_ERROR_CHECK_AND_THROW(...)                                                                              \
    VPCCTL_GET_NTH_ARG(__VA_ARGS__, VPCCTL_ERROR_CHECK_AND_THROW_2, VPCCTL_ERROR_CHECK_AND_THROW_1)(__VA_ARGS__)

namespace vpcctl::common::utils {

/**
 * VPC control exception.
 */
class VPCException : public Poco::Exception {
public:
    /**
     * Creates exception instance.
     *
     * @param err error.
     * @param message message.
     */
    explicit VPCException(const Error& err, const std::string& message = "");

    /**
     * Returns error.
     *
     * @return Error.
     */
    Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "VPC exception"; }

private:
    Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error to use for foreign exceptions.
 *
 * @return Error.
 */
Error ToAosError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed);

/**
 * Formats error as a human readable string.
 *
 * @param err error.
 * @return std::string.
 */
std::string ErrorToString(const Error& err);

} // namespace vpcctl::common::utils

#endif
