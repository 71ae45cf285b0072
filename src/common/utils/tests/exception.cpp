/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/utils/exception.hpp>

using namespace testing;

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

Error CheckedFunction(const Error& err)
{
    try {
        VPCCTL_ERROR_CHECK_AND_THROW(err, "check failed");
    } catch (const std::exception& e) {
        return ToAosError(e);
    }

    return ErrorEnum::eNone;
}

} // namespace

class ExceptionTest : public Test { };

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ExceptionTest, ThrowVPCExceptionWithMessage)
{
    try {
        VPCCTL_ERROR_THROW(ErrorEnum::eRuntime, "oops");
    } catch (const VPCException& e) {
        EXPECT_STREQ(e.what(), "VPC exception");
        EXPECT_STREQ(e.name(), "VPC exception");
        EXPECT_EQ(e.message().rfind("oops: ", 0), 0u) << e.message();

        EXPECT_TRUE(e.GetError().Is(ErrorEnum::eRuntime));
        EXPECT_STREQ(e.GetError().Message(), "oops");
    } catch (...) {
        FAIL() << "VPCException expected";
    }
}

TEST_F(ExceptionTest, ThrowVPCExceptionWithoutMessage)
{
    try {
        VPCCTL_ERROR_THROW(Error(ErrorEnum::eNotFound, "missing"));
    } catch (const VPCException& e) {
        EXPECT_TRUE(e.GetError().Is(ErrorEnum::eNotFound));
        EXPECT_STREQ(e.GetError().Message(), "missing");
        EXPECT_NE(e.message().find("missing"), std::string::npos) << e.message();
    } catch (...) {
        FAIL() << "VPCException expected";
    }
}

TEST_F(ExceptionTest, CheckAndThrow)
{
    EXPECT_TRUE(CheckedFunction(ErrorEnum::eNone).IsNone());

    auto err = CheckedFunction(Error(ErrorEnum::eAlreadyExist, "exists"));

    EXPECT_TRUE(err.Is(ErrorEnum::eAlreadyExist));
}

TEST_F(ExceptionTest, ConvertStdException)
{
    try {
        throw std::runtime_error("oops");
    } catch (const std::exception& e) {
        auto err = ToAosError(e);

        EXPECT_TRUE(err.Is(ErrorEnum::eFailed));
        EXPECT_STREQ(err.Message(), "oops");

        EXPECT_TRUE(ToAosError(e, ErrorEnum::eInvalidArgument).Is(ErrorEnum::eInvalidArgument));
    }
}

TEST_F(ExceptionTest, ConvertPocoException)
{
    try {
        throw Poco::Exception("oops");
    } catch (const Poco::Exception& e) {
        auto err = ToAosError(e);

        EXPECT_TRUE(err.Is(ErrorEnum::eFailed));
        EXPECT_STREQ(err.Message(), e.displayText().c_str());
    }
}

} // namespace vpcctl::common::utils
