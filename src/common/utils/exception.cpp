/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <core/common/tools/string.hpp>

#include "exception.hpp"

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

VPCException::VPCException(const Error& err, const std::string& message)
    : Poco::Exception(message.empty() ? ErrorToString(err) : message + ": " + ErrorToString(err), err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
}

Error ToAosError(const std::exception& e, ErrorEnum err)
{
    if (const auto* vpcExc = dynamic_cast<const VPCException*>(&e)) {
        return vpcExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return Error {err, pocoExc->displayText().c_str()};
    }

    return Error {err, e.what()};
}

std::string ErrorToString(const Error& err)
{
    aos::StaticString<aos::cMaxErrorStrLen> errStr;

    if (errStr.Convert(err).IsNone()) {
        return errStr.CStr();
    }

    return err.Message();
}

} // namespace vpcctl::common::utils
