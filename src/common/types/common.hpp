/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_TYPES_COMMON_HPP_
#define VPCCTL_COMMON_TYPES_COMMON_HPP_

#include <core/common/tools/enum.hpp>
#include <core/common/tools/error.hpp>
#include <core/common/tools/logger.hpp>
#include <core/common/tools/memory.hpp>
#include <core/common/tools/time.hpp>

namespace vpcctl {

using aos::Array;
using aos::ArraySize;
using aos::DeferRelease;
using aos::Duration;
using aos::EnumStringer;
using aos::Error;
using aos::ErrorEnum;
using aos::Log;
using aos::LogLevel;
using aos::LogLevelEnum;
using aos::RetWithError;
using aos::String;
using aos::Tie;
using aos::Time;

} // namespace vpcctl

#endif
