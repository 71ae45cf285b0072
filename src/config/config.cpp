/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <Poco/JSON/Parser.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <common/utils/time.hpp>

#include "config.hpp"

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cDefaultWorkingDir      = "/var/lib/vpcctl";
constexpr auto cDefaultNetnsDir        = "/run/netns";
constexpr auto cDefaultIPForwardPath   = "/proc/sys/net/ipv4/ip_forward";
constexpr auto cDefaultLogLevel        = "info";
constexpr auto cDefaultProbeTimeout    = "1s";
constexpr auto cDefaultProbeRetries    = 1;
constexpr auto cDefaultExternalAddress = "8.8.8.8";

namespace vpcctl::config {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

std::string JoinPath(const std::string& base, const std::string& entry)
{
    auto path = std::filesystem::path(base);

    path /= entry;

    return path.string();
}

void SetDefaults(Config& config)
{
    config.mWorkingDir              = cDefaultWorkingDir;
    config.mLogLevel                = cDefaultLogLevel;
    config.mDatabase.mWorkingDir    = config.mWorkingDir;
    config.mDriver.mNetnsDir        = cDefaultNetnsDir;
    config.mDriver.mIPForwardPath   = cDefaultIPForwardPath;
    config.mDriver.mProber.mTimeout = Time::cSeconds;
    config.mDriver.mProber.mRetries = cDefaultProbeRetries;
    config.mProbe.mExternalAddress  = cDefaultExternalAddress;
    config.mProbe.mPorts            = {80, 22, 443, 8080};
    config.mWorkload.mRootDir       = JoinPath(config.mWorkingDir, "www");
}

void ParseProbeConfig(const common::utils::CaseInsensitiveObjectWrapper& object, Config& config)
{
    Error err = ErrorEnum::eNone;

    Tie(config.mDriver.mProber.mTimeout, err)
        = common::utils::ParseDuration(object.GetValue<std::string>("timeout", cDefaultProbeTimeout));
    VPCCTL_ERROR_CHECK_AND_THROW(err, "error parsing probe timeout tag");

    config.mDriver.mProber.mRetries = object.GetValue<int>("retries", cDefaultProbeRetries);
    if (config.mDriver.mProber.mRetries < 1) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "probe retries should be positive");
    }

    config.mProbe.mExternalAddress = object.GetValue<std::string>("externalAddress", cDefaultExternalAddress);

    if (object.Has("ports")) {
        config.mProbe.mPorts = object.GetArrayValue<uint16_t>("ports");
    }
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Error ParseConfig(const std::string& filename, Config& config)
{
    SetDefaults(config);

    std::ifstream file(filename);

    if (!file.is_open()) {
        return ErrorEnum::eNotFound;
    }

    try {
        Poco::JSON::Parser                          parser;
        auto                                        result = parser.parse(file);
        common::utils::CaseInsensitiveObjectWrapper object(result);

        config.mWorkingDir           = object.GetValue<std::string>("workingDir", cDefaultWorkingDir);
        config.mLogLevel             = object.GetValue<std::string>("logLevel", cDefaultLogLevel);
        config.mDatabase.mWorkingDir = config.mWorkingDir;

        config.mDriver.mNetnsDir      = object.GetValue<std::string>("netnsDir", cDefaultNetnsDir);
        config.mDriver.mIPForwardPath = object.GetValue<std::string>("ipForwardPath", cDefaultIPForwardPath);

        auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

        auto probe    = object.Has("probe") ? object.GetObject("probe") : empty;
        auto workload = object.Has("workload") ? object.GetObject("workload") : empty;

        ParseProbeConfig(probe, config);

        config.mWorkload.mRootDir
            = workload.GetOptionalValue<std::string>("rootDir").value_or(JoinPath(config.mWorkingDir, "www"));
    } catch (const std::exception& e) {
        return common::utils::ToAosError(e, ErrorEnum::eInvalidArgument);
    }

    return ErrorEnum::eNone;
}

} // namespace vpcctl::config
