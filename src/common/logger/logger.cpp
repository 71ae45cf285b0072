/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormatter.h>
#include <syslog.h>
#include <systemd/sd-journal.h>

#include "logger.hpp"

namespace vpcctl::common::logger {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::mutex Logger::sMutex;
LogLevel   Logger::sLogLevel = LogLevelEnum::eInfo;

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Logger::Init()
{
    switch (mBackend) {
    case Backend::eStdIO:
        Log::SetCallback(StdIOCallback);
        break;

    case Backend::eJournald:
        Log::SetCallback(JournaldCallback);
        break;

    default:
        return Error(ErrorEnum::eInvalidArgument, "unsupported log backend");
    }

    return ErrorEnum::eNone;
}

void Logger::SetLogLevel(LogLevel level)
{
    std::lock_guard lock {sMutex};

    sLogLevel = level;
}

LogLevel Logger::GetLogLevel()
{
    std::lock_guard lock {sMutex};

    return sLogLevel;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Logger::StdIOCallback(const char* module, LogLevel level, const String& message)
{
    std::lock_guard lock {sMutex};

    if (level.GetValue() < sLogLevel.GetValue()) {
        return;
    }

    auto now = Poco::DateTimeFormatter::format(Poco::DateTime(), "%Y-%m-%d %H:%M:%S.%i");

    std::cerr << now << " [" << level.ToString().CStr() << "] ";

    if (module != nullptr && *module != '\0') {
        std::cerr << "[" << module << "] ";
    }

    std::cerr << message.CStr() << std::endl;
}

void Logger::JournaldCallback(const char* module, LogLevel level, const String& message)
{
    {
        std::lock_guard lock {sMutex};

        if (level.GetValue() < sLogLevel.GetValue()) {
            return;
        }
    }

    sd_journal_send("MESSAGE=%s", message.CStr(), "PRIORITY=%i", GetSyslogPriority(level), "VPCCTL_MODULE=%s",
        module != nullptr ? module : "", nullptr);
}

int Logger::GetSyslogPriority(LogLevel level)
{
    switch (level.GetValue()) {
    case LogLevelEnum::eDebug:
        return LOG_DEBUG;

    case LogLevelEnum::eInfo:
        return LOG_INFO;

    case LogLevelEnum::eWarning:
        return LOG_WARNING;

    case LogLevelEnum::eError:
        return LOG_ERR;

    default:
        return LOG_INFO;
    }
}

} // namespace vpcctl::common::logger
