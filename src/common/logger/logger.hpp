/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_LOGGER_LOGGER_HPP_
#define VPCCTL_COMMON_LOGGER_LOGGER_HPP_

#include <mutex>

#include <common/types/common.hpp>

namespace vpcctl::common::logger {

/**
 * Installs log backend for the core log macros.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eJournald,
    };

    /**
     * Initializes logger.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Sets log backend.
     *
     * @param backend backend.
     */
    void SetBackend(Backend backend) { mBackend = backend; }

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    void SetLogLevel(LogLevel level);

    /**
     * Returns current log level.
     *
     * @return LogLevel.
     */
    static LogLevel GetLogLevel();

private:
    static void StdIOCallback(const char* module, LogLevel level, const String& message);
    static void JournaldCallback(const char* module, LogLevel level, const String& message);
    static int  GetSyslogPriority(LogLevel level);

    static std::mutex sMutex;
    static LogLevel   sLogLevel;

    Backend mBackend = Backend::eStdIO;
};

} // namespace vpcctl::common::logger

#endif
