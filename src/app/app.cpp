/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <unistd.h>

#include <Poco/NamedMutex.h>
#include <Poco/ScopedLock.h>
#include <Poco/Util/HelpFormatter.h>

#include <common/utils/exception.hpp>
#include <common/version/version.hpp>

#include "app.hpp"

namespace vpcctl::app {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void ErrorHandler(int sig)
{
    static constexpr auto cBacktraceSize = 32;

    void*  array[cBacktraceSize];
    size_t size;

    switch (sig) {
    case SIGILL:
        std::cerr << "Illegal instruction" << std::endl;
        break;

    case SIGABRT:
        std::cerr << "Aborted" << std::endl;
        break;

    case SIGFPE:
        std::cerr << "Floating point exception" << std::endl;
        break;

    case SIGSEGV:
        std::cerr << "Segmentation fault" << std::endl;
        break;

    default:
        std::cerr << "Unknown signal" << std::endl;
        break;
    }

    size = backtrace(array, cBacktraceSize);

    backtrace_symbols_fd(array, size, STDERR_FILENO);

    raise(sig);
}

void RegisterErrorSignals()
{
    struct sigaction act { };

    act.sa_handler = ErrorHandler;
    act.sa_flags   = SA_RESETHAND;

    sigaction(SIGILL, &act, nullptr);
    sigaction(SIGABRT, &act, nullptr);
    sigaction(SIGFPE, &act, nullptr);
    sigaction(SIGSEGV, &act, nullptr);
}

} // namespace

/***********************************************************************************************************************
 * Protected
 **********************************************************************************************************************/

void App::initialize(Application& self)
{
    if (mStopProcessing) {
        return;
    }

    RegisterErrorSignals();

    auto err = mLogger.Init();
    VPCCTL_ERROR_CHECK_AND_THROW(err, "can't initialize logger");

    Application::initialize(self);
}

void App::uninitialize()
{
    Application::uninitialize();

    mVPCCore.reset();
}

int App::main(const ArgVec& args)
{
    if (mStopProcessing) {
        return Application::EXIT_OK;
    }

    if (args.empty()) {
        std::cerr << "Command is required, see --help" << std::endl;

        return cExitError;
    }

    try {
        mVPCCore = std::make_unique<VPCCore>();

        mVPCCore->Init(mConfigFile);

        if (!mLogLevel.has_value()) {
            LogLevel level;

            if (auto err = level.FromString(String(mVPCCore->GetConfig().mLogLevel.c_str())); !err.IsNone()) {
                LOG_WRN() << "Unsupported log level in config"
                          << Log::Field("level", mVPCCore->GetConfig().mLogLevel.c_str());
            } else {
                mLogger.SetLogLevel(level);
            }
        }

        if (!CommandHandler::IsMutating(args[0])) {
            return RunCommand(args);
        }

        Poco::NamedMutex                   mutex(cLockName);
        Poco::ScopedLock<Poco::NamedMutex> lock(mutex);

        return RunCommand(args);
    } catch (const std::exception& e) {
        auto err = common::utils::ToAosError(e);

        LOG_DBG() << "Command failed" << Log::Field(err);

        std::cerr << "Error: " << common::utils::ErrorToString(err) << std::endl;
    }

    return cExitError;
}

void App::defineOptions(Poco::Util::OptionSet& options)
{
    Application::defineOptions(options);

    options.addOption(Poco::Util::Option("help", "h", "displays help information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleHelp)));
    options.addOption(Poco::Util::Option("config", "c", "path to config file")
                          .argument("${file}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleConfigFile)));
    options.addOption(Poco::Util::Option("verbose", "v", "sets current log level")
                          .argument("${level}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleLogLevel)));
    options.addOption(Poco::Util::Option("version", "", "displays version information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleVersion)));
    options.addOption(Poco::Util::Option("journal", "j", "redirects logs to systemd journal")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleJournal)));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

int App::RunCommand(const ArgVec& args)
{
    auto err = mVPCCore->GetCommandHandler().Execute(args, std::cout);
    if (!err.IsNone()) {
        LOG_DBG() << "Command failed" << Log::Field("command", args[0].c_str()) << Log::Field(err);

        std::cerr << "Error: " << common::utils::ErrorToString(err) << std::endl;

        return cExitError;
    }

    return Application::EXIT_OK;
}

void App::HandleHelp(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    Poco::Util::HelpFormatter helpFormatter(options());

    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS] <command> [ARGS]");
    helpFormatter.setHeader("Single host VPC control plane.");
    helpFormatter.format(std::cout);

    CommandHandler::PrintCommands(std::cout);

    stopOptionsProcessing();
}

void App::HandleConfigFile(const std::string& name, const std::string& value)
{
    (void)name;

    mConfigFile = value;
}

void App::HandleLogLevel(const std::string& name, const std::string& value)
{
    (void)name;

    LogLevel level;

    auto err = level.FromString(String(value.c_str()));
    if (!err.IsNone()) {
        throw Poco::Exception("unsupported log level", value);
    }

    mLogLevel = level;
    mLogger.SetLogLevel(level);
}

void App::HandleVersion(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    std::cout << "vpcctl version: " << VPCCTL_VERSION << std::endl;

    stopOptionsProcessing();
}

void App::HandleJournal(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mLogger.SetBackend(common::logger::Logger::Backend::eJournald);
}

} // namespace vpcctl::app
