/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_APP_APP_HPP_
#define VPCCTL_APP_APP_HPP_

#include <memory>
#include <optional>

#include <Poco/Util/Application.h>

#include <common/logger/logger.hpp>

#include "vpccore.hpp"

namespace vpcctl::app {

/**
 * vpcctl application.
 */
class App : public Poco::Util::Application {
public:
    /**
     * Constructor.
     */
    App() = default;

protected:
    void initialize(Application& self) override;
    void uninitialize() override;
    int  main(const ArgVec& args) override;
    void defineOptions(Poco::Util::OptionSet& options) override;

private:
    static constexpr auto cLockName  = "vpcctl";
    static constexpr auto cExitError = 1;

    void HandleHelp(const std::string& name, const std::string& value);
    void HandleConfigFile(const std::string& name, const std::string& value);
    void HandleLogLevel(const std::string& name, const std::string& value);
    void HandleVersion(const std::string& name, const std::string& value);
    void HandleJournal(const std::string& name, const std::string& value);

    int RunCommand(const ArgVec& args);

    std::unique_ptr<VPCCore> mVPCCore;
    common::logger::Logger   mLogger;
    std::optional<LogLevel>  mLogLevel;
    bool                     mStopProcessing {};
    std::string              mConfigFile;
};

} // namespace vpcctl::app

#endif
