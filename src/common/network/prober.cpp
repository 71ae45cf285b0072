/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <Poco/Net/NetException.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/Net/StreamSocket.h>
#include <Poco/Timespan.h>

#include <common/utils/utils.hpp>

#include "prober.hpp"

namespace vpcctl::common::network {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Prober::Init(const ProberConfig& config, Executor executor)
{
    mConfig   = config;
    mExecutor = executor ? std::move(executor) : Executor(utils::ExecCommand);

    return ErrorEnum::eNone;
}

bool Prober::Ping(const std::string& ns, const std::string& address)
{
    auto timeoutSec = std::max<int64_t>(1, mConfig.mTimeout.Nanoseconds() / Time::cSeconds.Nanoseconds());

    std::vector<std::string> command;

    if (!ns.empty()) {
        command = {"ip", "netns", "exec", ns};
    }

    command.insert(command.end(), {"ping", "-c", "1", "-W", std::to_string(timeoutSec), address});

    for (int attempt = 0; attempt < std::max(1, mConfig.mRetries); ++attempt) {
        if (auto [_, err] = mExecutor(command); err.IsNone()) {
            return true;
        } else {
            LOG_DBG() << "Ping failed" << Log::Field("ns", ns.c_str()) << Log::Field("address", address.c_str())
                      << Log::Field("attempt", attempt + 1) << Log::Field(err);
        }
    }

    return false;
}

PortState Prober::ProbePort(const std::string& address, uint16_t port)
{
    auto timeoutUs = mConfig.mTimeout.Nanoseconds() / 1000;

    for (int attempt = 0; attempt < std::max(1, mConfig.mRetries); ++attempt) {
        try {
            Poco::Net::StreamSocket socket;

            socket.connect(Poco::Net::SocketAddress(address, port), Poco::Timespan(timeoutUs));
            socket.close();

            return PortStateEnum::eOpen;
        } catch (const Poco::Net::ConnectionRefusedException&) {
            return PortStateEnum::eClosed;
        } catch (const Poco::TimeoutException&) {
            LOG_DBG() << "Port probe timed out" << Log::Field("address", address.c_str()) << Log::Field("port", port);
        } catch (const std::exception& e) {
            LOG_DBG() << "Port probe failed" << Log::Field("address", address.c_str()) << Log::Field("port", port)
                      << Log::Field("error", e.what());
        }
    }

    return PortStateEnum::eFiltered;
}

} // namespace vpcctl::common::network
