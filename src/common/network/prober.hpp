/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_NETWORK_PROBER_HPP_
#define VPCCTL_COMMON_NETWORK_PROBER_HPP_

#include <functional>
#include <string>
#include <vector>

#include <common/types/network.hpp>

namespace vpcctl::common::network {

/**
 * Prober config.
 */
struct ProberConfig {
    Duration mTimeout;
    int      mRetries {1};
};

/**
 * Bounded reachability probes.
 */
class Prober {
public:
    using Executor = std::function<RetWithError<std::string>(const std::vector<std::string>&)>;

    /**
     * Initializes prober.
     *
     * @param config prober config.
     * @param executor command executor.
     * @return Error.
     */
    Error Init(const ProberConfig& config, Executor executor = nullptr);

    /**
     * Sends ICMP echo, retried up to configured count.
     *
     * @param ns source namespace, host if empty.
     * @param address destination address.
     * @return bool true if any echo reply is received.
     */
    bool Ping(const std::string& ns, const std::string& address);

    /**
     * Probes TCP port from the host.
     *
     * @param address destination address.
     * @param port destination port.
     * @return PortState.
     */
    PortState ProbePort(const std::string& address, uint16_t port);

private:
    ProberConfig mConfig;
    Executor     mExecutor;
};

} // namespace vpcctl::common::network

#endif
