/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_ISOLATION_HPP_
#define VPCCTL_VPC_ISOLATION_HPP_

#include <string>

#include <common/utils/report.hpp>
#include <driver/itf/networkdriver.hpp>

namespace vpcctl::vpc {

/**
 * Returns host forward rule dropping traffic routed from one VPC bridge to another.
 *
 * @param inBridge ingress bridge.
 * @param outBridge egress bridge.
 * @return common::network::RuleBuilder.
 */
common::network::RuleBuilder IsolationRule(const std::string& inBridge, const std::string& outBridge);

/**
 * Installs isolation rules in both directions between two bridges. Present rules are skipped.
 *
 * @param driver network driver.
 * @param bridgeA first bridge.
 * @param bridgeB second bridge.
 * @param[out] report operation report.
 * @return Error.
 */
Error IsolateBridges(driver::NetworkDriverItf& driver, const std::string& bridgeA, const std::string& bridgeB,
    common::utils::OperationReport& report);

/**
 * Removes isolation rules between two bridges. Absent rules are skipped.
 *
 * @param driver network driver.
 * @param bridgeA first bridge.
 * @param bridgeB second bridge.
 * @param[out] report operation report.
 * @return Error.
 */
Error JoinBridges(driver::NetworkDriverItf& driver, const std::string& bridgeA, const std::string& bridgeB,
    common::utils::OperationReport& report);

/**
 * Removes all isolation rules referring to the bridge.
 *
 * @param driver network driver.
 * @param bridge bridge.
 * @param[out] report operation report.
 * @return Error.
 */
Error RemoveBridgeIsolation(
    driver::NetworkDriverItf& driver, const std::string& bridge, common::utils::OperationReport& report);

} // namespace vpcctl::vpc

#endif
