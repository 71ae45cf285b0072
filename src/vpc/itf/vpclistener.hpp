/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_ITF_VPCLISTENER_HPP_
#define VPCCTL_VPC_ITF_VPCLISTENER_HPP_

#include <common/utils/report.hpp>

#include "storage.hpp"

namespace vpcctl::vpc {

/**
 * Receives VPC lifecycle notifications.
 */
class VPCListenerItf {
public:
    /**
     * Destructor.
     */
    virtual ~VPCListenerItf() = default;

    /**
     * Called before VPC resources are removed.
     *
     * @param vpc VPC record.
     * @param[out] report operation report.
     * @return Error.
     */
    virtual Error OnVPCDelete(const VPCInfo& vpc, common::utils::OperationReport& report) = 0;
};

} // namespace vpcctl::vpc

#endif
