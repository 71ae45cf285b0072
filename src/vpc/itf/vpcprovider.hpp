/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_ITF_VPCPROVIDER_HPP_
#define VPCCTL_VPC_ITF_VPCPROVIDER_HPP_

#include "storage.hpp"

namespace vpcctl::vpc {

/**
 * Gives read access to VPC records.
 */
class VPCProviderItf {
public:
    /**
     * Destructor.
     */
    virtual ~VPCProviderItf() = default;

    /**
     * Returns VPC record.
     *
     * @param name VPC name.
     * @param[out] vpc VPC record.
     * @return Error eNotFound if VPC doesn't exist.
     */
    virtual Error GetVPC(const std::string& name, VPCInfo& vpc) = 0;

    /**
     * Returns VPC CIDR.
     *
     * @param name VPC name.
     * @return RetWithError<std::string> eNotFound if VPC doesn't exist.
     */
    virtual RetWithError<std::string> GetCIDR(const std::string& name) = 0;
};

} // namespace vpcctl::vpc

#endif
