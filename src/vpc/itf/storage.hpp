/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_ITF_STORAGE_HPP_
#define VPCCTL_VPC_ITF_STORAGE_HPP_

#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::vpc {

/**
 * VPC status type.
 */
class VPCStatusType {
public:
    enum class Enum {
        eActive,
        eDeleted,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "active",
            "deleted",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using VPCStatusEnum = VPCStatusType::Enum;
using VPCStatus     = EnumStringer<VPCStatusType>;

/**
 * VPC record.
 */
struct VPCInfo {
    std::string mName;
    std::string mCIDR;
    std::string mBridge;
    std::string mGateway;
    Time        mCreated;
    VPCStatus   mStatus;

    /**
     * Compares VPC records.
     *
     * @param rhs record to compare with.
     * @return bool.
     */
    bool operator==(const VPCInfo& rhs) const
    {
        return mName == rhs.mName && mCIDR == rhs.mCIDR && mBridge == rhs.mBridge && mGateway == rhs.mGateway
            && mCreated == rhs.mCreated && mStatus == rhs.mStatus;
    }

    /**
     * Compares VPC records.
     *
     * @param rhs record to compare with.
     * @return bool.
     */
    bool operator!=(const VPCInfo& rhs) const { return !operator==(rhs); }
};

/**
 * VPC storage interface.
 */
class StorageItf {
public:
    /**
     * Destructor.
     */
    virtual ~StorageItf() = default;

    /**
     * Adds VPC record.
     *
     * @param vpc VPC record.
     * @return Error eAlreadyExist if record with the same name exists.
     */
    virtual Error AddVPC(const VPCInfo& vpc) = 0;

    /**
     * Updates VPC record.
     *
     * @param vpc VPC record.
     * @return Error eNotFound if record doesn't exist.
     */
    virtual Error UpdateVPC(const VPCInfo& vpc) = 0;

    /**
     * Returns VPC record.
     *
     * @param name VPC name.
     * @param[out] vpc VPC record.
     * @return Error eNotFound if record doesn't exist.
     */
    virtual Error GetVPC(const std::string& name, VPCInfo& vpc) = 0;

    /**
     * Returns all VPC records.
     *
     * @param[out] vpcs VPC records.
     * @return Error.
     */
    virtual Error GetAllVPCs(std::vector<VPCInfo>& vpcs) = 0;

    /**
     * Removes VPC record.
     *
     * @param name VPC name.
     * @return Error eNotFound if record doesn't exist.
     */
    virtual Error RemoveVPC(const std::string& name) = 0;
};

} // namespace vpcctl::vpc

#endif
