/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_PEERING_ITF_STORAGE_HPP_
#define VPCCTL_PEERING_ITF_STORAGE_HPP_

#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::peering {

/**
 * Peering record. VPC names are stored in canonical order: mVPC1 < mVPC2.
 */
struct PeeringInfo {
    std::string mVPC1;
    std::string mVPC2;
    std::string mLink1;
    std::string mLink2;
    Time        mCreated;

    /**
     * Compares peering records.
     *
     * @param rhs record to compare with.
     * @return bool.
     */
    bool operator==(const PeeringInfo& rhs) const
    {
        return mVPC1 == rhs.mVPC1 && mVPC2 == rhs.mVPC2 && mLink1 == rhs.mLink1 && mLink2 == rhs.mLink2
            && mCreated == rhs.mCreated;
    }

    /**
     * Compares peering records.
     *
     * @param rhs record to compare with.
     * @return bool.
     */
    bool operator!=(const PeeringInfo& rhs) const { return !operator==(rhs); }
};

/**
 * Peering storage interface.
 */
class StorageItf {
public:
    /**
     * Destructor.
     */
    virtual ~StorageItf() = default;

    /**
     * Adds peering record.
     *
     * @param peering peering record.
     * @return Error eAlreadyExist if record for the pair exists.
     */
    virtual Error AddPeering(const PeeringInfo& peering) = 0;

    /**
     * Returns peering record.
     *
     * @param vpc1 first VPC name.
     * @param vpc2 second VPC name.
     * @param[out] peering peering record.
     * @return Error eNotFound if record doesn't exist.
     */
    virtual Error GetPeering(const std::string& vpc1, const std::string& vpc2, PeeringInfo& peering) = 0;

    /**
     * Returns all peering records.
     *
     * @param[out] peerings peering records.
     * @return Error.
     */
    virtual Error GetAllPeerings(std::vector<PeeringInfo>& peerings) = 0;

    /**
     * Removes peering record.
     *
     * @param vpc1 first VPC name.
     * @param vpc2 second VPC name.
     * @return Error eNotFound if record doesn't exist.
     */
    virtual Error RemovePeering(const std::string& vpc1, const std::string& vpc2) = 0;
};

} // namespace vpcctl::peering

#endif
