/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_DATABASE_DATABASE_HPP_
#define VPCCTL_DATABASE_DATABASE_HPP_

#include <memory>
#include <mutex>

#include <Poco/Data/Session.h>
#include <Poco/Tuple.h>

#include <peering/itf/storage.hpp>
#include <vpc/itf/storage.hpp>

#include "config.hpp"

namespace vpcctl::database {

/**
 * Control plane state database.
 */
class Database : public vpc::StorageItf, public peering::StorageItf {
public:
    /**
     * Creates database instance.
     */
    Database();

    /**
     * Destroys database instance.
     */
    ~Database();

    /**
     * Initializes database.
     *
     * @param config database configuration.
     * @return Error.
     */
    Error Init(const Config& config);

    //
    // vpc::StorageItf interface
    //

    /**
     * Adds VPC record.
     *
     * @param vpc VPC record.
     * @return Error.
     */
    Error AddVPC(const vpc::VPCInfo& vpc) override;

    /**
     * Updates VPC record.
     *
     * @param vpc VPC record.
     * @return Error.
     */
    Error UpdateVPC(const vpc::VPCInfo& vpc) override;

    /**
     * Returns VPC record.
     *
     * @param name VPC name.
     * @param[out] vpc VPC record.
     * @return Error.
     */
    Error GetVPC(const std::string& name, vpc::VPCInfo& vpc) override;

    /**
     * Returns all VPC records.
     *
     * @param[out] vpcs VPC records.
     * @return Error.
     */
    Error GetAllVPCs(std::vector<vpc::VPCInfo>& vpcs) override;

    /**
     * Removes VPC record.
     *
     * @param name VPC name.
     * @return Error.
     */
    Error RemoveVPC(const std::string& name) override;

    //
    // peering::StorageItf interface
    //

    /**
     * Adds peering record.
     *
     * @param peering peering record.
     * @return Error.
     */
    Error AddPeering(const peering::PeeringInfo& peering) override;

    /**
     * Returns peering record.
     *
     * @param vpc1 first VPC name.
     * @param vpc2 second VPC name.
     * @param[out] peering peering record.
     * @return Error.
     */
    Error GetPeering(const std::string& vpc1, const std::string& vpc2, peering::PeeringInfo& peering) override;

    /**
     * Returns all peering records.
     *
     * @param[out] peerings peering records.
     * @return Error.
     */
    Error GetAllPeerings(std::vector<peering::PeeringInfo>& peerings) override;

    /**
     * Removes peering record.
     *
     * @param vpc1 first VPC name.
     * @param vpc2 second VPC name.
     * @return Error.
     */
    Error RemovePeering(const std::string& vpc1, const std::string& vpc2) override;

private:
    static constexpr auto cDBFileName = "vpcctl.db";

    enum class VPCColumns : int { eName = 0, eCIDR, eBridge, eGateway, eCreated, eStatus };
    using VPCRow = Poco::Tuple<std::string, std::string, std::string, std::string, uint64_t, std::string>;

    enum class PeeringColumns : int { eVPC1 = 0, eVPC2, eLink1, eLink2, eCreated };
    using PeeringRow = Poco::Tuple<std::string, std::string, std::string, std::string, uint64_t>;

    void CreateTables();
    bool VPCExists(const std::string& name);
    bool PeeringExists(const std::string& vpc1, const std::string& vpc2);

    static void FromAos(const vpc::VPCInfo& src, VPCRow& dst);
    static void ToAos(const VPCRow& src, vpc::VPCInfo& dst);

    static void FromAos(const peering::PeeringInfo& src, PeeringRow& dst);
    static void ToAos(const PeeringRow& src, peering::PeeringInfo& dst);

    std::unique_ptr<Poco::Data::Session> mSession;
    mutable std::mutex                   mMutex;
};

} // namespace vpcctl::database

#endif
