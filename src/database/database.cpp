/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/Statement.h>
#include <Poco/Path.h>

#include <common/utils/exception.hpp>

#include "database.hpp"

using namespace Poco::Data::Keywords;

namespace vpcctl::database {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

template <typename E>
constexpr int ToInt(E e)
{
    return static_cast<int>(e);
}

Time FromUnixNano(uint64_t timestamp)
{
    return Time::Unix(timestamp / Time::cSeconds.Nanoseconds(), timestamp % Time::cSeconds.Nanoseconds());
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Database::Database()
{
    Poco::Data::SQLite::Connector::registerConnector();
}

Database::~Database()
{
    if (mSession && mSession->isConnected()) {
        mSession->close();
    }

    Poco::Data::SQLite::Connector::unregisterConnector();
}

Error Database::Init(const Config& config)
{
    std::lock_guard lock {mMutex};

    if (mSession && mSession->isConnected()) {
        return ErrorEnum::eNone;
    }

    try {
        auto dirPath = std::filesystem::path(config.mWorkingDir);
        if (!std::filesystem::exists(dirPath)) {
            std::filesystem::create_directories(dirPath);
        }

        const auto dbPath = Poco::Path(config.mWorkingDir, cDBFileName);

        LOG_DBG() << "Open database" << Log::Field("path", dbPath.toString().c_str());

        mSession = std::make_unique<Poco::Data::Session>("SQLite", dbPath.toString());
        CreateTables();
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * vpc::StorageItf implementation
 **********************************************************************************************************************/

Error Database::AddVPC(const vpc::VPCInfo& vpc)
{
    std::lock_guard lock {mMutex};

    try {
        if (VPCExists(vpc.mName)) {
            return ErrorEnum::eAlreadyExist;
        }

        VPCRow row;

        FromAos(vpc, row);

        *mSession << "INSERT INTO vpcs (name, cidr, bridge, gateway, created, status) VALUES (?, ?, ?, ?, ?, ?);",
            bind(row), now;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::UpdateVPC(const vpc::VPCInfo& vpc)
{
    std::lock_guard lock {mMutex};

    try {
        Poco::Data::Statement statement {*mSession};

        statement << "UPDATE vpcs SET cidr = ?, bridge = ?, gateway = ?, created = ?, status = ? WHERE name = ?;",
            bind(vpc.mCIDR), bind(vpc.mBridge), bind(vpc.mGateway), bind(vpc.mCreated.UnixNano()),
            bind(vpc.mStatus.ToString().CStr()), bind(vpc.mName);

        if (statement.execute() == 0) {
            return ErrorEnum::eNotFound;
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::GetVPC(const std::string& name, vpc::VPCInfo& vpc)
{
    std::lock_guard lock {mMutex};

    try {
        VPCRow                row;
        Poco::Data::Statement statement {*mSession};

        statement << "SELECT name, cidr, bridge, gateway, created, status FROM vpcs WHERE name = ?;", bind(name),
            into(row);

        if (statement.execute() == 0) {
            return ErrorEnum::eNotFound;
        }

        ToAos(row, vpc);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::GetAllVPCs(std::vector<vpc::VPCInfo>& vpcs)
{
    std::lock_guard lock {mMutex};

    try {
        std::vector<VPCRow> rows;

        *mSession << "SELECT name, cidr, bridge, gateway, created, status FROM vpcs ORDER BY name;", into(rows), now;

        vpcs.clear();

        for (const auto& row : rows) {
            vpc::VPCInfo info;

            ToAos(row, info);
            vpcs.push_back(std::move(info));
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::RemoveVPC(const std::string& name)
{
    std::lock_guard lock {mMutex};

    try {
        Poco::Data::Statement statement {*mSession};

        statement << "DELETE FROM vpcs WHERE name = ?;", bind(name);

        if (statement.execute() != 1) {
            return ErrorEnum::eNotFound;
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * peering::StorageItf implementation
 **********************************************************************************************************************/

Error Database::AddPeering(const peering::PeeringInfo& peering)
{
    std::lock_guard lock {mMutex};

    try {
        if (PeeringExists(peering.mVPC1, peering.mVPC2)) {
            return ErrorEnum::eAlreadyExist;
        }

        PeeringRow row;

        FromAos(peering, row);

        *mSession << "INSERT INTO peerings (vpc1, vpc2, link1, link2, created) VALUES (?, ?, ?, ?, ?);", bind(row),
            now;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::GetPeering(const std::string& vpc1, const std::string& vpc2, peering::PeeringInfo& peering)
{
    std::lock_guard lock {mMutex};

    try {
        PeeringRow            row;
        Poco::Data::Statement statement {*mSession};

        statement << "SELECT vpc1, vpc2, link1, link2, created FROM peerings WHERE vpc1 = ? AND vpc2 = ?;",
            bind(vpc1), bind(vpc2), into(row);

        if (statement.execute() == 0) {
            return ErrorEnum::eNotFound;
        }

        ToAos(row, peering);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::GetAllPeerings(std::vector<peering::PeeringInfo>& peerings)
{
    std::lock_guard lock {mMutex};

    try {
        std::vector<PeeringRow> rows;

        *mSession << "SELECT vpc1, vpc2, link1, link2, created FROM peerings ORDER BY vpc1, vpc2;", into(rows), now;

        peerings.clear();

        for (const auto& row : rows) {
            peering::PeeringInfo info;

            ToAos(row, info);
            peerings.push_back(std::move(info));
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

Error Database::RemovePeering(const std::string& vpc1, const std::string& vpc2)
{
    std::lock_guard lock {mMutex};

    try {
        Poco::Data::Statement statement {*mSession};

        statement << "DELETE FROM peerings WHERE vpc1 = ? AND vpc2 = ?;", bind(vpc1), bind(vpc2);

        if (statement.execute() != 1) {
            return ErrorEnum::eNotFound;
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Database::CreateTables()
{
    LOG_DBG() << "Create vpcs table";

    *mSession << "CREATE TABLE IF NOT EXISTS vpcs ("
                 "name TEXT PRIMARY KEY,"
                 "cidr TEXT,"
                 "bridge TEXT,"
                 "gateway TEXT,"
                 "created INTEGER,"
                 "status TEXT"
                 ");",
        now;

    LOG_DBG() << "Create peerings table";

    *mSession << "CREATE TABLE IF NOT EXISTS peerings ("
                 "vpc1 TEXT,"
                 "vpc2 TEXT,"
                 "link1 TEXT,"
                 "link2 TEXT,"
                 "created INTEGER,"
                 "PRIMARY KEY(vpc1,vpc2)"
                 ");",
        now;
}

bool Database::VPCExists(const std::string& name)
{
    size_t count = 0;

    *mSession << "SELECT COUNT(*) FROM vpcs WHERE name = ?;", bind(name), into(count), now;

    return count != 0;
}

bool Database::PeeringExists(const std::string& vpc1, const std::string& vpc2)
{
    size_t count = 0;

    *mSession << "SELECT COUNT(*) FROM peerings WHERE vpc1 = ? AND vpc2 = ?;", bind(vpc1), bind(vpc2), into(count),
        now;

    return count != 0;
}

void Database::FromAos(const vpc::VPCInfo& src, VPCRow& dst)
{
    dst.set<ToInt(VPCColumns::eName)>(src.mName);
    dst.set<ToInt(VPCColumns::eCIDR)>(src.mCIDR);
    dst.set<ToInt(VPCColumns::eBridge)>(src.mBridge);
    dst.set<ToInt(VPCColumns::eGateway)>(src.mGateway);
    dst.set<ToInt(VPCColumns::eCreated)>(src.mCreated.UnixNano());
    dst.set<ToInt(VPCColumns::eStatus)>(src.mStatus.ToString().CStr());
}

void Database::ToAos(const VPCRow& src, vpc::VPCInfo& dst)
{
    dst.mName    = src.get<ToInt(VPCColumns::eName)>();
    dst.mCIDR    = src.get<ToInt(VPCColumns::eCIDR)>();
    dst.mBridge  = src.get<ToInt(VPCColumns::eBridge)>();
    dst.mGateway = src.get<ToInt(VPCColumns::eGateway)>();
    dst.mCreated = FromUnixNano(src.get<ToInt(VPCColumns::eCreated)>());

    VPCCTL_ERROR_CHECK_AND_THROW(
        dst.mStatus.FromString(src.get<ToInt(VPCColumns::eStatus)>().c_str()), "invalid VPC status");
}

void Database::FromAos(const peering::PeeringInfo& src, PeeringRow& dst)
{
    dst.set<ToInt(PeeringColumns::eVPC1)>(src.mVPC1);
    dst.set<ToInt(PeeringColumns::eVPC2)>(src.mVPC2);
    dst.set<ToInt(PeeringColumns::eLink1)>(src.mLink1);
    dst.set<ToInt(PeeringColumns::eLink2)>(src.mLink2);
    dst.set<ToInt(PeeringColumns::eCreated)>(src.mCreated.UnixNano());
}

void Database::ToAos(const PeeringRow& src, peering::PeeringInfo& dst)
{
    dst.mVPC1    = src.get<ToInt(PeeringColumns::eVPC1)>();
    dst.mVPC2    = src.get<ToInt(PeeringColumns::eVPC2)>();
    dst.mLink1   = src.get<ToInt(PeeringColumns::eLink1)>();
    dst.mLink2   = src.get<ToInt(PeeringColumns::eLink2)>();
    dst.mCreated = FromUnixNano(src.get<ToInt(PeeringColumns::eCreated)>());
}

} // namespace vpcctl::database
