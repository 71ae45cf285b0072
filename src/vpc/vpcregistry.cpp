/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/network/utils.hpp>
#include <common/utils/steprunner.hpp>
#include <naming/naming.hpp>

#include "isolation.hpp"
#include "vpcregistry.hpp"

namespace vpcctl::vpc {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error VPCRegistry::Init(StorageItf& storage, driver::NetworkDriverItf& driver)
{
    mStorage = &storage;
    mDriver  = &driver;

    return ErrorEnum::eNone;
}

void VPCRegistry::Subscribe(VPCListenerItf& listener)
{
    std::lock_guard lock {mMutex};

    mListeners.push_back(&listener);
}

Error VPCRegistry::CreateVPC(const std::string& name, const std::string& cidr, common::utils::OperationReport& report)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Create VPC" << Log::Field("name", name.c_str()) << Log::Field("cidr", cidr.c_str());

    if (auto err = naming::ValidateVPCName(name); !err.IsNone()) {
        return err;
    }

    if (auto err = naming::ValidateCIDR(cidr); !err.IsNone()) {
        return err;
    }

    VPCInfo existing;

    if (auto err = mStorage->GetVPC(name, existing); err.IsNone()) {
        return Error(ErrorEnum::eAlreadyExist, ("VPC already exists: " + name).c_str());
    } else if (!err.Is(ErrorEnum::eNotFound)) {
        return AOS_ERROR_WRAP(err);
    }

    auto bridge = naming::BridgeName(name);

    if (auto err = CheckNameCollision(name, bridge); !err.IsNone()) {
        return err;
    }

    auto [gateway, err] = naming::GatewayAddress(cidr);
    if (!err.IsNone()) {
        return err;
    }

    auto bridgeAddress = naming::WithPrefix(gateway, cidr);

    std::vector<VPCInfo> others;

    if (err = mStorage->GetAllVPCs(others); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    VPCInfo vpc {name, cidr, bridge, gateway, Time::Now(), VPCStatusEnum::eActive};

    common::utils::StepRunner steps("create VPC " + name);

    steps.AddStep(
        "create bridge " + bridge, [&]() { return mDriver->CreateBridge(bridge); },
        [&]() { return mDriver->DeleteLink(bridge); });
    steps.AddStep("bring up " + bridge, [&]() { return mDriver->SetLinkUp(bridge); });
    steps.AddStep(
        "assign " + bridgeAddress + " to " + bridge, [&]() { return mDriver->AddAddress(bridge, bridgeAddress); },
        [&]() { return mDriver->DeleteAddress(bridge, bridgeAddress); });

    common::utils::OperationReport isolation;

    for (const auto& other : others) {
        auto otherBridge = other.mBridge;

        steps.AddStep(
            "isolate from VPC " + other.mName,
            [this, &bridge, &isolation, otherBridge]() {
                return IsolateBridges(*mDriver, bridge, otherBridge, isolation);
            },
            [this, &bridge, &isolation, otherBridge]() {
                return JoinBridges(*mDriver, bridge, otherBridge, isolation);
            });
    }

    steps.AddStep("enable host forwarding", [&]() { return mDriver->SetHostForwarding(true); });
    steps.AddStep(
        "store record", [&]() { return mStorage->AddVPC(vpc); }, [&]() { return mStorage->RemoveVPC(name); });

    if (err = steps.Run(); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& step : steps.GetCompleted()) {
        report.Succeeded(step);
    }

    LOG_INF() << "VPC created" << Log::Field("name", name.c_str()) << Log::Field("bridge", bridge.c_str())
              << Log::Field("gateway", gateway.c_str());

    return ErrorEnum::eNone;
}

Error VPCRegistry::DeleteVPC(const std::string& name, common::utils::OperationReport& report)
{
    LOG_INF() << "Delete VPC" << Log::Field("name", name.c_str());

    VPCInfo                      vpc;
    std::vector<VPCListenerItf*> listeners;

    {
        std::lock_guard lock {mMutex};

        if (auto err = mStorage->GetVPC(name, vpc); !err.IsNone()) {
            if (err.Is(ErrorEnum::eNotFound)) {
                return Error(ErrorEnum::eNotFound, ("VPC not found: " + name).c_str());
            }

            return AOS_ERROR_WRAP(err);
        }

        vpc.mStatus = VPCStatusEnum::eDeleted;

        if (auto err = mStorage->UpdateVPC(vpc); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        listeners = mListeners;
    }

    // Listeners query this registry, so they run without the lock held.
    for (auto listener : listeners) {
        if (auto err = listener->OnVPCDelete(vpc, report); !err.IsNone()) {
            LOG_WRN() << "VPC delete listener failed" << Log::Field("name", name.c_str()) << Log::Field(err);

            report.Warning(err.Message());
        }
    }

    std::lock_guard lock {mMutex};

    if (auto err = DeleteNamespaces(name, report); !err.IsNone()) {
        return err;
    }

    if (auto err = RemoveBridgeIsolation(*mDriver, vpc.mBridge, report); !err.IsNone()) {
        LOG_WRN() << "Can't remove bridge isolation" << Log::Field("bridge", vpc.mBridge.c_str()) << Log::Field(err);

        report.Warning("can't remove isolation of " + vpc.mBridge + ": " + err.Message());
    }

    if (auto err = mDriver->DeleteLink(vpc.mBridge); err.Is(ErrorEnum::eNotFound)) {
        report.Skipped("bridge " + vpc.mBridge + " already absent");
    } else if (!err.IsNone()) {
        return AOS_ERROR_WRAP(Error(err, ("can't delete bridge " + vpc.mBridge).c_str()));
    } else {
        report.Succeeded("delete bridge " + vpc.mBridge);
    }

    if (auto err = mStorage->RemoveVPC(name); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    report.Succeeded("remove record " + name);

    LOG_INF() << "VPC deleted" << Log::Field("name", name.c_str());

    return ErrorEnum::eNone;
}

Error VPCRegistry::ListVPCs(std::vector<VPCSummary>& vpcs)
{
    std::lock_guard lock {mMutex};

    std::vector<VPCInfo> records;

    if (auto err = mStorage->GetAllVPCs(records); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& record : records) {
        auto [state, err] = mDriver->GetLinkState(record.mBridge);
        if (!err.IsNone()) {
            LOG_WRN() << "Can't get bridge state" << Log::Field("bridge", record.mBridge.c_str()) << Log::Field(err);

            state = LinkStateEnum::eAbsent;
        }

        vpcs.push_back({record, state});
    }

    return ErrorEnum::eNone;
}

Error VPCRegistry::GetVPC(const std::string& name, VPCInfo& vpc)
{
    std::lock_guard lock {mMutex};

    if (auto err = mStorage->GetVPC(name, vpc); !err.IsNone()) {
        if (err.Is(ErrorEnum::eNotFound)) {
            return Error(ErrorEnum::eNotFound, ("VPC not found: " + name).c_str());
        }

        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<std::string> VPCRegistry::GetCIDR(const std::string& name)
{
    VPCInfo vpc;

    if (auto err = GetVPC(name, vpc); !err.IsNone()) {
        return {"", err};
    }

    return vpc.mCIDR;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error VPCRegistry::CheckNameCollision(const std::string& name, const std::string& bridge)
{
    std::vector<VPCInfo> records;

    if (auto err = mStorage->GetAllVPCs(records); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& record : records) {
        if (record.mBridge == bridge) {
            return Error(ErrorEnum::eAlreadyExist,
                ("name collision: bridge " + bridge + " of " + name + " is owned by VPC " + record.mName).c_str());
        }
    }

    auto [state, err] = mDriver->GetLinkState(bridge);
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (state != LinkStateEnum::eAbsent) {
        return Error(ErrorEnum::eAlreadyExist, ("bridge already exists: " + bridge).c_str());
    }

    return ErrorEnum::eNone;
}

Error VPCRegistry::DeleteNamespaces(const std::string& name, common::utils::OperationReport& report)
{
    std::vector<std::string> namespaces;

    if (auto err = mDriver->ListNamespaces(namespaces); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    for (const auto& ns : namespaces) {
        auto key = naming::ParseNamespaceName(ns);
        if (!key.has_value() || key->mVPCName != name) {
            continue;
        }

        if (auto err = mDriver->DeleteNamespace(ns); !err.IsNone() && !err.Is(ErrorEnum::eNotFound)) {
            LOG_WRN() << "Can't delete namespace" << Log::Field("ns", ns.c_str()) << Log::Field(err);

            report.Warning("can't delete namespace " + ns + ": " + err.Message());

            continue;
        }

        report.Succeeded("delete namespace " + ns);
    }

    return ErrorEnum::eNone;
}

} // namespace vpcctl::vpc
