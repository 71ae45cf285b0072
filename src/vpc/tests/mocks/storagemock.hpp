/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_VPC_TESTS_MOCKS_STORAGEMOCK_HPP_
#define VPCCTL_VPC_TESTS_MOCKS_STORAGEMOCK_HPP_

#include <gmock/gmock.h>

#include <vpc/itf/storage.hpp>

namespace vpcctl::vpc::tests {

class MockStorage : public StorageItf {
public:
    MOCK_METHOD(Error, AddVPC, (const VPCInfo& vpc), (override));
    MOCK_METHOD(Error, UpdateVPC, (const VPCInfo& vpc), (override));
    MOCK_METHOD(Error, GetVPC, (const std::string& name, VPCInfo& vpc), (override));
    MOCK_METHOD(Error, GetAllVPCs, (std::vector<VPCInfo> & vpcs), (override));
    MOCK_METHOD(Error, RemoveVPC, (const std::string& name), (override));
};

} // namespace vpcctl::vpc::tests

#endif
