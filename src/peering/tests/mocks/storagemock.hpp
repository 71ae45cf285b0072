/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_PEERING_TESTS_MOCKS_STORAGEMOCK_HPP_
#define VPCCTL_PEERING_TESTS_MOCKS_STORAGEMOCK_HPP_

#include <gmock/gmock.h>

#include <peering/itf/storage.hpp>

namespace vpcctl::peering::tests {

class MockStorage : public StorageItf {
public:
    MOCK_METHOD(Error, AddPeering, (const PeeringInfo& peering), (override));
    MOCK_METHOD(
        Error, GetPeering, (const std::string& vpc1, const std::string& vpc2, PeeringInfo& peering), (override));
    MOCK_METHOD(Error, GetAllPeerings, (std::vector<PeeringInfo> & peerings), (override));
    MOCK_METHOD(Error, RemovePeering, (const std::string& vpc1, const std::string& vpc2), (override));
};

} // namespace vpcctl::peering::tests

#endif
