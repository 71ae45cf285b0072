/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_TYPES_NETWORK_HPP_
#define VPCCTL_COMMON_TYPES_NETWORK_HPP_

#include <cstdint>
#include <string>

#include "common.hpp"

namespace vpcctl {

/**
 * Max interface name length without terminating zero.
 */
constexpr auto cMaxIfNameLen = 15;

/**
 * Subnet type.
 */
class SubnetTypeType {
public:
    enum class Enum {
        ePublic,
        ePrivate,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "public",
            "private",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using SubnetTypeEnum = SubnetTypeType::Enum;
using SubnetType     = EnumStringer<SubnetTypeType>;

/**
 * Live state of a link as observed in the kernel.
 */
class LinkStateType {
public:
    enum class Enum {
        eAbsent,
        eDown,
        eUp,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "absent",
            "down",
            "up",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using LinkStateEnum = LinkStateType::Enum;
using LinkState     = EnumStringer<LinkStateType>;

/**
 * TCP port probe result.
 */
class PortStateType {
public:
    enum class Enum {
        eOpen,
        eClosed,
        eFiltered,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "open",
            "closed",
            "filtered",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using PortStateEnum = PortStateType::Enum;
using PortState     = EnumStringer<PortStateType>;

/**
 * Route inside a namespace.
 */
struct Route {
    std::string mDestination;
    std::string mGateway;
    std::string mDevice;
    bool        mOnLink {};

    /**
     * Compares routes.
     *
     * @param rhs route to compare with.
     * @return bool.
     */
    bool operator==(const Route& rhs) const
    {
        return mDestination == rhs.mDestination && mGateway == rhs.mGateway && mDevice == rhs.mDevice
            && mOnLink == rhs.mOnLink;
    }

    /**
     * Compares routes.
     *
     * @param rhs route to compare with.
     * @return bool.
     */
    bool operator!=(const Route& rhs) const { return !operator==(rhs); }
};

} // namespace vpcctl

#endif
