/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <limits>
#include <unordered_map>

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/NumberParser.h>
#include <Poco/Timestamp.h>

#include "time.hpp"

namespace vpcctl::common::utils {

namespace {

const std::unordered_map<std::string, int64_t>& Units()
{
    static const std::unordered_map<std::string, int64_t> sUnits = {
        {"ns", 1},
        {"us", 1000},
        {"ms", 1000 * 1000},
        {"s", 1000 * 1000 * 1000},
        {"m", 60LL * 1000 * 1000 * 1000},
        {"h", 60LL * 60 * 1000 * 1000 * 1000},
    };

    return sUnits;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Duration> ParseDuration(const std::string& duration)
{
    if (duration.empty()) {
        return {Duration(0), Error(ErrorEnum::eInvalidArgument, "empty duration")};
    }

    int64_t total = 0;
    size_t  pos   = 0;

    while (pos < duration.size()) {
        auto start = pos;

        while (pos < duration.size() && std::isdigit(static_cast<unsigned char>(duration[pos]))) {
            pos++;
        }

        if (start == pos) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, ("invalid duration: " + duration).c_str())};
        }

        Poco::Int64 value = 0;

        if (!Poco::NumberParser::tryParse64(duration.substr(start, pos - start), value)) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, ("duration out of range: " + duration).c_str())};
        }

        auto unitStart = pos;

        while (pos < duration.size() && std::isalpha(static_cast<unsigned char>(duration[pos]))) {
            pos++;
        }

        auto unit = Units().find(duration.substr(unitStart, pos - unitStart));
        if (unit == Units().end()) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, ("invalid duration unit: " + duration).c_str())};
        }

        if (value > (std::numeric_limits<int64_t>::max() - total) / unit->second) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, ("duration out of range: " + duration).c_str())};
        }

        total += value * unit->second;
    }

    return Duration(total);
}

std::string ToUTCString(const Time& time)
{
    Poco::Timestamp timestamp(time.UnixNano() / 1000);

    return Poco::DateTimeFormatter::format(timestamp, Poco::DateTimeFormat::ISO8601_FORMAT);
}

} // namespace vpcctl::common::utils
