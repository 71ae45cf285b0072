/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/Parser.h>
#include <Poco/JSON/Stringifier.h>
#include <Poco/String.h>

#include "exception.hpp"
#include "json.hpp"

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in)
{
    try {
        Poco::JSON::Parser parser;

        return parser.parse(in);
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json)
{
    std::istringstream in(json);

    return ParseJson(in);
}

std::string Stringify(const Poco::Dynamic::Var& json)
{
    std::ostringstream out;

    Poco::JSON::Stringifier::stringify(json, out);

    return out.str();
}

/***********************************************************************************************************************
 * CaseInsensitiveObjectWrapper
 **********************************************************************************************************************/

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var)
    : mObject(var.extract<Poco::JSON::Object::Ptr>())
{
    if (mObject.isNull()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "JSON value is not an object");
    }
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object)
    : mObject(object)
{
    if (mObject.isNull()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "JSON value is not an object");
    }
}

bool CaseInsensitiveObjectWrapper::Has(const std::string& key) const
{
    return FindKey(key).has_value();
}

Poco::Dynamic::Var CaseInsensitiveObjectWrapper::Get(const std::string& key) const
{
    auto realKey = FindKey(key);
    if (!realKey.has_value()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eNotFound, "key not found: " + key);
    }

    return mObject->get(*realKey);
}

CaseInsensitiveObjectWrapper CaseInsensitiveObjectWrapper::GetObject(const std::string& key) const
{
    auto realKey = FindKey(key);
    if (!realKey.has_value()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eNotFound, "key not found: " + key);
    }

    return CaseInsensitiveObjectWrapper(mObject->getObject(*realKey));
}

Poco::JSON::Array::Ptr CaseInsensitiveObjectWrapper::GetArray(const std::string& key) const
{
    auto realKey = FindKey(key);
    if (!realKey.has_value()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eNotFound, "key not found: " + key);
    }

    auto array = mObject->getArray(*realKey);
    if (array.isNull()) {
        VPCCTL_ERROR_THROW(ErrorEnum::eInvalidArgument, "value is not an array: " + key);
    }

    return array;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::optional<std::string> CaseInsensitiveObjectWrapper::FindKey(const std::string& key) const
{
    for (const auto& [name, value] : *mObject) {
        if (Poco::icompare(name, key) == 0) {
            return name;
        }
    }

    return std::nullopt;
}

} // namespace vpcctl::common::utils
