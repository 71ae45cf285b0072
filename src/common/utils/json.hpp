/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_JSON_HPP_
#define VPCCTL_COMMON_UTILS_JSON_HPP_

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <common/types/common.hpp>

namespace vpcctl::common::utils {

/**
 * Parses JSON from stream.
 *
 * @param in input stream.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in);

/**
 * Parses JSON from string.
 *
 * @param json JSON string.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json);

/**
 * Stringifies JSON value.
 *
 * @param json JSON value.
 * @return std::string.
 */
std::string Stringify(const Poco::Dynamic::Var& json);

/**
 * Wrapper of JSON object with case insensitive keys.
 */
class CaseInsensitiveObjectWrapper {
public:
    /**
     * Constructor.
     *
     * @param var JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var);

    /**
     * Constructor.
     *
     * @param object JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object);

    /**
     * Checks if object has the key.
     *
     * @param key key.
     * @return bool.
     */
    bool Has(const std::string& key) const;

    /**
     * Returns value by key.
     *
     * @param key key.
     * @return Poco::Dynamic::Var.
     */
    Poco::Dynamic::Var Get(const std::string& key) const;

    /**
     * Returns value by key converted to the type, throws if key is absent.
     *
     * @param key key.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key) const
    {
        return Get(key).convert<T>();
    }

    /**
     * Returns value by key converted to the type or default value.
     *
     * @param key key.
     * @param defaultValue default value.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key, const T& defaultValue) const
    {
        return GetOptionalValue<T>(key).value_or(defaultValue);
    }

    /**
     * Returns optional value by key.
     *
     * @param key key.
     * @return std::optional<T>.
     */
    template <typename T>
    std::optional<T> GetOptionalValue(const std::string& key) const
    {
        if (!Has(key)) {
            return std::nullopt;
        }

        auto value = Get(key);
        if (value.isEmpty()) {
            return std::nullopt;
        }

        return value.convert<T>();
    }

    /**
     * Returns nested object.
     *
     * @param key key.
     * @return CaseInsensitiveObjectWrapper.
     */
    CaseInsensitiveObjectWrapper GetObject(const std::string& key) const;

    /**
     * Returns nested array.
     *
     * @param key key.
     * @return Poco::JSON::Array::Ptr.
     */
    Poco::JSON::Array::Ptr GetArray(const std::string& key) const;

    /**
     * Returns array of values converted to the type.
     *
     * @param key key.
     * @return std::vector<T>.
     */
    template <typename T>
    std::vector<T> GetArrayValue(const std::string& key) const
    {
        std::vector<T> result;

        if (!Has(key)) {
            return result;
        }

        for (const auto& item : *GetArray(key)) {
            result.push_back(item.convert<T>());
        }

        return result;
    }

private:
    std::optional<std::string> FindKey(const std::string& key) const;

    Poco::JSON::Object::Ptr mObject;
};

} // namespace vpcctl::common::utils

#endif
