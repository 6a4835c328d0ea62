/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_JSON_HPP_
#define HEALER_COMMON_UTILS_JSON_HPP_

#include <optional>
#include <string>
#include <vector>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <core/common/tools/error.hpp>

namespace healer::common::utils {

/**
 * Parses JSON string.
 *
 * @param json JSON string.
 * @return aos::RetWithError<Poco::Dynamic::Var>.
 */
aos::RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json) noexcept;

/**
 * Converts JSON object to string.
 *
 * @param json JSON object.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Object& json);

/**
 * Converts JSON array to string.
 *
 * @param json JSON array.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Array& json);

/**
 * Wraps JSON object and provides access to its members ignoring key case.
 */
class CaseInsensitiveObjectWrapper {
public:
    /**
     * Creates wrapper from dynamic var.
     *
     * @param var dynamic var holding JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var);

    /**
     * Creates wrapper from JSON object.
     *
     * @param object JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(Poco::JSON::Object::Ptr object);

    /**
     * Checks whether object has key.
     *
     * @param key key.
     * @return bool.
     */
    bool Has(const std::string& key) const;

    /**
     * Returns object member names.
     *
     * @return std::vector<std::string>.
     */
    std::vector<std::string> GetNames() const;

    /**
     * Returns raw member value.
     *
     * @param key key.
     * @return Poco::Dynamic::Var.
     */
    Poco::Dynamic::Var Get(const std::string& key) const;

    /**
     * Returns member value or throws if it is absent.
     *
     * @param key key.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key) const
    {
        auto value = GetOptionalValue<T>(key);
        if (!value.has_value()) {
            throw Poco::NotFoundException("key not found", key);
        }

        return *value;
    }

    /**
     * Returns member value or default value if it is absent.
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
     * Returns optional member value.
     *
     * @param key key.
     * @return std::optional<T>.
     */
    template <typename T>
    std::optional<T> GetOptionalValue(const std::string& key) const
    {
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

private:
    std::optional<std::string> FindKey(const std::string& key) const;

    Poco::JSON::Object::Ptr mObject;
};

/**
 * Returns array member converted to vector.
 *
 * @param object JSON object wrapper.
 * @param key key.
 * @return std::vector<T>.
 */
template <typename T>
std::vector<T> GetArrayValue(const CaseInsensitiveObjectWrapper& object, const std::string& key)
{
    std::vector<T> result;

    if (!object.Has(key)) {
        return result;
    }

    auto array = object.GetArray(key);
    if (array.isNull()) {
        return result;
    }

    for (const auto& item : *array) {
        result.push_back(item.convert<T>());
    }

    return result;
}

} // namespace healer::common::utils

#endif
