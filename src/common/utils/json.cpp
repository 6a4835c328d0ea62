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

namespace healer::common::utils {

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

aos::RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json) noexcept
{
    try {
        Poco::JSON::Parser parser;

        return {parser.parse(json), aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(ToAosError(e, aos::ErrorEnum::eInvalidArgument))};
    }
}

std::string Stringify(const Poco::JSON::Object& json)
{
    std::ostringstream oss;

    Poco::JSON::Stringifier::stringify(json, oss);

    return oss.str();
}

std::string Stringify(const Poco::JSON::Array& json)
{
    std::ostringstream oss;

    Poco::JSON::Stringifier::stringify(json, oss);

    return oss.str();
}

/***********************************************************************************************************************
 * CaseInsensitiveObjectWrapper
 **********************************************************************************************************************/

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var)
    : mObject(var.extract<Poco::JSON::Object::Ptr>())
{
    if (mObject.isNull()) {
        throw Poco::InvalidArgumentException("JSON object expected");
    }
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(Poco::JSON::Object::Ptr object)
    : mObject(std::move(object))
{
    if (mObject.isNull()) {
        throw Poco::InvalidArgumentException("JSON object expected");
    }
}

bool CaseInsensitiveObjectWrapper::Has(const std::string& key) const
{
    return FindKey(key).has_value();
}

std::vector<std::string> CaseInsensitiveObjectWrapper::GetNames() const
{
    return mObject->getNames();
}

Poco::Dynamic::Var CaseInsensitiveObjectWrapper::Get(const std::string& key) const
{
    auto name = FindKey(key);
    if (!name.has_value()) {
        return {};
    }

    return mObject->get(*name);
}

CaseInsensitiveObjectWrapper CaseInsensitiveObjectWrapper::GetObject(const std::string& key) const
{
    auto name = FindKey(key);
    if (!name.has_value()) {
        throw Poco::NotFoundException("key not found", key);
    }

    return CaseInsensitiveObjectWrapper(mObject->getObject(*name));
}

Poco::JSON::Array::Ptr CaseInsensitiveObjectWrapper::GetArray(const std::string& key) const
{
    auto name = FindKey(key);
    if (!name.has_value()) {
        return {};
    }

    return mObject->getArray(*name);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::optional<std::string> CaseInsensitiveObjectWrapper::FindKey(const std::string& key) const
{
    if (mObject->has(key)) {
        return key;
    }

    for (const auto& name : mObject->getNames()) {
        if (Poco::icompare(name, key) == 0) {
            return name;
        }
    }

    return std::nullopt;
}

} // namespace healer::common::utils
