/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/exception.hpp>

#include "payload.hpp"

namespace healer::alerts {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void CheckPayloadType(const common::utils::CaseInsensitiveObjectWrapper& json, const std::string& expected)
{
    if (json.GetValue<std::string>("type") != expected) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, ("payload type is not " + expected).c_str());
    }
}

Poco::JSON::Object::Ptr RuleToJSON(const RulePayload& rule)
{
    auto json = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    json->set("id", rule.mID);
    json->set("name", rule.mName);
    json->set("type", rule.mType);
    json->set("condition", rule.mCondition);
    json->set("threshold", rule.mThreshold);

    return json;
}

void RuleFromJSON(const common::utils::CaseInsensitiveObjectWrapper& json, RulePayload& rule)
{
    rule.mID        = json.GetValue<std::string>("id");
    rule.mName      = json.GetValue<std::string>("name");
    rule.mType      = json.GetValue<std::string>("type");
    rule.mCondition = json.GetValue<std::string>("condition");
    rule.mThreshold = json.GetValue<double>("threshold");
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

AlertPayload CreateAlertPayload(const AlertRule& rule, double currentValue, const AlertContext& context,
    const std::string& source, const Time& now)
{
    AlertPayload payload;

    payload.mTimestamp       = common::utils::ToISO8601String(now);
    payload.mRule.mID        = rule.mID;
    payload.mRule.mName      = rule.mName;
    payload.mRule.mType      = ToString(rule.mType);
    payload.mRule.mCondition = ToString(rule.mCondition);
    payload.mRule.mThreshold = rule.mThreshold;
    payload.mCurrentValue    = currentValue;
    payload.mContext         = context;
    payload.mSource          = source;

    return payload;
}

aos::Error ToJSON(const AlertPayload& payload, Poco::JSON::Object& json)
{
    try {
        auto context = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

        for (const auto& [key, value] : payload.mContext) {
            context->set(key, value);
        }

        json.set("type", cAlertPayloadType);
        json.set("timestamp", payload.mTimestamp);
        json.set("rule", RuleToJSON(payload.mRule));
        json.set("currentValue", payload.mCurrentValue);
        json.set("context", context);
        json.set("source", payload.mSource);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error FromJSON(const common::utils::CaseInsensitiveObjectWrapper& json, AlertPayload& payload)
{
    try {
        CheckPayloadType(json, cAlertPayloadType);

        payload.mTimestamp    = json.GetValue<std::string>("timestamp");
        payload.mCurrentValue = json.GetValue<double>("currentValue");
        payload.mSource       = json.GetValue<std::string>("source");

        RuleFromJSON(json.GetObject("rule"), payload.mRule);

        payload.mContext.clear();

        if (json.Has("context")) {
            auto context = json.GetObject("context");

            for (const auto& key : context.GetNames()) {
                payload.mContext.emplace(key, context.GetValue<std::string>(key));
            }
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eInvalidArgument));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error ToJSON(const CriticalAlertPayload& payload, Poco::JSON::Object& json)
{
    try {
        json.set("type", cCriticalAlertPayloadType);
        json.set("timestamp", payload.mTimestamp);
        json.set("severity", payload.mSeverity);
        json.set("message", payload.mMessage);
        json.set("errorType", payload.mErrorType);
        json.set("action", payload.mAction);
        json.set("source", payload.mSource);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error FromJSON(const common::utils::CaseInsensitiveObjectWrapper& json, CriticalAlertPayload& payload)
{
    try {
        CheckPayloadType(json, cCriticalAlertPayloadType);

        payload.mTimestamp = json.GetValue<std::string>("timestamp");
        payload.mSeverity  = json.GetValue<std::string>("severity");
        payload.mMessage   = json.GetValue<std::string>("message");
        payload.mErrorType = json.GetValue<std::string>("errorType");
        payload.mAction    = json.GetValue<std::string>("action");
        payload.mSource    = json.GetValue<std::string>("source");
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eInvalidArgument));
    }

    return aos::ErrorEnum::eNone;
}

} // namespace healer::alerts
