/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_PAYLOAD_HPP_
#define HEALER_ALERTS_PAYLOAD_HPP_

#include <string>

#include <Poco/JSON/Object.h>

#include <common/utils/json.hpp>

#include "alertrule.hpp"

namespace healer::alerts {

/**
 * Alert payload type names.
 */
constexpr auto cAlertPayloadType         = "alert";
constexpr auto cCriticalAlertPayloadType = "critical_alert";

/**
 * Rule part of alert payload.
 */
struct RulePayload {
    std::string mID;
    std::string mName;
    std::string mType;
    std::string mCondition;
    double      mThreshold {};
};

/**
 * Rule-based alert webhook payload.
 */
struct AlertPayload {
    std::string  mTimestamp;
    RulePayload  mRule;
    double       mCurrentValue {};
    AlertContext mContext;
    std::string  mSource;
};

/**
 * Critical alert webhook payload.
 */
struct CriticalAlertPayload {
    std::string mTimestamp;
    std::string mSeverity = "critical";
    std::string mMessage;
    std::string mErrorType;
    std::string mAction;
    std::string mSource;
};

/**
 * Creates alert payload for fired rule.
 *
 * @param rule fired rule.
 * @param currentValue value that fired the rule.
 * @param context alert context.
 * @param source alert source.
 * @param now fire time.
 * @return AlertPayload.
 */
AlertPayload CreateAlertPayload(const AlertRule& rule, double currentValue, const AlertContext& context,
    const std::string& source, const Time& now);

/**
 * Converts alert payload to JSON object.
 *
 * @param payload payload.
 * @param[out] json JSON object to fill.
 * @return aos::Error.
 */
aos::Error ToJSON(const AlertPayload& payload, Poco::JSON::Object& json);

/**
 * Converts JSON object to alert payload.
 *
 * @param json JSON object to parse.
 * @param[out] payload payload.
 * @return aos::Error.
 */
aos::Error FromJSON(const common::utils::CaseInsensitiveObjectWrapper& json, AlertPayload& payload);

/**
 * Converts critical alert payload to JSON object.
 *
 * @param payload payload.
 * @param[out] json JSON object to fill.
 * @return aos::Error.
 */
aos::Error ToJSON(const CriticalAlertPayload& payload, Poco::JSON::Object& json);

/**
 * Converts JSON object to critical alert payload.
 *
 * @param json JSON object to parse.
 * @param[out] payload payload.
 * @return aos::Error.
 */
aos::Error FromJSON(const common::utils::CaseInsensitiveObjectWrapper& json, CriticalAlertPayload& payload);

} // namespace healer::alerts

#endif
