/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/json.hpp>
#include <healer/logger/logmodule.hpp>

#include "alertengine.hpp"
#include "payload.hpp"

namespace healer::alerts {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

namespace {

constexpr auto cCriticalMessage = "Max recovery attempts reached - manual intervention may be required";
constexpr auto cCriticalAction  = "manual_intervention_required";

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error AlertEngine::Init(const config::Alerts& config, RuleStorageItf& storage, WebhookSenderItf& webhookSender,
    common::utils::ClockItf& clock)
{
    LOG_DBG() << "Init alert engine" << aos::Log::Field("webhook", !config.mWebhookURL.empty());

    mConfig        = config;
    mStorage       = &storage;
    mWebhookSender = &webhookSender;
    mClock         = &clock;

    mCooldowns.clear();

    return aos::ErrorEnum::eNone;
}

std::vector<std::string> AlertEngine::Evaluate(RuleType type, double currentValue, const AlertContext& context)
{
    std::vector<std::string> fired;
    std::vector<AlertRule>   rules;

    if (auto err = mStorage->GetEnabledRules(type, rules); !err.IsNone()) {
        LOG_ERR() << "Can't get alert rules" << aos::Log::Field("type", ToString(type)) << aos::Log::Field(err);

        return fired;
    }

    for (const auto& rule : rules) {
        if (!rule.mEnabled || rule.mType != type || !IsRuleMet(rule, currentValue)) {
            continue;
        }

        auto now = mClock->Now();

        if (IsInCooldown(rule, now)) {
            LOG_DBG() << "Alert suppressed by cooldown" << aos::Log::Field("rule", rule.mName.c_str());

            continue;
        }

        if (auto err = mStorage->RecordTrigger(rule.mID, now); !err.IsNone()) {
            LOG_ERR() << "Can't record alert trigger" << aos::Log::Field("rule", rule.mID.c_str())
                      << aos::Log::Field(err);
        }

        mCooldowns[rule.mID] = now;

        LOG_WRN() << "Alert triggered" << aos::Log::Field("rule", rule.mName.c_str())
                  << aos::Log::Field("type", ToString(type)) << aos::Log::Field("condition", ToString(rule.mCondition))
                  << aos::Log::Field("value", static_cast<int64_t>(currentValue))
                  << aos::Log::Field("threshold", static_cast<int64_t>(rule.mThreshold));

        fired.push_back(rule.mID);

        if (mConfig.mWebhookURL.empty()) {
            continue;
        }

        Poco::JSON::Object json(Poco::JSON_PRESERVE_KEY_ORDER);

        if (auto err = ToJSON(CreateAlertPayload(rule, currentValue, context, mConfig.mSource, now), json);
            !err.IsNone()) {
            LOG_ERR() << "Can't create alert payload" << aos::Log::Field(err);

            continue;
        }

        SendWebhook(json);
    }

    return fired;
}

aos::Error AlertEngine::SendCriticalAlert(classifier::ErrorType errorType, uint32_t attempts)
{
    LOG_ERR() << "CRITICAL: " << cCriticalMessage << aos::Log::Field("errorType", classifier::ToString(errorType))
              << aos::Log::Field("attempts", attempts);

    if (mConfig.mWebhookURL.empty()) {
        return aos::ErrorEnum::eNone;
    }

    CriticalAlertPayload payload;

    payload.mTimestamp = common::utils::ToISO8601String(mClock->Now());
    payload.mMessage   = cCriticalMessage;
    payload.mErrorType = classifier::ToString(errorType);
    payload.mAction    = cCriticalAction;
    payload.mSource    = mConfig.mSource;

    Poco::JSON::Object json(Poco::JSON_PRESERVE_KEY_ORDER);

    if (auto err = ToJSON(payload, json); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mWebhookSender->Send(mConfig.mWebhookURL, common::utils::Stringify(json)); !err.IsNone()) {
        LOG_ERR() << "Can't send critical alert webhook" << aos::Log::Field(err);

        return AOS_ERROR_WRAP(err);
    }

    return aos::ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

bool AlertEngine::IsRuleMet(const AlertRule& rule, double currentValue) const
{
    if (rule.mType == RuleType::eService && rule.mThreshold == 0) {
        return currentValue == 0;
    }

    return IsConditionMet(rule.mCondition, currentValue, rule.mThreshold);
}

bool AlertEngine::IsInCooldown(const AlertRule& rule, const Time& now) const
{
    auto it = mCooldowns.find(rule.mID);
    if (it == mCooldowns.end()) {
        return false;
    }

    return now - it->second < std::chrono::minutes(rule.mCooldownMins);
}

void AlertEngine::SendWebhook(const Poco::JSON::Object& json)
{
    if (auto err = mWebhookSender->Send(mConfig.mWebhookURL, common::utils::Stringify(json)); !err.IsNone()) {
        LOG_ERR() << "Can't send alert webhook" << aos::Log::Field(err);
    }
}

} // namespace healer::alerts
