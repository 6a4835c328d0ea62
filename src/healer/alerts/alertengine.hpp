/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_ALERTENGINE_HPP_
#define HEALER_ALERTS_ALERTENGINE_HPP_

#include <string>
#include <unordered_map>
#include <vector>

#include <Poco/JSON/Object.h>

#include <common/utils/clock.hpp>
#include <healer/config/config.hpp>

#include "alertrule.hpp"
#include "itf/criticalalertsender.hpp"
#include "itf/rulestorage.hpp"
#include "itf/webhooksender.hpp"

namespace healer::alerts {

/**
 * Evaluates alert rules and emits alerts.
 */
class AlertEngine : public CriticalAlertSenderItf {
public:
    /**
     * Initializes alert engine.
     *
     * @param config alerts config.
     * @param storage rule storage.
     * @param webhookSender webhook sender.
     * @param clock clock.
     * @return aos::Error.
     */
    aos::Error Init(const config::Alerts& config, RuleStorageItf& storage, WebhookSenderItf& webhookSender,
        common::utils::ClockItf& clock);

    /**
     * Evaluates enabled rules of specified type against current value.
     *
     * SERVICE rules with zero threshold fire when value is 0, i.e. the service is reported unhealthy, regardless of
     * their condition. Rules that fired within their cooldown window are suppressed before anything is persisted.
     *
     * @param type rule type.
     * @param currentValue current value.
     * @param context alert context.
     * @return IDs of fired rules.
     */
    std::vector<std::string> Evaluate(RuleType type, double currentValue, const AlertContext& context = {});

    /**
     * Emits critical alert independent of alert rules.
     *
     * @param errorType failure category.
     * @param attempts consecutive failed recovery attempts.
     * @return aos::Error.
     */
    aos::Error SendCriticalAlert(classifier::ErrorType errorType, uint32_t attempts) override;

private:
    bool IsRuleMet(const AlertRule& rule, double currentValue) const;
    bool IsInCooldown(const AlertRule& rule, const Time& now) const;
    void SendWebhook(const Poco::JSON::Object& json);

    config::Alerts                        mConfig;
    RuleStorageItf*                       mStorage {};
    WebhookSenderItf*                     mWebhookSender {};
    common::utils::ClockItf*              mClock {};
    std::unordered_map<std::string, Time> mCooldowns;
};

} // namespace healer::alerts

#endif
