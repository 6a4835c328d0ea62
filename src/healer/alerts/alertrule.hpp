/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_ALERTRULE_HPP_
#define HEALER_ALERTS_ALERTRULE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <core/common/tools/error.hpp>

#include <common/utils/time.hpp>

namespace healer::alerts {

/**
 * Alert rule type.
 */
enum class RuleType {
    eCPU,
    eMemory,
    eDisk,
    eService,
    eContainer,
};

/**
 * Alert rule condition.
 */
enum class Condition {
    eGT,
    eGTE,
    eLT,
    eLTE,
    eEQ,
    eNEQ,
};

/**
 * Alert rule.
 */
struct AlertRule {
    std::string         mID;
    std::string         mName;
    std::string         mDescription;
    RuleType            mType {RuleType::eMemory};
    Condition           mCondition {Condition::eGT};
    double              mThreshold {};
    bool                mEnabled {true};
    uint32_t            mCooldownMins {5};
    std::optional<Time> mLastTriggered;
    uint64_t            mTriggerCount {};
};

/**
 * Alert context: free-form key/value pairs attached to fired alert.
 */
using AlertContext = std::map<std::string, std::string>;

/**
 * Returns rule type name.
 *
 * @param type rule type.
 * @return const char*.
 */
const char* ToString(RuleType type);

/**
 * Returns condition name.
 *
 * @param condition condition.
 * @return const char*.
 */
const char* ToString(Condition condition);

/**
 * Parses rule type name, case insensitive.
 *
 * @param name type name.
 * @return aos::RetWithError<RuleType>.
 */
aos::RetWithError<RuleType> ParseRuleType(const std::string& name);

/**
 * Parses condition name, case insensitive. "ne" is accepted as alias of "neq".
 *
 * @param name condition name.
 * @return aos::RetWithError<Condition>.
 */
aos::RetWithError<Condition> ParseCondition(const std::string& name);

/**
 * Compares value against threshold.
 *
 * @param condition condition.
 * @param value current value.
 * @param threshold threshold.
 * @return bool.
 */
bool IsConditionMet(Condition condition, double value, double threshold);

} // namespace healer::alerts

#endif
