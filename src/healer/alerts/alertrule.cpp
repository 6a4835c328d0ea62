/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/String.h>

#include "alertrule.hpp"

namespace healer::alerts {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

const std::pair<RuleType, const char*> cRuleTypeNames[] = {
    {RuleType::eCPU, "CPU"},
    {RuleType::eMemory, "MEMORY"},
    {RuleType::eDisk, "DISK"},
    {RuleType::eService, "SERVICE"},
    {RuleType::eContainer, "CONTAINER"},
};

const std::pair<Condition, const char*> cConditionNames[] = {
    {Condition::eGT, "gt"},
    {Condition::eGTE, "gte"},
    {Condition::eLT, "lt"},
    {Condition::eLTE, "lte"},
    {Condition::eEQ, "eq"},
    {Condition::eNEQ, "neq"},
    {Condition::eNEQ, "ne"},
};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

const char* ToString(RuleType type)
{
    for (const auto& [value, name] : cRuleTypeNames) {
        if (value == type) {
            return name;
        }
    }

    return "UNKNOWN";
}

const char* ToString(Condition condition)
{
    for (const auto& [value, name] : cConditionNames) {
        if (value == condition) {
            return name;
        }
    }

    return "unknown";
}

aos::RetWithError<RuleType> ParseRuleType(const std::string& name)
{
    for (const auto& [value, typeName] : cRuleTypeNames) {
        if (Poco::icompare(name, typeName) == 0) {
            return {value, aos::ErrorEnum::eNone};
        }
    }

    return {RuleType::eMemory, aos::Error(aos::ErrorEnum::eInvalidArgument, "unknown alert rule type")};
}

aos::RetWithError<Condition> ParseCondition(const std::string& name)
{
    for (const auto& [value, conditionName] : cConditionNames) {
        if (Poco::icompare(name, conditionName) == 0) {
            return {value, aos::ErrorEnum::eNone};
        }
    }

    return {Condition::eGT, aos::Error(aos::ErrorEnum::eInvalidArgument, "unknown alert rule condition")};
}

bool IsConditionMet(Condition condition, double value, double threshold)
{
    switch (condition) {
    case Condition::eGT:
        return value > threshold;

    case Condition::eGTE:
        return value >= threshold;

    case Condition::eLT:
        return value < threshold;

    case Condition::eLTE:
        return value <= threshold;

    case Condition::eEQ:
        return value == threshold;

    case Condition::eNEQ:
        return value != threshold;
    }

    return false;
}

} // namespace healer::alerts
