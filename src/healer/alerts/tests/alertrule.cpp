/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <healer/alerts/alertrule.hpp>

using namespace testing;

namespace healer::alerts {

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(AlertRuleTest, Conditions)
{
    EXPECT_TRUE(IsConditionMet(Condition::eGT, 81, 80));
    EXPECT_FALSE(IsConditionMet(Condition::eGT, 80, 80));
    EXPECT_TRUE(IsConditionMet(Condition::eGTE, 80, 80));
    EXPECT_TRUE(IsConditionMet(Condition::eLT, 79, 80));
    EXPECT_TRUE(IsConditionMet(Condition::eLTE, 80, 80));
    EXPECT_TRUE(IsConditionMet(Condition::eEQ, 0, 0));
    EXPECT_TRUE(IsConditionMet(Condition::eNEQ, 1, 0));
    EXPECT_FALSE(IsConditionMet(Condition::eNEQ, 0, 0));
}

TEST(AlertRuleTest, ParseCondition)
{
    auto [gt, err] = ParseCondition("GT");

    EXPECT_TRUE(err.IsNone());
    EXPECT_EQ(gt, Condition::eGT);

    EXPECT_EQ(ParseCondition("ne").mValue, Condition::eNEQ);
    EXPECT_EQ(ParseCondition("NEQ").mValue, Condition::eNEQ);
    EXPECT_STREQ(ToString(Condition::eNEQ), "neq");
    EXPECT_TRUE(ParseCondition("between").mError.Is(aos::ErrorEnum::eInvalidArgument));
}

TEST(AlertRuleTest, ParseRuleType)
{
    EXPECT_EQ(ParseRuleType("memory").mValue, RuleType::eMemory);
    EXPECT_EQ(ParseRuleType("SERVICE").mValue, RuleType::eService);
    EXPECT_EQ(ParseRuleType("Container").mValue, RuleType::eContainer);
    EXPECT_STREQ(ToString(RuleType::eDisk), "DISK");
    EXPECT_TRUE(ParseRuleType("network").mError.Is(aos::ErrorEnum::eInvalidArgument));
}

} // namespace healer::alerts
