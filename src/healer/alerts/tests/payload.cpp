/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/utils/json.hpp>
#include <healer/alerts/payload.hpp>

using namespace testing;

namespace healer::alerts {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class PayloadTest : public Test {
protected:
    void SetUp() override { aos::tests::utils::InitLog(); }

    template <typename T>
    T RoundTrip(const T& payload)
    {
        Poco::JSON::Object json(Poco::JSON_PRESERVE_KEY_ORDER);

        auto err = ToJSON(payload, json);
        EXPECT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

        auto [var, parseErr] = common::utils::ParseJson(common::utils::Stringify(json));
        EXPECT_TRUE(parseErr.IsNone()) << aos::tests::utils::ErrorToStr(parseErr);

        T result;

        err = FromJSON(common::utils::CaseInsensitiveObjectWrapper(var), result);
        EXPECT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

        return result;
    }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(PayloadTest, AlertPayloadPreservesRuleFields)
{
    AlertRule rule;

    rule.mID        = "7d0c9b1e-high-memory";
    rule.mName      = "High Memory \"console-web\"";
    rule.mType      = RuleType::eMemory;
    rule.mCondition = Condition::eGTE;
    rule.mThreshold = 512.75;

    auto now     = common::utils::FromUnixMilli(1760000000123);
    auto payload = CreateAlertPayload(rule, 640.5, {{"processName", "console-web"}, {"pid", "4242"}}, "healer", now);
    auto result  = RoundTrip(payload);

    EXPECT_EQ(result.mRule.mID, rule.mID);
    EXPECT_EQ(result.mRule.mName, rule.mName);
    EXPECT_EQ(result.mRule.mType, "MEMORY");
    EXPECT_EQ(result.mRule.mCondition, "gte");
    EXPECT_EQ(result.mRule.mThreshold, rule.mThreshold);
    EXPECT_EQ(result.mCurrentValue, 640.5);
    EXPECT_EQ(result.mContext, payload.mContext);
    EXPECT_EQ(result.mSource, "healer");
    EXPECT_EQ(result.mTimestamp, payload.mTimestamp);
    EXPECT_EQ(result.mTimestamp, "2025-10-09T08:53:20.123Z");

    auto [type, typeErr] = ParseRuleType(result.mRule.mType);
    EXPECT_TRUE(typeErr.IsNone());
    EXPECT_EQ(type, rule.mType);

    auto [condition, conditionErr] = ParseCondition(result.mRule.mCondition);
    EXPECT_TRUE(conditionErr.IsNone());
    EXPECT_EQ(condition, rule.mCondition);
}

TEST_F(PayloadTest, CriticalAlertPayload)
{
    CriticalAlertPayload payload;

    payload.mTimestamp = "2025-10-09T08:53:20.123Z";
    payload.mMessage   = "Max recovery attempts reached";
    payload.mErrorType = "prisma";
    payload.mAction    = "manual_intervention_required";
    payload.mSource    = "healer";

    auto result = RoundTrip(payload);

    EXPECT_EQ(result.mTimestamp, payload.mTimestamp);
    EXPECT_EQ(result.mSeverity, "critical");
    EXPECT_EQ(result.mMessage, payload.mMessage);
    EXPECT_EQ(result.mErrorType, payload.mErrorType);
    EXPECT_EQ(result.mAction, payload.mAction);
    EXPECT_EQ(result.mSource, payload.mSource);
}

TEST_F(PayloadTest, WrongPayloadTypeIsRejected)
{
    auto [var, err] = common::utils::ParseJson(R"({"type": "critical_alert", "timestamp": "", "source": ""})");

    ASSERT_TRUE(err.IsNone());

    AlertPayload payload;

    EXPECT_TRUE(
        FromJSON(common::utils::CaseInsensitiveObjectWrapper(var), payload).Is(aos::ErrorEnum::eInvalidArgument));
}

} // namespace healer::alerts
