/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <healer/database/database.hpp>

using namespace testing;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

constexpr auto cWorkingDir = "database";

healer::alerts::AlertRule CreateRule(const std::string& id, healer::alerts::RuleType type, bool enabled = true)
{
    healer::alerts::AlertRule rule;

    rule.mID           = id;
    rule.mName         = "rule " + id;
    rule.mDescription  = "description " + id;
    rule.mType         = type;
    rule.mCondition    = healer::alerts::Condition::eGTE;
    rule.mThreshold    = 75.5;
    rule.mEnabled      = enabled;
    rule.mCooldownMins = 10;

    return rule;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DatabaseTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        std::filesystem::remove_all(cWorkingDir);

        mDatabase = std::make_unique<healer::database::Database>();

        ASSERT_TRUE(mDatabase->Init(cWorkingDir).IsNone());
    }

    void TearDown() override
    {
        mDatabase.reset();

        std::filesystem::remove_all(cWorkingDir);
    }

    std::unique_ptr<healer::database::Database> mDatabase;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DatabaseTest, AddGetRule)
{
    auto rule = CreateRule("mem", healer::alerts::RuleType::eMemory);

    ASSERT_TRUE(mDatabase->AddUpdateRule(rule).IsNone());

    healer::alerts::AlertRule result;

    auto err = mDatabase->GetRule("mem", result);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(result.mID, rule.mID);
    EXPECT_EQ(result.mName, rule.mName);
    EXPECT_EQ(result.mDescription, rule.mDescription);
    EXPECT_EQ(result.mType, rule.mType);
    EXPECT_EQ(result.mCondition, rule.mCondition);
    EXPECT_DOUBLE_EQ(result.mThreshold, rule.mThreshold);
    EXPECT_TRUE(result.mEnabled);
    EXPECT_EQ(result.mCooldownMins, 10);
    EXPECT_FALSE(result.mLastTriggered.has_value());
    EXPECT_EQ(result.mTriggerCount, 0);

    EXPECT_TRUE(mDatabase->GetRule("unknown", result).Is(aos::ErrorEnum::eNotFound));
    EXPECT_TRUE(mDatabase->AddUpdateRule(healer::alerts::AlertRule {}).Is(aos::ErrorEnum::eInvalidArgument));
}

TEST_F(DatabaseTest, GetEnabledRulesFiltersByTypeAndState)
{
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("mem1", healer::alerts::RuleType::eMemory)).IsNone());
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("mem2", healer::alerts::RuleType::eMemory, false)).IsNone());
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("svc", healer::alerts::RuleType::eService)).IsNone());
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("mem3", healer::alerts::RuleType::eMemory)).IsNone());

    std::vector<healer::alerts::AlertRule> rules;

    ASSERT_TRUE(mDatabase->GetEnabledRules(healer::alerts::RuleType::eMemory, rules).IsNone());

    ASSERT_EQ(rules.size(), 2);
    EXPECT_EQ(rules[0].mID, "mem1");
    EXPECT_EQ(rules[1].mID, "mem3");

    ASSERT_TRUE(mDatabase->GetEnabledRules(healer::alerts::RuleType::eDisk, rules).IsNone());
    EXPECT_TRUE(rules.empty());

    ASSERT_TRUE(mDatabase->GetAllRules(rules).IsNone());
    EXPECT_EQ(rules.size(), 4);
}

TEST_F(DatabaseTest, RecordAndResetTrigger)
{
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("svc", healer::alerts::RuleType::eService)).IsNone());

    auto first  = healer::common::utils::FromUnixMilli(1760000000000);
    auto second = healer::common::utils::FromUnixMilli(1760000120000);

    ASSERT_TRUE(mDatabase->RecordTrigger("svc", first).IsNone());
    ASSERT_TRUE(mDatabase->RecordTrigger("svc", second).IsNone());

    healer::alerts::AlertRule rule;

    ASSERT_TRUE(mDatabase->GetRule("svc", rule).IsNone());

    EXPECT_EQ(rule.mTriggerCount, 2);
    ASSERT_TRUE(rule.mLastTriggered.has_value());
    EXPECT_EQ(*rule.mLastTriggered, second);

    EXPECT_TRUE(mDatabase->RecordTrigger("unknown", second).Is(aos::ErrorEnum::eNotFound));

    ASSERT_TRUE(mDatabase->ResetTrigger("svc").IsNone());
    ASSERT_TRUE(mDatabase->GetRule("svc", rule).IsNone());

    EXPECT_EQ(rule.mTriggerCount, 0);
    EXPECT_FALSE(rule.mLastTriggered.has_value());
}

TEST_F(DatabaseTest, SeedDefaultRulesOnlyWhenEmpty)
{
    ASSERT_TRUE(mDatabase->SeedDefaultRules(768).IsNone());

    std::vector<healer::alerts::AlertRule> rules;

    ASSERT_TRUE(mDatabase->GetAllRules(rules).IsNone());
    ASSERT_EQ(rules.size(), 3);

    EXPECT_EQ(rules[0].mType, healer::alerts::RuleType::eMemory);
    EXPECT_DOUBLE_EQ(rules[0].mThreshold, 768);
    EXPECT_EQ(rules[0].mCooldownMins, 5);
    EXPECT_EQ(rules[1].mType, healer::alerts::RuleType::eService);
    EXPECT_EQ(rules[1].mCondition, healer::alerts::Condition::eEQ);
    EXPECT_DOUBLE_EQ(rules[1].mThreshold, 0);
    EXPECT_EQ(rules[1].mCooldownMins, 2);
    EXPECT_EQ(rules[2].mType, healer::alerts::RuleType::eCPU);

    ASSERT_TRUE(mDatabase->SeedDefaultRules(768).IsNone());
    ASSERT_TRUE(mDatabase->GetAllRules(rules).IsNone());
    EXPECT_EQ(rules.size(), 3);
}

TEST_F(DatabaseTest, RulesArePersisted)
{
    ASSERT_TRUE(mDatabase->AddUpdateRule(CreateRule("mem", healer::alerts::RuleType::eMemory)).IsNone());

    mDatabase.reset();
    mDatabase = std::make_unique<healer::database::Database>();

    ASSERT_TRUE(mDatabase->Init(cWorkingDir).IsNone());

    healer::alerts::AlertRule rule;

    EXPECT_TRUE(mDatabase->GetRule("mem", rule).IsNone());
}
