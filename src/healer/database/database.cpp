/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Path.h>
#include <Poco/UUIDGenerator.h>

#include <common/utils/exception.hpp>
#include <healer/logger/logmodule.hpp>

#include "database.hpp"

using namespace Poco::Data::Keywords;

namespace healer::database {

/***********************************************************************************************************************
 * Statics
 **********************************************************************************************************************/

namespace {

template <typename E>
constexpr int ToInt(E e)
{
    return static_cast<int>(e);
}

alerts::AlertRule CreateDefaultRule(const std::string& name, const std::string& description, alerts::RuleType type,
    alerts::Condition condition, double threshold, uint32_t cooldownMins)
{
    alerts::AlertRule rule;

    rule.mID           = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    rule.mName         = name;
    rule.mDescription  = description;
    rule.mType         = type;
    rule.mCondition    = condition;
    rule.mThreshold    = threshold;
    rule.mCooldownMins = cooldownMins;

    return rule;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Database::Database()
{
    Poco::Data::SQLite::Connector::registerConnector();
}

Database::~Database()
{
    if (mSession && mSession->isConnected()) {
        mSession->close();
    }

    Poco::Data::SQLite::Connector::unregisterConnector();
}

aos::Error Database::Init(const std::string& workDir)
{
    LOG_DBG() << "Init database" << aos::Log::Field("workDir", workDir.c_str());

    if (mSession && mSession->isConnected()) {
        return aos::ErrorEnum::eNone;
    }

    try {
        auto dirPath = std::filesystem::path(workDir);
        if (!std::filesystem::exists(dirPath)) {
            std::filesystem::create_directories(dirPath);
        }

        const auto dbPath = Poco::Path(workDir, cDBFileName);
        mSession          = std::make_unique<Poco::Data::Session>("SQLite", dbPath.toString());

        CreateTables();
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::GetEnabledRules(alerts::RuleType type, std::vector<alerts::AlertRule>& rules)
{
    std::lock_guard lock {mMutex};

    try {
        std::vector<AlertRuleRow> rows;

        *mSession << "SELECT " << cRuleFields << " FROM alertrules WHERE enabled = 1 AND type = ? ORDER BY rowid;",
            bind(std::string(alerts::ToString(type))), into(rows), now;

        rules.clear();

        for (const auto& row : rows) {
            ToRule(row, rules.emplace_back());
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::RecordTrigger(const std::string& id, const Time& time)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Record alert trigger" << aos::Log::Field("id", id.c_str());

    try {
        Poco::Data::Statement statement {*mSession};

        statement << "UPDATE alertrules SET triggerCount = triggerCount + 1, lastTriggered = ? WHERE id = ?;",
            bind(common::utils::ToUnixMilli(time)), bind(id);

        if (statement.execute() == 0) {
            return AOS_ERROR_WRAP(aos::ErrorEnum::eNotFound);
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::GetAllRules(std::vector<alerts::AlertRule>& rules)
{
    std::lock_guard lock {mMutex};

    try {
        std::vector<AlertRuleRow> rows;

        *mSession << "SELECT " << cRuleFields << " FROM alertrules ORDER BY rowid;", into(rows), now;

        rules.clear();

        for (const auto& row : rows) {
            ToRule(row, rules.emplace_back());
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::GetRule(const std::string& id, alerts::AlertRule& rule)
{
    std::lock_guard lock {mMutex};

    try {
        std::vector<AlertRuleRow> rows;
        Poco::Data::Statement     statement {*mSession};

        statement << "SELECT " << cRuleFields << " FROM alertrules WHERE id = ?;", bind(id), into(rows);

        if (statement.execute() == 0 || rows.empty()) {
            return AOS_ERROR_WRAP(aos::ErrorEnum::eNotFound);
        }

        ToRule(rows.front(), rule);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::AddUpdateRule(const alerts::AlertRule& rule)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Add update alert rule" << aos::Log::Field("id", rule.mID.c_str())
              << aos::Log::Field("name", rule.mName.c_str());

    if (rule.mID.empty()) {
        return AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "rule ID is empty"));
    }

    try {
        InsertRule(rule);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::ResetTrigger(const std::string& id)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Reset alert trigger" << aos::Log::Field("id", id.c_str());

    try {
        Poco::Data::Statement statement {*mSession};

        statement << "UPDATE alertrules SET triggerCount = 0, lastTriggered = 0 WHERE id = ?;", bind(id);

        if (statement.execute() == 0) {
            return AOS_ERROR_WRAP(aos::ErrorEnum::eNotFound);
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::Error Database::SeedDefaultRules(uint64_t memoryThresholdMB)
{
    std::lock_guard lock {mMutex};

    try {
        size_t count {0};

        *mSession << "SELECT COUNT(*) FROM alertrules;", into(count), now;

        if (count > 0) {
            return aos::ErrorEnum::eNone;
        }

        LOG_INF() << "Seed default alert rules";

        InsertRule(CreateDefaultRule("High Memory", "Process memory usage exceeds threshold", alerts::RuleType::eMemory,
            alerts::Condition::eGT, static_cast<double>(memoryThresholdMB), 5));
        InsertRule(CreateDefaultRule("Service Down", "Health check failed", alerts::RuleType::eService,
            alerts::Condition::eEQ, 0, 2));
        InsertRule(CreateDefaultRule("High CPU", "Process CPU usage exceeds threshold", alerts::RuleType::eCPU,
            alerts::Condition::eGT, 80, 5));
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Database::CreateTables()
{
    LOG_DBG() << "Create tables";

    *mSession << "CREATE TABLE IF NOT EXISTS alertrules ("
                 "id TEXT NOT NULL PRIMARY KEY, "
                 "name TEXT, "
                 "description TEXT, "
                 "type TEXT, "
                 "condition TEXT, "
                 "threshold REAL, "
                 "enabled INTEGER, "
                 "cooldownMins INTEGER, "
                 "lastTriggered INTEGER, "
                 "triggerCount INTEGER);",
        now;
}

void Database::InsertRule(const alerts::AlertRule& rule)
{
    AlertRuleRow row;

    FromRule(rule, row);

    *mSession << "INSERT OR REPLACE INTO alertrules (" << cRuleFields << ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
        bind(row), now;
}

void Database::FromRule(const alerts::AlertRule& src, AlertRuleRow& dst)
{
    dst.set<ToInt(AlertRuleColumns::eID)>(src.mID);
    dst.set<ToInt(AlertRuleColumns::eName)>(src.mName);
    dst.set<ToInt(AlertRuleColumns::eDescription)>(src.mDescription);
    dst.set<ToInt(AlertRuleColumns::eType)>(alerts::ToString(src.mType));
    dst.set<ToInt(AlertRuleColumns::eCondition)>(alerts::ToString(src.mCondition));
    dst.set<ToInt(AlertRuleColumns::eThreshold)>(src.mThreshold);
    dst.set<ToInt(AlertRuleColumns::eEnabled)>(src.mEnabled);
    dst.set<ToInt(AlertRuleColumns::eCooldownMins)>(src.mCooldownMins);
    dst.set<ToInt(AlertRuleColumns::eLastTriggered)>(
        src.mLastTriggered.has_value() ? common::utils::ToUnixMilli(*src.mLastTriggered) : 0);
    dst.set<ToInt(AlertRuleColumns::eTriggerCount)>(src.mTriggerCount);
}

void Database::ToRule(const AlertRuleRow& src, alerts::AlertRule& dst)
{
    dst.mID          = src.get<ToInt(AlertRuleColumns::eID)>();
    dst.mName        = src.get<ToInt(AlertRuleColumns::eName)>();
    dst.mDescription = src.get<ToInt(AlertRuleColumns::eDescription)>();

    auto [type, err] = alerts::ParseRuleType(src.get<ToInt(AlertRuleColumns::eType)>());
    HEALER_ERROR_CHECK_AND_THROW(err, "failed to parse rule type");

    dst.mType = type;

    auto [condition, conditionErr] = alerts::ParseCondition(src.get<ToInt(AlertRuleColumns::eCondition)>());
    HEALER_ERROR_CHECK_AND_THROW(conditionErr, "failed to parse rule condition");

    dst.mCondition    = condition;
    dst.mThreshold    = src.get<ToInt(AlertRuleColumns::eThreshold)>();
    dst.mEnabled      = src.get<ToInt(AlertRuleColumns::eEnabled)>();
    dst.mCooldownMins = src.get<ToInt(AlertRuleColumns::eCooldownMins)>();
    dst.mTriggerCount = src.get<ToInt(AlertRuleColumns::eTriggerCount)>();

    if (auto lastTriggered = src.get<ToInt(AlertRuleColumns::eLastTriggered)>(); lastTriggered > 0) {
        dst.mLastTriggered = common::utils::FromUnixMilli(lastTriggered);
    } else {
        dst.mLastTriggered.reset();
    }
}

} // namespace healer::database
