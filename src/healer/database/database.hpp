/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_DATABASE_DATABASE_HPP_
#define HEALER_DATABASE_DATABASE_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <Poco/Data/Session.h>
#include <Poco/Tuple.h>

#include <healer/alerts/itf/rulestorage.hpp>

namespace healer::database {

/**
 * SQLite alert rule store.
 */
class Database : public alerts::RuleStorageItf {
public:
    /**
     * Creates database instance.
     */
    Database();

    /**
     * Destroys database instance.
     */
    ~Database();

    /**
     * Initializes database.
     *
     * @param workDir working directory.
     * @return aos::Error.
     */
    aos::Error Init(const std::string& workDir);

    // alerts::RuleStorageItf interface

    /**
     * Returns enabled rules of specified type.
     *
     * @param type rule type.
     * @param[out] rules enabled rules.
     * @return aos::Error.
     */
    aos::Error GetEnabledRules(alerts::RuleType type, std::vector<alerts::AlertRule>& rules) override;

    /**
     * Atomically increments trigger count and sets last triggered time.
     *
     * @param id rule ID.
     * @param time trigger time.
     * @return aos::Error.
     */
    aos::Error RecordTrigger(const std::string& id, const Time& time) override;

    // Rule management

    /**
     * Returns all rules.
     *
     * @param[out] rules rules.
     * @return aos::Error.
     */
    aos::Error GetAllRules(std::vector<alerts::AlertRule>& rules);

    /**
     * Returns rule by ID.
     *
     * @param id rule ID.
     * @param[out] rule rule.
     * @return aos::Error.
     */
    aos::Error GetRule(const std::string& id, alerts::AlertRule& rule);

    /**
     * Adds or replaces rule.
     *
     * @param rule rule.
     * @return aos::Error.
     */
    aos::Error AddUpdateRule(const alerts::AlertRule& rule);

    /**
     * Resets rule trigger count and last triggered time.
     *
     * @param id rule ID.
     * @return aos::Error.
     */
    aos::Error ResetTrigger(const std::string& id);

    /**
     * Adds default rules if the store is empty.
     *
     * @param memoryThresholdMB memory threshold of default memory rule.
     * @return aos::Error.
     */
    aos::Error SeedDefaultRules(uint64_t memoryThresholdMB);

private:
    static constexpr auto cDBFileName = "healer.db";
    static constexpr auto cRuleFields = "id, name, description, type, condition, threshold, enabled, cooldownMins, "
                                        "lastTriggered, triggerCount";

    enum class AlertRuleColumns : int {
        eID = 0,
        eName,
        eDescription,
        eType,
        eCondition,
        eThreshold,
        eEnabled,
        eCooldownMins,
        eLastTriggered,
        eTriggerCount
    };
    using AlertRuleRow = Poco::Tuple<std::string, std::string, std::string, std::string, std::string, double, bool,
        uint32_t, int64_t, uint64_t>;

    void CreateTables();
    void InsertRule(const alerts::AlertRule& rule);

    static void FromRule(const alerts::AlertRule& src, AlertRuleRow& dst);
    static void ToRule(const AlertRuleRow& src, alerts::AlertRule& dst);

    std::unique_ptr<Poco::Data::Session> mSession;
    std::mutex                           mMutex;
};

} // namespace healer::database

#endif
