/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_ITF_RULESTORAGE_HPP_
#define HEALER_ALERTS_ITF_RULESTORAGE_HPP_

#include <vector>

#include <healer/alerts/alertrule.hpp>

namespace healer::alerts {

/**
 * Alert rule storage interface.
 */
class RuleStorageItf {
public:
    /**
     * Returns enabled rules of specified type.
     *
     * @param type rule type.
     * @param[out] rules enabled rules.
     * @return aos::Error.
     */
    virtual aos::Error GetEnabledRules(RuleType type, std::vector<AlertRule>& rules) = 0;

    /**
     * Atomically increments trigger count and sets last triggered time.
     *
     * @param id rule ID.
     * @param time trigger time.
     * @return aos::Error.
     */
    virtual aos::Error RecordTrigger(const std::string& id, const Time& time) = 0;

    /**
     * Destructor.
     */
    virtual ~RuleStorageItf() = default;
};

} // namespace healer::alerts

#endif
