/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_ITF_CRITICALALERTSENDER_HPP_
#define HEALER_ALERTS_ITF_CRITICALALERTSENDER_HPP_

#include <cstdint>

#include <core/common/tools/error.hpp>

#include <healer/classifier/classifier.hpp>

namespace healer::alerts {

/**
 * Critical alert sender interface.
 */
class CriticalAlertSenderItf {
public:
    /**
     * Emits critical alert independent of alert rules.
     *
     * @param errorType failure category.
     * @param attempts consecutive failed recovery attempts.
     * @return aos::Error.
     */
    virtual aos::Error SendCriticalAlert(classifier::ErrorType errorType, uint32_t attempts) = 0;

    /**
     * Destructor.
     */
    virtual ~CriticalAlertSenderItf() = default;
};

} // namespace healer::alerts

#endif
