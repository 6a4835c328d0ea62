/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_SUPERVISOR_STATE_HPP_
#define HEALER_SUPERVISOR_STATE_HPP_

#include <cstdint>
#include <optional>

#include <common/utils/time.hpp>

namespace healer::supervisor {

/**
 * Supervisor state. Mutated only from the supervisor thread.
 */
struct SupervisorState {
    uint32_t            mConsecutiveFailures {};
    std::optional<Time> mLastHealthCheckAt;
    std::optional<Time> mLastRecoveryAttemptAt;
    Duration            mCurrentBackoff {};
    bool                mIsRecovering {};
    bool                mCriticalAlertSent {};
    Time                mStartedAt {};
};

} // namespace healer::supervisor

#endif
