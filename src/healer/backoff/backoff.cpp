/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>

#include "backoff.hpp"

namespace healer::backoff {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

BackoffController::BackoffController(const config::Backoff& config)
    : mConfig(config)
{
}

bool BackoffController::ShouldAttempt(
    const std::optional<Time>& lastAttempt, Duration currentBackoff, const Time& now) const
{
    return Remaining(lastAttempt, currentBackoff, now) == Duration::zero();
}

Duration BackoffController::Remaining(
    const std::optional<Time>& lastAttempt, Duration currentBackoff, const Time& now) const
{
    if (!lastAttempt.has_value()) {
        return Duration::zero();
    }

    auto elapsed = std::chrono::duration_cast<Duration>(now - *lastAttempt);

    return std::max(Clamp(currentBackoff) - elapsed, Duration::zero());
}

Duration BackoffController::OnFailure(Duration currentBackoff) const
{
    auto grown = std::llround(static_cast<double>(Clamp(currentBackoff).count()) * mConfig.mMultiplier);

    if (grown >= mConfig.mMax.count()) {
        return mConfig.mMax;
    }

    return Clamp(Duration(grown));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Duration BackoffController::Clamp(Duration value) const
{
    return std::min(std::max(value, mConfig.mInitial), mConfig.mMax);
}

} // namespace healer::backoff
