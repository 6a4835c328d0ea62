/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_BACKOFF_BACKOFF_HPP_
#define HEALER_BACKOFF_BACKOFF_HPP_

#include <optional>

#include <healer/config/config.hpp>

namespace healer::backoff {

/**
 * Exponential backoff between recovery attempts.
 *
 * The controller is stateless: the current interval is kept by the caller and always stays within [initial, max].
 */
class BackoffController {
public:
    /**
     * Constructor.
     *
     * @param config backoff config.
     */
    explicit BackoffController(const config::Backoff& config = {});

    /**
     * Checks whether a recovery attempt is allowed.
     *
     * @param lastAttempt time of last recovery attempt.
     * @param currentBackoff current backoff interval.
     * @param now current time.
     * @return bool.
     */
    bool ShouldAttempt(const std::optional<Time>& lastAttempt, Duration currentBackoff, const Time& now) const;

    /**
     * Returns time left until next attempt is allowed.
     *
     * @param lastAttempt time of last recovery attempt.
     * @param currentBackoff current backoff interval.
     * @param now current time.
     * @return Duration.
     */
    Duration Remaining(const std::optional<Time>& lastAttempt, Duration currentBackoff, const Time& now) const;

    /**
     * Returns grown backoff interval after failed recovery.
     *
     * @param currentBackoff current backoff interval.
     * @return Duration.
     */
    Duration OnFailure(Duration currentBackoff) const;

    /**
     * Returns backoff interval after successful recovery.
     *
     * @return Duration.
     */
    Duration OnSuccess() const { return mConfig.mInitial; }

private:
    Duration Clamp(Duration value) const;

    config::Backoff mConfig;
};

} // namespace healer::backoff

#endif
