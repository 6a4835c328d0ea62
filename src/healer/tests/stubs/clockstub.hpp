/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_TESTS_STUBS_CLOCKSTUB_HPP_
#define HEALER_TESTS_STUBS_CLOCKSTUB_HPP_

#include <vector>

#include <common/utils/clock.hpp>

namespace healer::common::utils {

/**
 * Manual clock: waits advance time instantly.
 */
class ManualClock : public ClockItf {
public:
    explicit ManualClock(Time now = Time(std::chrono::hours(24 * 365 * 50)))
        : mNow(now)
    {
    }

    Time Now() const override { return mNow; }

    bool WaitFor(Duration duration) override
    {
        mWaits.push_back(duration);

        if (mInterrupted) {
            return false;
        }

        mNow += duration;

        return true;
    }

    bool IsInterrupted() const override { return mInterrupted; }

    void Advance(Duration duration) { mNow += duration; }

    void SetInterrupted(bool interrupted) { mInterrupted = interrupted; }

    const std::vector<Duration>& GetWaits() const { return mWaits; }

private:
    Time                  mNow;
    bool                  mInterrupted {};
    std::vector<Duration> mWaits;
};

} // namespace healer::common::utils

#endif
