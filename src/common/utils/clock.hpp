/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_CLOCK_HPP_
#define HEALER_COMMON_UTILS_CLOCK_HPP_

#include <condition_variable>
#include <mutex>

#include "time.hpp"

namespace healer::common::utils {

/**
 * Clock interface.
 */
class ClockItf {
public:
    /**
     * Returns current time.
     *
     * @return Time.
     */
    virtual Time Now() const = 0;

    /**
     * Blocks for the specified duration.
     *
     * @param duration duration to wait.
     * @return false if the wait was interrupted.
     */
    virtual bool WaitFor(Duration duration) = 0;

    /**
     * Checks whether waits are interrupted.
     *
     * @return bool.
     */
    virtual bool IsInterrupted() const = 0;

    /**
     * Destructor.
     */
    virtual ~ClockItf() = default;
};

/**
 * System clock with interruptible waits.
 */
class SystemClock : public ClockItf {
public:
    /**
     * Returns current time.
     *
     * @return Time.
     */
    Time Now() const override;

    /**
     * Blocks for the specified duration or until interrupted.
     *
     * @param duration duration to wait.
     * @return false if the wait was interrupted.
     */
    bool WaitFor(Duration duration) override;

    /**
     * Checks whether waits are interrupted.
     *
     * @return bool.
     */
    bool IsInterrupted() const override;

    /**
     * Interrupts current and further waits until reset.
     */
    void Interrupt();

    /**
     * Re-enables waits.
     */
    void Reset();

private:
    mutable std::mutex      mMutex;
    std::condition_variable mCondVar;
    bool                    mInterrupted {};
};

} // namespace healer::common::utils

#endif
