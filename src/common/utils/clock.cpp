/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock.hpp"

namespace healer::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Time SystemClock::Now() const
{
    return std::chrono::system_clock::now();
}

bool SystemClock::WaitFor(Duration duration)
{
    std::unique_lock lock {mMutex};

    return !mCondVar.wait_for(lock, duration, [this] { return mInterrupted; });
}

bool SystemClock::IsInterrupted() const
{
    std::lock_guard lock {mMutex};

    return mInterrupted;
}

void SystemClock::Interrupt()
{
    std::lock_guard lock {mMutex};

    mInterrupted = true;
    mCondVar.notify_all();
}

void SystemClock::Reset()
{
    std::lock_guard lock {mMutex};

    mInterrupted = false;
}

} // namespace healer::common::utils
