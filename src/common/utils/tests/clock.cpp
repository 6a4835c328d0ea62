/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <future>

#include <gtest/gtest.h>

#include <common/utils/clock.hpp>

using namespace testing;
using namespace std::chrono_literals;

namespace healer::common::utils {

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(SystemClockTest, WaitForElapses)
{
    SystemClock clock;

    auto start = clock.Now();

    EXPECT_TRUE(clock.WaitFor(50ms));
    EXPECT_GE(clock.Now() - start, 50ms);
}

TEST(SystemClockTest, InterruptWakesWaiter)
{
    SystemClock clock;

    auto result = std::async(std::launch::async, [&clock]() { return clock.WaitFor(1min); });

    std::this_thread::sleep_for(50ms);
    clock.Interrupt();

    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(result.get());

    EXPECT_FALSE(clock.WaitFor(1min));
    EXPECT_TRUE(clock.IsInterrupted());

    clock.Reset();

    EXPECT_FALSE(clock.IsInterrupted());
    EXPECT_TRUE(clock.WaitFor(1ms));
}

} // namespace healer::common::utils
