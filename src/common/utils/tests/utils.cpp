/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <atomic>
#include <filesystem>
#include <thread>

#include <gtest/gtest.h>

#include <core/common/tests/utils/utils.hpp>

#include <common/utils/utils.hpp>

using namespace testing;

namespace healer::common::utils {

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(ExecCommandTest, CollectsOutput)
{
    auto [output, err] = ExecCommand({"/bin/sh", "-c", "echo stdout; echo stderr >&2"});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_NE(output.find("stdout"), std::string::npos);
    EXPECT_NE(output.find("stderr"), std::string::npos);
}

TEST(ExecCommandTest, RunsInWorkingDir)
{
    auto dir = std::filesystem::temp_directory_path();

    auto [output, err] = ExecCommand({"/bin/pwd"}, {dir.string(), std::chrono::seconds(10)});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(std::filesystem::canonical(output.substr(0, output.find('\n'))), std::filesystem::canonical(dir));
}

TEST(ExecCommandTest, NonZeroExitCode)
{
    auto [output, err] = ExecCommand({"/bin/sh", "-c", "echo broken; exit 3"});

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eRuntime));
    EXPECT_NE(std::string(err.Message()).find("exit=3"), std::string::npos);
    EXPECT_EQ(output, "broken\n");
}

TEST(ExecCommandTest, Timeout)
{
    auto start = std::chrono::steady_clock::now();

    auto [output, err] = ExecCommand({"/bin/sleep", "10"}, {"", std::chrono::milliseconds(200)});

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eTimeout));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ExecCommandTest, TimeoutKillsSpawnedChildren)
{
    auto start = std::chrono::steady_clock::now();

    auto [output, err] = ExecCommand({"/bin/sh", "-c", "sleep 10; echo late"}, {"", std::chrono::milliseconds(200)});

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eTimeout)) << aos::tests::utils::ErrorToStr(err);
    EXPECT_EQ(output.find("late"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ExecCommandTest, BackgroundChildHoldingOutput)
{
    auto start = std::chrono::steady_clock::now();

    auto [output, err]
        = ExecCommand({"/bin/sh", "-c", "sleep 10 & echo started"}, {"", std::chrono::milliseconds(500)});

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eTimeout)) << aos::tests::utils::ErrorToStr(err);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ExecCommandTest, StopRequested)
{
    std::atomic_bool stop {false};

    std::thread stopper([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        stop = true;
    });

    auto start = std::chrono::steady_clock::now();

    auto [output, err] = ExecCommand(
        {"/bin/sh", "-c", "sleep 10"}, {"", std::chrono::seconds(30), [&stop]() { return stop.load(); }});

    stopper.join();

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eFailed)) << aos::tests::utils::ErrorToStr(err);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ExecCommandTest, InvalidCommand)
{
    EXPECT_TRUE(ExecCommand({}).mError.Is(aos::ErrorEnum::eInvalidArgument));
    EXPECT_FALSE(ExecCommand({"/nonexistent/pm2", "jlist"}).mError.IsNone());
}

} // namespace healer::common::utils
