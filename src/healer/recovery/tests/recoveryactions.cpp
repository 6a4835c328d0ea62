/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>

#include <healer/recovery/recoveryactions.hpp>
#include <healer/tests/mocks/processmanagermock.hpp>
#include <healer/tests/stubs/clockstub.hpp>

using namespace testing;

namespace healer::recovery {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

static constexpr auto cProjectDir = "recovery_project";

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class RecoveryActionsTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        std::filesystem::remove_all(cProjectDir);
        std::filesystem::create_directories(mCacheDir);

        if (std::ofstream file(mCacheDir / "stale"); file.good()) {
            file << "stale";
        }

        mProcessConfig.mName       = "console-web";
        mProcessConfig.mProjectDir = std::filesystem::absolute(cProjectDir).string();

        mRecoveryConfig.mRegenerateCommand = {"/bin/sh", "-c", "touch generated"};
        mRecoveryConfig.mInstallCommand    = {"/bin/sh", "-c", "touch installed"};
        mRecoveryConfig.mBuildCommand      = {"/bin/sh", "-c", "echo build failed >&2; exit 2"};
        mRecoveryConfig.mActionTimeout     = std::chrono::seconds(10);

        ASSERT_TRUE(mActions.Init(mProcessConfig, mRecoveryConfig, mProcessManager, mClock).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cProjectDir); }

    std::filesystem::path mCacheDir = std::filesystem::path(cProjectDir) / "node_modules" / ".cache";
    config::Process                                mProcessConfig;
    config::Recovery                               mRecoveryConfig;
    StrictMock<processmanager::ProcessManagerMock> mProcessManager;
    common::utils::ManualClock                     mClock;
    CommandRecoveryActions                         mActions;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(RecoveryActionsTest, RestartUsesProcessManager)
{
    EXPECT_CALL(mProcessManager, Restart("console-web"))
        .WillOnce(Return(aos::ErrorEnum::eNone))
        .WillOnce(Return(aos::Error(aos::ErrorEnum::eRuntime, "pm2 failed")));

    EXPECT_TRUE(mActions.Restart().IsNone());
    EXPECT_TRUE(mActions.Restart().Is(aos::ErrorEnum::eRuntime));
}

TEST_F(RecoveryActionsTest, RegenerateClientRunsInProjectDir)
{
    ASSERT_TRUE(mActions.RegenerateClient().IsNone());

    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cProjectDir) / "generated"));
}

TEST_F(RecoveryActionsTest, ReinstallDependenciesClearsCache)
{
    ASSERT_TRUE(mActions.ReinstallDependencies().IsNone());

    EXPECT_FALSE(std::filesystem::exists(mCacheDir));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cProjectDir) / "node_modules"));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cProjectDir) / "installed"));
}

TEST_F(RecoveryActionsTest, FailedCommandReturnsError)
{
    auto err = mActions.Rebuild();

    EXPECT_FALSE(err.IsNone());
}

TEST_F(RecoveryActionsTest, InterruptedClockStopsCommand)
{
    mRecoveryConfig.mInstallCommand = {"/bin/sh", "-c", "sleep 30"};
    mRecoveryConfig.mActionTimeout  = std::chrono::minutes(5);

    ASSERT_TRUE(mActions.Init(mProcessConfig, mRecoveryConfig, mProcessManager, mClock).IsNone());

    mClock.SetInterrupted(true);

    auto start = std::chrono::steady_clock::now();

    EXPECT_TRUE(mActions.ReinstallDependencies().Is(aos::ErrorEnum::eFailed));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

} // namespace healer::recovery
