/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <healer/probe/processprobe.hpp>
#include <healer/tests/mocks/processmanagermock.hpp>
#include <healer/tests/stubs/clockstub.hpp>

using namespace testing;

namespace healer::probe {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

namespace {

constexpr auto cProcessList = R"([
    {
        "name": "worker",
        "pid": 100,
        "monit": {"memory": 1048576, "cpu": 1},
        "pm2_env": {"status": "online", "restart_time": 0, "pm_uptime": 0}
    },
    {
        "name": "console-web",
        "pid": 4242,
        "monit": {"memory": 314572800, "cpu": 12.5},
        "pm2_env": {"status": "online", "restart_time": 3, "pm_uptime": %PM_UPTIME%}
    }
])";

constexpr auto cStoppedProcessList = R"([
    {
        "name": "console-web",
        "pid": 0,
        "monit": {"memory": 0, "cpu": 0},
        "pm2_env": {"status": "errored", "restart_time": 15, "pm_uptime": 0}
    }
])";

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ProcessProbeTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        ASSERT_TRUE(mProbe.Init("console-web", mProcessManager, mClock).IsNone());
    }

    std::string ProcessList(Time startedAt)
    {
        std::string list = cProcessList;

        list.replace(list.find("%PM_UPTIME%"), 11, std::to_string(common::utils::ToUnixMilli(startedAt)));

        return list;
    }

    common::utils::ManualClock                     mClock;
    StrictMock<processmanager::ProcessManagerMock> mProcessManager;
    ProcessProbe                                   mProbe;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ProcessProbeTest, RunningProcess)
{
    auto startedAt = mClock.Now() - std::chrono::minutes(10);

    EXPECT_CALL(mProcessManager, ListProcesses())
        .WillOnce(Return(
            aos::RetWithError<std::string>("[PM2] warning\n" + ProcessList(startedAt), aos::ErrorEnum::eNone)));

    auto [snapshot, err] = mProbe.Probe();

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_TRUE(snapshot.mRunning);
    EXPECT_EQ(snapshot.mStatus, "online");
    EXPECT_EQ(snapshot.mPID, 4242);
    EXPECT_EQ(snapshot.mMemoryMB, 300);
    EXPECT_DOUBLE_EQ(snapshot.mCPU, 12.5);
    EXPECT_EQ(snapshot.mRestarts, 3);
    EXPECT_EQ(snapshot.mUptime, std::chrono::minutes(10));
}

TEST_F(ProcessProbeTest, StoppedProcess)
{
    EXPECT_CALL(mProcessManager, ListProcesses())
        .WillOnce(Return(aos::RetWithError<std::string>(cStoppedProcessList, aos::ErrorEnum::eNone)));

    auto [snapshot, err] = mProbe.Probe();

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_FALSE(snapshot.mRunning);
    EXPECT_EQ(snapshot.mStatus, "errored");
    EXPECT_EQ(snapshot.mRestarts, 15);
    EXPECT_EQ(snapshot.mUptime, Duration::zero());
    EXPECT_FALSE(snapshot.mReason.empty());
}

TEST_F(ProcessProbeTest, MissingProcess)
{
    EXPECT_CALL(mProcessManager, ListProcesses())
        .WillOnce(Return(aos::RetWithError<std::string>("[]", aos::ErrorEnum::eNone)));

    auto [snapshot, err] = mProbe.Probe();

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_FALSE(snapshot.mRunning);
    EXPECT_EQ(snapshot.mReason, "Process not found");
}

TEST_F(ProcessProbeTest, ProcessManagerFailure)
{
    EXPECT_CALL(mProcessManager, ListProcesses())
        .WillOnce(Return(aos::RetWithError<std::string>("", aos::Error(aos::ErrorEnum::eRuntime, "pm2 not found"))));

    auto [snapshot, err] = mProbe.Probe();

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eRuntime));
    EXPECT_FALSE(snapshot.mRunning);
}

TEST_F(ProcessProbeTest, MalformedOutput)
{
    EXPECT_CALL(mProcessManager, ListProcesses())
        .WillOnce(
            Return(aos::RetWithError<std::string>(R"([{"name": "console-web",)", aos::ErrorEnum::eNone)));

    auto [snapshot, err] = mProbe.Probe();

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eInvalidArgument));
    EXPECT_FALSE(snapshot.mRunning);
}

} // namespace healer::probe
