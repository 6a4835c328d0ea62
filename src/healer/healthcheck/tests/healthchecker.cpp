/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>

#include <healer/healthcheck/healthchecker.hpp>
#include <healer/tests/stubs/httpserverstub.hpp>

using namespace testing;
using namespace std::chrono_literals;

namespace healer::healthcheck {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

static constexpr auto cHealthPath = "/api/watcher/health";

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class HealthCheckerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        mServer.Start();
    }

    void TearDown() override { mServer.Stop(); }

    tests::HTTPServerStub mServer;
    HTTPHealthChecker     mHealthChecker;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(HealthCheckerTest, Healthy)
{
    mServer.State().SetResponse(200, R"({"status":"ok","uptime":42})");

    auto result = mHealthChecker.Check(mServer.BaseURL(), cHealthPath, 2s);

    EXPECT_TRUE(result.mHealthy) << result.mReason;
    EXPECT_EQ(result.mStatus, 200);
    EXPECT_EQ(result.mPayload, R"({"status":"ok","uptime":42})");

    auto requests = mServer.State().GetRequests();

    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].mMethod, "GET");
    EXPECT_EQ(requests[0].mURI, cHealthPath);
}

TEST_F(HealthCheckerTest, NonSuccessStatus)
{
    mServer.State().SetResponse(503, R"({"status":"degraded"})");

    auto result = mHealthChecker.Check(mServer.BaseURL(), cHealthPath, 2s);

    EXPECT_FALSE(result.mHealthy);
    EXPECT_EQ(result.mReason, "HTTP 503");
}

TEST_F(HealthCheckerTest, NonJSONBody)
{
    mServer.State().SetResponse(200, "<html>ok</html>");

    auto result = mHealthChecker.Check(mServer.BaseURL(), cHealthPath, 2s);

    EXPECT_FALSE(result.mHealthy);
    EXPECT_FALSE(result.mReason.empty());
}

TEST_F(HealthCheckerTest, Timeout)
{
    mServer.State().SetResponse(200, "{}", 1500ms);

    auto result = mHealthChecker.Check(mServer.BaseURL(), cHealthPath, 200ms);

    EXPECT_FALSE(result.mHealthy);
    EXPECT_EQ(result.mReason, "timeout");
}

TEST_F(HealthCheckerTest, SlowBodyHitsOverallTimeout)
{
    mServer.State().SetResponse(200, R"({"status":"ok","uptime":42,"pad":"xxxx"})");
    mServer.State().SetBodyByteDelay(100ms);

    auto start  = std::chrono::steady_clock::now();
    auto result = mHealthChecker.Check(mServer.BaseURL(), cHealthPath, 500ms);

    EXPECT_FALSE(result.mHealthy);
    EXPECT_EQ(result.mReason, "timeout");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(HealthCheckerTest, ConnectionRefused)
{
    auto baseURL = mServer.BaseURL();

    mServer.Stop();

    auto result = mHealthChecker.Check(baseURL, cHealthPath, 1s);

    EXPECT_FALSE(result.mHealthy);
    EXPECT_FALSE(result.mReason.empty());
}

} // namespace healer::healthcheck
