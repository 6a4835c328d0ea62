/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <healer/alerts/webhooksender.hpp>
#include <healer/tests/stubs/httpserverstub.hpp>

using namespace testing;
using namespace std::chrono_literals;

namespace healer::alerts {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class WebhookSenderTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        mServer.Start();
    }

    void TearDown() override { mServer.Stop(); }

    tests::HTTPServerStub mServer;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(WebhookSenderTest, PostsJSONBody)
{
    HTTPWebhookSender sender(2s);

    mServer.State().SetResponse(204, "");

    auto err = sender.Send(mServer.BaseURL() + "/hooks/alert", R"({"type":"alert"})");

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto requests = mServer.State().GetRequests();

    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].mMethod, "POST");
    EXPECT_EQ(requests[0].mURI, "/hooks/alert");
    EXPECT_EQ(requests[0].mContentType, "application/json");
    EXPECT_EQ(requests[0].mBody, R"({"type":"alert"})");
}

TEST_F(WebhookSenderTest, ErrorStatus)
{
    HTTPWebhookSender sender(2s);

    mServer.State().SetResponse(500, R"({"error":"boom"})");

    EXPECT_TRUE(sender.Send(mServer.BaseURL(), "{}").Is(aos::ErrorEnum::eRuntime));
}

TEST_F(WebhookSenderTest, Timeout)
{
    HTTPWebhookSender sender(200ms);

    mServer.State().SetResponse(200, "{}", 1500ms);

    EXPECT_TRUE(sender.Send(mServer.BaseURL(), "{}").Is(aos::ErrorEnum::eTimeout));
}

TEST_F(WebhookSenderTest, UnsupportedScheme)
{
    HTTPWebhookSender sender;

    EXPECT_TRUE(sender.Send("ftp://hooks.local/alert", "{}").Is(aos::ErrorEnum::eInvalidArgument));
}

} // namespace healer::alerts
