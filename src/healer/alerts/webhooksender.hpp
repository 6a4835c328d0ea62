/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_WEBHOOKSENDER_HPP_
#define HEALER_ALERTS_WEBHOOKSENDER_HPP_

#include <memory>

#include <Poco/Net/HTTPClientSession.h>
#include <Poco/URI.h>

#include <common/utils/time.hpp>

#include "itf/webhooksender.hpp"

namespace healer::alerts {

/**
 * HTTP(S) webhook sender.
 */
class HTTPWebhookSender : public WebhookSenderItf {
public:
    /**
     * Constructor.
     *
     * @param timeout request timeout.
     */
    explicit HTTPWebhookSender(Duration timeout = std::chrono::seconds(10));

    /**
     * Posts JSON body to webhook URL. Any 2xx status is success.
     *
     * @param url webhook URL.
     * @param body JSON body.
     * @return aos::Error.
     */
    aos::Error Send(const std::string& url, const std::string& body) override;

private:
    static std::unique_ptr<Poco::Net::HTTPClientSession> CreateSession(const Poco::URI& uri);

    Duration mTimeout;
};

} // namespace healer::alerts

#endif
