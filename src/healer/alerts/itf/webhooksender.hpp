/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_ALERTS_ITF_WEBHOOKSENDER_HPP_
#define HEALER_ALERTS_ITF_WEBHOOKSENDER_HPP_

#include <string>

#include <core/common/tools/error.hpp>

namespace healer::alerts {

/**
 * Webhook sender interface.
 */
class WebhookSenderItf {
public:
    /**
     * Posts JSON body to webhook URL.
     *
     * @param url webhook URL.
     * @param body JSON body.
     * @return aos::Error.
     */
    virtual aos::Error Send(const std::string& url, const std::string& body) = 0;

    /**
     * Destructor.
     */
    virtual ~WebhookSenderItf() = default;
};

} // namespace healer::alerts

#endif
