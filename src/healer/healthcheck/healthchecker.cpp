/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Exception.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/URI.h>

#include <common/utils/json.hpp>
#include <healer/logger/logmodule.hpp>

#include "healthchecker.hpp"

namespace healer::healthcheck {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

namespace {

constexpr auto cTimeoutReason = "timeout";
constexpr auto cReadChunkSize = 1024;

// Socket timeouts apply per operation, so each operation gets what is left of the whole check timeout.
Poco::Timespan Remaining(std::chrono::steady_clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - std::chrono::steady_clock::now());

    if (left.count() <= 0) {
        throw Poco::TimeoutException("health check deadline exceeded");
    }

    return Poco::Timespan(left.count());
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

HealthResult HTTPHealthChecker::Check(const std::string& baseURL, const std::string& path, Duration timeout)
{
    HealthResult result;
    const auto   deadline = std::chrono::steady_clock::now() + timeout;

    try {
        Poco::URI uri(baseURL);

        uri.setPath(path);

        LOG_DBG() << "Check health" << aos::Log::Field("url", uri.toString().c_str());

        Poco::Net::HTTPClientSession session(uri.getHost(), uri.getPort());

        session.setTimeout(Remaining(deadline));

        Poco::Net::HTTPRequest httpRequest(
            Poco::Net::HTTPRequest::HTTP_GET, uri.getPathAndQuery(), Poco::Net::HTTPMessage::HTTP_1_1);

        httpRequest.setKeepAlive(false);
        httpRequest.set("Accept", "application/json");

        session.sendRequest(httpRequest);

        Poco::Net::HTTPResponse httpResponse;

        session.socket().setReceiveTimeout(Remaining(deadline));

        auto& istr = session.receiveResponse(httpResponse);
        char  buffer[cReadChunkSize];

        while (true) {
            session.socket().setReceiveTimeout(Remaining(deadline));

            istr.read(buffer, sizeof(buffer));
            result.mPayload.append(buffer, static_cast<size_t>(istr.gcount()));

            if (!istr) {
                break;
            }
        }

        if (istr.bad()) {
            if (const auto* networkError = session.networkException(); networkError != nullptr) {
                networkError->rethrow();
            }

            throw Poco::IOException("can't read health response");
        }

        result.mStatus = static_cast<int>(httpResponse.getStatus());

        if (result.mStatus < 200 || result.mStatus >= 300) {
            result.mReason = "HTTP " + std::to_string(result.mStatus);

            return result;
        }

        if (auto err = common::utils::ParseJson(result.mPayload).mError; !err.IsNone()) {
            result.mReason = "invalid JSON response";

            return result;
        }

        result.mHealthy = true;
    } catch (const Poco::TimeoutException&) {
        result.mReason = cTimeoutReason;
    } catch (const Poco::Exception& e) {
        result.mReason = e.displayText();
    } catch (const std::exception& e) {
        result.mReason = e.what();
    }

    return result;
}

} // namespace healer::healthcheck
