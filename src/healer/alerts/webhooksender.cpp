/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/StreamCopier.h>

#include <common/utils/exception.hpp>
#include <healer/logger/logmodule.hpp>

#include "webhooksender.hpp"

namespace healer::alerts {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

HTTPWebhookSender::HTTPWebhookSender(Duration timeout)
    : mTimeout(timeout)
{
}

aos::Error HTTPWebhookSender::Send(const std::string& url, const std::string& body)
{
    try {
        Poco::URI uri(url);

        LOG_DBG() << "Send webhook" << aos::Log::Field("url", url.c_str());

        auto session = CreateSession(uri);

        session->setTimeout(Poco::Timespan(std::chrono::duration_cast<std::chrono::microseconds>(mTimeout).count()));

        Poco::Net::HTTPRequest httpRequest(Poco::Net::HTTPRequest::HTTP_POST,
            uri.getPathAndQuery().empty() ? "/" : uri.getPathAndQuery(), Poco::Net::HTTPMessage::HTTP_1_1);

        httpRequest.setKeepAlive(false);
        httpRequest.setContentType("application/json");
        httpRequest.setContentLength64(static_cast<Poco::Int64>(body.length()));

        session->sendRequest(httpRequest) << body;

        Poco::Net::HTTPResponse httpResponse;
        std::string             responseBody;

        Poco::StreamCopier::copyToString(session->receiveResponse(httpResponse), responseBody);

        auto status = static_cast<int>(httpResponse.getStatus());
        if (status < 200 || status >= 300) {
            return AOS_ERROR_WRAP(
                aos::Error(aos::ErrorEnum::eRuntime, ("webhook returned HTTP " + std::to_string(status)).c_str()));
        }
    } catch (const Poco::TimeoutException& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eTimeout));
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eRuntime));
    }

    return aos::ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::unique_ptr<Poco::Net::HTTPClientSession> HTTPWebhookSender::CreateSession(const Poco::URI& uri)
{
    if (uri.getScheme() == "http") {
        return std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(), uri.getPort());
    }

    if (uri.getScheme() != "https") {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, ("unsupported webhook scheme " + uri.getScheme()).c_str());
    }

    Poco::Net::Context::Ptr context = new Poco::Net::Context(
        Poco::Net::Context::TLS_CLIENT_USE, "", "", "", Poco::Net::Context::VERIFY_RELAXED, 9, true);

    return std::make_unique<Poco::Net::HTTPSClientSession>(uri.getHost(), uri.getPort(), context);
}

} // namespace healer::alerts
