/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exception.hpp"

namespace healer::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

HealerException::HealerException(const aos::Error& err, const std::string& message)
    : Poco::Exception(message, err.Message(), err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
    auto errStr = ErrorToString(err);

    if (message.empty()) {
        Poco::Exception::message(errStr);

        return;
    }

    Poco::Exception::message(errStr.empty() ? message : message + ": " + errStr);
}

aos::Error ToAosError(const std::exception& e, aos::ErrorEnum err)
{
    if (const auto* healerExc = dynamic_cast<const HealerException*>(&e)) {
        return healerExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return aos::Error {err, pocoExc->displayText().c_str()};
    }

    return aos::Error {err, e.what()};
}

std::string ErrorToString(const aos::Error& err)
{
    aos::StaticString<aos::cMaxErrorStrLen> errStr;

    if (!errStr.Convert(err).IsNone()) {
        return err.Message();
    }

    return errStr.CStr();
}

} // namespace healer::common::utils
