/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <unordered_map>

#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

#include "time.hpp"

namespace healer::common::utils {

namespace {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cISO8601Format = "%Y-%m-%dT%H:%M:%S.%iZ";

const std::unordered_map<std::string, Duration> cDurationUnits = {
    {"ms", std::chrono::milliseconds(1)},
    {"s", std::chrono::seconds(1)},
    {"m", std::chrono::minutes(1)},
    {"h", std::chrono::hours(1)},
    {"d", std::chrono::hours(24)},
};

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

aos::RetWithError<Duration> ParseDuration(const std::string& duration)
{
    if (duration.empty()) {
        return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "empty duration")};
    }

    // Plain number is treated as seconds.
    if (duration.find_first_not_of("0123456789") == std::string::npos) {
        return {std::chrono::seconds(std::stoll(duration)), aos::ErrorEnum::eNone};
    }

    Duration result {};
    size_t   pos = 0;

    while (pos < duration.size()) {
        auto numEnd = pos;

        while (numEnd < duration.size() && std::isdigit(static_cast<unsigned char>(duration[numEnd]))) {
            ++numEnd;
        }

        if (numEnd == pos) {
            return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "invalid duration format")};
        }

        auto unitEnd = numEnd;

        while (unitEnd < duration.size() && std::isalpha(static_cast<unsigned char>(duration[unitEnd]))) {
            ++unitEnd;
        }

        auto unit = cDurationUnits.find(duration.substr(numEnd, unitEnd - numEnd));
        if (unit == cDurationUnits.end()) {
            return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "invalid duration unit")};
        }

        result += std::stoll(duration.substr(pos, numEnd - pos)) * unit->second;
        pos = unitEnd;
    }

    return {result, aos::ErrorEnum::eNone};
}

std::string ToISO8601String(const Time& time)
{
    const auto micros
        = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();

    return Poco::DateTimeFormatter::format(Poco::Timestamp(micros), cISO8601Format);
}

int64_t ToUnixMilli(const Time& time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Time FromUnixMilli(int64_t milliseconds)
{
    return Time(std::chrono::milliseconds(milliseconds));
}

} // namespace healer::common::utils
