/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_TIME_HPP_
#define HEALER_COMMON_UTILS_TIME_HPP_

#include <chrono>
#include <cstdint>
#include <string>

#include <core/common/tools/error.hpp>

namespace healer {

/**
 * Wall clock time point.
 */
using Time = std::chrono::system_clock::time_point;

/**
 * Duration with millisecond resolution.
 */
using Duration = std::chrono::milliseconds;

namespace common::utils {

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses duration from string, e.g. "500ms", "30s", "1m30s", "2h", "1d".
 *
 * @param duration duration string.
 * @return parsed duration.
 */
aos::RetWithError<Duration> ParseDuration(const std::string& duration);

/**
 * Converts time into ISO 8601 UTC string with millisecond precision.
 *
 * @param time time.
 * @return std::string.
 */
std::string ToISO8601String(const Time& time);

/**
 * Converts time to milliseconds since Unix epoch.
 *
 * @param time time.
 * @return int64_t.
 */
int64_t ToUnixMilli(const Time& time);

/**
 * Creates time from milliseconds since Unix epoch.
 *
 * @param milliseconds milliseconds since Unix epoch.
 * @return Time.
 */
Time FromUnixMilli(int64_t milliseconds);

} // namespace common::utils

} // namespace healer

#endif
