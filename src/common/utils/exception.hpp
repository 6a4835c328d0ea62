/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_EXCEPTION_HPP_
#define HEALER_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <core/common/tools/error.hpp>
#include <core/common/tools/string.hpp>

/**
 * Helper macros for argument counting
 */
#define _GET_NTH_ARG(_1, _2, NAME, ...) NAME
#define GET_MACRO(NAME)                 NAME

/**
 * Error throw with and without message
 */
#define HEALER_ERROR_THROW_1(err) throw healer::common::utils::HealerException(AOS_ERROR_WRAP(err))
#define HEALER_ERROR_THROW_2(err, message)                                                                             \
    throw healer::common::utils::HealerException(AOS_ERROR_WRAP(err), message)
#define HEALER_ERROR_THROW(...)                                                                                        \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, HEALER_ERROR_THROW_2, HEALER_ERROR_THROW_1))(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define HEALER_ERROR_CHECK_AND_THROW_1(err)                                                                            \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        HEALER_ERROR_THROW_1(err);                                                                                     \
    }
#define HEALER_ERROR_CHECK_AND_THROW_2(err, message)                                                                   \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        HEALER_ERROR_THROW_2(err, message);                                                                            \
    }
#define HEALER_ERROR_CHECK_AND_THROW(...)                                                                              \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, HEALER_ERROR_CHECK_AND_THROW_2, HEALER_ERROR_CHECK_AND_THROW_1))(__VA_ARGS__)

namespace healer::common::utils {

/**
 * Healer exception.
 */
class HealerException : public Poco::Exception {
public:
    /**
     * Creates healer exception instance.
     *
     * @param err error.
     * @param message message.
     */
    explicit HealerException(const aos::Error& err, const std::string& message = "");

    /**
     * Returns error.
     *
     * @return aos::Error.
     */
    aos::Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "Healer exception"; }

private:
    aos::Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error.
 *
 * @return aos::Error.
 */
aos::Error ToAosError(const std::exception& e, aos::ErrorEnum err = aos::ErrorEnum::eFailed);

/**
 * Converts error to string.
 *
 * @param err error.
 * @return std::string.
 */
std::string ErrorToString(const aos::Error& err);

} // namespace healer::common::utils

#endif
