/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_HEALTHCHECK_ITF_HEALTHCHECKER_HPP_
#define HEALER_HEALTHCHECK_ITF_HEALTHCHECKER_HPP_

#include <string>

#include <common/utils/time.hpp>

namespace healer::healthcheck {

/**
 * Health check result.
 */
struct HealthResult {
    bool        mHealthy {};
    int         mStatus {};
    std::string mPayload;
    std::string mReason;
};

/**
 * Health checker interface.
 */
class HealthCheckerItf {
public:
    /**
     * Checks application health endpoint. Never throws.
     *
     * @param baseURL base URL.
     * @param path health endpoint path.
     * @param timeout request timeout.
     * @return HealthResult.
     */
    virtual HealthResult Check(const std::string& baseURL, const std::string& path, Duration timeout) = 0;

    /**
     * Destructor.
     */
    virtual ~HealthCheckerItf() = default;
};

} // namespace healer::healthcheck

#endif
