/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_HEALTHCHECK_HEALTHCHECKER_HPP_
#define HEALER_HEALTHCHECK_HEALTHCHECKER_HPP_

#include "itf/healthchecker.hpp"

namespace healer::healthcheck {

/**
 * HTTP health checker.
 */
class HTTPHealthChecker : public HealthCheckerItf {
public:
    /**
     * Issues GET request to health endpoint.
     *
     * Any 2xx response with JSON body is healthy. Timeout, transport error, non-2xx status or non-JSON body are
     * unhealthy.
     *
     * @param baseURL base URL.
     * @param path health endpoint path.
     * @param timeout request timeout.
     * @return HealthResult.
     */
    HealthResult Check(const std::string& baseURL, const std::string& path, Duration timeout) override;
};

} // namespace healer::healthcheck

#endif
