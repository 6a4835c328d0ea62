/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_PROCESSMANAGER_ITF_PROCESSMANAGER_HPP_
#define HEALER_PROCESSMANAGER_ITF_PROCESSMANAGER_HPP_

#include <cstdint>
#include <string>

#include <core/common/tools/error.hpp>

namespace healer::processmanager {

/**
 * Process manager interface.
 */
class ProcessManagerItf {
public:
    /**
     * Returns raw JSON list of managed processes.
     *
     * @return aos::RetWithError<std::string>.
     */
    virtual aos::RetWithError<std::string> ListProcesses() = 0;

    /**
     * Returns tail of process error log.
     *
     * @param name process name.
     * @param lines number of lines.
     * @return aos::RetWithError<std::string>.
     */
    virtual aos::RetWithError<std::string> GetErrorLogs(const std::string& name, uint32_t lines) = 0;

    /**
     * Restarts process.
     *
     * @param name process name.
     * @return aos::Error.
     */
    virtual aos::Error Restart(const std::string& name) = 0;

    /**
     * Destructor.
     */
    virtual ~ProcessManagerItf() = default;
};

} // namespace healer::processmanager

#endif
