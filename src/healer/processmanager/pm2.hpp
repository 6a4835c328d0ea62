/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_PROCESSMANAGER_PM2_HPP_
#define HEALER_PROCESSMANAGER_PM2_HPP_

#include <healer/config/config.hpp>

#include "itf/processmanager.hpp"

namespace healer::processmanager {

/**
 * PM2 process manager adapter.
 */
class PM2 : public ProcessManagerItf {
public:
    /**
     * Initializes adapter.
     *
     * @param config process config.
     * @return aos::Error.
     */
    aos::Error Init(const config::Process& config);

    /**
     * Returns output of `pm2 jlist`.
     *
     * @return aos::RetWithError<std::string>.
     */
    aos::RetWithError<std::string> ListProcesses() override;

    /**
     * Returns output of `pm2 logs <name> --err --lines <lines> --nostream`.
     *
     * @param name process name.
     * @param lines number of lines.
     * @return aos::RetWithError<std::string>.
     */
    aos::RetWithError<std::string> GetErrorLogs(const std::string& name, uint32_t lines) override;

    /**
     * Runs `pm2 restart <name>`.
     *
     * @param name process name.
     * @return aos::Error.
     */
    aos::Error Restart(const std::string& name) override;

private:
    aos::RetWithError<std::string> Run(const std::vector<std::string>& args);

    std::vector<std::string> mCommand;
    std::string              mProjectDir;
    Duration                 mTimeout {};
};

} // namespace healer::processmanager

#endif
