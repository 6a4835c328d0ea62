/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_RECOVERY_RECOVERYACTIONS_HPP_
#define HEALER_RECOVERY_RECOVERYACTIONS_HPP_

#include <common/utils/clock.hpp>
#include <healer/config/config.hpp>
#include <healer/processmanager/itf/processmanager.hpp>

#include "itf/recoveryactions.hpp"

namespace healer::recovery {

/**
 * Recovery actions backed by process manager and project shell commands.
 */
class CommandRecoveryActions : public RecoveryActionsItf {
public:
    /**
     * Initializes recovery actions.
     *
     * @param processConfig process config.
     * @param recoveryConfig recovery config.
     * @param processManager process manager.
     * @param clock clock, running commands are killed once its waits are interrupted.
     * @return aos::Error.
     */
    aos::Error Init(const config::Process& processConfig, const config::Recovery& recoveryConfig,
        processmanager::ProcessManagerItf& processManager, const common::utils::ClockItf& clock);

    aos::Error Restart() override;
    aos::Error RegenerateClient() override;
    aos::Error ReinstallDependencies() override;
    aos::Error Rebuild() override;

private:
    aos::Error RunInProject(const std::vector<std::string>& command);

    config::Process                    mProcessConfig;
    config::Recovery                   mRecoveryConfig;
    processmanager::ProcessManagerItf* mProcessManager {};
    const common::utils::ClockItf*     mClock {};
};

} // namespace healer::recovery

#endif
