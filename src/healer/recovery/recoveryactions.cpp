/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <common/utils/utils.hpp>
#include <healer/logger/logmodule.hpp>

#include "recoveryactions.hpp"

namespace healer::recovery {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error CommandRecoveryActions::Init(const config::Process& processConfig, const config::Recovery& recoveryConfig,
    processmanager::ProcessManagerItf& processManager, const common::utils::ClockItf& clock)
{
    LOG_DBG() << "Init recovery actions" << aos::Log::Field("projectDir", processConfig.mProjectDir.c_str());

    mProcessConfig  = processConfig;
    mRecoveryConfig = recoveryConfig;
    mProcessManager = &processManager;
    mClock          = &clock;

    return aos::ErrorEnum::eNone;
}

aos::Error CommandRecoveryActions::Restart()
{
    return mProcessManager->Restart(mProcessConfig.mName);
}

aos::Error CommandRecoveryActions::RegenerateClient()
{
    LOG_INF() << "Regenerate client";

    return RunInProject(mRecoveryConfig.mRegenerateCommand);
}

aos::Error CommandRecoveryActions::ReinstallDependencies()
{
    LOG_INF() << "Reinstall dependencies";

    if (!mRecoveryConfig.mDependencyCacheDir.empty()) {
        auto cacheDir = std::filesystem::path(mProcessConfig.mProjectDir) / mRecoveryConfig.mDependencyCacheDir;

        std::error_code ec;

        std::filesystem::remove_all(cacheDir, ec);

        if (ec) {
            LOG_WRN() << "Can't clear dependency cache" << aos::Log::Field("path", cacheDir.c_str())
                      << aos::Log::Field("error", ec.message().c_str());
        }
    }

    return RunInProject(mRecoveryConfig.mInstallCommand);
}

aos::Error CommandRecoveryActions::Rebuild()
{
    LOG_INF() << "Rebuild application";

    return RunInProject(mRecoveryConfig.mBuildCommand);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

aos::Error CommandRecoveryActions::RunInProject(const std::vector<std::string>& command)
{
    auto [output, err] = common::utils::ExecCommand(command,
        {mProcessConfig.mProjectDir, mRecoveryConfig.mActionTimeout, [this]() { return mClock->IsInterrupted(); }});
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    LOG_DBG() << "Command succeeded" << aos::Log::Field("output", output.c_str());

    return aos::ErrorEnum::eNone;
}

} // namespace healer::recovery
