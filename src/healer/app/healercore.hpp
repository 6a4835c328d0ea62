/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_APP_HEALERCORE_HPP_
#define HEALER_APP_HEALERCORE_HPP_

#include <memory>
#include <optional>
#include <string>

#include <common/logger/logger.hpp>
#include <common/utils/cleanupmanager.hpp>
#include <common/utils/clock.hpp>
#include <healer/alerts/alertengine.hpp>
#include <healer/alerts/webhooksender.hpp>
#include <healer/config/config.hpp>
#include <healer/database/database.hpp>
#include <healer/healthcheck/healthchecker.hpp>
#include <healer/probe/processprobe.hpp>
#include <healer/processmanager/pm2.hpp>
#include <healer/recovery/recoveryactions.hpp>
#include <healer/recovery/recoveryorchestrator.hpp>
#include <healer/supervisor/supervisor.hpp>

namespace healer::app {

/**
 * Healer core instance.
 */
class HealerCore {
public:
    /**
     * Initializes healer core.
     *
     * @param configFile config file path. Defaults are used if the file doesn't exist.
     */
    void Init(const std::string& configFile);

    /**
     * Starts healer core.
     */
    void Start();

    /**
     * Stops healer core.
     */
    void Stop();

    /**
     * Sets log backend.
     *
     * @param backend log backend.
     */
    void SetLogBackend(common::logger::Logger::Backend backend);

    /**
     * Sets log level. Overrides the level from config.
     *
     * @param level log level.
     */
    void SetLogLevel(aos::LogLevel level);

private:
    static constexpr auto cDefaultConfigFile = "healer.cfg";

    void InitLogger();

    config::Config mConfig;

    common::logger::Logger          mLogger;
    common::logger::Logger::Backend mLogBackend = common::logger::Logger::Backend::eStdIO;
    std::optional<aos::LogLevel>    mLogLevel;
    common::utils::CleanupManager   mCleanupManager;
    common::utils::SystemClock      mClock;

    std::unique_ptr<alerts::HTTPWebhookSender> mWebhookSender;
    alerts::AlertEngine                        mAlertEngine;
    database::Database                         mDatabase;
    healthcheck::HTTPHealthChecker             mHealthChecker;
    probe::ProcessProbe                        mProbe;
    processmanager::PM2                        mPM2;
    recovery::CommandRecoveryActions           mRecoveryActions;
    recovery::RecoveryOrchestrator             mRecovery;
    supervisor::Supervisor                     mSupervisor;
};

} // namespace healer::app

#endif
