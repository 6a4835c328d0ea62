/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Net/SSLManager.h>

#include <common/utils/exception.hpp>
#include <common/version/version.hpp>
#include <healer/logger/logmodule.hpp>

#include "healercore.hpp"

namespace healer::app {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void HealerCore::Init(const std::string& configFile)
{
    auto err = mLogger.Init();
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize logger");

    LOG_INF() << "Init healer" << aos::Log::Field("version", HEALER_VERSION);

    // Initialize config

    err = config::ParseConfig(configFile.empty() ? cDefaultConfigFile : configFile, mConfig);
    if (err.Is(aos::ErrorEnum::eNotFound)) {
        LOG_WRN() << "Config file not found, defaults are used" << aos::Log::Field(err);
    } else {
        HEALER_ERROR_CHECK_AND_THROW(err, "can't parse config");
    }

    err = config::ApplyEnvOverrides(mConfig);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't apply environment overrides");

    InitLogger();

    Poco::Net::initializeSSL();

    mCleanupManager.AddCleanup("ssl", []() { Poco::Net::uninitializeSSL(); });

    // Initialize database

    err = mDatabase.Init(mConfig.mWorkingDir);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize database");

    if (mConfig.mAlerts.mSeedDefaultRules) {
        err = mDatabase.SeedDefaultRules(mConfig.mProcess.mMaxMemoryMB);
        HEALER_ERROR_CHECK_AND_THROW(err, "can't seed default alert rules");
    }

    // Initialize process manager

    err = mPM2.Init(mConfig.mProcess);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize process manager");

    // Initialize process probe

    err = mProbe.Init(mConfig.mProcess.mName, mPM2, mClock);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize process probe");

    // Initialize alert engine

    mWebhookSender = std::make_unique<alerts::HTTPWebhookSender>(mConfig.mAlerts.mWebhookTimeout);

    err = mAlertEngine.Init(mConfig.mAlerts, mDatabase, *mWebhookSender, mClock);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize alert engine");

    // Initialize recovery

    err = mRecoveryActions.Init(mConfig.mProcess, mConfig.mRecovery, mPM2, mClock);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize recovery actions");

    err = mSupervisor.Init(mConfig, mProbe, mPM2, mHealthChecker, mAlertEngine, mRecovery, mClock);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize supervisor");

    err = mRecovery.Init(mConfig, mSupervisor.GetState(), mRecoveryActions, mHealthChecker, mAlertEngine, mClock);
    HEALER_ERROR_CHECK_AND_THROW(err, "can't initialize recovery orchestrator");
}

void HealerCore::Start()
{
    mClock.Reset();

    auto err = mSupervisor.Start();
    HEALER_ERROR_CHECK_AND_THROW(err, "can't start supervisor");

    mCleanupManager.AddCleanup("supervisor", [this]() {
        // Aborts a running recovery: settle wait, pending actions and running commands.
        mClock.Interrupt();

        if (auto err = mSupervisor.Stop(); !err.IsNone()) {
            LOG_ERR() << "Can't stop supervisor" << aos::Log::Field(err);
        }
    });
}

void HealerCore::Stop()
{
    LOG_INF() << "Stop healer";

    mCleanupManager.ExecuteCleanups();
}

void HealerCore::SetLogBackend(common::logger::Logger::Backend backend)
{
    mLogBackend = backend;

    mLogger.SetBackend(backend);
}

void HealerCore::SetLogLevel(aos::LogLevel level)
{
    mLogLevel = level;

    mLogger.SetLogLevel(level);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void HealerCore::InitLogger()
{
    if (!mLogLevel.has_value()) {
        aos::LogLevel level;

        auto err = level.FromString(aos::String(mConfig.mLogLevel.c_str()));
        HEALER_ERROR_CHECK_AND_THROW(err, "unsupported log level");

        mLogger.SetLogLevel(level);
    }

    if (!mConfig.mLogFile.empty() && mLogBackend != common::logger::Logger::Backend::eJournald) {
        LOG_INF() << "Log to file" << aos::Log::Field("path", mConfig.mLogFile.c_str());

        mLogger.SetLogFile(mConfig.mLogFile);
    }
}

} // namespace healer::app
