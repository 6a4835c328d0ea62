/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_CONFIG_CONFIG_HPP_
#define HEALER_CONFIG_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <core/common/tools/error.hpp>

#include <common/utils/time.hpp>

namespace healer::config {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * Monitored process configuration.
 */
struct Process {
    std::string              mName           = "console-web";
    std::string              mProjectDir     = ".";
    std::vector<std::string> mManagerCommand = {"pm2"};
    uint32_t                 mErrorLogLines  = 20;
    Duration                 mCommandTimeout = std::chrono::seconds(30);
    uint64_t                 mMaxMemoryMB    = 512;
};

/*
 * Health check configuration.
 */
struct HealthCheck {
    std::string mHost    = "localhost";
    uint16_t    mPort    = 5275;
    std::string mPath    = "/api/watcher/health";
    Duration    mTimeout = std::chrono::seconds(10);

    /**
     * Returns health endpoint base URL.
     *
     * @return std::string.
     */
    std::string BaseURL() const { return "http://" + mHost + ":" + std::to_string(mPort); }
};

/*
 * Backoff configuration.
 */
struct Backoff {
    Duration mInitial    = std::chrono::seconds(5);
    double   mMultiplier = 2.0;
    Duration mMax        = std::chrono::seconds(300);
};

/*
 * Recovery configuration.
 */
struct Recovery {
    uint32_t                 mMaxRestartAttempts  = 5;
    Duration                 mSettleDelay         = std::chrono::seconds(5);
    Duration                 mActionTimeout       = std::chrono::minutes(5);
    bool                     mRebuildOnEscalation = false;
    std::string              mDependencyCacheDir  = "node_modules/.cache";
    std::vector<std::string> mRegenerateCommand   = {"npx", "prisma", "generate"};
    std::vector<std::string> mInstallCommand      = {"npm", "install", "--include=dev"};
    std::vector<std::string> mBuildCommand        = {"npm", "run", "build"};
};

/*
 * Alerts configuration.
 */
struct Alerts {
    std::string mWebhookURL;
    Duration    mWebhookTimeout   = std::chrono::seconds(10);
    std::string mSource           = "healer";
    bool        mSeedDefaultRules = true;
};

/*
 * Config instance.
 */
struct Config {
    std::string mWorkingDir = "/var/healer";
    std::string mLogFile;
    std::string mLogLevel     = "info";
    Duration    mPollInterval = std::chrono::seconds(30);
    Process     mProcess;
    HealthCheck mHealthCheck;
    Backoff     mBackoff;
    Recovery    mRecovery;
    Alerts      mAlerts;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/*
 * Parses config from file.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return aos::Error.
 */
aos::Error ParseConfig(const std::string& filename, Config& config);

/*
 * Applies HEALER_* environment variables on top of config.
 *
 * @param[out] config config instance.
 * @return aos::Error.
 */
aos::Error ApplyEnvOverrides(Config& config);

} // namespace healer::config

#endif
