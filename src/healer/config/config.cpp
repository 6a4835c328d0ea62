/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <Poco/Environment.h>
#include <Poco/JSON/Parser.h>
#include <Poco/NumberParser.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <healer/logger/logmodule.hpp>

#include "config.hpp"

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cEnvProcessName        = "HEALER_PROCESS_NAME";
constexpr auto cEnvAppPort            = "HEALER_APP_PORT";
constexpr auto cEnvHealthPath         = "HEALER_HEALTH_PATH";
constexpr auto cEnvPollInterval       = "HEALER_POLL_INTERVAL";
constexpr auto cEnvMaxMemoryMB        = "HEALER_MAX_MEMORY_MB";
constexpr auto cEnvMaxRestartAttempts = "HEALER_MAX_RESTART_ATTEMPTS";
constexpr auto cEnvWebhookURL         = "HEALER_WEBHOOK_URL";
constexpr auto cEnvLogFile            = "HEALER_LOG_FILE";
constexpr auto cEnvWorkingDir         = "HEALER_WORKING_DIR";
constexpr auto cEnvProjectDir         = "HEALER_PROJECT_DIR";

namespace healer::config {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

using common::utils::CaseInsensitiveObjectWrapper;

Duration GetDuration(const CaseInsensitiveObjectWrapper& object, const std::string& key, Duration defaultValue)
{
    auto value = object.GetOptionalValue<std::string>(key);
    if (!value.has_value()) {
        return defaultValue;
    }

    auto [duration, err] = common::utils::ParseDuration(*value);
    HEALER_ERROR_CHECK_AND_THROW(err, ("error parsing " + key + " tag").c_str());

    return duration;
}

std::vector<std::string> GetCommand(
    const CaseInsensitiveObjectWrapper& object, const std::string& key, const std::vector<std::string>& defaultValue)
{
    if (!object.Has(key)) {
        return defaultValue;
    }

    auto command = common::utils::GetArrayValue<std::string>(object, key);
    if (command.empty()) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, ("empty command in " + key + " tag").c_str());
    }

    return command;
}

void ParseProcessConfig(const CaseInsensitiveObjectWrapper& object, Process& config)
{
    config.mName           = object.GetValue<std::string>("name", config.mName);
    config.mProjectDir     = object.GetValue<std::string>("projectDir", config.mProjectDir);
    config.mManagerCommand = GetCommand(object, "managerCommand", config.mManagerCommand);
    config.mErrorLogLines  = object.GetValue<uint32_t>("errorLogLines", config.mErrorLogLines);
    config.mCommandTimeout = GetDuration(object, "commandTimeout", config.mCommandTimeout);
    config.mMaxMemoryMB    = object.GetValue<uint64_t>("maxMemoryMB", config.mMaxMemoryMB);

    if (config.mName.empty()) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, "process name is empty");
    }
}

void ParseHealthCheckConfig(const CaseInsensitiveObjectWrapper& object, HealthCheck& config)
{
    config.mHost    = object.GetValue<std::string>("host", config.mHost);
    config.mPort    = object.GetValue<uint16_t>("port", config.mPort);
    config.mPath    = object.GetValue<std::string>("path", config.mPath);
    config.mTimeout = GetDuration(object, "timeout", config.mTimeout);

    if (config.mPath.empty() || config.mPath.front() != '/') {
        config.mPath = "/" + config.mPath;
    }
}

void ParseBackoffConfig(const CaseInsensitiveObjectWrapper& object, Backoff& config)
{
    config.mInitial    = GetDuration(object, "initial", config.mInitial);
    config.mMultiplier = object.GetValue<double>("multiplier", config.mMultiplier);
    config.mMax        = GetDuration(object, "max", config.mMax);

    if (config.mMultiplier < 1.0) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, "backoff multiplier should be >= 1");
    }

    if (config.mMax < config.mInitial) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, "max backoff is less than initial backoff");
    }
}

void ParseRecoveryConfig(const CaseInsensitiveObjectWrapper& object, Recovery& config)
{
    config.mMaxRestartAttempts  = object.GetValue<uint32_t>("maxRestartAttempts", config.mMaxRestartAttempts);
    config.mSettleDelay         = GetDuration(object, "settleDelay", config.mSettleDelay);
    config.mActionTimeout       = GetDuration(object, "actionTimeout", config.mActionTimeout);
    config.mRebuildOnEscalation = object.GetValue<bool>("rebuildOnEscalation", config.mRebuildOnEscalation);
    config.mDependencyCacheDir  = object.GetValue<std::string>("dependencyCacheDir", config.mDependencyCacheDir);
    config.mRegenerateCommand   = GetCommand(object, "regenerateCommand", config.mRegenerateCommand);
    config.mInstallCommand      = GetCommand(object, "installCommand", config.mInstallCommand);
    config.mBuildCommand        = GetCommand(object, "buildCommand", config.mBuildCommand);
}

void ParseAlertsConfig(const CaseInsensitiveObjectWrapper& object, Alerts& config)
{
    config.mWebhookURL       = object.GetValue<std::string>("webhookURL", config.mWebhookURL);
    config.mWebhookTimeout   = GetDuration(object, "webhookTimeout", config.mWebhookTimeout);
    config.mSource           = object.GetValue<std::string>("source", config.mSource);
    config.mSeedDefaultRules = object.GetValue<bool>("seedDefaultRules", config.mSeedDefaultRules);
}

template <typename T>
T ParseUnsignedEnv(const std::string& name, const std::string& value)
{
    unsigned long long result = 0;

    if (!Poco::NumberParser::tryParseUnsigned64(value, result)) {
        HEALER_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, ("invalid " + name + " value").c_str());
    }

    return static_cast<T>(result);
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

aos::Error ParseConfig(const std::string& filename, Config& config)
{
    std::ifstream file(filename);

    if (!file.is_open()) {
        return aos::ErrorEnum::eNotFound;
    }

    try {
        Poco::JSON::Parser           parser;
        auto                         result = parser.parse(file);
        CaseInsensitiveObjectWrapper object(result);

        config.mWorkingDir   = object.GetValue<std::string>("workingDir", config.mWorkingDir);
        config.mLogFile      = object.GetValue<std::string>("logFile", config.mLogFile);
        config.mLogLevel     = object.GetValue<std::string>("logLevel", config.mLogLevel);
        config.mPollInterval = GetDuration(object, "pollInterval", config.mPollInterval);

        auto empty = CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

        ParseProcessConfig(object.Has("process") ? object.GetObject("process") : empty, config.mProcess);
        ParseHealthCheckConfig(
            object.Has("healthCheck") ? object.GetObject("healthCheck") : empty, config.mHealthCheck);
        ParseBackoffConfig(object.Has("backoff") ? object.GetObject("backoff") : empty, config.mBackoff);
        ParseRecoveryConfig(object.Has("recovery") ? object.GetObject("recovery") : empty, config.mRecovery);
        ParseAlertsConfig(object.Has("alerts") ? object.GetObject("alerts") : empty, config.mAlerts);

        if (config.mPollInterval <= Duration::zero()) {
            return AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "poll interval should be positive"));
        }
    } catch (const std::exception& e) {
        return common::utils::ToAosError(e);
    }

    return aos::ErrorEnum::eNone;
}

aos::Error ApplyEnvOverrides(Config& config)
{
    try {
        if (Poco::Environment::has(cEnvProcessName)) {
            config.mProcess.mName = Poco::Environment::get(cEnvProcessName);
        }

        if (Poco::Environment::has(cEnvAppPort)) {
            config.mHealthCheck.mPort = ParseUnsignedEnv<uint16_t>(cEnvAppPort, Poco::Environment::get(cEnvAppPort));
        }

        if (Poco::Environment::has(cEnvHealthPath)) {
            config.mHealthCheck.mPath = Poco::Environment::get(cEnvHealthPath);
        }

        if (Poco::Environment::has(cEnvPollInterval)) {
            auto [interval, err] = common::utils::ParseDuration(Poco::Environment::get(cEnvPollInterval));
            if (!err.IsNone()) {
                return AOS_ERROR_WRAP(err);
            }

            config.mPollInterval = interval;
        }

        if (Poco::Environment::has(cEnvMaxMemoryMB)) {
            config.mProcess.mMaxMemoryMB
                = ParseUnsignedEnv<uint64_t>(cEnvMaxMemoryMB, Poco::Environment::get(cEnvMaxMemoryMB));
        }

        if (Poco::Environment::has(cEnvMaxRestartAttempts)) {
            config.mRecovery.mMaxRestartAttempts
                = ParseUnsignedEnv<uint32_t>(cEnvMaxRestartAttempts, Poco::Environment::get(cEnvMaxRestartAttempts));
        }

        if (Poco::Environment::has(cEnvWebhookURL)) {
            config.mAlerts.mWebhookURL = Poco::Environment::get(cEnvWebhookURL);
        }

        if (Poco::Environment::has(cEnvLogFile)) {
            config.mLogFile = Poco::Environment::get(cEnvLogFile);
        }

        if (Poco::Environment::has(cEnvWorkingDir)) {
            config.mWorkingDir = Poco::Environment::get(cEnvWorkingDir);
        }

        if (Poco::Environment::has(cEnvProjectDir)) {
            config.mProcess.mProjectDir = Poco::Environment::get(cEnvProjectDir);
        }
    } catch (const std::exception& e) {
        return common::utils::ToAosError(e, aos::ErrorEnum::eInvalidArgument);
    }

    if (config.mPollInterval <= Duration::zero()) {
        return AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "poll interval should be positive"));
    }

    return aos::ErrorEnum::eNone;
}

} // namespace healer::config
