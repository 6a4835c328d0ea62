/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <healer/logger/logmodule.hpp>

#include "supervisor.hpp"

namespace healer::supervisor {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

int64_t ToSeconds(Duration duration)
{
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error Supervisor::Init(const config::Config& config, probe::ProcessProbe& probe,
    processmanager::ProcessManagerItf& processManager, healthcheck::HealthCheckerItf& healthChecker,
    alerts::AlertEngine& alertEngine, recovery::RecoveryOrchestrator& recovery, common::utils::ClockItf& clock)
{
    LOG_DBG() << "Init supervisor";

    mConfig         = config;
    mBackoff        = backoff::BackoffController(config.mBackoff);
    mProbe          = &probe;
    mProcessManager = &processManager;
    mHealthChecker  = &healthChecker;
    mAlertEngine    = &alertEngine;
    mRecovery       = &recovery;
    mClock          = &clock;

    mState                 = {};
    mState.mCurrentBackoff = mBackoff.OnSuccess();
    mState.mStartedAt      = clock.Now();

    return aos::ErrorEnum::eNone;
}

aos::Error Supervisor::Start()
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Start supervisor";

    if (!mStopped) {
        return aos::Error(aos::ErrorEnum::eRuntime, "already started");
    }

    LOG_INF() << "Supervisor started" << aos::Log::Field("process", mConfig.mProcess.mName.c_str())
              << aos::Log::Field("port", mConfig.mHealthCheck.mPort)
              << aos::Log::Field("pollIntervalSec", ToSeconds(mConfig.mPollInterval))
              << aos::Log::Field("maxMemoryMB", mConfig.mProcess.mMaxMemoryMB);

    mStopped = false;

    mThread = std::thread([this]() { Run(); });

    return aos::ErrorEnum::eNone;
}

aos::Error Supervisor::Stop()
{
    {
        std::lock_guard lock {mMutex};

        LOG_DBG() << "Stop supervisor";

        if (mStopped) {
            return aos::Error(aos::ErrorEnum::eRuntime, "already stopped");
        }

        mStopped = true;
        mCondVar.notify_all();
    }

    if (mThread.joinable()) {
        mThread.join();
    }

    return aos::ErrorEnum::eNone;
}

void Supervisor::Tick()
{
    if (mState.mIsRecovering) {
        LOG_DBG() << "Recovery in progress, tick skipped";

        return;
    }

    auto [snapshot, err] = mProbe->Probe();
    if (!err.IsNone()) {
        LOG_ERR() << "Can't probe process" << aos::Log::Field("process", mConfig.mProcess.mName.c_str())
                  << aos::Log::Field(err);

        HandleProcessDown();

        return;
    }

    if (!snapshot.mRunning) {
        LOG_WRN() << "Process is not running" << aos::Log::Field("process", mConfig.mProcess.mName.c_str())
                  << aos::Log::Field("status", snapshot.mStatus.c_str())
                  << aos::Log::Field("reason", snapshot.mReason.c_str());

        HandleProcessDown();

        return;
    }

    auto context = CreateContext(snapshot);

    mAlertEngine->Evaluate(alerts::RuleType::eMemory, static_cast<double>(snapshot.mMemoryMB), context);
    mAlertEngine->Evaluate(alerts::RuleType::eCPU, snapshot.mCPU, context);

    if (snapshot.mMemoryMB > mConfig.mProcess.mMaxMemoryMB) {
        LOG_WRN() << "Memory threshold exceeded" << aos::Log::Field("memoryMB", snapshot.mMemoryMB)
                  << aos::Log::Field("maxMemoryMB", mConfig.mProcess.mMaxMemoryMB);

        mRecovery->Recover(classifier::ErrorType::eMemory);

        return;
    }

    auto result = mHealthChecker->Check(
        mConfig.mHealthCheck.BaseURL(), mConfig.mHealthCheck.mPath, mConfig.mHealthCheck.mTimeout);
    mState.mLastHealthCheckAt = mClock->Now();

    if (!result.mHealthy) {
        HandleUnhealthy(result);

        return;
    }

    HandleHealthy(snapshot);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Supervisor::Run()
{
    LOG_DBG() << "Run supervisor";

    while (true) {
        try {
            Tick();
        } catch (const std::exception& e) {
            LOG_ERR() << "Supervision tick failed" << aos::Log::Field("error", e.what());
        }

        std::unique_lock lock {mMutex};

        mCondVar.wait_for(lock, mConfig.mPollInterval, [this]() { return mStopped; });

        if (mStopped) {
            break;
        }
    }
}

void Supervisor::HandleProcessDown()
{
    auto errorType = ClassifyErrorLogs(classifier::ErrorType::eUnknown);

    if (!IsRecoveryAllowed()) {
        return;
    }

    mRecovery->Recover(errorType);
}

void Supervisor::HandleUnhealthy(const healthcheck::HealthResult& result)
{
    LOG_WRN() << "Health check failed" << aos::Log::Field("status", result.mStatus)
              << aos::Log::Field("reason", result.mReason.c_str());

    mAlertEngine->Evaluate(alerts::RuleType::eService, 0, {{"reason", result.mReason}});

    auto errorType = ClassifyErrorLogs(classifier::ErrorType::eUnresponsive);

    if (!IsRecoveryAllowed()) {
        return;
    }

    mRecovery->Recover(errorType);
}

void Supervisor::HandleHealthy(const probe::ProcessSnapshot& snapshot)
{
    if (mState.mConsecutiveFailures > 0) {
        LOG_INF() << "Process recovered" << aos::Log::Field("failedAttempts", mState.mConsecutiveFailures);

        mState.mConsecutiveFailures = 0;
        mState.mCurrentBackoff      = mBackoff.OnSuccess();
        mState.mCriticalAlertSent   = false;
    }

    auto uptimeMin = std::chrono::duration_cast<std::chrono::minutes>(snapshot.mUptime).count();

    LOG_INF() << "Process healthy" << aos::Log::Field("memoryMB", snapshot.mMemoryMB)
              << aos::Log::Field("uptimeMin", uptimeMin) << aos::Log::Field("restarts", snapshot.mRestarts);
}

classifier::ErrorType Supervisor::ClassifyErrorLogs(classifier::ErrorType fallback)
{
    auto [logs, err] = mProcessManager->GetErrorLogs(mConfig.mProcess.mName, mConfig.mProcess.mErrorLogLines);
    if (!err.IsNone()) {
        LOG_ERR() << "Can't get error logs" << aos::Log::Field(err);

        return fallback;
    }

    auto errorType = classifier::SelectErrorType(classifier::Classify(logs), fallback);

    LOG_INF() << "Failure classified" << aos::Log::Field("errorType", classifier::ToString(errorType));

    return errorType;
}

bool Supervisor::IsRecoveryAllowed()
{
    auto now = mClock->Now();

    if (mBackoff.ShouldAttempt(mState.mLastRecoveryAttemptAt, mState.mCurrentBackoff, now)) {
        return true;
    }

    auto remaining = mBackoff.Remaining(mState.mLastRecoveryAttemptAt, mState.mCurrentBackoff, now);

    LOG_INF() << "Recovery postponed by backoff" << aos::Log::Field("remainingSec", ToSeconds(remaining));

    return false;
}

alerts::AlertContext Supervisor::CreateContext(const probe::ProcessSnapshot& snapshot) const
{
    return {{"processName", mConfig.mProcess.mName}, {"pid", std::to_string(snapshot.mPID)},
        {"status", snapshot.mStatus}};
}

} // namespace healer::supervisor
