/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <healer/logger/logmodule.hpp>

#include "recoveryorchestrator.hpp"

namespace healer::recovery {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

class RecoveringGuard {
public:
    explicit RecoveringGuard(bool& isRecovering)
        : mIsRecovering(isRecovering)
    {
        mIsRecovering = true;
    }

    ~RecoveringGuard() { mIsRecovering = false; }

    RecoveringGuard(const RecoveringGuard&)            = delete;
    RecoveringGuard& operator=(const RecoveringGuard&) = delete;

private:
    bool& mIsRecovering;
};

int64_t ToSeconds(Duration duration)
{
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

const char* ToString(ActionType action)
{
    switch (action) {
    case ActionType::eRestart:
        return "restart";

    case ActionType::eRegenerateClient:
        return "regenerateClient";

    case ActionType::eReinstallDependencies:
        return "reinstallDependencies";

    case ActionType::eRebuild:
        return "rebuild";
    }

    return "unknown";
}

aos::Error RecoveryOrchestrator::Init(const config::Config& config, supervisor::SupervisorState& state,
    RecoveryActionsItf& actions, healthcheck::HealthCheckerItf& healthChecker,
    alerts::CriticalAlertSenderItf& criticalAlertSender, common::utils::ClockItf& clock)
{
    LOG_DBG() << "Init recovery orchestrator"
              << aos::Log::Field("maxRestartAttempts", config.mRecovery.mMaxRestartAttempts);

    mConfig              = config;
    mBackoff             = backoff::BackoffController(config.mBackoff);
    mState               = &state;
    mActions             = &actions;
    mHealthChecker       = &healthChecker;
    mCriticalAlertSender = &criticalAlertSender;
    mClock               = &clock;

    return aos::ErrorEnum::eNone;
}

RecoveryReport RecoveryOrchestrator::Recover(classifier::ErrorType errorType)
{
    RecoveryReport report;

    report.mErrorType = errorType;

    if (mState->mIsRecovering) {
        LOG_WRN() << "Recovery already in progress, request dropped"
                  << aos::Log::Field("errorType", classifier::ToString(errorType));

        report.mSkipped = true;

        return report;
    }

    RecoveringGuard guard(mState->mIsRecovering);

    try {
        RunRecovery(errorType, report);
    } catch (const std::exception& e) {
        LOG_ERR() << "Recovery failed" << aos::Log::Field("errorType", classifier::ToString(errorType))
                  << aos::Log::Field("error", e.what());
    }

    return report;
}

std::vector<ActionType> RecoveryOrchestrator::GetActionSequence(classifier::ErrorType errorType)
{
    switch (errorType) {
    case classifier::ErrorType::ePrisma:
        return {ActionType::eRegenerateClient, ActionType::eRestart};

    case classifier::ErrorType::eModule:
        return {ActionType::eReinstallDependencies, ActionType::eRegenerateClient, ActionType::eRestart};

    default:
        return {ActionType::eRestart};
    }
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void RecoveryOrchestrator::RunRecovery(classifier::ErrorType errorType, RecoveryReport& report)
{
    mState->mConsecutiveFailures++;
    mState->mLastRecoveryAttemptAt = mClock->Now();

    report.mAttempt = mState->mConsecutiveFailures;

    LOG_WRN() << "Start recovery" << aos::Log::Field("errorType", classifier::ToString(errorType))
              << aos::Log::Field("attempt", report.mAttempt)
              << aos::Log::Field("maxAttempts", mConfig.mRecovery.mMaxRestartAttempts);

    if (!RunActions(GetActionSequence(errorType), report) || !mClock->WaitFor(mConfig.mRecovery.mSettleDelay)) {
        LOG_INF() << "Recovery interrupted";

        report.mInterrupted = true;

        return;
    }

    report.mVerification = mHealthChecker->Check(
        mConfig.mHealthCheck.BaseURL(), mConfig.mHealthCheck.mPath, mConfig.mHealthCheck.mTimeout);
    mState->mLastHealthCheckAt = mClock->Now();

    if (report.mVerification->mHealthy) {
        OnRecovered(report);

        return;
    }

    OnFailed(errorType, report);
}

bool RecoveryOrchestrator::RunActions(const std::vector<ActionType>& actions, RecoveryReport& report)
{
    for (const auto& action : actions) {
        if (mClock->IsInterrupted()) {
            return false;
        }

        aos::Error err = aos::ErrorEnum::eNone;

        switch (action) {
        case ActionType::eRestart:
            err = mActions->Restart();
            break;

        case ActionType::eRegenerateClient:
            err = mActions->RegenerateClient();
            break;

        case ActionType::eReinstallDependencies:
            err = mActions->ReinstallDependencies();
            break;

        case ActionType::eRebuild:
            err = mActions->Rebuild();
            break;
        }

        if (err.IsNone()) {
            LOG_INF() << "Recovery action succeeded" << aos::Log::Field("action", ToString(action));
        } else {
            LOG_ERR() << "Recovery action failed" << aos::Log::Field("action", ToString(action))
                      << aos::Log::Field(err);
        }

        report.mActions.push_back({action, err});
    }

    return true;
}

bool RecoveryOrchestrator::Escalate(classifier::ErrorType errorType, RecoveryReport& report)
{
    auto failures = mState->mConsecutiveFailures;

    if (failures >= 2 && errorType != classifier::ErrorType::ePrisma) {
        LOG_WRN() << "Escalate recovery: regenerate client" << aos::Log::Field("attempt", failures);

        if (!RunActions({ActionType::eRegenerateClient, ActionType::eRestart}, report)) {
            return false;
        }
    }

    if (failures >= 3) {
        LOG_WRN() << "Escalate recovery: reinstall dependencies" << aos::Log::Field("attempt", failures);

        std::vector<ActionType> actions = {ActionType::eReinstallDependencies, ActionType::eRegenerateClient};

        if (mConfig.mRecovery.mRebuildOnEscalation) {
            actions.push_back(ActionType::eRebuild);
        }

        actions.push_back(ActionType::eRestart);

        return RunActions(actions, report);
    }

    return true;
}

void RecoveryOrchestrator::OnRecovered(RecoveryReport& report)
{
    LOG_INF() << "Recovery succeeded" << aos::Log::Field("attempt", report.mAttempt);

    mState->mConsecutiveFailures = 0;
    mState->mCurrentBackoff      = mBackoff.OnSuccess();
    mState->mCriticalAlertSent   = false;

    report.mRecovered = true;
    report.mBackoff   = mState->mCurrentBackoff;
}

void RecoveryOrchestrator::OnFailed(classifier::ErrorType errorType, RecoveryReport& report)
{
    LOG_ERR() << "Recovery verification failed" << aos::Log::Field("attempt", report.mAttempt)
              << aos::Log::Field("reason", report.mVerification->mReason.c_str());

    if (!Escalate(errorType, report)) {
        LOG_INF() << "Recovery interrupted";

        report.mInterrupted = true;
    }

    mState->mCurrentBackoff = mBackoff.OnFailure(mState->mCurrentBackoff);
    report.mBackoff         = mState->mCurrentBackoff;

    LOG_WRN() << "Backoff increased" << aos::Log::Field("backoffSec", ToSeconds(mState->mCurrentBackoff));

    if (mState->mConsecutiveFailures < mConfig.mRecovery.mMaxRestartAttempts || mState->mCriticalAlertSent) {
        return;
    }

    if (auto err = mCriticalAlertSender->SendCriticalAlert(errorType, mState->mConsecutiveFailures); !err.IsNone()) {
        LOG_ERR() << "Can't send critical alert" << aos::Log::Field(err);
    }

    mState->mCriticalAlertSent = true;
    report.mCriticalAlertSent  = true;
}

} // namespace healer::recovery
