/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_RECOVERY_RECOVERYORCHESTRATOR_HPP_
#define HEALER_RECOVERY_RECOVERYORCHESTRATOR_HPP_

#include <optional>
#include <vector>

#include <common/utils/clock.hpp>
#include <healer/alerts/itf/criticalalertsender.hpp>
#include <healer/backoff/backoff.hpp>
#include <healer/classifier/classifier.hpp>
#include <healer/config/config.hpp>
#include <healer/healthcheck/itf/healthchecker.hpp>
#include <healer/supervisor/state.hpp>

#include "itf/recoveryactions.hpp"

namespace healer::recovery {

/**
 * Recovery action type.
 */
enum class ActionType {
    eRestart,
    eRegenerateClient,
    eReinstallDependencies,
    eRebuild,
};

/**
 * Returns action name.
 *
 * @param action action type.
 * @return const char*.
 */
const char* ToString(ActionType action);

/**
 * Recovery action result.
 */
struct ActionResult {
    ActionType mAction;
    aos::Error mError;
};

/**
 * Recovery run report.
 */
struct RecoveryReport {
    // Dropped because another recovery run is in progress.
    bool                                     mSkipped {};
    // Aborted by shutdown before the run completed.
    bool                                     mInterrupted {};
    classifier::ErrorType                    mErrorType {classifier::ErrorType::eUnknown};
    uint32_t                                 mAttempt {};
    std::vector<ActionResult>                mActions;
    std::optional<healthcheck::HealthResult> mVerification;
    bool                                     mRecovered {};
    bool                                     mCriticalAlertSent {};
    Duration                                 mBackoff {};
};

/**
 * Runs recovery action sequences and verifies their outcome.
 */
class RecoveryOrchestrator {
public:
    /**
     * Initializes orchestrator.
     *
     * @param config config.
     * @param state supervisor state.
     * @param actions recovery actions.
     * @param healthChecker health checker.
     * @param criticalAlertSender critical alert sender.
     * @param clock clock.
     * @return aos::Error.
     */
    aos::Error Init(const config::Config& config, supervisor::SupervisorState& state, RecoveryActionsItf& actions,
        healthcheck::HealthCheckerItf& healthChecker, alerts::CriticalAlertSenderItf& criticalAlertSender,
        common::utils::ClockItf& clock);

    /**
     * Runs one recovery for the classified failure.
     *
     * The request is dropped if a recovery is already in progress. Action failures are logged and collected in the
     * report; only health verification decides the outcome.
     *
     * @param errorType failure category.
     * @return RecoveryReport.
     */
    RecoveryReport Recover(classifier::ErrorType errorType);

    /**
     * Returns initial action sequence for failure category.
     *
     * @param errorType failure category.
     * @return std::vector<ActionType>.
     */
    static std::vector<ActionType> GetActionSequence(classifier::ErrorType errorType);

private:
    void RunRecovery(classifier::ErrorType errorType, RecoveryReport& report);
    bool RunActions(const std::vector<ActionType>& actions, RecoveryReport& report);
    bool Escalate(classifier::ErrorType errorType, RecoveryReport& report);
    void OnRecovered(RecoveryReport& report);
    void OnFailed(classifier::ErrorType errorType, RecoveryReport& report);

    config::Config                  mConfig;
    backoff::BackoffController      mBackoff;
    supervisor::SupervisorState*    mState {};
    RecoveryActionsItf*             mActions {};
    healthcheck::HealthCheckerItf*  mHealthChecker {};
    alerts::CriticalAlertSenderItf* mCriticalAlertSender {};
    common::utils::ClockItf*        mClock {};
};

} // namespace healer::recovery

#endif
