/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_SUPERVISOR_SUPERVISOR_HPP_
#define HEALER_SUPERVISOR_SUPERVISOR_HPP_

#include <condition_variable>
#include <mutex>
#include <thread>

#include <common/utils/clock.hpp>
#include <healer/alerts/alertengine.hpp>
#include <healer/backoff/backoff.hpp>
#include <healer/classifier/classifier.hpp>
#include <healer/config/config.hpp>
#include <healer/healthcheck/itf/healthchecker.hpp>
#include <healer/probe/processprobe.hpp>
#include <healer/processmanager/itf/processmanager.hpp>
#include <healer/recovery/recoveryorchestrator.hpp>

#include "state.hpp"

namespace healer::supervisor {

/**
 * Polls monitored process and drives recovery.
 */
class Supervisor {
public:
    /**
     * Initializes supervisor.
     *
     * @param config config.
     * @param probe process probe.
     * @param processManager process manager used to fetch error logs.
     * @param healthChecker health checker.
     * @param alertEngine alert engine.
     * @param recovery recovery orchestrator.
     * @param clock clock.
     * @return aos::Error.
     */
    aos::Error Init(const config::Config& config, probe::ProcessProbe& probe,
        processmanager::ProcessManagerItf& processManager, healthcheck::HealthCheckerItf& healthChecker,
        alerts::AlertEngine& alertEngine, recovery::RecoveryOrchestrator& recovery, common::utils::ClockItf& clock);

    /**
     * Starts polling thread. First tick runs immediately.
     *
     * @return aos::Error.
     */
    aos::Error Start();

    /**
     * Stops polling thread.
     *
     * @return aos::Error.
     */
    aos::Error Stop();

    /**
     * Runs one supervision tick.
     */
    void Tick();

    /**
     * Returns supervisor state.
     *
     * @return SupervisorState&.
     */
    SupervisorState& GetState() { return mState; }

private:
    void                  Run();
    void                  HandleProcessDown();
    void                  HandleUnhealthy(const healthcheck::HealthResult& result);
    void                  HandleHealthy(const probe::ProcessSnapshot& snapshot);
    classifier::ErrorType ClassifyErrorLogs(classifier::ErrorType fallback);
    bool                  IsRecoveryAllowed();
    alerts::AlertContext  CreateContext(const probe::ProcessSnapshot& snapshot) const;

    config::Config                     mConfig;
    backoff::BackoffController         mBackoff;
    SupervisorState                    mState;
    probe::ProcessProbe*               mProbe {};
    processmanager::ProcessManagerItf* mProcessManager {};
    healthcheck::HealthCheckerItf*     mHealthChecker {};
    alerts::AlertEngine*               mAlertEngine {};
    recovery::RecoveryOrchestrator*    mRecovery {};
    common::utils::ClockItf*           mClock {};

    std::mutex              mMutex;
    std::condition_variable mCondVar;
    std::thread             mThread;
    bool                    mStopped {true};
};

} // namespace healer::supervisor

#endif
