/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_PROBE_PROCESSPROBE_HPP_
#define HEALER_PROBE_PROCESSPROBE_HPP_

#include <string>

#include <common/utils/clock.hpp>
#include <healer/processmanager/itf/processmanager.hpp>

namespace healer::probe {

/**
 * Process snapshot.
 */
struct ProcessSnapshot {
    bool        mRunning {};
    std::string mStatus;
    std::string mReason;
    int64_t     mPID {};
    uint64_t    mMemoryMB {};
    double      mCPU {};
    uint64_t    mRestarts {};
    Duration    mUptime {};
};

/**
 * Queries process manager for the monitored process state.
 */
class ProcessProbe {
public:
    /**
     * Initializes probe.
     *
     * @param name monitored process name.
     * @param processManager process manager.
     * @param clock clock.
     * @return aos::Error.
     */
    aos::Error Init(
        const std::string& name, processmanager::ProcessManagerItf& processManager, common::utils::ClockItf& clock);

    /**
     * Returns monitored process snapshot.
     *
     * Missing process is reported as not running. Error is returned if the process manager can't be queried or its
     * output can't be parsed.
     *
     * @return aos::RetWithError<ProcessSnapshot>.
     */
    aos::RetWithError<ProcessSnapshot> Probe();

    /**
     * Parses process list JSON.
     *
     * @param name process name.
     * @param processList process manager JSON output.
     * @param now current time.
     * @return aos::RetWithError<ProcessSnapshot>.
     */
    static aos::RetWithError<ProcessSnapshot> ParseProcessList(
        const std::string& name, const std::string& processList, const Time& now);

private:
    std::string                        mName;
    processmanager::ProcessManagerItf* mProcessManager {};
    common::utils::ClockItf*           mClock {};
};

} // namespace healer::probe

#endif
