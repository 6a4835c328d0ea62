/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cmath>

#include <Poco/JSON/Parser.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <healer/logger/logmodule.hpp>

#include "processprobe.hpp"

namespace healer::probe {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

namespace {

constexpr auto cOnlineStatus = "online";
constexpr auto cBytesInMB    = 1024.0 * 1024.0;

} // namespace

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

// Process manager may print banners like "[PM2] ..." before the JSON payload.
size_t FindProcessListStart(const std::string& output)
{
    for (auto pos = output.find('['); pos != std::string::npos; pos = output.find('[', pos + 1)) {
        auto next = output.find_first_not_of(" \t\r\n", pos + 1);

        if (next != std::string::npos && (output[next] == '{' || output[next] == ']')) {
            return pos;
        }
    }

    return std::string::npos;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error ProcessProbe::Init(
    const std::string& name, processmanager::ProcessManagerItf& processManager, common::utils::ClockItf& clock)
{
    LOG_DBG() << "Init process probe" << aos::Log::Field("name", name.c_str());

    mName           = name;
    mProcessManager = &processManager;
    mClock          = &clock;

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<ProcessSnapshot> ProcessProbe::Probe()
{
    auto [processList, err] = mProcessManager->ListProcesses();
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    return ParseProcessList(mName, processList, mClock->Now());
}

aos::RetWithError<ProcessSnapshot> ProcessProbe::ParseProcessList(
    const std::string& name, const std::string& processList, const Time& now)
{
    ProcessSnapshot snapshot;

    auto start = FindProcessListStart(processList);
    if (start == std::string::npos) {
        return {snapshot, AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "process list not found"))};
    }

    try {
        Poco::JSON::Parser parser;

        auto processes = parser.parse(processList.substr(start)).extract<Poco::JSON::Array::Ptr>();
        if (processes.isNull()) {
            return {snapshot, AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "invalid process list"))};
        }

        for (const auto& process : *processes) {
            common::utils::CaseInsensitiveObjectWrapper object(process);

            if (object.GetValue<std::string>("name", "") != name) {
                continue;
            }

            auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());
            auto env   = object.Has("pm2_env") ? object.GetObject("pm2_env") : empty;
            auto monit = object.Has("monit") ? object.GetObject("monit") : empty;

            snapshot.mStatus   = env.GetValue<std::string>("status", "unknown");
            snapshot.mRunning  = snapshot.mStatus == cOnlineStatus;
            snapshot.mPID      = object.GetValue<int64_t>("pid", 0);
            snapshot.mMemoryMB = static_cast<uint64_t>(std::llround(monit.GetValue<double>("memory", 0) / cBytesInMB));
            snapshot.mCPU      = monit.GetValue<double>("cpu", 0);
            snapshot.mRestarts = env.GetValue<uint64_t>("restart_time", 0);

            auto startedAt = env.GetValue<int64_t>("pm_uptime", 0);
            if (snapshot.mRunning && startedAt > 0) {
                auto uptime = std::chrono::duration_cast<Duration>(now - common::utils::FromUnixMilli(startedAt));

                snapshot.mUptime = std::max(uptime, Duration::zero());
            }

            if (!snapshot.mRunning) {
                snapshot.mReason = "Process status is " + snapshot.mStatus;
            }

            return {snapshot, aos::ErrorEnum::eNone};
        }
    } catch (const std::exception& e) {
        return {snapshot, AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eInvalidArgument))};
    }

    snapshot.mStatus = "missing";
    snapshot.mReason = "Process not found";

    return {snapshot, aos::ErrorEnum::eNone};
}

} // namespace healer::probe
