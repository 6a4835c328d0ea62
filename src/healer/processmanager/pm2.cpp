/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/utils.hpp>
#include <healer/logger/logmodule.hpp>

#include "pm2.hpp"

namespace healer::processmanager {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error PM2::Init(const config::Process& config)
{
    if (config.mManagerCommand.empty()) {
        return AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "empty process manager command"));
    }

    LOG_DBG() << "Init PM2 adapter" << aos::Log::Field("command", config.mManagerCommand.front().c_str());

    mCommand    = config.mManagerCommand;
    mProjectDir = config.mProjectDir;
    mTimeout    = config.mCommandTimeout;

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<std::string> PM2::ListProcesses()
{
    return Run({"jlist"});
}

aos::RetWithError<std::string> PM2::GetErrorLogs(const std::string& name, uint32_t lines)
{
    return Run({"logs", name, "--err", "--lines", std::to_string(lines), "--nostream"});
}

aos::Error PM2::Restart(const std::string& name)
{
    LOG_INF() << "Restart process" << aos::Log::Field("name", name.c_str());

    auto [output, err] = Run({"restart", name});
    if (!err.IsNone()) {
        return err;
    }

    LOG_DBG() << "Process restarted" << aos::Log::Field("output", output.c_str());

    return aos::ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

aos::RetWithError<std::string> PM2::Run(const std::vector<std::string>& args)
{
    auto command = mCommand;

    command.insert(command.end(), args.begin(), args.end());

    auto [output, err] = common::utils::ExecCommand(command, {mProjectDir, mTimeout});
    if (!err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    return {output, aos::ErrorEnum::eNone};
}

} // namespace healer::processmanager
