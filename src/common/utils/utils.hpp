/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_UTILS_HPP_
#define HEALER_COMMON_UTILS_UTILS_HPP_

#include <functional>
#include <string>
#include <vector>

#include <core/common/tools/error.hpp>

#include "time.hpp"

namespace healer::common::utils {

/**
 * Command execution options.
 */
struct ExecOptions {
    std::string           mWorkingDir;
    Duration              mTimeout {std::chrono::minutes(5)};
    std::function<bool()> mStopRequested;
};

/**
 * Executes command and returns its combined stdout and stderr output.
 *
 * The command runs in its own session. The whole session is killed when the command does not finish within the
 * timeout or when stop is requested, so processes spawned by the command can't outlive the call.
 *
 * @param args command and its arguments.
 * @param options execution options.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ExecCommand(const std::vector<std::string>& args, const ExecOptions& options = {});

} // namespace healer::common::utils

#endif
