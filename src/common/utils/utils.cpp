/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <future>
#include <memory>
#include <sstream>
#include <thread>

#include <signal.h>

#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>

#include "exception.hpp"
#include "utils.hpp"

namespace healer::common::utils {

namespace {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cExitPollPeriod    = std::chrono::milliseconds(50);
constexpr auto cReaderGracePeriod = std::chrono::seconds(1);
constexpr auto cSetsidCommand     = "setsid";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

struct OutputReader {
    Poco::Pipe         mPipe;
    std::ostringstream mOutput;
    std::string        mError;
    std::promise<void> mDone;
};

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void KillSession(Poco::ProcessHandle::PID pid)
{
    // Process is not yet a session leader if setsid hasn't run.
    if (::kill(-pid, SIGKILL) != 0) {
        ::kill(pid, SIGKILL);
    }
}

std::string CommandToString(const std::vector<std::string>& args)
{
    std::ostringstream oss;

    for (size_t i = 0; i < args.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }

        oss << args[i];
    }

    return oss.str();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::RetWithError<std::string> ExecCommand(const std::vector<std::string>& args, const ExecOptions& options)
{
    if (args.empty()) {
        return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, "exec command requires at least one argument")};
    }

    const Poco::Process::Args pocoArgs(args.begin(), args.end());

    try {
        auto reader = std::make_shared<OutputReader>();
        auto ph     = Poco::Process::launch(
            cSetsidCommand, pocoArgs, options.mWorkingDir, nullptr, &reader->mPipe, &reader->mPipe);
        auto readDone = reader->mDone.get_future();

        // Output is drained in a separate thread so a hung command can still be killed. The reader owns its state:
        // it is detached if a process outside the session keeps the pipe open.
        std::thread readerThread([reader]() {
            try {
                Poco::PipeInputStream istr(reader->mPipe);

                Poco::StreamCopier::copyStream(istr, reader->mOutput);
            } catch (const std::exception& e) {
                reader->mError = e.what();
            }

            reader->mDone.set_value();
        });

        const auto deadline = std::chrono::steady_clock::now() + options.mTimeout;
        bool       timedOut = false;
        bool       stopped  = false;
        int        rc       = -1;

        try {
            while (Poco::Process::isRunning(ph)) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    timedOut = true;
                } else if (options.mStopRequested && options.mStopRequested()) {
                    stopped = true;
                }

                if (timedOut || stopped) {
                    KillSession(ph.id());

                    break;
                }

                std::this_thread::sleep_for(cExitPollPeriod);
            }

            rc = ph.wait();
        } catch (...) {
            KillSession(ph.id());
            readerThread.detach();

            throw;
        }

        const auto readDeadline
            = (timedOut || stopped) ? std::chrono::steady_clock::now() + cReaderGracePeriod : deadline;

        if (readDone.wait_until(readDeadline) != std::future_status::ready) {
            // Children that survived the command still hold the pipe.
            KillSession(ph.id());

            if (readDone.wait_for(cReaderGracePeriod) != std::future_status::ready) {
                readerThread.detach();

                return {"", aos::Error(stopped ? aos::ErrorEnum::eFailed : aos::ErrorEnum::eTimeout,
                                ("command `" + CommandToString(args) + "` output is not closed").c_str())};
            }

            timedOut = !stopped;
        }

        readerThread.join();

        const auto output    = reader->mOutput.str();
        const auto readError = reader->mError;

        if (timedOut) {
            return {output,
                aos::Error(aos::ErrorEnum::eTimeout, ("command `" + CommandToString(args) + "` timed out").c_str())};
        }

        if (stopped) {
            return {output,
                aos::Error(aos::ErrorEnum::eFailed, ("command `" + CommandToString(args) + "` stopped").c_str())};
        }

        if (!readError.empty()) {
            return {output, aos::Error(aos::ErrorEnum::eRuntime, ("can't read command output: " + readError).c_str())};
        }

        if (rc != 0) {
            std::ostringstream err;

            err << "command `" << CommandToString(args) << "` failed (exit=" << rc << "):" << output;

            return {output, aos::Error(aos::ErrorEnum::eRuntime, err.str().c_str())};
        }

        return {output, aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", AOS_ERROR_WRAP(ToAosError(e, aos::ErrorEnum::eRuntime))};
    }
}

} // namespace healer::common::utils
