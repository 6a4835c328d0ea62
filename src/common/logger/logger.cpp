/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

#include <systemd/sd-journal.h>

#include <common/utils/time.hpp>

#include "logger.hpp"

namespace healer::common::logger {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

// Journal priorities as defined by syslog.
constexpr auto cPriorityError   = 3;
constexpr auto cPriorityWarning = 4;
constexpr auto cPriorityNotice  = 5;
constexpr auto cPriorityInfo    = 6;
constexpr auto cPriorityDebug   = 7;

std::mutex    sMutex;
aos::LogLevel sLogLevel       = aos::LogLevelEnum::eInfo;
std::string   sLogFile        = "";
bool          sMirrorToStdout = true;
bool          sFileErrorShown = false;

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error Logger::Init()
{
    SetBackend(mBackend);

    return aos::ErrorEnum::eNone;
}

void Logger::SetBackend(Backend backend)
{
    mBackend = backend;

    switch (mBackend) {
    case Backend::eJournald:
        aos::Log::SetCallback(JournaldCallback);
        break;

    case Backend::eFile:
        aos::Log::SetCallback(FileCallback);
        break;

    default:
        aos::Log::SetCallback(StdIOCallback);
        break;
    }
}

void Logger::SetLogLevel(aos::LogLevel level)
{
    std::lock_guard lock {sMutex};

    sLogLevel = level;
}

void Logger::SetLogFile(const std::string& path, bool mirrorToStdout)
{
    {
        std::lock_guard lock {sMutex};

        sLogFile        = path;
        sMirrorToStdout = mirrorToStdout;
        sFileErrorShown = false;
    }

    SetBackend(path.empty() ? Backend::eStdIO : Backend::eFile);
}

std::string Logger::FormatLine(aos::LogLevel level, const std::string& message)
{
    return "[" + utils::ToISO8601String(std::chrono::system_clock::now()) + "] [" + LevelToString(level) + "] "
        + message;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Logger::StdIOCallback(const char* module, aos::LogLevel level, const aos::String& message)
{
    (void)module;

    if (!IsEnabled(level)) {
        return;
    }

    std::lock_guard lock {sMutex};

    std::cout << FormatLine(level, message.CStr()) << std::endl;
}

void Logger::JournaldCallback(const char* module, aos::LogLevel level, const aos::String& message)
{
    if (!IsEnabled(level)) {
        return;
    }

    sd_journal_send("MESSAGE=%s", message.CStr(), "PRIORITY=%i", LevelToPriority(level), "HEALER_MODULE=%s",
        module ? module : "", nullptr);
}

void Logger::FileCallback(const char* module, aos::LogLevel level, const aos::String& message)
{
    (void)module;

    if (!IsEnabled(level)) {
        return;
    }

    const auto line = FormatLine(level, message.CStr());

    std::lock_guard lock {sMutex};

    if (sMirrorToStdout) {
        std::cout << line << std::endl;
    }

    AppendToFile(line);
}

bool Logger::IsEnabled(aos::LogLevel level)
{
    std::lock_guard lock {sMutex};

    return level.GetValue() >= sLogLevel.GetValue();
}

const char* Logger::LevelToString(aos::LogLevel level)
{
    switch (level.GetValue()) {
    case aos::LogLevelEnum::eDebug:
        return "DEBUG";

    case aos::LogLevelEnum::eInfo:
        return "INFO";

    case aos::LogLevelEnum::eWarning:
        return "WARN";

    case aos::LogLevelEnum::eError:
        return "ERROR";

    default:
        return "UNKNOWN";
    }
}

int Logger::LevelToPriority(aos::LogLevel level)
{
    switch (level.GetValue()) {
    case aos::LogLevelEnum::eDebug:
        return cPriorityDebug;

    case aos::LogLevelEnum::eInfo:
        return cPriorityInfo;

    case aos::LogLevelEnum::eWarning:
        return cPriorityWarning;

    case aos::LogLevelEnum::eError:
        return cPriorityError;

    default:
        return cPriorityNotice;
    }
}

// Must be called with sMutex locked. Write failures never propagate to the caller.
void Logger::AppendToFile(const std::string& line)
{
    try {
        const auto dir = std::filesystem::path(sLogFile).parent_path();

        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(sLogFile, std::ios::app);
        if (!file.is_open()) {
            throw std::runtime_error("can't open " + sLogFile);
        }

        file << line << '\n';
    } catch (const std::exception& e) {
        if (!sFileErrorShown) {
            std::cerr << "Failed to write to log file: " << e.what() << std::endl;
            sFileErrorShown = true;
        }
    }
}

} // namespace healer::common::logger
