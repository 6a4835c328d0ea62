/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_LOGGER_LOGGER_HPP_
#define HEALER_COMMON_LOGGER_LOGGER_HPP_

#include <string>

#include <core/common/tools/error.hpp>
#include <core/common/tools/logger.hpp>

namespace healer::common::logger {

/**
 * Logger.
 *
 * Installs log callback and dispatches log lines to the selected backend.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eJournald,
        eFile,
    };

    /**
     * Initializes logger.
     *
     * @return aos::Error.
     */
    aos::Error Init();

    /**
     * Sets log backend.
     *
     * @param backend log backend.
     */
    void SetBackend(Backend backend);

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    void SetLogLevel(aos::LogLevel level);

    /**
     * Sets log file path used by file backend. Also mirrors lines to stdout when enabled.
     *
     * @param path log file path.
     * @param mirrorToStdout mirror log lines to stdout.
     */
    void SetLogFile(const std::string& path, bool mirrorToStdout = true);

    /**
     * Formats log line.
     *
     * @param level log level.
     * @param message log message.
     * @return std::string.
     */
    static std::string FormatLine(aos::LogLevel level, const std::string& message);

private:
    static void StdIOCallback(const char* module, aos::LogLevel level, const aos::String& message);
    static void JournaldCallback(const char* module, aos::LogLevel level, const aos::String& message);
    static void FileCallback(const char* module, aos::LogLevel level, const aos::String& message);

    static bool        IsEnabled(aos::LogLevel level);
    static const char* LevelToString(aos::LogLevel level);
    static int         LevelToPriority(aos::LogLevel level);
    static void        AppendToFile(const std::string& line);

    Backend mBackend = Backend::eStdIO;
};

} // namespace healer::common::logger

#endif
