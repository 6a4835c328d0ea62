/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_APP_APP_HPP_
#define HEALER_APP_APP_HPP_

#include <memory>
#include <optional>

#include <Poco/Util/ServerApplication.h>

#include <common/logger/logger.hpp>

#include "healercore.hpp"

namespace healer::app {

/**
 * Healer application.
 */
class App : public Poco::Util::ServerApplication {
public:
    /**
     * Constructor.
     */
    App() = default;

protected:
    void initialize(Application& self) override;
    void uninitialize() override;
    void reinitialize(Application& self) override;
    int  main(const ArgVec& args) override;
    void defineOptions(Poco::Util::OptionSet& options) override;

private:
    static constexpr auto cSDNotifyReady = "READY=1";

    void HandleHelp(const std::string& name, const std::string& value);
    void HandleConfigFile(const std::string& name, const std::string& value);
    void HandleLogLevel(const std::string& name, const std::string& value);
    void HandleVersion(const std::string& name, const std::string& value);
    void HandleJournal(const std::string& name, const std::string& value);

    std::unique_ptr<HealerCore>     mHealerCore;
    common::logger::Logger          mLogger;
    common::logger::Logger::Backend mLogBackend = common::logger::Logger::Backend::eStdIO;
    std::optional<aos::LogLevel>    mLogLevel;
    bool                            mStopProcessing {};
    bool                            mInitialized {};
    std::string                     mConfigFile;
};

} // namespace healer::app

#endif
