/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "cleanupmanager.hpp"

namespace healer::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void CleanupManager::AddCleanup(const std::string& name, std::function<void()>&& cleanup)
{
    mCleanups.emplace_back(name, std::move(cleanup));
}

void CleanupManager::ExecuteCleanups()
{
    auto cleanups = std::move(mCleanups);

    mCleanups.clear();

    for (auto it = cleanups.rbegin(); it != cleanups.rend(); ++it) {
        LOG_DBG() << "Execute cleanup" << aos::Log::Field("name", it->first.c_str());

        try {
            it->second();
        } catch (const std::exception& e) {
            LOG_ERR() << "Cleanup failed" << aos::Log::Field("name", it->first.c_str())
                      << aos::Log::Field("error", e.what());
        }
    }
}

} // namespace healer::common::utils
