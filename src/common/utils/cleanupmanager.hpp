/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_UTILS_CLEANUPMANAGER_HPP_
#define HEALER_COMMON_UTILS_CLEANUPMANAGER_HPP_

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace healer::common::utils {

/**
 * Runs registered shutdown steps in reverse registration order.
 */
class CleanupManager {
public:
    /**
     * Registers named cleanup step.
     *
     * @param name step name.
     * @param cleanup cleanup function.
     */
    void AddCleanup(const std::string& name, std::function<void()>&& cleanup);

    /**
     * Executes registered cleanups once. A throwing step is logged and does not prevent the remaining ones.
     */
    void ExecuteCleanups();

    /**
     * Returns number of pending cleanups.
     *
     * @return size_t.
     */
    size_t Size() const { return mCleanups.size(); }

private:
    std::vector<std::pair<std::string, std::function<void()>>> mCleanups;
};

} // namespace healer::common::utils

#endif
