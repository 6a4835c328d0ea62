/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_RECOVERY_ITF_RECOVERYACTIONS_HPP_
#define HEALER_RECOVERY_ITF_RECOVERYACTIONS_HPP_

#include <core/common/tools/error.hpp>

namespace healer::recovery {

/**
 * Recovery actions interface.
 */
class RecoveryActionsItf {
public:
    /**
     * Restarts monitored process.
     *
     * @return aos::Error.
     */
    virtual aos::Error Restart() = 0;

    /**
     * Regenerates ORM client.
     *
     * @return aos::Error.
     */
    virtual aos::Error RegenerateClient() = 0;

    /**
     * Clears dependency cache and reinstalls dependencies.
     *
     * @return aos::Error.
     */
    virtual aos::Error ReinstallDependencies() = 0;

    /**
     * Rebuilds application.
     *
     * @return aos::Error.
     */
    virtual aos::Error Rebuild() = 0;

    /**
     * Destructor.
     */
    virtual ~RecoveryActionsItf() = default;
};

} // namespace healer::recovery

#endif
