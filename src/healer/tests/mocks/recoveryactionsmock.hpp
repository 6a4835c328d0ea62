/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_TESTS_MOCKS_RECOVERYACTIONSMOCK_HPP_
#define HEALER_TESTS_MOCKS_RECOVERYACTIONSMOCK_HPP_

#include <gmock/gmock.h>

#include <healer/recovery/itf/recoveryactions.hpp>

namespace healer::recovery {

class RecoveryActionsMock : public RecoveryActionsItf {
public:
    MOCK_METHOD(aos::Error, Restart, (), (override));
    MOCK_METHOD(aos::Error, RegenerateClient, (), (override));
    MOCK_METHOD(aos::Error, ReinstallDependencies, (), (override));
    MOCK_METHOD(aos::Error, Rebuild, (), (override));
};

} // namespace healer::recovery

#endif
