/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_TESTS_MOCKS_PROCESSMANAGERMOCK_HPP_
#define HEALER_TESTS_MOCKS_PROCESSMANAGERMOCK_HPP_

#include <gmock/gmock.h>

#include <healer/processmanager/itf/processmanager.hpp>

namespace healer::processmanager {

class ProcessManagerMock : public ProcessManagerItf {
public:
    MOCK_METHOD(aos::RetWithError<std::string>, ListProcesses, (), (override));
    MOCK_METHOD(aos::RetWithError<std::string>, GetErrorLogs, (const std::string& name, uint32_t lines), (override));
    MOCK_METHOD(aos::Error, Restart, (const std::string& name), (override));
};

} // namespace healer::processmanager

#endif
