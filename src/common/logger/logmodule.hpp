/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_COMMON_LOGGER_LOGMODULE_HPP_
#define HEALER_COMMON_LOGGER_LOGMODULE_HPP_

#ifndef LOG_MODULE
#define LOG_MODULE "common"
#endif

#include <core/common/tools/logger.hpp>

#endif
