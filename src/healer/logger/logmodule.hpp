/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_LOGGER_LOGMODULE_HPP_
#define HEALER_LOGGER_LOGMODULE_HPP_

#ifndef LOG_MODULE
#define LOG_MODULE "healer"
#endif

#include <core/common/tools/logger.hpp>

#endif
