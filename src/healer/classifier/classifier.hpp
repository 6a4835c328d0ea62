/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HEALER_CLASSIFIER_CLASSIFIER_HPP_
#define HEALER_CLASSIFIER_CLASSIFIER_HPP_

#include <string>
#include <vector>

namespace healer::classifier {

/**
 * Failure category.
 */
enum class ErrorType {
    ePrisma,
    eModule,
    eMemory,
    eConnection,
    eUnresponsive,
    eUnknown,
};

/**
 * Categories detected in a log tail.
 */
struct ErrorFlags {
    bool mPrisma {};
    bool mModule {};
    bool mMemory {};
    bool mConnection {};

    bool Any() const { return mPrisma || mModule || mMemory || mConnection; }
};

/**
 * Log pattern rule.
 */
struct ClassificationRule {
    const char* mPattern;
    ErrorType   mType;
};

/**
 * Returns ordered log pattern rules. Patterns are matched as case-sensitive substrings.
 *
 * @return const std::vector<ClassificationRule>&.
 */
const std::vector<ClassificationRule>& GetClassificationRules();

/**
 * Detects failure categories in a log tail.
 *
 * @param logTail log tail.
 * @return ErrorFlags.
 */
ErrorFlags Classify(const std::string& logTail);

/**
 * Picks the highest priority detected category.
 *
 * Priority is prisma, module, memory, connection. If nothing is detected, fallback is returned: unknown for a stopped
 * process and unresponsive for a running process that fails its health check.
 *
 * @param flags detected categories.
 * @param fallback fallback category.
 * @return ErrorType.
 */
ErrorType SelectErrorType(const ErrorFlags& flags, ErrorType fallback);

/**
 * Returns error type name.
 *
 * @param type error type.
 * @return const char*.
 */
const char* ToString(ErrorType type);

} // namespace healer::classifier

#endif
