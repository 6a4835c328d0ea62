/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "classifier.hpp"

namespace healer::classifier {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

const std::vector<ClassificationRule>& GetClassificationRules()
{
    static const std::vector<ClassificationRule> sRules = {
        {"PrismaClient", ErrorType::ePrisma},
        {"@prisma/client", ErrorType::ePrisma},
        {"Cannot find module", ErrorType::eModule},
        {"SyntaxError", ErrorType::eModule},
        {"FATAL ERROR", ErrorType::eMemory},
        {"heap out of memory", ErrorType::eMemory},
        {"ECONNREFUSED", ErrorType::eConnection},
        {"ENOTFOUND", ErrorType::eConnection},
    };

    return sRules;
}

ErrorFlags Classify(const std::string& logTail)
{
    ErrorFlags flags;

    for (const auto& rule : GetClassificationRules()) {
        if (logTail.find(rule.mPattern) == std::string::npos) {
            continue;
        }

        switch (rule.mType) {
        case ErrorType::ePrisma:
            flags.mPrisma = true;
            break;

        case ErrorType::eModule:
            flags.mModule = true;
            break;

        case ErrorType::eMemory:
            flags.mMemory = true;
            break;

        case ErrorType::eConnection:
            flags.mConnection = true;
            break;

        default:
            break;
        }
    }

    return flags;
}

ErrorType SelectErrorType(const ErrorFlags& flags, ErrorType fallback)
{
    if (flags.mPrisma) {
        return ErrorType::ePrisma;
    }

    if (flags.mModule) {
        return ErrorType::eModule;
    }

    if (flags.mMemory) {
        return ErrorType::eMemory;
    }

    if (flags.mConnection) {
        return ErrorType::eConnection;
    }

    return fallback;
}

const char* ToString(ErrorType type)
{
    switch (type) {
    case ErrorType::ePrisma:
        return "prisma";

    case ErrorType::eModule:
        return "module";

    case ErrorType::eMemory:
        return "memory";

    case ErrorType::eConnection:
        return "connection";

    case ErrorType::eUnresponsive:
        return "unresponsive";

    default:
        return "unknown";
    }
}

} // namespace healer::classifier
