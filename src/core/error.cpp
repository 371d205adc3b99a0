/*
 * UUIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the UuidKit Community License.
 * You may not use this file except in compliance with the License.
 */

#include "uuidkit/core/error.hpp"

namespace uuidkit::core {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnsupportedVersion:
        return "UnsupportedVersion";
    case ErrorCode::MissingHashInput:
        return "MissingHashInput";
    case ErrorCode::InvalidV2Domain:
        return "InvalidV2Domain";
    case ErrorCode::UnknownV2Domain:
        return "UnknownV2Domain";
    case ErrorCode::TimestampOutOfRange:
        return "TimestampOutOfRange";
    case ErrorCode::InvalidUuidString:
        return "InvalidUuidString";
    case ErrorCode::InvalidNamespaceString:
        return "InvalidNamespaceString";
    }
    return "Unknown";
}

} // namespace uuidkit::core
