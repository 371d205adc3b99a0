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

/**
 * @file error.hpp
 * @brief Error taxonomy shared by generation, parsing and namespace handling.
 *
 * @details
 * Recoverable conditions are reported as `Issue` values alongside the substituted
 * result. Fatal conditions are raised as `UuidError`.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace uuidkit::core {

/**
 * @enum ErrorCode
 * @brief Classified failure conditions.
 */
enum class ErrorCode {
    UnsupportedVersion,    ///< Recoverable: the default version is used instead.
    MissingHashInput,      ///< Recoverable: a name-based version got no name; nil is produced.
    InvalidV2Domain,       ///< Recoverable: negative DCE domain; nil is produced.
    UnknownV2Domain,       ///< Fatal: no automatic identifier exists for the domain.
    TimestampOutOfRange,   ///< Recoverable: nil (too early) or max (too late) is produced.
    InvalidUuidString,     ///< Recoverable with nil, fatal in strict mode.
    InvalidNamespaceString ///< Fatal: the namespace would corrupt every name-based UUID.
};

/// @brief Stable identifier for a code, e.g. `"InvalidUuidString"`.
const char* to_string(ErrorCode code);

/**
 * @struct Issue
 * @brief A recoverable condition that was resolved by substitution.
 */
struct Issue {
    ErrorCode code;
    std::string detail;
};

/**
 * @class UuidError
 * @brief Exception raised for fatal conditions.
 */
class UuidError : public std::runtime_error {
  public:
    UuidError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

} // namespace uuidkit::core
