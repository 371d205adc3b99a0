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
 * @file hasher.hpp
 * @brief Namespace digests for name-based UUIDs (versions 3 and 5).
 */

#pragma once

#include "uuidkit/core/uuid.hpp"

#include <string_view>

namespace uuidkit::core {

/**
 * @class NamespaceHasher
 * @brief Computes RFC 4122 section 4.3 name-based UUIDs.
 *
 * @details
 * The digest input is the 16-byte binary namespace followed by the raw name bytes.
 * Version 3 uses MD5, version 5 uses SHA-1 truncated to 128 bits. The version and
 * variant bits of the result are overwritten.
 */
class NamespaceHasher {
  public:
    /**
     * @brief Returns the version-3 or version-5 UUID of `name` within `ns`.
     *
     * @throws std::invalid_argument if `version` is neither 3 nor 5.
     * @throws std::runtime_error if the digest engine fails.
     */
    static Uuid name_based(int version, const Uuid& ns, std::string_view name);

    /// @brief The raw (unversioned) first 128 bits of the digest.
    static Bytes digest(int version, const Uuid& ns, std::string_view name);
};

} // namespace uuidkit::core
