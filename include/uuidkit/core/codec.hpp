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
 * @file codec.hpp
 * @brief Conversion between `Uuid` values and their external representations.
 *
 * @details
 * Three representations are supported, all of which sort identically:
 * - **Canonical**: 36 characters, lower-case hex grouped `8-4-4-4-12`.
 * - **Binary**: the 16 raw bytes.
 * - **Compact**: 22 characters of base64 over the binary form, written with a
 *   sortable alphabet whose ASCII order matches the 6-bit values it encodes.
 *
 * Parsing detects the representation from the input's length and content.
 */

#pragma once

#include "uuidkit/core/error.hpp"
#include "uuidkit/core/uuid.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace uuidkit::core {

/// @brief Standard base64 alphabet followed by its padding character.
inline constexpr std::string_view kBase64Standard =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";

/**
 * @brief Sort-preserving alphabet, position-for-position with `kBase64Standard`.
 *
 * The 64 symbols are in ascending ASCII order. The trailing space stands in for
 * padding and is never emitted.
 */
inline constexpr std::string_view kBase64Sortable =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz~ ";

/// @brief Length of the canonical form.
inline constexpr std::size_t kCanonicalLength = 36;

/// @brief Length of the binary form.
inline constexpr std::size_t kBinaryLength = 16;

/// @brief Length of the compact form.
inline constexpr std::size_t kCompactLength = 22;

/**
 * @struct Parsed
 * @brief Result of a non-fatal parse: the value plus the substitution notice, if any.
 */
struct Parsed {
    Uuid value;
    std::optional<Issue> issue;
};

/**
 * @struct Converted
 * @brief Result of `compress`/`expand`.
 */
struct Converted {
    std::string text;
    std::optional<Issue> issue;
};

/**
 * @class Codec
 * @brief Stateless encoder/decoder for the three UUID forms.
 */
class Codec {
  public:
    /**
     * @brief Decodes any of the three forms.
     *
     * Detection order:
     * 1. Exactly 16 bytes: binary.
     * 2. Exactly 22 characters from the sortable alphabet: compact.
     * 3. Exactly 32 hex digits once `{`, `}` and `-` are removed: canonical.
     *
     * @return The value, or `std::nullopt` when the input matches none of them.
     */
    static std::optional<Uuid> decode(std::string_view input);

    /**
     * @brief Parses `input`, substituting the nil UUID when it is invalid.
     *
     * @param strict When true an invalid input is fatal.
     * @throws UuidError (`InvalidUuidString`) in strict mode.
     */
    static Parsed parse(std::string_view input, bool strict = false);

    static std::string to_canonical(const Uuid& uuid);

    /// @brief The 16 raw bytes as a `std::string`.
    static std::string to_binary(const Uuid& uuid);

    static std::string to_compact(const Uuid& uuid);

    /**
     * @brief Re-encodes any UUID form as binary (default) or compact.
     */
    static Converted compress(std::string_view input, bool to_compact = false);

    /// @brief Re-encodes any UUID form as canonical.
    static Converted expand(std::string_view input);

  private:
    static std::optional<Uuid> decode_compact(std::string_view input);
    static std::optional<Uuid> decode_hex(std::string_view input);
};

} // namespace uuidkit::core
