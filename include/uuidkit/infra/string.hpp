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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` covering the text chores of the UUID codec and the command-line
 * front end: trimming, case folding, character stripping and hexadecimal conversion.
 */

#pragma once

#include <string>
#include <string_view>

namespace uuidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string without surrounding whitespace. Returns an
     * empty string if the input consists solely of whitespace.
     *
     * @code
     * std::string clean = uuidkit::infra::String::trim("  {6ba7b810-...}\n");
     * @endcode
     */
    static std::string trim(std::string_view s);

    /// @brief Returns an ASCII lower-cased copy of `s`.
    static std::string to_lower(std::string_view s);

    /**
     * @brief Removes every occurrence of the characters in `chars` from `s`.
     *
     * @code
     * String::strip_chars("{6ba7b810-9dad}", "{}-"); // "6ba7b8109dad"
     * @endcode
     */
    static std::string strip_chars(std::string_view s, std::string_view chars);

    /// @brief True when `s` is non-empty and made only of `[0-9A-Fa-f]`.
    static bool is_hex(std::string_view s);

    /**
     * @brief Encodes raw bytes as lower-case hexadecimal, two digits per byte.
     */
    static std::string to_hex(std::string_view bytes);

    /**
     * @brief Decodes an even-length hexadecimal string to raw bytes.
     *
     * @throws std::invalid_argument on odd length or a non-hex character.
     */
    static std::string from_hex(std::string_view hex);
};

} // namespace uuidkit::infra
