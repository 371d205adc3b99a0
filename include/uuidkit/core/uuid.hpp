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
 * @file uuid.hpp
 * @brief The immutable 128-bit UUID value and the well-known constants.
 *
 * @details
 * A `Uuid` is a plain 16-byte value held in big-endian field order, which makes
 * byte-wise comparison agree with the lexical order of the canonical string.
 * Version and variant are not stored separately; they are read from the bytes.
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace uuidkit::core {

/// @brief Raw storage of a UUID, byte 0 first.
using Bytes = std::array<std::uint8_t, 16>;

/// @brief The all-zero UUID in canonical form.
inline constexpr std::string_view kNilUuid = "00000000-0000-0000-0000-000000000000";

/// @brief The all-one UUID in canonical form.
inline constexpr std::string_view kMaxUuid = "ffffffff-ffff-ffff-ffff-ffffffffffff";

/// @brief Predefined namespace for fully qualified domain names (RFC 4122, appendix C).
inline constexpr std::string_view kNamespaceDns = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

/// @brief Predefined namespace for URLs.
inline constexpr std::string_view kNamespaceUrl = "6ba7b811-9dad-11d1-80b4-00c04fd430c8";

/// @brief Predefined namespace for ISO object identifiers.
inline constexpr std::string_view kNamespaceOid = "6ba7b812-9dad-11d1-80b4-00c04fd430c8";

/// @brief Predefined namespace for X.500 distinguished names.
inline constexpr std::string_view kNamespaceX500 = "6ba7b814-9dad-11d1-80b4-00c04fd430c8";

/// @brief Version field value of the nil UUID.
inline constexpr int kNilVersion = 0;

/// @brief Version field value of the max UUID.
inline constexpr int kMaxVersion = 15;

/**
 * @class Uuid
 * @brief A 128-bit identifier with derived accessors.
 */
class Uuid {
  public:
    /// @brief Constructs the nil UUID.
    Uuid() : bytes_{} {}

    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    static Uuid nil() { return Uuid(); }
    static Uuid max();

    const Bytes& bytes() const { return bytes_; }

    /**
     * @brief The 4-bit version field (high nibble of byte 6).
     *
     * Values outside the supported set are returned as stored.
     */
    int version() const { return bytes_[6] >> 4; }

    /// @brief The top two bits of byte 8 (`0b10` for RFC 4122 layouts).
    int variant() const { return bytes_[8] >> 6; }

    bool is_nil() const;
    bool is_max() const;

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }
    bool operator>(const Uuid& other) const { return other.bytes_ < bytes_; }
    bool operator<=(const Uuid& other) const { return !(other.bytes_ < bytes_); }
    bool operator>=(const Uuid& other) const { return !(bytes_ < other.bytes_); }

  private:
    Bytes bytes_;
};

/// @brief Writes the canonical 36-character form.
std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace uuidkit::core
