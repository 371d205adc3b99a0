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
 * @file timestamp.hpp
 * @brief Resolution of points in time and their version-specific integer encodings.
 *
 * @details
 * Time-based UUIDs need a point in time with sub-second precision. `TimestampSource`
 * produces one from "now", an explicit instant, or a date-like string, and converts
 * it to the integer timestamp each version packs:
 * - v1, v2, v6: 100-nanosecond ticks since 1582-10-15T00:00:00Z, 60 bits.
 * - v7: milliseconds since the Unix epoch, 48 bits.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace uuidkit::core {

/**
 * @brief A UTC point in time with microsecond resolution.
 *
 * The signed 64-bit microsecond count spans roughly +/-292,000 years, which keeps
 * every date a UUID can represent, and the overflow cases on both sides, exact.
 */
using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * @enum TimestampRange
 * @brief Where an adjusted timestamp falls relative to the version's field width.
 */
enum class TimestampRange {
    InRange,
    TooEarly, ///< Negative: the caller substitutes the nil UUID.
    TooLate   ///< Wider than the field: the caller substitutes the max UUID.
};

/**
 * @struct AdjustedTimestamp
 * @brief A version-specific integer timestamp and its range classification.
 *
 * `ticks` saturates at the `int64_t` limits instead of overflowing.
 */
struct AdjustedTimestamp {
    std::int64_t ticks;
    TimestampRange range;

    bool in_range() const { return range == TimestampRange::InRange; }
};

/**
 * @class TimestampSource
 * @brief Produces instants and converts them to UUID timestamps.
 */
class TimestampSource {
  public:
    /// @brief Supplier of the current time.
    using Clock = std::function<Instant()>;

    /// @brief Seconds between 1582-10-15T00:00:00Z and the Unix epoch.
    static constexpr std::int64_t kGregorianOffsetSeconds = 12219292800LL;

    /// @brief Largest value of the 60-bit Gregorian timestamp.
    static constexpr std::int64_t kMaxGregorianTicks = 0x0FFFFFFFFFFFFFFFLL;

    /// @brief Largest value of the 48-bit Unix millisecond timestamp.
    static constexpr std::int64_t kMaxUnixMillis = 0xFFFFFFFFFFFFLL;

    /// @brief Uses `std::chrono::system_clock`.
    TimestampSource();

    /// @brief Uses `clock` as the source of "now" (e.g., a frozen clock in tests).
    explicit TimestampSource(Clock clock);

    Instant now() const;

    /**
     * @brief Best-effort resolution of a date-like string.
     *
     * Accepts `now`, a numeric epoch in seconds (optionally `@`-prefixed and
     * fractional), or an ISO-8601 date/time. Anything unreadable resolves to `now()`.
     */
    Instant resolve(std::string_view text) const;

    /**
     * @brief Strict parser behind `resolve`.
     *
     * @return The instant, or `std::nullopt` when `text` is not understood.
     */
    static std::optional<Instant> parse(std::string_view text);

    /**
     * @brief Converts `instant` to the integer timestamp of `version`.
     *
     * Fractions below the unit of the target encoding are truncated toward zero.
     *
     * @throws std::invalid_argument if `version` is not 1, 2, 6 or 7.
     */
    static AdjustedTimestamp adjust(Instant instant, int version);

  private:
    Clock clock_;
};

} // namespace uuidkit::core
