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
 * @file clock_state.hpp
 * @brief Monotonic clock bookkeeping shared by the time-based generators.
 *
 * @details
 * `ClockState` owns the last timestamp handed out, the 16-bit clock sequence and the
 * 48-bit node identifier used by versions 1, 2 and 6, plus the greatest value issued
 * by version 7. Every mutation happens under one mutex so concurrent generators never
 * observe a stale `last_timestamp`.
 */

#pragma once

#include "uuidkit/core/uuid.hpp"
#include "uuidkit/infra/random.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>

namespace uuidkit::core {

/// @brief Bit 40 of the node: the multicast bit of its first octet.
inline constexpr std::uint64_t kNodeMulticastBit = 0x010000000000ULL;

/// @brief Bytes 6-15 of a v7 value before the version and variant are stamped.
using V7Entropy = std::array<std::uint8_t, 10>;

/**
 * @struct ClockTick
 * @brief Snapshot handed to a time-based generator.
 */
struct ClockTick {
    std::int64_t timestamp;
    std::uint16_t clock_seq;
    std::uint64_t node;
};

/**
 * @class ClockState
 * @brief Serialized clock sequence, node and ordering state.
 */
class ClockState {
  public:
    /**
     * @param random Source used to seed the clock sequence and node on first use.
     * The reference must outlive this object.
     */
    explicit ClockState(infra::RandomSource& random);

    ClockState(const ClockState&) = delete;
    ClockState& operator=(const ClockState&) = delete;

    /**
     * @brief Records `timestamp` and returns the values to pack with it.
     *
     * If `timestamp` is not strictly greater than the last one recorded, the clock
     * sequence is incremented (wrapping at 2^16). `last_timestamp` becomes the larger
     * of the two. The clock sequence and node are seeded lazily on the first call.
     */
    ClockTick next(std::int64_t timestamp);

    /**
     * @brief Returns a freshly drawn node identifier with the multicast bit set.
     *
     * The process-wide node is left untouched.
     */
    std::uint64_t random_node();

    /**
     * @brief Builds the next v7 value for `millis` with `entropy` in bytes 6-15.
     *
     * With `clamp` set, `millis` is first raised to the largest implicit millisecond
     * seen so it never steps back with the wall clock. When the result shares its
     * millisecond with the greatest v7 value issued so far but does not sort after it,
     * that value's 74 random bits are incremented instead. Everything happens under
     * one lock, so a value returned to one caller always sorts before any value of the
     * same millisecond issued afterwards.
     *
     * All-zero and all-one bit patterns come back unstamped and unrecorded so the
     * caller can collapse them to the nil and max sentinels.
     */
    Bytes next_v7(std::int64_t millis, bool clamp, const V7Entropy& entropy);

    /// @brief Forgets all state; the next call reseeds. Intended for tests.
    void reset();

    std::int64_t last_timestamp() const;

    /// @brief The current clock sequence, seeding it if needed.
    std::uint16_t clock_seq();

    /// @brief The process-wide node, seeding it if needed.
    std::uint64_t node();

  private:
    void seed_locked();

    infra::RandomSource& random_;
    mutable std::mutex mutex_;

    bool seeded_ = false;
    std::int64_t last_timestamp_ = 0;
    std::uint16_t clock_seq_ = 0;
    std::uint64_t node_ = 0;

    std::optional<Uuid> max_v7_;
    std::int64_t last_v7_millis_ = 0;
};

} // namespace uuidkit::core
