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
 * @file clock_test.cpp
 * @brief Tests for timestamp resolution, range adjustment and the shared clock state.
 */

#include "uuidkit/core/clock_state.hpp"
#include "uuidkit/core/timestamp.hpp"
#include "uuidkit/infra/random.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>

using uuidkit::core::AdjustedTimestamp;
using uuidkit::core::Bytes;
using uuidkit::core::ClockState;
using uuidkit::core::Instant;
using uuidkit::core::TimestampRange;
using uuidkit::core::TimestampSource;
using uuidkit::core::Uuid;
using uuidkit::core::V7Entropy;

namespace {

Instant from_seconds(std::int64_t seconds)
{
    return Instant(std::chrono::seconds(seconds));
}

std::int64_t micros_of(const Instant& instant)
{
    return instant.time_since_epoch().count();
}

V7Entropy entropy_of(std::uint8_t byte)
{
    V7Entropy entropy;
    entropy.fill(byte);
    return entropy;
}

std::int64_t millis_of(const Bytes& bytes)
{
    std::int64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes[i];
    }
    return ms;
}

} // namespace

/**
 * @brief Epoch seconds, ISO-8601 with offsets and the `now` keyword.
 */
void test_timestamp_parse_formats()
{
    const std::int64_t jan_2024 = 1704067200LL * 1000000;

    ASSERT_EQ(micros_of(*TimestampSource::parse("1704067200")), jan_2024);
    ASSERT_EQ(micros_of(*TimestampSource::parse("@1704067200.25")), jan_2024 + 250000);
    ASSERT_EQ(micros_of(*TimestampSource::parse("-1.5")), static_cast<std::int64_t>(-1500000));

    ASSERT_EQ(micros_of(*TimestampSource::parse("2024-01-01")), jan_2024);
    ASSERT_EQ(micros_of(*TimestampSource::parse("2024-01-01T00:00:00Z")), jan_2024);
    ASSERT_EQ(micros_of(*TimestampSource::parse("2024-01-01 02:00:00+02:00")), jan_2024);
    ASSERT_EQ(micros_of(*TimestampSource::parse("2023-12-31T19:00:00.5-05:00")), jan_2024 + 500000);
    ASSERT_EQ(micros_of(*TimestampSource::parse("1582-10-15T00:00:00Z")),
              -TimestampSource::kGregorianOffsetSeconds * 1000000);

    ASSERT_FALSE(TimestampSource::parse("now").has_value());
    ASSERT_FALSE(TimestampSource::parse("").has_value());
    ASSERT_FALSE(TimestampSource::parse("2023-02-29").has_value());
    ASSERT_FALSE(TimestampSource::parse("2024-13-01").has_value());
    ASSERT_FALSE(TimestampSource::parse("yesterday").has_value());
}

/**
 * @brief Unreadable text resolves to the injected "now" without raising.
 */
void test_timestamp_resolve_falls_back_to_now()
{
    const Instant frozen = from_seconds(1700000000);
    TimestampSource source([frozen]() { return frozen; });

    ASSERT_EQ(micros_of(source.resolve("next tuesday")), micros_of(frozen));
    ASSERT_EQ(micros_of(source.resolve("now")), micros_of(frozen));
    ASSERT_EQ(micros_of(source.resolve("0")), static_cast<std::int64_t>(0));
}

/**
 * @brief Range boundaries of the Gregorian (v1/v2/v6) and Unix millisecond (v7) encodings.
 */
void test_timestamp_adjust_ranges()
{
    AdjustedTimestamp epoch_v1 = TimestampSource::adjust(from_seconds(0), 1);
    ASSERT_EQ(epoch_v1.ticks, static_cast<std::int64_t>(122192928000000000LL));
    ASSERT_TRUE(epoch_v1.in_range());

    Instant reform = from_seconds(-TimestampSource::kGregorianOffsetSeconds);
    ASSERT_EQ(TimestampSource::adjust(reform, 6).ticks, static_cast<std::int64_t>(0));
    ASSERT_TRUE(TimestampSource::adjust(reform, 6).in_range());
    ASSERT_TRUE(TimestampSource::adjust(reform - std::chrono::microseconds(1), 6).range ==
                TimestampRange::TooEarly);

    Instant far_future(std::chrono::microseconds(std::numeric_limits<std::int64_t>::max()));
    AdjustedTimestamp saturated = TimestampSource::adjust(far_future, 1);
    ASSERT_TRUE(saturated.range == TimestampRange::TooLate);

    ASSERT_EQ(TimestampSource::adjust(from_seconds(0), 7).ticks, static_cast<std::int64_t>(0));
    ASSERT_TRUE(TimestampSource::adjust(Instant(std::chrono::milliseconds(-1)), 7).range ==
                TimestampRange::TooEarly);

    Instant last_ms(std::chrono::milliseconds(TimestampSource::kMaxUnixMillis));
    ASSERT_TRUE(TimestampSource::adjust(last_ms, 7).in_range());
    ASSERT_TRUE(TimestampSource::adjust(last_ms + std::chrono::milliseconds(1), 7).range ==
                TimestampRange::TooLate);

    ASSERT_THROWS(std::invalid_argument, TimestampSource::adjust(from_seconds(0), 4));
}

/**
 * @brief The clock sequence bumps whenever the timestamp fails to advance.
 */
void test_clock_sequence_bumps_on_repeat()
{
    uuidkit::infra::SeededRandom random(7);
    ClockState clock(random);

    auto first = clock.next(1000);
    auto repeat = clock.next(1000);
    auto earlier = clock.next(500);
    auto later = clock.next(2000);

    ASSERT_EQ(repeat.clock_seq, static_cast<std::uint16_t>(first.clock_seq + 1));
    ASSERT_EQ(earlier.clock_seq, static_cast<std::uint16_t>(first.clock_seq + 2));
    ASSERT_EQ(later.clock_seq, earlier.clock_seq);
    ASSERT_EQ(clock.last_timestamp(), static_cast<std::int64_t>(2000));

    // The node is stable and carries the multicast bit.
    ASSERT_EQ(first.node, later.node);
    ASSERT_TRUE((first.node & uuidkit::core::kNodeMulticastBit) != 0);
    ASSERT_TRUE(first.node < (1ULL << 48));
}

void test_clock_reset_reseeds()
{
    uuidkit::infra::SeededRandom random(99);
    ClockState clock(random);

    clock.next(10);
    std::uint64_t node = clock.node();
    clock.reset();

    ASSERT_EQ(clock.last_timestamp(), static_cast<std::int64_t>(0));
    ASSERT_NE(clock.node(), node);
}

void test_clock_v7_millis_never_regress()
{
    uuidkit::infra::SeededRandom random(1);
    ClockState clock(random);

    ASSERT_EQ(millis_of(clock.next_v7(100, true, entropy_of(0x11))), static_cast<std::int64_t>(100));
    ASSERT_EQ(millis_of(clock.next_v7(90, true, entropy_of(0x22))), static_cast<std::int64_t>(100));
    ASSERT_EQ(millis_of(clock.next_v7(101, true, entropy_of(0x33))), static_cast<std::int64_t>(101));

    // Explicit instants are used as given.
    ASSERT_EQ(millis_of(clock.next_v7(50, false, entropy_of(0x44))), static_cast<std::int64_t>(50));
}

/**
 * @brief Each v7 value sorts after the greatest one issued in its millisecond.
 *
 * A caller that read the clock before a faster caller finished must not pull the
 * ordering reference back to its older millisecond.
 */
void test_clock_v7_orders_after_greatest_issued()
{
    uuidkit::infra::SeededRandom random(1);
    ClockState clock(random);

    Uuid fast(clock.next_v7(101, true, entropy_of(0xF0)));
    Uuid slow(clock.next_v7(100, true, entropy_of(0x00)));
    ASSERT_EQ(millis_of(slow.bytes()), static_cast<std::int64_t>(101));
    ASSERT_TRUE(fast < slow);

    // An explicit earlier instant neither moves nor replaces the reference.
    Uuid early(clock.next_v7(100, false, entropy_of(0xFF)));
    ASSERT_TRUE(early < fast);

    Uuid later(clock.next_v7(101, true, entropy_of(0x00)));
    ASSERT_TRUE(slow < later);
    ASSERT_EQ(later.version(), 7);
    ASSERT_EQ(later.variant(), 2);
}

void test_clock_v7_sentinel_bits_stay_raw()
{
    uuidkit::infra::SeededRandom random(1);
    ClockState clock(random);

    Bytes zero = clock.next_v7(0, false, entropy_of(0x00));
    ASSERT_TRUE(Uuid(zero).is_nil());
}
