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
 * @file clock_state.cpp
 * @brief Implementation of the serialized clock bookkeeping.
 */

#include "uuidkit/core/clock_state.hpp"

#include "uuidkit/infra/logger.hpp"

#include <algorithm>
#include <string>

namespace uuidkit::core {

namespace {

std::int64_t v7_millis(const Bytes& bytes)
{
    std::int64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes[i];
    }
    return ms;
}

/**
 * Adds one to the 74 random bits of a v7 value: the low nibble of byte 6, byte 7,
 * the low six bits of byte 8 and bytes 9-15. Returns false on wrap-around.
 */
bool increment_v7_random(Bytes& bytes)
{
    for (int i = 15; i >= 9; --i) {
        if (++bytes[i] != 0) {
            return true;
        }
    }

    std::uint8_t low = bytes[8] & 0x3F;
    if (low != 0x3F) {
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0xC0) | (low + 1));
        return true;
    }
    bytes[8] &= 0xC0;

    if (++bytes[7] != 0) {
        return true;
    }

    std::uint8_t nibble = bytes[6] & 0x0F;
    if (nibble != 0x0F) {
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0xF0) | (nibble + 1));
        return true;
    }
    return false;
}

} // namespace

ClockState::ClockState(infra::RandomSource& random) : random_(random) {}

void ClockState::seed_locked()
{
    if (seeded_) {
        return;
    }

    // Per RFC 4122 section 4.5 a random node must carry the multicast bit so it
    // can never collide with a real IEEE 802 address.
    clock_seq_ = random_.next_u16();
    node_ = random_.next_u48() | kNodeMulticastBit;
    seeded_ = true;
}

ClockTick ClockState::next(std::int64_t timestamp)
{
    ClockTick tick{timestamp, 0, 0};
    bool repeated = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seed_locked();

        if (last_timestamp_ >= timestamp) {
            clock_seq_ = static_cast<std::uint16_t>(clock_seq_ + 1);
            repeated = true;
        }

        last_timestamp_ = std::max(last_timestamp_, timestamp);
        tick.clock_seq = clock_seq_;
        tick.node = node_;
    }

    if (repeated) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "Clock: Timestamp did not advance, clock sequence now " +
                               std::to_string(tick.clock_seq));
    }
    return tick;
}

std::uint64_t ClockState::random_node()
{
    return random_.next_u48() | kNodeMulticastBit;
}

Bytes ClockState::next_v7(std::int64_t millis, bool clamp, const V7Entropy& entropy)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (clamp) {
        millis = std::max(millis, last_v7_millis_);
        last_v7_millis_ = millis;
    }

    Bytes raw{};
    for (int i = 5; i >= 0; --i) {
        raw[i] = static_cast<std::uint8_t>(millis & 0xFF);
        millis >>= 8;
    }
    std::copy(entropy.begin(), entropy.end(), raw.begin() + 6);

    if (std::all_of(raw.begin(), raw.end(), [](std::uint8_t b) { return b == 0x00; }) ||
        std::all_of(raw.begin(), raw.end(), [](std::uint8_t b) { return b == 0xFF; })) {
        return raw;
    }

    raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | 0x70);
    raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);

    Uuid result(raw);
    if (max_v7_ && v7_millis(max_v7_->bytes()) == v7_millis(raw) && result <= *max_v7_) {
        Bytes bumped = max_v7_->bytes();
        if (increment_v7_random(bumped)) {
            result = Uuid(bumped);
        }
    }

    if (!max_v7_ || *max_v7_ < result) {
        max_v7_ = result;
    }
    return result.bytes();
}

void ClockState::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    seeded_ = false;
    last_timestamp_ = 0;
    clock_seq_ = 0;
    node_ = 0;
    max_v7_.reset();
    last_v7_millis_ = 0;
}

std::int64_t ClockState::last_timestamp() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_timestamp_;
}

std::uint16_t ClockState::clock_seq()
{
    std::lock_guard<std::mutex> lock(mutex_);
    seed_locked();
    return clock_seq_;
}

std::uint64_t ClockState::node()
{
    std::lock_guard<std::mutex> lock(mutex_);
    seed_locked();
    return node_;
}

} // namespace uuidkit::core
