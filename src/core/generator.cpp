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
 * @file generator.cpp
 * @brief Implementation of the per-version UUID generators.
 */

#include "uuidkit/core/generator.hpp"

#include "uuidkit/core/hasher.hpp"

#include <algorithm>

namespace uuidkit::core {

namespace {

/// Writes the low `width` bytes of `value` big-endian at `offset`.
void put_be(Bytes& bytes, std::size_t offset, std::uint64_t value, std::size_t width)
{
    for (std::size_t i = 0; i < width; ++i) {
        bytes[offset + width - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

/**
 * Final packing shared by every version: sentinel detection on the raw bits, then
 * the version nibble and the RFC 4122 variant.
 */
void finish(Outcome& out, Bytes raw, int version)
{
    if (std::all_of(raw.begin(), raw.end(), [](std::uint8_t b) { return b == 0x00; })) {
        out.value = Uuid::nil();
        out.version = kNilVersion;
        return;
    }
    if (std::all_of(raw.begin(), raw.end(), [](std::uint8_t b) { return b == 0xFF; })) {
        out.value = Uuid::max();
        out.version = kMaxVersion;
        return;
    }

    raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | (version << 4));
    raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);
    out.value = Uuid(raw);
    out.version = version;
}

} // namespace

Generator::Generator(ClockState& clock, NamespaceBinding& ns, const TimestampSource& time,
                     infra::RandomSource& random, const infra::IdentitySource& identity)
    : clock_(clock), ns_(ns), time_(time), random_(random), identity_(identity)
{
}

bool Generator::is_supported(int version)
{
    return (version >= 0 && version <= 7) || version == kMaxVersion;
}

bool Generator::is_time_based(int version)
{
    return version == 1 || version == 2 || version == 6 || version == 7;
}

bool Generator::is_hash_based(int version)
{
    return version == 3 || version == 5;
}

std::optional<Instant> Generator::explicit_time(const Input& input) const
{
    if (auto instant = std::get_if<Instant>(&input)) {
        return *instant;
    }
    if (auto date = std::get_if<DateText>(&input)) {
        return time_.resolve(date->value);
    }
    if (auto text = std::get_if<Text>(&input)) {
        return time_.resolve(text->value);
    }
    if (auto params = std::get_if<V2Params>(&input)) {
        return params->timestamp;
    }
    return std::nullopt;
}

std::optional<std::string> Generator::hash_name(const Input& input) const
{
    if (auto text = std::get_if<Text>(&input)) {
        return text->value;
    }
    if (auto date = std::get_if<DateText>(&input)) {
        return date->value;
    }
    return std::nullopt;
}

Outcome Generator::generate(std::optional<int> version, const Input& input)
{
    Outcome out;
    int requested = version.value_or(kDefaultVersion);

    if (!is_supported(requested)) {
        out.issues.push_back({ErrorCode::UnsupportedVersion,
                              "Unsupported UUID version requested: " + std::to_string(requested)});
        requested = kDefaultVersion;
    }

    switch (requested) {
    case 1:
    case 6:
        generate_gregorian(out, requested, input);
        break;

    case 2:
        generate_v2(out, input);
        break;

    case 3:
    case 5: {
        std::optional<std::string> name = hash_name(input);
        if (!name) {
            out.issues.push_back({ErrorCode::MissingHashInput,
                                  "UUIDv" + std::to_string(requested) +
                                      " requires string input, but none was provided"});
            out.value = Uuid::nil();
            out.version = kNilVersion;
            break;
        }
        finish(out, NamespaceHasher::digest(requested, ns_.get(), *name), requested);
        break;
    }

    case 4: {
        Bytes raw;
        random_.fill(raw.data(), raw.size());
        finish(out, raw, 4);
        break;
    }

    case 7:
        generate_v7(out, input);
        break;

    case kMaxVersion:
        out.value = Uuid::max();
        out.version = kMaxVersion;
        break;

    default:
        out.value = Uuid::nil();
        out.version = kNilVersion;
        break;
    }

    return out;
}

void Generator::substitute_out_of_range(Outcome& out, int version, const AdjustedTimestamp& adjusted)
{
    out.issues.push_back({ErrorCode::TimestampOutOfRange,
                          "Timestamp out of range for UUIDv" + std::to_string(version) + ": " +
                              std::to_string(adjusted.ticks)});

    if (adjusted.range == TimestampRange::TooEarly) {
        out.value = Uuid::nil();
        out.version = kNilVersion;
    } else {
        out.value = Uuid::max();
        out.version = kMaxVersion;
    }
}

/**
 * Versions 1 and 6 share the Gregorian timestamp, clock sequence and node; they
 * differ only in the order the timestamp bits are laid out.
 */
void Generator::generate_gregorian(Outcome& out, int version, const Input& input)
{
    Instant instant = explicit_time(input).value_or(time_.now());
    out.timestamp = instant;

    AdjustedTimestamp adjusted = TimestampSource::adjust(instant, version);

    // Clock bookkeeping happens before the range check, as with in-range values.
    ClockTick tick = clock_.next(adjusted.ticks);

    if (!adjusted.in_range()) {
        substitute_out_of_range(out, version, adjusted);
        return;
    }

    const auto t = static_cast<std::uint64_t>(tick.timestamp);
    Bytes raw{};

    if (version == 1) {
        put_be(raw, 0, t & 0xFFFFFFFF, 4);         // time_low
        put_be(raw, 4, (t >> 32) & 0xFFFF, 2);     // time_mid
        put_be(raw, 6, (t >> 48) & 0x0FFF, 2);     // time_high
    } else {
        put_be(raw, 0, t >> 12, 6);                // top 48 bits
        put_be(raw, 6, t & 0x0FFF, 2);             // low 12 bits
    }

    put_be(raw, 8, tick.clock_seq, 2);
    put_be(raw, 10, tick.node, 6);

    finish(out, raw, version);
}

void Generator::generate_v2(Outcome& out, const Input& input)
{
    V2Params params;
    if (auto given = std::get_if<V2Params>(&input)) {
        params = *given;
    } else {
        params.timestamp = explicit_time(input);
    }

    if (params.domain < 0) {
        out.issues.push_back({ErrorCode::InvalidV2Domain,
                              "Invalid UUIDv2 domain: " + std::to_string(params.domain)});
        out.value = Uuid::nil();
        out.version = kNilVersion;
        return;
    }

    Instant instant = params.timestamp.value_or(time_.now());
    out.timestamp = instant;

    AdjustedTimestamp adjusted = TimestampSource::adjust(instant, 2);
    ClockTick tick = clock_.next(adjusted.ticks);

    if (!adjusted.in_range()) {
        substitute_out_of_range(out, 2, adjusted);
        return;
    }

    int domain = params.domain;
    std::uint32_t local_id = 0;

    if (params.id) {
        local_id = static_cast<std::uint32_t>(*params.id & 0xFFFFFFFF);
    } else {
        switch (domain) {
        case 0:
            local_id = identity_.user_id();
            break;

        case 1:
            if (auto gid = identity_.group_id()) {
                local_id = *gid;
            } else {
                out.notices.push_back("Automatic group domain is unavailable for UUIDv2; "
                                      "falling back to user domain");
                local_id = identity_.user_id();
                domain = 0;
            }
            break;

        case 2: {
            const Bytes& ns = ns_.get().bytes();
            local_id = (static_cast<std::uint32_t>(ns[0]) << 24) |
                       (static_cast<std::uint32_t>(ns[1]) << 16) |
                       (static_cast<std::uint32_t>(ns[2]) << 8) | ns[3];
            break;
        }

        default:
            throw UuidError(ErrorCode::UnknownV2Domain,
                            "Cannot generate automatic UUIDv2 for unknown domain: " +
                                std::to_string(domain));
        }
    }

    const auto t = static_cast<std::uint64_t>(tick.timestamp);
    Bytes raw{};

    put_be(raw, 0, local_id, 4);
    put_be(raw, 4, (t >> 32) & 0xFFFF, 2);
    put_be(raw, 6, (t >> 48) & 0x0FFF, 2);
    raw[8] = static_cast<std::uint8_t>(tick.clock_seq >> 8);
    raw[9] = static_cast<std::uint8_t>(domain & 0xFF);

    // Unlike v1/v6, every v2 value carries a freshly drawn node.
    put_be(raw, 10, clock_.random_node(), 6);

    finish(out, raw, 2);
}

void Generator::generate_v7(Outcome& out, const Input& input)
{
    std::optional<Instant> given = explicit_time(input);
    Instant instant = given.value_or(time_.now());
    out.timestamp = instant;

    AdjustedTimestamp adjusted = TimestampSource::adjust(instant, 7);
    if (!adjusted.in_range()) {
        substitute_out_of_range(out, 7, adjusted);
        return;
    }

    V7Entropy entropy;
    random_.fill(entropy.data(), entropy.size());

    finish(out, clock_.next_v7(adjusted.ticks, !given, entropy), 7);
}

} // namespace uuidkit::core
