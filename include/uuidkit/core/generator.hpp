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
 * @file generator.hpp
 * @brief Version dispatch and field packing for UUID versions 0-7 and 15.
 *
 * @details
 * This header declares the `Generator` class and the `Input` variant it consumes.
 * The generator composes the collaborators it is given (clock state, timestamp
 * source, namespace binding, random and identity sources) and never reaches for
 * global state itself.
 *
 * **Field layouts (big-endian, before the version nibble and variant are applied):**
 * - v1: time_low(32) | time_mid(16) | time_high(12) | clock_seq(16) | node(48)
 * - v2: local_id(32) | time_mid(16) | time_high(12) | clock_seq_hi(8) | domain(8) | node(48)
 * - v3/v5: first 128 bits of MD5/SHA-1 over namespace || name
 * - v4: 122 random bits
 * - v6: timestamp(60, most significant first) | clock_seq(16) | node(48)
 * - v7: unix_ms(48) | random(74)
 */

#pragma once

#include "uuidkit/core/clock_state.hpp"
#include "uuidkit/core/error.hpp"
#include "uuidkit/core/namespace.hpp"
#include "uuidkit/core/timestamp.hpp"
#include "uuidkit/core/uuid.hpp"
#include "uuidkit/infra/identity.hpp"
#include "uuidkit/infra/random.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace uuidkit::core {

/// @brief A name to hash (versions 3 and 5).
struct Text {
    std::string value;
};

/// @brief A date-like string, resolved best-effort (versions 1, 6 and 7).
struct DateText {
    std::string value;
};

/**
 * @struct V2Params
 * @brief Parameters of a DCE-security UUID.
 *
 * Domains 0, 1 and 2 are the POSIX user, group and organization domains. Without an
 * explicit `id` only those three can be filled in automatically.
 */
struct V2Params {
    int domain = 0;
    std::optional<std::int64_t> id;
    std::optional<Instant> timestamp;
};

/**
 * @brief Generator input; which alternative is meaningful depends on the version.
 */
using Input = std::variant<std::monostate, Text, Instant, DateText, V2Params>;

/**
 * @struct Outcome
 * @brief A generated UUID and how it was arrived at.
 */
struct Outcome {
    Uuid value;

    /// @brief Effective version: 0 or 15 when a sentinel was substituted.
    int version = kNilVersion;

    /// @brief The resolved instant, for time-based versions only.
    std::optional<Instant> timestamp;

    /// @brief Recoverable conditions that were handled by substitution.
    std::vector<Issue> issues;

    /// @brief Informational fallbacks that did not change the outcome's validity.
    std::vector<std::string> notices;

    bool ok() const { return issues.empty(); }
};

/**
 * @class Generator
 * @brief Produces UUIDs of every supported version.
 */
class Generator {
  public:
    static constexpr int kDefaultVersion = 7;

    /**
     * @brief Wires the generator to its collaborators.
     *
     * All references must outlive the generator.
     */
    Generator(ClockState& clock, NamespaceBinding& ns, const TimestampSource& time,
              infra::RandomSource& random, const infra::IdentitySource& identity);

    /**
     * @brief Generates a UUID.
     *
     * @param version Requested version; `std::nullopt` selects `kDefaultVersion`.
     * Unsupported versions fall back to the default with an `UnsupportedVersion` issue.
     * @param input Version-specific input.
     *
     * @throws UuidError (`UnknownV2Domain`) for a v2 request with no `id` and a domain
     * outside 0-2.
     * @throws std::runtime_error if the random source fails.
     */
    Outcome generate(std::optional<int> version = std::nullopt, const Input& input = {});

    /// @brief True for 0-7 and 15.
    static bool is_supported(int version);

    /// @brief True for 1, 2, 6 and 7.
    static bool is_time_based(int version);

    /// @brief True for 3 and 5.
    static bool is_hash_based(int version);

  private:
    std::optional<Instant> explicit_time(const Input& input) const;
    std::optional<std::string> hash_name(const Input& input) const;

    void generate_gregorian(Outcome& out, int version, const Input& input);
    void generate_v2(Outcome& out, const Input& input);
    void generate_v7(Outcome& out, const Input& input);

    static void substitute_out_of_range(Outcome& out, int version, const AdjustedTimestamp& adjusted);

    ClockState& clock_;
    NamespaceBinding& ns_;
    const TimestampSource& time_;
    infra::RandomSource& random_;
    const infra::IdentitySource& identity_;
};

} // namespace uuidkit::core
