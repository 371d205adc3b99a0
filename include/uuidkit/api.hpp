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
 * @file api.hpp
 * @brief Public entry points of the UuidKit library.
 *
 * @details
 * This header ties the core components into a `Context` and exposes the library
 * surface as free functions. Functions without a `Context` argument operate on the
 * lazily created process-wide context.
 *
 * Recoverable issues reported by the core are logged here at `WARN` (notices at
 * `INFO`) and the substituted value is returned. Fatal conditions propagate as
 * `core::UuidError`.
 *
 * @code
 * auto id = uuidkit::generate();                                    // v7
 * auto dns = uuidkit::generate(5, uuidkit::core::Text{"example.com"});
 * std::string short_id = uuidkit::to_compact_string(id);            // 22 chars
 * auto back = uuidkit::parse(short_id);                             // == id
 * @endcode
 */

#pragma once

#include "uuidkit/core/clock_state.hpp"
#include "uuidkit/core/codec.hpp"
#include "uuidkit/core/generator.hpp"
#include "uuidkit/core/namespace.hpp"
#include "uuidkit/core/timestamp.hpp"
#include "uuidkit/core/uuid.hpp"
#include "uuidkit/infra/identity.hpp"
#include "uuidkit/infra/random.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace uuidkit {

/**
 * @class Context
 * @brief Owns one complete set of generation collaborators.
 */
class Context {
  public:
    /**
     * @brief Production wiring: OpenSSL randomness, POSIX identity, the system clock,
     * and a default namespace derived from `file://<hostname>/`.
     */
    Context();

    /**
     * @brief Custom wiring, typically for deterministic tests.
     *
     * @param random Entropy source (required).
     * @param identity Identity source (required).
     * @param clock Source of "now"; empty means the system clock.
     * @param default_namespace Name for the default namespace; empty means
     * `NamespaceBinding::kFallbackName`.
     */
    Context(std::unique_ptr<infra::RandomSource> random,
            std::unique_ptr<infra::IdentitySource> identity,
            core::TimestampSource::Clock clock = {},
            core::NamespaceBinding::DefaultSource default_namespace = {});

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /// @brief The process-wide context, created on first use.
    static Context& process();

    core::Generator& generator() { return generator_; }
    core::ClockState& clock() { return clock_; }
    core::NamespaceBinding& namespaces() { return namespaces_; }
    const core::TimestampSource& time() const { return time_; }

  private:
    std::unique_ptr<infra::RandomSource> random_;
    std::unique_ptr<infra::IdentitySource> identity_;
    core::TimestampSource time_;
    core::ClockState clock_;
    core::NamespaceBinding namespaces_;
    core::Generator generator_;
};

/// @brief Logs the issues and notices of an outcome.
void report(const core::Outcome& outcome);

/**
 * @brief Generates a UUID and returns the full outcome, after logging its issues.
 */
core::Outcome generate_outcome(Context& context, std::optional<int> version = std::nullopt,
                               const core::Input& input = {});

/// @brief Generates a UUID in `context`.
core::Uuid generate(Context& context, std::optional<int> version = std::nullopt,
                    const core::Input& input = {});

/// @brief Generates a UUID in the process-wide context.
core::Uuid generate(std::optional<int> version = std::nullopt, const core::Input& input = {});

/**
 * @brief Parses any UUID form.
 *
 * Invalid input yields the nil UUID and a warning, or throws `core::UuidError`
 * when `strict` is set.
 */
core::Uuid parse(std::string_view input, bool strict = false);

std::string to_canonical_string(const core::Uuid& value);
std::string to_binary(const core::Uuid& value);
std::string to_compact_string(const core::Uuid& value);

/// @brief Any form to binary (default) or compact.
std::string compress(std::string_view input, bool to_compact = false);

/// @brief Any form to canonical.
std::string expand(std::string_view input);

/// @brief The namespace used by v3/v5, in canonical form.
std::string get_namespace(Context& context);
std::string get_namespace();

/**
 * @brief Updates the namespace used by v3/v5.
 *
 * @throws core::UuidError (`InvalidNamespaceString`) for an invalid explicit value.
 */
void set_namespace(Context& context, const core::NamespaceInput& input = core::UseExistingOrDefault{});
void set_namespace(const core::NamespaceInput& input = core::UseExistingOrDefault{});

} // namespace uuidkit
