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
 * @file api.cpp
 * @brief Implementation of the library facade and the process-wide context.
 */

#include "uuidkit/api.hpp"

#include "uuidkit/infra/logger.hpp"

#include <stdexcept>
#include <string>

namespace uuidkit {

namespace {

template <typename T>
std::unique_ptr<T> required(std::unique_ptr<T> component, const char* what)
{
    if (!component) {
        throw std::invalid_argument(std::string("Context: missing ") + what);
    }
    return component;
}

/// Reports a parse substitution, if any.
void report(const std::optional<core::Issue>& issue)
{
    if (issue) {
        infra::Logger::log(infra::LogLevel::WARN, issue->detail);
    }
}

} // namespace

Context::Context()
    : Context(std::make_unique<infra::SecureRandom>(), std::make_unique<infra::PosixIdentity>())
{
}

Context::Context(std::unique_ptr<infra::RandomSource> random,
                 std::unique_ptr<infra::IdentitySource> identity, core::TimestampSource::Clock clock,
                 core::NamespaceBinding::DefaultSource default_namespace)
    : random_(required(std::move(random), "random source")),
      identity_(required(std::move(identity), "identity source")),
      time_(std::move(clock)),
      clock_(*random_),
      namespaces_(default_namespace
                      ? std::move(default_namespace)
                      : core::NamespaceBinding::DefaultSource([id = identity_.get()]() {
                            return core::NamespaceBinding::host_name_url(id->host_name());
                        })),
      generator_(clock_, namespaces_, time_, *random_, *identity_)
{
}

Context& Context::process()
{
    static Context context;
    return context;
}

void report(const core::Outcome& outcome)
{
    for (const auto& issue : outcome.issues) {
        infra::Logger::log(infra::LogLevel::WARN, issue.detail);
    }
    for (const auto& notice : outcome.notices) {
        infra::Logger::log(infra::LogLevel::INFO, notice);
    }
}

core::Outcome generate_outcome(Context& context, std::optional<int> version, const core::Input& input)
{
    core::Outcome outcome = context.generator().generate(version, input);
    report(outcome);
    return outcome;
}

core::Uuid generate(Context& context, std::optional<int> version, const core::Input& input)
{
    return generate_outcome(context, version, input).value;
}

core::Uuid generate(std::optional<int> version, const core::Input& input)
{
    return generate(Context::process(), version, input);
}

core::Uuid parse(std::string_view input, bool strict)
{
    core::Parsed parsed = core::Codec::parse(input, strict);
    report(parsed.issue);
    return parsed.value;
}

std::string to_canonical_string(const core::Uuid& value)
{
    return core::Codec::to_canonical(value);
}

std::string to_binary(const core::Uuid& value)
{
    return core::Codec::to_binary(value);
}

std::string to_compact_string(const core::Uuid& value)
{
    return core::Codec::to_compact(value);
}

std::string compress(std::string_view input, bool to_compact)
{
    core::Converted converted = core::Codec::compress(input, to_compact);
    report(converted.issue);
    return converted.text;
}

std::string expand(std::string_view input)
{
    core::Converted converted = core::Codec::expand(input);
    report(converted.issue);
    return converted.text;
}

std::string get_namespace(Context& context)
{
    return context.namespaces().get_string();
}

std::string get_namespace()
{
    return get_namespace(Context::process());
}

void set_namespace(Context& context, const core::NamespaceInput& input)
{
    context.namespaces().set(input);
}

void set_namespace(const core::NamespaceInput& input)
{
    set_namespace(Context::process(), input);
}

} // namespace uuidkit
