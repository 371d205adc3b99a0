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
 * @file api_test.cpp
 * @brief Tests for the namespace binding and the public facade.
 */

#include "uuidkit/api.hpp"
#include "uuidkit/core/hasher.hpp"
#include "uuidkit/infra/logger.hpp"
#include "framework.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using uuidkit::infra::Logger;
using uuidkit::infra::LogLevel;

namespace {

/// A context with deterministic collaborators and a frozen clock.
std::unique_ptr<uuidkit::Context> make_context(uuidkit::core::NamespaceBinding::DefaultSource source = {})
{
    const uuidkit::core::Instant frozen{std::chrono::seconds(1700000000)};
    return std::make_unique<uuidkit::Context>(
        std::make_unique<uuidkit::infra::SeededRandom>(2026),
        std::make_unique<uuidkit::infra::FixedIdentity>(501, 20u, "unit-host"),
        [frozen]() { return frozen; }, std::move(source));
}

/**
 * @class LogCapture
 * @brief RAII sink that records every entry at or above INFO while in scope.
 */
class LogCapture {
  public:
    LogCapture() : previous_(Logger::level())
    {
        Logger::set_level(LogLevel::INFO);
        Logger::set_sink([this](LogLevel level, const std::string& message) {
            entries.emplace_back(level, message);
        });
    }

    ~LogCapture()
    {
        Logger::set_sink({});
        Logger::set_level(previous_);
    }

    std::size_t count(LogLevel level) const
    {
        std::size_t n = 0;
        for (const auto& entry : entries) {
            if (entry.first == level) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::pair<LogLevel, std::string>> entries;

  private:
    LogLevel previous_;
};

uuidkit::core::Uuid url_namespace_hash(const std::string& name)
{
    return uuidkit::core::NamespaceHasher::name_based(
        5, *uuidkit::core::Codec::decode(uuidkit::core::kNamespaceUrl), name);
}

} // namespace

/**
 * @brief The default namespace is derived lazily from the configured name source.
 */
void test_namespace_default_derivation()
{
    uuidkit::core::NamespaceBinding fallback;
    ASSERT_EQ(fallback.get(), url_namespace_hash("file://localhost/"));

    uuidkit::core::NamespaceBinding custom([] { return std::string("file://example.org/"); });
    ASSERT_EQ(custom.get(), url_namespace_hash("file://example.org/"));
    ASSERT_EQ(custom.get_string(), uuidkit::core::Codec::to_canonical(custom.get()));

    ASSERT_EQ(uuidkit::core::NamespaceBinding::host_name_url("build-01"), std::string("file://build-01/"));
}

/**
 * @brief Explicit values stick, invalid ones are rejected without side effects, and
 * a reset restores the default.
 */
void test_namespace_set_semantics()
{
    uuidkit::core::NamespaceBinding binding;
    const std::string dns(uuidkit::core::kNamespaceDns);

    binding.set(uuidkit::core::ExplicitNamespace{"{6BA7B810-9DAD-11D1-80B4-00C04FD430C8}"});
    ASSERT_EQ(binding.get_string(), dns);

    ASSERT_THROWS(uuidkit::core::UuidError, binding.set(uuidkit::core::ExplicitNamespace{"bogus"}));
    ASSERT_EQ(binding.get_string(), dns);

    binding.set(uuidkit::core::UseExistingOrDefault{});
    ASSERT_EQ(binding.get_string(), dns);

    binding.set(uuidkit::core::ResetToDefault{});
    ASSERT_EQ(binding.get(), url_namespace_hash("file://localhost/"));
}

/**
 * @brief A context derives its default namespace from the identity's host name.
 */
void test_context_wires_host_namespace()
{
    auto context = make_context();

    ASSERT_EQ(context->namespaces().get(), url_namespace_hash("file://unit-host/"));
    ASSERT_EQ(uuidkit::get_namespace(*context),
              uuidkit::core::Codec::to_canonical(url_namespace_hash("file://unit-host/")));

    auto overridden = make_context([] { return std::string("file://elsewhere/"); });
    ASSERT_EQ(overridden->namespaces().get(), url_namespace_hash("file://elsewhere/"));

    ASSERT_THROWS(std::invalid_argument,
                  uuidkit::Context(nullptr, std::make_unique<uuidkit::infra::FixedIdentity>(0, 0u)));
}

void test_api_generate_with_context()
{
    auto context = make_context();
    uuidkit::set_namespace(*context, uuidkit::core::ExplicitNamespace{std::string(uuidkit::core::kNamespaceDns)});

    uuidkit::core::Uuid v5 = uuidkit::generate(*context, 5, uuidkit::core::Text{"example.com"});
    ASSERT_EQ(uuidkit::to_canonical_string(v5), std::string("cfbff0d1-9375-5685-968c-48ce8b15ae17"));

    uuidkit::core::Uuid v7 = uuidkit::generate(*context);
    ASSERT_EQ(v7.version(), 7);

    uuidkit::core::Outcome v1 = uuidkit::generate_outcome(*context, 1);
    ASSERT_TRUE(v1.timestamp.has_value());
    ASSERT_EQ(v1.timestamp->time_since_epoch().count(),
              static_cast<std::int64_t>(1700000000LL * 1000000));
}

/**
 * @brief Recoverable issues surface as WARN entries; notices surface as INFO.
 */
void test_api_reports_issues_through_logger()
{
    auto context = make_context();
    LogCapture capture;

    uuidkit::core::Uuid fallback = uuidkit::generate(*context, 12);
    ASSERT_EQ(fallback.version(), 7);
    ASSERT_EQ(capture.count(LogLevel::WARN), static_cast<size_t>(1));

    uuidkit::core::Uuid nil = uuidkit::parse("definitely not a uuid");
    ASSERT_TRUE(nil.is_nil());
    ASSERT_EQ(capture.count(LogLevel::WARN), static_cast<size_t>(2));

    auto no_group = std::make_unique<uuidkit::Context>(
        std::make_unique<uuidkit::infra::SeededRandom>(5),
        std::make_unique<uuidkit::infra::FixedIdentity>(501, std::nullopt));
    uuidkit::generate(*no_group, 2, uuidkit::core::V2Params{1, std::nullopt, std::nullopt});
    ASSERT_EQ(capture.count(LogLevel::INFO), static_cast<size_t>(1));
}

void test_api_codec_functions()
{
    const std::string canonical(uuidkit::core::kNamespaceX500);
    uuidkit::core::Uuid value = uuidkit::parse(canonical, true);

    ASSERT_EQ(uuidkit::to_canonical_string(value), canonical);
    ASSERT_EQ(uuidkit::to_binary(value).size(), static_cast<size_t>(16));
    ASSERT_EQ(uuidkit::parse(uuidkit::to_compact_string(value)), value);

    ASSERT_EQ(uuidkit::expand(uuidkit::compress(canonical)), canonical);
    ASSERT_EQ(uuidkit::expand(uuidkit::compress(canonical, true)), canonical);

    ASSERT_THROWS(uuidkit::core::UuidError, uuidkit::parse("xyz", true));
}

/**
 * @brief The process-wide context is a single lazily built instance.
 */
void test_api_process_context()
{
    uuidkit::Context& first = uuidkit::Context::process();
    uuidkit::Context& second = uuidkit::Context::process();
    ASSERT_TRUE(&first == &second);

    uuidkit::core::Uuid a = uuidkit::generate();
    uuidkit::core::Uuid b = uuidkit::generate();
    ASSERT_EQ(a.version(), 7);
    ASSERT_TRUE(a < b);

    std::string before = uuidkit::get_namespace();
    uuidkit::set_namespace(uuidkit::core::ExplicitNamespace{std::string(uuidkit::core::kNamespaceOid)});
    ASSERT_EQ(uuidkit::get_namespace(), std::string(uuidkit::core::kNamespaceOid));
    uuidkit::set_namespace(uuidkit::core::ResetToDefault{});
    ASSERT_EQ(uuidkit::get_namespace(), before);
}

/**
 * @brief The default source runs outside the binding's lock, so it may touch the binding.
 */
void test_namespace_default_source_runs_unlocked()
{
    uuidkit::core::NamespaceBinding* self = nullptr;
    uuidkit::core::NamespaceBinding binding([&self] {
        self->set(uuidkit::core::ExplicitNamespace{std::string(uuidkit::core::kNamespaceOid)});
        return std::string("file://reentrant/");
    });
    self = &binding;

    // The value stored by the source wins over the derived default.
    ASSERT_EQ(binding.get_string(), std::string(uuidkit::core::kNamespaceOid));

    binding.set(uuidkit::core::ResetToDefault{});
    ASSERT_EQ(binding.get(), url_namespace_hash("file://reentrant/"));
}
