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
 * @file options_test.cpp
 * @brief Tests for command line parsing and environment fallbacks.
 */

#include "uuidkit/app/options.hpp"
#include "framework.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using uuidkit::app::Options;
using uuidkit::app::parse_options;

namespace {

uuidkit::app::Environment fake_env(std::map<std::string, std::string> vars)
{
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

void test_options_defaults()
{
    Options opts = parse_options({}, fake_env({}));

    ASSERT_FALSE(opts.help);
    ASSERT_FALSE(opts.version.has_value());
    ASSERT_EQ(opts.count, 1);
    ASSERT_TRUE(opts.form == uuidkit::service::Form::Canonical);
    ASSERT_FALSE(opts.ns.has_value());
    ASSERT_FALSE(opts.json);
    ASSERT_FALSE(opts.log_level.has_value());
}

void test_options_full_command_line()
{
    Options opts = parse_options({"-v", "2", "--domain", "1", "--id", "4294967296", "-t",
                                  "2024-01-01", "-c", "3", "-f", "SHORT", "--log-level", "debug"},
                                 fake_env({}));

    ASSERT_EQ(*opts.version, 2);
    ASSERT_EQ(*opts.domain, 1);
    ASSERT_EQ(*opts.id, static_cast<std::int64_t>(4294967296LL));
    ASSERT_EQ(*opts.time, std::string("2024-01-01"));
    ASSERT_EQ(opts.count, 3);
    ASSERT_TRUE(opts.form == uuidkit::service::Form::Short);
    ASSERT_TRUE(*opts.log_level == uuidkit::infra::LogLevel::DEBUG);

    Options parse = parse_options({"--parse", "abc", "--strict", "--name", "x"}, fake_env({}));
    ASSERT_EQ(*parse.parse, std::string("abc"));
    ASSERT_TRUE(parse.strict);
    ASSERT_EQ(*parse.name, std::string("x"));

    ASSERT_TRUE(parse_options({"--help"}, fake_env({})).help);
    ASSERT_TRUE(parse_options({"--json"}, fake_env({})).json);
}

/**
 * @brief Environment variables seed defaults that flags override.
 */
void test_options_environment_fallback()
{
    auto env = fake_env({{"UUIDKIT_NAMESPACE", "6ba7b811-9dad-11d1-80b4-00c04fd430c8"},
                         {"UUIDKIT_LOG_LEVEL", "error"}});

    Options from_env = parse_options({}, env);
    ASSERT_EQ(*from_env.ns, std::string("6ba7b811-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_TRUE(*from_env.log_level == uuidkit::infra::LogLevel::ERROR);

    Options overridden = parse_options({"--namespace", "other", "--log-level", "trace"}, env);
    ASSERT_EQ(*overridden.ns, std::string("other"));
    ASSERT_TRUE(*overridden.log_level == uuidkit::infra::LogLevel::TRACE);

    ASSERT_THROWS(std::invalid_argument, parse_options({}, fake_env({{"UUIDKIT_LOG_LEVEL", "loud"}})));
}

void test_options_rejects_malformed()
{
    auto env = fake_env({});

    ASSERT_THROWS(std::invalid_argument, parse_options({"--bogus"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"-v"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"-v", "seven"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"-v", "7x"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"-c", "0"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"-f", "hex"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"--domain", "99999999999"}, env));
    ASSERT_THROWS(std::invalid_argument, parse_options({"--json", "--parse", "x"}, env));
}
