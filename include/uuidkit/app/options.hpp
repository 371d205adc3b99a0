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
 * @file options.hpp
 * @brief Command line and environment configuration of the `uuidkit` tool.
 */

#pragma once

#include "uuidkit/infra/logger.hpp"
#include "uuidkit/service/handler.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace uuidkit::app {

/// @brief Environment variable holding the default namespace.
inline constexpr const char* kNamespaceEnv = "UUIDKIT_NAMESPACE";

/// @brief Environment variable holding the default log level.
inline constexpr const char* kLogLevelEnv = "UUIDKIT_LOG_LEVEL";

/**
 * @struct Options
 * @brief Resolved configuration of one `uuidkit` invocation.
 */
struct Options {
    bool help = false;

    std::optional<int> version;
    std::optional<std::string> name;
    std::optional<std::string> time;
    std::optional<int> domain;
    std::optional<std::int64_t> id;
    std::optional<std::string> ns;

    int count = 1;
    service::Form form = service::Form::Canonical;

    std::optional<std::string> parse;
    bool strict = false;
    bool json = false;

    std::optional<infra::LogLevel> log_level;
};

/// @brief Looks up an environment variable by name.
using Environment = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Parses `args` (without the program name), falling back to `env` for the
 * settings that have an environment variable.
 *
 * @throws std::invalid_argument for unknown flags, missing or malformed values.
 */
Options parse_options(const std::vector<std::string>& args, const Environment& env);

/// @brief Parses `argv` against the process environment.
Options parse_options(int argc, char* argv[]);

/// @brief The usage text printed by `--help`.
std::string usage(const std::string& binary_name);

} // namespace uuidkit::app
