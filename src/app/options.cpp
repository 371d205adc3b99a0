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
 * @file options.cpp
 * @brief Implementation of the command line parser.
 */

#include "uuidkit/app/options.hpp"

#include "uuidkit/infra/string.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace uuidkit::app {

namespace {

std::int64_t parse_integer(const std::string& flag, const std::string& text)
{
    std::string trimmed = infra::String::trim(text);
    std::int64_t value = 0;

    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (trimmed.empty() || ec != std::errc() || ptr != last) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + text + "'");
    }
    return value;
}

int parse_int(const std::string& flag, const std::string& text)
{
    std::int64_t value = parse_integer(flag, text);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Value out of range for " + flag + ": '" + text + "'");
    }
    return static_cast<int>(value);
}

} // namespace

Options parse_options(const std::vector<std::string>& args, const Environment& env)
{
    Options opts;

    if (env) {
        opts.ns = env(kNamespaceEnv);
        if (auto level = env(kLogLevelEnv)) {
            opts.log_level = infra::Logger::parse_level(*level);
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.version = parse_int(arg, value());
        } else if (arg == "-n" || arg == "--name") {
            opts.name = value();
        } else if (arg == "-t" || arg == "--time") {
            opts.time = value();
        } else if (arg == "--domain") {
            opts.domain = parse_int(arg, value());
        } else if (arg == "--id") {
            opts.id = parse_integer(arg, value());
        } else if (arg == "--namespace") {
            opts.ns = value();
        } else if (arg == "-c" || arg == "--count") {
            opts.count = parse_int(arg, value());
            if (opts.count < 1) {
                throw std::invalid_argument("--count must be at least 1");
            }
        } else if (arg == "-f" || arg == "--form") {
            opts.form = service::Handler::parse_form(value());
        } else if (arg == "--parse") {
            opts.parse = value();
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--log-level") {
            opts.log_level = infra::Logger::parse_level(value());
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (opts.json && opts.parse) {
        throw std::invalid_argument("--json and --parse are mutually exclusive");
    }

    return opts;
}

Options parse_options(int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return parse_options(args, [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    });
}

std::string usage(const std::string& binary_name)
{
    std::ostringstream out;
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  -v, --version N     UUID version: 0-7 or 15 (Default: 7)\n"
        << "  -n, --name TEXT     Name to hash for versions 3 and 5\n"
        << "  -t, --time TEXT     Timestamp for versions 1, 2, 6 and 7 (epoch seconds or ISO-8601)\n"
        << "      --domain N      DCE domain for version 2 (Default: 0)\n"
        << "      --id N          Local identifier for version 2\n"
        << "      --namespace U   Namespace UUID for versions 3 and 5 (env: " << kNamespaceEnv
        << ")\n"
        << "  -c, --count N       Number of UUIDs to generate (Default: 1)\n"
        << "  -f, --form F        Output form: canonical, binary or short (Default: canonical)\n"
        << "      --parse TEXT    Parse an existing UUID in any form and print it\n"
        << "      --strict        Fail instead of substituting nil for invalid --parse input\n"
        << "      --json          Serve JSON requests, one per line, from stdin\n"
        << "      --log-level L   trace, debug, info, warn, error or fatal (env: " << kLogLevelEnv
        << ")\n"
        << "  -h, --help          Show this help message\n";
    return out.str();
}

} // namespace uuidkit::app
