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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates one invocation:
 * 1. Argument and environment parsing.
 * 2. Logger and namespace configuration.
 * 3. Execution of the selected mode (generate, parse or JSON service).
 */

#include "uuidkit/api.hpp"
#include "uuidkit/app/options.hpp"
#include "uuidkit/infra/logger.hpp"
#include "uuidkit/service/handler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Generates `opts.count` UUIDs and prints one per line.
 */
void run_generate(uuidkit::Context& context, const uuidkit::app::Options& opts)
{
    int version = opts.version.value_or(uuidkit::core::Generator::kDefaultVersion);
    uuidkit::core::Input input = uuidkit::service::Handler::make_input(
        version, opts.name, opts.time, opts.domain, opts.id, context.time());

    for (int i = 0; i < opts.count; ++i) {
        uuidkit::core::Uuid value = uuidkit::generate(context, opts.version, input);
        std::cout << uuidkit::service::Handler::render(value, opts.form) << '\n';
    }
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    try {
        // 1. Parse Command Line Arguments
        uuidkit::app::Options opts = uuidkit::app::parse_options(argc, argv);

        if (opts.help) {
            std::cout << uuidkit::app::usage(argv[0]);
            return 0;
        }

        // 2. Configure Subsystems
        if (opts.log_level) {
            uuidkit::infra::Logger::set_level(*opts.log_level);
        }

        uuidkit::Context& context = uuidkit::Context::process();

        if (opts.ns) {
            uuidkit::set_namespace(context, uuidkit::core::ExplicitNamespace{*opts.ns});
            uuidkit::infra::Logger::log(uuidkit::infra::LogLevel::DEBUG,
                                        "Config: Namespace set to " +
                                            uuidkit::get_namespace(context));
        }

        // 3. Execute
        if (opts.json) {
            uuidkit::infra::Logger::log(uuidkit::infra::LogLevel::DEBUG,
                                        "System: Serving JSON requests from stdin");
            uuidkit::service::Handler::serve(context, std::cin, std::cout);
        } else if (opts.parse) {
            uuidkit::core::Uuid value = uuidkit::parse(*opts.parse, opts.strict);
            std::cout << uuidkit::service::Handler::render(value, opts.form) << '\n';
        } else {
            run_generate(context, opts);
        }

    } catch (const std::exception& e) {
        uuidkit::infra::Logger::log(uuidkit::infra::LogLevel::FATAL,
                                    "System: Critical Failure: " + std::string(e.what()));
        return 1;
    } catch (...) {
        uuidkit::infra::Logger::log(uuidkit::infra::LogLevel::FATAL,
                                    "System: Unknown unhandled exception occurred.");
        return 1;
    }

    return 0;
}
