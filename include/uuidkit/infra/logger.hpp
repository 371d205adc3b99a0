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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for UuidKit.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the library facade and the command-line tool. The generation core reports misuse
 * as classified issues; the facade decides which of them end up here.
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace uuidkit::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., clock sequence bumps).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events and notices (e.g., v2 domain fallbacks).
    WARN,  ///< Recoverable misuse that was replaced by a fallback value.
    ERROR, ///< Failed requests that did not stop the process.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are dropped. Messages that pass are
 * either handed to an installed sink, or written to the console with a timestamp
 * and an ANSI-colored severity tag.
 */
class Logger {
  public:
    /// @brief Receiver for log entries that replaces console output.
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /**
     * @brief Writes a diagnostic message.
     *
     * **Stream Routing Logic (console mode):**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * uuidkit::infra::Logger::log(LogLevel::WARN, "Unsupported UUID version requested: 9");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that is emitted. Defaults to `INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Installs a sink that receives every emitted entry instead of the console.
     *
     * Passing an empty function restores console output.
     */
    static void set_sink(Sink sink);

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * @throws std::invalid_argument if the name is not recognised.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards the console streams, the threshold and the sink.
    static std::mutex mutex_;

    static LogLevel level_;

    static Sink sink_;
};

} // namespace uuidkit::infra
