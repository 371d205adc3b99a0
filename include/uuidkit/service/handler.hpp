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
 * @file handler.hpp
 * @brief JSON request dispatcher for the line-oriented service mode.
 *
 * @details
 * This header declares the `Handler` class, which sits between a stream of JSON
 * requests and the library facade. It decodes the request, routes the `"action"`
 * to the matching facade call and serializes the result with cJSON.
 *
 * It also owns the small amount of presentation logic shared with the command line
 * tool: turning request fields into a generator `Input` and rendering a UUID in one
 * of the three output forms.
 */

#pragma once

#include "uuidkit/api.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace uuidkit::service {

/// @brief Output representation of a UUID.
enum class Form {
    Canonical, ///< 36-character hyphenated lower-case hex.
    Binary,    ///< 16 raw bytes, printed as 32 lower-case hex digits.
    Short,     ///< 22-character sortable compact form.
};

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Processes one raw JSON request against `context`.
     *
     * @return std::string A compact JSON response.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "uuid": "...", "version": 7, ...}`
     * - **Error:** `{"status": "error", "message": "<error_description>"}`
     *
     * @code
     * {"action": "generate", "version": 5, "name": "example.com", "form": "short"}
     * {"action": "parse", "uuid": "{CFBFF0D1-9375-5685-968C-48CE8B15AE17}", "strict": true}
     * {"action": "set_namespace", "namespace": true}
     * @endcode
     */
    static std::string process(Context& context, const std::string& raw_json);

    /**
     * @brief Answers every non-blank line of `in` with one response line on `out`.
     *
     * @return std::size_t The number of requests processed.
     */
    static std::size_t serve(Context& context, std::istream& in, std::ostream& out);

    /**
     * @brief Builds the generator input for `version` from loosely typed fields.
     *
     * v2 always receives `V2Params`; v3/v5 receive the name; v1/v6/v7 receive the
     * time text. An unsupported version is treated as the default version, so the
     * fallback still honours the caller's fields. Fields irrelevant to the version are
     * ignored.
     */
    static core::Input make_input(int version, const std::optional<std::string>& name,
                                  const std::optional<std::string>& time,
                                  std::optional<int> domain, std::optional<std::int64_t> id,
                                  const core::TimestampSource& clock);

    /// @brief Renders `value` in `form`; binary is rendered as hex.
    static std::string render(const core::Uuid& value, Form form);

    /**
     * @brief Parses `canonical`, `binary` or `short` (case-insensitive).
     * @throws std::invalid_argument for any other name.
     */
    static Form parse_form(const std::string& name);
};

} // namespace uuidkit::service
