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
 * @file handler.cpp
 * @brief Implementation of the JSON request pipeline.
 *
 * @details
 * Each request goes through the same phases:
 * 1. **Ingest**: Parsing the raw JSON line.
 * 2. **Decode**: Extracting the `"action"` opcode and its typed arguments.
 * 3. **Execute**: Calling into the library facade.
 * 4. **Respond**: Formatting the result, or the failure, as a compact JSON object.
 */

#include "uuidkit/service/handler.hpp"

#include "uuidkit/core/codec.hpp"
#include "uuidkit/infra/logger.hpp"
#include "uuidkit/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <istream>
#include <limits>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace uuidkit::service {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

std::string serialize(const cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    if (!raw_output) {
        throw std::runtime_error("Failed to serialize JSON response");
    }
    std::string result(raw_output);
    free(raw_output);
    return result;
}

std::string error_response(const std::string& message)
{
    JsonPtr root(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(root.get(), "status", "error");
    cJSON_AddStringToObject(root.get(), "message", message.c_str());
    return serialize(root.get());
}

std::optional<std::string> string_field(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!item || cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw std::invalid_argument(std::string("Invalid argument: '") + key + "' must be a string");
    }
    return std::string(item->valuestring);
}

/// An integral number within [min, max]; fractions and out-of-range values are rejected.
std::optional<std::int64_t> integer_field(const cJSON* req, const char* key,
                                          std::int64_t min = std::numeric_limits<std::int64_t>::min(),
                                          std::int64_t max = std::numeric_limits<std::int64_t>::max())
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!item || cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsNumber(item)) {
        throw std::invalid_argument(std::string("Invalid argument: '") + key + "' must be a number");
    }

    // 2^63 is the first double outside the int64 range.
    const double number = item->valuedouble;
    if (!(number >= -9223372036854775808.0 && number < 9223372036854775808.0) ||
        std::trunc(number) != number) {
        throw std::invalid_argument(std::string("Value out of range for '") + key + "'");
    }

    const auto value = static_cast<std::int64_t>(number);
    if (value < min || value > max) {
        throw std::invalid_argument(std::string("Value out of range for '") + key + "'");
    }
    return value;
}

/// `integer_field` narrowed to `int`.
std::optional<int> int_field(const cJSON* req, const char* key)
{
    std::optional<std::int64_t> value = integer_field(req, key, std::numeric_limits<int>::min(),
                                                      std::numeric_limits<int>::max());
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

bool bool_field(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!item || cJSON_IsNull(item)) {
        return false;
    }
    if (!cJSON_IsBool(item)) {
        throw std::invalid_argument(std::string("Invalid argument: '") + key + "' must be a boolean");
    }
    return cJSON_IsTrue(item);
}

/// "time" may be date text or a number of epoch seconds.
std::optional<std::string> time_field(const cJSON* req)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, "time");
    if (item && cJSON_IsNumber(item)) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%.6f", item->valuedouble);
        return std::string(buffer);
    }
    return string_field(req, "time");
}

std::string require_uuid(const cJSON* req)
{
    std::optional<std::string> text = string_field(req, "uuid");
    if (!text) {
        throw std::invalid_argument("Missing argument: 'uuid'");
    }
    return *text;
}

void add_list(cJSON* resp, const char* key, const std::vector<std::string>& items)
{
    if (items.empty()) {
        return;
    }
    cJSON* array = cJSON_AddArrayToObject(resp, key);
    for (const auto& item : items) {
        cJSON_AddItemToArray(array, cJSON_CreateString(item.c_str()));
    }
}

void add_uuid_fields(cJSON* resp, const core::Uuid& value, Form form)
{
    cJSON_AddStringToObject(resp, "uuid", Handler::render(value, form).c_str());
    cJSON_AddNumberToObject(resp, "version", value.version());
    cJSON_AddStringToObject(resp, "short", core::Codec::to_compact(value).c_str());
    cJSON_AddStringToObject(resp, "binary", Handler::render(value, Form::Binary).c_str());
}

/// Logs a recoverable issue and records it for the response.
void collect(std::vector<std::string>& warnings, const std::optional<core::Issue>& issue)
{
    if (issue) {
        infra::Logger::log(infra::LogLevel::WARN, issue->detail);
        warnings.push_back(issue->detail);
    }
}

} // namespace

std::string Handler::process(Context& context, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response("Empty request payload");
    }

    JsonPtr req(cJSON_Parse(raw_json.c_str()), cJSON_Delete);
    if (!req) {
        return error_response("Invalid JSON syntax");
    }
    if (!cJSON_IsObject(req.get())) {
        return error_response("Request must be a JSON object");
    }

    JsonPtr resp(cJSON_CreateObject(), cJSON_Delete);
    std::vector<std::string> warnings;

    try {
        std::string action = string_field(req.get(), "action").value_or("");

        if (action == "generate") {
            std::optional<int> version = int_field(req.get(), "version");
            std::optional<std::string> form = string_field(req.get(), "form");

            core::Input input =
                make_input(version.value_or(core::Generator::kDefaultVersion),
                           string_field(req.get(), "name"), time_field(req.get()),
                           int_field(req.get(), "domain"), integer_field(req.get(), "id"),
                           context.time());

            core::Outcome outcome = generate_outcome(context, version, input);
            for (const auto& issue : outcome.issues) {
                warnings.push_back(issue.detail);
            }

            add_uuid_fields(resp.get(), outcome.value, form ? parse_form(*form) : Form::Canonical);
            add_list(resp.get(), "notices", outcome.notices);

        } else if (action == "parse") {
            std::string text = require_uuid(req.get());
            core::Parsed parsed = core::Codec::parse(text, bool_field(req.get(), "strict"));
            collect(warnings, parsed.issue);
            add_uuid_fields(resp.get(), parsed.value, Form::Canonical);

        } else if (action == "compress") {
            std::string text = require_uuid(req.get());
            bool to_short = bool_field(req.get(), "short");
            core::Converted converted = core::Codec::compress(text, to_short);
            collect(warnings, converted.issue);
            std::string rendered = to_short ? converted.text : infra::String::to_hex(converted.text);
            cJSON_AddStringToObject(resp.get(), "uuid", rendered.c_str());

        } else if (action == "expand") {
            core::Converted converted = core::Codec::expand(require_uuid(req.get()));
            collect(warnings, converted.issue);
            cJSON_AddStringToObject(resp.get(), "uuid", converted.text.c_str());

        } else if (action == "get_namespace") {
            cJSON_AddStringToObject(resp.get(), "namespace", get_namespace(context).c_str());

        } else if (action == "set_namespace") {
            const cJSON* ns = cJSON_GetObjectItemCaseSensitive(req.get(), "namespace");
            if (!ns || cJSON_IsNull(ns)) {
                set_namespace(context, core::UseExistingOrDefault{});
            } else if (cJSON_IsTrue(ns)) {
                set_namespace(context, core::ResetToDefault{});
            } else if (cJSON_IsString(ns) && ns->valuestring) {
                set_namespace(context, core::ExplicitNamespace{ns->valuestring});
            } else {
                return error_response("Invalid argument: 'namespace' must be a UUID string or true");
            }
            cJSON_AddStringToObject(resp.get(), "namespace", get_namespace(context).c_str());

        } else {
            return error_response("Unknown action opcode: " + action);
        }
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::DEBUG, std::string("Handler: Request failed: ") + e.what());
        return error_response(e.what());
    }

    add_list(resp.get(), "warnings", warnings);
    cJSON_AddStringToObject(resp.get(), "status", "ok");

    return serialize(resp.get());
}

std::size_t Handler::serve(Context& context, std::istream& in, std::ostream& out)
{
    std::size_t processed = 0;
    std::string line;

    while (std::getline(in, line)) {
        std::string request = infra::String::trim(line);
        if (request.empty()) {
            continue;
        }
        out << process(context, request) << std::endl;
        ++processed;
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Handler: Input closed after " + std::to_string(processed) + " requests");
    return processed;
}

core::Input Handler::make_input(int version, const std::optional<std::string>& name,
                                const std::optional<std::string>& time, std::optional<int> domain,
                                std::optional<std::int64_t> id, const core::TimestampSource& clock)
{
    // An unsupported version falls back to the default, which still gets the input.
    if (!core::Generator::is_supported(version)) {
        version = core::Generator::kDefaultVersion;
    }

    if (version == 2) {
        core::V2Params params;
        params.domain = domain.value_or(0);
        params.id = id;
        if (time) {
            params.timestamp = clock.resolve(*time);
        }
        return params;
    }

    if (core::Generator::is_hash_based(version) && name) {
        return core::Text{*name};
    }

    if (core::Generator::is_time_based(version) && time) {
        return core::DateText{*time};
    }

    return {};
}

std::string Handler::render(const core::Uuid& value, Form form)
{
    switch (form) {
    case Form::Binary:
        return infra::String::to_hex(core::Codec::to_binary(value));
    case Form::Short:
        return core::Codec::to_compact(value);
    case Form::Canonical:
    default:
        return core::Codec::to_canonical(value);
    }
}

Form Handler::parse_form(const std::string& name)
{
    std::string lowered = infra::String::to_lower(name);
    if (lowered == "canonical") {
        return Form::Canonical;
    }
    if (lowered == "binary") {
        return Form::Binary;
    }
    if (lowered == "short") {
        return Form::Short;
    }
    throw std::invalid_argument("Unknown output form: '" + name + "'");
}

} // namespace uuidkit::service
