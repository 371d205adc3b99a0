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
 * @file namespace.cpp
 * @brief Implementation of the namespace binding.
 */

#include "uuidkit/core/namespace.hpp"

#include "uuidkit/core/codec.hpp"
#include "uuidkit/core/error.hpp"
#include "uuidkit/core/hasher.hpp"
#include "uuidkit/infra/logger.hpp"

#include <mutex>
#include <utility>

namespace uuidkit::core {

NamespaceBinding::NamespaceBinding(DefaultSource source) : source_(std::move(source)) {}

Uuid NamespaceBinding::derive_default() const
{
    std::string name = source_ ? source_() : std::string(kFallbackName);
    Uuid url_ns = *Codec::decode(kNamespaceUrl);

    Uuid derived = NamespaceHasher::name_based(5, url_ns, name);
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Namespace: Derived default " + Codec::to_canonical(derived) + " from " + name);
    return derived;
}

Uuid NamespaceBinding::get()
{
    {
        std::shared_lock lock(mutex_);
        if (value_) {
            return *value_;
        }
    }

    // The default source is caller code; it runs without the lock held.
    Uuid derived = derive_default();

    std::unique_lock lock(mutex_);
    if (!value_) {
        value_ = derived;
    }
    return *value_;
}

std::string NamespaceBinding::get_string()
{
    return Codec::to_canonical(get());
}

void NamespaceBinding::set(const NamespaceInput& input)
{
    if (std::holds_alternative<ExplicitNamespace>(input)) {
        const std::string& text = std::get<ExplicitNamespace>(input).value;
        std::optional<Uuid> parsed = Codec::decode(text);
        if (!parsed) {
            throw UuidError(ErrorCode::InvalidNamespaceString,
                            "Invalid namespace UUID supplied: '" + text + "'");
        }

        std::unique_lock lock(mutex_);
        value_ = *parsed;
        return;
    }

    if (std::holds_alternative<ResetToDefault>(input)) {
        Uuid derived = derive_default();
        std::unique_lock lock(mutex_);
        value_ = derived;
        return;
    }

    // UseExistingOrDefault: only an unset namespace changes.
    get();
}

std::string NamespaceBinding::host_name_url(const std::string& host)
{
    return "file://" + host + "/";
}

} // namespace uuidkit::core
