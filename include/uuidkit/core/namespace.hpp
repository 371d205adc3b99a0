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
 * @file namespace.hpp
 * @brief The namespace UUID used by name-based generation when none is given.
 */

#pragma once

#include "uuidkit/core/uuid.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>

namespace uuidkit::core {

/// @brief Use this UUID string (any accepted form) as the namespace.
struct ExplicitNamespace {
    std::string value;
};

/// @brief Discard the current namespace and derive the default again.
struct ResetToDefault {};

/// @brief Keep the current namespace, deriving the default if none is set.
struct UseExistingOrDefault {};

using NamespaceInput = std::variant<UseExistingOrDefault, ExplicitNamespace, ResetToDefault>;

/**
 * @class NamespaceBinding
 * @brief Holds the process's namespace UUID behind a reader-writer lock.
 *
 * @details
 * Until a namespace is set explicitly, the binding lazily derives a default: the
 * version-5 UUID, under the predefined URL namespace, of the name produced by the
 * default source. Reads take a shared lock; setting and deriving take an exclusive one.
 */
class NamespaceBinding {
  public:
    /// @brief Produces the name (normally a URL) the default namespace is derived from.
    using DefaultSource = std::function<std::string()>;

    /// @brief Name used when no default source is configured.
    static constexpr const char* kFallbackName = "file://localhost/";

    explicit NamespaceBinding(DefaultSource source = {});

    NamespaceBinding(const NamespaceBinding&) = delete;
    NamespaceBinding& operator=(const NamespaceBinding&) = delete;

    /// @brief The current namespace, deriving the default on first use.
    Uuid get();

    /// @brief `get()` in canonical form.
    std::string get_string();

    /**
     * @brief Applies a namespace update.
     *
     * @throws UuidError (`InvalidNamespaceString`) if an explicit value is not a UUID.
     * The current namespace is left unchanged in that case.
     */
    void set(const NamespaceInput& input);

    /// @brief The default-source name for a host: `file://<host>/`.
    static std::string host_name_url(const std::string& host);

  private:
    Uuid derive_default() const;

    std::shared_mutex mutex_;
    std::optional<Uuid> value_;
    DefaultSource source_;
};

} // namespace uuidkit::core
