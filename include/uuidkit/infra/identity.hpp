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
 * @file identity.hpp
 * @brief Host-specific identity lookups.
 *
 * @details
 * DCE-security UUIDs (version 2) embed a local user, group or organization
 * identifier, and the default namespace is derived from the host name. Those
 * values live outside the generation core and are supplied through this interface.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace uuidkit::infra {

/**
 * @class IdentitySource
 * @brief Supplies the local identifiers of the running process.
 */
class IdentitySource {
  public:
    virtual ~IdentitySource() = default;

    /// @brief The identifier of the user running the process.
    virtual std::uint32_t user_id() const = 0;

    /// @brief The primary group identifier, when the platform exposes one.
    virtual std::optional<std::uint32_t> group_id() const = 0;

    /// @brief The host name, or `localhost` when it cannot be determined.
    virtual std::string host_name() const = 0;
};

/**
 * @class PosixIdentity
 * @brief `IdentitySource` backed by `getuid`, `getgid` and `gethostname`.
 */
class PosixIdentity : public IdentitySource {
  public:
    std::uint32_t user_id() const override;
    std::optional<std::uint32_t> group_id() const override;
    std::string host_name() const override;
};

/**
 * @class FixedIdentity
 * @brief `IdentitySource` returning preset values.
 */
class FixedIdentity : public IdentitySource {
  public:
    FixedIdentity(std::uint32_t uid, std::optional<std::uint32_t> gid,
                  std::string host = "localhost");

    std::uint32_t user_id() const override { return uid_; }
    std::optional<std::uint32_t> group_id() const override { return gid_; }
    std::string host_name() const override { return host_; }

  private:
    std::uint32_t uid_;
    std::optional<std::uint32_t> gid_;
    std::string host_;
};

} // namespace uuidkit::infra
