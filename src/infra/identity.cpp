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
 * @file identity.cpp
 * @brief POSIX implementation of the identity lookups.
 */

#include "uuidkit/infra/identity.hpp"

#include <climits>
#include <unistd.h>

namespace uuidkit::infra {

std::uint32_t PosixIdentity::user_id() const
{
    return static_cast<std::uint32_t>(::getuid());
}

std::optional<std::uint32_t> PosixIdentity::group_id() const
{
    return static_cast<std::uint32_t>(::getgid());
}

std::string PosixIdentity::host_name() const
{
#ifdef HOST_NAME_MAX
    char buf[HOST_NAME_MAX + 1] = {};
#else
    char buf[256] = {};
#endif
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    return std::string(buf);
}

FixedIdentity::FixedIdentity(std::uint32_t uid, std::optional<std::uint32_t> gid, std::string host)
    : uid_(uid), gid_(gid), host_(std::move(host))
{
}

} // namespace uuidkit::infra
