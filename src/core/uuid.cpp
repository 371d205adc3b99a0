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

#include "uuidkit/core/uuid.hpp"

#include "uuidkit/core/codec.hpp"

#include <algorithm>
#include <ostream>

namespace uuidkit::core {

Uuid Uuid::max()
{
    Bytes bytes;
    bytes.fill(0xFF);
    return Uuid(bytes);
}

bool Uuid::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0x00; });
}

bool Uuid::is_max() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0xFF; });
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << Codec::to_canonical(uuid);
}

} // namespace uuidkit::core
