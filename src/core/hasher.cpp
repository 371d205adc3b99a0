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
 * @file hasher.cpp
 * @brief OpenSSL EVP implementation of the namespace digests.
 */

#include "uuidkit/core/hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace uuidkit::core {

Bytes NamespaceHasher::digest(int version, const Uuid& ns, std::string_view name)
{
    const EVP_MD* md = nullptr;
    switch (version) {
    case 3:
        md = EVP_md5();
        break;
    case 5:
        md = EVP_sha1();
        break;
    default:
        throw std::invalid_argument("No namespace digest for UUID version " + std::to_string(version));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Digest: Failed to allocate EVP context");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), ns.bytes().data(), ns.bytes().size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1 || out_len < 16) {
        throw std::runtime_error("Digest: EVP computation failed");
    }

    Bytes bytes;
    std::copy(out, out + bytes.size(), bytes.begin());
    return bytes;
}

Uuid NamespaceHasher::name_based(int version, const Uuid& ns, std::string_view name)
{
    Bytes bytes = digest(version, ns, name);
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

} // namespace uuidkit::core
