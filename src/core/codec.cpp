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
 * @file codec.cpp
 * @brief Implementation of the canonical, binary and compact UUID codecs.
 *
 * @details
 * Base64 itself is delegated to OpenSSL (`EVP_EncodeBlock`/`EVP_DecodeBlock`);
 * this file only translates between the standard and sortable alphabets.
 */

#include "uuidkit/core/codec.hpp"

#include "uuidkit/infra/string.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace uuidkit::core {

namespace {

// The standard and sortable alphabets agree on length; the padding slot is excluded.
constexpr std::size_t kSymbolCount = 64;

char to_sortable(char c)
{
    auto pos = kBase64Standard.find(c);
    return pos == std::string_view::npos ? c : kBase64Sortable[pos];
}

char to_standard(char c)
{
    auto pos = kBase64Sortable.find(c);
    return pos == std::string_view::npos ? c : kBase64Standard[pos];
}

bool is_sortable_symbol(char c)
{
    auto pos = kBase64Sortable.find(c);
    return pos != std::string_view::npos && pos < kSymbolCount;
}

/// Renders arbitrary input for diagnostics; binary payloads are shown as hex.
std::string describe(std::string_view input)
{
    bool printable = std::all_of(input.begin(), input.end(), [](char c) {
        return std::isprint(static_cast<unsigned char>(c)) != 0;
    });
    return printable ? "'" + std::string(input) + "'" : "0x" + infra::String::to_hex(input);
}

} // namespace

std::optional<Uuid> Codec::decode(std::string_view input)
{
    if (input.size() == kBinaryLength) {
        Bytes bytes;
        std::copy(input.begin(), input.end(), bytes.begin());
        return Uuid(bytes);
    }

    if (auto compact = decode_compact(input)) {
        return compact;
    }

    return decode_hex(input);
}

std::optional<Uuid> Codec::decode_compact(std::string_view input)
{
    if (input.size() != kCompactLength || !std::all_of(input.begin(), input.end(), is_sortable_symbol)) {
        return std::nullopt;
    }

    // 22 symbols carry 132 bits. Two zero symbols complete the final quantum;
    // the decoder then yields 18 bytes of which the first 16 are the UUID.
    unsigned char encoded[kCompactLength + 2];
    for (std::size_t i = 0; i < kCompactLength; ++i) {
        encoded[i] = static_cast<unsigned char>(to_standard(input[i]));
    }
    encoded[kCompactLength] = 'A';
    encoded[kCompactLength + 1] = 'A';

    unsigned char decoded[18];
    int n = EVP_DecodeBlock(decoded, encoded, static_cast<int>(sizeof(encoded)));
    if (n < static_cast<int>(kBinaryLength)) {
        return std::nullopt;
    }

    Bytes bytes;
    std::copy(decoded, decoded + kBinaryLength, bytes.begin());
    return Uuid(bytes);
}

std::optional<Uuid> Codec::decode_hex(std::string_view input)
{
    std::string hex = infra::String::strip_chars(input, "{}-");
    if (hex.size() != 2 * kBinaryLength || !infra::String::is_hex(hex)) {
        return std::nullopt;
    }

    std::string raw = infra::String::from_hex(hex);
    Bytes bytes;
    std::copy(raw.begin(), raw.end(), bytes.begin());
    return Uuid(bytes);
}

Parsed Codec::parse(std::string_view input, bool strict)
{
    if (auto value = decode(input)) {
        return {*value, std::nullopt};
    }

    std::string detail = "Invalid UUID string supplied: " + describe(input);
    if (strict) {
        throw UuidError(ErrorCode::InvalidUuidString, detail);
    }
    return {Uuid::nil(), Issue{ErrorCode::InvalidUuidString, detail}};
}

std::string Codec::to_canonical(const Uuid& uuid)
{
    std::string hex = infra::String::to_hex(to_binary(uuid));

    std::string out;
    out.reserve(kCanonicalLength);
    out.append(hex, 0, 8).push_back('-');
    out.append(hex, 8, 4).push_back('-');
    out.append(hex, 12, 4).push_back('-');
    out.append(hex, 16, 4).push_back('-');
    out.append(hex, 20, 12);
    return out;
}

std::string Codec::to_binary(const Uuid& uuid)
{
    const Bytes& bytes = uuid.bytes();
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string Codec::to_compact(const Uuid& uuid)
{
    // 16 bytes encode to 24 characters (two of them padding) plus a terminator.
    unsigned char encoded[25];
    EVP_EncodeBlock(encoded, uuid.bytes().data(), static_cast<int>(kBinaryLength));

    std::string out;
    out.reserve(kCompactLength);
    for (std::size_t i = 0; i < kCompactLength; ++i) {
        out.push_back(to_sortable(static_cast<char>(encoded[i])));
    }
    return out;
}

Converted Codec::compress(std::string_view input, bool to_compact)
{
    Parsed parsed = parse(input);
    return {to_compact ? Codec::to_compact(parsed.value) : to_binary(parsed.value), parsed.issue};
}

Converted Codec::expand(std::string_view input)
{
    Parsed parsed = parse(input);
    return {to_canonical(parsed.value), parsed.issue};
}

} // namespace uuidkit::core
