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
 * @file random.cpp
 * @brief Implementation of the entropy sources.
 */

#include "uuidkit/infra/random.hpp"

#include <openssl/rand.h>

#include <climits>
#include <stdexcept>

namespace uuidkit::infra {

std::uint16_t RandomSource::next_u16()
{
    std::uint8_t buf[2];
    fill(buf, sizeof(buf));
    return static_cast<std::uint16_t>((buf[0] << 8) | buf[1]);
}

std::uint64_t RandomSource::next_u48()
{
    std::uint8_t buf[6];
    fill(buf, sizeof(buf));

    std::uint64_t value = 0;
    for (std::uint8_t b : buf) {
        value = (value << 8) | b;
    }
    return value;
}

/**
 * @brief Draws bytes from the OpenSSL DRBG.
 *
 * `RAND_bytes` takes an `int` length, so oversized requests are split.
 */
void SecureRandom::fill(std::uint8_t* out, std::size_t size)
{
    while (size > 0) {
        int chunk = size > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(size);
        if (RAND_bytes(out, chunk) != 1) {
            throw std::runtime_error("Entropy source failure: RAND_bytes could not deliver");
        }
        out += chunk;
        size -= static_cast<std::size_t>(chunk);
    }
}

SeededRandom::SeededRandom(std::uint64_t seed) : engine_(seed) {}

void SeededRandom::fill(std::uint8_t* out, std::size_t size)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Consume one 64-bit sample per 8 output bytes; the tail of the last sample is dropped.
    std::size_t i = 0;
    while (i < size) {
        std::uint64_t sample = engine_();
        for (int b = 0; b < 8 && i < size; ++b, ++i) {
            out[i] = static_cast<std::uint8_t>(sample >> (56 - 8 * b));
        }
    }
}

} // namespace uuidkit::infra
