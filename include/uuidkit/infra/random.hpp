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
 * @file random.hpp
 * @brief Entropy sources for UUID generation.
 *
 * @details
 * Declares the `RandomSource` interface consumed by the generators and the clock
 * state, together with the production implementation backed by OpenSSL's CSPRNG
 * and a seeded implementation that makes test runs reproducible.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace uuidkit::infra {

/**
 * @class RandomSource
 * @brief Abstract producer of random bytes.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fills `size` bytes at `out` with random data.
     *
     * @throws std::runtime_error if the source is exhausted or unavailable.
     */
    virtual void fill(std::uint8_t* out, std::size_t size) = 0;

    /// @brief Convenience accessor returning a random 16-bit value.
    std::uint16_t next_u16();

    /// @brief Convenience accessor returning 48 random bits in the low end of a `uint64_t`.
    std::uint64_t next_u48();
};

/**
 * @class SecureRandom
 * @brief Cryptographically strong source using OpenSSL `RAND_bytes`.
 *
 * OpenSSL's default DRBG is thread-safe, so no additional locking is needed.
 */
class SecureRandom : public RandomSource {
  public:
    void fill(std::uint8_t* out, std::size_t size) override;
};

/**
 * @class SeededRandom
 * @brief Deterministic source driven by a 64-bit Mersenne Twister.
 *
 * @details
 * Intended for tests and reproducible tooling. Two instances built from the same
 * seed yield the same byte stream. Access is serialized internally.
 */
class SeededRandom : public RandomSource {
  public:
    explicit SeededRandom(std::uint64_t seed);

    void fill(std::uint8_t* out, std::size_t size) override;

  private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace uuidkit::infra
