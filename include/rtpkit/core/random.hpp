/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <random>
#include <type_traits>

namespace rtpkit {

/**
 * Pseudo random number source. Components which need randomness take a reference to an instance of this class, so
 * tests can supply a seeded instance and get deterministic results.
 */
class Random {
  public:
    /**
     * Constructs a generator seeded from std::random_device.
     */
    Random() : generator_(std::random_device {}()) {}

    /**
     * Constructs a generator with an explicit seed.
     * @param seed The seed.
     */
    explicit Random(const uint32_t seed) : generator_(seed) {}

    /**
     * Generates a random integer between min and max (inclusive).
     * @tparam T The type of the integer.
     * @param min The minimum value.
     * @param max The maximum value.
     * @return The pseudo randomly generated integer.
     */
    template<typename T = int>
    T get_random_int(T min, T max) {
        // uniform_int_distribution is not defined for 8-bit types.
        using DistType = std::conditional_t<(sizeof(T) < sizeof(uint16_t)), uint16_t, T>;
        std::uniform_int_distribution<DistType> dist(min, max);
        return static_cast<T>(dist(generator_));
    }

    /**
     * @tparam T An unsigned integer type.
     * @return A random value covering the full range of T.
     */
    template<typename T>
    T get_random_uint() {
        static_assert(std::is_unsigned_v<T>, "Only unsigned types are supported");
        return get_random_int<T>(std::numeric_limits<T>::min(), std::numeric_limits<T>::max());
    }

  private:
    std::mt19937 generator_;
};

}  // namespace rtpkit
