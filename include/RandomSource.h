/**
 * @file RandomSource.h
 * @brief Declares the uniform random source consumed by Universe::random().
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <random>

/**
 * @class RandomSource
 * @brief Uniform generator of doubles in [0,1). Implementations need not be thread-safe.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    /** @brief Next uniform draw in [0,1). */
    virtual double draw() = 0;
};

/**
 * @class MersenneSource
 * @brief Default RandomSource over std::mt19937.
 */
class MersenneSource : public RandomSource {
public:
    /** @brief Seed from std::random_device. */
    MersenneSource();
    /** @brief Seed deterministically from @p seed. */
    explicit MersenneSource(std::uint32_t seed);

    double draw() override;

private:
    std::mt19937 prng;
    std::uniform_real_distribution<double> dist{0.0, 1.0};
};
