/**
 * @file RandomSource.cpp
 * @brief MersenneSource implementation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RandomSource.h"

MersenneSource::MersenneSource() {
    std::random_device rd;
    prng.seed(rd());
}

MersenneSource::MersenneSource(std::uint32_t seed) : prng(seed) {}

/** @copydoc MersenneSource::draw */
double MersenneSource::draw() {
    return dist(prng);
}
