/**
 * @file CellBitset.cpp
 * @brief CellBitset implementation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CellBitset.h"

#include <algorithm>
#include <bitset>
#include <stdexcept>
#include <string>
#include <utility>

/** @copydoc CellBitset::CellBitset(std::size_t) */
CellBitset::CellBitset(std::size_t bits)
    : nbits(bits), data((bits + kWordBits - 1) / kWordBits, Word(0)) {}

/** @copydoc CellBitset::test */
bool CellBitset::test(std::size_t i) const {
    if (i >= nbits) {
        throw std::out_of_range("CellBitset::test: index " + std::to_string(i) +
                                " out of range for size " + std::to_string(nbits));
    }
    return (*this)[i];
}

/** @copydoc CellBitset::reset */
void CellBitset::reset() {
    std::fill(data.begin(), data.end(), Word(0));
}

/** @copydoc CellBitset::count */
std::size_t CellBitset::count() const {
    std::size_t n = 0;
    for (Word w : data) n += std::bitset<kWordBits>(w).count();
    return n;
}

void CellBitset::swap(CellBitset& other) noexcept {
    std::swap(nbits, other.nbits);
    data.swap(other.data);
}
