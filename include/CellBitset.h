/**
 * @file CellBitset.h
 * @brief Declares CellBitset: a fixed-length, word-packed bit vector holding one bit per grid cell.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @class CellBitset
 * @brief Dense bit storage backed by 32-bit words.
 *
 * Bit @c i lives in word @c i/32 at bit position @c i%32 (little-endian bit order within a word).
 * Padding bits past size() in the last word are always zero, so words() can be handed to a renderer as-is.
 */
class CellBitset {
public:
    using Word = std::uint32_t;
    static constexpr std::size_t kWordBits = 32;

    CellBitset() = default;
    /** @brief Construct @p bits cleared bits. */
    explicit CellBitset(std::size_t bits);

    /** @brief Number of addressable bits. */
    std::size_t size() const { return nbits; }
    /** @brief Number of backing words: ceil(size()/32). */
    std::size_t wordCount() const { return data.size(); }
    /** @brief Raw backing words; valid until the next mutating call. */
    const Word* words() const { return data.data(); }

    /** @brief Unchecked read of bit @p i. */
    bool operator[](std::size_t i) const {
        return (data[i / kWordBits] >> (i % kWordBits)) & 1u;
    }
    /** @brief Checked read of bit @p i; throws std::out_of_range past size(). */
    bool test(std::size_t i) const;

    /** @brief Set bit @p i to @p value (unchecked). */
    void set(std::size_t i, bool value) {
        const Word mask = Word(1) << (i % kWordBits);
        if (value) data[i / kWordBits] |= mask;
        else data[i / kWordBits] &= ~mask;
    }
    /** @brief Flip bit @p i (unchecked). */
    void toggle(std::size_t i) { data[i / kWordBits] ^= Word(1) << (i % kWordBits); }

    /** @brief Clear every bit; size is unchanged. */
    void reset();
    /** @brief Population count. */
    std::size_t count() const;

    void swap(CellBitset& other) noexcept;

    bool operator==(const CellBitset& other) const {
        return nbits == other.nbits && data == other.data;
    }
    bool operator!=(const CellBitset& other) const { return !(*this == other); }

private:
    std::size_t nbits{0};
    std::vector<Word> data;
};
