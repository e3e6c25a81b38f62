/**
 * @file Universe.h
 * @brief Declares the Universe class: a toroidal Game of Life grid stored one bit per cell.
 *
 * The Universe owns the grid dimensions and the packed cell state. Generations advance synchronously:
 * tick() reads a frozen copy of the current generation and writes the next one into a second buffer.
 * Neighbor counting wraps across the edges; region clearing and pattern stamping never wrap.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "CellBitset.h"
#include "RandomSource.h"

/** @brief State of a single cell. */
enum class Cell : std::uint8_t {
    Dead = 0,
    Alive = 1,
};

/**
 * @class Universe
 * @brief Owner of the automaton state. Not thread-safe: callers serialize access to one instance.
 *
 * Coordinates are (row, column) with row < height() and column < width().
 */
class Universe {
public:
    using Coord = std::pair<std::uint32_t, std::uint32_t>;

    static constexpr std::uint32_t kDefaultWidth = 64;
    static constexpr std::uint32_t kDefaultHeight = 64;

    /** @brief 64x64 grid seeded with the default pattern; random() draws from a MersenneSource. */
    Universe();
    /** @brief 64x64 grid seeded with the default pattern; random() draws from @p source. */
    explicit Universe(std::unique_ptr<RandomSource> source);

    // Dimensions
    std::uint32_t width() const { return w; }
    std::uint32_t height() const { return h; }
    /** @brief Change the column count and reset every cell to Dead. Throws std::invalid_argument for 0. */
    void setWidth(std::uint32_t width);
    /** @brief Change the row count and reset every cell to Dead. Throws std::invalid_argument for 0. */
    void setHeight(std::uint32_t height);

    // Whole-grid mutation
    /** @brief Reset every cell to Dead; dimensions unchanged. */
    void clear();
    /** @brief Replace every cell with an independent draw: Alive iff draw() < 0.5. */
    void random();
    /** @brief Set cell i Alive iff i % 2 == 0 || i % 7 == 0 (row-major), the constructor's seed. */
    void fillDefaultPattern();
    /** @brief Advance one generation under the standard B3/S23 rule. */
    void tick();
    /** @brief Replace the generator used by random(). */
    void setRandomSource(std::unique_ptr<RandomSource> source);

    // Single cells and regions
    /** @brief Flip cell (row, column). Throws std::out_of_range outside the grid. */
    void toggleCell(std::uint32_t row, std::uint32_t column);
    /** @brief Set Dead every cell in rows [start.first, end.first) x columns [start.second, end.second). */
    void clearCells(Coord start, Coord end);
    /**
     * @brief Clear the 4x4 block from (row-2, column-2) and stamp a glider around (row, column).
     * Requires row >= 2, column >= 2, row + 2 <= height(), column + 2 <= width(); throws std::out_of_range otherwise.
     */
    void insertGlider(std::uint32_t row, std::uint32_t column);
    /**
     * @brief Clear the 14x14 block from (row-7, column-7) and stamp a 48-cell pulsar centred on (row, column).
     * Requires row >= 7, column >= 7, row + 7 <= height(), column + 7 <= width(); throws std::out_of_range otherwise.
     */
    void insertPulsar(std::uint32_t row, std::uint32_t column);

    // Bulk access
    /** @brief Read-only view of the packed state; valid until the next mutating call. */
    const CellBitset& getCells() const { return grid; }
    /** @brief Set every listed coordinate Alive; other cells keep their state. */
    void setCells(const std::vector<Coord>& alive);
    /**
     * @brief Raw packed words, ceil(width*height/32) of them, bit i at word i/32 bit i%32.
     * Valid until the next mutating call.
     */
    const std::uint32_t* cells() const { return grid.words(); }

    // Queries
    /** @brief State of (row, column). Throws std::out_of_range outside the grid. */
    Cell cell(std::uint32_t row, std::uint32_t column) const;
    /** @brief Number of Alive cells. */
    std::size_t population() const { return grid.count(); }

    /** @brief Row-major index; unchecked. */
    std::size_t getIndex(std::uint32_t row, std::uint32_t column) const {
        return static_cast<std::size_t>(row) * w + column;
    }
    /** @brief Alive cells among the 8 wrapped Moore neighbors of (row, column); unchecked. */
    std::uint8_t liveNeighborCount(std::uint32_t row, std::uint32_t column) const;

private:
    void initCells();
    void requireInGrid(std::uint32_t row, std::uint32_t column, const char* where) const;
    void requireMargin(std::uint32_t row, std::uint32_t column, std::uint32_t margin, const char* where) const;

    std::uint32_t w{kDefaultWidth};  /**< column count */
    std::uint32_t h{kDefaultHeight}; /**< row count */
    CellBitset grid;                 /**< current generation, w*h bits row-major */
    CellBitset scratch;              /**< next generation under construction in tick(); swapped with grid */
    std::unique_ptr<RandomSource> rng; /**< source for random() */
};
