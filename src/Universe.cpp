/**
 * @file Universe.cpp
 * @brief Universe implementation: indexing, wrapped neighbor counts, generation update and pattern stamps.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Universe.h"
#include "Logger.h"

#include <array>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace {
/** @brief One quadrant of the pulsar as (row, column) offsets from its centre; mirrored into the other three. */
const std::array<std::pair<int, int>, 12> kPulsarQuadrant{{
    {-6, -2}, {-6, -3}, {-6, -4},
    {-4, -6}, {-3, -6}, {-2, -6},
    {-4, -1}, {-3, -1}, {-2, -1},
    {-1, -2}, {-1, -3}, {-1, -4},
}};

std::string coordText(std::uint32_t row, std::uint32_t column) {
    return "(" + std::to_string(row) + ", " + std::to_string(column) + ")";
}
}

/** @copydoc Universe::Universe() */
Universe::Universe() : Universe(std::make_unique<MersenneSource>()) {}

/** @copydoc Universe::Universe(std::unique_ptr<RandomSource>) */
Universe::Universe(std::unique_ptr<RandomSource> source) : rng(std::move(source)) {
    if (!rng) throw std::invalid_argument("Universe: random source must not be null");
    fillDefaultPattern();
}

/** @copydoc Universe::setWidth */
void Universe::setWidth(std::uint32_t width) {
    if (width == 0) throw std::invalid_argument("Universe::setWidth: width must be positive");
    w = width;
    initCells();
}

/** @copydoc Universe::setHeight */
void Universe::setHeight(std::uint32_t height) {
    if (height == 0) throw std::invalid_argument("Universe::setHeight: height must be positive");
    h = height;
    initCells();
}

void Universe::initCells() {
    grid = CellBitset(static_cast<std::size_t>(w) * h);
}

/** @copydoc Universe::clear */
void Universe::clear() {
    initCells();
}

/** @copydoc Universe::random */
void Universe::random() {
    const std::size_t size = static_cast<std::size_t>(w) * h;
    CellBitset fresh(size);
    for (std::size_t i = 0; i < size; ++i) {
        fresh.set(i, rng->draw() < 0.5);
    }
    grid.swap(fresh);
}

/** @copydoc Universe::fillDefaultPattern */
void Universe::fillDefaultPattern() {
    const std::size_t size = static_cast<std::size_t>(w) * h;
    CellBitset fresh(size);
    for (std::size_t i = 0; i < size; ++i) {
        fresh.set(i, i % 2 == 0 || i % 7 == 0);
    }
    grid.swap(fresh);
}

/** @copydoc Universe::setRandomSource */
void Universe::setRandomSource(std::unique_ptr<RandomSource> source) {
    if (!source) throw std::invalid_argument("Universe::setRandomSource: source must not be null");
    rng = std::move(source);
}

/** @copydoc Universe::liveNeighborCount */
std::uint8_t Universe::liveNeighborCount(std::uint32_t row, std::uint32_t column) const {
    std::uint8_t count = 0;
    const std::uint32_t rowDeltas[3] = {h - 1, 0, 1};
    const std::uint32_t colDeltas[3] = {w - 1, 0, 1};
    for (std::uint32_t dr : rowDeltas) {
        for (std::uint32_t dc : colDeltas) {
            if (dr == 0 && dc == 0) continue;
            // 64-bit sums so row + (h-1) cannot overflow for heights near 2^32.
            const auto nr = static_cast<std::uint32_t>((std::uint64_t(row) + dr) % h);
            const auto nc = static_cast<std::uint32_t>((std::uint64_t(column) + dc) % w);
            count += grid[getIndex(nr, nc)] ? 1 : 0;
        }
    }
    return count;
}

/** @copydoc Universe::tick */
void Universe::tick() {
    if (scratch.size() != grid.size()) scratch = CellBitset(grid.size());

    for (std::uint32_t row = 0; row < h; ++row) {
        for (std::uint32_t col = 0; col < w; ++col) {
            const std::size_t idx = getIndex(row, col);
            const bool alive = grid[idx];
            const std::uint8_t n = liveNeighborCount(row, col);
            bool nextState = alive;
            if (alive && n < 2) nextState = false;       // underpopulation
            else if (alive && n > 3) nextState = false;  // overpopulation
            else if (!alive && n == 3) nextState = true; // birth
            scratch.set(idx, nextState);
        }
    }

    grid.swap(scratch);
}

/** @copydoc Universe::toggleCell */
void Universe::toggleCell(std::uint32_t row, std::uint32_t column) {
    requireInGrid(row, column, "Universe::toggleCell");
    Logger::debug("toggling state of " + coordText(row, column));
    grid.toggle(getIndex(row, column));
}

/** @copydoc Universe::clearCells */
void Universe::clearCells(Coord start, Coord end) {
    if (start.first > end.first || start.second > end.second || end.first > h || end.second > w) {
        throw std::out_of_range("Universe::clearCells: region " + coordText(start.first, start.second) +
                                " to " + coordText(end.first, end.second) + " does not fit a " +
                                std::to_string(h) + "x" + std::to_string(w) + " grid");
    }
    for (std::uint32_t row = start.first; row < end.first; ++row) {
        for (std::uint32_t col = start.second; col < end.second; ++col) {
            grid.set(getIndex(row, col), false);
        }
    }
}

/** @copydoc Universe::insertGlider */
void Universe::insertGlider(std::uint32_t row, std::uint32_t column) {
    requireMargin(row, column, 2, "Universe::insertGlider");
    clearCells({row - 2, column - 2}, {row + 2, column + 2});
    grid.set(getIndex(row, column - 1), true);
    grid.set(getIndex(row - 1, column + 1), true);
    grid.set(getIndex(row, column + 1), true);
    grid.set(getIndex(row + 1, column), true);
    grid.set(getIndex(row + 1, column + 1), true);
}

/** @copydoc Universe::insertPulsar */
void Universe::insertPulsar(std::uint32_t row, std::uint32_t column) {
    requireMargin(row, column, 7, "Universe::insertPulsar");
    clearCells({row - 7, column - 7}, {row + 7, column + 7});
    const int r = static_cast<int>(row);
    const int c = static_cast<int>(column);
    for (const auto& off : kPulsarQuadrant) {
        for (int sr : {-1, 1}) {
            for (int sc : {-1, 1}) {
                const auto pr = static_cast<std::uint32_t>(r + sr * off.first);
                const auto pc = static_cast<std::uint32_t>(c + sc * off.second);
                grid.set(getIndex(pr, pc), true);
            }
        }
    }
}

/** @copydoc Universe::setCells */
void Universe::setCells(const std::vector<Coord>& alive) {
    // Validate everything first so a bad coordinate leaves the grid untouched.
    for (const auto& rc : alive) requireInGrid(rc.first, rc.second, "Universe::setCells");
    for (const auto& rc : alive) grid.set(getIndex(rc.first, rc.second), true);
}

/** @copydoc Universe::cell */
Cell Universe::cell(std::uint32_t row, std::uint32_t column) const {
    requireInGrid(row, column, "Universe::cell");
    return grid[getIndex(row, column)] ? Cell::Alive : Cell::Dead;
}

void Universe::requireInGrid(std::uint32_t row, std::uint32_t column, const char* where) const {
    if (row >= h || column >= w) {
        throw std::out_of_range(std::string(where) + ": " + coordText(row, column) + " outside " +
                                std::to_string(h) + "x" + std::to_string(w) + " grid");
    }
}

void Universe::requireMargin(std::uint32_t row, std::uint32_t column, std::uint32_t margin,
                             const char* where) const {
    const bool fits = row >= margin && column >= margin &&
                      std::uint64_t(row) + margin <= h && std::uint64_t(column) + margin <= w;
    if (!fits) {
        throw std::out_of_range(std::string(where) + ": " + coordText(row, column) + " needs " +
                                std::to_string(margin) + " cells of margin in a " +
                                std::to_string(h) + "x" + std::to_string(w) + " grid");
    }
}
