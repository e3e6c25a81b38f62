/**
 * @file Viewport.cpp
 * @brief Viewport coordinate mapping.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Viewport.h"

namespace {
/** @brief Largest origin that still fills @p span screen cells from a grid of @p extent cells. */
std::uint32_t maxOrigin(std::uint32_t extent, int span) {
    if (span <= 0) return 0;
    const auto s = static_cast<std::uint32_t>(span);
    return extent > s ? extent - s : 0;
}
}

/** @copydoc Viewport::resize */
void Viewport::resize(int screenRows, int screenCols, std::uint32_t gridH, std::uint32_t gridW) {
    rows = screenRows < 0 ? 0 : screenRows;
    cols = screenCols < 0 ? 0 : screenCols;
    const std::uint32_t maxRow = maxOrigin(gridH, rows);
    const std::uint32_t maxCol = maxOrigin(gridW, cols);
    if (originRow > maxRow) originRow = maxRow;
    if (originCol > maxCol) originCol = maxCol;
}

/** @copydoc Viewport::toGrid */
bool Viewport::toGrid(int y, int x, std::uint32_t gridH, std::uint32_t gridW,
                      std::uint32_t& row, std::uint32_t& col) const {
    if (y < 0 || x < 0 || y >= rows || x >= cols) return false;
    const std::uint64_t r = std::uint64_t(originRow) + static_cast<std::uint32_t>(y);
    const std::uint64_t c = std::uint64_t(originCol) + static_cast<std::uint32_t>(x);
    if (r >= gridH || c >= gridW) return false;
    row = static_cast<std::uint32_t>(r);
    col = static_cast<std::uint32_t>(c);
    return true;
}

/** @copydoc Viewport::visible */
bool Viewport::visible(std::uint32_t row, std::uint32_t col) const {
    return row >= originRow && col >= originCol &&
           std::uint64_t(row) < std::uint64_t(originRow) + static_cast<std::uint32_t>(rows) &&
           std::uint64_t(col) < std::uint64_t(originCol) + static_cast<std::uint32_t>(cols);
}

/** @copydoc Viewport::follow */
void Viewport::follow(std::uint32_t row, std::uint32_t col) {
    if (rows > 0) {
        if (row < originRow) originRow = row;
        else if (row - originRow >= static_cast<std::uint32_t>(rows)) originRow = row - static_cast<std::uint32_t>(rows) + 1;
    }
    if (cols > 0) {
        if (col < originCol) originCol = col;
        else if (col - originCol >= static_cast<std::uint32_t>(cols)) originCol = col - static_cast<std::uint32_t>(cols) + 1;
    }
}
