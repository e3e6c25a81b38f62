/**
 * @file Viewport.h
 * @brief Declares Viewport: the mapping between terminal cells and grid coordinates.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>

/**
 * @struct Viewport
 * @brief A window of @c rows x @c cols screen cells showing the grid starting at (originRow, originCol).
 *
 * One screen character per grid cell. The viewport never wraps; it scrolls to keep a cursor visible.
 */
struct Viewport {
    std::uint32_t originRow{0}; /**< grid row shown on screen row 0 */
    std::uint32_t originCol{0}; /**< grid column shown on screen column 0 */
    int rows{0};                /**< screen rows available for the grid */
    int cols{0};                /**< screen columns available for the grid */

    /** @brief Resize the visible area; origin is pulled back so it stays inside a gridH x gridW grid. */
    void resize(int screenRows, int screenCols, std::uint32_t gridH, std::uint32_t gridW);

    /**
     * @brief Map screen position (y, x) to a grid coordinate.
     * @return false if the position is outside the viewport or past the grid's last row/column.
     */
    bool toGrid(int y, int x, std::uint32_t gridH, std::uint32_t gridW,
                std::uint32_t& row, std::uint32_t& col) const;

    /** @brief Whether grid cell (row, col) is currently on screen. */
    bool visible(std::uint32_t row, std::uint32_t col) const;

    /** @brief Scroll the minimum amount so (row, col) is on screen. */
    void follow(std::uint32_t row, std::uint32_t col);
};
