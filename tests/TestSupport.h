/**
 * @file TestSupport.h
 * @brief Shared helpers for the toruslife test suite.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

#include "RandomSource.h"
#include "Universe.h"

/** @brief RandomSource that replays a fixed list of draws, cycling when exhausted. */
class ScriptedSource : public RandomSource {
public:
    explicit ScriptedSource(std::vector<double> draws) : values(std::move(draws)) {}
    double draw() override {
        double v = values[pos % values.size()];
        ++pos;
        return v;
    }
    std::size_t calls() const { return pos; }

private:
    std::vector<double> values;
    std::size_t pos{0};
};

/** @brief A width x height universe with every cell Dead. */
inline Universe blankUniverse(std::uint32_t width, std::uint32_t height) {
    Universe u;
    u.setWidth(width);
    u.setHeight(height);
    return u;
}

/** @brief Coordinates of every Alive cell, ordered by (row, column). */
inline std::set<Universe::Coord> aliveCells(const Universe& u) {
    std::set<Universe::Coord> out;
    for (std::uint32_t r = 0; r < u.height(); ++r) {
        for (std::uint32_t c = 0; c < u.width(); ++c) {
            if (u.getCells()[u.getIndex(r, c)]) out.insert({r, c});
        }
    }
    return out;
}
