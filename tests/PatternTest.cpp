/**
 * @file PatternTest.cpp
 * @brief Tests for region clearing and the glider / pulsar stamps.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <vector>

#include "TestSupport.h"
#include "Universe.h"

namespace {
std::set<Universe::Coord> shifted(const std::set<Universe::Coord>& cells, std::uint32_t dr, std::uint32_t dc) {
    std::set<Universe::Coord> out;
    for (auto rc : cells) out.insert({rc.first + dr, rc.second + dc});
    return out;
}

void fillAll(Universe& u) {
    std::vector<Universe::Coord> all;
    for (std::uint32_t r = 0; r < u.height(); ++r)
        for (std::uint32_t c = 0; c < u.width(); ++c) all.push_back({r, c});
    u.setCells(all);
}
}

class PatternTest : public ::testing::Test {
 protected:
  Universe u = blankUniverse(20, 20);
};

TEST_F(PatternTest, GliderStampsFiveCellsAndClearsItsBlock) {
    // Pre-populate the 4x4 block [8,12) x [8,12) plus two cells just outside it.
    std::vector<Universe::Coord> block;
    for (std::uint32_t r = 8; r < 12; ++r)
        for (std::uint32_t c = 8; c < 12; ++c) block.push_back({r, c});
    u.setCells(block);
    u.setCells({{7, 7}, {12, 12}});

    u.insertGlider(10, 10);

    const std::set<Universe::Coord> glider{{10, 9}, {9, 11}, {10, 11}, {11, 10}, {11, 11}};
    for (std::uint32_t r = 8; r < 12; ++r) {
        for (std::uint32_t c = 8; c < 12; ++c) {
            const bool expected = glider.count({r, c}) > 0;
            EXPECT_EQ(u.cell(r, c) == Cell::Alive, expected) << "(" << r << "," << c << ")";
        }
    }
    EXPECT_EQ(u.cell(7, 7), Cell::Alive);
    EXPECT_EQ(u.cell(12, 12), Cell::Alive);
    EXPECT_EQ(u.population(), 7u);
}

TEST_F(PatternTest, GliderTravelsOneDiagonalCellEveryFourGenerations) {
    u.insertGlider(5, 5);
    const auto start = aliveCells(u);
    ASSERT_EQ(start.size(), 5u);
    for (int i = 0; i < 4; ++i) u.tick();
    EXPECT_EQ(aliveCells(u), shifted(start, 1, 1));
}

TEST_F(PatternTest, GliderMarginIsEnforced) {
    EXPECT_NO_THROW(u.insertGlider(2, 2));
    EXPECT_NO_THROW(u.insertGlider(18, 18));
    u.clear();
    EXPECT_THROW(u.insertGlider(1, 5), std::out_of_range);
    EXPECT_THROW(u.insertGlider(5, 1), std::out_of_range);
    EXPECT_THROW(u.insertGlider(19, 5), std::out_of_range);
    EXPECT_THROW(u.insertGlider(5, 19), std::out_of_range);
    EXPECT_EQ(u.population(), 0u);
}

TEST_F(PatternTest, PulsarHasFortyEightSymmetricCells) {
    u.insertPulsar(10, 10);
    const auto cells = aliveCells(u);
    EXPECT_EQ(cells.size(), 48u);
    for (auto rc : cells) {
        // mirror through the centre row and column
        EXPECT_TRUE(cells.count({20 - rc.first, rc.second}));
        EXPECT_TRUE(cells.count({rc.first, 20 - rc.second}));
        EXPECT_GE(rc.first, 4u);
        EXPECT_LE(rc.first, 16u);
    }
    EXPECT_TRUE(cells.count({4, 8}));    // (-6,-2)
    EXPECT_TRUE(cells.count({16, 14}));  // (+6,+4)
    EXPECT_FALSE(cells.count({9, 11}));  // (-1,+1)
    EXPECT_FALSE(cells.count({10, 10})); // centre
}

TEST_F(PatternTest, PulsarClearsOnlyItsFourteenSquareBlock) {
    fillAll(u);
    u.insertPulsar(10, 10);
    EXPECT_EQ(u.population(), 400u - 14u * 14u + 48u);
    EXPECT_EQ(u.cell(2, 2), Cell::Alive);
    EXPECT_EQ(u.cell(17, 17), Cell::Alive);
    EXPECT_EQ(u.cell(3, 3), Cell::Dead);
    EXPECT_EQ(u.cell(16, 16), Cell::Dead);
}

TEST(PatternPeriodTest, PulsarHasPeriodThree) {
    Universe u = blankUniverse(24, 24);
    u.insertPulsar(12, 12);
    const CellBitset phase0 = u.getCells();
    u.tick();
    EXPECT_NE(u.getCells(), phase0);
    u.tick();
    EXPECT_NE(u.getCells(), phase0);
    u.tick();
    EXPECT_EQ(u.getCells(), phase0);
}

TEST_F(PatternTest, PulsarMarginIsEnforced) {
    EXPECT_NO_THROW(u.insertPulsar(7, 7));
    EXPECT_NO_THROW(u.insertPulsar(13, 13));
    u.clear();
    EXPECT_THROW(u.insertPulsar(6, 10), std::out_of_range);
    EXPECT_THROW(u.insertPulsar(10, 6), std::out_of_range);
    EXPECT_THROW(u.insertPulsar(14, 10), std::out_of_range);
    EXPECT_THROW(u.insertPulsar(10, 14), std::out_of_range);
    EXPECT_EQ(u.population(), 0u);
}

TEST_F(PatternTest, ClearCellsIsHalfOpen) {
    fillAll(u);
    u.clearCells({2, 3}, {5, 7});
    for (std::uint32_t r = 0; r < 20; ++r) {
        for (std::uint32_t c = 0; c < 20; ++c) {
            const bool inside = r >= 2 && r < 5 && c >= 3 && c < 7;
            EXPECT_EQ(u.cell(r, c) == Cell::Dead, inside) << "(" << r << "," << c << ")";
        }
    }
    u.clearCells({6, 6}, {6, 9});
    EXPECT_EQ(u.population(), 400u - 12u);
}

TEST_F(PatternTest, ClearCellsRejectsRegionsOffTheGrid) {
    fillAll(u);
    EXPECT_THROW(u.clearCells({5, 5}, {4, 8}), std::out_of_range);
    EXPECT_THROW(u.clearCells({5, 5}, {21, 8}), std::out_of_range);
    EXPECT_THROW(u.clearCells({5, 5}, {8, 21}), std::out_of_range);
    EXPECT_NO_THROW(u.clearCells({18, 18}, {20, 20}));
    EXPECT_EQ(u.population(), 400u - 4u);
}
