/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GridTests
#include <boost/test/unit_test.hpp>

#include "world/Grid.hpp"
#include <limits>
#include <stdexcept>

using namespace TerraNav;

struct GridFixture {
    static constexpr float CELL_SIZE = 32.0f;
    Grid grid{10, 8, CELL_SIZE};
};

BOOST_AUTO_TEST_SUITE(GridConstructionTests)

BOOST_AUTO_TEST_CASE(TestDimensionsAreFixed) {
    Grid grid(12, 6, 16.0f);
    BOOST_CHECK_EQUAL(grid.getWidth(), 12);
    BOOST_CHECK_EQUAL(grid.getHeight(), 6);
    BOOST_CHECK_CLOSE(grid.getCellSize(), 16.0f, 0.001f);
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::EMPTY), 72u);
}

BOOST_AUTO_TEST_CASE(TestDefaultCellSize) {
    Grid grid(4, 4);
    BOOST_CHECK_CLOSE(grid.getCellSize(), Grid::DEFAULT_CELL_SIZE, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestInvalidDimensionsThrow) {
    BOOST_CHECK_THROW(Grid(0, 10), std::invalid_argument);
    BOOST_CHECK_THROW(Grid(10, -1), std::invalid_argument);
    BOOST_CHECK_THROW(Grid(10, 10, 0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(Grid(10, 10, -4.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GridCellAccessTests, GridFixture)

BOOST_AUTO_TEST_CASE(TestOutOfBoundsReadsAsBlocked) {
    BOOST_CHECK(!grid.isInBounds(-1, 0));
    BOOST_CHECK(!grid.isInBounds(10, 0));
    BOOST_CHECK(!grid.isInBounds(0, 8));
    BOOST_CHECK_EQUAL(grid.getCellType(-1, 3), CellType::BLOCKED);
    BOOST_CHECK_EQUAL(grid.getCellType(3, 100), CellType::BLOCKED);
    BOOST_CHECK_EQUAL(grid.getCellData(50, 50).type, CellType::BLOCKED);
    BOOST_CHECK_CLOSE(grid.getMovementSpeed(-5, -5), 0.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsWritesAreIgnored) {
    grid.setCellType(-1, -1, CellType::TOWER);
    grid.setCellData(20, 20, CellData{CellType::PATH, 2.0f, std::nullopt, std::nullopt, std::nullopt});
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::TOWER), 0u);
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::PATH), 0u);
}

BOOST_AUTO_TEST_CASE(TestSetAndGetCellData) {
    CellData data;
    data.type = CellType::DECORATIVE;
    data.decorationId = "rock_02";
    data.biomeVariant = 3;
    grid.setCellData(2, 3, data);

    BOOST_CHECK(grid.getCellData(2, 3) == data);
    BOOST_CHECK_EQUAL(grid.getCellType(2, 3), CellType::DECORATIVE);
}

BOOST_AUTO_TEST_CASE(TestMovementSpeedByType) {
    grid.setCellType(0, 0, CellType::PATH);
    grid.setCellType(1, 0, CellType::ROUGH_TERRAIN);
    grid.setCellType(2, 0, CellType::WATER);
    grid.setCellType(3, 0, CellType::TOWER);
    grid.setCellType(4, 0, CellType::BORDER);
    grid.setCellType(5, 0, CellType::BRIDGE);

    BOOST_CHECK_CLOSE(grid.getMovementSpeed(0, 0), 1.2f, 0.001f);
    BOOST_CHECK_CLOSE(grid.getMovementSpeed(1, 0), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(grid.getMovementSpeed(2, 0), 0.0f);
    BOOST_CHECK_EQUAL(grid.getMovementSpeed(3, 0), 0.0f);
    BOOST_CHECK_EQUAL(grid.getMovementSpeed(4, 0), 0.0f);
    BOOST_CHECK_CLOSE(grid.getMovementSpeed(5, 0), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(grid.getMovementSpeed(6, 0), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestMovementSpeedOverride) {
    CellData data;
    data.type = CellType::WATER;
    data.movementSpeed = 0.3f;
    grid.setCellData(4, 4, data);
    BOOST_CHECK_CLOSE(grid.getMovementSpeed(4, 4), 0.3f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestHeightIsClamped) {
    BOOST_CHECK_EQUAL(grid.getCellHeight(1, 1), 0.0f);
    grid.setCellHeight(1, 1, 0.4f);
    BOOST_CHECK_CLOSE(grid.getCellHeight(1, 1), 0.4f, 0.001f);
    grid.setCellHeight(1, 1, 3.0f);
    BOOST_CHECK_CLOSE(grid.getCellHeight(1, 1), 1.0f, 0.001f);
    grid.setCellHeight(1, 1, -1.0f);
    BOOST_CHECK_EQUAL(grid.getCellHeight(1, 1), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestBiome) {
    BOOST_CHECK_EQUAL(grid.getBiome(), BiomeType::GRASSLAND);
    grid.setBiome(BiomeType::VOLCANIC);
    BOOST_CHECK_EQUAL(grid.getBiome(), BiomeType::VOLCANIC);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GridCoordinateTests, GridFixture)

BOOST_AUTO_TEST_CASE(TestWorldToGridFloors) {
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(0.0f, 0.0f)), (GridPoint{0, 0}));
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(31.9f, 32.0f)), (GridPoint{0, 1}));
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(-0.5f, 70.0f)), (GridPoint{-1, 2}));
}

BOOST_AUTO_TEST_CASE(TestWorldToGridRejectsUnrepresentableCoordinates) {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();

    GridPoint far = grid.worldToGrid(Vector2D(1e12f, 16.0f));
    BOOST_CHECK_EQUAL(far, (GridPoint{Grid::OUT_OF_RANGE_INDEX, 0}));
    BOOST_CHECK(!grid.isInBounds(far.x, far.y));

    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(-1e12f, -1e12f)),
                      (GridPoint{Grid::OUT_OF_RANGE_INDEX, Grid::OUT_OF_RANGE_INDEX}));
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(inf, 40.0f)), (GridPoint{Grid::OUT_OF_RANGE_INDEX, 1}));
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(40.0f, -inf)), (GridPoint{1, Grid::OUT_OF_RANGE_INDEX}));

    GridPoint notANumber = grid.worldToGrid(Vector2D(nan, nan));
    BOOST_CHECK(!grid.isInBounds(notANumber.x, notANumber.y));

    // Large but representable cells keep their value
    BOOST_CHECK_EQUAL(grid.worldToGrid(Vector2D(3200.0f, 0.0f)), (GridPoint{100, 0}));
}

BOOST_AUTO_TEST_CASE(TestGridToWorldIsCellCentre) {
    Vector2D centre = grid.gridToWorld(2, 3);
    BOOST_CHECK_CLOSE(centre.getX(), 80.0f, 0.001f);
    BOOST_CHECK_CLOSE(centre.getY(), 112.0f, 0.001f);
    BOOST_CHECK_EQUAL(grid.worldToGrid(centre), (GridPoint{2, 3}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GridQueryTests, GridFixture)

BOOST_AUTO_TEST_CASE(TestNeighborsAreCardinalAndInBounds) {
    auto corner = grid.getNeighbors(0, 0);
    BOOST_CHECK_EQUAL(corner.size(), 2u);

    auto inner = grid.getNeighbors(4, 4);
    BOOST_REQUIRE_EQUAL(inner.size(), 4u);
    BOOST_CHECK_EQUAL(inner[0], (GridPoint{4, 3}));
    BOOST_CHECK_EQUAL(inner[1], (GridPoint{5, 4}));
    BOOST_CHECK_EQUAL(inner[2], (GridPoint{4, 5}));
    BOOST_CHECK_EQUAL(inner[3], (GridPoint{3, 4}));
}

BOOST_AUTO_TEST_CASE(TestWalkableNeighbors) {
    grid.setCellType(5, 4, CellType::OBSTACLE);
    grid.setCellType(4, 5, CellType::WATER);
    auto neighbors = grid.getWalkableNeighbors(4, 4);
    BOOST_CHECK_EQUAL(neighbors.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestTowerPlacement) {
    grid.setCellType(1, 1, CellType::DECORATIVE);
    grid.setCellType(2, 1, CellType::PATH);
    grid.setCellType(3, 1, CellType::TOWER);
    BOOST_CHECK(grid.canPlaceTower(0, 0));
    BOOST_CHECK(grid.canPlaceTower(1, 1));
    BOOST_CHECK(!grid.canPlaceTower(2, 1));
    BOOST_CHECK(!grid.canPlaceTower(3, 1));
    BOOST_CHECK(!grid.canPlaceTower(-1, 0));
}

BOOST_AUTO_TEST_CASE(TestCellsOfType) {
    grid.setCellType(1, 2, CellType::WATER);
    grid.setCellType(7, 5, CellType::WATER);
    auto water = grid.getCellsOfType(CellType::WATER);
    BOOST_REQUIRE_EQUAL(water.size(), 2u);
    BOOST_CHECK_EQUAL(water[0], (GridPoint{1, 2}));
    BOOST_CHECK_EQUAL(water[1], (GridPoint{7, 5}));
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::WATER), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GridGenerationHelperTests, GridFixture)

BOOST_AUTO_TEST_CASE(TestSetPathClearsPreviousPath) {
    grid.setPath({{0, 0}, {1, 0}, {2, 0}});
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::PATH), 3u);

    grid.setPath({{0, 1}, {1, 1}});
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::PATH), 2u);
    BOOST_CHECK_EQUAL(grid.getCellType(0, 0), CellType::EMPTY);
    BOOST_CHECK_EQUAL(grid.getCellType(1, 1), CellType::PATH);
}

BOOST_AUTO_TEST_CASE(TestAddObstaclesOnlyOntoEmpty) {
    grid.setCellType(3, 3, CellType::PATH);
    grid.addObstacles({{2, 2}, {3, 3}, {-1, 0}});
    BOOST_CHECK_EQUAL(grid.getCellType(2, 2), CellType::OBSTACLE);
    BOOST_CHECK_EQUAL(grid.getCellType(3, 3), CellType::PATH);
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::OBSTACLE), 1u);
}

BOOST_AUTO_TEST_CASE(TestBordersRingTheMap) {
    grid.setBorders();
    // 2*10 + 2*(8-2)
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::BORDER), 32u);
    BOOST_CHECK_EQUAL(grid.getCellType(0, 4), CellType::BORDER);
    BOOST_CHECK_EQUAL(grid.getCellType(9, 7), CellType::BORDER);
    BOOST_CHECK_EQUAL(grid.getCellType(4, 4), CellType::EMPTY);
}

BOOST_AUTO_TEST_CASE(TestSpawnZones) {
    grid.setSpawnZones({{1, 1}, {8, 6}});
    BOOST_CHECK_EQUAL(grid.countCellsOfType(CellType::SPAWN_ZONE), 2u);
    BOOST_CHECK(grid.isWalkable(1, 1));
}

BOOST_AUTO_TEST_CASE(TestRandomObstaclesAreSeededAndKeepMargin) {
    Grid a(20, 20);
    Grid b(20, 20);
    a.generateRandomObstacles(25, 1234u);
    b.generateRandomObstacles(25, 1234u);

    auto cellsA = a.getCellsOfType(CellType::OBSTACLE);
    auto cellsB = b.getCellsOfType(CellType::OBSTACLE);
    BOOST_CHECK(!cellsA.empty());
    BOOST_CHECK(cellsA == cellsB);

    for (const auto& p : cellsA) {
        BOOST_CHECK(p.x >= 3 && p.x <= 17);
        BOOST_CHECK(p.y >= 3 && p.y <= 17);
    }
}

BOOST_AUTO_TEST_SUITE_END()
