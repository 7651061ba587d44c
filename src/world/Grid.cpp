/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Grid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace TerraNav {

namespace {
const CellData BLOCKED_CELL{CellType::BLOCKED, std::nullopt, std::nullopt, std::nullopt, std::nullopt};

int toCellIndex(float world, float cellSize) {
    const double cell = std::floor(static_cast<double>(world) / static_cast<double>(cellSize));
    if (!std::isfinite(cell) || cell < -Grid::MAX_CELL_INDEX || cell > Grid::MAX_CELL_INDEX) {
        return Grid::OUT_OF_RANGE_INDEX;
    }
    return static_cast<int>(cell);
}
}

Grid::Grid(int width, int height, float cellSize)
    : m_width(width), m_height(height), m_cellSize(cellSize) {

    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive: " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument("Grid cell size must be positive: " + std::to_string(cellSize));
    }

    m_cells.assign(static_cast<size_t>(width) * static_cast<size_t>(height), CellData{});
    GRID_DEBUG("Created " + std::to_string(width) + "x" + std::to_string(height) +
               " grid, cell size " + std::to_string(cellSize));
}

CellType Grid::getCellType(int x, int y) const {
    if (!isInBounds(x, y)) return CellType::BLOCKED;
    return m_cells[index(x, y)].type;
}

void Grid::setCellType(int x, int y, CellType type) {
    if (!isInBounds(x, y)) return;
    m_cells[index(x, y)].type = type;
}

const CellData& Grid::getCellData(int x, int y) const {
    if (!isInBounds(x, y)) return BLOCKED_CELL;
    return m_cells[index(x, y)];
}

void Grid::setCellData(int x, int y, const CellData& data) {
    if (!isInBounds(x, y)) return;
    m_cells[index(x, y)] = data;
}

float Grid::getMovementSpeed(int x, int y) const {
    const CellData& cell = getCellData(x, y);
    if (cell.movementSpeed) {
        return *cell.movementSpeed;
    }

    switch (cell.type) {
        case CellType::PATH:
            return 1.2f;
        case CellType::ROUGH_TERRAIN:
            return 0.5f;
        case CellType::WATER:
        case CellType::BLOCKED:
        case CellType::OBSTACLE:
        case CellType::TOWER:
        case CellType::BORDER:
            return 0.0f;
        default:
            return 1.0f;
    }
}

GridPoint Grid::worldToGrid(const Vector2D& worldPos) const {
    return GridPoint{toCellIndex(worldPos.getX(), m_cellSize), toCellIndex(worldPos.getY(), m_cellSize)};
}

Vector2D Grid::gridToWorld(int x, int y) const {
    return Vector2D(x * m_cellSize + m_cellSize * 0.5f, y * m_cellSize + m_cellSize * 0.5f);
}

bool Grid::canPlaceTower(int x, int y) const {
    if (!isInBounds(x, y)) return false;
    CellType type = getCellType(x, y);
    return type == CellType::EMPTY || type == CellType::DECORATIVE;
}

bool Grid::isWalkable(int x, int y) const {
    switch (getCellType(x, y)) {
        case CellType::EMPTY:
        case CellType::PATH:
        case CellType::DECORATIVE:
        case CellType::ROUGH_TERRAIN:
        case CellType::BRIDGE:
        case CellType::SPAWN_ZONE:
            return true;
        default:
            return false;
    }
}

std::vector<GridPoint> Grid::getNeighbors(int x, int y) const {
    static constexpr int dx4[4] = {0, 1, 0, -1};
    static constexpr int dy4[4] = {-1, 0, 1, 0};

    std::vector<GridPoint> neighbors;
    neighbors.reserve(4);
    for (int i = 0; i < 4; ++i) {
        int nx = x + dx4[i];
        int ny = y + dy4[i];
        if (isInBounds(nx, ny)) {
            neighbors.push_back(GridPoint{nx, ny});
        }
    }
    return neighbors;
}

std::vector<GridPoint> Grid::getWalkableNeighbors(int x, int y) const {
    std::vector<GridPoint> neighbors = getNeighbors(x, y);
    neighbors.erase(std::remove_if(neighbors.begin(), neighbors.end(),
                                   [this](const GridPoint& p) { return !isWalkable(p.x, p.y); }),
                    neighbors.end());
    return neighbors;
}

std::vector<GridPoint> Grid::getCellsOfType(CellType type) const {
    std::vector<GridPoint> cells;
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (m_cells[index(x, y)].type == type) {
                cells.push_back(GridPoint{x, y});
            }
        }
    }
    return cells;
}

size_t Grid::countCellsOfType(CellType type) const {
    return static_cast<size_t>(std::count_if(m_cells.begin(), m_cells.end(),
                                             [type](const CellData& c) { return c.type == type; }));
}

void Grid::setPath(const std::vector<GridPoint>& cells) {
    // Previous path reverts to open ground
    for (const auto& p : m_pathCells) {
        if (getCellType(p.x, p.y) == CellType::PATH) {
            setCellType(p.x, p.y, CellType::EMPTY);
        }
    }

    m_pathCells.clear();
    for (const auto& p : cells) {
        if (!isInBounds(p.x, p.y)) continue;
        setCellType(p.x, p.y, CellType::PATH);
        m_pathCells.push_back(p);
    }
}

void Grid::addObstacles(const std::vector<GridPoint>& cells) {
    for (const auto& p : cells) {
        if (getCellType(p.x, p.y) == CellType::EMPTY) {
            setCellType(p.x, p.y, CellType::OBSTACLE);
        }
    }
}

void Grid::generateRandomObstacles(int count, uint32_t seed) {
    // Obstacles stay inside [3, size - 3] so edges and spawn lanes remain open
    const int minX = 3, maxX = m_width - 3;
    const int minY = 3, maxY = m_height - 3;
    if (count <= 0 || minX > maxX || minY > maxY) {
        GRID_DEBUG("Grid too small for random obstacles");
        return;
    }

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> distX(minX, maxX);
    std::uniform_int_distribution<int> distY(minY, maxY);

    int placed = 0;
    for (int attempt = 0; attempt < count; ++attempt) {
        int x = distX(rng);
        int y = distY(rng);
        if (getCellType(x, y) == CellType::EMPTY) {
            setCellType(x, y, CellType::OBSTACLE);
            ++placed;
        }
    }
    GRID_DEBUG("Placed " + std::to_string(placed) + " random obstacles");
}

void Grid::setBorders() {
    for (int x = 0; x < m_width; ++x) {
        setCellType(x, 0, CellType::BORDER);
        setCellType(x, m_height - 1, CellType::BORDER);
    }
    for (int y = 1; y < m_height - 1; ++y) {
        setCellType(0, y, CellType::BORDER);
        setCellType(m_width - 1, y, CellType::BORDER);
    }
}

void Grid::setSpawnZones(const std::vector<GridPoint>& cells) {
    for (const auto& p : cells) {
        setCellType(p.x, p.y, CellType::SPAWN_ZONE);
    }
}

void Grid::setCellHeight(int x, int y, float height) {
    if (!isInBounds(x, y)) return;
    m_cells[index(x, y)].height = std::clamp(height, 0.0f, 1.0f);
}

float Grid::getCellHeight(int x, int y) const {
    return getCellData(x, y).height.value_or(0.0f);
}

} // namespace TerraNav
