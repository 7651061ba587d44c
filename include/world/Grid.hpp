/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_HPP
#define GRID_HPP

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "utils/Vector2D.hpp"

namespace TerraNav {

enum class CellType : uint8_t {
    EMPTY,
    PATH,
    TOWER,
    BLOCKED,
    OBSTACLE,
    DECORATIVE,
    ROUGH_TERRAIN,
    WATER,
    BRIDGE,
    SPAWN_ZONE,
    BORDER
};

enum class BiomeType : uint8_t {
    GRASSLAND,
    DESERT,
    FOREST,
    ARCTIC,
    VOLCANIC
};

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const CellType& type) {
    switch (type) {
        case CellType::EMPTY: return os << "EMPTY";
        case CellType::PATH: return os << "PATH";
        case CellType::TOWER: return os << "TOWER";
        case CellType::BLOCKED: return os << "BLOCKED";
        case CellType::OBSTACLE: return os << "OBSTACLE";
        case CellType::DECORATIVE: return os << "DECORATIVE";
        case CellType::ROUGH_TERRAIN: return os << "ROUGH_TERRAIN";
        case CellType::WATER: return os << "WATER";
        case CellType::BRIDGE: return os << "BRIDGE";
        case CellType::SPAWN_ZONE: return os << "SPAWN_ZONE";
        case CellType::BORDER: return os << "BORDER";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const BiomeType& biome) {
    switch (biome) {
        case BiomeType::GRASSLAND: return os << "GRASSLAND";
        case BiomeType::DESERT: return os << "DESERT";
        case BiomeType::FOREST: return os << "FOREST";
        case BiomeType::ARCTIC: return os << "ARCTIC";
        case BiomeType::VOLCANIC: return os << "VOLCANIC";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief One terrain cell. The type decides traversability and speed unless
 * movementSpeed overrides it.
 */
struct CellData {
    CellType type{CellType::EMPTY};
    std::optional<float> movementSpeed;
    std::optional<float> height;          // 0..1
    std::optional<int> biomeVariant;
    std::optional<std::string> decorationId;

    bool operator==(const CellData& other) const = default;
};

struct GridPoint {
    int x{0};
    int y{0};

    bool operator==(const GridPoint& other) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const GridPoint& p) {
    return os << "(" << p.x << ", " << p.y << ")";
}

/**
 * @brief Canonical terrain storage for one map session.
 *
 * Dimensions and cell size are fixed at construction. Queries outside the map
 * never fail: they answer as if the cell were BLOCKED.
 */
class Grid {
public:
    static constexpr float DEFAULT_CELL_SIZE = 32.0f;
    // Cell indices past this magnitude collapse to OUT_OF_RANGE_INDEX so that
    // differences and doubled differences of two indices stay inside int
    static constexpr int MAX_CELL_INDEX = std::numeric_limits<int>::max() / 4;
    static constexpr int OUT_OF_RANGE_INDEX = -1;

    Grid(int width, int height, float cellSize = DEFAULT_CELL_SIZE);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    float getCellSize() const { return m_cellSize; }

    bool isInBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }

    CellType getCellType(int x, int y) const;
    void setCellType(int x, int y, CellType type);

    // Out-of-bounds reads return a shared BLOCKED cell
    const CellData& getCellData(int x, int y) const;
    void setCellData(int x, int y, const CellData& data);

    float getMovementSpeed(int x, int y) const;

    // NaN, infinite and far-away coordinates map to OUT_OF_RANGE_INDEX on that axis
    GridPoint worldToGrid(const Vector2D& worldPos) const;
    Vector2D gridToWorld(int x, int y) const;
    Vector2D gridToWorld(const GridPoint& p) const { return gridToWorld(p.x, p.y); }

    bool canPlaceTower(int x, int y) const;
    bool isWalkable(int x, int y) const;

    // 4-connected, in-bounds only
    std::vector<GridPoint> getNeighbors(int x, int y) const;
    std::vector<GridPoint> getWalkableNeighbors(int x, int y) const;

    std::vector<GridPoint> getCellsOfType(CellType type) const;
    size_t countCellsOfType(CellType type) const;

    // Generation helpers
    void setPath(const std::vector<GridPoint>& cells);
    void addObstacles(const std::vector<GridPoint>& cells);
    void generateRandomObstacles(int count, uint32_t seed);
    void setBorders();
    void setSpawnZones(const std::vector<GridPoint>& cells);

    void setCellHeight(int x, int y, float height);
    float getCellHeight(int x, int y) const;

    void setBiome(BiomeType biome) { m_biome = biome; }
    BiomeType getBiome() const { return m_biome; }

private:
    int m_width;
    int m_height;
    float m_cellSize;
    BiomeType m_biome{BiomeType::GRASSLAND};
    std::vector<CellData> m_cells;
    std::vector<GridPoint> m_pathCells;

    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    }
};

} // namespace TerraNav

#endif // GRID_HPP
