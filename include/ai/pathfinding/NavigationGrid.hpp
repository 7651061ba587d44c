/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_GRID_HPP
#define NAVIGATION_GRID_HPP

#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>
#include "ai/pathfinding/MovementSystem.hpp"
#include "utils/Vector2D.hpp"
#include "world/Grid.hpp"

namespace TerraNav {

struct NavigationCell {
    bool walkable{true};
    bool flyable{true};
    bool swimmable{false};
    float cost{1.0f};
    float distanceToNearestObstacle{std::numeric_limits<float>::infinity()};
};

/**
 * @brief Derived walk/fly/swim/cost overlay over a Grid.
 *
 * rebuild() recomputes everything from terrain plus the registered dynamic
 * obstacles, including an obstacle-distance field from a multi-source
 * flood fill. Adding or removing a dynamic obstacle only touches the cells in
 * its footprint; distanceToNearestObstacle stays as computed by the last
 * rebuild() until the next one (needsRebuild() reports this).
 */
class NavigationGrid {
public:
    // Invoked with every cell whose navigation data changed
    using ObstacleChangeCallback = std::function<void(const std::vector<GridPoint>& affectedCells)>;

    static constexpr float DEFAULT_OBSTACLE_BUFFER = 0.5f; // grid cells
    static constexpr int MAX_SAFE_SEARCH_RADIUS = 10;      // grid cells

    explicit NavigationGrid(const Grid& grid, float obstacleBuffer = DEFAULT_OBSTACLE_BUFFER);

    void rebuild();
    bool needsRebuild() const { return m_dirty; }

    /**
     * @brief Blocks the disk of cells around worldPos.
     * @return false if an obstacle is already registered at that cell
     */
    bool addDynamicObstacle(const Vector2D& worldPos, float radius);

    /**
     * @brief Restores the footprint registered at worldPos from terrain.
     * @return false if no obstacle was registered at that cell
     */
    bool removeDynamicObstacle(const Vector2D& worldPos);

    size_t getDynamicObstacleCount() const { return m_dynamicObstacles.size(); }

    bool isWalkable(int x, int y, MovementCapability capability) const;
    float getMovementCost(int x, int y) const;
    float getDistanceToObstacle(int x, int y) const;
    std::optional<NavigationCell> getDebugInfo(int x, int y) const;

    bool hasEnoughClearance(const Vector2D& worldPos, float entityRadius) const;
    std::optional<Vector2D> getNearestSafePosition(const Vector2D& target, float entityRadius,
                                                   MovementCapability capability) const;

    float getObstacleBuffer() const { return m_obstacleBuffer; }
    void setObstacleBuffer(float buffer);

    void setObstacleChangeListener(ObstacleChangeCallback callback) { m_listener = std::move(callback); }

    const Grid& getGrid() const { return m_grid; }

private:
    struct DynamicObstacle {
        GridPoint center;
        int gridRadius;
    };

    const Grid& m_grid;
    float m_obstacleBuffer;
    bool m_dirty{true};
    std::vector<NavigationCell> m_cells;
    boost::container::flat_map<uint64_t, DynamicObstacle> m_dynamicObstacles;
    ObstacleChangeCallback m_listener;

    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_grid.getWidth()) + static_cast<size_t>(x);
    }
    static uint64_t cellKey(const GridPoint& p) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) | static_cast<uint32_t>(p.y);
    }

    std::vector<GridPoint> footprint(const GridPoint& center, int gridRadius) const;
    void resetFromTerrain(int x, int y);
    void applyBuffer(NavigationCell& cell) const;
    void computeObstacleDistances();
    void stamp(const DynamicObstacle& obstacle);
    void notify(const std::vector<GridPoint>& cells) const;
};

} // namespace TerraNav

#endif // NAVIGATION_GRID_HPP
