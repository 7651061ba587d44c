/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/NavigationGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <queue>

namespace TerraNav {

namespace {
constexpr float INF = std::numeric_limits<float>::infinity();

bool seedsObstacleDistance(CellType type) {
    return type == CellType::OBSTACLE || type == CellType::BLOCKED ||
           type == CellType::BORDER || type == CellType::WATER;
}

// NaN and negative radii cover the centre cell only; huge ones stop at the map size
int radiusInCells(float radius, const Grid& grid) {
    const double cells = std::ceil(static_cast<double>(radius) / grid.getCellSize());
    if (!(cells > 0.0)) return 0;
    const int limit = std::max(grid.getWidth(), grid.getHeight());
    return cells >= limit ? limit : static_cast<int>(cells);
}
} // namespace

NavigationGrid::NavigationGrid(const Grid& grid, float obstacleBuffer)
    : m_grid(grid), m_obstacleBuffer(obstacleBuffer) {
    m_cells.resize(static_cast<size_t>(grid.getWidth()) * static_cast<size_t>(grid.getHeight()));
    rebuild();
}

void NavigationGrid::resetFromTerrain(int x, int y) {
    NavigationCell& cell = m_cells[index(x, y)];
    switch (m_grid.getCellType(x, y)) {
        case CellType::WATER:
            cell.walkable = false; cell.flyable = true; cell.swimmable = true; cell.cost = 1.0f;
            break;
        case CellType::OBSTACLE:
        case CellType::BLOCKED:
        case CellType::BORDER:
        case CellType::TOWER:
            cell.walkable = false; cell.flyable = false; cell.swimmable = false; cell.cost = INF;
            break;
        case CellType::ROUGH_TERRAIN:
            cell.walkable = true; cell.flyable = true; cell.swimmable = false; cell.cost = 2.0f;
            break;
        case CellType::BRIDGE:
            cell.walkable = true; cell.flyable = true; cell.swimmable = true; cell.cost = 1.0f;
            break;
        default: // EMPTY, PATH, SPAWN_ZONE, DECORATIVE
            cell.walkable = true; cell.flyable = true; cell.swimmable = false; cell.cost = 1.0f;
            break;
    }
}

void NavigationGrid::applyBuffer(NavigationCell& cell) const {
    if (cell.distanceToNearestObstacle < m_obstacleBuffer) {
        cell.cost *= 2.0f;
        if (cell.distanceToNearestObstacle == 0.0f) {
            cell.walkable = false;
        }
    }
}

std::vector<GridPoint> NavigationGrid::footprint(const GridPoint& center, int gridRadius) const {
    std::vector<GridPoint> cells;
    for (int dy = -gridRadius; dy <= gridRadius; ++dy) {
        for (int dx = -gridRadius; dx <= gridRadius; ++dx) {
            int x = center.x + dx;
            int y = center.y + dy;
            if (!m_grid.isInBounds(x, y)) continue;
            if (dx * dx + dy * dy <= gridRadius * gridRadius) {
                cells.push_back(GridPoint{x, y});
            }
        }
    }
    return cells;
}

void NavigationGrid::rebuild() {
    const int w = m_grid.getWidth();
    const int h = m_grid.getHeight();

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            resetFromTerrain(x, y);
        }
    }

    computeObstacleDistances();

    for (auto& cell : m_cells) {
        applyBuffer(cell);
    }

    for (const auto& [key, obstacle] : m_dynamicObstacles) {
        stamp(obstacle);
    }

    m_dirty = false;
    NAVGRID_DEBUG("Rebuilt " + std::to_string(w) + "x" + std::to_string(h) + " overlay with " +
                  std::to_string(m_dynamicObstacles.size()) + " dynamic obstacles");
}

void NavigationGrid::computeObstacleDistances() {
    const int w = m_grid.getWidth();
    const int h = m_grid.getHeight();

    // Multi-source BFS: every blocking terrain cell and every dynamic footprint starts at 0
    std::queue<GridPoint> frontier;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            NavigationCell& cell = m_cells[index(x, y)];
            if (seedsObstacleDistance(m_grid.getCellType(x, y))) {
                cell.distanceToNearestObstacle = 0.0f;
                frontier.push(GridPoint{x, y});
            } else {
                cell.distanceToNearestObstacle = INF;
            }
        }
    }
    for (const auto& [key, obstacle] : m_dynamicObstacles) {
        for (const auto& p : footprint(obstacle.center, obstacle.gridRadius)) {
            NavigationCell& cell = m_cells[index(p.x, p.y)];
            if (cell.distanceToNearestObstacle != 0.0f) {
                cell.distanceToNearestObstacle = 0.0f;
                frontier.push(p);
            }
        }
    }

    static constexpr int dx4[4] = {-1, 1, 0, 0};
    static constexpr int dy4[4] = {0, 0, -1, 1};

    while (!frontier.empty()) {
        GridPoint cur = frontier.front();
        frontier.pop();
        const float next = m_cells[index(cur.x, cur.y)].distanceToNearestObstacle + 1.0f;

        for (int i = 0; i < 4; ++i) {
            int nx = cur.x + dx4[i];
            int ny = cur.y + dy4[i];
            if (!m_grid.isInBounds(nx, ny)) continue;
            NavigationCell& neighbor = m_cells[index(nx, ny)];
            if (next < neighbor.distanceToNearestObstacle) {
                neighbor.distanceToNearestObstacle = next;
                frontier.push(GridPoint{nx, ny});
            }
        }
    }
}

void NavigationGrid::stamp(const DynamicObstacle& obstacle) {
    for (const auto& p : footprint(obstacle.center, obstacle.gridRadius)) {
        NavigationCell& cell = m_cells[index(p.x, p.y)];
        cell.walkable = false;
        cell.cost = INF;
    }
}

void NavigationGrid::notify(const std::vector<GridPoint>& cells) const {
    if (m_listener && !cells.empty()) {
        m_listener(cells);
    }
}

bool NavigationGrid::addDynamicObstacle(const Vector2D& worldPos, float radius) {
    GridPoint center = m_grid.worldToGrid(worldPos);
    if (!m_grid.isInBounds(center.x, center.y)) {
        NAVGRID_WARN("Ignoring dynamic obstacle outside the map at (" + std::to_string(center.x) +
                     "," + std::to_string(center.y) + ")");
        return false;
    }

    uint64_t key = cellKey(center);
    if (m_dynamicObstacles.find(key) != m_dynamicObstacles.end()) {
        return false;
    }

    int gridRadius = radiusInCells(radius, m_grid);
    DynamicObstacle obstacle{center, gridRadius};
    m_dynamicObstacles.emplace(key, obstacle);
    stamp(obstacle);
    m_dirty = true;

    NAVGRID_DEBUG("Dynamic obstacle added at (" + std::to_string(center.x) + "," +
                  std::to_string(center.y) + ") radius " + std::to_string(gridRadius));
    notify(footprint(center, gridRadius));
    return true;
}

bool NavigationGrid::removeDynamicObstacle(const Vector2D& worldPos) {
    GridPoint center = m_grid.worldToGrid(worldPos);
    auto it = m_dynamicObstacles.find(cellKey(center));
    if (it == m_dynamicObstacles.end()) {
        return false;
    }

    DynamicObstacle removed = it->second;
    m_dynamicObstacles.erase(it);

    std::vector<GridPoint> affected = footprint(removed.center, removed.gridRadius);
    for (const auto& p : affected) {
        resetFromTerrain(p.x, p.y);
        NavigationCell& cell = m_cells[index(p.x, p.y)];
        // A zero left by a rebuild taken while the obstacle stood is stale; the
        // exact distance returns with the next rebuild()
        if (cell.distanceToNearestObstacle == 0.0f && !seedsObstacleDistance(m_grid.getCellType(p.x, p.y))) {
            cell.distanceToNearestObstacle = 1.0f;
        }
        applyBuffer(cell);
    }
    // Overlapping footprints keep their cells blocked
    for (const auto& [key, obstacle] : m_dynamicObstacles) {
        stamp(obstacle);
    }
    m_dirty = true;

    NAVGRID_DEBUG("Dynamic obstacle removed at (" + std::to_string(center.x) + "," +
                  std::to_string(center.y) + ")");
    notify(affected);
    return true;
}

bool NavigationGrid::isWalkable(int x, int y, MovementCapability capability) const {
    if (!m_grid.isInBounds(x, y)) return false;
    const NavigationCell& cell = m_cells[index(x, y)];

    switch (capability) {
        case MovementCapability::WALKING:
            return cell.walkable;
        case MovementCapability::FLYING:
            return cell.flyable;
        case MovementCapability::SWIMMING:
            return cell.swimmable;
        case MovementCapability::AMPHIBIOUS:
            return cell.walkable || cell.swimmable;
        case MovementCapability::ALL_TERRAIN:
            return cell.walkable || cell.flyable || cell.swimmable;
        default:
            return cell.walkable;
    }
}

float NavigationGrid::getMovementCost(int x, int y) const {
    if (!m_grid.isInBounds(x, y)) return INF;
    return m_cells[index(x, y)].cost;
}

float NavigationGrid::getDistanceToObstacle(int x, int y) const {
    if (!m_grid.isInBounds(x, y)) return 0.0f;
    return m_cells[index(x, y)].distanceToNearestObstacle;
}

std::optional<NavigationCell> NavigationGrid::getDebugInfo(int x, int y) const {
    if (!m_grid.isInBounds(x, y)) return std::nullopt;
    return m_cells[index(x, y)];
}

bool NavigationGrid::hasEnoughClearance(const Vector2D& worldPos, float entityRadius) const {
    GridPoint center = m_grid.worldToGrid(worldPos);
    int gridRadius = radiusInCells(entityRadius, m_grid);

    for (int dy = -gridRadius; dy <= gridRadius; ++dy) {
        for (int dx = -gridRadius; dx <= gridRadius; ++dx) {
            if (dx * dx + dy * dy > gridRadius * gridRadius) continue;
            int x = center.x + dx;
            int y = center.y + dy;
            if (!m_grid.isInBounds(x, y) || !m_cells[index(x, y)].walkable) {
                return false;
            }
        }
    }
    return true;
}

std::optional<Vector2D> NavigationGrid::getNearestSafePosition(const Vector2D& target, float entityRadius,
                                                               MovementCapability capability) const {
    GridPoint origin = m_grid.worldToGrid(target);
    if (isWalkable(origin.x, origin.y, capability) && hasEnoughClearance(target, entityRadius)) {
        return target;
    }

    for (int r = 1; r <= MAX_SAFE_SEARCH_RADIUS; ++r) {
        std::optional<Vector2D> best;
        float bestDistSq = INF;

        for (int dy = -r; dy <= r; ++dy) {
            for (int dx = -r; dx <= r; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != r) continue; // ring only
                int x = origin.x + dx;
                int y = origin.y + dy;
                if (!isWalkable(x, y, capability)) continue;

                Vector2D candidate = m_grid.gridToWorld(x, y);
                if (!hasEnoughClearance(candidate, entityRadius)) continue;

                float distSq = Vector2D::distanceSquared(candidate, target);
                if (distSq < bestDistSq) {
                    bestDistSq = distSq;
                    best = candidate;
                }
            }
        }

        if (best) {
            return best;
        }
    }
    return std::nullopt;
}

void NavigationGrid::setObstacleBuffer(float buffer) {
    m_obstacleBuffer = buffer;
    m_dirty = true;
}

} // namespace TerraNav
