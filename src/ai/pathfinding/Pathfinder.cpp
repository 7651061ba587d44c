/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/Pathfinder.hpp"
#include "ai/pathfinding/PathSmoother.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <numbers>
#include <optional>
#include <string>

namespace TerraNav {

namespace {
constexpr int ALTERNATIVE_RADII[] = {1, 2, 3, 5, 8};
constexpr int ALTERNATIVE_ANGLES = 16;
constexpr int RELAXED_ITERATION_FACTOR = 3;

std::string cellString(const GridPoint& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}

float angularDistance(float a, float b) {
    float diff = std::fabs(a - b);
    while (diff > 2.0f * std::numbers::pi_v<float>) {
        diff -= 2.0f * std::numbers::pi_v<float>;
    }
    return std::min(diff, 2.0f * std::numbers::pi_v<float> - diff);
}
} // namespace

Pathfinder::Pathfinder(Grid& grid, MovementSystem& movement, NavigationGrid* navigation)
    : m_grid(grid), m_movement(movement), m_navigation(navigation) {
    if (m_navigation) {
        m_navigation->setObstacleChangeListener([this](const std::vector<GridPoint>& cells) {
            m_cache.invalidateCells(cells);
        });
    }
}

Pathfinder::~Pathfinder() {
    unbindSettings();
    if (m_navigation) {
        m_navigation->setObstacleChangeListener(nullptr);
    }
}

PathfindingResult Pathfinder::findPath(const Vector2D& start, const Vector2D& goal) {
    return findPath(start, goal, m_defaultOptions);
}

PathfindingResult Pathfinder::findPath(const Vector2D& start, const Vector2D& goal,
                                       const PathfindingOptions& options) {
    PathfindingResult result = resolvePath(start, goal, options);
    recordResult(result);
    return result;
}

PathfindingResult Pathfinder::resolvePath(const Vector2D& start, const Vector2D& goal,
                                          const PathfindingOptions& options) {
    GridPoint startCell = m_grid.worldToGrid(start);
    GridPoint goalCell = m_grid.worldToGrid(goal);

    if (!m_grid.isInBounds(startCell.x, startCell.y)) {
        PATHFIND_DEBUG("findPath: INVALID_START " + cellString(startCell) + " out of bounds");
        return PathfindingResult::failure(PathfindingStatus::INVALID_START);
    }
    if (!m_grid.isInBounds(goalCell.x, goalCell.y)) {
        PATHFIND_DEBUG("findPath: INVALID_GOAL " + cellString(goalCell) + " out of bounds");
        return PathfindingResult::failure(PathfindingStatus::INVALID_GOAL);
    }

    ensureNavigationCurrent();

    if (options.predictiveTarget) {
        goalCell = predictGoal(goalCell, goal, options);
    }

    NavInternal::PathCacheKey key{startCell, goalCell, options.movementType, optionsSignature(options)};
    if (options.useCache) {
        if (auto cached = m_cache.find(key)) {
            m_stats.cacheHits++;
            return *cached;
        }
    }

    if (!isTraversable(goalCell.x, goalCell.y, options.movementType)) {
        PATHFIND_DEBUG("findPath: INVALID_GOAL " + cellString(goalCell) + " not traversable");
        return PathfindingResult::failure(PathfindingStatus::INVALID_GOAL);
    }

    if (startCell == goalCell) {
        PathfindingResult result;
        result.path.push_back(m_grid.gridToWorld(goalCell));
        result.success = true;
        result.status = PathfindingStatus::SUCCESS;
        return result;
    }

    std::vector<GridPoint> cells;
    PathfindingResult result = search(startCell, goalCell, options, cells);

    if (result.success) {
        if (options.smoothPath && result.path.size() > 2) {
            result.path = smoothPath(result.path, options);
        }
        if (options.useCache) {
            // Smoothed segments may cross cells the raw route did not
            std::vector<GridPoint> traversed = cells;
            for (size_t i = 1; i < result.path.size(); ++i) {
                appendSegmentCells(m_grid.worldToGrid(result.path[i - 1]),
                                   m_grid.worldToGrid(result.path[i]), traversed);
            }
            m_cache.store(key, result, traversed);
        }
    }
    return result;
}

PathfindingResult Pathfinder::search(const GridPoint& start, const GridPoint& goal,
                                     const PathfindingOptions& options, std::vector<GridPoint>& outCells) {
    const int W = m_grid.getWidth();
    const int H = m_grid.getHeight();
    auto idx = [W](int x, int y) { return static_cast<size_t>(y) * static_cast<size_t>(W) + static_cast<size_t>(x); };
    auto h = [&goal](int x, int y) {
        float dx = static_cast<float>(x - goal.x);
        float dy = static_cast<float>(y - goal.y);
        return std::sqrt(dx * dx + dy * dy);
    };

    m_nodePool.ensureCapacity(static_cast<size_t>(W) * static_cast<size_t>(H));
    m_nodePool.reset();

    auto& open = m_nodePool.openQueue;
    auto& gScore = m_nodePool.gScoreBuffer;
    auto& parent = m_nodePool.parentBuffer;
    auto& closed = m_nodePool.closedBuffer;

    gScore[idx(start.x, start.y)] = 0.0f;
    open.push(NodePool::Node{start.x, start.y, h(start.x, start.y)});

    // Cardinal first (up, right, down, left), then diagonals
    constexpr int dx8[8] = {0, 1, 0, -1, -1, 1, 1, -1};
    constexpr int dy8[8] = {-1, 0, 1, 0, -1, -1, 1, 1};
    const int dirs = options.allowDiagonal ? 8 : 4;

    int iterations = 0;
    bool found = false;
    bool budgetExhausted = false;

    while (!open.empty()) {
        NodePool::Node current = open.top();
        open.pop();

        size_t ci = idx(current.x, current.y);
        if (closed[ci]) continue; // stale queue entry

        if (iterations >= options.maxIterations) {
            budgetExhausted = true;
            break;
        }
        ++iterations;

        if (current.x == goal.x && current.y == goal.y) {
            found = true;
            break;
        }
        closed[ci] = 1;

        for (int i = 0; i < dirs; ++i) {
            int nx = current.x + dx8[i];
            int ny = current.y + dy8[i];
            if (!m_grid.isInBounds(nx, ny)) continue;

            size_t ni = idx(nx, ny);
            if (closed[ni]) continue;
            if (!isValidPosition(nx, ny, options)) continue;
            if (i >= 4 && !isDiagonalAllowed(current.x, current.y, nx, ny, options.movementType)) continue;

            float tentativeG = gScore[ci] + stepCost(current.x, current.y, nx, ny, options);
            if (tentativeG < gScore[ni]) {
                gScore[ni] = tentativeG;
                parent[ni] = static_cast<int>(ci);
                open.push(NodePool::Node{nx, ny, tentativeG + h(nx, ny)});
            }
        }
    }

    if (!found) {
        PathfindingStatus status = budgetExhausted ? PathfindingStatus::TIMEOUT : PathfindingStatus::NO_PATH_FOUND;
        PATHFIND_DEBUG("A* " + cellString(start) + " -> " + cellString(goal) + " failed after " +
                       std::to_string(iterations) + " iterations");
        return PathfindingResult::failure(status, iterations);
    }

    outCells.clear();
    for (int cur = static_cast<int>(idx(goal.x, goal.y)); cur != -1; cur = parent[static_cast<size_t>(cur)]) {
        outCells.push_back(GridPoint{cur % W, cur / W});
    }
    std::reverse(outCells.begin(), outCells.end());

    PathfindingResult result;
    result.path.reserve(outCells.size());
    for (const auto& p : outCells) {
        result.path.push_back(m_grid.gridToWorld(p));
    }
    result.success = true;
    result.iterations = iterations;
    result.cost = gScore[idx(goal.x, goal.y)];
    result.status = PathfindingStatus::SUCCESS;
    return result;
}

bool Pathfinder::isTraversable(int x, int y, MovementCapability movementType) const {
    if (!m_grid.isInBounds(x, y)) return false;
    if (!m_movement.canMoveOnTerrain(movementType, m_grid.getCellType(x, y))) return false;
    return !m_navigation || m_navigation->isWalkable(x, y, movementType);
}

bool Pathfinder::isValidPosition(int x, int y, const PathfindingOptions& options) const {
    if (!isTraversable(x, y, options.movementType)) return false;

    if (options.minDistanceFromObstacles > 0.0f) {
        const int radius = static_cast<int>(std::min(std::ceil(options.minDistanceFromObstacles),
            static_cast<float>(std::max(m_grid.getWidth(), m_grid.getHeight()))));
        for (int dy = -radius; dy <= radius; ++dy) {
            for (int dx = -radius; dx <= radius; ++dx) {
                int cx = x + dx;
                int cy = y + dy;
                if (!m_grid.isInBounds(cx, cy) || isTraversable(cx, cy, options.movementType)) continue;
                float distance = std::sqrt(static_cast<float>(dx * dx + dy * dy));
                if (distance < options.minDistanceFromObstacles) {
                    return false;
                }
            }
        }
    }
    return true;
}

bool Pathfinder::isDiagonalAllowed(int fromX, int fromY, int toX, int toY, MovementCapability movementType) const {
    if (isTraversable(toX, fromY, movementType) && isTraversable(fromX, toY, movementType)) {
        return true;
    }
    // Bridges may be entered or skirted diagonally
    return m_grid.getCellType(toX, toY) == CellType::BRIDGE ||
           m_grid.getCellType(toX, fromY) == CellType::BRIDGE ||
           m_grid.getCellType(fromX, toY) == CellType::BRIDGE;
}

float Pathfinder::stepCost(int fromX, int fromY, int toX, int toY, const PathfindingOptions& options) const {
    float dx = static_cast<float>(toX - fromX);
    float dy = static_cast<float>(toY - fromY);
    float distance = std::sqrt(dx * dx + dy * dy);

    float speed = m_movement.getSpeedMultiplier(options.movementType, m_grid.getCellData(toX, toY));
    float terrainCost = speed > 0.0f ? 1.0f / speed : UNWALKABLE_STEP_COST;

    float cost = distance * terrainCost * options.terrainCostMultiplier;
    if (m_navigation && options.movementType != MovementCapability::FLYING &&
        m_navigation->getDistanceToObstacle(toX, toY) < m_navigation->getObstacleBuffer()) {
        cost *= CLEARANCE_PENALTY;
    }
    return cost;
}

GridPoint Pathfinder::predictGoal(const GridPoint& goal, const Vector2D& goalWorld,
                                  const PathfindingOptions& options) const {
    Vector2D projected = goalWorld + options.targetVelocity * options.predictionTime;
    GridPoint predicted = m_grid.worldToGrid(projected);
    if (isTraversable(predicted.x, predicted.y, options.movementType)) {
        return predicted;
    }
    return goal;
}

std::vector<Vector2D> Pathfinder::smoothPath(const std::vector<Vector2D>& path,
                                             const PathfindingOptions& options) const {
    return PathSmoother::smooth(path, [this, &options](const Vector2D& a, const Vector2D& b) {
        return hasLineOfSight(a, b, options);
    });
}

bool Pathfinder::hasLineOfSight(const Vector2D& from, const Vector2D& to, const PathfindingOptions& options) const {
    GridPoint a = m_grid.worldToGrid(from);
    GridPoint b = m_grid.worldToGrid(to);

    // Bresenham; every cell before the endpoint must be valid
    const int dx = std::abs(b.x - a.x);
    const int dy = std::abs(b.y - a.y);
    const int sx = a.x < b.x ? 1 : -1;
    const int sy = a.y < b.y ? 1 : -1;
    int err = dx - dy;
    int x = a.x;
    int y = a.y;

    while (x != b.x || y != b.y) {
        if (!isValidPosition(x, y, options)) {
            return false;
        }

        int nx = x;
        int ny = y;
        const int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            nx += sx;
        }
        if (e2 < dx) {
            err += dx;
            ny += sy;
        }
        if (nx != x && ny != y && !isDiagonalAllowed(x, y, nx, ny, options.movementType)) {
            return false;
        }
        x = nx;
        y = ny;
    }
    return true;
}

bool Pathfinder::validatePath(const std::vector<Vector2D>& path, MovementCapability movementType) const {
    if (path.empty()) return false;

    PathfindingOptions options;
    options.movementType = movementType;

    for (size_t i = 0; i < path.size(); ++i) {
        GridPoint p = m_grid.worldToGrid(path[i]);
        if (!isTraversable(p.x, p.y, movementType)) {
            return false;
        }
        if (i > 0 && !hasLineOfSight(path[i - 1], path[i], options)) {
            return false;
        }
    }
    return true;
}

PathfindingResult Pathfinder::findPathWithFallback(const Vector2D& start, const Vector2D& goal,
                                                   const PathfindingOptions& options) {
    // One caller request; the ladder's internal attempts are not recorded
    PathfindingResult result = resolveWithFallback(start, goal, options);
    recordResult(result);
    return result;
}

PathfindingResult Pathfinder::resolveWithFallback(const Vector2D& start, const Vector2D& goal,
                                                  const PathfindingOptions& options) {
    PathfindingResult primary = resolvePath(start, goal, options);
    if (primary.success || primary.status == PathfindingStatus::INVALID_START) {
        return primary;
    }

    PathfindingOptions relaxed = options;
    relaxed.minDistanceFromObstacles = 0.0f;
    relaxed.maxIterations =
        clampIterationBudget(static_cast<int64_t>(options.maxIterations) * RELAXED_ITERATION_FACTOR);
    PathfindingResult result = resolvePath(start, goal, relaxed);
    if (result.success) {
        PATHFIND_DEBUG("Fallback: relaxed search succeeded");
        m_stats.fallbackPaths++;
        return result;
    }

    result = resolveAlternative(start, goal, relaxed);
    if (result.success) {
        m_stats.fallbackPaths++;
        return result;
    }

    GridPoint startCell = m_grid.worldToGrid(start);
    GridPoint goalCell = m_grid.worldToGrid(goal);
    goalCell.x = std::clamp(goalCell.x, 0, m_grid.getWidth() - 1);
    goalCell.y = std::clamp(goalCell.y, 0, m_grid.getHeight() - 1);

    result = emergencyPath(startCell, goalCell, options);
    if (result.success) {
        PATHFIND_WARN("Fallback: emergency path " + cellString(startCell) + " -> " + cellString(goalCell) +
                      " with " + std::to_string(result.path.size()) + " waypoints");
        m_stats.fallbackPaths++;
        return result;
    }
    return primary;
}

PathfindingResult Pathfinder::findAlternativePath(const Vector2D& start, const Vector2D& goal,
                                                  const PathfindingOptions& options) {
    PathfindingResult result = resolveAlternative(start, goal, options);
    recordResult(result);
    return result;
}

PathfindingResult Pathfinder::resolveAlternative(const Vector2D& start, const Vector2D& goal,
                                                 const PathfindingOptions& options) {
    const float cellSize = m_grid.getCellSize();
    const float bearing = std::atan2(start.getY() - goal.getY(), start.getX() - goal.getX());
    GridPoint startCell = m_grid.worldToGrid(start);
    GridPoint goalCell = m_grid.worldToGrid(goal);

    struct Candidate {
        Vector2D position;
        float angleOffset;
    };

    int lastIterations = 0;
    for (int radius : ALTERNATIVE_RADII) {
        std::vector<Candidate> candidates;
        std::vector<GridPoint> seen;

        for (int i = 0; i < ALTERNATIVE_ANGLES; ++i) {
            float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) / ALTERNATIVE_ANGLES;
            Vector2D offset(std::cos(angle), std::sin(angle));
            Vector2D position = goal + offset * (static_cast<float>(radius) * cellSize);

            GridPoint cell = m_grid.worldToGrid(position);
            if (cell == goalCell || cell == startCell ||
                std::find(seen.begin(), seen.end(), cell) != seen.end()) continue;
            seen.push_back(cell);
            if (!isTraversable(cell.x, cell.y, options.movementType)) continue;

            candidates.push_back(Candidate{m_grid.gridToWorld(cell), angularDistance(angle, bearing)});
        }

        std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return a.angleOffset < b.angleOffset;
        });

        for (const auto& candidate : candidates) {
            PathfindingResult result = resolvePath(start, candidate.position, options);
            lastIterations = result.iterations;
            if (result.success) {
                PATHFIND_DEBUG("Alternative goal at radius " + std::to_string(radius) + " reached");
                return result;
            }
        }
    }
    return PathfindingResult::failure(PathfindingStatus::NO_PATH_FOUND, lastIterations);
}

PathfindingResult Pathfinder::emergencyPath(const GridPoint& start, const GridPoint& goal,
                                            const PathfindingOptions& options) const {
    PathfindingResult result;
    result.path.push_back(m_grid.gridToWorld(start));

    const int steps = std::max(std::abs(goal.x - start.x), std::abs(goal.y - start.y));
    if (steps == 0) {
        return result;
    }

    Vector2D direction(static_cast<float>(goal.x - start.x), static_cast<float>(goal.y - start.y));
    Vector2D side = direction.normalized().perpendicular();
    const int maxDeflection = static_cast<int>(EMERGENCY_DEFLECTION_CELLS);

    GridPoint last = start;
    for (int i = 1; i <= steps; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(steps);
        GridPoint target{start.x + static_cast<int>(std::lround((goal.x - start.x) * t)),
                         start.y + static_cast<int>(std::lround((goal.y - start.y) * t))};

        std::optional<GridPoint> next;
        if (isTraversable(target.x, target.y, options.movementType)) {
            next = target;
        } else {
            for (int k = 1; k <= maxDeflection && !next; ++k) {
                for (int sign : {1, -1}) {
                    GridPoint deflected{target.x + static_cast<int>(std::lround(side.getX() * k * sign)),
                                        target.y + static_cast<int>(std::lround(side.getY() * k * sign))};
                    if (isTraversable(deflected.x, deflected.y, options.movementType)) {
                        next = deflected;
                        break;
                    }
                }
            }
        }
        if (!next) break;
        if (*next == last) continue;

        float dx = static_cast<float>(next->x - last.x);
        float dy = static_cast<float>(next->y - last.y);
        result.cost += std::sqrt(dx * dx + dy * dy);
        result.path.push_back(m_grid.gridToWorld(*next));
        last = *next;
    }

    result.iterations = steps;
    if (result.path.size() > 1) {
        result.success = true;
        result.status = PathfindingStatus::PARTIAL;
    }
    return result;
}

void Pathfinder::appendSegmentCells(const GridPoint& from, const GridPoint& to, std::vector<GridPoint>& out) const {
    const int dx = std::abs(to.x - from.x);
    const int dy = std::abs(to.y - from.y);
    const int sx = from.x < to.x ? 1 : -1;
    const int sy = from.y < to.y ? 1 : -1;
    int err = dx - dy;
    int x = from.x;
    int y = from.y;

    out.push_back(GridPoint{x, y});
    while (x != to.x || y != to.y) {
        const int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
        out.push_back(GridPoint{x, y});
    }
}

bool Pathfinder::arePointsConnected(const Vector2D& a, const Vector2D& b, MovementCapability movementType) {
    PathfindingOptions options;
    options.movementType = movementType;
    options.maxIterations = clampIterationBudget(static_cast<int64_t>(m_grid.getWidth()) * m_grid.getHeight());
    options.smoothPath = false;
    options.useCache = false;
    return findPath(a, b, options).success;
}

bool Pathfinder::onStructurePlaced(const Vector2D& worldPos, float radius) {
    if (!m_navigation) {
        PATHFIND_WARN("Structure placed without a navigation overlay; cached routes kept");
        return false;
    }
    return m_navigation->addDynamicObstacle(worldPos, radius);
}

bool Pathfinder::onStructureRemoved(const Vector2D& worldPos) {
    if (!m_navigation) {
        PATHFIND_WARN("Structure removed without a navigation overlay; cached routes kept");
        return false;
    }
    return m_navigation->removeDynamicObstacle(worldPos);
}

void Pathfinder::clearCache() {
    m_cache.clear();
}

size_t Pathfinder::invalidateCacheForCell(int gx, int gy) {
    return m_cache.invalidateCell(gx, gy);
}

void Pathfinder::resetForNewMap() {
    m_cache.clear();
    m_movement.clearCache();
    if (m_navigation) {
        m_navigation->rebuild();
    }
    resetStats();
    PATHFIND_INFO("Pathfinder reset for a " + std::to_string(m_grid.getWidth()) + "x" +
                  std::to_string(m_grid.getHeight()) + " map");
}

void Pathfinder::applySettings(const NavigationSettings& settings) {
    m_defaultOptions = settings.buildPathfindingOptions();
    applyCacheCapacity(settings);
    applyObstacleBuffer(settings);
    m_cache.clear();
    PATHFIND_INFO("Applied navigation settings (cache capacity " + std::to_string(m_cache.getCapacity()) + ")");
}

void Pathfinder::bindSettings(NavigationSettings& settings) {
    unbindSettings();
    applySettings(settings);
    m_boundSettings = &settings;

    auto listener = [this](const std::string& category, const std::string& key,
                           const NavigationSettings::SettingValue&) {
        onSettingChanged(category, key);
    };
    m_settingsListeners.push_back(
        settings.registerChangeListener(NavigationSettings::PATHFINDING_CATEGORY, listener));
    m_settingsListeners.push_back(
        settings.registerChangeListener(NavigationSettings::NAVIGATION_CATEGORY, listener));
}

void Pathfinder::unbindSettings() {
    if (!m_boundSettings) return;
    for (size_t id : m_settingsListeners) {
        m_boundSettings->unregisterChangeListener(id);
    }
    m_settingsListeners.clear();
    m_boundSettings = nullptr;
}

void Pathfinder::onSettingChanged(const std::string& category, const std::string& key) {
    if (category == NavigationSettings::PATHFINDING_CATEGORY) {
        m_defaultOptions = m_boundSettings->buildPathfindingOptions();
        PATHFIND_DEBUG("Default search options refreshed after " + category + "." + key + " changed");
    } else if (key == "cache_capacity") {
        applyCacheCapacity(*m_boundSettings);
    } else if (key == "obstacle_buffer" && m_navigation) {
        applyObstacleBuffer(*m_boundSettings);
        m_cache.clear();
    }
}

void Pathfinder::applyCacheCapacity(const NavigationSettings& settings) {
    int capacity = settings.get<int>(NavigationSettings::NAVIGATION_CATEGORY, "cache_capacity",
                                     static_cast<int>(NavInternal::PathCache::DEFAULT_CAPACITY));
    m_cache.setCapacity(static_cast<size_t>(std::max(1, capacity)));
}

void Pathfinder::applyObstacleBuffer(const NavigationSettings& settings) {
    if (!m_navigation) return;
    m_navigation->setObstacleBuffer(settings.get<float>(NavigationSettings::NAVIGATION_CATEGORY, "obstacle_buffer",
                                                        NavigationGrid::DEFAULT_OBSTACLE_BUFFER));
}

uint32_t Pathfinder::optionsSignature(const PathfindingOptions& options) {
    // Only options that change the shape or cost of a route
    uint64_t seed = 0;
    auto combine = [&seed](uint64_t value) { seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2); };
    combine(options.allowDiagonal ? 1u : 0u);
    combine(options.smoothPath ? 1u : 0u);
    combine(std::hash<float>{}(options.minDistanceFromObstacles));
    combine(std::hash<float>{}(options.terrainCostMultiplier));
    return static_cast<uint32_t>(seed ^ (seed >> 32));
}

void Pathfinder::ensureNavigationCurrent() {
    if (m_navigation && m_navigation->needsRebuild()) {
        m_navigation->rebuild();
    }
}

void Pathfinder::recordResult(const PathfindingResult& result) {
    m_stats.totalRequests++;
    m_stats.totalIterations += static_cast<uint64_t>(result.iterations);

    switch (result.status) {
        case PathfindingStatus::SUCCESS:
        case PathfindingStatus::PARTIAL:
            m_stats.successfulPaths++;
            m_pathLengthSum += result.path.size();
            m_stats.avgPathLength = static_cast<uint32_t>(m_pathLengthSum / m_stats.successfulPaths);
            break;
        case PathfindingStatus::TIMEOUT: m_stats.timeouts++; break;
        case PathfindingStatus::NO_PATH_FOUND: m_stats.noPathFound++; break;
        case PathfindingStatus::INVALID_START: m_stats.invalidStarts++; break;
        case PathfindingStatus::INVALID_GOAL: m_stats.invalidGoals++; break;
    }
}

} // namespace TerraNav
