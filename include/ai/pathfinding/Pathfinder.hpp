/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <queue>
#include <vector>
#include "ai/internal/PathCache.hpp"
#include "ai/pathfinding/MovementSystem.hpp"
#include "ai/pathfinding/NavigationGrid.hpp"
#include "ai/pathfinding/PathfindingTypes.hpp"
#include "core/NavigationSettings.hpp"
#include "utils/Vector2D.hpp"
#include "world/Grid.hpp"

namespace TerraNav {

/**
 * @brief A* route engine for one map session.
 *
 * Traversability comes from the MovementSystem rule table and, when a
 * NavigationGrid is attached, from its overlay (dynamic obstacles, clearance
 * penalty). The attached overlay reports obstacle changes back so that only
 * the cached routes crossing the affected cells are dropped.
 *
 * Grid, MovementSystem and NavigationGrid must outlive the Pathfinder. Bound
 * NavigationSettings must outlive the binding (see bindSettings()).
 */
class Pathfinder {
public:
    static constexpr float UNWALKABLE_STEP_COST = 10.0f; // 1/speed stand-in when speed is 0
    static constexpr float CLEARANCE_PENALTY = 2.0f;
    static constexpr float EMERGENCY_DEFLECTION_CELLS = 2.0f;

    Pathfinder(Grid& grid, MovementSystem& movement, NavigationGrid* navigation = nullptr);
    ~Pathfinder();

    Pathfinder(const Pathfinder&) = delete;
    Pathfinder& operator=(const Pathfinder&) = delete;

    PathfindingResult findPath(const Vector2D& start, const Vector2D& goal);
    PathfindingResult findPath(const Vector2D& start, const Vector2D& goal, const PathfindingOptions& options);

    /**
     * @brief findPath, then relaxed clearance, then nearby goals, then a
     * best-effort straight walk (status PARTIAL).
     */
    PathfindingResult findPathWithFallback(const Vector2D& start, const Vector2D& goal,
                                           const PathfindingOptions& options);

    // Route to the best reachable point on rings around the goal
    PathfindingResult findAlternativePath(const Vector2D& start, const Vector2D& goal,
                                          const PathfindingOptions& options);

    bool arePointsConnected(const Vector2D& a, const Vector2D& b,
                            MovementCapability movementType = MovementCapability::WALKING);

    std::vector<Vector2D> smoothPath(const std::vector<Vector2D>& path, const PathfindingOptions& options) const;
    bool validatePath(const std::vector<Vector2D>& path, MovementCapability movementType) const;
    bool hasLineOfSight(const Vector2D& from, const Vector2D& to, const PathfindingOptions& options) const;

    // Dynamic obstacle hooks; both return false without an attached NavigationGrid
    bool onStructurePlaced(const Vector2D& worldPos, float radius);
    bool onStructureRemoved(const Vector2D& worldPos);

    void clearCache();
    size_t invalidateCacheForCell(int gx, int gy);
    size_t getCacheSize() const { return m_cache.size(); }
    NavInternal::PathCacheStats getCacheStats() const { return m_cache.getStats(); }

    // Drop every per-map cache and recompute the overlay
    void resetForNewMap();

    // One-off copy of the current values; later edits are not seen
    void applySettings(const NavigationSettings& settings);

    /**
     * @brief applySettings(), then follows pathfinding and navigation changes
     *
     * Option changes refresh the defaults and keep cached routes, whose keys
     * already carry the options they were found with. A new cache capacity
     * evicts down to size; a new obstacle buffer drops every cached route.
     * Replaces any previous binding.
     */
    void bindSettings(NavigationSettings& settings);
    void unbindSettings();

    const PathfindingOptions& getDefaultOptions() const { return m_defaultOptions; }
    void setDefaultOptions(const PathfindingOptions& options) { m_defaultOptions = options; }

    // Statistics
    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t timeouts{0};
        uint64_t noPathFound{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t cacheHits{0};
        uint64_t fallbackPaths{0};
        uint64_t totalIterations{0};
        uint32_t avgPathLength{0};
    };

    void resetStats() {
        m_stats = PathfindingStats{};
        m_pathLengthSum = 0;
    }
    const PathfindingStats& getStats() const { return m_stats; }

    bool isTraversable(int x, int y, MovementCapability movementType) const;
    const Grid& getGrid() const { return m_grid; }

private:
    Grid& m_grid;
    MovementSystem& m_movement;
    NavigationGrid* m_navigation;

    NavInternal::PathCache m_cache;
    PathfindingOptions m_defaultOptions;
    PathfindingStats m_stats{};
    uint64_t m_pathLengthSum{0};

    // Search buffers reused between requests
    struct NodePool {
        struct Node { int x; int y; float f; };
        struct Cmp { bool operator()(const Node& a, const Node& b) const { return a.f > b.f; } };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<int> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void ensureCapacity(size_t gridSize) {
            if (gScoreBuffer.size() != gridSize) {
                gScoreBuffer.resize(gridSize);
                parentBuffer.resize(gridSize);
                closedBuffer.resize(gridSize);
            }
        }

        void reset() {
            while (!openQueue.empty()) openQueue.pop();
            std::fill(gScoreBuffer.begin(), gScoreBuffer.end(), std::numeric_limits<float>::infinity());
            std::fill(parentBuffer.begin(), parentBuffer.end(), -1);
            std::fill(closedBuffer.begin(), closedBuffer.end(), 0);
        }
    };
    NodePool m_nodePool;

    NavigationSettings* m_boundSettings{nullptr};
    std::vector<size_t> m_settingsListeners;

    // Public entry points wrap these and record one stats entry per request
    PathfindingResult resolvePath(const Vector2D& start, const Vector2D& goal, const PathfindingOptions& options);
    PathfindingResult resolveWithFallback(const Vector2D& start, const Vector2D& goal,
                                          const PathfindingOptions& options);
    PathfindingResult resolveAlternative(const Vector2D& start, const Vector2D& goal,
                                         const PathfindingOptions& options);

    PathfindingResult search(const GridPoint& start, const GridPoint& goal, const PathfindingOptions& options,
                             std::vector<GridPoint>& outCells);

    bool isValidPosition(int x, int y, const PathfindingOptions& options) const;
    bool isDiagonalAllowed(int fromX, int fromY, int toX, int toY, MovementCapability movementType) const;
    float stepCost(int fromX, int fromY, int toX, int toY, const PathfindingOptions& options) const;
    GridPoint predictGoal(const GridPoint& goal, const Vector2D& goalWorld, const PathfindingOptions& options) const;
    PathfindingResult emergencyPath(const GridPoint& start, const GridPoint& goal,
                                    const PathfindingOptions& options) const;

    // Cells a route actually crosses, for cache invalidation
    void appendSegmentCells(const GridPoint& from, const GridPoint& to, std::vector<GridPoint>& out) const;

    void onSettingChanged(const std::string& category, const std::string& key);
    void applyCacheCapacity(const NavigationSettings& settings);
    void applyObstacleBuffer(const NavigationSettings& settings);

    static uint32_t optionsSignature(const PathfindingOptions& options);
    void ensureNavigationCurrent();
    void recordResult(const PathfindingResult& result);
};

} // namespace TerraNav

#endif // PATHFINDER_HPP
