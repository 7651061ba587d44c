/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_TYPES_HPP
#define PATHFINDING_TYPES_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>
#include <vector>
#include "ai/pathfinding/MovementSystem.hpp"
#include "utils/Vector2D.hpp"

namespace TerraNav {

enum class PathfindingStatus : uint8_t { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT, PARTIAL };

// Stream operator for PathfindingStatus to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingStatus& status) {
    switch (status) {
        case PathfindingStatus::SUCCESS: return os << "SUCCESS";
        case PathfindingStatus::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingStatus::INVALID_START: return os << "INVALID_START";
        case PathfindingStatus::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingStatus::TIMEOUT: return os << "TIMEOUT";
        case PathfindingStatus::PARTIAL: return os << "PARTIAL";
        default: return os << "UNKNOWN";
    }
}

// Iteration caps derived from products of sizes or factors, saturated to [1, INT_MAX]
inline int clampIterationBudget(int64_t iterations) {
    return static_cast<int>(std::clamp<int64_t>(iterations, 1, std::numeric_limits<int>::max()));
}

struct PathfindingOptions {
    int maxIterations{1000};
    bool allowDiagonal{true};
    bool smoothPath{true};
    MovementCapability movementType{MovementCapability::WALKING};
    float minDistanceFromObstacles{0.0f}; // grid cells
    float terrainCostMultiplier{1.0f};

    // Moving targets: goal is projected by targetVelocity * predictionTime
    bool predictiveTarget{false};
    Vector2D targetVelocity;
    float predictionTime{1.0f}; // seconds

    bool useCache{true};
};

/**
 * @brief Outcome of one route request. Failures carry an empty path and the
 * diagnostics gathered before giving up.
 */
struct PathfindingResult {
    std::vector<Vector2D> path;
    bool success{false};
    int iterations{0};
    float cost{0.0f};
    PathfindingStatus status{PathfindingStatus::NO_PATH_FOUND};

    static PathfindingResult failure(PathfindingStatus status, int iterations = 0) {
        PathfindingResult result;
        result.status = status;
        result.iterations = iterations;
        return result;
    }
};

} // namespace TerraNav

#endif // PATHFINDING_TYPES_HPP
