/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/SpawnConnectivityValidator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace TerraNav {

namespace {
std::string describeCell(const GridPoint& p) {
    return "grid (" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}
} // namespace

SpawnConnectivityValidator::SpawnConnectivityValidator(Pathfinder& pathfinder)
    : m_pathfinder(pathfinder) {}

PathfindingOptions SpawnConnectivityValidator::searchOptions(MovementCapability movementType) const {
    const Grid& grid = m_pathfinder.getGrid();
    PathfindingOptions options;
    options.movementType = movementType;
    options.maxIterations = clampIterationBudget(std::max<int64_t>(
        MIN_SEARCH_ITERATIONS, static_cast<int64_t>(grid.getWidth()) * grid.getHeight() * 2));
    options.smoothPath = false;
    options.useCache = false;
    return options;
}

SpawnPointValidation SpawnConnectivityValidator::validateSpawnPointConnectivity(
    const Vector2D& spawnPoint, const Vector2D& target, MovementCapability movementType) const {
    const Grid& grid = m_pathfinder.getGrid();
    SpawnPointValidation validation;
    validation.spawnPoint = spawnPoint;

    GridPoint spawnCell = grid.worldToGrid(spawnPoint);
    GridPoint targetCell = grid.worldToGrid(target);

    if (!grid.isInBounds(spawnCell.x, spawnCell.y)) {
        validation.issue = "Spawn point is out of bounds";
        return validation;
    }
    if (!grid.isInBounds(targetCell.x, targetCell.y)) {
        validation.issue = "Target is out of bounds";
        return validation;
    }
    if (!m_pathfinder.isTraversable(spawnCell.x, spawnCell.y, movementType)) {
        validation.issue = "Spawn point is not walkable";
        return validation;
    }
    if (!m_pathfinder.isTraversable(targetCell.x, targetCell.y, movementType)) {
        validation.issue = "Target is not walkable";
        return validation;
    }

    PathfindingResult result = m_pathfinder.findPath(spawnPoint, target, searchOptions(movementType));
    if (!result.success) {
        validation.issue = "No valid path from spawn point to target";
        return validation;
    }

    float dx = static_cast<float>(targetCell.x - spawnCell.x);
    float dy = static_cast<float>(targetCell.y - spawnCell.y);

    validation.isValid = true;
    validation.path = std::move(result.path);
    validation.pathCost = result.cost;
    validation.distance = std::sqrt(dx * dx + dy * dy);
    return validation;
}

MapConnectivityValidation SpawnConnectivityValidator::validateAllSpawnPoints(
    const std::vector<Vector2D>& spawnPoints, const Vector2D& target, MovementCapability movementType) const {
    const Grid& grid = m_pathfinder.getGrid();
    MapConnectivityValidation report;

    if (spawnPoints.empty()) {
        report.errors.push_back("No spawn points defined");
        VALIDATION_WARN("Map has no spawn points");
        return report;
    }

    for (const auto& spawn : spawnPoints) {
        SpawnPointValidation validation = validateSpawnPointConnectivity(spawn, target, movementType);
        GridPoint cell = grid.worldToGrid(spawn);

        if (validation.isValid) {
            report.validSpawnPoints.push_back(spawn);

            if (validation.pathCost && validation.distance && *validation.distance > 0.0f) {
                float ratio = *validation.pathCost / *validation.distance;
                if (ratio > LONG_PATH_RATIO) {
                    std::ostringstream msg;
                    msg.precision(2);
                    msg << std::fixed << "Spawn point at " << describeCell(cell)
                        << " has an unusually long path (cost ratio " << ratio << ")";
                    report.warnings.push_back(msg.str());
                }
            }
        } else {
            report.invalidSpawnPoints.push_back(spawn);
            report.errors.push_back("Spawn point at " + describeCell(cell) + " cannot reach target: " +
                                    validation.issue.value_or("unknown issue"));
        }
        report.spawnValidations.push_back(std::move(validation));
    }

    if (!report.invalidSpawnPoints.empty()) {
        report.warnings.push_back(std::to_string(report.invalidSpawnPoints.size()) + " of " +
                                  std::to_string(spawnPoints.size()) + " spawn points cannot reach the target");
    }
    if (report.validSpawnPoints.size() < MIN_VALID_SPAWN_POINTS) {
        report.warnings.push_back("Less than 2 valid spawn points available - gameplay may be too predictable");
    }

    report.allSpawnPointsValid = report.invalidSpawnPoints.empty();

    VALIDATION_INFO("Validated " + std::to_string(spawnPoints.size()) + " spawn points: " +
                    std::to_string(report.validSpawnPoints.size()) + " valid, " +
                    std::to_string(report.errors.size()) + " errors, " +
                    std::to_string(report.warnings.size()) + " warnings");
    return report;
}

} // namespace TerraNav
