/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_CONNECTIVITY_VALIDATOR_HPP
#define SPAWN_CONNECTIVITY_VALIDATOR_HPP

#include <optional>
#include <string>
#include <vector>
#include "ai/pathfinding/Pathfinder.hpp"
#include "utils/Vector2D.hpp"

namespace TerraNav {

struct SpawnPointValidation {
    Vector2D spawnPoint;
    bool isValid{false};
    std::vector<Vector2D> path;
    std::optional<float> pathCost;
    std::optional<float> distance; // straight line, grid cells
    std::optional<std::string> issue;
};

struct MapConnectivityValidation {
    bool allSpawnPointsValid{false};
    std::vector<Vector2D> validSpawnPoints;
    std::vector<Vector2D> invalidSpawnPoints;
    std::vector<SpawnPointValidation> spawnValidations;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

/**
 * @brief Checks that enemy spawn points can reach the defended target.
 *
 * Reports are advisory: nothing here changes the map. Searches bypass the
 * route cache and run without smoothing so the reported cost is the raw
 * route cost.
 */
class SpawnConnectivityValidator {
public:
    static constexpr int MIN_SEARCH_ITERATIONS = 5000;
    static constexpr float LONG_PATH_RATIO = 3.0f;
    static constexpr size_t MIN_VALID_SPAWN_POINTS = 2;

    explicit SpawnConnectivityValidator(Pathfinder& pathfinder);

    SpawnPointValidation validateSpawnPointConnectivity(const Vector2D& spawnPoint, const Vector2D& target,
                                                        MovementCapability movementType = MovementCapability::WALKING) const;

    MapConnectivityValidation validateAllSpawnPoints(const std::vector<Vector2D>& spawnPoints,
                                                     const Vector2D& target,
                                                     MovementCapability movementType = MovementCapability::WALKING) const;

private:
    Pathfinder& m_pathfinder;

    PathfindingOptions searchOptions(MovementCapability movementType) const;
};

} // namespace TerraNav

#endif // SPAWN_CONNECTIVITY_VALIDATOR_HPP
