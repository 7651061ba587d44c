/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/MovementSystem.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <limits>

namespace TerraNav {

MovementCapability movementCapabilityFromString(const std::string& name) {
    if (name == "FLYING") return MovementCapability::FLYING;
    if (name == "SWIMMING") return MovementCapability::SWIMMING;
    if (name == "AMPHIBIOUS") return MovementCapability::AMPHIBIOUS;
    if (name == "ALL_TERRAIN") return MovementCapability::ALL_TERRAIN;
    if (name != "WALKING") {
        MOVEMENT_WARN("Unknown movement type '" + name + "', using WALKING");
    }
    return MovementCapability::WALKING;
}

MovementSystem::MovementSystem() {
    loadDefaultRules();
}

void MovementSystem::loadDefaultRules() {
    //                                     walk   fly    swim   speed
    m_rules[CellType::EMPTY]         = TerrainRule{true,  true,  false, 1.0f, {}, {}};
    m_rules[CellType::PATH]          = TerrainRule{true,  true,  false, 1.2f, {}, {}};
    m_rules[CellType::ROUGH_TERRAIN] = TerrainRule{true,  true,  false, 0.5f, {}, {}};
    m_rules[CellType::WATER]         = TerrainRule{false, true,  true,  0.8f, {}, {}};
    m_rules[CellType::BRIDGE]        = TerrainRule{true,  true,  false, 1.0f, {}, {}};
    m_rules[CellType::OBSTACLE]      = TerrainRule{false, false, false, 0.0f, {}, {}};
    m_rules[CellType::BLOCKED]       = TerrainRule{false, false, false, 0.0f, {}, {}};
    m_rules[CellType::TOWER]         = TerrainRule{false, false, false, 0.0f, {}, {}};
    m_rules[CellType::DECORATIVE]    = TerrainRule{true,  true,  false, 1.0f, {}, {}};
    m_rules[CellType::SPAWN_ZONE]    = TerrainRule{true,  true,  false, 1.0f, {}, {}};
    m_rules[CellType::BORDER]        = TerrainRule{false, false, false, 0.0f, {}, {}};
}

const TerrainRule& MovementSystem::getTerrainRule(CellType type) const {
    auto it = m_rules.find(type);
    if (it == m_rules.end()) {
        return m_rules.at(CellType::EMPTY);
    }
    return it->second;
}

void MovementSystem::setTerrainRule(CellType type, const TerrainRule& rule) {
    m_rules[type] = rule;
    clearCache();
}

bool MovementSystem::allows(MovementCapability capability, const TerrainRule& rule) {
    switch (capability) {
        case MovementCapability::WALKING:
            return rule.walkable;
        case MovementCapability::FLYING:
            return rule.flyable;
        case MovementCapability::SWIMMING:
            return rule.swimmable;
        case MovementCapability::AMPHIBIOUS:
            return rule.walkable || rule.swimmable;
        case MovementCapability::ALL_TERRAIN:
            return rule.walkable || rule.flyable || rule.swimmable;
        default:
            return rule.walkable;
    }
}

bool MovementSystem::canMoveOnTerrain(MovementCapability capability, CellType type) const {
    auto it = m_rules.find(type);
    if (it == m_rules.end()) return false;
    return allows(capability, it->second);
}

bool MovementSystem::canEntityMoveTo(const TerrainEffectTarget& target, const Vector2D& position,
                                     const Grid& grid) const {
    GridPoint cell = grid.worldToGrid(position);
    if (!grid.isInBounds(cell.x, cell.y)) return false;
    return canMoveOnTerrain(target.getMovementCapability(), grid.getCellType(cell.x, cell.y));
}

float MovementSystem::getSpeedMultiplier(MovementCapability capability, const CellData& cell) const {
    const TerrainRule& rule = getTerrainRule(cell.type);
    if (capability == MovementCapability::FLYING && rule.flyable) {
        return 1.0f;
    }
    if (cell.movementSpeed) {
        return *cell.movementSpeed;
    }
    return rule.speedMultiplier;
}

float MovementSystem::getMovementCost(const Vector2D& from, const Vector2D& to, const Grid& grid,
                                      MovementCapability capability) const {
    GridPoint dest = grid.worldToGrid(to);
    if (!grid.isInBounds(dest.x, dest.y) ||
        !canMoveOnTerrain(capability, grid.getCellType(dest.x, dest.y))) {
        return std::numeric_limits<float>::infinity();
    }

    float speed = getSpeedMultiplier(capability, grid.getCellData(dest.x, dest.y));
    if (speed <= 0.0f) {
        return std::numeric_limits<float>::infinity();
    }

    float distanceInCells = Vector2D::distance(from, to) / grid.getCellSize();
    return distanceInCells / speed;
}

float MovementSystem::getAdjustedSpeed(const Vector2D& position, float baseSpeed, const Grid& grid) {
    GridPoint cell = grid.worldToGrid(position);
    uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(cell.x)) << 32) |
                   static_cast<uint32_t>(cell.y);

    if (auto it = m_speedCache.find(key); it != m_speedCache.end()) {
        return baseSpeed * it->second;
    }

    float multiplier = grid.getMovementSpeed(cell.x, cell.y);

    if (m_speedCache.size() >= SPEED_CACHE_CAPACITY && !m_speedCacheOrder.empty()) {
        m_speedCache.erase(m_speedCacheOrder.front());
        m_speedCacheOrder.pop_front();
    }
    m_speedCache.emplace(key, multiplier);
    m_speedCacheOrder.push_back(key);

    return baseSpeed * multiplier;
}

void MovementSystem::applyTerrainEffects(TerrainEffectTarget& target, float deltaTimeMs,
                                         const Grid& grid) const {
    GridPoint cell = grid.worldToGrid(target.getPosition());
    if (!grid.isInBounds(cell.x, cell.y)) return;

    const TerrainRule& rule = getTerrainRule(grid.getCellType(cell.x, cell.y));

    if (rule.damagePerSecond && *rule.damagePerSecond > 0.0f) {
        target.takeDamage(*rule.damagePerSecond * (deltaTimeMs / 1000.0f));
    }
    if (rule.statusEffect) {
        target.applyStatusEffect(*rule.statusEffect);
    }
}

float MovementSystem::getSmoothTransitionSpeed(float currentSpeed, float targetSpeed,
                                               float deltaTimeMs, float transitionRate) {
    float diff = targetSpeed - currentSpeed;
    float maxChange = transitionRate * (deltaTimeMs / 1000.0f);
    if (std::fabs(diff) <= maxChange) {
        return targetSpeed;
    }
    return currentSpeed + (diff > 0.0f ? maxChange : -maxChange);
}

void MovementSystem::clearCache() {
    m_speedCache.clear();
    m_speedCacheOrder.clear();
}

} // namespace TerraNav
