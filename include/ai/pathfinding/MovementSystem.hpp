/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_SYSTEM_HPP
#define MOVEMENT_SYSTEM_HPP

#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include "utils/Vector2D.hpp"
#include "world/Grid.hpp"

namespace TerraNav {

enum class MovementCapability : uint8_t { WALKING, FLYING, SWIMMING, AMPHIBIOUS, ALL_TERRAIN };

inline std::ostream& operator<<(std::ostream& os, const MovementCapability& cap) {
    switch (cap) {
        case MovementCapability::WALKING: return os << "WALKING";
        case MovementCapability::FLYING: return os << "FLYING";
        case MovementCapability::SWIMMING: return os << "SWIMMING";
        case MovementCapability::AMPHIBIOUS: return os << "AMPHIBIOUS";
        case MovementCapability::ALL_TERRAIN: return os << "ALL_TERRAIN";
        default: return os << "UNKNOWN";
    }
}

// Unrecognised names resolve to WALKING
MovementCapability movementCapabilityFromString(const std::string& name);

enum class StatusEffectType : uint8_t { BURN, SLOW, FREEZE, POISON };

struct StatusEffect {
    StatusEffectType type{StatusEffectType::SLOW};
    float durationMs{0.0f};
    float strength{0.0f};
};

struct TerrainRule {
    bool walkable{false};
    bool flyable{false};
    bool swimmable{false};
    float speedMultiplier{0.0f};
    std::optional<float> damagePerSecond;
    std::optional<StatusEffect> statusEffect;
};

/**
 * @brief Anything that stands on terrain and can be hurt or slowed by it.
 */
class TerrainEffectTarget {
public:
    virtual ~TerrainEffectTarget() = default;

    virtual Vector2D getPosition() const = 0;
    virtual MovementCapability getMovementCapability() const = 0;
    virtual void takeDamage(float amount) = 0;
    virtual void applyStatusEffect(const StatusEffect& effect) = 0;
};

/**
 * @brief Resolves (movement capability x cell type) into traversability and
 * speed, and applies per-terrain side effects.
 *
 * One instance per map session; the rule table and the per-cell speed cache
 * are instance state.
 */
class MovementSystem {
public:
    static constexpr size_t SPEED_CACHE_CAPACITY = 100;

    MovementSystem();

    const TerrainRule& getTerrainRule(CellType type) const;
    void setTerrainRule(CellType type, const TerrainRule& rule);

    bool canMoveOnTerrain(MovementCapability capability, CellType type) const;
    bool canEntityMoveTo(const TerrainEffectTarget& target, const Vector2D& position,
                         const Grid& grid) const;

    // Speed factor used for one step onto the cell; flyers ignore terrain penalties
    float getSpeedMultiplier(MovementCapability capability, const CellData& cell) const;

    // Infinity when the destination cell cannot be entered
    float getMovementCost(const Vector2D& from, const Vector2D& to, const Grid& grid,
                          MovementCapability capability) const;

    float getAdjustedSpeed(const Vector2D& position, float baseSpeed, const Grid& grid);

    void applyTerrainEffects(TerrainEffectTarget& target, float deltaTimeMs, const Grid& grid) const;

    static float getSmoothTransitionSpeed(float currentSpeed, float targetSpeed,
                                          float deltaTimeMs, float transitionRate = 2.0f);

    void clearCache();
    size_t getCacheSize() const { return m_speedCache.size(); }

private:
    boost::container::flat_map<CellType, TerrainRule> m_rules;

    // Per-cell grid speed, evicted oldest-first
    boost::container::flat_map<uint64_t, float> m_speedCache;
    std::deque<uint64_t> m_speedCacheOrder;

    static bool allows(MovementCapability capability, const TerrainRule& rule);
    void loadDefaultRules();
};

} // namespace TerraNav

#endif // MOVEMENT_SYSTEM_HPP
