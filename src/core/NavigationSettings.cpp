/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/NavigationSettings.hpp"
#include "ai/internal/PathCache.hpp"
#include "ai/pathfinding/NavigationGrid.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>

namespace TerraNav {

namespace {
// Whole numbers inside int range load as int, everything else as float
std::optional<NavigationSettings::SettingValue> settingFromJson(const JsonValue& json) {
    using SettingValue = NavigationSettings::SettingValue;

    if (auto flag = json.tryAsBool()) {
        return SettingValue(std::in_place_type<bool>, *flag);
    }
    if (auto number = json.tryAsNumber()) {
        const double n = *number;
        if (std::trunc(n) == n && n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max()) {
            return SettingValue(std::in_place_type<int>, static_cast<int>(n));
        }
        return SettingValue(std::in_place_type<float>, static_cast<float>(n));
    }
    if (auto text = json.tryAsString()) {
        return SettingValue(std::in_place_type<std::string>, *text);
    }
    return std::nullopt;
}

JsonValue settingToJson(const NavigationSettings::SettingValue& value) {
    return std::visit([](const auto& stored) {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, float>) {
            return JsonValue(static_cast<double>(stored));
        } else {
            return JsonValue(stored);
        }
    }, value);
}
} // namespace

bool NavigationSettings::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load navigation settings from " + filepath + ": " + reader.getLastError());
        return false;
    }

    const JsonObject* categories = reader.getRoot().tryAsObject();
    if (!categories) {
        SETTINGS_ERROR("Navigation settings root is not a JSON object: " + filepath);
        return false;
    }

    size_t loaded = 0;
    for (const auto& [category, entries] : *categories) {
        const JsonObject* members = entries.tryAsObject();
        if (!members) {
            SETTINGS_WARNING("Skipping '" + category + "': a category must be an object");
            continue;
        }

        for (const auto& [key, json] : *members) {
            std::optional<SettingValue> value = settingFromJson(json);
            if (!value) {
                SETTINGS_WARNING("Skipping '" + category + "." + key + "': unsupported value type");
                continue;
            }
            assign(category, key, std::move(*value));
            ++loaded;
        }
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded) + " navigation settings from " + filepath);
    return true;
}

bool NavigationSettings::saveToFile(const std::string& filepath) const {
    JsonObject document;
    for (const auto& [category, entries] : m_values) {
        JsonObject members;
        for (const auto& [key, value] : entries) {
            members.emplace(key, settingToJson(value));
        }
        document.emplace(category, JsonValue(std::move(members)));
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open navigation settings file for writing: " + filepath);
        return false;
    }

    file << JsonValue(std::move(document)).toString() << '\n';
    if (!file) {
        SETTINGS_ERROR("Failed while writing navigation settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved navigation settings to " + filepath);
    return true;
}

void NavigationSettings::loadDefaults() {
    const PathfindingOptions defaults;
    set(PATHFINDING_CATEGORY, "max_iterations", defaults.maxIterations);
    set(PATHFINDING_CATEGORY, "allow_diagonal", defaults.allowDiagonal);
    set(PATHFINDING_CATEGORY, "smooth_path", defaults.smoothPath);
    set(PATHFINDING_CATEGORY, "movement_type", std::string("WALKING"));
    set(PATHFINDING_CATEGORY, "min_distance_from_obstacles", defaults.minDistanceFromObstacles);
    set(PATHFINDING_CATEGORY, "terrain_cost_multiplier", defaults.terrainCostMultiplier);
    set(PATHFINDING_CATEGORY, "prediction_time", defaults.predictionTime);
    set(NAVIGATION_CATEGORY, "obstacle_buffer", NavigationGrid::DEFAULT_OBSTACLE_BUFFER);
    set(NAVIGATION_CATEGORY, "cache_capacity", static_cast<int>(NavInternal::PathCache::DEFAULT_CAPACITY));
}

bool NavigationSettings::has(const std::string& category, const std::string& key) const {
    return lookup(category, key) != nullptr;
}

size_t NavigationSettings::registerChangeListener(const std::string& category, ChangeCallback callback) {
    const size_t id = m_nextListenerId++;
    m_listeners.push_back(Listener{id, category, std::move(callback)});
    return id;
}

void NavigationSettings::unregisterChangeListener(size_t listenerId) {
    std::erase_if(m_listeners, [listenerId](const Listener& listener) { return listener.id == listenerId; });
}

PathfindingOptions NavigationSettings::buildPathfindingOptions() const {
    PathfindingOptions options;
    options.maxIterations = std::max(1, get<int>(PATHFINDING_CATEGORY, "max_iterations", options.maxIterations));
    options.allowDiagonal = get<bool>(PATHFINDING_CATEGORY, "allow_diagonal", options.allowDiagonal);
    options.smoothPath = get<bool>(PATHFINDING_CATEGORY, "smooth_path", options.smoothPath);
    options.minDistanceFromObstacles = std::max(0.0f,
        get<float>(PATHFINDING_CATEGORY, "min_distance_from_obstacles", options.minDistanceFromObstacles));
    options.terrainCostMultiplier = get<float>(PATHFINDING_CATEGORY, "terrain_cost_multiplier",
                                               options.terrainCostMultiplier);
    options.predictionTime = get<float>(PATHFINDING_CATEGORY, "prediction_time", options.predictionTime);

    if (has(PATHFINDING_CATEGORY, "movement_type")) {
        options.movementType = movementCapabilityFromString(
            get<std::string>(PATHFINDING_CATEGORY, "movement_type", "WALKING"));
    }
    return options;
}

const NavigationSettings::SettingValue* NavigationSettings::lookup(const std::string& category,
                                                                  const std::string& key) const {
    auto categoryIt = m_values.find(category);
    if (categoryIt == m_values.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool NavigationSettings::assign(const std::string& category, const std::string& key, SettingValue value) {
    auto& entries = m_values[category];
    auto existing = entries.find(key);
    if (existing != entries.end() && existing->second == value) {
        return false;
    }
    const SettingValue& stored = entries.insert_or_assign(key, std::move(value)).first->second;

    for (const auto& listener : m_listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, stored);
        }
    }
    return true;
}

} // namespace TerraNav
