/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NAVIGATION_SETTINGS_HPP
#define NAVIGATION_SETTINGS_HPP

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "ai/pathfinding/PathfindingTypes.hpp"

namespace TerraNav {

/**
 * @brief Navigation tuning values grouped under "pathfinding" and "navigation"
 *
 * Values live in JSON files of the form {"category": {"key": value}}. A bound
 * Pathfinder listens to both categories, so edits made through set() or a
 * later loadFromFile() reach it without another applySettings() call.
 *
 * One instance per map session; not shared between threads.
 *
 * Usage:
 *   NavigationSettings settings;
 *   settings.loadDefaults();
 *   settings.loadFromFile("res/navigation.json");
 *   pathfinder.bindSettings(settings);
 *   settings.set("navigation", "obstacle_buffer", 1.0f);
 */
class NavigationSettings {
public:
    static constexpr const char* PATHFINDING_CATEGORY = "pathfinding";
    static constexpr const char* NAVIGATION_CATEGORY = "navigation";

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    NavigationSettings() = default;

    NavigationSettings(const NavigationSettings&) = delete;
    NavigationSettings& operator=(const NavigationSettings&) = delete;

    /**
     * @brief Merges a settings file into the current values
     *
     * Every value that changes is reported to listeners. Arrays, objects and
     * nulls below a category are skipped with a warning.
     * @return false if the file is missing or malformed; current values are kept
     */
    bool loadFromFile(const std::string& filepath);

    // @return false if the file cannot be written
    bool saveToFile(const std::string& filepath) const;

    // Fills every pathfinding and navigation key with its built-in default
    void loadDefaults();

    /**
     * @brief Gets a typed setting value
     * @return The stored value, or defaultValue when missing or of another type.
     * An int stored under a float key reads back as float.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Stores a value and notifies listeners
     * @return false when the same value was already stored; listeners are not called
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    // Empty category watches every category
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t listenerId);

    /**
     * @brief Maps the pathfinding category onto search options
     *
     * Missing keys keep the PathfindingOptions defaults.
     */
    PathfindingOptions buildPathfindingOptions() const;

private:
    template<typename T>
    static constexpr bool isStoredType = std::is_same_v<T, int> || std::is_same_v<T, float> ||
                                         std::is_same_v<T, bool> || std::is_same_v<T, std::string>;

    std::map<std::string, std::map<std::string, SettingValue>> m_values;

    struct Listener {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<Listener> m_listeners;
    size_t m_nextListenerId{1};

    const SettingValue* lookup(const std::string& category, const std::string& key) const;
    bool assign(const std::string& category, const std::string& key, SettingValue value);
};

template<typename T>
T NavigationSettings::get(const std::string& category, const std::string& key, T defaultValue) const {
    static_assert(isStoredType<T>, "settings hold int, float, bool or std::string");

    const SettingValue* stored = lookup(category, key);
    if (!stored) {
        return defaultValue;
    }
    if (const T* value = std::get_if<T>(stored)) {
        return *value;
    }
    if constexpr (std::is_same_v<T, float>) {
        if (const int* whole = std::get_if<int>(stored)) {
            return static_cast<float>(*whole);
        }
    }
    return defaultValue;
}

template<typename T>
bool NavigationSettings::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (isStoredType<T>) {
        return assign(category, key, SettingValue(std::in_place_type<T>, value));
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "settings hold int, float, bool or std::string");
        return assign(category, key, SettingValue(std::in_place_type<std::string>, value));
    }
}

} // namespace TerraNav

#endif // NAVIGATION_SETTINGS_HPP
