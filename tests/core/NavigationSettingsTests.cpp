/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE NavigationSettingsTests
#include <boost/test/unit_test.hpp>
#include "core/NavigationSettings.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

using namespace TerraNav;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_navigation_settings.json";
    NavigationSettings settings;

    SettingsTestFixture() {
        // Ensure test_data directory exists
        std::filesystem::create_directories("tests/test_data");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(NavigationSettingsValueTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypedValues) {
    BOOST_CHECK(settings.set("pathfinding", "max_iterations", 2500));
    BOOST_CHECK(settings.set("navigation", "obstacle_buffer", 0.75f));
    BOOST_CHECK(settings.set("pathfinding", "allow_diagonal", false));
    BOOST_CHECK(settings.set("pathfinding", "movement_type", "FLYING"));

    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "max_iterations", 0), 2500);
    BOOST_CHECK_CLOSE(settings.get<float>("navigation", "obstacle_buffer", 0.0f), 0.75f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("pathfinding", "allow_diagonal", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("pathfinding", "movement_type", ""), "FLYING");

    // Test default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "nonexistent", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<int>("nonexistent", "max_iterations", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    settings.set("pathfinding", "smooth_path", true);
    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "smooth_path", 99), 99);
    BOOST_CHECK_EQUAL(settings.get<std::string>("pathfinding", "smooth_path", "fallback"), "fallback");
}

BOOST_AUTO_TEST_CASE(TestIntReadsBackAsFloat) {
    settings.set("navigation", "obstacle_buffer", 2);
    BOOST_CHECK_CLOSE(settings.get<float>("navigation", "obstacle_buffer", 0.0f), 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestHas) {
    BOOST_CHECK(!settings.has("pathfinding", "max_iterations"));
    settings.set("pathfinding", "max_iterations", 100);
    BOOST_CHECK(settings.has("pathfinding", "max_iterations"));
    BOOST_CHECK(!settings.has("navigation", "max_iterations"));
}

BOOST_AUTO_TEST_CASE(TestSettingSameValueIsNotAChange) {
    int changes = 0;
    settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const NavigationSettings::SettingValue&) { changes++; });

    BOOST_CHECK(settings.set("navigation", "cache_capacity", 20));
    BOOST_CHECK(!settings.set("navigation", "cache_capacity", 20));
    BOOST_CHECK_EQUAL(changes, 1);

    // Same number under another type is a change
    BOOST_CHECK(settings.set("navigation", "cache_capacity", 20.0f));
    BOOST_CHECK_EQUAL(changes, 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(NavigationSettingsFileTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestSaveAndLoadRoundTrip) {
    settings.set("pathfinding", "max_iterations", 3000);
    settings.set("pathfinding", "terrain_cost_multiplier", 1.25f);
    settings.set("pathfinding", "movement_type", std::string("AMPHIBIOUS"));
    settings.set("navigation", "obstacle_buffer", 0.5f);
    settings.set("pathfinding", "smooth_path", false);

    BOOST_REQUIRE(settings.saveToFile(testFile));

    NavigationSettings loaded;
    BOOST_REQUIRE(loaded.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(loaded.get<int>("pathfinding", "max_iterations", 0), 3000);
    BOOST_CHECK_CLOSE(loaded.get<float>("pathfinding", "terrain_cost_multiplier", 0.0f), 1.25f, 0.001f);
    BOOST_CHECK_EQUAL(loaded.get<std::string>("pathfinding", "movement_type", ""), "AMPHIBIOUS");
    BOOST_CHECK_CLOSE(loaded.get<float>("navigation", "obstacle_buffer", 0.0f), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(loaded.get<bool>("pathfinding", "smooth_path", true), false);
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExistingValues) {
    settings.set("navigation", "cache_capacity", 10);
    createTestFile(R"({
        "pathfinding": { "max_iterations": 1500, "allow_diagonal": true },
        "navigation": { "obstacle_buffer": 1.5 }
    })");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "max_iterations", 0), 1500);
    BOOST_CHECK_CLOSE(settings.get<float>("navigation", "obstacle_buffer", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("navigation", "cache_capacity", 0), 10);
}

BOOST_AUTO_TEST_CASE(TestUnsupportedEntriesAreSkipped) {
    createTestFile(R"({
        "pathfinding": { "max_iterations": 800, "weights": [1, 2, 3], "unset": null },
        "comment": "not a category"
    })");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "max_iterations", 0), 800);
    BOOST_CHECK(!settings.has("pathfinding", "weights"));
    BOOST_CHECK(!settings.has("pathfinding", "unset"));
    BOOST_CHECK(!settings.has("comment", "comment"));
}

BOOST_AUTO_TEST_CASE(TestMalformedFileKeepsCurrentValues) {
    settings.set("pathfinding", "max_iterations", 250);
    createTestFile(R"({ "pathfinding": { "max_iterations": 900, })");

    BOOST_CHECK(!settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("pathfinding", "max_iterations", 0), 250);
}

BOOST_AUTO_TEST_CASE(TestMissingFileFails) {
    BOOST_CHECK(!settings.loadFromFile("tests/test_data/does_not_exist.json"));
}

BOOST_AUTO_TEST_CASE(TestNonObjectRootFails) {
    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(NavigationSettingsBehaviourTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestChangeListeners) {
    int pathfindingChanges = 0;
    int allChanges = 0;
    std::string lastKey;

    size_t scoped = settings.registerChangeListener("pathfinding",
        [&](const std::string&, const std::string& key, const NavigationSettings::SettingValue&) {
            pathfindingChanges++;
            lastKey = key;
        });
    settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const NavigationSettings::SettingValue&) {
            allChanges++;
        });

    settings.set("pathfinding", "max_iterations", 10);
    settings.set("navigation", "obstacle_buffer", 1.0f);
    BOOST_CHECK_EQUAL(pathfindingChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 2);
    BOOST_CHECK_EQUAL(lastKey, "max_iterations");

    settings.unregisterChangeListener(scoped);
    settings.set("pathfinding", "smooth_path", false);
    BOOST_CHECK_EQUAL(pathfindingChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 3);
}

BOOST_AUTO_TEST_CASE(TestLoadNotifiesChangedValues) {
    settings.set("pathfinding", "max_iterations", 1500);
    std::vector<std::string> changedKeys;
    settings.registerChangeListener("pathfinding",
        [&](const std::string&, const std::string& key, const NavigationSettings::SettingValue&) {
            changedKeys.push_back(key);
        });

    createTestFile(R"({ "pathfinding": { "max_iterations": 1500, "smooth_path": false } })");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_REQUIRE_EQUAL(changedKeys.size(), 1u);
    BOOST_CHECK_EQUAL(changedKeys[0], "smooth_path");
}

BOOST_AUTO_TEST_CASE(TestDefaultsMatchSearchOptions) {
    settings.loadDefaults();

    const PathfindingOptions defaults;
    PathfindingOptions options = settings.buildPathfindingOptions();
    BOOST_CHECK_EQUAL(options.maxIterations, defaults.maxIterations);
    BOOST_CHECK_EQUAL(options.allowDiagonal, defaults.allowDiagonal);
    BOOST_CHECK_EQUAL(options.smoothPath, defaults.smoothPath);
    BOOST_CHECK_EQUAL(options.movementType, MovementCapability::WALKING);
    BOOST_CHECK(settings.has("navigation", "obstacle_buffer"));
    BOOST_CHECK(settings.has("navigation", "cache_capacity"));
}

BOOST_AUTO_TEST_CASE(TestBuildPathfindingOptions) {
    settings.set("pathfinding", "max_iterations", 0);
    settings.set("pathfinding", "allow_diagonal", false);
    settings.set("pathfinding", "min_distance_from_obstacles", -2.0f);
    settings.set("pathfinding", "terrain_cost_multiplier", 1.5f);
    settings.set("pathfinding", "prediction_time", 0.25f);
    settings.set("pathfinding", "movement_type", "SWIMMING");

    PathfindingOptions options = settings.buildPathfindingOptions();
    BOOST_CHECK_EQUAL(options.maxIterations, 1);
    BOOST_CHECK(!options.allowDiagonal);
    BOOST_CHECK_EQUAL(options.minDistanceFromObstacles, 0.0f);
    BOOST_CHECK_CLOSE(options.terrainCostMultiplier, 1.5f, 0.001f);
    BOOST_CHECK_CLOSE(options.predictionTime, 0.25f, 0.001f);
    BOOST_CHECK_EQUAL(options.movementType, MovementCapability::SWIMMING);
}

BOOST_AUTO_TEST_SUITE_END()
