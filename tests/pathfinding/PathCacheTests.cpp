/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PathCacheTests
#include <boost/test/unit_test.hpp>

#include "ai/internal/PathCache.hpp"
#include <vector>

using namespace TerraNav;
using NavInternal::PathCache;
using NavInternal::PathCacheKey;

namespace {

PathfindingResult makeRoute(std::initializer_list<Vector2D> points) {
    PathfindingResult result;
    result.path = points;
    result.success = true;
    result.status = PathfindingStatus::SUCCESS;
    result.cost = static_cast<float>(result.path.size());
    return result;
}

PathCacheKey makeKey(int sx, int sy, int gx, int gy) {
    return PathCacheKey{GridPoint{sx, sy}, GridPoint{gx, gy}, MovementCapability::WALKING, 0};
}

} // namespace

struct PathCacheFixture {
    PathCache cache{3};
    PathfindingResult route = makeRoute({Vector2D(16.0f, 16.0f), Vector2D(48.0f, 16.0f)});
};

BOOST_FIXTURE_TEST_SUITE(PathCacheLookupTests, PathCacheFixture)

BOOST_AUTO_TEST_CASE(TestMissThenHit) {
    PathCacheKey key = makeKey(0, 0, 1, 0);
    BOOST_CHECK(!cache.find(key).has_value());

    cache.store(key, route, {{0, 0}, {1, 0}});
    auto hit = cache.find(key);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->path.size(), 2u);
    BOOST_CHECK_EQUAL(hit->status, PathfindingStatus::SUCCESS);

    auto stats = cache.getStats();
    BOOST_CHECK_EQUAL(stats.totalQueries, 2u);
    BOOST_CHECK_EQUAL(stats.totalHits, 1u);
    BOOST_CHECK_EQUAL(stats.totalMisses, 1u);
    BOOST_CHECK_CLOSE(stats.hitRate, 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestKeyIncludesMovementAndOptions) {
    PathCacheKey key = makeKey(0, 0, 1, 0);
    cache.store(key, route, {});

    PathCacheKey flying = key;
    flying.movement = MovementCapability::FLYING;
    BOOST_CHECK(!cache.find(flying).has_value());

    PathCacheKey otherOptions = key;
    otherOptions.optionsSignature = 42;
    BOOST_CHECK(!cache.find(otherOptions).has_value());
}

BOOST_AUTO_TEST_CASE(TestFailuresAreNotStored) {
    cache.store(makeKey(0, 0, 5, 5), PathfindingResult::failure(PathfindingStatus::NO_PATH_FOUND), {});
    cache.store(makeKey(0, 0, 6, 6), PathfindingResult::failure(PathfindingStatus::TIMEOUT, 1000), {});
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestStoreReplacesSameKey) {
    PathCacheKey key = makeKey(0, 0, 2, 0);
    cache.store(key, route, {});
    cache.store(key, makeRoute({Vector2D(16.0f, 16.0f), Vector2D(48.0f, 16.0f), Vector2D(80.0f, 16.0f)}), {});

    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK_EQUAL(cache.find(key)->path.size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PathCacheEvictionTests, PathCacheFixture)

BOOST_AUTO_TEST_CASE(TestOldestEntryIsEvictedFirst) {
    cache.store(makeKey(0, 0, 1, 0), route, {});
    cache.store(makeKey(0, 0, 2, 0), route, {});
    cache.store(makeKey(0, 0, 3, 0), route, {});

    // A hit does not refresh the oldest entry
    BOOST_CHECK(cache.find(makeKey(0, 0, 1, 0)).has_value());

    cache.store(makeKey(0, 0, 4, 0), route, {});
    BOOST_CHECK_EQUAL(cache.size(), 3u);
    BOOST_CHECK(!cache.find(makeKey(0, 0, 1, 0)).has_value());
    BOOST_CHECK(cache.find(makeKey(0, 0, 2, 0)).has_value());
    BOOST_CHECK(cache.find(makeKey(0, 0, 4, 0)).has_value());
    BOOST_CHECK_EQUAL(cache.getStats().evictedPaths, 1u);
}

BOOST_AUTO_TEST_CASE(TestShrinkingCapacityEvicts) {
    cache.store(makeKey(0, 0, 1, 0), route, {});
    cache.store(makeKey(0, 0, 2, 0), route, {});
    cache.store(makeKey(0, 0, 3, 0), route, {});

    cache.setCapacity(1);
    BOOST_CHECK_EQUAL(cache.getCapacity(), 1u);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK(cache.find(makeKey(0, 0, 3, 0)).has_value());

    cache.setCapacity(0);
    BOOST_CHECK_EQUAL(cache.getCapacity(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEvictionSkipsInvalidatedEntries) {
    cache.store(makeKey(0, 0, 1, 0), route, {});
    cache.store(makeKey(0, 5, 1, 5), route, {});
    cache.invalidateCell(0, 0);

    cache.store(makeKey(0, 0, 2, 0), route, {});
    cache.store(makeKey(0, 0, 3, 0), route, {});
    BOOST_CHECK_EQUAL(cache.size(), 3u);
    BOOST_CHECK_EQUAL(cache.getStats().evictedPaths, 0u);

    cache.store(makeKey(0, 0, 4, 0), route, {});
    BOOST_CHECK(!cache.find(makeKey(0, 5, 1, 5)).has_value());
    BOOST_CHECK(cache.find(makeKey(0, 0, 2, 0)).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PathCacheInvalidationTests, PathCacheFixture)

BOOST_AUTO_TEST_CASE(TestInvalidateByTraversedCell) {
    cache.store(makeKey(0, 0, 4, 0), route, {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}});
    cache.store(makeKey(0, 2, 4, 2), route, {{0, 2}, {1, 2}, {2, 2}, {3, 2}, {4, 2}});

    BOOST_CHECK_EQUAL(cache.invalidateCell(2, 0), 1u);
    BOOST_CHECK(!cache.find(makeKey(0, 0, 4, 0)).has_value());
    BOOST_CHECK(cache.find(makeKey(0, 2, 4, 2)).has_value());
    BOOST_CHECK_EQUAL(cache.getStats().invalidatedPaths, 1u);
}

BOOST_AUTO_TEST_CASE(TestInvalidateByEndpointsWithoutTraversal) {
    cache.store(makeKey(1, 1, 7, 7), route, {});
    BOOST_CHECK_EQUAL(cache.invalidateCell(7, 7), 1u);
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestUnrelatedCellKeepsEverything) {
    cache.store(makeKey(0, 0, 2, 0), route, {{0, 0}, {1, 0}, {2, 0}});
    BOOST_CHECK_EQUAL(cache.invalidateCell(9, 9), 0u);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestInvalidateCellsCountsEachRouteOnce) {
    cache.store(makeKey(0, 0, 2, 0), route, {{0, 0}, {1, 0}, {2, 0}});
    cache.store(makeKey(0, 1, 2, 1), route, {{0, 1}, {1, 1}, {2, 1}});

    // Both cells of the first route, one of the second
    size_t removed = cache.invalidateCells({{1, 0}, {2, 0}, {1, 1}});
    BOOST_CHECK_EQUAL(removed, 2u);
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestClearResetsStats) {
    cache.store(makeKey(0, 0, 2, 0), route, {});
    cache.find(makeKey(0, 0, 2, 0));
    cache.clear();

    auto stats = cache.getStats();
    BOOST_CHECK_EQUAL(cache.size(), 0u);
    BOOST_CHECK_EQUAL(stats.totalPaths, 0u);
    BOOST_CHECK_EQUAL(stats.totalQueries, 0u);
    BOOST_CHECK_EQUAL(stats.hitRate, 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
