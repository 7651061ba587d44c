#ifndef PATH_CACHE_HPP
#define PATH_CACHE_HPP

#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "ai/pathfinding/PathfindingTypes.hpp"
#include "world/Grid.hpp"

namespace NavInternal {

/**
 * Identity of a cached route. optionsSignature folds in the search options
 * that change the shape of a route (diagonals, smoothing, clearance, cost).
 */
struct PathCacheKey {
    TerraNav::GridPoint start;
    TerraNav::GridPoint goal;
    TerraNav::MovementCapability movement{TerraNav::MovementCapability::WALKING};
    uint32_t optionsSignature{0};

    bool operator==(const PathCacheKey& other) const = default;
};

/**
 * Statistics for monitoring PathCache hit rate and invalidation churn.
 */
struct PathCacheStats {
    size_t totalPaths = 0;
    size_t totalQueries = 0;
    size_t totalHits = 0;
    size_t totalMisses = 0;
    size_t evictedPaths = 0;
    size_t invalidatedPaths = 0;
    float hitRate = 0.0f;

    void updateHitRate() {
        hitRate = (totalQueries > 0) ? (static_cast<float>(totalHits) / static_cast<float>(totalQueries)) : 0.0f;
    }
};

/**
 * PathCache - bounded store of successful routes for one map session.
 *
 * Entries are evicted in insertion order once capacity is reached (FIFO, not
 * LRU: a hit does not refresh an entry). Each entry is indexed by every grid
 * cell its route traverses, plus its start and goal, so an obstacle change
 * at a cell drops exactly the routes that could have become invalid.
 *
 * Single-threaded: owned by one Pathfinder and used from the update thread.
 */
class PathCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;

    explicit PathCache(size_t capacity = DEFAULT_CAPACITY);

    /**
     * Look up a route. Counts towards hit/miss statistics.
     * @return Copy of the cached result, nullopt on miss
     */
    std::optional<TerraNav::PathfindingResult> find(const PathCacheKey& key);

    /**
     * Store a successful result. Failed results are ignored.
     * @param traversedCells Cells the route passes through (used for invalidation)
     */
    void store(const PathCacheKey& key, const TerraNav::PathfindingResult& result,
               const std::vector<TerraNav::GridPoint>& traversedCells);

    /**
     * Drop every route that touches the cell.
     * @return Number of routes removed
     */
    size_t invalidateCell(int gx, int gy);
    size_t invalidateCells(const std::vector<TerraNav::GridPoint>& cells);

    void clear();
    size_t size() const { return m_entries.size(); }

    size_t getCapacity() const { return m_capacity; }
    void setCapacity(size_t capacity);

    PathCacheStats getStats() const;

private:
    struct CachedPath {
        PathCacheKey key;
        TerraNav::PathfindingResult result;
        std::vector<uint64_t> cells;
        uint64_t sequence;
    };

    size_t m_capacity;
    uint64_t m_nextSequence{0};
    std::unordered_map<uint64_t, CachedPath> m_entries;
    std::deque<std::pair<uint64_t, uint64_t>> m_insertionOrder; // (entry hash, sequence)
    std::unordered_map<uint64_t, boost::container::small_vector<uint64_t, 4>> m_cellIndex;

    PathCacheStats m_stats;

    static uint64_t hashKey(const PathCacheKey& key);
    static uint64_t cellKey(int gx, int gy) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(gx)) << 32) | static_cast<uint32_t>(gy);
    }

    void erase(uint64_t entryHash);
    void evictOldest();

    // Prevent copying
    PathCache(const PathCache&) = delete;
    PathCache& operator=(const PathCache&) = delete;
};

} // namespace NavInternal

#endif // PATH_CACHE_HPP
