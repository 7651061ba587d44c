#include "ai/internal/PathCache.hpp"

#include <algorithm>

#include "core/Logger.hpp"

namespace NavInternal {

PathCache::PathCache(size_t capacity)
    : m_capacity(std::max<size_t>(1, capacity))
{
    m_entries.reserve(m_capacity);
}

std::optional<TerraNav::PathfindingResult> PathCache::find(const PathCacheKey& key)
{
    m_stats.totalQueries++;

    auto it = m_entries.find(hashKey(key));
    if (it != m_entries.end() && it->second.key == key) {
        m_stats.totalHits++;
        return it->second.result;
    }

    m_stats.totalMisses++;
    return std::nullopt;
}

void PathCache::store(const PathCacheKey& key, const TerraNav::PathfindingResult& result,
                      const std::vector<TerraNav::GridPoint>& traversedCells)
{
    if (!result.success || result.path.empty()) {
        return;
    }

    const uint64_t entryHash = hashKey(key);

    // Replacing (or colliding with) an existing entry drops the old one first
    if (m_entries.find(entryHash) != m_entries.end()) {
        erase(entryHash);
    }

    while (m_entries.size() >= m_capacity && !m_insertionOrder.empty()) {
        evictOldest();
    }

    CachedPath entry{key, result, {}, m_nextSequence++};
    entry.cells.reserve(traversedCells.size() + 2);
    auto addCell = [&entry](int gx, int gy) {
        uint64_t ck = cellKey(gx, gy);
        if (std::find(entry.cells.begin(), entry.cells.end(), ck) == entry.cells.end()) {
            entry.cells.push_back(ck);
        }
    };
    addCell(key.start.x, key.start.y);
    addCell(key.goal.x, key.goal.y);
    for (const auto& p : traversedCells) {
        addCell(p.x, p.y);
    }

    for (uint64_t ck : entry.cells) {
        m_cellIndex[ck].push_back(entryHash);
    }
    m_insertionOrder.emplace_back(entryHash, entry.sequence);
    m_entries.emplace(entryHash, std::move(entry));

    // Invalidation leaves dead order records behind; drop them once they pile up
    if (m_insertionOrder.size() > m_capacity * 4) {
        std::erase_if(m_insertionOrder, [this](const std::pair<uint64_t, uint64_t>& record) {
            auto it = m_entries.find(record.first);
            return it == m_entries.end() || it->second.sequence != record.second;
        });
    }
}

size_t PathCache::invalidateCell(int gx, int gy)
{
    auto it = m_cellIndex.find(cellKey(gx, gy));
    if (it == m_cellIndex.end()) {
        return 0;
    }

    // erase() edits the index, so work from a copy
    const auto dependents = it->second;
    size_t removed = 0;
    for (uint64_t entryHash : dependents) {
        if (m_entries.find(entryHash) != m_entries.end()) {
            erase(entryHash);
            ++removed;
        }
    }
    m_stats.invalidatedPaths += removed;
    return removed;
}

size_t PathCache::invalidateCells(const std::vector<TerraNav::GridPoint>& cells)
{
    size_t removed = 0;
    for (const auto& p : cells) {
        removed += invalidateCell(p.x, p.y);
    }
    if (removed > 0) {
        PATHFIND_DEBUG("PathCache: invalidated " + std::to_string(removed) + " cached routes");
    }
    return removed;
}

void PathCache::clear()
{
    m_entries.clear();
    m_insertionOrder.clear();
    m_cellIndex.clear();
    m_stats = PathCacheStats{};
}

void PathCache::setCapacity(size_t capacity)
{
    m_capacity = std::max<size_t>(1, capacity);
    while (m_entries.size() > m_capacity && !m_insertionOrder.empty()) {
        evictOldest();
    }
}

PathCacheStats PathCache::getStats() const
{
    PathCacheStats stats = m_stats;
    stats.totalPaths = m_entries.size();
    stats.updateHitRate();
    return stats;
}

// Private helper methods

uint64_t PathCache::hashKey(const PathCacheKey& key)
{
    // FNV-1a over the key fields
    uint64_t hash = 14695981039346656037ULL;
    auto mix = [&hash](uint64_t value) {
        hash ^= value;
        hash *= 1099511628211ULL;
    };
    mix(static_cast<uint32_t>(key.start.x));
    mix(static_cast<uint32_t>(key.start.y));
    mix(static_cast<uint32_t>(key.goal.x));
    mix(static_cast<uint32_t>(key.goal.y));
    mix(static_cast<uint64_t>(key.movement));
    mix(key.optionsSignature);
    return hash;
}

void PathCache::erase(uint64_t entryHash)
{
    auto it = m_entries.find(entryHash);
    if (it == m_entries.end()) {
        return;
    }

    for (uint64_t ck : it->second.cells) {
        auto indexIt = m_cellIndex.find(ck);
        if (indexIt == m_cellIndex.end()) continue;
        auto& bucket = indexIt->second;
        bucket.erase(std::remove(bucket.begin(), bucket.end(), entryHash), bucket.end());
        if (bucket.empty()) {
            m_cellIndex.erase(indexIt);
        }
    }
    m_entries.erase(it);
}

void PathCache::evictOldest()
{
    // Skip order records whose entry was already invalidated or replaced
    while (!m_insertionOrder.empty()) {
        auto [entryHash, sequence] = m_insertionOrder.front();
        m_insertionOrder.pop_front();

        auto it = m_entries.find(entryHash);
        if (it != m_entries.end() && it->second.sequence == sequence) {
            erase(entryHash);
            m_stats.evictedPaths++;
            return;
        }
    }
}

} // namespace NavInternal
