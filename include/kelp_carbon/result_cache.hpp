/**
 * @file result_cache.hpp
 * @brief Single-flight memoization of estimates keyed by (geometry, date)
 */

#pragma once

#include "cache_store.hpp"
#include "data_types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Canonical text of a ring used as hash input
 *
 * Expects a closed ring. Drops the closing vertex, rounds to @p precision
 * decimals, orients the ring counter-clockwise and starts it at the
 * lexicographically smallest vertex, so equal polygons give equal text
 * regardless of start point or winding.
 */
std::string normalizedRingText(const std::vector<GeoPoint>& ring, int precision = 7);

/**
 * @brief Lower-case hex SHA-256 of normalizedRingText()
 */
GeometryHash geometryHash(const AreaOfInterest& aoi, int precision = 7);

/**
 * @brief Lower-case hex SHA-256 of an arbitrary string
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256Hex(const std::string& data);

/**
 * @brief Cache counters
 */
struct CacheStats {
    uint64_t hits = 0;          ///< Served from memory (including in-flight waits)
    uint64_t store_hits = 0;    ///< Served from the durable store
    uint64_t misses = 0;
    uint64_t computations = 0;  ///< compute() invocations
    uint64_t failures = 0;      ///< compute() calls that threw
    size_t entries = 0;
};

/**
 * @brief Memoizes CarbonEstimates with at most one computation per key
 *
 * The first caller for a key installs a shared future and runs compute()
 * outside the lock; concurrent callers for the same key block on that
 * future. A failed computation is dropped so the next call retries, and
 * every caller waiting on it receives the same exception.
 */
class ResultCache {
public:
    using ComputeFn = std::function<CarbonEstimate()>;

    /**
     * @param store Optional durable mirror (may be null)
     */
    explicit ResultCache(std::shared_ptr<CacheStore> store = nullptr);

    /**
     * @brief Return the cached estimate for @p key or compute and remember it
     *
     * @param key Cache key
     * @param compute Producer run on a miss; its exceptions propagate
     * @param cache_hit Set to true when no computation ran for this call
     */
    CarbonEstimate getOrCompute(const CacheKey& key, const ComputeFn& compute,
                                bool* cache_hit = nullptr);

    /// Completed entry, if any (does not wait on in-flight work)
    std::optional<CarbonEstimate> lookup(const CacheKey& key) const;

    void invalidate(const CacheKey& key);
    void clear();

    CacheStats stats() const;

private:
    struct Entry {
        std::shared_future<CarbonEstimate> future;
        uint64_t generation = 0;
    };

    std::optional<CarbonEstimate> loadFromStore(const CacheKey& key);
    void saveToStore(const CacheKey& key, const CarbonEstimate& estimate);

    std::shared_ptr<CacheStore> store_;

    mutable std::mutex mutex_;
    std::map<CacheKey, Entry> entries_;
    uint64_t next_generation_ = 0;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> store_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> computations_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace kelp_carbon
