/**
 * @file cache_store.hpp
 * @brief Durable mirror for cached estimates
 */

#pragma once

#include "data_types.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace kelp_carbon {

/**
 * @brief Memoization key: normalized geometry digest plus date
 */
struct CacheKey {
    GeometryHash geometry_hash;
    std::string date;  ///< YYYY-MM-DD

    std::string toString() const { return geometry_hash + "|" + date; }

    bool operator==(const CacheKey& o) const {
        return geometry_hash == o.geometry_hash && date == o.date;
    }
    bool operator<(const CacheKey& o) const {
        return geometry_hash < o.geometry_hash ||
               (geometry_hash == o.geometry_hash && date < o.date);
    }
};

/**
 * @brief Persistent key -> estimate table
 *
 * Implementations throw std::runtime_error on I/O failure; ResultCache logs
 * those and carries on with the in-memory cache.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<CarbonEstimate> load(const CacheKey& key) = 0;
    virtual void save(const CacheKey& key, const CarbonEstimate& estimate) = 0;
    virtual void erase(const CacheKey& key) = 0;
    virtual void clear() = 0;
};

/**
 * @brief CacheStore backed by a single JSON file
 *
 * The file holds {"entries": {"<hash>|<date>": {...record...}}}. The whole
 * document is rewritten on every change.
 */
class JsonCacheStore : public CacheStore {
public:
    /**
     * @param path File to read (if present) and write
     * @throws std::runtime_error if an existing file cannot be parsed
     */
    explicit JsonCacheStore(const std::string& path);

    std::optional<CarbonEstimate> load(const CacheKey& key) override;
    void save(const CacheKey& key, const CarbonEstimate& estimate) override;
    void erase(const CacheKey& key) override;
    void clear() override;

    size_t size() const;

private:
    /// Writes @p entries to path_; throws std::runtime_error on failure
    void flush(const nlohmann::json& entries) const;

    std::string path_;
    mutable std::mutex mutex_;
    nlohmann::json entries_;
};

} // namespace kelp_carbon
