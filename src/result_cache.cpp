/**
 * @file result_cache.cpp
 * @brief Implementation of ResultCache and geometry hashing
 */

#include "kelp_carbon/result_cache.hpp"
#include "kelp_carbon/geodesy.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace kelp_carbon {

// ============================================================================
// Geometry hashing
// ============================================================================

std::string normalizedRingText(const std::vector<GeoPoint>& ring, int precision) {
    // Closed rings only; the last vertex may differ from the first within the closure tolerance
    std::vector<GeoPoint> pts(ring.begin(), ring.end());
    if (pts.size() > 1) {
        pts.pop_back();
    }

    const double scale = std::pow(10.0, precision);
    for (auto& p : pts) {
        // + 0.0 folds -0 into 0
        p.lon = std::round(p.lon * scale) / scale + 0.0;
        p.lat = std::round(p.lat * scale) / scale + 0.0;
    }

    std::vector<GeoPoint> closed(pts);
    if (!closed.empty()) {
        closed.push_back(closed.front());
    }
    if (signedRingArea(closed) < 0.0) {
        std::reverse(pts.begin(), pts.end());
    }

    auto smallest = std::min_element(pts.begin(), pts.end(), [](const GeoPoint& a, const GeoPoint& b) {
        return a.lon < b.lon || (a.lon == b.lon && a.lat < b.lat);
    });
    std::rotate(pts.begin(), smallest, pts.end());

    std::string text;
    char buffer[64];
    for (size_t i = 0; i < pts.size(); ++i) {
        snprintf(buffer, sizeof(buffer), "%s%.*f %.*f", i ? "," : "",
                 precision, pts[i].lon, precision, pts[i].lat);
        text += buffer;
    }
    return text;
}

std::string sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

GeometryHash geometryHash(const AreaOfInterest& aoi, int precision) {
    return sha256Hex(normalizedRingText(aoi.ring, precision));
}

// ============================================================================
// ResultCache
// ============================================================================

ResultCache::ResultCache(std::shared_ptr<CacheStore> store) : store_(std::move(store)) {
}

CarbonEstimate ResultCache::getOrCompute(const CacheKey& key, const ComputeFn& compute, bool* cache_hit) {
    std::promise<CarbonEstimate> promise;
    uint64_t generation = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            std::shared_future<CarbonEstimate> future = it->second.future;
            lock.unlock();
            hits_++;
            if (cache_hit) *cache_hit = true;
            return future.get();
        }
        misses_++;
        generation = ++next_generation_;
        entries_[key] = Entry{promise.get_future().share(), generation};
    }

    try {
        CarbonEstimate value;
        bool from_store = false;
        if (auto stored = loadFromStore(key)) {
            value = *stored;
            from_store = true;
            store_hits_++;
        } else {
            computations_++;
            value = compute();
            saveToStore(key, value);
        }
        if (cache_hit) *cache_hit = from_store;
        promise.set_value(value);
        return value;
    } catch (...) {
        failures_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.generation == generation) {
                entries_.erase(it);
            }
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<CarbonEstimate> ResultCache::lookup(const CacheKey& key) const {
    std::shared_future<CarbonEstimate> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        future = it->second.future;
    }
    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

void ResultCache::invalidate(const CacheKey& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }
    if (store_) {
        try {
            store_->erase(key);
        } catch (const std::exception& e) {
            std::cerr << "[ResultCache] Warning: store erase failed: " << e.what() << std::endl;
        }
    }
}

void ResultCache::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }
    if (store_) {
        try {
            store_->clear();
        } catch (const std::exception& e) {
            std::cerr << "[ResultCache] Warning: store clear failed: " << e.what() << std::endl;
        }
    }
}

CacheStats ResultCache::stats() const {
    CacheStats s;
    s.hits = hits_;
    s.store_hits = store_hits_;
    s.misses = misses_;
    s.computations = computations_;
    s.failures = failures_;
    std::lock_guard<std::mutex> lock(mutex_);
    s.entries = entries_.size();
    return s;
}

std::optional<CarbonEstimate> ResultCache::loadFromStore(const CacheKey& key) {
    if (!store_) {
        return std::nullopt;
    }
    try {
        return store_->load(key);
    } catch (const std::exception& e) {
        std::cerr << "[ResultCache] Warning: store read failed, recomputing: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void ResultCache::saveToStore(const CacheKey& key, const CarbonEstimate& estimate) {
    if (!store_) {
        return;
    }
    try {
        store_->save(key, estimate);
    } catch (const std::exception& e) {
        std::cerr << "[ResultCache] Warning: store write failed: " << e.what() << std::endl;
    }
}

} // namespace kelp_carbon
