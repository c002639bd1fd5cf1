/**
 * @file cache_store.cpp
 * @brief Implementation of JsonCacheStore
 */

#include "kelp_carbon/cache_store.hpp"
#include "kelp_carbon/serialization.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace kelp_carbon {

using json = nlohmann::json;

JsonCacheStore::JsonCacheStore(const std::string& path)
    : path_(path), entries_(json::object()) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return;  // first run
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse cache store " + path_ + ": " + e.what());
    }
    if (doc.contains("entries") && doc["entries"].is_object()) {
        entries_ = doc["entries"];
    }
}

std::optional<CarbonEstimate> JsonCacheStore::load(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.toString());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    try {
        return estimateFromJson(it->at("estimate"));
    } catch (const std::exception& e) {
        throw std::runtime_error("Corrupt cache record " + key.toString() + ": " + e.what());
    }
}

void JsonCacheStore::save(const CacheKey& key, const CarbonEstimate& estimate) {
    std::lock_guard<std::mutex> lock(mutex_);
    json record;
    record["geometry_hash"] = key.geometry_hash;
    record["date"] = key.date;
    record["pixel_count"] = estimate.pixel_count;
    record["valid_pixel_percentage"] = estimate.valid_pixel_fraction * 100.0;
    record["estimate"] = toJson(estimate);

    // Memory only changes once the file holds the new state
    json next = entries_;
    next[key.toString()] = std::move(record);
    flush(next);
    entries_ = std::move(next);
}

void JsonCacheStore::erase(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    json next = entries_;
    if (next.erase(key.toString()) > 0) {
        flush(next);
        entries_ = std::move(next);
    }
}

void JsonCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    json next = json::object();
    flush(next);
    entries_ = std::move(next);
}

size_t JsonCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void JsonCacheStore::flush(const json& entries) const {
    std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    // Write-then-rename; readers never see a partial document
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write cache store " + tmp.string());
        }
        json doc;
        doc["entries"] = entries;
        out << doc.dump(2);
        if (!out) {
            throw std::runtime_error("Write failed for cache store " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace cache store " + path_ + ": " + ec.message());
    }
}

} // namespace kelp_carbon
