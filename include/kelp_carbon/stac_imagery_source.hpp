/**
 * @file stac_imagery_source.hpp
 * @brief Sentinel-2 L2A scenes from a STAC API, read through GDAL
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "imagery_source.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief One STAC item returned by a search
 */
struct SceneCandidate {
    std::string id;
    Date acquired;
    double cloud_cover = 100.0;                       ///< Percent
    std::vector<std::vector<GeoPoint>> footprint;     ///< Outer rings of the item geometry
    std::map<std::string, std::string> assets;        ///< Asset key -> href
    std::string platform;
    std::string collection;
    std::string processing_baseline;                  ///< e.g. "04.00"
};

/**
 * @brief Extract scene candidates from a STAC ItemCollection
 *
 * Items without an id, datetime or polygonal geometry are skipped with a
 * warning.
 *
 * @throws std::runtime_error if the document is not an ItemCollection
 */
std::vector<SceneCandidate> parseStacItems(const nlohmann::json& item_collection);

/**
 * @brief Pick the scene to analyze
 *
 * Only items whose footprint contains every AOI vertex are eligible. Items
 * acquired on the requested date win over the rest of the window; within the
 * chosen group the least cloudy item is taken (ties: closer date, then id).
 *
 * @throws std::runtime_error if no item covers the AOI
 */
SceneCandidate selectBestScene(const std::vector<SceneCandidate>& candidates,
                               const AreaOfInterest& aoi, const Date& date);

/**
 * @brief Digital number -> surface reflectance for Sentinel-2 L2A
 *
 * DN 0 is the product's no-data value and maps to @p nodata. Products with
 * processing baseline 04.00 or later carry a -1000 radiometric offset.
 */
float dnToReflectance(float dn, double processing_baseline, float nodata);

/**
 * @brief Whole seconds left before @p deadline, rounded up, never below 1
 *
 * Per-request HTTP and GDAL timeouts are derived from this so a single
 * request cannot run past the acquisition deadline.
 */
int timeoutSecondsUntil(std::chrono::steady_clock::time_point deadline);

/**
 * @brief Real imagery provider: STAC search + SAS-signed COG reads via GDAL
 */
class StacImagerySource : public ImagerySource {
public:
    explicit StacImagerySource(const Config& config);

    SceneFetch fetch(const AreaOfInterest& aoi, const Date& date) override;

    std::string name() const override { return "stac"; }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    nlohmann::json search(const AreaOfInterest& aoi, const Date& date, Deadline deadline) const;
    std::string requestSasToken(Deadline deadline) const;
    SpectralBandSet readBands(const SceneCandidate& scene, const AreaOfInterest& aoi,
                              const std::string& sas_token, Deadline deadline) const;

    static void checkDeadline(Deadline deadline, const std::string& step);

    Config cfg_;
};

} // namespace kelp_carbon
