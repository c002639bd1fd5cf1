/**
 * @file stac_imagery_source.cpp
 * @brief Implementation of the STAC/GDAL real imagery provider
 */

#include "kelp_carbon/stac_imagery_source.hpp"
#include "kelp_carbon/geodesy.hpp"

#include <httplib.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace kelp_carbon {

using json = nlohmann::json;

// ============================================================================
// STAC item parsing and scene selection
// ============================================================================

namespace {

std::vector<GeoPoint> ringFromJson(const json& coords) {
    std::vector<GeoPoint> ring;
    for (const auto& c : coords) {
        if (!c.is_array() || c.size() < 2) {
            throw std::runtime_error("malformed coordinate");
        }
        ring.push_back({c[0].get<double>(), c[1].get<double>()});
    }
    return ring;
}

std::vector<std::vector<GeoPoint>> footprintFromGeometry(const json& geometry) {
    std::vector<std::vector<GeoPoint>> rings;
    std::string type = geometry.value("type", "");
    const json& coords = geometry.at("coordinates");
    if (type == "Polygon") {
        rings.push_back(ringFromJson(coords.at(0)));
    } else if (type == "MultiPolygon") {
        for (const auto& polygon : coords) {
            rings.push_back(ringFromJson(polygon.at(0)));
        }
    } else {
        throw std::runtime_error("unsupported footprint geometry " + type);
    }
    return rings;
}

bool footprintCovers(const SceneCandidate& scene, const AreaOfInterest& aoi) {
    for (const auto& p : aoi.ring) {
        bool inside = false;
        for (const auto& ring : scene.footprint) {
            if (ringContains(ring, p)) {
                inside = true;
                break;
            }
        }
        if (!inside) {
            return false;
        }
    }
    return true;
}

/// "https://host/api/x" -> ("https://host", "/api/x")
std::pair<std::string, std::string> splitUrl(const std::string& url) {
    size_t scheme = url.find("://");
    size_t start = scheme == std::string::npos ? 0 : scheme + 3;
    size_t slash = url.find('/', start);
    if (slash == std::string::npos) {
        return {url, ""};
    }
    std::string path = url.substr(slash);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return {url.substr(0, slash), path};
}

std::string signHref(const std::string& href, const std::string& token) {
    if (token.empty()) {
        return href;
    }
    return href + (href.find('?') == std::string::npos ? "?" : "&") + token;
}

std::once_flag gdal_registered;

/// GDALProgressFunc; returning FALSE makes GDAL abandon the read with CE_Failure
int CPL_STDCALL continueUntilDeadline(double, const char*, void* data) {
    const auto* deadline = static_cast<const std::chrono::steady_clock::time_point*>(data);
    return std::chrono::steady_clock::now() > *deadline ? FALSE : TRUE;
}

struct CoordinateTransformDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

} // namespace

std::vector<SceneCandidate> parseStacItems(const json& item_collection) {
    if (!item_collection.is_object() || !item_collection.contains("features") ||
        !item_collection["features"].is_array()) {
        throw std::runtime_error("STAC response is not an ItemCollection");
    }

    std::vector<SceneCandidate> candidates;
    for (const auto& item : item_collection["features"]) {
        try {
            SceneCandidate scene;
            scene.id = item.at("id").get<std::string>();
            scene.collection = item.value("collection", "");

            const json& props = item.at("properties");
            scene.acquired = Date::parse(props.at("datetime").get<std::string>());
            scene.cloud_cover = props.value("eo:cloud_cover", 100.0);
            scene.platform = props.value("platform", "");
            scene.processing_baseline = props.value("s2:processing_baseline", "");

            scene.footprint = footprintFromGeometry(item.at("geometry"));

            if (item.contains("assets")) {
                for (const auto& [key, asset] : item["assets"].items()) {
                    if (asset.contains("href")) {
                        scene.assets[key] = asset["href"].get<std::string>();
                    }
                }
            }
            candidates.push_back(std::move(scene));
        } catch (const std::exception& e) {
            std::cerr << "[StacImagerySource] Skipping malformed STAC item: " << e.what() << std::endl;
        }
    }
    return candidates;
}

SceneCandidate selectBestScene(const std::vector<SceneCandidate>& candidates,
                               const AreaOfInterest& aoi, const Date& date) {
    std::vector<const SceneCandidate*> covering;
    for (const auto& c : candidates) {
        if (footprintCovers(c, aoi)) {
            covering.push_back(&c);
        }
    }
    if (covering.empty()) {
        throw std::runtime_error("no scene in the search window covers the AOI (" +
                                 std::to_string(candidates.size()) + " candidates)");
    }

    bool exact_available = std::any_of(covering.begin(), covering.end(),
        [&](const SceneCandidate* c) { return c->acquired == date; });

    const long target = date.toDays();
    const SceneCandidate* best = nullptr;
    for (const SceneCandidate* c : covering) {
        if (exact_available && c->acquired != date) {
            continue;
        }
        if (!best) {
            best = c;
            continue;
        }
        if (c->cloud_cover != best->cloud_cover) {
            if (c->cloud_cover < best->cloud_cover) best = c;
            continue;
        }
        long dc = std::labs(c->acquired.toDays() - target);
        long db = std::labs(best->acquired.toDays() - target);
        if (dc != db) {
            if (dc < db) best = c;
            continue;
        }
        if (c->id < best->id) {
            best = c;
        }
    }
    return *best;
}

int timeoutSecondsUntil(std::chrono::steady_clock::time_point deadline) {
    double remaining = std::chrono::duration<double>(deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::max(1.0, std::ceil(remaining)));
}

float dnToReflectance(float dn, double processing_baseline, float nodata) {
    if (dn == 0.0f || !std::isfinite(dn)) {
        return nodata;
    }
    double offset = processing_baseline >= 4.0 ? -1000.0 : 0.0;
    return static_cast<float>((dn + offset) / 10000.0);
}

// ============================================================================
// StacImagerySource
// ============================================================================

StacImagerySource::StacImagerySource(const Config& config) : cfg_(config) {
    std::call_once(gdal_registered, []() { GDALAllRegister(); });
}

void StacImagerySource::checkDeadline(Deadline deadline, const std::string& step) {
    if (std::chrono::steady_clock::now() > deadline) {
        throw std::runtime_error("acquisition timed out before " + step);
    }
}

SceneFetch StacImagerySource::fetch(const AreaOfInterest& aoi, const Date& date) {
    auto timeout = std::chrono::duration<double>(cfg_.acquisition_timeout_sec);
    Deadline deadline = std::chrono::steady_clock::now() +
                        std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);

    json response = search(aoi, date, deadline);
    std::vector<SceneCandidate> candidates = parseStacItems(response);
    if (cfg_.verbose) {
        std::cout << "[StacImagerySource] " << candidates.size() << " candidate scenes around "
                  << date.toString() << std::endl;
    }

    SceneCandidate scene = selectBestScene(candidates, aoi, date);

    checkDeadline(deadline, "SAS token request");
    std::string token = cfg_.sas_token_url.empty() ? "" : requestSasToken(deadline);

    checkDeadline(deadline, "band reads");
    SceneFetch result;
    result.bands = readBands(scene, aoi, token, deadline);

    char cloud[32];
    snprintf(cloud, sizeof(cloud), "%.2f", scene.cloud_cover);
    result.metadata["scene_id"] = scene.id;
    result.metadata["acquired"] = scene.acquired.toString();
    result.metadata["cloud_cover"] = cloud;
    result.metadata["platform"] = scene.platform;
    result.metadata["collection"] = scene.collection.empty() ? cfg_.stac_collection : scene.collection;
    if (!scene.processing_baseline.empty()) {
        result.metadata["processing_baseline"] = scene.processing_baseline;
    }
    return result;
}

json StacImagerySource::search(const AreaOfInterest& aoi, const Date& date, Deadline deadline) const {
    json coordinates = json::array();
    for (const auto& p : aoi.ring) {
        coordinates.push_back({p.lon, p.lat});
    }

    json body;
    body["collections"] = {cfg_.stac_collection};
    body["intersects"] = {{"type", "Polygon"}, {"coordinates", json::array({coordinates})}};
    body["datetime"] = date.addDays(-cfg_.acquisition_window_days).toString() + "T00:00:00Z/" +
                       date.addDays(cfg_.acquisition_window_days).toString() + "T23:59:59Z";
    body["query"] = {{"eo:cloud_cover", {{"lt", cfg_.max_cloud_cover}}}};
    body["limit"] = cfg_.max_search_items;

    auto [host, path] = splitUrl(cfg_.stac_api_url);
    httplib::Client cli(host);
    cli.set_follow_location(true);

    const int seconds = timeoutSecondsUntil(deadline);
    cli.set_connection_timeout(seconds, 0);
    cli.set_read_timeout(seconds, 0);

    auto started = std::chrono::steady_clock::now();
    httplib::Result res = cli.Post(path + "/search", body.dump(), "application/json");
    if (!res) {
        double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        if (waited >= 0.9 * seconds || std::chrono::steady_clock::now() > deadline) {
            throw std::runtime_error("acquisition timed out during STAC search after " +
                                     std::to_string(seconds) + " s (" + httplib::to_string(res.error()) + ")");
        }
        throw std::runtime_error("STAC search failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("STAC search returned HTTP " + std::to_string(res->status));
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("STAC search returned invalid JSON: ") + e.what());
    }
}

std::string StacImagerySource::requestSasToken(Deadline deadline) const {
    auto [host, path] = splitUrl(cfg_.sas_token_url);
    httplib::Client cli(host);
    cli.set_follow_location(true);

    const int seconds = timeoutSecondsUntil(deadline);
    cli.set_connection_timeout(seconds, 0);
    cli.set_read_timeout(seconds, 0);

    httplib::Result res = cli.Get(path + "/" + cfg_.stac_collection);
    if (!res) {
        throw std::runtime_error("SAS token request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("SAS token request returned HTTP " + std::to_string(res->status));
    }

    try {
        return json::parse(res->body).at("token").get<std::string>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("SAS token response is malformed: ") + e.what());
    }
}

SpectralBandSet StacImagerySource::readBands(const SceneCandidate& scene, const AreaOfInterest& aoi,
                                             const std::string& sas_token, Deadline deadline) const {
    const std::pair<SpectralBand, const char*> layout[] = {
        {SpectralBand::NIR, "B08"},  // reference grid, read first
        {SpectralBand::RED, "B04"},
        {SpectralBand::RED_EDGE, "B05"},
        {SpectralBand::SWIR, "B11"},
        {SpectralBand::SCENE_CLASSIFICATION, "SCL"},
    };

    for (const auto& entry : layout) {
        if (entry.first != SpectralBand::SCENE_CLASSIFICATION && !scene.assets.count(entry.second)) {
            throw std::runtime_error("scene " + scene.id + " has no asset " + entry.second);
        }
    }

    // Thread-local and restored on return; the worker thread is reused
    CPLConfigOptionSetter no_readdir("GDAL_DISABLE_READDIR_ON_OPEN", "EMPTY_DIR", false);

    double baseline = std::atof(scene.processing_baseline.c_str());

    auto open = [&](const char* key) {
        std::string path = "/vsicurl/" + signHref(scene.assets.at(key), sas_token);
        CPLConfigOptionSetter http_timeout("GDAL_HTTP_TIMEOUT",
                                           std::to_string(timeoutSecondsUntil(deadline)).c_str(), false);
        GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READ_ONLY));
        if (!ds) {
            throw std::runtime_error(std::string("GDAL could not open asset ") + key + ": " +
                                     CPLGetLastErrorMsg());
        }
        return ds;
    };

    SpectralBandSet set;
    set.nodata = cfg_.nodata_value;

    // --- Reference grid: AOI window on the B08 raster ---
    GDALDatasetUniquePtr ref = open("B08");
    double gt[6];
    if (ref->GetGeoTransform(gt) != CE_None) {
        throw std::runtime_error("asset B08 has no geotransform");
    }
    const char* projection = ref->GetProjectionRef();

    OGRSpatialReference wgs84;
    wgs84.importFromEPSG(4326);
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    OGRSpatialReference scene_srs;
    if (scene_srs.importFromWkt(projection) != OGRERR_NONE) {
        throw std::runtime_error("asset B08 has no usable spatial reference");
    }
    scene_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformDeleter> ct(
        OGRCreateCoordinateTransformation(&wgs84, &scene_srs));
    if (!ct) {
        throw std::runtime_error("cannot transform EPSG:4326 to the scene CRS");
    }

    std::vector<double> xs, ys;
    for (const auto& p : aoi.ring) {
        xs.push_back(p.lon);
        ys.push_back(p.lat);
    }
    if (!ct->Transform(static_cast<int>(xs.size()), xs.data(), ys.data())) {
        throw std::runtime_error("AOI reprojection failed");
    }

    double inv[6];
    if (!GDALInvGeoTransform(gt, inv)) {
        throw std::runtime_error("asset B08 geotransform is not invertible");
    }
    double min_col = 1e300, max_col = -1e300, min_row = 1e300, max_row = -1e300;
    for (size_t i = 0; i < xs.size(); ++i) {
        double col = inv[0] + xs[i] * inv[1] + ys[i] * inv[2];
        double row = inv[3] + xs[i] * inv[4] + ys[i] * inv[5];
        min_col = std::min(min_col, col);
        max_col = std::max(max_col, col);
        min_row = std::min(min_row, row);
        max_row = std::max(max_row, row);
    }
    int x0 = std::max(0, static_cast<int>(std::floor(min_col)));
    int y0 = std::max(0, static_cast<int>(std::floor(min_row)));
    int x1 = std::min(ref->GetRasterXSize(), static_cast<int>(std::ceil(max_col)));
    int y1 = std::min(ref->GetRasterYSize(), static_cast<int>(std::ceil(max_row)));
    if (x1 <= x0 || y1 <= y0) {
        throw std::runtime_error("AOI falls outside the raster of scene " + scene.id);
    }
    const int width = x1 - x0;
    const int height = y1 - y0;

    set.transform.coeffs = {gt[0] + x0 * gt[1] + y0 * gt[2], gt[1], gt[2],
                            gt[3] + x0 * gt[4] + y0 * gt[5], gt[4], gt[5]};
    set.transform.crs = projection;
    set.transform.resolution_m = std::sqrt(std::abs(gt[1] * gt[5] - gt[2] * gt[4]));

    // World extent of the window corners
    const double wx0 = set.transform.coeffs[0];
    const double wy0 = set.transform.coeffs[3];
    const double wx1 = wx0 + width * gt[1] + height * gt[2];
    const double wy1 = wy0 + width * gt[4] + height * gt[5];

    // --- Read every band onto the reference grid ---
    for (const auto& [band, key] : layout) {
        if (!scene.assets.count(key)) {
            continue;
        }
        checkDeadline(deadline, std::string("reading ") + key);

        GDALDatasetUniquePtr owned;
        GDALDataset* ds = ref.get();
        if (band != SpectralBand::NIR) {
            owned = open(key);
            ds = owned.get();
        }

        double bgt[6], binv[6];
        if (ds->GetGeoTransform(bgt) != CE_None || !GDALInvGeoTransform(bgt, binv)) {
            throw std::runtime_error(std::string("asset ") + key + " has no usable geotransform");
        }
        double c0 = binv[0] + wx0 * binv[1] + wy0 * binv[2];
        double r0 = binv[3] + wx0 * binv[4] + wy0 * binv[5];
        double c1 = binv[0] + wx1 * binv[1] + wy1 * binv[2];
        double r1 = binv[3] + wx1 * binv[4] + wy1 * binv[5];

        GDALRasterIOExtraArg extra;
        INIT_RASTERIO_EXTRA_ARG(extra);
        extra.eResampleAlg = band == SpectralBand::SCENE_CLASSIFICATION ? GRIORA_NearestNeighbour
                                                                         : GRIORA_Bilinear;
        extra.bFloatingPointWindowValidity = TRUE;
        extra.dfXOff = c0;
        extra.dfYOff = r0;
        extra.dfXSize = c1 - c0;
        extra.dfYSize = r1 - r0;
        extra.pfnProgress = continueUntilDeadline;
        extra.pProgressData = &deadline;

        int ix0 = std::max(0, static_cast<int>(std::floor(c0)));
        int iy0 = std::max(0, static_cast<int>(std::floor(r0)));
        int ix1 = std::min(ds->GetRasterXSize(), static_cast<int>(std::ceil(c1)));
        int iy1 = std::min(ds->GetRasterYSize(), static_cast<int>(std::ceil(r1)));
        if (ix1 <= ix0 || iy1 <= iy0) {
            throw std::runtime_error(std::string("asset ") + key + " does not cover the AOI window");
        }

        cv::Mat raster(height, width, CV_32F);
        CPLConfigOptionSetter http_timeout("GDAL_HTTP_TIMEOUT",
                                           std::to_string(timeoutSecondsUntil(deadline)).c_str(), false);
        CPLErr err = ds->GetRasterBand(1)->RasterIO(GF_Read, ix0, iy0, ix1 - ix0, iy1 - iy0,
                                                    raster.ptr<float>(), width, height,
                                                    GDT_Float32, 0, 0, &extra);
        if (err != CE_None && std::chrono::steady_clock::now() > deadline) {
            throw std::runtime_error(std::string("acquisition timed out while reading asset ") + key);
        }
        if (err != CE_None) {
            throw std::runtime_error(std::string("reading asset ") + key + " failed: " +
                                     CPLGetLastErrorMsg());
        }

        if (band != SpectralBand::SCENE_CLASSIFICATION) {
            for (int r = 0; r < height; ++r) {
                float* row = raster.ptr<float>(r);
                for (int c = 0; c < width; ++c) {
                    row[c] = dnToReflectance(row[c], baseline, set.nodata);
                }
            }
        }
        set.bands[band] = raster;
    }

    // --- AOI footprint on the reference grid ---
    std::vector<cv::Point2d> pixel_ring;
    for (size_t i = 0; i < xs.size(); ++i) {
        Eigen::Vector2d px = set.transform.worldToPixel(xs[i], ys[i]);
        pixel_ring.emplace_back(px.x(), px.y());
    }
    set.footprint = rasterizeFootprint(pixel_ring, cv::Size(width, height));

    if (cfg_.verbose) {
        std::cout << "[StacImagerySource] Read " << width << "x" << height << " window of "
                  << scene.id << std::endl;
    }
    return set;
}

} // namespace kelp_carbon
