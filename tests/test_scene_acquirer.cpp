/**
 * @file test_scene_acquirer.cpp
 * @brief Synthetic generation, fallback bookkeeping, STAC scene selection and timeouts
 */

#include "test_common.hpp"
#include <kelp_carbon/geometry_resolver.hpp>
#include <kelp_carbon/scene_acquirer.hpp>
#include <kelp_carbon/stac_imagery_source.hpp>
#include <kelp_carbon/synthetic_scene.hpp>

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace kelp_carbon;
using test_util::expect_true;
using test_util::throws;
using json = nlohmann::json;

namespace {

const std::string kTag = "acquirer";

AreaOfInterest testArea() {
    return GeometryResolver(test_util::quietConfig()).resolve(test_util::kTestPolygon);
}

bool identical(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

int test_synthetic_generator() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    AreaOfInterest aoi = testArea();
    SyntheticSceneGenerator generator(cfg);

    Date date = Date::parse("2023-07-15");
    SpectralBandSet a = generator.generate(aoi, date);
    SpectralBandSet b = generator.generate(aoi, date);
    SpectralBandSet other = generator.generate(aoi, Date::parse("2023-07-16"));

    const SpectralBand bands[] = {SpectralBand::RED, SpectralBand::RED_EDGE, SpectralBand::NIR, SpectralBand::SWIR};
    bool same = true;
    for (SpectralBand band : bands) {
        same = same && identical(a.band(band), b.band(band));
    }
    failures += expect_true(kTag, same, "same (area, date) gives identical bands");
    failures += expect_true(kTag, !identical(a.band(SpectralBand::NIR), other.band(SpectralBand::NIR)),
                            "another date gives another scene");
    failures += expect_true(kTag, SyntheticSceneGenerator::seedFor(aoi, date) ==
                                  SyntheticSceneGenerator::seedFor(aoi, date), "seed is stable");

    failures += expect_true(kTag, a.size() == cv::Size(cfg.synthetic_grid_size, cfg.synthetic_grid_size),
                            "grid is N x N");
    failures += expect_true(kTag, !a.has(SpectralBand::SCENE_CLASSIFICATION), "no classification band");
    failures += expect_true(kTag, cv::countNonZero(a.footprint) > cfg.synthetic_grid_size * cfg.synthetic_grid_size / 2,
                            "rectangular AOI fills most of its own bounding box");

    double min_v = 0.0, max_v = 0.0;
    cv::minMaxLoc(a.band(SpectralBand::SWIR), &min_v, &max_v);
    failures += expect_true(kTag, min_v >= 0.0 && max_v < cfg.land_swir_threshold, "no land pixels");
    cv::minMaxLoc(a.band(SpectralBand::RED), &min_v, &max_v);
    failures += expect_true(kTag, min_v >= 0.0 && max_v < cfg.cloud_red_threshold, "no cloud pixels");

    Eigen::Vector2d corner = a.transform.pixelToWorld(0.0, 0.0);
    failures += expect_true(kTag, test_util::nearly_equal(corner.x(), -123.5, 1e-9) &&
                                  test_util::nearly_equal(corner.y(), 48.5, 1e-9),
                            "grid origin is the north-west corner of the bounds");
    failures += expect_true(kTag, a.transform.resolution_m > 100.0 && a.transform.resolution_m < 200.0,
                            "0.1 deg over 64 pixels is ~115-175 m");
    return failures;
}

int test_fallback_metadata() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    AreaOfInterest aoi = testArea();
    Date date = Date::parse("2023-07-15");

    // Not requested
    auto source = std::make_shared<test_util::FakeImagerySource>(test_util::kelpBands());
    SceneAcquirer acquirer(cfg, source);
    AcquisitionResult r = acquirer.acquire(aoi, date, false);
    failures += expect_true(kTag, r.data_source == DataSource::SYNTHETIC, "prefer_real=false is synthetic");
    failures += expect_true(kTag, r.source_metadata["fallback_reason"] == "real imagery not requested",
                            "fallback reason recorded");
    failures += expect_true(kTag, source->calls() == 0, "real source not contacted");

    // Real scene available
    r = acquirer.acquire(aoi, date, true);
    failures += expect_true(kTag, r.data_source == DataSource::REAL, "real scene used");
    failures += expect_true(kTag, r.source_metadata["scene_id"] == "S2A_FAKE_2023-07-15", "scene metadata kept");
    failures += expect_true(kTag, r.source_metadata.count("fallback_reason") == 0, "no fallback reason");

    // Source fails
    auto failing = std::make_shared<test_util::FakeImagerySource>(test_util::kelpBands(), 0, true);
    SceneAcquirer degraded(cfg, failing);
    try {
        r = degraded.acquire(aoi, date, true);
        failures += expect_true(kTag, r.data_source == DataSource::SYNTHETIC, "failure degrades to synthetic");
        failures += expect_true(kTag, r.source_metadata["fallback_reason"].find("no coverage") != std::string::npos,
                                "provider error text recorded");
        failures += expect_true(kTag, r.source_metadata["requested_source"] == "real", "requested source recorded");
        failures += expect_true(kTag, !r.bands.band(SpectralBand::NIR).empty(), "synthetic bands produced");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("acquire must not throw: ") + e.what());
    }

    // No source configured
    SceneAcquirer offline(cfg, nullptr);
    r = offline.acquire(aoi, date, true);
    failures += expect_true(kTag, r.data_source == DataSource::SYNTHETIC &&
                                  r.source_metadata["fallback_reason"] == "no real imagery source configured",
                            "missing source degrades to synthetic");

    // Misaligned real bands are rejected
    SpectralBandSet broken = test_util::kelpBands(16, 16);
    broken.bands[SpectralBand::SWIR] = cv::Mat(8, 8, CV_32F, cv::Scalar(0.02f));
    SceneAcquirer checker(cfg, std::make_shared<test_util::FakeImagerySource>(broken));
    r = checker.acquire(aoi, date, true);
    failures += expect_true(kTag, r.data_source == DataSource::SYNTHETIC, "misaligned bands fall back");
    return failures;
}

json stacItem(const std::string& id, const std::string& datetime, double cloud,
              double west, double south, double east, double north) {
    json ring = json::array({{west, south}, {east, south}, {east, north}, {west, north}, {west, south}});
    json item;
    item["type"] = "Feature";
    item["id"] = id;
    item["collection"] = "sentinel-2-l2a";
    item["geometry"] = {{"type", "Polygon"}, {"coordinates", json::array({ring})}};
    item["properties"] = {{"datetime", datetime}, {"eo:cloud_cover", cloud},
                          {"platform", "Sentinel-2B"}, {"s2:processing_baseline", "05.09"}};
    item["assets"] = {{"B04", {{"href", "https://example.org/" + id + "/B04.tif"}}},
                      {"B08", {{"href", "https://example.org/" + id + "/B08.tif"}}}};
    return item;
}

int test_stac_parsing_and_selection() {
    int failures = 0;
    AreaOfInterest aoi = testArea();
    Date date = Date::parse("2023-07-15");

    json fc;
    fc["type"] = "FeatureCollection";
    fc["features"] = json::array({
        stacItem("A_exact_cloudy", "2023-07-15T19:09:11Z", 22.0, -124.0, 48.0, -123.0, 49.0),
        stacItem("B_near_clear", "2023-07-13T19:09:11Z", 1.0, -124.0, 48.0, -123.0, 49.0),
        stacItem("C_exact_partial", "2023-07-15T19:09:11Z", 5.0, -123.45, 48.0, -123.0, 49.0),
        stacItem("D_far_clear", "2023-07-10T19:09:11Z", 1.0, -124.0, 48.0, -123.0, 49.0),
    });
    json broken;
    broken["id"] = "no_geometry";
    fc["features"].push_back(broken);

    std::vector<SceneCandidate> items = parseStacItems(fc);
    failures += expect_true(kTag, items.size() == 4, "malformed item skipped");
    failures += expect_true(kTag, items[0].acquired == date && items[0].cloud_cover == 22.0, "item fields parsed");
    failures += expect_true(kTag, items[0].assets.count("B08") == 1 && items[0].processing_baseline == "05.09",
                            "assets and baseline parsed");

    // Exact-date item wins over a clearer one; the partial footprint is ignored
    SceneCandidate best = selectBestScene(items, aoi, date);
    failures += expect_true(kTag, best.id == "A_exact_cloudy", "exact date preferred, got " + best.id);

    // No exact date: least cloudy, ties broken by date distance
    Date other = Date::parse("2023-07-12");
    best = selectBestScene(items, aoi, other);
    failures += expect_true(kTag, best.id == "B_near_clear", "least cloudy then closest, got " + best.id);

    // Ties on cloud and distance: lowest id
    std::vector<SceneCandidate> twins = {items[1], items[1]};
    twins[0].id = "Z";
    twins[1].id = "Y";
    best = selectBestScene(twins, aoi, other);
    failures += expect_true(kTag, best.id == "Y", "id breaks the final tie");

    std::vector<SceneCandidate> partial = {items[2]};
    failures += expect_true(kTag, throws<std::runtime_error>([&]() { selectBestScene(partial, aoi, date); }),
                            "no covering scene throws");

    failures += expect_true(kTag, throws<std::runtime_error>([]() { parseStacItems(json::array()); }),
                            "non-collection response throws");
    return failures;
}

int test_reflectance_conversion_and_footprint() {
    int failures = 0;
    const float nodata = -9999.0f;
    failures += expect_true(kTag, test_util::nearly_equal(dnToReflectance(1500.0f, 5.09, nodata), 0.05, 1e-7),
                            "baseline >= 04.00 applies the -1000 offset");
    failures += expect_true(kTag, test_util::nearly_equal(dnToReflectance(1500.0f, 3.01, nodata), 0.15, 1e-7),
                            "older baselines have no offset");
    failures += expect_true(kTag, dnToReflectance(0.0f, 5.09, nodata) == nodata, "DN 0 is no-data");

    // Square from (2,2) to (6,6) in pixel units covers pixel centres 2..5
    std::vector<cv::Point2d> ring = {{2, 2}, {6, 2}, {6, 6}, {2, 6}, {2, 2}};
    cv::Mat mask = rasterizeFootprint(ring, cv::Size(10, 10));
    failures += expect_true(kTag, mask.at<uchar>(3, 3) == 255 && mask.at<uchar>(5, 5) == 255, "inside pixels set");
    failures += expect_true(kTag, mask.at<uchar>(0, 0) == 0 && mask.at<uchar>(8, 8) == 0, "outside pixels clear");
    int n = cv::countNonZero(mask);
    failures += expect_true(kTag, n >= 16 && n <= 25, "about 4x4 pixels, got " + std::to_string(n));
    return failures;
}

int test_search_timeout_falls_back_to_synthetic() {
    int failures = 0;

    // Local catalogue that answers long after the acquisition timeout
    std::atomic<bool> finished{false};
    httplib::Server server;
    server.Post("/api/stac/v1/search", [&](const httplib::Request&, httplib::Response& res) {
        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(4);
        while (!finished && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        res.set_content("{\"type\":\"FeatureCollection\",\"features\":[]}", "application/json");
    });
    int port = server.bind_to_any_port("127.0.0.1");
    if (port <= 0) {
        return expect_true(kTag, false, "could not bind a local port");
    }
    std::thread listener([&]() { server.listen_after_bind(); });

    Config cfg = test_util::quietConfig();
    cfg.acquisition_timeout_sec = 1.0;
    cfg.stac_api_url = "http://127.0.0.1:" + std::to_string(port) + "/api/stac/v1";
    cfg.sas_token_url = "";

    AreaOfInterest aoi = testArea();
    SceneAcquirer acquirer(cfg, std::make_shared<StacImagerySource>(cfg));

    auto start = std::chrono::steady_clock::now();
    try {
        AcquisitionResult r = acquirer.acquire(aoi, Date::parse("2023-07-15"), true);
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        failures += expect_true(kTag, r.data_source == DataSource::SYNTHETIC, "slow catalogue degrades to synthetic");
        failures += expect_true(kTag, r.source_metadata["fallback_reason"].find("timed out") != std::string::npos,
                                "fallback reason names the timeout, got '" + r.source_metadata["fallback_reason"] + "'");
        failures += expect_true(kTag, elapsed < 2.0 * cfg.acquisition_timeout_sec,
                                "acquire returns within twice the timeout, took " + std::to_string(elapsed) + " s");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("acquire must not throw: ") + e.what());
    }

    finished = true;
    server.stop();
    listener.join();
    return failures;
}

int test_timeout_seconds_until() {
    int failures = 0;
    auto now = std::chrono::steady_clock::now();
    failures += expect_true(kTag, timeoutSecondsUntil(now + std::chrono::milliseconds(2500)) == 3,
                            "partial seconds round up");
    failures += expect_true(kTag, timeoutSecondsUntil(now - std::chrono::seconds(5)) == 1,
                            "passed deadline still gives a 1 s timeout");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_synthetic_generator();
    failures += test_fallback_metadata();
    failures += test_stac_parsing_and_selection();
    failures += test_reflectance_conversion_and_footprint();
    failures += test_timeout_seconds_until();
    failures += test_search_timeout_falls_back_to_synthetic();
    return test_util::report(kTag, failures);
}
