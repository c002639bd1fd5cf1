/**
 * @file synthetic_scene.cpp
 * @brief Implementation of the deterministic synthetic scene generator
 */

#include "kelp_carbon/synthetic_scene.hpp"
#include "kelp_carbon/geodesy.hpp"
#include "kelp_carbon/imagery_source.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace kelp_carbon {

namespace {

// Surface reflectance end-members (red, red-edge, NIR, SWIR)
struct Endmember {
    float red;
    float red_edge;
    float nir;
    float swir;
};

const Endmember kOpenWater = {0.030f, 0.018f, 0.015f, 0.006f};
const Endmember kKelpCanopy = {0.040f, 0.090f, 0.230f, 0.035f};

constexpr float kMinReflectance = 0.0005f;
constexpr double kSensorNoise = 0.002;

} // namespace

SyntheticSceneGenerator::SyntheticSceneGenerator(const Config& config)
    : grid_size_(config.synthetic_grid_size),
      nodata_(config.nodata_value) {
}

uint64_t SyntheticSceneGenerator::seedFor(const AreaOfInterest& aoi, const Date& date) {
    GeoPoint c = aoi.centroid();
    char buffer[96];
    snprintf(buffer, sizeof(buffer), "%.6f,%.6f|%s", c.lon, c.lat, date.toString().c_str());

    uint64_t hash = 14695981039346656037ULL;
    for (const char* p = buffer; *p; ++p) {
        hash ^= static_cast<unsigned char>(*p);
        hash *= 1099511628211ULL;
    }
    return hash;
}

SpectralBandSet SyntheticSceneGenerator::generate(const AreaOfInterest& aoi, const Date& date) const {
    const int n = grid_size_;
    cv::RNG rng(seedFor(aoi, date));

    // --- Geotransform over the AOI bounds (EPSG:4326) ---
    BoundingBox box = aoi.bounds();
    SpectralBandSet set;
    set.nodata = nodata_;
    set.transform.crs = "EPSG:4326";
    set.transform.coeffs = {box.west, box.width() / n, 0.0,
                            box.north, 0.0, -box.height() / n};

    GeoPoint centre = aoi.centroid();
    double m_per_deg_lat = 111132.954 - 559.822 * std::cos(2.0 * deg2rad(centre.lat));
    double m_per_deg_lon = 111412.84 * std::cos(deg2rad(centre.lat));
    set.transform.resolution_m = std::sqrt(std::abs(set.transform.coeffs[1]) * m_per_deg_lon *
                                           std::abs(set.transform.coeffs[5]) * m_per_deg_lat);

    // --- Footprint ---
    std::vector<cv::Point2d> pixel_ring;
    pixel_ring.reserve(aoi.ring.size());
    for (const auto& p : aoi.ring) {
        Eigen::Vector2d px = set.transform.worldToPixel(p.lon, p.lat);
        pixel_ring.emplace_back(px.x(), px.y());
    }
    set.footprint = rasterizeFootprint(pixel_ring, cv::Size(n, n));

    // --- Kelp canopy field: smoothed noise thresholded at the cover fraction ---
    cv::Mat noise(n, n, CV_32F);
    rng.fill(noise, cv::RNG::NORMAL, 0.0, 1.0);
    cv::Mat field;
    cv::GaussianBlur(noise, field, cv::Size(0, 0), std::max(1.5, n / 12.0));

    // Canopy peaks in late summer in the northern hemisphere
    double season = std::sin(2.0 * M_PI * (date.month - 5) / 12.0);
    if (centre.lat < 0.0) {
        season = -season;
    }
    double cover = std::clamp(0.50 + 0.15 * rng.uniform(-1.0, 1.0) + 0.08 * season, 0.40, 0.70);

    std::vector<float> values(field.begin<float>(), field.end<float>());
    size_t k = static_cast<size_t>((1.0 - cover) * (values.size() - 1));
    std::nth_element(values.begin(), values.begin() + k, values.end());
    float threshold = values[k];
    double field_max = 0.0;
    cv::minMaxLoc(field, nullptr, &field_max);
    double span = std::max(field_max - threshold, 1e-6);

    // --- Mix end-members per pixel ---
    cv::Mat red(n, n, CV_32F), red_edge(n, n, CV_32F), nir(n, n, CV_32F), swir(n, n, CV_32F);
    cv::Mat sensor(n, n, CV_32FC4);
    rng.fill(sensor, cv::RNG::NORMAL, 0.0, kSensorNoise);

    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            float v = field.at<float>(r, c);
            double density = 0.0;
            if (v >= threshold) {
                density = 0.3 + 0.7 * std::min(1.0, (v - threshold) / span);
            }
            const cv::Vec4f& e = sensor.at<cv::Vec4f>(r, c);
            auto mix = [&](float water, float kelp, float eps) {
                float value = static_cast<float>(water * (1.0 - density) + kelp * density) + eps;
                return std::max(value, kMinReflectance);
            };
            red.at<float>(r, c) = mix(kOpenWater.red, kKelpCanopy.red, e[0]);
            red_edge.at<float>(r, c) = mix(kOpenWater.red_edge, kKelpCanopy.red_edge, e[1]);
            nir.at<float>(r, c) = mix(kOpenWater.nir, kKelpCanopy.nir, e[2]);
            swir.at<float>(r, c) = mix(kOpenWater.swir, kKelpCanopy.swir, e[3]);
        }
    }

    set.bands[SpectralBand::RED] = red;
    set.bands[SpectralBand::RED_EDGE] = red_edge;
    set.bands[SpectralBand::NIR] = nir;
    set.bands[SpectralBand::SWIR] = swir;

    return set;
}

} // namespace kelp_carbon
