/**
 * @file result_mapper.cpp
 * @brief Implementation of DefaultResultMapper
 */

#include "kelp_carbon/result_mapper.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace kelp_carbon {

using json = nlohmann::json;

std::string base64Encode(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

cv::Scalar DefaultResultMapper::densityColor(double density_t_ha) {
    if (density_t_ha > 50.0) return cv::Scalar(0, 100, 0);      // dark green
    if (density_t_ha > 20.0) return cv::Scalar(50, 205, 50);    // lime green
    if (density_t_ha > 10.0) return cv::Scalar(50, 205, 154);   // yellow green
    return cv::Scalar(140, 230, 240);                           // khaki
}

json DefaultResultMapper::render(const AreaOfInterest& aoi, const AnalysisResult& result,
                                 VisualizationKind kind) const {
    switch (kind) {
        case VisualizationKind::RAW_DATA:
            return geoJson(aoi, result);

        case VisualizationKind::RENDERED_IMAGE: {
            cv::Mat image = renderImage(aoi, result);
            std::vector<unsigned char> png;
            if (!cv::imencode(".png", image, png)) {
                throw std::runtime_error("PNG encoding failed");
            }
            json j;
            j["kind"] = toString(kind);
            j["format"] = "png";
            j["width"] = image.cols;
            j["height"] = image.rows;
            j["data_base64"] = base64Encode(png);
            return j;
        }

        case VisualizationKind::EMBEDDED_INTERACTIVE:
            throw std::runtime_error("embedded-interactive maps need an external map renderer");
    }
    throw std::invalid_argument("Unknown visualization kind");
}

json DefaultResultMapper::geoJson(const AreaOfInterest& aoi, const AnalysisResult& result) const {
    const CarbonEstimate& e = result.estimate;

    json ring = json::array();
    for (const auto& p : aoi.ring) {
        ring.push_back({p.lon, p.lat});
    }

    json feature;
    feature["type"] = "Feature";
    feature["geometry"] = {{"type", "Polygon"}, {"coordinates", json::array({ring})}};
    feature["properties"] = {
        {"area_hectares", e.area_m2 / 10000.0},
        {"biomass_tonnes", e.biomass_t},
        {"biomass_density_t_ha", e.biomass_density_t_ha},
        {"co2_tonnes", e.co2e_t},
        {"date", result.date},
        {"mean_fai", e.mean_fai},
        {"mean_ndre", e.mean_ndre},
        {"data_source", toString(e.data_source)},
    };

    BoundingBox box = aoi.bounds();
    GeoPoint c = aoi.centroid();

    json fc;
    fc["type"] = "FeatureCollection";
    fc["features"] = json::array({feature});
    fc["center"] = {{"lat", c.lat}, {"lon", c.lon}};
    fc["bounds"] = {{box.south, box.west}, {box.north, box.east}};
    return fc;
}

cv::Mat DefaultResultMapper::renderImage(const AreaOfInterest& aoi, const AnalysisResult& result) const {
    const int size = image_size_;
    const int margin = size / 10;
    cv::Mat image(size, size, CV_8UC3, cv::Scalar(120, 60, 20));  // ocean blue

    BoundingBox box = aoi.bounds();
    double span = std::max(std::max(box.width(), box.height()), 1e-12);
    double scale = (size - 2 * margin) / span;

    std::vector<cv::Point> pts;
    for (const auto& p : aoi.ring) {
        int x = margin + static_cast<int>((p.lon - box.west) * scale);
        int y = margin + static_cast<int>((box.north - p.lat) * scale);
        pts.emplace_back(x, y);
    }
    std::vector<std::vector<cv::Point>> polys{pts};

    const CarbonEstimate& e = result.estimate;
    cv::fillPoly(image, polys, densityColor(e.biomass_density_t_ha), cv::LINE_AA);
    cv::polylines(image, polys, true, cv::Scalar(255, 255, 255), 2, cv::LINE_AA);

    char label[128];
    snprintf(label, sizeof(label), "%s  %.1f t/ha  %.0f t CO2e",
             result.date.c_str(), e.biomass_density_t_ha, e.co2e_t);
    cv::putText(image, label, cv::Point(10, size - 12), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    return image;
}

} // namespace kelp_carbon
