/**
 * @file data_types.hpp
 * @brief Core data structures: geometry, rasters, summaries and estimates
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <array>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kelp_carbon {

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Geographic position in degrees (WGS84)
 */
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;
};

/**
 * @brief Axis-aligned lon/lat bounds
 */
struct BoundingBox {
    double west = 0.0;
    double south = 0.0;
    double east = 0.0;
    double north = 0.0;

    double width() const { return east - west; }
    double height() const { return north - south; }
};

/**
 * @brief Calendar date (ISO-8601 YYYY-MM-DD)
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /**
     * @brief Parse "YYYY-MM-DD"; a trailing "Thh:mm..." time part is ignored
     * @throws std::invalid_argument on malformed or impossible dates
     */
    static Date parse(const std::string& iso);

    /// Days since 1970-01-01 (proleptic Gregorian)
    long toDays() const;

    static Date fromDays(long days);

    Date addDays(long n) const { return fromDays(toDays() + n); }

    std::string toString() const;

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return toDays() < o.toDays(); }
};

/**
 * @brief Parsed, validated polygon being analyzed
 *
 * Immutable once produced by GeometryResolver::resolve().
 */
struct AreaOfInterest {
    std::vector<GeoPoint> ring;  ///< Closed ring: ring.front() == ring.back()
    double area_m2 = 0.0;        ///< Ellipsoidal area
    std::string source_wkt;      ///< WKT exactly as received

    BoundingBox bounds() const;

    /// Vertex mean of the open ring (closing point excluded)
    GeoPoint centroid() const;
};

// ============================================================================
// Rasters
// ============================================================================

/**
 * @brief Affine pixel -> CRS mapping (GDAL coefficient order)
 *
 * x = c[0] + col * c[1] + row * c[2]
 * y = c[3] + col * c[4] + row * c[5]
 */
struct GeoTransform {
    std::array<double, 6> coeffs = {0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::string crs = "EPSG:4326";   ///< "EPSG:4326" or the scene's WKT
    double resolution_m = 0.0;       ///< Nominal ground sample distance

    /// 2x3 affine matrix form
    Eigen::Matrix<double, 2, 3> affine() const;

    /// Pixel (col, row) -> CRS (x, y); pass col + 0.5 for pixel centres
    Eigen::Vector2d pixelToWorld(double col, double row) const;

    /// CRS (x, y) -> fractional pixel (col, row)
    Eigen::Vector2d worldToPixel(double x, double y) const;
};

/**
 * @brief Aligned multispectral band rasters for one acquisition
 *
 * Reflectance bands are CV_32F; the optional scene classification band holds
 * class codes as CV_32F. All grids share one size.
 */
struct SpectralBandSet {
    std::map<SpectralBand, cv::Mat> bands;
    float nodata = -9999.0f;
    GeoTransform transform;
    cv::Mat footprint;  ///< CV_8U, 255 where the pixel lies inside the AOI

    bool has(SpectralBand band) const { return bands.count(band) > 0; }

    /// @throws std::out_of_range if the band is missing
    const cv::Mat& band(SpectralBand band) const;

    cv::Size size() const;
};

/**
 * @brief Per-pixel usability grid (255 = usable)
 */
struct PixelMask {
    cv::Mat valid;            ///< CV_8U, same size as the bands
    int total_pixels = 0;     ///< Pixels inside the AOI footprint
    int valid_pixels = 0;

    double validFraction() const {
        return total_pixels > 0 ? double(valid_pixels) / total_pixels : 0.0;
    }
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Area-mean spectral indices
 */
struct SpectralSummary {
    double mean_fai = 0.0;
    double mean_ndre = 0.0;
    double valid_pixel_fraction = 0.0;  ///< In [0, 1]

    int valid_pixels = 0;
    int total_pixels = 0;
    int ndre_pixels = 0;  ///< Valid pixels with a usable NDRE denominator
};

/**
 * @brief Biomass and carbon estimate for one (AOI, date)
 *
 * Constructed once by BiomassEstimator and never mutated afterwards.
 */
struct CarbonEstimate {
    double area_m2 = 0.0;
    double mean_fai = 0.0;
    double mean_ndre = 0.0;
    double valid_pixel_fraction = 0.0;
    int pixel_count = 0;

    double biomass_density_kg_m2 = 0.0;
    double biomass_density_t_ha = 0.0;
    double biomass_t = 0.0;
    double carbon_t = 0.0;
    double co2e_t = 0.0;
    double car_equivalent = 0.0;  ///< Cars off the road for one year

    DataSource data_source = DataSource::SYNTHETIC;
    SourceMetadata source_metadata;  ///< Empty == null

    std::string toString() const {
        char buffer[192];
        snprintf(buffer, sizeof(buffer),
                 "CarbonEstimate(area=%.0fm2, fai=%.4f, ndre=%.4f, biomass=%.1ft, co2e=%.1ft, source=%s)",
                 area_m2, mean_fai, mean_ndre, biomass_t, co2e_t,
                 kelp_carbon::toString(data_source).c_str());
        return std::string(buffer);
    }
};

/**
 * @brief One analysis request from the serving layer
 */
struct AnalysisRequest {
    std::string aoi_wkt;
    std::string date;  ///< ISO-8601
    bool prefer_real_source = true;
    bool include_visualization = false;
    VisualizationKind visualization_kind = VisualizationKind::RAW_DATA;
};

/**
 * @brief Estimate plus request echo and optional visualization payload
 */
struct AnalysisResult {
    std::string date;
    std::string aoi_wkt;
    CarbonEstimate estimate;
    std::optional<nlohmann::json> visualization;  ///< Payload, or {"error": ...} when degraded
    bool cache_hit = false;
};

} // namespace kelp_carbon
