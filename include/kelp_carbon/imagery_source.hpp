/**
 * @file imagery_source.hpp
 * @brief Interface for real multispectral imagery providers
 */

#pragma once

#include "data_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Band rasters plus provenance returned by an imagery provider
 */
struct SceneFetch {
    SpectralBandSet bands;
    SourceMetadata metadata;  ///< scene_id, acquired, cloud_cover, ...
};

/**
 * @brief Provider of real satellite scenes for an AOI and date
 *
 * Implementations throw on any failure (no coverage, network error,
 * malformed response, timeout). SceneAcquirer turns those failures into a
 * recorded synthetic fallback. Implementations must be safe to call from
 * several threads at once.
 */
class ImagerySource {
public:
    virtual ~ImagerySource() = default;

    /**
     * @brief Fetch aligned RED, RED_EDGE, NIR and SWIR bands covering the AOI
     * @throws std::exception on any failure
     */
    virtual SceneFetch fetch(const AreaOfInterest& aoi, const Date& date) = 0;

    /**
     * @brief Short provider name for diagnostics
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Rasterize a polygon given in fractional pixel coordinates
 *
 * @param pixel_ring Polygon vertices as (col, row); pixel centres sit at +0.5
 * @param size Output raster size
 * @return CV_8U mask, 255 inside the polygon
 */
cv::Mat rasterizeFootprint(const std::vector<cv::Point2d>& pixel_ring, const cv::Size& size);

} // namespace kelp_carbon
