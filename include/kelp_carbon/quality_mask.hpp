/**
 * @file quality_mask.hpp
 * @brief Per-pixel validity mask (footprint, no-data, cloud, land)
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include <set>

namespace kelp_carbon {

/**
 * @brief Flags pixels that must not enter the index means
 *
 * A pixel is usable only if it lies inside the AOI footprint, every band holds
 * a finite reflectance in [0, 1] that is not the no-data sentinel, its scene
 * class (when a classification band is present) is not excluded, and neither
 * the cloud heuristic (bright red) nor the land heuristic (bright SWIR) fires.
 */
class QualityMask {
public:
    explicit QualityMask(const Config& config);

    /**
     * @brief Build the usable-pixel mask
     * @throws InsufficientCoverage if no pixel (or too small a share) is usable
     * @throws std::out_of_range if a required band is missing
     */
    PixelMask mask(const SpectralBandSet& bands) const;

    /// Rule check for a single pixel (reflectances already read from the bands)
    bool pixelUsable(float red, float red_edge, float nir, float swir, float nodata) const;

    bool classExcluded(int scene_class) const { return excluded_classes_.count(scene_class) > 0; }

private:
    double cloud_red_threshold_;
    double land_swir_threshold_;
    double min_valid_fraction_;
    double warning_fraction_;
    std::set<int> excluded_classes_;
    bool verbose_;
};

} // namespace kelp_carbon
