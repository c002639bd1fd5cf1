/**
 * @file spectral_indices.hpp
 * @brief Floating Algae Index and Normalized Difference Red Edge
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace kelp_carbon {

/**
 * @brief Band centre wavelengths used by the FAI baseline (nm)
 */
struct FaiWavelengths {
    double red_edge = 705.0;
    double nir = 842.0;
    double swir = 1610.0;
};

/**
 * @brief FAI = NIR - [RE + (SWIR - RE) * (l_NIR - l_RE) / (l_SWIR - l_RE)]
 */
inline double faiPixel(double red_edge, double nir, double swir, const FaiWavelengths& wl = {}) {
    double baseline = red_edge + (swir - red_edge) * (wl.nir - wl.red_edge) / (wl.swir - wl.red_edge);
    return nir - baseline;
}

/**
 * @brief NDRE = (NIR - RE) / (NIR + RE)
 * @return false (value untouched) if |NIR + RE| <= epsilon
 */
inline bool ndrePixel(double red_edge, double nir, double epsilon, double& value) {
    double denom = nir + red_edge;
    if (std::abs(denom) <= epsilon) {
        return false;
    }
    value = (nir - red_edge) / denom;
    return true;
}

/**
 * @brief Per-pixel index rasters (CV_32F, NaN where not computed)
 */
struct IndexMaps {
    cv::Mat fai;
    cv::Mat ndre;
};

/**
 * @brief Distribution of one index over the valid pixels
 */
struct IndexStats {
    std::string name;
    int count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double std = 0.0;
    int out_of_range = 0;          ///< Values outside the expected range
    double in_range_fraction = 1.0;
};

/**
 * @brief Computes area-mean FAI and NDRE over the usable pixels
 *
 * Accumulation is in double precision and strictly row-major, so the same
 * inputs always give bit-identical means.
 */
class SpectralIndexEngine {
public:
    explicit SpectralIndexEngine(const Config& config);

    /**
     * @brief Area means of FAI and NDRE
     *
     * Pixels where |NIR + RE| <= epsilon are left out of the NDRE mean only.
     *
     * @throws InsufficientCoverage if no pixel contributes to either mean
     */
    SpectralSummary compute(const SpectralBandSet& bands, const PixelMask& mask) const;

    /**
     * @brief FAI and NDRE rasters for diagnostics and rendering
     */
    IndexMaps computeIndexMaps(const SpectralBandSet& bands, const PixelMask& mask) const;

    /**
     * @brief Summary statistics of an index raster (NaN pixels ignored)
     *
     * @param values CV_32F raster from computeIndexMaps()
     * @param name "fai" or "ndre"; selects the expected range
     */
    static IndexStats describeIndex(const cv::Mat& values, const std::string& name);

    const FaiWavelengths& wavelengths() const { return wl_; }

private:
    FaiWavelengths wl_;
    double ndre_epsilon_;
    bool verbose_;
};

} // namespace kelp_carbon
