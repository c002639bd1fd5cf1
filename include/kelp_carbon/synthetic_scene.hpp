/**
 * @file synthetic_scene.hpp
 * @brief Deterministic synthetic band generator used as acquisition fallback
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include <cstdint>

namespace kelp_carbon {

/**
 * @brief Generates plausible kelp-over-water reflectance bands
 *
 * Output depends only on (AOI centroid, date) and the configuration: the same
 * inputs always give bit-identical bands, so cached results stay reproducible.
 */
class SyntheticSceneGenerator {
public:
    explicit SyntheticSceneGenerator(const Config& config);

    /**
     * @brief Generate RED, RED_EDGE, NIR and SWIR rasters over the AOI bounds
     */
    SpectralBandSet generate(const AreaOfInterest& aoi, const Date& date) const;

    /**
     * @brief 64-bit FNV-1a seed of the centroid (1e-6 deg) and ISO date
     */
    static uint64_t seedFor(const AreaOfInterest& aoi, const Date& date);

private:
    int grid_size_;
    float nodata_;
};

} // namespace kelp_carbon
