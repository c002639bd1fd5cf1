/**
 * @file serialization.hpp
 * @brief JSON records for results and cached estimates
 */

#pragma once

#include "data_types.hpp"
#include <nlohmann/json.hpp>

namespace kelp_carbon {

/**
 * @brief Flat output record handed to the serving layer
 *
 * Fields: date, aoi_wkt, area_m2, mean_fai, mean_ndre, biomass_t,
 * biomass_density_t_ha, carbon_t, co2e_t, car_equivalent,
 * valid_pixel_fraction, data_source, source_metadata (object or null),
 * visualization (object or null), cache_hit.
 */
nlohmann::json toJson(const AnalysisResult& result);

/**
 * @brief Full estimate, including every derived quantity
 */
nlohmann::json toJson(const CarbonEstimate& estimate);

/**
 * @brief Inverse of toJson(const CarbonEstimate&)
 * @throws std::invalid_argument on missing fields or wrong types
 */
CarbonEstimate estimateFromJson(const nlohmann::json& j);

} // namespace kelp_carbon
