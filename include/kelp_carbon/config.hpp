/**
 * @file config.hpp
 * @brief Pipeline configuration parameters
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Pipeline configuration with all tunable parameters
 *
 * Defaults reproduce the reference behaviour; a JSON file may override any
 * subset of fields (see loadConfig()).
 */
struct Config {
    // =========================================================================
    // GEOMETRY
    // =========================================================================

    double ring_closure_tolerance = 1e-9;  ///< Max |first - last| per axis (deg)
    int hash_precision_digits = 7;         ///< Decimal places kept when hashing rings

    // =========================================================================
    // SCENE ACQUISITION
    // =========================================================================

    // --- Real imagery (STAC) ---
    std::string stac_api_url = "https://planetarycomputer.microsoft.com/api/stac/v1";
    std::string stac_collection = "sentinel-2-l2a";
    std::string sas_token_url = "https://planetarycomputer.microsoft.com/api/sas/v1/token";
    int acquisition_window_days = 5;       ///< +/- days searched around the request date
    double max_cloud_cover = 30.0;         ///< Percent, STAC eo:cloud_cover filter
    int max_search_items = 50;             ///< STAC page size
    double acquisition_timeout_sec = 30.0; ///< Bound on every network call and the whole fetch

    // --- Synthetic fallback ---
    int synthetic_grid_size = 64;          ///< Synthetic raster is N x N pixels

    // =========================================================================
    // MASKING
    // =========================================================================

    float nodata_value = -9999.0f;              ///< Declared no-data sentinel
    double cloud_red_threshold = 0.20;          ///< red >= this -> cloud
    double land_swir_threshold = 0.10;          ///< swir >= this -> land
    std::vector<int> excluded_scene_classes = {0, 1, 3, 8, 9, 10};  ///< SCL codes
    double min_valid_pixel_fraction = 0.0;      ///< Below this (or zero pixels) -> InsufficientCoverage
    double low_coverage_warning_fraction = 0.25;

    // =========================================================================
    // SPECTRAL INDICES
    // =========================================================================

    double red_edge_wavelength_nm = 705.0;
    double nir_wavelength_nm = 842.0;
    double swir_wavelength_nm = 1610.0;
    double ndre_denominator_epsilon = 1e-9;    ///< |NIR + RE| <= eps -> excluded from NDRE mean

    // =========================================================================
    // BIOMASS / CARBON
    // =========================================================================

    std::string model_path = "models/biomass_model.json";
    double max_biomass_density_kg_m2 = 10.0;   ///< Physical upper bound on model output
    double carbon_fraction = 0.325;            ///< Carbon share of dry kelp biomass
    double co2_per_carbon = 44.01 / 12.011;    ///< CO2:C molar mass ratio
    double car_emissions_t_per_year = 4.6;     ///< For the car-equivalent figure

    // =========================================================================
    // CACHE
    // =========================================================================

    std::string cache_store_path;              ///< Empty disables the durable mirror

    // =========================================================================
    // LOGGING
    // =========================================================================

    bool verbose = true;                       ///< Print informational progress lines

    /**
     * @brief Check value ranges
     * @throws std::invalid_argument on inconsistent settings
     */
    void validate() const;
};

/**
 * @brief Build a Config from JSON; missing keys keep their defaults
 * @throws std::invalid_argument if a value has the wrong type or fails validate()
 */
Config configFromJson(const nlohmann::json& j);

/**
 * @brief Load a Config from a JSON file
 * @throws std::runtime_error if the file cannot be read or parsed
 */
Config loadConfig(const std::string& path);

} // namespace kelp_carbon
