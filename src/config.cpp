/**
 * @file config.cpp
 * @brief JSON loading and validation of pipeline configuration
 */

#include "kelp_carbon/config.hpp"
#include <fstream>
#include <stdexcept>

namespace kelp_carbon {

void Config::validate() const {
    if (ring_closure_tolerance < 0.0) {
        throw std::invalid_argument("ring_closure_tolerance must be >= 0");
    }
    if (hash_precision_digits < 1 || hash_precision_digits > 12) {
        throw std::invalid_argument("hash_precision_digits must be in [1, 12]");
    }
    if (acquisition_window_days < 0) {
        throw std::invalid_argument("acquisition_window_days must be >= 0");
    }
    if (acquisition_timeout_sec <= 0.0) {
        throw std::invalid_argument("acquisition_timeout_sec must be positive");
    }
    if (synthetic_grid_size < 8) {
        throw std::invalid_argument("synthetic_grid_size must be >= 8");
    }
    if (min_valid_pixel_fraction < 0.0 || min_valid_pixel_fraction > 1.0) {
        throw std::invalid_argument("min_valid_pixel_fraction must be in [0, 1]");
    }
    if (!(red_edge_wavelength_nm < nir_wavelength_nm && nir_wavelength_nm < swir_wavelength_nm)) {
        throw std::invalid_argument("Band wavelengths must satisfy red_edge < nir < swir");
    }
    if (max_biomass_density_kg_m2 <= 0.0) {
        throw std::invalid_argument("max_biomass_density_kg_m2 must be positive");
    }
    if (carbon_fraction <= 0.0 || carbon_fraction > 1.0) {
        throw std::invalid_argument("carbon_fraction must be in (0, 1]");
    }
    if (car_emissions_t_per_year <= 0.0) {
        throw std::invalid_argument("car_emissions_t_per_year must be positive");
    }
}

Config configFromJson(const nlohmann::json& j) {
    Config cfg;

    try {
        cfg.ring_closure_tolerance = j.value("ring_closure_tolerance", cfg.ring_closure_tolerance);
        cfg.hash_precision_digits = j.value("hash_precision_digits", cfg.hash_precision_digits);

        cfg.stac_api_url = j.value("stac_api_url", cfg.stac_api_url);
        cfg.stac_collection = j.value("stac_collection", cfg.stac_collection);
        cfg.sas_token_url = j.value("sas_token_url", cfg.sas_token_url);
        cfg.acquisition_window_days = j.value("acquisition_window_days", cfg.acquisition_window_days);
        cfg.max_cloud_cover = j.value("max_cloud_cover", cfg.max_cloud_cover);
        cfg.max_search_items = j.value("max_search_items", cfg.max_search_items);
        cfg.acquisition_timeout_sec = j.value("acquisition_timeout_sec", cfg.acquisition_timeout_sec);
        cfg.synthetic_grid_size = j.value("synthetic_grid_size", cfg.synthetic_grid_size);

        cfg.nodata_value = j.value("nodata_value", cfg.nodata_value);
        cfg.cloud_red_threshold = j.value("cloud_red_threshold", cfg.cloud_red_threshold);
        cfg.land_swir_threshold = j.value("land_swir_threshold", cfg.land_swir_threshold);
        cfg.excluded_scene_classes = j.value("excluded_scene_classes", cfg.excluded_scene_classes);
        cfg.min_valid_pixel_fraction = j.value("min_valid_pixel_fraction", cfg.min_valid_pixel_fraction);
        cfg.low_coverage_warning_fraction =
            j.value("low_coverage_warning_fraction", cfg.low_coverage_warning_fraction);

        cfg.red_edge_wavelength_nm = j.value("red_edge_wavelength_nm", cfg.red_edge_wavelength_nm);
        cfg.nir_wavelength_nm = j.value("nir_wavelength_nm", cfg.nir_wavelength_nm);
        cfg.swir_wavelength_nm = j.value("swir_wavelength_nm", cfg.swir_wavelength_nm);
        cfg.ndre_denominator_epsilon = j.value("ndre_denominator_epsilon", cfg.ndre_denominator_epsilon);

        cfg.model_path = j.value("model_path", cfg.model_path);
        cfg.max_biomass_density_kg_m2 = j.value("max_biomass_density_kg_m2", cfg.max_biomass_density_kg_m2);
        cfg.carbon_fraction = j.value("carbon_fraction", cfg.carbon_fraction);
        cfg.co2_per_carbon = j.value("co2_per_carbon", cfg.co2_per_carbon);
        cfg.car_emissions_t_per_year = j.value("car_emissions_t_per_year", cfg.car_emissions_t_per_year);

        cfg.cache_store_path = j.value("cache_store_path", cfg.cache_store_path);
        cfg.verbose = j.value("verbose", cfg.verbose);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Bad configuration value: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Config file not found: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    return configFromJson(j);
}

} // namespace kelp_carbon
