/**
 * @file biomass_estimator.cpp
 * @brief Implementation of BiomassEstimator
 */

#include "kelp_carbon/biomass_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace kelp_carbon {

BiomassEstimator::BiomassEstimator(const Config& config)
    : max_density_(config.max_biomass_density_kg_m2),
      carbon_fraction_(config.carbon_fraction),
      co2_per_carbon_(config.co2_per_carbon),
      car_emissions_(config.car_emissions_t_per_year),
      verbose_(config.verbose) {
}

double BiomassEstimator::clampDensity(double raw) const {
    if (!std::isfinite(raw)) {
        std::cerr << "[BiomassEstimator] Warning: model returned a non-finite density, using 0" << std::endl;
        return 0.0;
    }
    return std::clamp(raw, 0.0, max_density_);
}

CarbonEstimate BiomassEstimator::estimate(const SpectralSummary& summary, double area_m2,
                                          const RegressionModel& model) const {
    double raw = model.predict(summary.mean_fai, summary.mean_ndre);
    double density = clampDensity(raw);

    CarbonEstimate est;
    est.area_m2 = area_m2;
    est.mean_fai = summary.mean_fai;
    est.mean_ndre = summary.mean_ndre;
    est.valid_pixel_fraction = summary.valid_pixel_fraction;
    est.pixel_count = summary.valid_pixels;

    est.biomass_density_kg_m2 = density;
    est.biomass_density_t_ha = density * 10.0;
    est.biomass_t = density * area_m2 / 1000.0;
    est.carbon_t = est.biomass_t * carbon_fraction_;
    est.co2e_t = est.carbon_t * co2_per_carbon_;
    est.car_equivalent = car_emissions_ > 0.0 ? est.co2e_t / car_emissions_ : 0.0;

    if (verbose_) {
        std::cout << "[BiomassEstimator] density " << density << " kg/m2 (model " << raw
                  << "), biomass " << est.biomass_t << " t, CO2e " << est.co2e_t << " t" << std::endl;
    }
    return est;
}

} // namespace kelp_carbon
