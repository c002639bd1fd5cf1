/**
 * @file biomass_estimator.hpp
 * @brief Index means -> biomass density -> biomass, carbon and CO2e
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "regression_model.hpp"

namespace kelp_carbon {

/**
 * @brief Applies the regression model and the carbon stoichiometry
 *
 *   density  = clamp(model(fai, ndre), 0, max_density)     [kg/m^2]
 *   biomass  = density * area / 1000                        [t]
 *   carbon   = biomass * carbon_fraction                    [t]
 *   co2e     = carbon * 44.01 / 12.011                      [t]
 */
class BiomassEstimator {
public:
    explicit BiomassEstimator(const Config& config);

    /**
     * @brief Convert spectral means over an area into a CarbonEstimate
     *
     * data_source / source_metadata are left at their defaults; the caller
     * fills them from the acquisition.
     */
    CarbonEstimate estimate(const SpectralSummary& summary, double area_m2,
                            const RegressionModel& model) const;

    /// Model output clamped to [0, max]; non-finite -> 0
    double clampDensity(double raw) const;

private:
    double max_density_;
    double carbon_fraction_;
    double co2_per_carbon_;
    double car_emissions_;
    bool verbose_;
};

} // namespace kelp_carbon
