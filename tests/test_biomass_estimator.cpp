/**
 * @file test_biomass_estimator.cpp
 * @brief Density clamping, carbon stoichiometry and model artifact loading
 */

#include "test_common.hpp"
#include <kelp_carbon/biomass_estimator.hpp>
#include <kelp_carbon/carbon_pipeline.hpp>
#include <kelp_carbon/config.hpp>
#include <kelp_carbon/regression_model.hpp>
#include <limits>

using namespace kelp_carbon;
using test_util::expect_true;
using test_util::throws;

namespace {

const std::string kTag = "biomass";

SpectralSummary summaryOf(double fai, double ndre) {
    SpectralSummary s;
    s.mean_fai = fai;
    s.mean_ndre = ndre;
    s.valid_pixel_fraction = 0.8;
    s.valid_pixels = 800;
    s.total_pixels = 1000;
    s.ndre_pixels = 800;
    return s;
}

int test_reference_conversion() {
    int failures = 0;
    BiomassEstimator estimator(test_util::quietConfig());
    test_util::ConstantModel model(7.5);

    CarbonEstimate e = estimator.estimate(summaryOf(0.093, 0.060), 8.17e7, model);

    failures += expect_true(kTag, test_util::nearly_equal(e.biomass_density_kg_m2, 7.5), "density passed through");
    failures += expect_true(kTag, test_util::nearly_equal(e.biomass_density_t_ha, 75.0, 1e-9), "t/ha = 10 x kg/m2");
    failures += expect_true(kTag, test_util::relatively_equal(e.biomass_t, 612750.0, 1e-9), "biomass_t ~ 612750");
    failures += expect_true(kTag, test_util::relatively_equal(e.carbon_t, 199143.75, 1e-9), "carbon_t ~ 199144");
    failures += expect_true(kTag, test_util::relatively_equal(e.co2e_t, 729863.0, 1e-3),
                            "co2e_t ~ 729863, got " + std::to_string(e.co2e_t));
    failures += expect_true(kTag, test_util::relatively_equal(e.co2e_t / e.carbon_t, 44.01 / 12.011, 1e-12),
                            "CO2e:C is the molar mass ratio");
    failures += expect_true(kTag, test_util::relatively_equal(e.car_equivalent, e.co2e_t / 4.6, 1e-12),
                            "car equivalent");

    failures += expect_true(kTag, e.area_m2 == 8.17e7 && e.mean_fai == 0.093 && e.mean_ndre == 0.060,
                            "inputs echoed");
    failures += expect_true(kTag, e.pixel_count == 800 && e.valid_pixel_fraction == 0.8, "coverage echoed");
    return failures;
}

int test_density_clamping() {
    int failures = 0;
    BiomassEstimator estimator(test_util::quietConfig());
    SpectralSummary s = summaryOf(0.01, 0.02);

    CarbonEstimate neg = estimator.estimate(s, 1.0e6, test_util::ConstantModel(-3.0));
    failures += expect_true(kTag, neg.biomass_density_kg_m2 == 0.0 && neg.biomass_t == 0.0 && neg.co2e_t == 0.0,
                            "negative model output clamps to zero");

    CarbonEstimate high = estimator.estimate(s, 1.0e6, test_util::ConstantModel(25.0));
    failures += expect_true(kTag, high.biomass_density_kg_m2 == 10.0, "density capped at 10 kg/m2");

    CarbonEstimate nan = estimator.estimate(s, 1.0e6, test_util::ConstantModel(std::numeric_limits<double>::quiet_NaN()));
    failures += expect_true(kTag, nan.biomass_density_kg_m2 == 0.0 && std::isfinite(nan.co2e_t),
                            "non-finite model output becomes zero");

    Config loose = test_util::quietConfig();
    loose.max_biomass_density_kg_m2 = 50.0;
    CarbonEstimate raised = BiomassEstimator(loose).estimate(s, 1.0e6, test_util::ConstantModel(25.0));
    failures += expect_true(kTag, raised.biomass_density_kg_m2 == 25.0, "cap is configurable");
    return failures;
}

int test_polynomial_model() {
    int failures = 0;

    Eigen::VectorXd phi = PolynomialRegressionModel::features(2.0, 3.0, 2);
    failures += expect_true(kTag, phi.size() == 6, "degree 2 has 6 monomials");
    failures += expect_true(kTag, phi(0) == 1.0 && phi(1) == 2.0 && phi(2) == 3.0 &&
                                  phi(3) == 4.0 && phi(4) == 6.0 && phi(5) == 9.0,
                            "graded monomial order 1, fai, ndre, fai^2, fai*ndre, ndre^2");

    std::string path = test_util::writeTempFile("poly.json", R"({
        "type": "polynomial",
        "degree": 2,
        "feature_names": ["1", "fai", "ndre", "fai^2", "fai*ndre", "ndre^2"],
        "coefficients": [0.2, 38.0, 6.5, -40.0, 12.0, -3.0]
    })");
    try {
        auto model = loadRegressionModel(path);
        double expected = 0.2 + 38.0 * 0.1 + 6.5 * 0.3 - 40.0 * 0.01 + 12.0 * 0.03 - 3.0 * 0.09;
        failures += expect_true(kTag, test_util::nearly_equal(model->predict(0.1, 0.3), expected, 1e-12),
                                "polynomial prediction");
        failures += expect_true(kTag, model->describe() == "polynomial(degree=2)", "describe");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("polynomial artifact failed to load: ") + e.what());
    }
    return failures;
}

int test_random_forest_model() {
    int failures = 0;
    std::string path = test_util::writeTempFile("forest.json", R"({
        "type": "random_forest",
        "trees": [
            {"nodes": [
                {"feature": 0, "threshold": 0.05, "left": 1, "right": 2},
                {"value": 1.0},
                {"value": 5.0}
            ]},
            {"nodes": [
                {"feature": 1, "threshold": 0.2, "left": 1, "right": 2},
                {"value": 2.0},
                {"value": 4.0}
            ]}
        ]
    })");
    try {
        auto model = loadRegressionModel(path);
        failures += expect_true(kTag, model->predict(0.01, 0.1) == 1.5, "left/left leaves averaged");
        failures += expect_true(kTag, model->predict(0.10, 0.3) == 4.5, "right/right leaves averaged");
        failures += expect_true(kTag, model->predict(0.05, 0.2) == 1.5, "split goes left on equality");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("forest artifact failed to load: ") + e.what());
    }
    return failures;
}

int test_model_unavailable() {
    int failures = 0;

    failures += expect_true(kTag, throws<ModelUnavailable>([]() { loadRegressionModel("/nonexistent/model.json"); }),
                            "missing artifact");

    struct Case {
        const char* name;
        const char* body;
    };
    const Case cases[] = {
        {"garbage.json", "this is not json"},
        {"unknown.json", R"({"type": "neural_net"})"},
        {"shape.json", R"({"type": "polynomial", "degree": 2, "coefficients": [1.0, 2.0, 3.0]})"},
        {"types.json", R"({"type": "polynomial", "degree": "two", "coefficients": []})"},
        {"notrees.json", R"({"type": "random_forest", "trees": []})"},
        {"cycle.json", R"({"type": "random_forest", "trees": [{"nodes": [
            {"feature": 0, "threshold": 0.1, "left": 0, "right": 1}, {"value": 1.0}]}]})"},
        {"feature.json", R"({"type": "random_forest", "trees": [{"nodes": [
            {"feature": 5, "threshold": 0.1, "left": 1, "right": 2}, {"value": 1.0}, {"value": 2.0}]}]})"},
    };
    for (const auto& c : cases) {
        std::string path = test_util::writeTempFile(c.name, c.body);
        failures += expect_true(kTag, throws<ModelUnavailable>([&]() { loadRegressionModel(path); }),
                                std::string("ModelUnavailable expected for ") + c.name);
    }

    // The pipeline refuses to start without a model
    Config cfg = test_util::quietConfig();
    cfg.model_path = "/nonexistent/model.json";
    failures += expect_true(kTag, throws<ModelUnavailable>([&]() { CarbonPipeline pipeline(cfg); }),
                            "pipeline construction fails without a model");
    return failures;
}

int test_configuration() {
    int failures = 0;

    try {
        Config shipped = loadConfig("config/default_config.json");
        failures += expect_true(kTag, shipped.carbon_fraction == 0.325 && shipped.max_biomass_density_kg_m2 == 10.0,
                                "shipped config carries the default constants");
        failures += expect_true(kTag, test_util::relatively_equal(shipped.co2_per_carbon, 44.01 / 12.011, 1e-12),
                                "shipped CO2:C ratio");

        auto model = loadRegressionModel(shipped.model_path);
        failures += expect_true(kTag, model->describe().rfind("random_forest", 0) == 0,
                                "shipped model is a random forest, got " + model->describe());
        failures += expect_true(kTag, std::isfinite(model->predict(0.05, 0.2)), "shipped model predicts");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("shipped files failed to load: ") + e.what());
    }

    Config partial = configFromJson(nlohmann::json{{"carbon_fraction", 0.3}, {"verbose", false}});
    failures += expect_true(kTag, partial.carbon_fraction == 0.3 && !partial.verbose &&
                                  partial.synthetic_grid_size == 64, "missing keys keep their defaults");

    failures += expect_true(kTag, throws<std::invalid_argument>([]() {
        configFromJson(nlohmann::json{{"carbon_fraction", "a third"}});
    }), "wrong value type rejected");
    failures += expect_true(kTag, throws<std::invalid_argument>([]() {
        configFromJson(nlohmann::json{{"nir_wavelength_nm", 2000.0}});
    }), "wavelength order enforced");
    failures += expect_true(kTag, throws<std::runtime_error>([]() { loadConfig("/nonexistent/config.json"); }),
                            "missing config file reported");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_reference_conversion();
    failures += test_density_clamping();
    failures += test_polynomial_model();
    failures += test_random_forest_model();
    failures += test_model_unavailable();
    failures += test_configuration();
    return test_util::report(kTag, failures);
}
