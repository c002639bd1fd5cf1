/**
 * @file regression_model.hpp
 * @brief Pre-trained biomass density regressors loaded from JSON artifacts
 */

#pragma once

#include "errors.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Opaque (mean FAI, mean NDRE) -> biomass density (kg/m^2) mapping
 *
 * Instances are immutable after loading and shared read-only between threads.
 */
class RegressionModel {
public:
    virtual ~RegressionModel() = default;

    virtual double predict(double fai, double ndre) const = 0;

    /// Short description for logs, e.g. "polynomial(degree=2)"
    virtual std::string describe() const = 0;
};

/**
 * @brief Polynomial in (fai, ndre) with graded monomial order
 *
 * Features for degree d: 1, fai, ndre, fai^2, fai*ndre, ndre^2, ... up to
 * total degree d. Requires (d+1)(d+2)/2 coefficients.
 */
class PolynomialRegressionModel : public RegressionModel {
public:
    PolynomialRegressionModel(int degree, const Eigen::VectorXd& coefficients);

    double predict(double fai, double ndre) const override;
    std::string describe() const override;

    /// Monomial feature vector in the model's order
    static Eigen::VectorXd features(double fai, double ndre, int degree);

    static int featureCount(int degree) { return (degree + 1) * (degree + 2) / 2; }

private:
    int degree_;
    Eigen::VectorXd coefficients_;
};

/**
 * @brief Averaged ensemble of binary regression trees
 */
class RandomForestRegressionModel : public RegressionModel {
public:
    /// Split node when feature >= 0, leaf otherwise
    struct Node {
        int feature = -1;       ///< 0 = fai, 1 = ndre, -1 = leaf
        double threshold = 0.0; ///< Go left when x[feature] <= threshold
        int left = -1;
        int right = -1;
        double value = 0.0;     ///< Leaf output
    };
    using Tree = std::vector<Node>;

    explicit RandomForestRegressionModel(std::vector<Tree> trees);

    double predict(double fai, double ndre) const override;
    std::string describe() const override;

private:
    static double evaluate(const Tree& tree, const double x[2]);

    std::vector<Tree> trees_;
};

/**
 * @brief Build a model from a parsed artifact
 * @throws ModelUnavailable on unknown type or inconsistent shapes
 */
std::shared_ptr<const RegressionModel> regressionModelFromJson(const nlohmann::json& artifact);

/**
 * @brief Load a model artifact from disk
 * @throws ModelUnavailable if the file is missing, unreadable or invalid
 */
std::shared_ptr<const RegressionModel> loadRegressionModel(const std::string& path);

} // namespace kelp_carbon
