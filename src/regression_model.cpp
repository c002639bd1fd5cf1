/**
 * @file regression_model.cpp
 * @brief Implementation of the regression model artifacts
 */

#include "kelp_carbon/regression_model.hpp"
#include <cmath>
#include <fstream>

namespace kelp_carbon {

using json = nlohmann::json;

// ============================================================================
// PolynomialRegressionModel
// ============================================================================

PolynomialRegressionModel::PolynomialRegressionModel(int degree, const Eigen::VectorXd& coefficients)
    : degree_(degree), coefficients_(coefficients) {
    if (degree < 0) {
        throw ModelUnavailable("polynomial degree must be >= 0");
    }
    if (coefficients.size() != featureCount(degree)) {
        throw ModelUnavailable("polynomial of degree " + std::to_string(degree) + " needs " +
                               std::to_string(featureCount(degree)) + " coefficients, got " +
                               std::to_string(coefficients.size()));
    }
}

Eigen::VectorXd PolynomialRegressionModel::features(double fai, double ndre, int degree) {
    Eigen::VectorXd phi(featureCount(degree));
    int k = 0;
    for (int total = 0; total <= degree; ++total) {
        for (int j = 0; j <= total; ++j) {
            phi(k++) = std::pow(fai, total - j) * std::pow(ndre, j);
        }
    }
    return phi;
}

double PolynomialRegressionModel::predict(double fai, double ndre) const {
    return coefficients_.dot(features(fai, ndre, degree_));
}

std::string PolynomialRegressionModel::describe() const {
    return "polynomial(degree=" + std::to_string(degree_) + ")";
}

// ============================================================================
// RandomForestRegressionModel
// ============================================================================

RandomForestRegressionModel::RandomForestRegressionModel(std::vector<Tree> trees)
    : trees_(std::move(trees)) {
    if (trees_.empty()) {
        throw ModelUnavailable("random forest has no trees");
    }
    for (size_t t = 0; t < trees_.size(); ++t) {
        const Tree& tree = trees_[t];
        if (tree.empty()) {
            throw ModelUnavailable("tree " + std::to_string(t) + " is empty");
        }
        const int n = static_cast<int>(tree.size());
        for (int i = 0; i < n; ++i) {
            const Node& node = tree[i];
            if (node.feature < 0) {
                continue;
            }
            // Children must point forward so evaluation always terminates
            if (node.feature > 1 || node.left <= i || node.right <= i || node.left >= n || node.right >= n) {
                throw ModelUnavailable("tree " + std::to_string(t) + " node " + std::to_string(i) +
                                       " is malformed");
            }
        }
    }
}

double RandomForestRegressionModel::evaluate(const Tree& tree, const double x[2]) {
    int i = 0;
    while (tree[i].feature >= 0) {
        i = x[tree[i].feature] <= tree[i].threshold ? tree[i].left : tree[i].right;
    }
    return tree[i].value;
}

double RandomForestRegressionModel::predict(double fai, double ndre) const {
    const double x[2] = {fai, ndre};
    double sum = 0.0;
    for (const auto& tree : trees_) {
        sum += evaluate(tree, x);
    }
    return sum / trees_.size();
}

std::string RandomForestRegressionModel::describe() const {
    return "random_forest(trees=" + std::to_string(trees_.size()) + ")";
}

// ============================================================================
// Loading
// ============================================================================

std::shared_ptr<const RegressionModel> regressionModelFromJson(const json& artifact) {
    try {
        std::string type = artifact.at("type").get<std::string>();

        if (type == "polynomial") {
            int degree = artifact.at("degree").get<int>();
            std::vector<double> coeffs = artifact.at("coefficients").get<std::vector<double>>();
            Eigen::VectorXd c = Eigen::Map<Eigen::VectorXd>(coeffs.data(), coeffs.size());
            return std::make_shared<PolynomialRegressionModel>(degree, c);
        }

        if (type == "random_forest") {
            std::vector<RandomForestRegressionModel::Tree> trees;
            for (const auto& jt : artifact.at("trees")) {
                RandomForestRegressionModel::Tree tree;
                for (const auto& jn : jt.at("nodes")) {
                    RandomForestRegressionModel::Node node;
                    if (jn.contains("value")) {
                        node.value = jn["value"].get<double>();
                    } else {
                        node.feature = jn.at("feature").get<int>();
                        node.threshold = jn.at("threshold").get<double>();
                        node.left = jn.at("left").get<int>();
                        node.right = jn.at("right").get<int>();
                    }
                    tree.push_back(node);
                }
                trees.push_back(std::move(tree));
            }
            return std::make_shared<RandomForestRegressionModel>(std::move(trees));
        }

        throw ModelUnavailable("unknown model type '" + type + "'");
    } catch (const json::exception& e) {
        throw ModelUnavailable(std::string("malformed artifact: ") + e.what());
    }
}

std::shared_ptr<const RegressionModel> loadRegressionModel(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ModelUnavailable("cannot open " + path);
    }

    json artifact;
    try {
        file >> artifact;
    } catch (const json::parse_error& e) {
        throw ModelUnavailable("cannot parse " + path + ": " + e.what());
    }
    return regressionModelFromJson(artifact);
}

} // namespace kelp_carbon
