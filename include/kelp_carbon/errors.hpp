/**
 * @file errors.hpp
 * @brief Exception types raised by the estimation pipeline
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kelp_carbon {

/**
 * @brief Malformed or out-of-range polygon input (client error, never retried)
 */
class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& what)
        : std::invalid_argument("Invalid geometry: " + what) {}
};

/**
 * @brief No usable pixels remain for the area/date after masking
 */
class InsufficientCoverage : public std::runtime_error {
public:
    explicit InsufficientCoverage(const std::string& what)
        : std::runtime_error("Insufficient coverage: " + what) {}
};

/**
 * @brief Regression artifact could not be loaded (process-fatal at startup)
 */
class ModelUnavailable : public std::runtime_error {
public:
    explicit ModelUnavailable(const std::string& what)
        : std::runtime_error("Model unavailable: " + what) {}
};

} // namespace kelp_carbon
