/**
 * @file geometry_resolver.hpp
 * @brief WKT polygon parsing, validation and geodesic area
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Parse a single-ring WKT POLYGON into lon/lat vertices
 *
 * Accepts "POLYGON((x y, x y, ...))" case-insensitively with free whitespace.
 * A third/fourth ordinate (Z/M) is read and dropped. No validation beyond
 * syntax is performed here.
 *
 * @throws InvalidGeometry on syntax errors, other geometry types or interior rings
 */
std::vector<GeoPoint> parseWktPolygon(const std::string& wkt);

/**
 * @brief Format a ring as "POLYGON((lon lat, ...))"
 */
std::string formatWktPolygon(const std::vector<GeoPoint>& ring, int precision = 7);

/**
 * @brief Turns a WKT string into a validated AreaOfInterest
 *
 * Pure: no I/O, no state beyond the configuration it was built with.
 */
class GeometryResolver {
public:
    explicit GeometryResolver(const Config& config);

    /**
     * @brief Parse, validate and measure a polygon
     *
     * @param wkt WKT POLYGON string
     * @return AreaOfInterest with the closed ring and its ellipsoidal area
     *
     * @throws InvalidGeometry if the string is not a single POLYGON, the ring
     *         has fewer than 4 points or is not closed, a coordinate is out of
     *         range, or the enclosed area is zero
     */
    AreaOfInterest resolve(const std::string& wkt) const;

private:
    void validateRing(const std::vector<GeoPoint>& ring) const;

    double closure_tolerance_;
};

} // namespace kelp_carbon
