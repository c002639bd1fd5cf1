/**
 * @file geodesy.hpp
 * @brief WGS84 ellipsoid utilities and polygon area on the authalic sphere
 */

#pragma once

#include "data_types.hpp"
#include <vector>

namespace kelp_carbon {

/**
 * @brief WGS84 ellipsoid constants
 */
struct Wgs84 {
    static constexpr double a = 6378137.0;                 ///< Semi-major axis (m)
    static constexpr double f = 1.0 / 298.257223563;       ///< Flattening
    static constexpr double e2 = f * (2.0 - f);            ///< First eccentricity squared
};

/**
 * @brief Radius of the sphere with the same surface area as WGS84 (m)
 */
double authalicRadius();

/**
 * @brief Geodetic latitude -> authalic latitude
 *
 * The authalic sphere preserves area: a band between two parallels has the
 * same area on the ellipsoid and on the sphere.
 *
 * @param lat_rad Geodetic latitude (radians)
 * @return Authalic latitude (radians)
 */
double authalicLatitude(double lat_rad);

/**
 * @brief Ellipsoidal area of a closed lon/lat ring
 *
 * Latitudes are mapped to the authalic sphere and the spherical excess is
 * accumulated edge by edge (great-circle edges). The result is independent of
 * winding order.
 *
 * @param ring Closed ring in degrees (front == back)
 * @return Area in square meters
 */
double geodesicPolygonArea(const std::vector<GeoPoint>& ring);

/**
 * @brief Signed planar area in degree space (> 0 for counter-clockwise)
 */
double signedRingArea(const std::vector<GeoPoint>& ring);

/**
 * @brief Point-in-polygon test (even-odd rule) in lon/lat space
 */
bool ringContains(const std::vector<GeoPoint>& ring, const GeoPoint& p);

/**
 * @brief Degrees to radians
 */
inline double deg2rad(double deg) { return deg * 3.14159265358979323846 / 180.0; }

} // namespace kelp_carbon
