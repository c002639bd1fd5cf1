/**
 * @file geodesy.cpp
 * @brief Implementation of ellipsoid and polygon utilities
 */

#include "kelp_carbon/geodesy.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace kelp_carbon {

namespace {

// q(phi) from Snyder, "Map Projections: A Working Manual", eq. 3-12
double authalicQ(double sin_phi) {
    const double e2 = Wgs84::e2;
    const double e = std::sqrt(e2);
    return (1.0 - e2) * (sin_phi / (1.0 - e2 * sin_phi * sin_phi)
                         - (1.0 / (2.0 * e)) * std::log((1.0 - e * sin_phi) / (1.0 + e * sin_phi)));
}

double authalicQPole() {
    static const double qp = authalicQ(1.0);
    return qp;
}

} // namespace

double authalicRadius() {
    return Wgs84::a * std::sqrt(authalicQPole() / 2.0);
}

double authalicLatitude(double lat_rad) {
    double ratio = authalicQ(std::sin(lat_rad)) / authalicQPole();
    return std::asin(std::clamp(ratio, -1.0, 1.0));
}

double geodesicPolygonArea(const std::vector<GeoPoint>& ring) {
    if (ring.size() < 4) {
        return 0.0;
    }

    double excess = 0.0;
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        double b1 = authalicLatitude(deg2rad(ring[i].lat));
        double b2 = authalicLatitude(deg2rad(ring[i + 1].lat));

        // Shortest longitude difference in (-pi, pi]
        double dl = deg2rad(ring[i + 1].lon - ring[i].lon);
        dl = std::remainder(dl, 2.0 * M_PI);

        double t1 = std::tan(b1 / 2.0);
        double t2 = std::tan(b2 / 2.0);
        excess += 2.0 * std::atan2(std::tan(dl / 2.0) * (t1 + t2), 1.0 + t1 * t2);
    }

    double R = authalicRadius();
    return std::abs(excess) * R * R;
}

double signedRingArea(const std::vector<GeoPoint>& ring) {
    double sum = 0.0;
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        sum += ring[i].lon * ring[i + 1].lat - ring[i + 1].lon * ring[i].lat;
    }
    return 0.5 * sum;
}

bool ringContains(const std::vector<GeoPoint>& ring, const GeoPoint& p) {
    if (ring.empty()) {
        return false;
    }
    bool inside = false;
    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const GeoPoint& a = ring[i];
        const GeoPoint& b = ring[j];
        if ((a.lat > p.lat) != (b.lat > p.lat)) {
            double x = (b.lon - a.lon) * (p.lat - a.lat) / (b.lat - a.lat) + a.lon;
            if (p.lon < x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace kelp_carbon
