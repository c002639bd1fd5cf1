/**
 * @file geometry_resolver.cpp
 * @brief Implementation of WKT parsing and polygon validation
 */

#include "kelp_carbon/geometry_resolver.hpp"
#include "kelp_carbon/geodesy.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace kelp_carbon {

// ============================================================================
// WKT parsing
// ============================================================================

namespace {

class WktCursor {
public:
    explicit WktCursor(const std::string& text) : s_(text) {}

    void skipSpace() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }

    bool atEnd() {
        skipSpace();
        return pos_ >= s_.size();
    }

    char peek() {
        skipSpace();
        return pos_ < s_.size() ? s_[pos_] : '\0';
    }

    void expect(char c) {
        if (peek() != c) {
            throw InvalidGeometry(std::string("expected '") + c + "' at position " +
                                  std::to_string(pos_));
        }
        ++pos_;
    }

    std::string word() {
        skipSpace();
        size_t start = pos_;
        while (pos_ < s_.size() && std::isalpha(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
        std::string w = s_.substr(start, pos_ - start);
        for (auto& ch : w) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        return w;
    }

    bool tryNumber(double& value) {
        skipSpace();
        if (pos_ >= s_.size()) {
            return false;
        }
        const char* begin = s_.c_str() + pos_;
        char* end = nullptr;
        value = std::strtod(begin, &end);
        if (end == begin) {
            return false;
        }
        pos_ += static_cast<size_t>(end - begin);
        return true;
    }

private:
    const std::string& s_;
    size_t pos_ = 0;
};

} // namespace

std::vector<GeoPoint> parseWktPolygon(const std::string& wkt) {
    WktCursor cur(wkt);

    std::string type = cur.word();
    if (type != "POLYGON") {
        throw InvalidGeometry(type.empty() ? "not a WKT geometry" :
                              "expected POLYGON, got " + type);
    }

    // Optional dimension tag: Z, M or ZM
    if (std::isalpha(static_cast<unsigned char>(cur.peek()))) {
        std::string dim = cur.word();
        if (dim != "Z" && dim != "M" && dim != "ZM") {
            throw InvalidGeometry("unexpected token " + dim);
        }
    }

    cur.expect('(');
    cur.expect('(');

    std::vector<GeoPoint> ring;
    while (true) {
        double x = 0.0;
        double y = 0.0;
        if (!cur.tryNumber(x) || !cur.tryNumber(y)) {
            throw InvalidGeometry("coordinate pair " + std::to_string(ring.size() + 1) +
                                  " is not numeric");
        }
        // Drop Z/M ordinates
        double extra = 0.0;
        for (int k = 0; k < 2 && cur.peek() != ',' && cur.peek() != ')'; ++k) {
            if (!cur.tryNumber(extra)) {
                break;
            }
        }
        if (!std::isfinite(x) || !std::isfinite(y)) {
            throw InvalidGeometry("non-finite coordinate");
        }
        ring.push_back({x, y});

        char c = cur.peek();
        if (c == ',') {
            cur.expect(',');
            continue;
        }
        cur.expect(')');
        break;
    }

    if (cur.peek() == ',') {
        throw InvalidGeometry("polygons with interior rings are not supported");
    }
    cur.expect(')');

    if (!cur.atEnd()) {
        throw InvalidGeometry("unexpected trailing content");
    }

    return ring;
}

std::string formatWktPolygon(const std::vector<GeoPoint>& ring, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << "POLYGON((";
    for (size_t i = 0; i < ring.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << ring[i].lon << " " << ring[i].lat;
    }
    ss << "))";
    return ss.str();
}

// ============================================================================
// GeometryResolver
// ============================================================================

GeometryResolver::GeometryResolver(const Config& config)
    : closure_tolerance_(config.ring_closure_tolerance) {
}

AreaOfInterest GeometryResolver::resolve(const std::string& wkt) const {
    AreaOfInterest aoi;
    aoi.ring = parseWktPolygon(wkt);
    aoi.source_wkt = wkt;

    validateRing(aoi.ring);

    aoi.area_m2 = geodesicPolygonArea(aoi.ring);
    if (!(aoi.area_m2 > 0.0)) {
        throw InvalidGeometry("polygon encloses no area");
    }

    return aoi;
}

void GeometryResolver::validateRing(const std::vector<GeoPoint>& ring) const {
    if (ring.size() < 4) {
        throw InvalidGeometry("ring has " + std::to_string(ring.size()) +
                              " points, at least 4 required");
    }

    const GeoPoint& first = ring.front();
    const GeoPoint& last = ring.back();
    if (std::abs(first.lon - last.lon) > closure_tolerance_ ||
        std::abs(first.lat - last.lat) > closure_tolerance_) {
        throw InvalidGeometry("ring is not closed (first point != last point)");
    }

    for (const auto& p : ring) {
        if (p.lon < -180.0 || p.lon > 180.0) {
            throw InvalidGeometry("longitude " + std::to_string(p.lon) + " out of range [-180, 180]");
        }
        if (p.lat < -90.0 || p.lat > 90.0) {
            throw InvalidGeometry("latitude " + std::to_string(p.lat) + " out of range [-90, 90]");
        }
    }
}

} // namespace kelp_carbon
