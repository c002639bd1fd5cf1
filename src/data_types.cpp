/**
 * @file data_types.cpp
 * @brief Date arithmetic, AOI helpers and raster containers
 */

#include "kelp_carbon/data_types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace kelp_carbon {

// ============================================================================
// Date
// ============================================================================

namespace {

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}

int parseDigits(const std::string& s, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + s);
        }
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

} // namespace

Date Date::parse(const std::string& iso) {
    if (iso.size() < 10 || iso[4] != '-' || iso[7] != '-') {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + iso);
    }
    if (iso.size() > 10 && iso[10] != 'T' && iso[10] != ' ') {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + iso);
    }

    Date d;
    d.year = parseDigits(iso, 0, 4);
    d.month = parseDigits(iso, 5, 2);
    d.day = parseDigits(iso, 8, 2);

    if (d.month < 1 || d.month > 12) {
        throw std::invalid_argument("Invalid month in date: " + iso);
    }
    if (d.day < 1 || d.day > daysInMonth(d.year, d.month)) {
        throw std::invalid_argument("Invalid day in date: " + iso);
    }
    return d;
}

long Date::toDays() const {
    // Civil-to-days conversion on 400-year eras
    long y = year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = (month + 9) % 12;
    long doy = (153 * mp + 2) / 5 + day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(long days) {
    days += 719468;
    long era = (days >= 0 ? days : days - 146096) / 146097;
    long doe = days - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;

    Date d;
    d.day = int(doy - (153 * mp + 2) / 5 + 1);
    d.month = int(mp < 10 ? mp + 3 : mp - 9);
    d.year = int(yoe + era * 400 + (d.month <= 2 ? 1 : 0));
    return d;
}

std::string Date::toString() const {
    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

// ============================================================================
// AreaOfInterest
// ============================================================================

BoundingBox AreaOfInterest::bounds() const {
    BoundingBox box;
    if (ring.empty()) {
        return box;
    }
    box.west = box.east = ring.front().lon;
    box.south = box.north = ring.front().lat;
    for (const auto& p : ring) {
        box.west = std::min(box.west, p.lon);
        box.east = std::max(box.east, p.lon);
        box.south = std::min(box.south, p.lat);
        box.north = std::max(box.north, p.lat);
    }
    return box;
}

GeoPoint AreaOfInterest::centroid() const {
    GeoPoint c;
    if (ring.size() < 2) {
        return ring.empty() ? c : ring.front();
    }
    size_t n = ring.size() - 1;  // skip closing vertex
    for (size_t i = 0; i < n; ++i) {
        c.lon += ring[i].lon;
        c.lat += ring[i].lat;
    }
    c.lon /= double(n);
    c.lat /= double(n);
    return c;
}

// ============================================================================
// GeoTransform
// ============================================================================

Eigen::Matrix<double, 2, 3> GeoTransform::affine() const {
    Eigen::Matrix<double, 2, 3> A;
    A << coeffs[1], coeffs[2], coeffs[0],
         coeffs[4], coeffs[5], coeffs[3];
    return A;
}

Eigen::Vector2d GeoTransform::pixelToWorld(double col, double row) const {
    return affine() * Eigen::Vector3d(col, row, 1.0);
}

Eigen::Vector2d GeoTransform::worldToPixel(double x, double y) const {
    Eigen::Matrix2d L = affine().leftCols<2>();
    Eigen::Vector2d t = affine().col(2);
    if (std::abs(L.determinant()) < 1e-300) {
        throw std::runtime_error("GeoTransform is not invertible");
    }
    return L.inverse() * (Eigen::Vector2d(x, y) - t);
}

// ============================================================================
// SpectralBandSet
// ============================================================================

const cv::Mat& SpectralBandSet::band(SpectralBand b) const {
    auto it = bands.find(b);
    if (it == bands.end()) {
        throw std::out_of_range("Band not present: " + toString(b));
    }
    return it->second;
}

cv::Size SpectralBandSet::size() const {
    if (bands.empty()) {
        return cv::Size(0, 0);
    }
    return bands.begin()->second.size();
}

} // namespace kelp_carbon
