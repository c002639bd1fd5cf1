/**
 * @file imagery_source.cpp
 * @brief Shared raster helpers for imagery providers
 */

#include "kelp_carbon/imagery_source.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace kelp_carbon {

cv::Mat rasterizeFootprint(const std::vector<cv::Point2d>& pixel_ring, const cv::Size& size) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    if (pixel_ring.size() < 3) {
        return mask;
    }

    // fillPoly works on integer vertices; keep 8 fractional bits.
    // Shifting by -0.5 makes a pixel count as inside when its centre is.
    const int shift = 8;
    const double scale = double(1 << shift);

    std::vector<cv::Point> pts;
    pts.reserve(pixel_ring.size());
    for (const auto& p : pixel_ring) {
        pts.emplace_back(static_cast<int>(std::lround((p.x - 0.5) * scale)),
                         static_cast<int>(std::lround((p.y - 0.5) * scale)));
    }

    std::vector<std::vector<cv::Point>> polys{pts};
    cv::fillPoly(mask, polys, cv::Scalar(255), cv::LINE_8, shift);
    return mask;
}

} // namespace kelp_carbon
