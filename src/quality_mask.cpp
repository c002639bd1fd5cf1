/**
 * @file quality_mask.cpp
 * @brief Implementation of QualityMask
 */

#include "kelp_carbon/quality_mask.hpp"
#include <cmath>
#include <cstdio>
#include <iostream>

namespace kelp_carbon {

namespace {

bool reflectanceOk(float v, float nodata) {
    return std::isfinite(v) && v != nodata && v >= 0.0f && v <= 1.0f;
}

} // namespace

QualityMask::QualityMask(const Config& config)
    : cloud_red_threshold_(config.cloud_red_threshold),
      land_swir_threshold_(config.land_swir_threshold),
      min_valid_fraction_(config.min_valid_pixel_fraction),
      warning_fraction_(config.low_coverage_warning_fraction),
      excluded_classes_(config.excluded_scene_classes.begin(), config.excluded_scene_classes.end()),
      verbose_(config.verbose) {
}

bool QualityMask::pixelUsable(float red, float red_edge, float nir, float swir, float nodata) const {
    if (!reflectanceOk(red, nodata) || !reflectanceOk(red_edge, nodata) ||
        !reflectanceOk(nir, nodata) || !reflectanceOk(swir, nodata)) {
        return false;
    }
    // Cloud: bright in the visible
    if (red >= cloud_red_threshold_) {
        return false;
    }
    // Land: water absorbs SWIR almost completely
    if (swir >= land_swir_threshold_) {
        return false;
    }
    return true;
}

PixelMask QualityMask::mask(const SpectralBandSet& bands) const {
    const cv::Mat& red = bands.band(SpectralBand::RED);
    const cv::Mat& red_edge = bands.band(SpectralBand::RED_EDGE);
    const cv::Mat& nir = bands.band(SpectralBand::NIR);
    const cv::Mat& swir = bands.band(SpectralBand::SWIR);
    const cv::Mat* scl = bands.has(SpectralBand::SCENE_CLASSIFICATION)
                             ? &bands.band(SpectralBand::SCENE_CLASSIFICATION) : nullptr;
    const bool has_footprint = !bands.footprint.empty();

    PixelMask result;
    result.valid = cv::Mat::zeros(red.size(), CV_8UC1);

    for (int r = 0; r < red.rows; ++r) {
        const float* pr = red.ptr<float>(r);
        const float* pe = red_edge.ptr<float>(r);
        const float* pn = nir.ptr<float>(r);
        const float* ps = swir.ptr<float>(r);
        const float* pc = scl ? scl->ptr<float>(r) : nullptr;
        const uchar* pf = has_footprint ? bands.footprint.ptr<uchar>(r) : nullptr;
        uchar* out = result.valid.ptr<uchar>(r);

        for (int c = 0; c < red.cols; ++c) {
            if (pf && pf[c] == 0) {
                continue;
            }
            result.total_pixels++;

            if (pc) {
                float code = pc[c];
                if (!std::isfinite(code) || code == bands.nodata ||
                    classExcluded(static_cast<int>(std::lround(code)))) {
                    continue;
                }
            }
            if (!pixelUsable(pr[c], pe[c], pn[c], ps[c], bands.nodata)) {
                continue;
            }
            out[c] = 255;
            result.valid_pixels++;
        }
    }

    if (result.valid_pixels == 0) {
        throw InsufficientCoverage("no usable pixels out of " + std::to_string(result.total_pixels) +
                                   " inside the AOI (cloud, land or no-data)");
    }

    double fraction = result.validFraction();
    if (fraction < min_valid_fraction_) {
        char buffer[128];
        snprintf(buffer, sizeof(buffer), "valid pixel fraction %.3f below required %.3f",
                 fraction, min_valid_fraction_);
        throw InsufficientCoverage(buffer);
    }

    if (fraction < warning_fraction_) {
        std::cerr << "[QualityMask] Warning: only " << result.valid_pixels << "/"
                  << result.total_pixels << " pixels usable" << std::endl;
    } else if (verbose_) {
        std::cout << "[QualityMask] " << result.valid_pixels << "/" << result.total_pixels
                  << " pixels usable" << std::endl;
    }

    return result;
}

} // namespace kelp_carbon
