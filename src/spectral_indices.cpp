/**
 * @file spectral_indices.cpp
 * @brief Implementation of SpectralIndexEngine
 */

#include "kelp_carbon/spectral_indices.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace kelp_carbon {

SpectralIndexEngine::SpectralIndexEngine(const Config& config)
    : ndre_epsilon_(config.ndre_denominator_epsilon), verbose_(config.verbose) {
    wl_.red_edge = config.red_edge_wavelength_nm;
    wl_.nir = config.nir_wavelength_nm;
    wl_.swir = config.swir_wavelength_nm;
}

SpectralSummary SpectralIndexEngine::compute(const SpectralBandSet& bands, const PixelMask& mask) const {
    const cv::Mat& red_edge = bands.band(SpectralBand::RED_EDGE);
    const cv::Mat& nir = bands.band(SpectralBand::NIR);
    const cv::Mat& swir = bands.band(SpectralBand::SWIR);

    double fai_sum = 0.0;
    double ndre_sum = 0.0;
    int fai_count = 0;
    int ndre_count = 0;

    for (int r = 0; r < mask.valid.rows; ++r) {
        const uchar* m = mask.valid.ptr<uchar>(r);
        const float* pe = red_edge.ptr<float>(r);
        const float* pn = nir.ptr<float>(r);
        const float* ps = swir.ptr<float>(r);

        for (int c = 0; c < mask.valid.cols; ++c) {
            if (!m[c]) {
                continue;
            }
            fai_sum += faiPixel(pe[c], pn[c], ps[c], wl_);
            fai_count++;

            double ndre = 0.0;
            if (ndrePixel(pe[c], pn[c], ndre_epsilon_, ndre)) {
                ndre_sum += ndre;
                ndre_count++;
            }
        }
    }

    if (fai_count == 0) {
        throw InsufficientCoverage("no pixel contributes to the spectral index means");
    }
    if (ndre_count == 0) {
        throw InsufficientCoverage("no valid pixel has a defined NDRE (" + std::to_string(fai_count) +
                                   " pixels with NIR + red-edge ~ 0)");
    }

    SpectralSummary summary;
    summary.mean_fai = fai_sum / fai_count;
    summary.mean_ndre = ndre_sum / ndre_count;
    summary.valid_pixels = fai_count;
    summary.total_pixels = mask.total_pixels;
    summary.ndre_pixels = ndre_count;
    summary.valid_pixel_fraction = mask.total_pixels > 0
        ? std::min(1.0, double(fai_count) / mask.total_pixels) : 0.0;

    if (verbose_) {
        std::cout << "[SpectralIndexEngine] mean FAI=" << summary.mean_fai
                  << " mean NDRE=" << summary.mean_ndre
                  << " (" << fai_count << " pixels, " << ndre_count << " with NDRE)" << std::endl;
    }
    return summary;
}

IndexMaps SpectralIndexEngine::computeIndexMaps(const SpectralBandSet& bands, const PixelMask& mask) const {
    const cv::Mat& red_edge = bands.band(SpectralBand::RED_EDGE);
    const cv::Mat& nir = bands.band(SpectralBand::NIR);
    const cv::Mat& swir = bands.band(SpectralBand::SWIR);
    const float nan = std::numeric_limits<float>::quiet_NaN();

    IndexMaps maps;
    maps.fai = cv::Mat(mask.valid.size(), CV_32F, cv::Scalar(nan));
    maps.ndre = cv::Mat(mask.valid.size(), CV_32F, cv::Scalar(nan));

    for (int r = 0; r < mask.valid.rows; ++r) {
        const uchar* m = mask.valid.ptr<uchar>(r);
        for (int c = 0; c < mask.valid.cols; ++c) {
            if (!m[c]) {
                continue;
            }
            float re = red_edge.at<float>(r, c);
            float n = nir.at<float>(r, c);
            maps.fai.at<float>(r, c) = static_cast<float>(faiPixel(re, n, swir.at<float>(r, c), wl_));
            double ndre = 0.0;
            if (ndrePixel(re, n, ndre_epsilon_, ndre)) {
                maps.ndre.at<float>(r, c) = static_cast<float>(ndre);
            }
        }
    }
    return maps;
}

IndexStats SpectralIndexEngine::describeIndex(const cv::Mat& values, const std::string& name) {
    // Physically plausible ranges
    double lo = -1.1, hi = 1.1;
    if (name == "fai") {
        lo = -0.5;
        hi = 1.0;
    }

    IndexStats stats;
    stats.name = name;
    stats.min = std::numeric_limits<double>::infinity();
    stats.max = -std::numeric_limits<double>::infinity();

    double sum = 0.0;
    double sum_sq = 0.0;
    for (int r = 0; r < values.rows; ++r) {
        const float* p = values.ptr<float>(r);
        for (int c = 0; c < values.cols; ++c) {
            if (!std::isfinite(p[c])) {
                continue;
            }
            double v = p[c];
            stats.count++;
            sum += v;
            sum_sq += v * v;
            stats.min = std::min(stats.min, v);
            stats.max = std::max(stats.max, v);
            if (v < lo || v > hi) {
                stats.out_of_range++;
            }
        }
    }

    if (stats.count == 0) {
        stats.min = stats.max = 0.0;
        return stats;
    }

    stats.mean = sum / stats.count;
    stats.std = std::sqrt(std::max(0.0, sum_sq / stats.count - stats.mean * stats.mean));
    stats.in_range_fraction = 1.0 - double(stats.out_of_range) / stats.count;

    if (stats.out_of_range > 0) {
        std::cerr << "[SpectralIndexEngine] Warning: " << stats.out_of_range << " " << name
                  << " values outside [" << lo << ", " << hi << "]" << std::endl;
    }
    return stats;
}

} // namespace kelp_carbon
