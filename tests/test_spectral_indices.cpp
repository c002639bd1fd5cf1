/**
 * @file test_spectral_indices.cpp
 * @brief FAI/NDRE formulas, quality masking and index statistics
 */

#include "test_common.hpp"
#include <kelp_carbon/geometry_resolver.hpp>
#include <kelp_carbon/quality_mask.hpp>
#include <kelp_carbon/spectral_indices.hpp>
#include <kelp_carbon/synthetic_scene.hpp>
#include <cstring>
#include <limits>

using namespace kelp_carbon;
using test_util::expect_true;
using test_util::throws;

namespace {

const std::string kTag = "spectral";

int test_pixel_formulas() {
    int failures = 0;

    double expected_fai = 0.30 - (0.05 + (0.02 - 0.05) * (842.0 - 705.0) / (1610.0 - 705.0));
    failures += expect_true(kTag, test_util::nearly_equal(faiPixel(0.05, 0.30, 0.02), expected_fai),
                            "FAI uses the red-edge to SWIR baseline at 842 nm");

    // Flat spectrum has no NIR anomaly
    failures += expect_true(kTag, test_util::nearly_equal(faiPixel(0.1, 0.1, 0.1), 0.0), "flat spectrum FAI is 0");

    FaiWavelengths shifted;
    shifted.red_edge = 700.0;
    double custom = 0.30 - (0.05 + (0.02 - 0.05) * (842.0 - 700.0) / (1610.0 - 700.0));
    failures += expect_true(kTag, test_util::nearly_equal(faiPixel(0.05, 0.30, 0.02, shifted), custom),
                            "wavelengths are configurable");

    double ndre = -1.0;
    bool ok = ndrePixel(0.05, 0.30, 1e-9, ndre);
    failures += expect_true(kTag, ok && test_util::nearly_equal(ndre, 0.25 / 0.35), "NDRE value");

    double untouched = 42.0;
    failures += expect_true(kTag, !ndrePixel(0.0, 0.0, 1e-9, untouched) && untouched == 42.0,
                            "zero denominator yields no NDRE");
    failures += expect_true(kTag, !ndrePixel(0.5e-9, 0.4e-9, 1e-9, untouched),
                            "denominator at epsilon is excluded");
    return failures;
}

int test_uniform_scene_means() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    SpectralBandSet bands = test_util::kelpBands(8, 8);

    QualityMask masker(cfg);
    PixelMask mask = masker.mask(bands);
    failures += expect_true(kTag, mask.total_pixels == 64 && mask.valid_pixels == 64, "all kelp pixels usable");

    SpectralIndexEngine engine(cfg);
    SpectralSummary s = engine.compute(bands, mask);

    double fai = faiPixel(0.06f, 0.15f, 0.02f);
    double ndre = 0.0;
    ndrePixel(0.06f, 0.15f, 1e-9, ndre);
    failures += expect_true(kTag, test_util::nearly_equal(s.mean_fai, fai, 1e-12), "mean FAI of uniform scene");
    failures += expect_true(kTag, test_util::nearly_equal(s.mean_ndre, ndre, 1e-12), "mean NDRE of uniform scene");
    failures += expect_true(kTag, s.valid_pixel_fraction == 1.0, "valid fraction 1");
    failures += expect_true(kTag, s.valid_pixels == 64 && s.ndre_pixels == 64 && s.total_pixels == 64, "pixel counts");
    return failures;
}

int test_zero_denominator_excluded_from_ndre_mean() {
    int failures = 0;
    Config cfg = test_util::quietConfig();

    SpectralBandSet bands = test_util::makeBands(1, 2, 0.03f, 0.05f, 0.30f, 0.02f);
    // First pixel: NIR + RE == 0 (dark but valid)
    bands.bands[SpectralBand::RED_EDGE].at<float>(0, 0) = 0.0f;
    bands.bands[SpectralBand::NIR].at<float>(0, 0) = 0.0f;

    PixelMask mask = QualityMask(cfg).mask(bands);
    SpectralSummary s = SpectralIndexEngine(cfg).compute(bands, mask);

    double ndre_b = 0.0;
    ndrePixel(0.05f, 0.30f, 1e-9, ndre_b);
    failures += expect_true(kTag, s.valid_pixels == 2, "both pixels count for FAI");
    failures += expect_true(kTag, s.ndre_pixels == 1, "zero-denominator pixel skipped for NDRE");
    failures += expect_true(kTag, test_util::nearly_equal(s.mean_ndre, ndre_b, 1e-12),
                            "NDRE mean is not dragged toward zero");

    double fai_a = faiPixel(0.0f, 0.0f, 0.02f);
    double fai_b = faiPixel(0.05f, 0.30f, 0.02f);
    failures += expect_true(kTag, test_util::nearly_equal(s.mean_fai, (fai_a + fai_b) / 2.0, 1e-12),
                            "FAI mean covers both pixels");
    return failures;
}

int test_undefined_ndre_everywhere_is_insufficient() {
    int failures = 0;
    Config cfg = test_util::quietConfig();

    // Every valid pixel has NIR + RE == 0, so FAI is defined but NDRE is not
    SpectralBandSet bands = test_util::makeBands(2, 2, 0.03f, 0.0f, 0.0f, 0.02f);
    PixelMask mask = QualityMask(cfg).mask(bands);
    failures += expect_true(kTag, mask.valid_pixels == 4, "dark pixels pass the mask");
    failures += expect_true(kTag, throws<InsufficientCoverage>([&]() { SpectralIndexEngine(cfg).compute(bands, mask); }),
                            "no NDRE pixel is insufficient coverage, not a mean of 0");
    return failures;
}

int test_masking_rules() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    const float nodata = cfg.nodata_value;

    // 10 pixels in one row; only pixels 0 and 9 are usable
    SpectralBandSet bands = test_util::makeBands(1, 10, 0.03f, 0.05f, 0.20f, 0.02f);
    bands.nodata = nodata;
    cv::Mat scl(1, 10, CV_32F, cv::Scalar(6.0f));  // water
    bands.bands[SpectralBand::SCENE_CLASSIFICATION] = scl;

    bands.bands[SpectralBand::NIR].at<float>(0, 1) = nodata;                                    // no-data
    bands.bands[SpectralBand::RED_EDGE].at<float>(0, 2) = std::numeric_limits<float>::quiet_NaN(); // NaN
    bands.bands[SpectralBand::RED].at<float>(0, 3) = 0.25f;                                     // cloud
    bands.bands[SpectralBand::SWIR].at<float>(0, 4) = 0.15f;                                    // land
    bands.bands[SpectralBand::NIR].at<float>(0, 5) = 1.2f;                                      // out of range
    bands.bands[SpectralBand::RED].at<float>(0, 6) = -0.01f;                                    // negative
    bands.bands[SpectralBand::SCENE_CLASSIFICATION].at<float>(0, 7) = 8.0f;                     // cloud class
    bands.footprint.at<uchar>(0, 8) = 0;                                                        // outside AOI

    PixelMask mask = QualityMask(cfg).mask(bands);
    failures += expect_true(kTag, mask.total_pixels == 9, "footprint excludes one pixel from the total");
    failures += expect_true(kTag, mask.valid_pixels == 2, "only two pixels pass, got " + std::to_string(mask.valid_pixels));
    failures += expect_true(kTag, mask.valid.at<uchar>(0, 0) == 255 && mask.valid.at<uchar>(0, 9) == 255,
                            "clean pixels are marked usable");
    for (int c = 1; c <= 8; ++c) {
        failures += expect_true(kTag, mask.valid.at<uchar>(0, c) == 0, "pixel " + std::to_string(c) + " masked");
    }

    // Thresholds are inclusive
    QualityMask masker(cfg);
    failures += expect_true(kTag, !masker.pixelUsable(0.20f, 0.05f, 0.2f, 0.02f, nodata), "red == 0.20 is cloud");
    failures += expect_true(kTag, !masker.pixelUsable(0.03f, 0.05f, 0.2f, 0.10f, nodata), "swir == 0.10 is land");
    failures += expect_true(kTag, masker.classExcluded(3) && masker.classExcluded(9) && !masker.classExcluded(6),
                            "SCL shadow/cloud excluded, water kept");
    return failures;
}

int test_insufficient_coverage() {
    int failures = 0;
    Config cfg = test_util::quietConfig();

    SpectralBandSet land = test_util::landBands();
    failures += expect_true(kTag, throws<InsufficientCoverage>([&]() { QualityMask(cfg).mask(land); }),
                            "all-land scene has no usable pixels");

    SpectralBandSet outside = test_util::kelpBands();
    outside.footprint.setTo(0);
    failures += expect_true(kTag, throws<InsufficientCoverage>([&]() { QualityMask(cfg).mask(outside); }),
                            "empty footprint has no usable pixels");

    // 1 of 4 pixels usable, below a configured 50 % floor
    SpectralBandSet partial = test_util::makeBands(2, 2, 0.03f, 0.05f, 0.2f, 0.3f);
    partial.bands[SpectralBand::SWIR].at<float>(0, 0) = 0.02f;
    Config strict = cfg;
    strict.min_valid_pixel_fraction = 0.5;
    failures += expect_true(kTag, throws<InsufficientCoverage>([&]() { QualityMask(strict).mask(partial); }),
                            "coverage below the configured floor fails");
    try {
        PixelMask m = QualityMask(cfg).mask(partial);
        failures += expect_true(kTag, m.valid_pixels == 1 && test_util::nearly_equal(m.validFraction(), 0.25),
                                "default floor accepts low coverage");
    } catch (const std::exception& e) {
        failures += expect_true(kTag, false, std::string("default floor rejected low coverage: ") + e.what());
    }

    // Engine refuses an empty mask
    SpectralBandSet bands = test_util::kelpBands(4, 4);
    PixelMask empty;
    empty.valid = cv::Mat::zeros(4, 4, CV_8UC1);
    empty.total_pixels = 16;
    failures += expect_true(kTag, throws<InsufficientCoverage>([&]() { SpectralIndexEngine(cfg).compute(bands, empty); }),
                            "no contributing pixel fails");
    return failures;
}

int test_synthetic_scene_determinism() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    AreaOfInterest aoi = GeometryResolver(cfg).resolve(test_util::kTestPolygon);
    Date date = Date::parse("2023-07-15");

    SyntheticSceneGenerator generator(cfg);
    SpectralBandSet a = generator.generate(aoi, date);
    SpectralBandSet b = generator.generate(aoi, date);

    QualityMask masker(cfg);
    SpectralIndexEngine engine(cfg);
    SpectralSummary sa = engine.compute(a, masker.mask(a));
    SpectralSummary sb = engine.compute(b, masker.mask(b));

    failures += expect_true(kTag, std::memcmp(&sa.mean_fai, &sb.mean_fai, sizeof(double)) == 0 &&
                                  std::memcmp(&sa.mean_ndre, &sb.mean_ndre, sizeof(double)) == 0,
                            "means are bit-identical across runs");
    failures += expect_true(kTag, sa.mean_fai > 0.0 && sa.mean_fai < 0.3, "synthetic kelp FAI is positive and plausible");
    failures += expect_true(kTag, sa.mean_ndre > 0.0 && sa.mean_ndre < 1.0, "synthetic kelp NDRE is positive");
    failures += expect_true(kTag, sa.valid_pixel_fraction > 0.9, "synthetic scenes have no cloud or land");

    // Repeated compute over the same inputs
    PixelMask m = masker.mask(a);
    SpectralSummary s1 = engine.compute(a, m);
    SpectralSummary s2 = engine.compute(a, m);
    failures += expect_true(kTag, s1.mean_fai == s2.mean_fai && s1.mean_ndre == s2.mean_ndre,
                            "compute is repeatable");
    return failures;
}

int test_index_maps_and_stats() {
    int failures = 0;
    Config cfg = test_util::quietConfig();
    SpectralBandSet bands = test_util::kelpBands(4, 4);
    bands.footprint.at<uchar>(0, 0) = 0;

    SpectralIndexEngine engine(cfg);
    PixelMask mask = QualityMask(cfg).mask(bands);
    IndexMaps maps = engine.computeIndexMaps(bands, mask);

    failures += expect_true(kTag, std::isnan(maps.fai.at<float>(0, 0)) && std::isnan(maps.ndre.at<float>(0, 0)),
                            "masked pixels are NaN in the index maps");
    failures += expect_true(kTag, std::isfinite(maps.fai.at<float>(1, 1)), "valid pixels have values");

    IndexStats fai = SpectralIndexEngine::describeIndex(maps.fai, "fai");
    failures += expect_true(kTag, fai.count == 15, "stats skip NaN pixels");
    failures += expect_true(kTag, fai.std < 1e-6 && fai.out_of_range == 0 && fai.in_range_fraction == 1.0,
                            "uniform FAI stats");

    cv::Mat wild = (cv::Mat_<float>(1, 4) << 0.1f, 2.0f, -0.9f, 0.2f);
    IndexStats w = SpectralIndexEngine::describeIndex(wild, "fai");
    failures += expect_true(kTag, w.out_of_range == 2 && test_util::nearly_equal(w.in_range_fraction, 0.5),
                            "FAI outside [-0.5, 1.0] is counted");
    failures += expect_true(kTag, test_util::nearly_equal(w.min, -0.9, 1e-6) && test_util::nearly_equal(w.max, 2.0, 1e-6),
                            "min/max");

    IndexStats n = SpectralIndexEngine::describeIndex(wild, "ndre");
    failures += expect_true(kTag, n.out_of_range == 1, "NDRE range is [-1.1, 1.1]");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_pixel_formulas();
    failures += test_uniform_scene_means();
    failures += test_zero_denominator_excluded_from_ndre_mean();
    failures += test_undefined_ndre_everywhere_is_insufficient();
    failures += test_masking_rules();
    failures += test_insufficient_coverage();
    failures += test_synthetic_scene_determinism();
    failures += test_index_maps_and_stats();
    return test_util::report(kTag, failures);
}
