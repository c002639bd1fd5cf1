/**
 * @file scene_acquirer.cpp
 * @brief Implementation of SceneAcquirer
 */

#include "kelp_carbon/scene_acquirer.hpp"
#include <iostream>
#include <stdexcept>

namespace kelp_carbon {

SceneAcquirer::SceneAcquirer(const Config& config, std::shared_ptr<ImagerySource> real_source)
    : cfg_(config), real_source_(std::move(real_source)), synthetic_(config) {
}

AcquisitionResult SceneAcquirer::acquire(const AreaOfInterest& aoi, const Date& date, bool prefer_real) {
    if (!prefer_real) {
        return synthesize(aoi, date, "real imagery not requested", false);
    }
    if (!real_source_) {
        return synthesize(aoi, date, "no real imagery source configured", true);
    }

    try {
        SceneFetch fetched = real_source_->fetch(aoi, date);
        checkBands(fetched.bands);

        AcquisitionResult result;
        result.bands = std::move(fetched.bands);
        result.data_source = DataSource::REAL;
        result.source_metadata = std::move(fetched.metadata);
        result.source_metadata["requested_source"] = "real";

        if (cfg_.verbose) {
            auto it = result.source_metadata.find("scene_id");
            std::cout << "[SceneAcquirer] Using " << real_source_->name() << " scene "
                      << (it != result.source_metadata.end() ? it->second : "<unnamed>")
                      << " (" << result.bands.size().width << "x"
                      << result.bands.size().height << ")" << std::endl;
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[SceneAcquirer] Falling back to synthetic imagery: " << e.what() << std::endl;
        return synthesize(aoi, date, e.what(), true);
    }
}

AcquisitionResult SceneAcquirer::synthesize(const AreaOfInterest& aoi, const Date& date,
                                            const std::string& reason, bool requested_real) const {
    AcquisitionResult result;
    result.bands = synthetic_.generate(aoi, date);
    result.data_source = DataSource::SYNTHETIC;
    result.source_metadata["fallback_reason"] = reason;
    result.source_metadata["requested_source"] = requested_real ? "real" : "synthetic";

    if (cfg_.verbose) {
        std::cout << "[SceneAcquirer] Synthetic scene for " << date.toString()
                  << " (" << reason << ")" << std::endl;
    }
    return result;
}

void SceneAcquirer::checkBands(const SpectralBandSet& bands) {
    const SpectralBand required[] = {SpectralBand::RED, SpectralBand::RED_EDGE,
                                     SpectralBand::NIR, SpectralBand::SWIR};
    cv::Size size;
    for (SpectralBand b : required) {
        if (!bands.has(b) || bands.band(b).empty()) {
            throw std::runtime_error("scene is missing band " + toString(b));
        }
        if (size.area() == 0) {
            size = bands.band(b).size();
        } else if (bands.band(b).size() != size) {
            throw std::runtime_error("band " + toString(b) + " is not aligned with the others");
        }
    }
    if (bands.has(SpectralBand::SCENE_CLASSIFICATION) &&
        bands.band(SpectralBand::SCENE_CLASSIFICATION).size() != size) {
        throw std::runtime_error("scene classification band is not aligned with the others");
    }
    if (!bands.footprint.empty() && bands.footprint.size() != size) {
        throw std::runtime_error("footprint mask is not aligned with the bands");
    }
}

} // namespace kelp_carbon
