/**
 * @file scene_acquirer.hpp
 * @brief Real-first scene acquisition with recorded synthetic fallback
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include "imagery_source.hpp"
#include "synthetic_scene.hpp"
#include <memory>

namespace kelp_carbon {

/**
 * @brief Bands for one (AOI, date) plus where they came from
 */
struct AcquisitionResult {
    SpectralBandSet bands;
    DataSource data_source = DataSource::SYNTHETIC;
    SourceMetadata source_metadata;
};

/**
 * @brief Obtains band rasters, never failing the request
 *
 * When real imagery is preferred the configured ImagerySource is asked first.
 * Any failure it reports is caught here and replaced by a synthetic scene;
 * the reason is kept in source_metadata["fallback_reason"].
 */
class SceneAcquirer {
public:
    /**
     * @param config Pipeline configuration
     * @param real_source Provider of real scenes; may be null (always synthetic)
     */
    SceneAcquirer(const Config& config, std::shared_ptr<ImagerySource> real_source);

    AcquisitionResult acquire(const AreaOfInterest& aoi, const Date& date, bool prefer_real);

    bool hasRealSource() const { return real_source_ != nullptr; }

private:
    AcquisitionResult synthesize(const AreaOfInterest& aoi, const Date& date,
                                 const std::string& reason, bool requested_real) const;

    /// @throws std::runtime_error if a required band is missing or misaligned
    static void checkBands(const SpectralBandSet& bands);

    Config cfg_;
    std::shared_ptr<ImagerySource> real_source_;
    SyntheticSceneGenerator synthetic_;
};

} // namespace kelp_carbon
