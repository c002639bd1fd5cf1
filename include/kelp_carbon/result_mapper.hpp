/**
 * @file result_mapper.hpp
 * @brief Visualization collaborator interface and built-in renderers
 */

#pragma once

#include "data_types.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace kelp_carbon {

/**
 * @brief Produces a visualization payload for a finished result
 *
 * Exceptions thrown by render() never fail the request: the pipeline turns
 * them into {"error": message} in the result's visualization field.
 */
class ResultMapper {
public:
    virtual ~ResultMapper() = default;

    virtual nlohmann::json render(const AreaOfInterest& aoi, const AnalysisResult& result,
                                  VisualizationKind kind) const = 0;
};

/**
 * @brief GeoJSON and static PNG renderer
 *
 * - RAW_DATA: FeatureCollection with the AOI polygon and result properties,
 *   plus "center" and "bounds" for map framing
 * - RENDERED_IMAGE: PNG (base64) of the AOI filled by biomass density class
 * - EMBEDDED_INTERACTIVE: not supported, throws std::runtime_error
 */
class DefaultResultMapper : public ResultMapper {
public:
    explicit DefaultResultMapper(int image_size = 512) : image_size_(image_size) {}

    nlohmann::json render(const AreaOfInterest& aoi, const AnalysisResult& result,
                          VisualizationKind kind) const override;

    nlohmann::json geoJson(const AreaOfInterest& aoi, const AnalysisResult& result) const;

    /// BGR image of the AOI coloured by density class
    cv::Mat renderImage(const AreaOfInterest& aoi, const AnalysisResult& result) const;

    /// Fill colour (BGR) for a biomass density in t/ha
    static cv::Scalar densityColor(double density_t_ha);

private:
    int image_size_;
};

/**
 * @brief Standard base64 of a byte buffer
 */
std::string base64Encode(const std::vector<unsigned char>& bytes);

} // namespace kelp_carbon
