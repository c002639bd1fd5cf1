/**
 * @file serialization.cpp
 * @brief Implementation of the JSON records
 */

#include "kelp_carbon/serialization.hpp"
#include <stdexcept>

namespace kelp_carbon {

using json = nlohmann::json;

namespace {

json metadataJson(const SourceMetadata& metadata) {
    if (metadata.empty()) {
        return nullptr;
    }
    json j = json::object();
    for (const auto& [k, v] : metadata) {
        j[k] = v;
    }
    return j;
}

} // namespace

json toJson(const AnalysisResult& result) {
    const CarbonEstimate& e = result.estimate;

    json j;
    j["date"] = result.date;
    j["aoi_wkt"] = result.aoi_wkt;
    j["area_m2"] = e.area_m2;
    j["mean_fai"] = e.mean_fai;
    j["mean_ndre"] = e.mean_ndre;
    j["biomass_t"] = e.biomass_t;
    j["biomass_density_t_ha"] = e.biomass_density_t_ha;
    j["carbon_t"] = e.carbon_t;
    j["co2e_t"] = e.co2e_t;
    j["car_equivalent"] = e.car_equivalent;
    j["valid_pixel_fraction"] = e.valid_pixel_fraction;
    j["data_source"] = toString(e.data_source);
    j["source_metadata"] = metadataJson(e.source_metadata);
    j["visualization"] = result.visualization ? *result.visualization : json(nullptr);
    j["cache_hit"] = result.cache_hit;
    return j;
}

json toJson(const CarbonEstimate& e) {
    json j;
    j["area_m2"] = e.area_m2;
    j["mean_fai"] = e.mean_fai;
    j["mean_ndre"] = e.mean_ndre;
    j["valid_pixel_fraction"] = e.valid_pixel_fraction;
    j["pixel_count"] = e.pixel_count;
    j["biomass_density_kg_m2"] = e.biomass_density_kg_m2;
    j["biomass_density_t_ha"] = e.biomass_density_t_ha;
    j["biomass_t"] = e.biomass_t;
    j["carbon_t"] = e.carbon_t;
    j["co2e_t"] = e.co2e_t;
    j["car_equivalent"] = e.car_equivalent;
    j["data_source"] = toString(e.data_source);
    j["source_metadata"] = metadataJson(e.source_metadata);
    return j;
}

CarbonEstimate estimateFromJson(const json& j) {
    try {
        CarbonEstimate e;
        e.area_m2 = j.at("area_m2").get<double>();
        e.mean_fai = j.at("mean_fai").get<double>();
        e.mean_ndre = j.at("mean_ndre").get<double>();
        e.valid_pixel_fraction = j.value("valid_pixel_fraction", 0.0);
        e.pixel_count = j.value("pixel_count", 0);
        e.biomass_density_kg_m2 = j.at("biomass_density_kg_m2").get<double>();
        e.biomass_density_t_ha = j.at("biomass_density_t_ha").get<double>();
        e.biomass_t = j.at("biomass_t").get<double>();
        e.carbon_t = j.at("carbon_t").get<double>();
        e.co2e_t = j.at("co2e_t").get<double>();
        e.car_equivalent = j.value("car_equivalent", 0.0);

        std::string source = j.at("data_source").get<std::string>();
        if (source == "real") {
            e.data_source = DataSource::REAL;
        } else if (source == "synthetic") {
            e.data_source = DataSource::SYNTHETIC;
        } else {
            throw std::invalid_argument("unknown data_source '" + source + "'");
        }

        const json& meta = j.at("source_metadata");
        if (!meta.is_null()) {
            for (const auto& [k, v] : meta.items()) {
                e.source_metadata[k] = v.get<std::string>();
            }
        }
        return e;
    } catch (const json::exception& ex) {
        throw std::invalid_argument(std::string("Malformed estimate record: ") + ex.what());
    }
}

} // namespace kelp_carbon
