/**
 * @file carbon_pipeline.cpp
 * @brief Implementation of the main estimation pipeline
 */

#include "kelp_carbon/carbon_pipeline.hpp"
#include "kelp_carbon/biomass_estimator.hpp"
#include "kelp_carbon/geometry_resolver.hpp"
#include "kelp_carbon/quality_mask.hpp"
#include "kelp_carbon/scene_acquirer.hpp"
#include "kelp_carbon/spectral_indices.hpp"
#include "kelp_carbon/stac_imagery_source.hpp"
#include <iostream>

namespace kelp_carbon {

CarbonPipeline::CarbonPipeline(
    const Config& config,
    std::shared_ptr<ImagerySource> real_source,
    std::shared_ptr<const RegressionModel> model,
    std::shared_ptr<const ResultMapper> mapper,
    std::shared_ptr<CacheStore> store
) : cfg_(config), model_(std::move(model)), mapper_(std::move(mapper)) {

    cfg_.validate();

    // The service must not start without a model
    if (!model_) {
        model_ = loadRegressionModel(cfg_.model_path);
    }
    if (!mapper_) {
        mapper_ = std::make_shared<DefaultResultMapper>();
    }
    if (!store && !cfg_.cache_store_path.empty()) {
        store = std::make_shared<JsonCacheStore>(cfg_.cache_store_path);
    }

    // Stage components - use member cfg_, not the parameter
    resolver_ = std::make_unique<GeometryResolver>(cfg_);
    acquirer_ = std::make_unique<SceneAcquirer>(cfg_, std::move(real_source));
    quality_mask_ = std::make_unique<QualityMask>(cfg_);
    index_engine_ = std::make_unique<SpectralIndexEngine>(cfg_);
    estimator_ = std::make_unique<BiomassEstimator>(cfg_);
    cache_ = std::make_unique<ResultCache>(std::move(store));

    if (cfg_.verbose) {
        std::cout << "[CarbonPipeline] Ready: model " << model_->describe()
                  << (acquirer_->hasRealSource() ? ", real imagery enabled" : ", synthetic imagery only")
                  << std::endl;
    }
}

CarbonPipeline::~CarbonPipeline() = default;

void CarbonPipeline::enter(PipelineStage& stage, PipelineStage next) const {
    stage = next;
    if (cfg_.verbose) {
        std::cout << "[CarbonPipeline] " << toString(next) << std::endl;
    }
}

AnalysisResult CarbonPipeline::run(const AnalysisRequest& request) {
    PipelineStage stage = PipelineStage::PARSING;
    return runStaged(request, stage);
}

AnalysisResult CarbonPipeline::runStaged(const AnalysisRequest& request, PipelineStage& stage) {
    requests_++;
    try {
        // === PARSING ===
        enter(stage, PipelineStage::PARSING);
        AreaOfInterest aoi = resolver_->resolve(request.aoi_wkt);
        Date date = Date::parse(request.date);

        CacheKey key{geometryHash(aoi, cfg_.hash_precision_digits), date.toString()};

        // === CACHING (lookup) -> ACQUIRING ... ESTIMATING on a miss ===
        bool cache_hit = false;
        CarbonEstimate estimate = cache_->getOrCompute(
            key,
            [&]() { return computeEstimate(aoi, date, request.prefer_real_source, stage); },
            &cache_hit
        );
        enter(stage, PipelineStage::DONE);

        AnalysisResult result;
        result.date = date.toString();
        result.aoi_wkt = request.aoi_wkt;
        result.estimate = estimate;
        result.cache_hit = cache_hit;

        // Visualization never fails the request
        if (request.include_visualization) {
            try {
                result.visualization = mapper_->render(aoi, result, request.visualization_kind);
            } catch (const std::exception& e) {
                visualization_failures_++;
                std::cerr << "[CarbonPipeline] Visualization degraded: " << e.what() << std::endl;
                result.visualization = nlohmann::json{{"error", e.what()}};
            }
        }

        if (cfg_.verbose) {
            std::cout << "[CarbonPipeline] " << estimate.toString()
                      << (cache_hit ? " [cached]" : "") << std::endl;
        }
        return result;

    } catch (const std::exception& e) {
        failures_++;
        std::cerr << "[CarbonPipeline] FAILED in " << toString(stage) << ": " << e.what() << std::endl;
        throw;
    }
}

CarbonEstimate CarbonPipeline::computeEstimate(const AreaOfInterest& aoi, const Date& date,
                                               bool prefer_real, PipelineStage& stage) {
    // === ACQUIRING ===
    enter(stage, PipelineStage::ACQUIRING);
    AcquisitionResult scene = acquirer_->acquire(aoi, date, prefer_real);
    if (scene.data_source == DataSource::REAL) {
        real_scenes_++;
    } else {
        synthetic_scenes_++;
        if (prefer_real) {
            fallbacks_++;
        }
    }

    // === MASKING ===
    enter(stage, PipelineStage::MASKING);
    PixelMask mask = quality_mask_->mask(scene.bands);

    // === INDEXING ===
    enter(stage, PipelineStage::INDEXING);
    SpectralSummary summary = index_engine_->compute(scene.bands, mask);

    // === ESTIMATING ===
    enter(stage, PipelineStage::ESTIMATING);
    CarbonEstimate estimate = estimator_->estimate(summary, aoi.area_m2, *model_);
    estimate.data_source = scene.data_source;
    estimate.source_metadata = scene.source_metadata;

    enter(stage, PipelineStage::CACHING);
    return estimate;
}

PipelineOutcome CarbonPipeline::execute(const AnalysisRequest& request) {
    PipelineOutcome outcome;
    PipelineStage stage = PipelineStage::PARSING;
    try {
        outcome.result = runStaged(request, stage);
        return outcome;
    } catch (const std::invalid_argument& e) {
        // InvalidGeometry and malformed dates
        outcome.category = ErrorCategory::CLIENT_INPUT;
        outcome.message = e.what();
    } catch (const InsufficientCoverage& e) {
        outcome.category = ErrorCategory::UNANALYZABLE;
        outcome.message = e.what();
    } catch (const ModelUnavailable& e) {
        outcome.category = ErrorCategory::SERVICE_UNAVAILABLE;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        outcome.category = ErrorCategory::INTERNAL;
        outcome.message = e.what();
    }
    outcome.failed_stage = stage;
    return outcome;
}

std::map<std::string, double> CarbonPipeline::getStatus() const {
    std::map<std::string, double> status;
    status["requests"] = double(requests_);
    status["failures"] = double(failures_);
    status["real_scenes"] = double(real_scenes_);
    status["synthetic_scenes"] = double(synthetic_scenes_);
    status["fallbacks"] = double(fallbacks_);
    status["visualization_failures"] = double(visualization_failures_);
    status["real_source_configured"] = acquirer_->hasRealSource() ? 1.0 : 0.0;

    CacheStats cs = cache_->stats();
    status["cache_hits"] = double(cs.hits);
    status["cache_store_hits"] = double(cs.store_hits);
    status["cache_misses"] = double(cs.misses);
    status["cache_computations"] = double(cs.computations);
    status["cache_failures"] = double(cs.failures);
    status["cache_entries"] = double(cs.entries);
    return status;
}

std::unique_ptr<CarbonPipeline> createPipeline(const Config& config, bool enable_real_imagery) {
    std::shared_ptr<ImagerySource> source;
    if (enable_real_imagery) {
        source = std::make_shared<StacImagerySource>(config);
    }
    return std::make_unique<CarbonPipeline>(config, source);
}

} // namespace kelp_carbon
