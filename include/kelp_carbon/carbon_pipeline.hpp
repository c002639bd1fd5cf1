/**
 * @file carbon_pipeline.hpp
 * @brief Main estimation pipeline (integrates all components)
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "imagery_source.hpp"
#include "regression_model.hpp"
#include "result_cache.hpp"
#include "result_mapper.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kelp_carbon {

// Forward declarations for stage components
class GeometryResolver;
class SceneAcquirer;
class QualityMask;
class SpectralIndexEngine;
class BiomassEstimator;

/**
 * @brief Result of execute(): either a result or a categorized failure
 */
struct PipelineOutcome {
    std::optional<AnalysisResult> result;
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
    PipelineStage failed_stage = PipelineStage::DONE;

    bool ok() const { return result.has_value(); }
};

/**
 * @brief Polygon + date -> biomass and carbon estimate
 *
 * Stages: PARSING -> ACQUIRING -> MASKING -> INDEXING -> ESTIMATING ->
 * CACHING -> DONE. Any failure ends in FAILED; acquisition itself never fails
 * (it degrades to synthetic imagery). Results are memoized per
 * (geometry hash, date), so a repeated request performs no acquisition.
 *
 * Safe to call run() from several threads at once.
 */
class CarbonPipeline {
public:
    /**
     * @param config Pipeline configuration
     * @param real_source Real imagery provider (null: synthetic only)
     * @param model Pre-loaded model (null: load from config.model_path)
     * @param mapper Visualization collaborator (null: DefaultResultMapper)
     * @param store Durable cache mirror (null: JsonCacheStore when
     *              config.cache_store_path is set, otherwise none)
     *
     * @throws ModelUnavailable if the model artifact cannot be loaded
     * @throws std::invalid_argument if the configuration is inconsistent
     */
    explicit CarbonPipeline(const Config& config,
                            std::shared_ptr<ImagerySource> real_source = nullptr,
                            std::shared_ptr<const RegressionModel> model = nullptr,
                            std::shared_ptr<const ResultMapper> mapper = nullptr,
                            std::shared_ptr<CacheStore> store = nullptr);
    ~CarbonPipeline();

    /**
     * @brief Analyze one request
     *
     * @throws InvalidGeometry, std::invalid_argument (bad date),
     *         InsufficientCoverage; propagated unmodified
     */
    AnalysisResult run(const AnalysisRequest& request);

    /**
     * @brief Like run(), but maps failures to client error categories
     */
    PipelineOutcome execute(const AnalysisRequest& request);

    /**
     * @brief Get current pipeline counters
     */
    std::map<std::string, double> getStatus() const;

    ResultCache& cache() { return *cache_; }
    const Config& config() const { return cfg_; }
    const RegressionModel& model() const { return *model_; }

private:
    AnalysisResult runStaged(const AnalysisRequest& request, PipelineStage& stage);

    CarbonEstimate computeEstimate(const AreaOfInterest& aoi, const Date& date,
                                   bool prefer_real, PipelineStage& stage);

    void enter(PipelineStage& stage, PipelineStage next) const;

    Config cfg_;

    // Stage components
    std::unique_ptr<GeometryResolver> resolver_;
    std::unique_ptr<SceneAcquirer> acquirer_;
    std::unique_ptr<QualityMask> quality_mask_;
    std::unique_ptr<SpectralIndexEngine> index_engine_;
    std::unique_ptr<BiomassEstimator> estimator_;
    std::unique_ptr<ResultCache> cache_;

    std::shared_ptr<const RegressionModel> model_;
    std::shared_ptr<const ResultMapper> mapper_;

    // Counters
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> real_scenes_{0};
    std::atomic<uint64_t> synthetic_scenes_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> visualization_failures_{0};
};

/**
 * @brief Convenience function to create a pipeline with the STAC real source
 *
 * @param config Pipeline configuration (model loaded from config.model_path)
 * @param enable_real_imagery false: never contact the network
 * @return Configured CarbonPipeline instance
 *
 * @throws ModelUnavailable if the model artifact cannot be loaded
 */
std::unique_ptr<CarbonPipeline> createPipeline(const Config& config, bool enable_real_imagery = true);

} // namespace kelp_carbon
