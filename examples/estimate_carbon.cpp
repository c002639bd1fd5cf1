/**
 * @file estimate_carbon.cpp
 * @brief Command-line driver: estimate kelp biomass and carbon for a polygon
 *
 * Prints the flat JSON result record to stdout; progress goes to the log.
 */

#include <kelp_carbon/carbon_pipeline.hpp>
#include <kelp_carbon/serialization.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace kelp_carbon;

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " --aoi <WKT> --date <YYYY-MM-DD> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --aoi <wkt>        Polygon to analyze (WKT POLYGON, lon lat)\n";
    std::cout << "  --date <date>      Acquisition date (ISO-8601)\n";
    std::cout << "  --config <path>    JSON configuration file\n";
    std::cout << "  --model <path>     Regression model artifact (overrides config)\n";
    std::cout << "  --synthetic        Do not request real imagery\n";
    std::cout << "  --map <kind>       Add a visualization: raw-data, rendered-image, embedded-interactive\n";
    std::cout << "  --cache <path>     Durable cache file\n";
    std::cout << "  --quiet            Only print warnings and the result\n";
    std::cout << "  --help, -h         Show this help\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << prog << " --aoi \"POLYGON((-123.5 48.5, -123.4 48.5, -123.4 48.6, -123.5 48.6, -123.5 48.5))\" \\\n";
    std::cout << "      --date 2023-07-15 --synthetic\n";
}

int main(int argc, char* argv[]) {
    AnalysisRequest request;
    fs::path config_path;
    std::string model_path;
    std::string cache_path;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--aoi" && i + 1 < argc) {
            request.aoi_wkt = argv[++i];
        } else if (arg == "--date" && i + 1 < argc) {
            request.date = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg == "--cache" && i + 1 < argc) {
            cache_path = argv[++i];
        } else if (arg == "--synthetic") {
            request.prefer_real_source = false;
        } else if (arg == "--map" && i + 1 < argc) {
            try {
                request.visualization_kind = parseVisualizationKind(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                return 1;
            }
            request.include_visualization = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (request.aoi_wkt.empty() || request.date.empty()) {
        std::cerr << "ERROR: --aoi and --date are required\n\n";
        printUsage(argv[0]);
        return 1;
    }

    // Configuration
    Config config;
    try {
        if (!config_path.empty()) {
            config = loadConfig(config_path.string());
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR loading config: " << e.what() << "\n";
        return 1;
    }
    if (!model_path.empty()) {
        config.model_path = model_path;
    }
    if (!cache_path.empty()) {
        config.cache_store_path = cache_path;
    }
    if (quiet) {
        config.verbose = false;
    }

    // Pipeline (refuses to start without a model)
    std::unique_ptr<CarbonPipeline> pipeline;
    try {
        pipeline = createPipeline(config, request.prefer_real_source);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 3;
    }

    PipelineOutcome outcome = pipeline->execute(request);
    if (!outcome.ok()) {
        nlohmann::json err;
        err["error"] = toString(outcome.category);
        err["message"] = outcome.message;
        err["stage"] = toString(outcome.failed_stage);
        std::cout << err.dump(2) << std::endl;
        return outcome.category == ErrorCategory::CLIENT_INPUT ? 2 : 4;
    }

    std::cout << toJson(*outcome.result).dump(2) << std::endl;
    return 0;
}
