/**
 * @file common.hpp
 * @brief Common enums, string conversions and type aliases for kelp carbon estimation
 */

#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace kelp_carbon {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Origin of the band rasters a result was computed from
 */
enum class DataSource {
    REAL,       ///< Real satellite scene
    SYNTHETIC   ///< Deterministic synthetic bands (fallback)
};

/**
 * @brief Spectral bands used by the pipeline
 */
enum class SpectralBand {
    RED,                  ///< Sentinel-2 B04 (665 nm)
    RED_EDGE,             ///< Sentinel-2 B05 (705 nm)
    NIR,                  ///< Sentinel-2 B08 (842 nm)
    SWIR,                 ///< Sentinel-2 B11 (1610 nm)
    SCENE_CLASSIFICATION  ///< Sentinel-2 SCL class codes (optional)
};

/**
 * @brief Pipeline state machine stages
 */
enum class PipelineStage {
    PARSING,
    ACQUIRING,
    MASKING,
    INDEXING,
    ESTIMATING,
    CACHING,
    DONE,
    FAILED
};

/**
 * @brief Visualization payload requested from the mapping collaborator
 */
enum class VisualizationKind {
    RAW_DATA,             ///< GeoJSON feature collection
    RENDERED_IMAGE,       ///< Static PNG image
    EMBEDDED_INTERACTIVE  ///< Interactive HTML map
};

/**
 * @brief Client-facing error categories
 */
enum class ErrorCategory {
    NONE,
    CLIENT_INPUT,         ///< Malformed polygon or date, never retried
    UNANALYZABLE,         ///< No usable pixels for this area/date
    SERVICE_UNAVAILABLE,  ///< Model not loaded
    INTERNAL
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(DataSource source) {
    switch (source) {
        case DataSource::REAL: return "real";
        case DataSource::SYNTHETIC: return "synthetic";
        default: return "unknown";
    }
}

inline std::string toString(SpectralBand band) {
    switch (band) {
        case SpectralBand::RED: return "red";
        case SpectralBand::RED_EDGE: return "red_edge";
        case SpectralBand::NIR: return "nir";
        case SpectralBand::SWIR: return "swir";
        case SpectralBand::SCENE_CLASSIFICATION: return "scl";
        default: return "unknown";
    }
}

inline std::string toString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::PARSING: return "PARSING";
        case PipelineStage::ACQUIRING: return "ACQUIRING";
        case PipelineStage::MASKING: return "MASKING";
        case PipelineStage::INDEXING: return "INDEXING";
        case PipelineStage::ESTIMATING: return "ESTIMATING";
        case PipelineStage::CACHING: return "CACHING";
        case PipelineStage::DONE: return "DONE";
        case PipelineStage::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(VisualizationKind kind) {
    switch (kind) {
        case VisualizationKind::RAW_DATA: return "raw-data";
        case VisualizationKind::RENDERED_IMAGE: return "rendered-image";
        case VisualizationKind::EMBEDDED_INTERACTIVE: return "embedded-interactive";
        default: return "unknown";
    }
}

inline std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::CLIENT_INPUT: return "CLIENT_INPUT";
        case ErrorCategory::UNANALYZABLE: return "UNANALYZABLE";
        case ErrorCategory::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        case ErrorCategory::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

inline VisualizationKind parseVisualizationKind(const std::string& name) {
    if (name == "raw-data" || name == "geojson") return VisualizationKind::RAW_DATA;
    if (name == "rendered-image" || name == "static") return VisualizationKind::RENDERED_IMAGE;
    if (name == "embedded-interactive" || name == "interactive") {
        return VisualizationKind::EMBEDDED_INTERACTIVE;
    }
    throw std::invalid_argument("Unknown visualization kind: " + name);
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

/// Diagnostic key/value strings attached to a result (empty == null)
using SourceMetadata = std::map<std::string, std::string>;

/// Lower-case hex SHA-256 digest of a normalized polygon
using GeometryHash = std::string;

} // namespace kelp_carbon
