#pragma once

/**
 * @file popaccess.hpp
 * @brief Main header for the population accessibility analyzer
 *
 * Measures how far every populated grid cell lies from the nearest
 * facility or road, splits population into urban and rural classes,
 * and rolls the results up by distance band, country and region.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <optional>
#include <cmath>
#include <cstdint>
#include <algorithm>

namespace popaccess {

/// Kilometres per degree, used when a grid is referenced to a geographic CRS
constexpr double kKilometresPerDegree = 111.32;

/// Default urban density threshold (persons per cell) for the threshold policy
constexpr double kDefaultUrbanThreshold = 300.0;

/// Reference CRS assumed for feature sources that do not declare one
constexpr const char* kAssumedFeatureCrs = "EPSG:4326";

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief Axis-aligned bounding box in CRS units
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0), min_y(0), max_x(0), max_y(0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return width() * height(); }

    bool intersects(const BoundingBox& other) const {
        return min_x < other.max_x && other.min_x < max_x &&
               min_y < other.max_y && other.min_y < max_y;
    }

    BoundingBox intersection(const BoundingBox& other) const {
        return BoundingBox(std::max(min_x, other.min_x), std::max(min_y, other.min_y),
                           std::min(max_x, other.max_x), std::min(max_y, other.max_y));
    }
};

/**
 * @brief Row/column address of a grid cell
 *
 * Indices are signed so that locations outside the grid can be represented.
 */
struct CellIndex {
    long row = 0;
    long col = 0;

    bool operator==(const CellIndex& other) const {
        return row == other.row && col == other.col;
    }
};

// ============================================================================
// Classification Types
// ============================================================================

/**
 * @brief Settlement class of a populated cell
 */
enum class UrbanClass {
    URBAN,
    RURAL
};

inline const char* to_string(UrbanClass c) {
    return c == UrbanClass::URBAN ? "urban" : "rural";
}

/**
 * @brief How a grid value is turned into an urban/rural class
 *
 * SIGN: the grid is pre-classified, positive values are urban population and
 *       negative values rural population (magnitude = population).
 * THRESHOLD: the grid holds population density; values at or above the
 *       threshold are urban, smaller positive values rural.
 */
enum class ClassificationPolicy {
    SIGN,
    THRESHOLD
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Complete configuration for one analysis run
 */
struct AnalysisConfig {
    // Population raster
    std::string population_raster;
    std::string population_band = "1";          // 1-based index or band description
    std::optional<double> nodata_override;      // e.g. -9999 when the file lacks one

    // Reference features (facilities or roads)
    std::string features_path;
    std::string feature_layer;                  // Empty: first layer
    std::string feature_filter_field;           // e.g. "GP_RTP"
    std::vector<std::string> feature_filter_values;  // e.g. {"1", "2"}

    // Scope sources (at most one of boundaries / country_rasters)
    std::string boundaries_path;                // File or directory of boundary polygons
    std::string boundary_name_field = "name";
    std::string country_rasters_dir;            // Directory of per-country rasters
    std::string regions_file;                   // Empty: built-in African regions

    // Classification
    ClassificationPolicy classification_policy = ClassificationPolicy::THRESHOLD;
    std::optional<double> density_threshold;    // Threshold policy only

    // Distance bands and thresholds in kilometres
    std::vector<double> distance_bands_km = {1, 2, 5, 10, 20, 50, 100};
    std::vector<double> cumulative_thresholds_km;   // Empty: 1..100 step 1
    std::vector<double> gap_thresholds_km = {1, 5};

    // Output
    std::string output_directory = "output";
    std::string base_name = "accessibility";
    std::vector<std::string> output_formats = {"json", "csv"};
    bool write_cell_detail = false;
    bool write_distance_raster = false;
    int block_factor = 0;                       // 0: no block aggregation

    // Processing
    int num_threads = 0;                        // 0: TBB default
    std::string rollup_only_dir;                // Rebuild regions from stored scope results

    // Logging
    int log_level = 3;
    std::string log_file;
    std::string log_config;

    double effective_threshold() const {
        return density_threshold.value_or(kDefaultUrbanThreshold);
    }

    std::vector<double> effective_cumulative_thresholds() const {
        if (!cumulative_thresholds_km.empty()) {
            return cumulative_thresholds_km;
        }
        std::vector<double> defaults;
        for (int km = 1; km <= 100; ++km) {
            defaults.push_back(static_cast<double>(km));
        }
        return defaults;
    }

    bool wants_format(const std::string& format) const {
        for (const auto& f : output_formats) {
            if (f == format) return true;
        }
        return false;
    }
};

/// Human-readable version string
const char* version_string();

} // namespace popaccess
