/**
 * @file AccessPipeline.hpp
 * @brief Per-scope analysis and the whole-run pipeline
 *
 * Each scope runs Load, Rasterize, Distance, Classify, Aggregate and Emit
 * in that order on its own worker. Scope-level failures are recorded and
 * excluded from rollups; reconciliation and configuration failures abort
 * the run. A single sequential reducer merges the per-scope results.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "popaccess.hpp"
#include "AccessAggregator.hpp"
#include "CellClassifier.hpp"
#include "DistanceField.hpp"
#include "FeatureSet.hpp"
#include "PopulationGrid.hpp"
#include "RegionRollup.hpp"
#include "StageTracker.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Table layout and retention options for one scope analysis
 */
struct ScopeSettings {
    std::vector<double> thresholds_km;
    std::vector<double> gap_thresholds_km = {1.0, 5.0};
    bool keep_records = false;     // cell detail output
    bool keep_distances = false;   // distance raster output
};

/**
 * @brief Result of one scope plus the intermediate products kept on request
 */
struct ScopeAnalysis {
    ScopeResult result;
    std::vector<CellRecord> records;
    DistanceField distances;
};

/**
 * @brief Run Rasterize through Aggregate on one scope grid
 *
 * Features in another CRS are reprojected to the grid CRS first.
 * Cells with no data are counted, cells the classifier rejects are counted
 * separately, and zero-population cells are left out of every table.
 * The result and every cell record carry the scope's country and region.
 *
 * @param tracker Optional stage tracker; Load must already be complete
 * @throws NoReferenceFeaturesError if no feature falls inside the grid
 * @throws ReconciliationError if the resulting tables do not reconcile
 */
ScopeAnalysis analyze_scope(const RasterGrid& grid, const FeatureSet& features,
                            const ScopeKey& scope, const UrbanRuralClassifier& classifier,
                            const DistanceBands& bands, const ScopeSettings& settings,
                            StageTracker* tracker = nullptr);

/**
 * @brief Outcome of a whole run
 */
struct PipelineSummary {
    std::vector<ScopeResult> scopes;
    std::vector<ExcludedScope> excluded;
    RollupReport report;
    std::vector<std::string> output_files;
    bool outputs_complete = true;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Coordinates loading, parallel scope analysis, rollup and output
 */
class AccessPipeline {
public:
    /**
     * @throws ConfigurationError if the classifier, bands or thresholds are invalid
     */
    explicit AccessPipeline(const AnalysisConfig& config);
    ~AccessPipeline();

    AccessPipeline(const AccessPipeline&) = delete;
    AccessPipeline& operator=(const AccessPipeline&) = delete;

    /**
     * @brief Analyze every scope and write all outputs
     * @throws AccessError for failures that are not confined to one scope
     */
    PipelineSummary run();

    /**
     * @brief Rebuild region rollups from stored per-scope documents
     * @throws FormatError if the stored documents cannot be read
     */
    PipelineSummary run_rollup_only(const std::string& directory);

    const AnalysisConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace popaccess
