/**
 * @file AccessPipeline.cpp
 * @brief Implementation of the scope pipeline and the sequential reducer
 */

#include "AccessPipeline.hpp"
#include "AccessErrors.hpp"
#include "BlockAggregator.hpp"
#include "BoundaryResolver.hpp"
#include "ExecutionPolicies.hpp"
#include "FeatureRasterizer.hpp"
#include "GdalSupport.hpp"
#include "Logger.hpp"
#include "../export/CsvExporter.hpp"
#include "../export/GeoTIFFExporter.hpp"
#include "../export/ResultJsonWriter.hpp"
#include <tbb/global_control.h>
#include <filesystem>
#include <optional>
#include <sstream>

namespace popaccess {

namespace fs = std::filesystem;

// ============================================================================
// Single-scope analysis
// ============================================================================

ScopeAnalysis analyze_scope(const RasterGrid& grid, const FeatureSet& features,
                            const ScopeKey& scope, const UrbanRuralClassifier& classifier,
                            const DistanceBands& bands, const ScopeSettings& settings,
                            StageTracker* tracker) {
    Logger logger("AccessPipeline");
    const std::string& name = scope.country;
    auto key = std::make_shared<const ScopeKey>(scope);

    auto start = [tracker](PipelineStage stage) { if (tracker) tracker->startStage(stage); };
    auto complete = [tracker](PipelineStage stage) { if (tracker) tracker->completeStage(stage); };

    ScopeAnalysis analysis;

    // Rasterize
    start(PipelineStage::RASTERIZE);
    FeatureSet reprojected;
    const FeatureSet* source = &features;
    if (!same_crs(features.crs_wkt(), grid.crs_wkt())) {
        logger.scoped(LogLevel::DEBUG, name, "Reprojecting features to grid CRS");
        reprojected = features.reproject(grid.crs_wkt());
        source = &reprojected;
    }
    OccupancyGrid occupancy = rasterize_features(*source, grid);
    FeaturePlacement placement = tally_feature_placement(*source, grid, classifier);
    if (tracker) {
        tracker->addStageData(PipelineStage::RASTERIZE, "occupied_cells",
                              std::to_string(occupancy.occupied_count()));
    }
    complete(PipelineStage::RASTERIZE);

    // Distance
    start(PipelineStage::DISTANCE);
    DistanceField distances = compute_distances(occupancy, grid.cell_size_x_km(), grid.cell_size_y_km());
    complete(PipelineStage::DISTANCE);

    // Classify
    start(PipelineStage::CLASSIFY);
    std::vector<CellRecord> records;
    size_t nodata_cells = 0;
    size_t rejected_cells = 0;
    for (size_t r = 0; r < grid.rows(); ++r) {
        for (size_t c = 0; c < grid.cols(); ++c) {
            const double value = grid.at(r, c);
            if (grid.is_nodata(value)) {
                ++nodata_cells;
                continue;
            }
            if (classifier.rejects(value)) {
                ++rejected_cells;
                continue;
            }
            auto classified = classifier.classify(value);
            if (!classified) continue;

            CellRecord record;
            record.row = r;
            record.col = c;
            record.population = classified->population;
            record.urban_class = classified->urban_class;
            record.distance_km = distances.at(r, c);
            record.band = bands.band_of(record.distance_km);
            record.scope = key;
            records.push_back(record);
        }
    }
    if (rejected_cells > 0) {
        logger.scoped(LogLevel::WARNING, name,
                      std::to_string(rejected_cells) + " cells hold values the classifier rejects");
    }
    complete(PipelineStage::CLASSIFY);

    // Aggregate
    start(PipelineStage::AGGREGATE);
    ScopeAccumulator accumulator(name, bands, settings.thresholds_km, settings.gap_thresholds_km);
    for (const auto& record : records) {
        accumulator.add(record);
    }
    accumulator.count_nodata(nodata_cells);
    accumulator.count_rejected(rejected_cells);
    analysis.result = accumulator.finish();
    analysis.result.region = scope.region;
    analysis.result.occupied_cells = occupancy.occupied_count();
    analysis.result.placement = placement;
    complete(PipelineStage::AGGREGATE);

    std::ostringstream msg;
    msg << records.size() << " populated cells, population "
        << static_cast<long long>(std::llround(analysis.result.table.total.value()))
        << ", max distance " << format_km(analysis.result.max_distance_km) << " km";
    logger.scoped(LogLevel::INFO, name, msg.str());

    if (settings.keep_records) {
        analysis.records = std::move(records);
    }
    if (settings.keep_distances) {
        analysis.distances = std::move(distances);
    }
    return analysis;
}

// ============================================================================
// AccessPipeline::Impl - Private implementation
// ============================================================================

class AccessPipeline::Impl {
public:
    explicit Impl(const AnalysisConfig& config)
        : config_(config),
          logger_("AccessPipeline"),
          classifier_(make_classifier(config)),
          bands_(config.distance_bands_km) {
        settings_.thresholds_km = config_.effective_cumulative_thresholds();
        settings_.gap_thresholds_km = config_.gap_thresholds_km;
        settings_.keep_records = config_.write_cell_detail;
        settings_.keep_distances = config_.write_distance_raster;

        validate_thresholds(settings_.thresholds_km, "Cumulative thresholds");
        if (!settings_.gap_thresholds_km.empty()) {
            validate_thresholds(settings_.gap_thresholds_km, "Gap thresholds");
            validate_gap_thresholds(settings_.gap_thresholds_km, settings_.thresholds_km);
        }

        regions_ = config_.regions_file.empty()
            ? RegionDefinitions::african_defaults()
            : RegionDefinitions::load(config_.regions_file);
    }

    PipelineSummary run() {
        auto start_time = std::chrono::steady_clock::now();
        std::optional<tbb::global_control> thread_limit;
        if (config_.num_threads > 0) {
            thread_limit.emplace(tbb::global_control::max_allowed_parallelism,
                                 static_cast<size_t>(config_.num_threads));
        }

        prepare_output_directory();

        logger_.info("Classification: " + classifier_->describe());
        load_reference_features();
        std::vector<ScopeJob> jobs = build_jobs();
        logger_.info("Analyzing " + std::to_string(jobs.size()) + " scopes");

        // Each worker writes only its own slot
        std::vector<ScopeOutcome> slots(jobs.size());
        for_each_index(ParallelPolicy{}, 0, jobs.size(), [&](size_t i) {
            slots[i] = run_scope(jobs[i]);
        });

        // Sequential reducer
        PipelineSummary summary;
        summary.excluded = catalog_.failures;
        for (auto& slot : slots) {
            if (slot.result) {
                summary.scopes.push_back(std::move(*slot.result));
            } else if (slot.failure) {
                summary.excluded.push_back(std::move(*slot.failure));
            }
            summary.outputs_complete &= slot.outputs_complete;
            summary.output_files.insert(summary.output_files.end(),
                                        slot.output_files.begin(), slot.output_files.end());
        }

        logger_.info(std::to_string(summary.scopes.size()) + " scopes analyzed, " +
                     std::to_string(summary.excluded.size()) + " excluded");
        for (const auto& excluded : summary.excluded) {
            logger_.scoped(LogLevel::WARNING, excluded.name,
                           std::string("excluded (") + to_string(excluded.kind) + ")");
        }

        summary.report = rollup_regions(summary.scopes, regions_, summary.excluded);
        emit_combined(summary, true);

        if (config_.block_factor > 0) {
            emit_blocks(summary);
        }

        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return summary;
    }

    PipelineSummary run_rollup_only(const std::string& directory) {
        auto start_time = std::chrono::steady_clock::now();
        prepare_output_directory();

        PipelineSummary summary;
        summary.scopes = read_scope_directory(directory);
        for (auto& scope : summary.scopes) {
            scope.region = regions_.region_of(scope.name).value_or("");

            // Stored tables keep the threshold list of the run that wrote them
            std::vector<double> stored;
            for (const auto& row : scope.table.cumulative) {
                stored.push_back(row.threshold_km);
            }
            try {
                validate_gap_thresholds(settings_.gap_thresholds_km, stored);
            } catch (const ConfigurationError&) {
                logger_.scoped(LogLevel::ERROR, scope.name,
                               "stored cumulative thresholds lack a gap threshold");
                throw;
            }
        }
        summary.report = rollup_regions(summary.scopes, regions_);
        emit_combined(summary, false);

        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return summary;
    }

    const AnalysisConfig& get_config() const { return config_; }

private:
    struct ScopeJob {
        std::string name;
        const ScopeBoundary* boundary = nullptr;
        std::string raster_path;
        std::string file_stem;
    };

    struct ScopeOutcome {
        std::optional<ScopeResult> result;
        std::optional<ExcludedScope> failure;
        std::vector<std::string> output_files;
        bool outputs_complete = true;
    };

    AnalysisConfig config_;
    Logger logger_;
    std::unique_ptr<UrbanRuralClassifier> classifier_;
    DistanceBands bands_;
    ScopeSettings settings_;
    RegionDefinitions regions_;

    FeatureSet features_;
    RasterGrid continental_;
    BoundaryCatalog catalog_;

    void prepare_output_directory() const {
        std::error_code ec;
        fs::create_directories(fs::path(config_.output_directory) / "scopes", ec);
        if (ec) {
            throw ConfigurationError("Cannot create output directory " + config_.output_directory +
                                     ": " + ec.message());
        }
    }

    void load_reference_features() {
        features_ = load_features(config_.features_path, config_.feature_layer);
        if (!config_.feature_filter_field.empty()) {
            const size_t before = features_.size();
            features_ = features_.filter(config_.feature_filter_field, config_.feature_filter_values);
            logger_.info("Feature filter " + config_.feature_filter_field + " kept " +
                         std::to_string(features_.size()) + " of " + std::to_string(before));
        }
        if (features_.empty()) {
            logger_.warning("No reference features loaded; every scope will be excluded");
        }
    }

    std::vector<ScopeJob> build_jobs() {
        std::vector<ScopeJob> jobs;

        if (!config_.country_rasters_dir.empty()) {
            for (const auto& [name, path] : list_country_rasters(config_.country_rasters_dir)) {
                jobs.push_back({name, nullptr, path, ""});
            }
            assign_file_stems(jobs);
            return jobs;
        }

        continental_ = load_raster(config_.population_raster, config_.population_band,
                                   config_.nodata_override);

        if (!config_.boundaries_path.empty()) {
            catalog_ = load_boundaries(config_.boundaries_path, config_.boundary_name_field);
            for (const auto& boundary : catalog_.boundaries) {
                jobs.push_back({boundary.name, &boundary, "", ""});
            }
        } else {
            jobs.push_back({fs::path(config_.population_raster).stem().string(), nullptr, "", ""});
        }
        assign_file_stems(jobs);
        return jobs;
    }

    // Scope names that map to the same safe stem would otherwise share output files
    static void assign_file_stems(std::vector<ScopeJob>& jobs) {
        std::vector<std::string> names;
        names.reserve(jobs.size());
        for (const auto& job : jobs) names.push_back(job.name);
        const auto stems = unique_file_stems(names);
        for (size_t i = 0; i < jobs.size(); ++i) jobs[i].file_stem = stems[i];
    }

    ScopeOutcome run_scope(const ScopeJob& job) const {
        StageTracker tracker(job.name);
        ScopeOutcome outcome;

        try {
            tracker.startStage(PipelineStage::LOAD);
            RasterGrid own_grid;
            const RasterGrid* grid = &continental_;
            std::optional<BoundaryDiagnostics> diagnostics;
            if (job.boundary) {
                ResolvedScope resolved = resolve_scope(continental_, *job.boundary);
                own_grid = std::move(resolved.grid);
                diagnostics = resolved.diagnostics;
                grid = &own_grid;
            } else if (!job.raster_path.empty()) {
                own_grid = load_raster(job.raster_path, config_.population_band, config_.nodata_override);
                grid = &own_grid;
            }
            tracker.addStageData(PipelineStage::LOAD, "cells", std::to_string(grid->size()));
            tracker.completeStage(PipelineStage::LOAD);

            const ScopeKey key{job.name, regions_.region_of(job.name).value_or("")};
            ScopeAnalysis analysis = analyze_scope(*grid, features_, key, *classifier_,
                                                   bands_, settings_, &tracker);
            analysis.result.boundary = diagnostics;

            tracker.startStage(PipelineStage::EMIT);
            emit_scope(analysis, *grid, job.file_stem, tracker, outcome);
            tracker.completeStage(PipelineStage::EMIT);

            outcome.result = std::move(analysis.result);
        } catch (const AccessError& e) {
            tracker.failOpenStage(e.what());
            if (!e.is_scope_level()) {
                throw;
            }
            logger_.scoped(LogLevel::ERROR, job.name, e.what());
            outcome.failure = ExcludedScope{job.name, e.kind(), e.what()};
        }

        tracker.logSummary();
        return outcome;
    }

    void emit_scope(const ScopeAnalysis& analysis, const RasterGrid& grid, const std::string& file_stem,
                    StageTracker& tracker, ScopeOutcome& outcome) const {
        const ScopeResult& result = analysis.result;
        const std::string stem = config_.base_name + "_" + file_stem;

        auto record = [&](bool ok, const std::string& path, const std::string& format) {
            if (ok) {
                tracker.trackOutputFile(path, format);
                outcome.output_files.push_back(path);
            } else {
                outcome.outputs_complete = false;
            }
        };

        if (config_.wants_format("json")) {
            ResultJsonWriter writer(config_.output_directory, config_.base_name);
            std::string path;
            bool ok = writer.write_scope(result, file_stem, &path);
            record(ok, path, "json");
        }
        if (config_.write_cell_detail) {
            CsvExporter csv;
            const std::string path = (fs::path(config_.output_directory) / (stem + "_cells.csv")).string();
            record(csv.export_cell_detail(analysis.records, grid, path), path, "csv");
        }
        if (config_.write_distance_raster) {
            GeoTIFFExporter geotiff;
            const std::string path = (fs::path(config_.output_directory) / (stem + "_distance.tif")).string();
            record(geotiff.export_distance_field(analysis.distances, grid, path), path, "geotiff");
        }
    }

    RunMetadata metadata() const {
        RunMetadata meta;
        meta.version = version_string();
        meta.population_raster = config_.country_rasters_dir.empty()
            ? config_.population_raster : config_.country_rasters_dir;
        meta.features_path = config_.features_path;
        meta.classification = classifier_->describe();
        meta.band_labels = bands_.labels();
        meta.gap_thresholds_km = settings_.gap_thresholds_km;
        return meta;
    }

    void emit_combined(PipelineSummary& summary, bool include_countries) const {
        const RunMetadata meta = metadata();
        const fs::path out(config_.output_directory);

        auto record = [&summary](bool ok, const std::string& path) {
            if (ok) {
                summary.output_files.push_back(path);
            } else {
                summary.outputs_complete = false;
            }
        };

        if (config_.wants_format("json")) {
            ResultJsonWriter writer(config_.output_directory, config_.base_name);
            std::string path;
            // In rollup-only mode the scope documents already exist
            if (include_countries) {
                record(writer.write_countries(summary.scopes, meta, &path), path);
            }
            record(writer.write_regions(summary.report, meta, &path), path);
        }
        if (config_.wants_format("csv")) {
            CsvExporter csv;
            const std::string summary_path = (out / (config_.base_name + "_summary.csv")).string();
            const std::string bands_path = (out / (config_.base_name + "_bands.csv")).string();
            record(csv.export_summary(summary.scopes, summary.report, settings_.gap_thresholds_km,
                                      summary_path), summary_path);
            record(csv.export_bands(summary.scopes, summary.report, bands_path), bands_path);
        }
    }

    void emit_blocks(PipelineSummary& summary) const {
        if (continental_.empty()) {
            logger_.warning("Block aggregation needs a population raster, skipped");
            return;
        }
        BlockSummary blocks = aggregate_blocks(continental_, config_.block_factor, *classifier_);
        GeoTIFFExporter geotiff;
        const std::string path = (fs::path(config_.output_directory) /
                                  (config_.base_name + "_blocks.tif")).string();
        if (geotiff.export_block_summary(blocks, path)) {
            summary.output_files.push_back(path);
        } else {
            summary.outputs_complete = false;
        }
    }
};

// ============================================================================
// AccessPipeline Public Interface
// ============================================================================

AccessPipeline::AccessPipeline(const AnalysisConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

AccessPipeline::~AccessPipeline() = default;

PipelineSummary AccessPipeline::run() {
    return impl_->run();
}

PipelineSummary AccessPipeline::run_rollup_only(const std::string& directory) {
    return impl_->run_rollup_only(directory);
}

const AnalysisConfig& AccessPipeline::get_config() const {
    return impl_->get_config();
}

} // namespace popaccess
