/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "AccessErrors.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace popaccess {

namespace {

std::string join_numbers(const std::vector<double>& values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    return oss.str();
}

} // anonymous namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid or contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const AnalysisConfig& config, bool check_files) const {
    ValidationResult result;
    result.is_valid = true;

    auto add = [&result](const ParameterConflict& conflict) {
        result.conflicts.push_back(conflict);
        result.is_valid = false;
    };

    if (auto policy_conflict = check_classification_policy(config)) {
        add(*policy_conflict);
    }
    for (const auto& conflict : check_distance_lists(config)) {
        add(conflict);
    }
    for (const auto& conflict : check_scope_sources(config, check_files)) {
        add(conflict);
    }
    for (const auto& conflict : check_output_and_processing(config)) {
        add(conflict);
    }

    return result;
}

void InputValidator::validate_or_throw(const AnalysisConfig& config, bool check_files) const {
    ValidationResult result = validate(config, check_files);
    if (result.has_errors()) {
        throw ConfigurationError(result.format_error_message());
    }
}

std::optional<ParameterConflict> InputValidator::check_classification_policy(
    const AnalysisConfig& config) const {

    if (config.classification_policy == ClassificationPolicy::SIGN && config.density_threshold) {
        ParameterConflict conflict;
        conflict.description = "A density threshold cannot be combined with the sign policy";
        conflict.involved_params = {
            "--policy sign (grid is pre-classified by sign)",
            "--threshold " + std::to_string(*config.density_threshold)
        };
        conflict.suggestions = {
            "Remove --threshold to classify by the sign of each cell",
            "Use --policy threshold to classify a density grid"
        };
        return conflict;
    }

    if (config.classification_policy == ClassificationPolicy::THRESHOLD &&
        !(config.effective_threshold() > 0.0)) {
        ParameterConflict conflict;
        conflict.description = "Urban density threshold must be positive";
        conflict.involved_params = {"--threshold " + std::to_string(config.effective_threshold())};
        conflict.suggestions = {
            "Use --threshold " + std::to_string(static_cast<int>(kDefaultUrbanThreshold)) + " (default)"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_ascending(
    const std::vector<double>& values, const std::string& param, bool allow_empty) {

    if (values.empty()) {
        if (allow_empty) return std::nullopt;
        ParameterConflict conflict;
        conflict.description = "Distance list is empty";
        conflict.involved_params = {param};
        conflict.suggestions = {"Provide at least one distance in kilometres"};
        return conflict;
    }

    for (size_t i = 0; i < values.size(); ++i) {
        const bool positive = values[i] > 0.0 && std::isfinite(values[i]);
        const bool ascending = i == 0 || values[i] > values[i - 1];
        if (!positive || !ascending) {
            ParameterConflict conflict;
            conflict.description = positive
                ? "Distances must be strictly ascending"
                : "Distances must be positive";
            conflict.involved_params = {param + " " + join_numbers(values)};
            conflict.suggestions = {"Sort the list and remove duplicates and values <= 0"};
            return conflict;
        }
    }
    return std::nullopt;
}

std::vector<ParameterConflict> InputValidator::check_distance_lists(
    const AnalysisConfig& config) const {

    std::vector<ParameterConflict> conflicts;
    if (auto c = check_ascending(config.distance_bands_km, "--bands", false)) {
        conflicts.push_back(*c);
    }
    if (auto c = check_ascending(config.cumulative_thresholds_km, "--thresholds", true)) {
        conflicts.push_back(*c);
    }
    if (auto c = check_ascending(config.gap_thresholds_km, "--gap-thresholds", true)) {
        conflicts.push_back(*c);
    }
    if (!conflicts.empty()) {
        return conflicts;
    }

    // No-access residuals are only tabulated at cumulative thresholds
    const std::vector<double> cumulative = config.effective_cumulative_thresholds();
    std::vector<double> untabulated;
    for (double gap : config.gap_thresholds_km) {
        bool found = false;
        for (double t : cumulative) {
            if (std::fabs(t - gap) <= 1e-9 * std::max(1.0, std::fabs(t))) {
                found = true;
                break;
            }
        }
        if (!found) untabulated.push_back(gap);
    }
    if (!untabulated.empty()) {
        ParameterConflict conflict;
        conflict.description = "Gap thresholds must be among the cumulative thresholds";
        conflict.involved_params = {"--gap-thresholds " + join_numbers(config.gap_thresholds_km),
                                    config.cumulative_thresholds_km.empty()
                                        ? std::string("--thresholds (default 1:100:1)")
                                        : "--thresholds " + join_numbers(cumulative)};
        conflict.suggestions = {"Add " + join_numbers(untabulated) + " to --thresholds",
                                "Choose --gap-thresholds from the --thresholds list"};
        conflicts.push_back(conflict);
    }
    return conflicts;
}

std::vector<ParameterConflict> InputValidator::check_scope_sources(
    const AnalysisConfig& config, bool check_files) const {

    namespace fs = std::filesystem;
    std::vector<ParameterConflict> conflicts;

    auto missing_path = [&](const std::string& path, const std::string& param) {
        if (!check_files || path.empty()) return;
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            ParameterConflict conflict;
            conflict.description = "Input does not exist";
            conflict.involved_params = {param + " " + path};
            conflict.suggestions = {"Check the path and working directory"};
            conflicts.push_back(conflict);
        }
    };

    missing_path(config.regions_file, "--regions");

    if (!config.rollup_only_dir.empty()) {
        missing_path(config.rollup_only_dir, "--rollup-only");
        if (config.write_cell_detail || config.write_distance_raster || config.block_factor > 0) {
            ParameterConflict conflict;
            conflict.description = "Rollup-only mode reuses stored results and cannot produce grid outputs";
            conflict.involved_params = {"--rollup-only " + config.rollup_only_dir};
            if (config.write_cell_detail) conflict.involved_params.push_back("--cell-detail");
            if (config.write_distance_raster) conflict.involved_params.push_back("--distance-raster");
            if (config.block_factor > 0) {
                conflict.involved_params.push_back("--block-factor " + std::to_string(config.block_factor));
            }
            conflict.suggestions = {"Drop the grid output options, or run the full analysis"};
            conflicts.push_back(conflict);
        }
        return conflicts;
    }

    if (config.population_raster.empty() && config.country_rasters_dir.empty()) {
        ParameterConflict conflict;
        conflict.description = "No population data to analyze";
        conflict.involved_params = {"--population (not set)", "--country-rasters (not set)"};
        conflict.suggestions = {
            "Use --population with a continental raster (optionally with --boundaries)",
            "Use --country-rasters with a directory of per-country rasters",
            "Use --rollup-only to rebuild regions from earlier results"
        };
        conflicts.push_back(conflict);
    }

    if (!config.country_rasters_dir.empty() && !config.boundaries_path.empty()) {
        ParameterConflict conflict;
        conflict.description = "Scopes can come from boundaries or from per-country rasters, not both";
        conflict.involved_params = {"--boundaries " + config.boundaries_path,
                                    "--country-rasters " + config.country_rasters_dir};
        conflict.suggestions = {"Remove one of the two scope sources"};
        conflicts.push_back(conflict);
    }

    if (config.features_path.empty()) {
        ParameterConflict conflict;
        conflict.description = "No reference features to measure distance against";
        conflict.involved_params = {"--features (not set)"};
        conflict.suggestions = {"Use --features with a vector file of facilities or roads"};
        conflicts.push_back(conflict);
    }

    if (!config.feature_filter_field.empty() && config.feature_filter_values.empty()) {
        ParameterConflict conflict;
        conflict.description = "Feature filter field given without accepted values";
        conflict.involved_params = {"--filter-field " + config.feature_filter_field};
        conflict.suggestions = {"Add --filter-values, e.g. --filter-values 1,2"};
        conflicts.push_back(conflict);
    }

    missing_path(config.population_raster, "--population");
    missing_path(config.country_rasters_dir, "--country-rasters");
    missing_path(config.features_path, "--features");
    missing_path(config.boundaries_path, "--boundaries");
    return conflicts;
}

std::vector<ParameterConflict> InputValidator::check_output_and_processing(
    const AnalysisConfig& config) const {

    std::vector<ParameterConflict> conflicts;

    for (const auto& format : config.output_formats) {
        if (format != "json" && format != "csv") {
            ParameterConflict conflict;
            conflict.description = "Unsupported output format '" + format + "'";
            conflict.involved_params = {"--output-formats"};
            conflict.suggestions = {"Use json, csv or json,csv"};
            conflicts.push_back(conflict);
        }
    }

    if (config.base_name.empty()) {
        ParameterConflict conflict;
        conflict.description = "Output base name is empty";
        conflict.involved_params = {"--base-name"};
        conflict.suggestions = {"Use --base-name accessibility (default)"};
        conflicts.push_back(conflict);
    }

    if (config.block_factor < 0) {
        ParameterConflict conflict;
        conflict.description = "Block factor cannot be negative";
        conflict.involved_params = {"--block-factor " + std::to_string(config.block_factor)};
        conflict.suggestions = {"Use 0 to disable block aggregation, or a factor such as 10"};
        conflicts.push_back(conflict);
    }

    if (config.num_threads < 0) {
        ParameterConflict conflict;
        conflict.description = "Thread count cannot be negative";
        conflict.involved_params = {"--threads " + std::to_string(config.num_threads)};
        conflict.suggestions = {"Use 0 for the default, or a positive worker limit"};
        conflicts.push_back(conflict);
    }

    if (config.log_level < 1 || config.log_level > 6) {
        ParameterConflict conflict;
        conflict.description = "Log level must be between 1 and 6";
        conflict.involved_params = {"--log-level " + std::to_string(config.log_level)};
        conflict.suggestions = {"Use --log-level 3 (default)"};
        conflicts.push_back(conflict);
    }

    return conflicts;
}

} // namespace popaccess
