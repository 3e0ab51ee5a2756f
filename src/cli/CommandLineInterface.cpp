/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "SimpleCommandLineParser.hpp"
#include "AccessErrors.hpp"
#include "version.h"
#include <iostream>
#include <sstream>

namespace popaccess {

namespace {

std::string join(const std::vector<double>& values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    return oss.str();
}

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += values[i];
    }
    return out;
}

} // anonymous namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("popaccess",
        "Measures how far every populated cell of a population grid lies from the\n"
        "nearest facility or road, splits population into urban and rural classes,\n"
        "and reports cumulative coverage and distance bands per country, region and\n"
        "continent.");

    // Configuration file option
    parser.add_option("config", "c", "Path to JSON configuration file");

    // Input options
    parser.add_option("population", "p", "Population raster");
    parser.add_option("band", "", "Raster band index or description");
    parser.add_option("nodata", "", "No-data override value");
    parser.add_option("features", "f", "Reference feature source");
    parser.add_option("feature-layer", "", "Layer name in the feature source");
    parser.add_option("filter-field", "", "Feature attribute used for class filtering");
    parser.add_option("filter-values", "", "Accepted filter attribute values (comma-separated)");

    // Scope options
    parser.add_option("boundaries", "b", "Boundary file or directory");
    parser.add_option("boundary-name-field", "", "Boundary attribute holding the country name");
    parser.add_option("country-rasters", "", "Directory of per-country rasters");
    parser.add_option("regions", "r", "Region definition JSON");
    parser.add_option("rollup-only", "", "Directory with stored per-country results");

    // Classification options
    parser.add_option("policy", "", "Urban/rural policy: sign or threshold");
    parser.add_option("threshold", "t", "Urban density threshold");
    parser.add_option("bands", "", "Distance band breakpoints in km");
    parser.add_option("thresholds", "", "Cumulative thresholds in km");
    parser.add_option("gap-thresholds", "", "Coverage gap thresholds in km");

    // Output options
    parser.add_option("output-dir", "o", "Output directory");
    parser.add_option("base-name", "", "Base name for output files");
    parser.add_option("output-formats", "", "Output formats: json,csv (comma-separated)");
    parser.add_flag("cell-detail", "", "Write grid-level CSV detail");
    parser.add_flag("distance-raster", "", "Write distance field GeoTIFFs");
    parser.add_option("block-factor", "", "Block aggregation factor");

    // Processing, logging and utility options
    parser.add_option("threads", "j", "Worker thread limit");
    parser.add_option("log-level", "", "Logging level: 1=ERROR ... 6=TRACE");
    parser.add_option("log-config", "", "Per-facility logging levels");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_option("create-config", "", "Create default configuration file at path");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        exit_code_ = 1;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "popaccess v" << POPACCESS_VERSION_STRING << std::endl;
        std::cout << "Population accessibility by distance to facilities and roads" << std::endl;
        std::cout << "Built with GDAL, TBB, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
        } else {
            std::cout << "Created default configuration file: " << config_path.value() << std::endl;
            exit_code_ = 0;
        }
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    try {
        parse_all_options(parser);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        exit_code_ = 1;
        return false;
    }

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Numeric options must parse completely
    auto number = [&parser](const std::string& name) -> std::optional<double> {
        auto value = parser.get(name);
        if (!value) return std::nullopt;
        auto parsed = parser.get_as<double>(name);
        if (!parsed) {
            throw ConfigurationError("--" + name + " expects a number, got '" + *value + "'");
        }
        return parsed;
    };
    auto integer = [&parser](const std::string& name) -> std::optional<int> {
        auto value = parser.get(name);
        if (!value) return std::nullopt;
        auto parsed = parser.get_as<int>(name);
        if (!parsed) {
            throw ConfigurationError("--" + name + " expects an integer, got '" + *value + "'");
        }
        return parsed;
    };

    // Input options
    if (auto value = parser.get("population")) config_.population_raster = value.value();
    if (auto value = parser.get("band")) config_.population_band = value.value();
    if (auto value = number("nodata")) config_.nodata_override = value;
    if (auto value = parser.get("features")) config_.features_path = value.value();
    if (auto value = parser.get("feature-layer")) config_.feature_layer = value.value();
    if (auto value = parser.get("filter-field")) config_.feature_filter_field = value.value();
    if (auto value = parser.get("filter-values")) {
        config_.feature_filter_values = ConfigurationManager::parse_string_list(value.value());
    }

    // Scope options
    if (auto value = parser.get("boundaries")) config_.boundaries_path = value.value();
    if (auto value = parser.get("boundary-name-field")) config_.boundary_name_field = value.value();
    if (auto value = parser.get("country-rasters")) config_.country_rasters_dir = value.value();
    if (auto value = parser.get("regions")) config_.regions_file = value.value();
    if (auto value = parser.get("rollup-only")) config_.rollup_only_dir = value.value();

    // Classification options
    if (auto value = parser.get("policy")) {
        config_.classification_policy = ConfigurationManager::parse_policy(value.value());
    }
    if (auto value = number("threshold")) config_.density_threshold = value;
    if (auto value = parser.get("bands")) {
        config_.distance_bands_km = ConfigurationManager::parse_distance_list(value.value());
    }
    if (auto value = parser.get("thresholds")) {
        config_.cumulative_thresholds_km = ConfigurationManager::parse_distance_list(value.value());
    }
    if (auto value = parser.get("gap-thresholds")) {
        config_.gap_thresholds_km = ConfigurationManager::parse_distance_list(value.value());
    }

    // Output options
    if (auto value = parser.get("output-dir")) {
        std::string path = value.value();
        // Remove trailing slash if present for consistency
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        config_.output_directory = path;
    }
    if (auto value = parser.get("base-name")) config_.base_name = value.value();
    if (auto value = parser.get("output-formats")) {
        config_.output_formats = ConfigurationManager::parse_string_list(value.value());
    }
    if (parser.get_flag("cell-detail")) config_.write_cell_detail = true;
    if (parser.get_flag("distance-raster")) config_.write_distance_raster = true;
    if (auto value = integer("block-factor")) config_.block_factor = *value;

    // Processing and logging
    if (auto value = integer("threads")) config_.num_threads = *value;
    if (auto value = integer("log-level")) config_.log_level = *value;
    if (auto value = parser.get("log-config")) config_.log_config = value.value();
    if (auto value = parser.get("log-file")) config_.log_file = value.value();
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager(AnalysisConfig{});
    return manager.save_to_file(filename);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager(config_);
    if (!manager.load_from_file(filename)) {
        return false;
    }
    config_ = manager.to_analysis_config();
    return true;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    if (!config_.rollup_only_dir.empty()) {
        std::cout << "Rollup only from: " << config_.rollup_only_dir << "\n";
    } else {
        std::cout << "Population raster: "
                  << (config_.population_raster.empty() ? "(per-country rasters)" : config_.population_raster)
                  << " band " << config_.population_band << "\n";
        if (!config_.country_rasters_dir.empty()) {
            std::cout << "Country rasters: " << config_.country_rasters_dir << "\n";
        }
        if (!config_.boundaries_path.empty()) {
            std::cout << "Boundaries: " << config_.boundaries_path
                      << " (name field '" << config_.boundary_name_field << "')\n";
        }
        std::cout << "Features: " << config_.features_path;
        if (!config_.feature_filter_field.empty()) {
            std::cout << " where " << config_.feature_filter_field << " in "
                      << join(config_.feature_filter_values);
        }
        std::cout << "\n";
    }
    std::cout << "Regions: " << (config_.regions_file.empty() ? "(built-in)" : config_.regions_file) << "\n";
    if (config_.classification_policy == ClassificationPolicy::SIGN) {
        std::cout << "Classification: sign\n";
    } else {
        std::cout << "Classification: threshold " << config_.effective_threshold() << "\n";
    }
    std::cout << "Bands (km): " << join(config_.distance_bands_km) << "\n";
    std::cout << "Cumulative thresholds (km): "
              << (config_.cumulative_thresholds_km.empty() ? "1:100:1" : join(config_.cumulative_thresholds_km))
              << "\n";
    std::cout << "Gap thresholds (km): " << join(config_.gap_thresholds_km) << "\n";
    std::cout << "Output directory: " << config_.output_directory << "\n";
    std::cout << "Base name: " << config_.base_name << "\n";
    std::cout << "Formats: " << join(config_.output_formats) << "\n";
    std::cout << "Threads: " << (config_.num_threads > 0 ? std::to_string(config_.num_threads) : "auto") << "\n";
    std::cout << "===================\n\n";
}

} // namespace popaccess
