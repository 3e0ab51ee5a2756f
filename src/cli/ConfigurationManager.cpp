/**
 * @file ConfigurationManager.cpp
 * @brief JSON configuration management for accessibility runs
 */

#include "ConfigurationManager.hpp"
#include "AccessErrors.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace popaccess {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

double parse_number(const std::string& token, const std::string& context) {
    try {
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw ConfigurationError("'" + token + "' is not a number in " + context);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("'" + token + "' is not a number in " + context);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("'" + token + "' is out of range in " + context);
    }
}

std::vector<double> distances_from_json(const json& value, const std::string& key) {
    if (value.is_string()) {
        return ConfigurationManager::parse_distance_list(value.get<std::string>());
    }
    if (!value.is_array()) {
        throw ConfigurationError("'" + key + "' must be a list of kilometres or a string");
    }
    std::vector<double> distances;
    for (const auto& item : value) {
        if (!item.is_number()) {
            throw ConfigurationError("'" + key + "' contains a non-numeric entry");
        }
        distances.push_back(item.get<double>());
    }
    return distances;
}

std::vector<std::string> strings_from_json(const json& value, const std::string& key) {
    if (value.is_string()) {
        return ConfigurationManager::parse_string_list(value.get<std::string>());
    }
    if (!value.is_array()) {
        throw ConfigurationError("'" + key + "' must be a list or a comma-separated string");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            items.push_back(std::to_string(item.get<long long>()));
        } else {
            throw ConfigurationError("'" + key + "' entries must be strings or integers");
        }
    }
    return items;
}

void apply_json(const json& config, AnalysisConfig& target) {
    if (!config.is_object()) {
        throw ConfigurationError("configuration document must be a JSON object");
    }

    auto set_string = [&config](const char* key, std::string& field) {
        if (config.contains(key) && !config[key].is_null()) field = config[key].get<std::string>();
    };
    auto set_optional_number = [&config](const char* key, std::optional<double>& field) {
        if (!config.contains(key)) return;
        if (config[key].is_null()) {
            field.reset();
        } else {
            field = config[key].get<double>();
        }
    };

    set_string("population_raster", target.population_raster);
    if (config.contains("population_band")) {
        // Accept 2 as well as "2" or "population_count"
        const auto& band = config["population_band"];
        target.population_band = band.is_number_integer()
            ? std::to_string(band.get<int>())
            : band.get<std::string>();
    }
    set_optional_number("nodata", target.nodata_override);

    set_string("features", target.features_path);
    set_string("feature_layer", target.feature_layer);
    set_string("feature_filter_field", target.feature_filter_field);
    if (config.contains("feature_filter_values")) {
        target.feature_filter_values = strings_from_json(config["feature_filter_values"],
                                                         "feature_filter_values");
    }

    set_string("boundaries", target.boundaries_path);
    set_string("boundary_name_field", target.boundary_name_field);
    set_string("country_rasters", target.country_rasters_dir);
    set_string("regions_file", target.regions_file);

    if (config.contains("classification_policy")) {
        target.classification_policy =
            ConfigurationManager::parse_policy(config["classification_policy"].get<std::string>());
    }
    set_optional_number("density_threshold", target.density_threshold);

    if (config.contains("distance_bands_km")) {
        target.distance_bands_km = distances_from_json(config["distance_bands_km"], "distance_bands_km");
    }
    if (config.contains("cumulative_thresholds_km")) {
        target.cumulative_thresholds_km =
            distances_from_json(config["cumulative_thresholds_km"], "cumulative_thresholds_km");
    }
    if (config.contains("gap_thresholds_km")) {
        target.gap_thresholds_km = distances_from_json(config["gap_thresholds_km"], "gap_thresholds_km");
    }

    set_string("output_dir", target.output_directory);
    set_string("base_name", target.base_name);
    if (config.contains("output_formats")) {
        target.output_formats = strings_from_json(config["output_formats"], "output_formats");
    }
    if (config.contains("write_cell_detail")) target.write_cell_detail = config["write_cell_detail"].get<bool>();
    if (config.contains("write_distance_raster")) {
        target.write_distance_raster = config["write_distance_raster"].get<bool>();
    }
    if (config.contains("block_factor")) target.block_factor = config["block_factor"].get<int>();
    if (config.contains("threads")) target.num_threads = config["threads"].get<int>();

    if (config.contains("log_level")) target.log_level = config["log_level"].get<int>();
    set_string("log_file", target.log_file);
    set_string("log_config", target.log_config);
}

} // anonymous namespace

std::vector<double> ConfigurationManager::parse_distance_list(const std::string& text) {
    const std::string list_text = trim(text);

    if (list_text.find(':') != std::string::npos) {
        std::vector<std::string> parts;
        std::istringstream iss(list_text);
        std::string part;
        while (std::getline(iss, part, ':')) {
            parts.push_back(trim(part));
        }
        if (parts.size() != 3) {
            throw ConfigurationError("range '" + list_text + "' must have the form start:stop:step");
        }
        const double start = parse_number(parts[0], "range '" + list_text + "'");
        const double stop = parse_number(parts[1], "range '" + list_text + "'");
        const double step = parse_number(parts[2], "range '" + list_text + "'");
        if (!(step > 0.0) || stop < start) {
            throw ConfigurationError("range '" + list_text + "' is empty");
        }

        const long count = static_cast<long>(std::floor((stop - start) / step + 1e-9)) + 1;
        std::vector<double> values;
        values.reserve(static_cast<size_t>(count));
        for (long k = 0; k < count; ++k) {
            values.push_back(start + static_cast<double>(k) * step);
        }
        return values;
    }

    std::vector<double> values;
    for (const auto& token : parse_string_list(list_text)) {
        values.push_back(parse_number(token, "list '" + list_text + "'"));
    }
    return values;
}

std::vector<std::string> ConfigurationManager::parse_string_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream iss(text);
    std::string item;

    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

ClassificationPolicy ConfigurationManager::parse_policy(const std::string& text) {
    if (text == "sign") return ClassificationPolicy::SIGN;
    if (text == "threshold") return ClassificationPolicy::THRESHOLD;
    throw ConfigurationError("unknown classification policy '" + text + "' (use sign or threshold)");
}

void ConfigurationManager::load_from_string(const std::string& text) {
    AnalysisConfig updated = config_;
    try {
        json config = json::parse(text);
        apply_json(config, updated);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid configuration JSON: ") + e.what());
    }
    config_ = updated;
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    Logger logger("ConfigurationManager");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not open config file: " + filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        load_from_string(buffer.str());
    } catch (const ConfigurationError& e) {
        logger.error(std::string(e.what()) + " (" + filename + ")");
        return false;
    }

    logger.detailed("Loaded configuration from " + filename);
    return true;
}

std::string ConfigurationManager::to_json_string() const {
    json config;
    config["population_raster"] = config_.population_raster;
    config["population_band"] = config_.population_band;
    config["nodata"] = config_.nodata_override ? json(*config_.nodata_override) : json(nullptr);
    config["features"] = config_.features_path;
    config["feature_layer"] = config_.feature_layer;
    config["feature_filter_field"] = config_.feature_filter_field;
    config["feature_filter_values"] = config_.feature_filter_values;
    config["boundaries"] = config_.boundaries_path;
    config["boundary_name_field"] = config_.boundary_name_field;
    config["country_rasters"] = config_.country_rasters_dir;
    config["regions_file"] = config_.regions_file;
    config["classification_policy"] =
        config_.classification_policy == ClassificationPolicy::SIGN ? "sign" : "threshold";
    config["density_threshold"] =
        config_.density_threshold ? json(*config_.density_threshold) : json(nullptr);
    config["distance_bands_km"] = config_.distance_bands_km;
    config["cumulative_thresholds_km"] = config_.cumulative_thresholds_km;
    config["gap_thresholds_km"] = config_.gap_thresholds_km;
    config["output_dir"] = config_.output_directory;
    config["base_name"] = config_.base_name;
    config["output_formats"] = config_.output_formats;
    config["write_cell_detail"] = config_.write_cell_detail;
    config["write_distance_raster"] = config_.write_distance_raster;
    config["block_factor"] = config_.block_factor;
    config["threads"] = config_.num_threads;
    config["log_level"] = config_.log_level;
    config["log_file"] = config_.log_file;
    config["log_config"] = config_.log_config;
    return config.dump(2);
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger("ConfigurationManager").error("Could not create config file: " + filename);
        return false;
    }

    file << to_json_string() << std::endl;
    return static_cast<bool>(file);
}

} // namespace popaccess
