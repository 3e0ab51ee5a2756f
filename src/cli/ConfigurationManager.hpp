/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for accessibility runs
 */

#pragma once

#include "popaccess.hpp"
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Keys that are absent from a file keep their current value, so a file
 * only needs to list what differs from the defaults.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;
    explicit ConfigurationManager(const AnalysisConfig& config) : config_(config) {}

    /**
     * @brief Load configuration from file
     * @param filename Path to JSON configuration file
     * @return true if successful, false otherwise (errors are logged)
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from a JSON document
     * @throws ConfigurationError on malformed JSON, wrong value types or bad lists
     */
    void load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Serialize the configuration as an indented JSON document
     */
    std::string to_json_string() const;

    const AnalysisConfig& to_analysis_config() const { return config_; }
    void from_analysis_config(const AnalysisConfig& config) { config_ = config; }

    /**
     * @brief Parse a kilometre list: "1,2,5" or the range form "start:stop:step"
     *
     * The range includes stop when it is reached within rounding.
     *
     * @throws ConfigurationError if a value is not a number or the range is empty
     */
    static std::vector<double> parse_distance_list(const std::string& text);

    /**
     * @brief Split a comma-separated list, trimming whitespace and dropping empty items
     */
    static std::vector<std::string> parse_string_list(const std::string& text);

    /**
     * @throws ConfigurationError unless text is "sign" or "threshold"
     */
    static ClassificationPolicy parse_policy(const std::string& text);

private:
    AnalysisConfig config_;
};

} // namespace popaccess
