/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates an analysis configuration for contradictions and missing
 * inputs, and reports every conflict at once with suggested resolutions.
 */

#pragma once

#include "popaccess.hpp"
#include <string>
#include <vector>
#include <optional>

namespace popaccess {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates analysis configurations for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @param check_files Also require that input paths exist
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const AnalysisConfig& config, bool check_files = true) const;

    /**
     * @brief Validate and throw on the first report
     * @throws ConfigurationError listing every conflict
     */
    void validate_or_throw(const AnalysisConfig& config, bool check_files = true) const;

private:
    /**
     * @brief Sign policy with a density threshold, or a non-positive threshold
     */
    std::optional<ParameterConflict> check_classification_policy(
        const AnalysisConfig& config) const;

    /**
     * @brief Bands and thresholds must be positive and strictly ascending,
     *        and every gap threshold must be a cumulative threshold
     */
    std::vector<ParameterConflict> check_distance_lists(
        const AnalysisConfig& config) const;

    /**
     * @brief Exactly one way of defining scopes, and reference features to measure against
     */
    std::vector<ParameterConflict> check_scope_sources(
        const AnalysisConfig& config, bool check_files) const;

    std::vector<ParameterConflict> check_output_and_processing(
        const AnalysisConfig& config) const;

    static std::optional<ParameterConflict> check_ascending(
        const std::vector<double>& values, const std::string& param, bool allow_empty);
};

} // namespace popaccess
