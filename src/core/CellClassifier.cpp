/**
 * @file CellClassifier.cpp
 * @brief Implementation of classification policies and distance bands
 */

#include "CellClassifier.hpp"
#include "AccessErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace popaccess {

std::optional<Classification> SignClassifier::classify(double value) const {
    if (value > 0.0) {
        return Classification{UrbanClass::URBAN, value};
    }
    if (value < 0.0) {
        return Classification{UrbanClass::RURAL, -value};
    }
    return std::nullopt;
}

ThresholdClassifier::ThresholdClassifier(double threshold) : threshold_(threshold) {
    if (!(threshold > 0.0) || !std::isfinite(threshold)) {
        throw ConfigurationError("Urban density threshold must be a positive number, got " +
                                 format_km(threshold));
    }
}

std::optional<Classification> ThresholdClassifier::classify(double value) const {
    if (value <= 0.0) {
        return std::nullopt;
    }
    return Classification{value >= threshold_ ? UrbanClass::URBAN : UrbanClass::RURAL, value};
}

std::string ThresholdClassifier::describe() const {
    return "threshold (urban >= " + format_km(threshold_) + ")";
}

std::unique_ptr<UrbanRuralClassifier> make_classifier(const AnalysisConfig& config) {
    switch (config.classification_policy) {
        case ClassificationPolicy::SIGN:
            if (config.density_threshold.has_value()) {
                throw ConfigurationError(
                    "A density threshold cannot be combined with the sign classification policy");
            }
            return std::make_unique<SignClassifier>();
        case ClassificationPolicy::THRESHOLD:
            return std::make_unique<ThresholdClassifier>(config.effective_threshold());
    }
    throw ConfigurationError("Unknown classification policy");
}

// ============================================================================
// DistanceBands
// ============================================================================

std::string format_km(double km) {
    std::ostringstream oss;
    oss << km;
    return oss.str();
}

DistanceBands::DistanceBands() : breakpoints_{1, 2, 5, 10, 20, 50, 100} {
}

DistanceBands::DistanceBands(std::vector<double> breakpoints_km)
    : breakpoints_(std::move(breakpoints_km)) {
    if (breakpoints_.empty()) {
        throw ConfigurationError("At least one distance band breakpoint is required");
    }
    for (size_t i = 0; i < breakpoints_.size(); ++i) {
        if (!(breakpoints_[i] > 0.0) || !std::isfinite(breakpoints_[i])) {
            throw ConfigurationError("Distance band breakpoints must be positive, got " +
                                     format_km(breakpoints_[i]));
        }
        if (i > 0 && !(breakpoints_[i] > breakpoints_[i - 1])) {
            throw ConfigurationError("Distance band breakpoints must be strictly ascending (" +
                                     format_km(breakpoints_[i - 1]) + " then " +
                                     format_km(breakpoints_[i]) + ")");
        }
    }
}

size_t DistanceBands::band_of(double distance_km) const {
    auto it = std::lower_bound(breakpoints_.begin(), breakpoints_.end(), distance_km);
    return static_cast<size_t>(it - breakpoints_.begin());
}

std::string DistanceBands::label(size_t band) const {
    if (band >= breakpoints_.size()) {
        return ">" + format_km(breakpoints_.back()) + "km";
    }
    return format_km(lower_km(band)) + "-" + format_km(breakpoints_[band]) + "km";
}

std::vector<std::string> DistanceBands::labels() const {
    std::vector<std::string> result;
    result.reserve(band_count());
    for (size_t i = 0; i < band_count(); ++i) {
        result.push_back(label(i));
    }
    return result;
}

} // namespace popaccess
