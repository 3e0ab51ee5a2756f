/**
 * @file CellClassifier.hpp
 * @brief Urban/rural classification policies and distance banding
 */

#pragma once

#include "popaccess.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Result of classifying one grid value
 */
struct Classification {
    UrbanClass urban_class;
    double population;
};

/**
 * @brief Turns a raw grid value into an urban/rural class and population
 *
 * Implementations are stateless and safe to share across worker threads.
 */
class UrbanRuralClassifier {
public:
    virtual ~UrbanRuralClassifier() = default;

    /**
     * @brief Classify a valid (non-no-data) grid value
     * @return nullopt when the cell carries no population
     */
    virtual std::optional<Classification> classify(double value) const = 0;

    /**
     * @brief True for values the policy cannot interpret (counted, not classified)
     */
    virtual bool rejects(double value) const { (void)value; return false; }

    virtual ClassificationPolicy policy() const = 0;
    virtual std::string describe() const = 0;
};

/**
 * @brief Pre-classified grid: sign carries the class, magnitude the population
 */
class SignClassifier final : public UrbanRuralClassifier {
public:
    std::optional<Classification> classify(double value) const override;
    ClassificationPolicy policy() const override { return ClassificationPolicy::SIGN; }
    std::string describe() const override { return "sign (positive=urban, negative=rural)"; }
};

/**
 * @brief Density grid: values at or above the threshold are urban
 */
class ThresholdClassifier final : public UrbanRuralClassifier {
public:
    explicit ThresholdClassifier(double threshold = kDefaultUrbanThreshold);

    std::optional<Classification> classify(double value) const override;
    bool rejects(double value) const override { return value < 0.0; }
    ClassificationPolicy policy() const override { return ClassificationPolicy::THRESHOLD; }
    std::string describe() const override;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

/**
 * @brief Build the classifier selected by a configuration
 * @throws ConfigurationError if the policies are mixed or the threshold is invalid
 */
std::unique_ptr<UrbanRuralClassifier> make_classifier(const AnalysisConfig& config);

/**
 * @brief Ordered distance bands with closed upper ends
 *
 * Breakpoints b0 < b1 < ... < bn give bands [0, b0], (b0, b1], ...,
 * (b(n-1), bn], (bn, inf). A distance equal to a breakpoint belongs to the
 * band it closes.
 */
class DistanceBands {
public:
    /// Default breakpoints 1, 2, 5, 10, 20, 50, 100 km
    DistanceBands();

    /**
     * @throws ConfigurationError unless breakpoints are positive and strictly ascending
     */
    explicit DistanceBands(std::vector<double> breakpoints_km);

    size_t band_count() const { return breakpoints_.size() + 1; }
    size_t band_of(double distance_km) const;

    /// "0-1km", "1-2km", ..., ">100km"
    std::string label(size_t band) const;
    std::vector<std::string> labels() const;

    double lower_km(size_t band) const { return band == 0 ? 0.0 : breakpoints_[band - 1]; }

    /// Upper bound, nullopt for the unbounded last band
    std::optional<double> upper_km(size_t band) const {
        if (band < breakpoints_.size()) return breakpoints_[band];
        return std::nullopt;
    }

    const std::vector<double>& breakpoints() const { return breakpoints_; }

private:
    std::vector<double> breakpoints_;
};

/// Compact number formatting for labels ("1", "2.5", "100")
std::string format_km(double km);

/**
 * @brief Country and region a cell belongs to
 */
struct ScopeKey {
    std::string country;
    std::string region;   // Empty when the country has no region
};

/**
 * @brief Per-cell measurement emitted by classification
 *
 * Every record of one scope shares the same ScopeKey.
 */
struct CellRecord {
    size_t row = 0;
    size_t col = 0;
    double population = 0.0;
    UrbanClass urban_class = UrbanClass::RURAL;
    double distance_km = 0.0;
    size_t band = 0;
    std::shared_ptr<const ScopeKey> scope;
};

} // namespace popaccess
