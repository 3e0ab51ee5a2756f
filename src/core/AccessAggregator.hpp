/**
 * @file AccessAggregator.hpp
 * @brief Population-by-distance tables for one scope
 *
 * A ScopeAccumulator consumes the cell records of one country and produces
 * an immutable ScopeResult: totals, a distance-band table, a cumulative
 * reachability table and the supplementary accessibility statistics.
 * Every partition of the total reconciles exactly.
 */

#pragma once

#include "CellClassifier.hpp"
#include "FeatureRasterizer.hpp"
#include "PopulationCount.hpp"
#include <optional>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Urban/rural split of a population amount
 */
struct ClassTotals {
    PopulationCount urban;
    PopulationCount rural;
    size_t urban_cells = 0;
    size_t rural_cells = 0;

    PopulationCount total() const { return urban + rural; }

    ClassTotals& operator+=(const ClassTotals& other) {
        urban += other.urban;
        rural += other.rural;
        urban_cells += other.urban_cells;
        rural_cells += other.rural_cells;
        return *this;
    }
};

/**
 * @brief One row of the distance-band table
 */
struct BandRow {
    std::string label;
    double lower_km = 0.0;
    std::optional<double> upper_km;   // nullopt: unbounded
    PopulationCount population;
    size_t cells = 0;
    std::optional<ClassTotals> split;
};

/**
 * @brief Population within a distance threshold (distance <= threshold)
 */
struct ThresholdRow {
    double threshold_km = 0.0;
    PopulationCount reachable;
    size_t cells = 0;
    std::optional<ClassTotals> split;
};

/**
 * @brief Population beyond a threshold
 *
 * The class split is only reported when the class totals are known.
 */
struct NoAccess {
    double threshold_km = 0.0;
    PopulationCount total;
    std::optional<PopulationCount> urban;
    std::optional<PopulationCount> rural;
};

/**
 * @brief Totals, band table and cumulative table shared by scopes and regions
 */
struct AccessTable {
    PopulationCount total;
    size_t populated_cells = 0;
    std::optional<ClassTotals> class_totals;
    std::vector<BandRow> bands;
    std::vector<ThresholdRow> cumulative;

    bool has_class_split() const { return class_totals.has_value(); }

    const ThresholdRow* find_threshold(double threshold_km) const;

    /**
     * @brief Residual population without access at a tabulated threshold
     * @throws std::invalid_argument if the threshold is not in the cumulative table
     */
    NoAccess no_access(double threshold_km) const;

    /**
     * @brief Check every partition against the totals
     * @param context Name used in the error message
     * @throws ReconciliationError on any mismatch
     */
    void validate(const std::string& context) const;

    /**
     * @brief Add another table row by row
     *
     * The class split survives only when both tables carry it.
     *
     * @throws ReconciliationError if band or threshold layouts differ
     */
    void merge(const AccessTable& other, const std::string& context);

    /// Empty table with the same band and threshold layout
    AccessTable empty_like() const;
};

/**
 * @brief Descriptive statistics of cell population values for one class
 */
struct ClassStatistics {
    size_t cells = 0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;
};

/**
 * @brief Urban vs rural coverage at one threshold, in percent of class population
 */
struct CoverageGap {
    double threshold_km = 0.0;
    double urban_percent = 0.0;
    double rural_percent = 0.0;

    double gap_percent() const { return urban_percent - rural_percent; }
};

/**
 * @brief Population-weighted accessibility gap between urban and rural cells
 */
struct AccessGap {
    std::optional<double> urban_mean_distance_km;
    std::optional<double> rural_mean_distance_km;
    std::vector<CoverageGap> coverage;

    std::optional<double> mean_distance_gap_km() const {
        if (urban_mean_distance_km && rural_mean_distance_km) {
            return *rural_mean_distance_km - *urban_mean_distance_km;
        }
        return std::nullopt;
    }
};

/**
 * @brief How well a boundary polygon matches the population raster
 */
struct BoundaryDiagnostics {
    double area_km2 = 0.0;
    double overlap_ratio = 1.0;
};

/**
 * @brief Immutable per-scope result
 */
struct ScopeResult {
    std::string name;
    std::string region;
    AccessTable table;

    size_t nodata_cells = 0;
    size_t rejected_cells = 0;
    size_t occupied_cells = 0;
    double max_distance_km = 0.0;

    std::optional<ClassStatistics> urban_stats;
    std::optional<ClassStatistics> rural_stats;
    std::optional<AccessGap> gap;
    std::optional<FeaturePlacement> placement;
    std::optional<BoundaryDiagnostics> boundary;
};

/**
 * @brief Builds one ScopeResult from a stream of cell records
 *
 * Not thread-safe; each scope worker owns its accumulator.
 */
class ScopeAccumulator {
public:
    /**
     * @throws ConfigurationError if thresholds are not positive and ascending,
     *         or a gap threshold is not a cumulative threshold
     */
    ScopeAccumulator(std::string name, const DistanceBands& bands,
                     std::vector<double> thresholds_km,
                     std::vector<double> gap_thresholds_km = {1.0, 5.0});

    void add(const CellRecord& record);
    void count_nodata(size_t cells = 1) { nodata_cells_ += cells; }
    void count_rejected(size_t cells = 1) { rejected_cells_ += cells; }

    /**
     * @brief Build and validate the result
     * @throws ReconciliationError if the partitions do not reconcile
     */
    ScopeResult finish() const;

private:
    struct Bucket {
        PopulationCount population;
        size_t cells = 0;
        ClassTotals split;
    };

    struct RunningStats {
        size_t count = 0;
        double mean = 0.0;
        double m2 = 0.0;
        double min = 0.0;
        double max = 0.0;
        long double weighted_distance = 0.0L;
        long double weight = 0.0L;

        void add(double value, double distance_km);
        ClassStatistics finish() const;
    };

    std::string name_;
    DistanceBands bands_;
    std::vector<double> thresholds_;
    std::vector<double> gap_thresholds_;

    std::vector<Bucket> band_buckets_;
    std::vector<Bucket> threshold_buckets_;   // index k: first threshold >= distance
    std::vector<ClassTotals> gap_within_;

    PopulationCount total_;
    ClassTotals class_totals_;
    size_t populated_cells_ = 0;
    size_t nodata_cells_ = 0;
    size_t rejected_cells_ = 0;
    double max_distance_km_ = 0.0;
    RunningStats urban_stats_;
    RunningStats rural_stats_;
};

/**
 * @brief Validate a threshold list (positive, strictly ascending, non-empty)
 * @throws ConfigurationError on violation
 */
void validate_thresholds(const std::vector<double>& thresholds_km, const std::string& what);

/**
 * @brief Require every gap threshold to appear in the cumulative table
 *
 * No-access residuals are read from cumulative rows, so an untabulated gap
 * threshold would have no residual.
 *
 * @throws ConfigurationError naming the first missing threshold
 */
void validate_gap_thresholds(const std::vector<double>& gap_thresholds_km,
                             const std::vector<double>& cumulative_thresholds_km);

} // namespace popaccess
