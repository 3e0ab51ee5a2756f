/**
 * @file AccessAggregator.cpp
 * @brief Per-scope accumulation and table reconciliation
 */

#include "AccessAggregator.hpp"
#include "AccessErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace popaccess {

namespace {

constexpr double kThresholdTolerance = 1e-9;

bool same_threshold(double a, double b) {
    return std::fabs(a - b) <= kThresholdTolerance * std::max(1.0, std::fabs(a));
}

[[noreturn]] void reconciliation_failure(const std::string& context, const std::string& what,
                                         const PopulationCount& expected,
                                         const PopulationCount& actual) {
    std::ostringstream msg;
    msg.precision(15);
    msg << context << ": " << what << " is " << actual.value() << " but expected "
        << expected.value();
    throw ReconciliationError(msg.str());
}

} // anonymous namespace

void validate_thresholds(const std::vector<double>& thresholds_km, const std::string& what) {
    if (thresholds_km.empty()) {
        throw ConfigurationError(what + " list is empty");
    }
    for (size_t i = 0; i < thresholds_km.size(); ++i) {
        if (!(thresholds_km[i] > 0.0) || !std::isfinite(thresholds_km[i])) {
            throw ConfigurationError(what + " must be positive, got " + format_km(thresholds_km[i]));
        }
        if (i > 0 && !(thresholds_km[i] > thresholds_km[i - 1])) {
            throw ConfigurationError(what + " must be strictly ascending (" +
                                     format_km(thresholds_km[i - 1]) + " then " +
                                     format_km(thresholds_km[i]) + ")");
        }
    }
}

void validate_gap_thresholds(const std::vector<double>& gap_thresholds_km,
                             const std::vector<double>& cumulative_thresholds_km) {
    for (double gap : gap_thresholds_km) {
        const bool tabulated = std::any_of(cumulative_thresholds_km.begin(),
                                           cumulative_thresholds_km.end(),
                                           [gap](double t) { return same_threshold(t, gap); });
        if (!tabulated) {
            throw ConfigurationError("Gap threshold " + format_km(gap) +
                                     " km is not one of the cumulative thresholds");
        }
    }
}

// ============================================================================
// AccessTable
// ============================================================================

const ThresholdRow* AccessTable::find_threshold(double threshold_km) const {
    for (const auto& row : cumulative) {
        if (same_threshold(row.threshold_km, threshold_km)) {
            return &row;
        }
    }
    return nullptr;
}

NoAccess AccessTable::no_access(double threshold_km) const {
    const ThresholdRow* row = find_threshold(threshold_km);
    if (!row) {
        throw std::invalid_argument("Threshold " + format_km(threshold_km) +
                                    " km is not in the cumulative table");
    }

    NoAccess result;
    result.threshold_km = row->threshold_km;
    result.total = total - row->reachable;
    if (class_totals && row->split) {
        result.urban = class_totals->urban - row->split->urban;
        result.rural = class_totals->rural - row->split->rural;
    }
    return result;
}

void AccessTable::validate(const std::string& context) const {
    PopulationCount band_sum;
    size_t band_cells = 0;
    ClassTotals band_split;
    for (const auto& row : bands) {
        band_sum += row.population;
        band_cells += row.cells;
        if (row.split) {
            if (row.split->total() != row.population) {
                reconciliation_failure(context, "urban+rural of band " + row.label,
                                       row.population, row.split->total());
            }
            band_split += *row.split;
        }
    }
    if (band_sum != total) {
        reconciliation_failure(context, "sum of distance bands", total, band_sum);
    }
    if (band_cells != populated_cells) {
        throw ReconciliationError(context + ": band cell counts sum to " +
                                  std::to_string(band_cells) + " but " +
                                  std::to_string(populated_cells) + " cells are populated");
    }

    if (class_totals) {
        if (class_totals->total() != total) {
            reconciliation_failure(context, "urban+rural total", total, class_totals->total());
        }
        if (band_split.urban != class_totals->urban) {
            reconciliation_failure(context, "urban sum of bands", class_totals->urban, band_split.urban);
        }
        if (band_split.rural != class_totals->rural) {
            reconciliation_failure(context, "rural sum of bands", class_totals->rural, band_split.rural);
        }
    }

    PopulationCount previous;
    std::optional<ClassTotals> previous_split;
    for (const auto& row : cumulative) {
        const std::string at = " at " + format_km(row.threshold_km) + " km";
        if (row.reachable < previous) {
            reconciliation_failure(context, "reachable population" + at + " (non-monotone)",
                                   previous, row.reachable);
        }
        if (total < row.reachable) {
            reconciliation_failure(context, "reachable population" + at + " (exceeds total)",
                                   total, row.reachable);
        }
        if (row.split) {
            if (row.split->total() != row.reachable) {
                reconciliation_failure(context, "urban+rural reachable" + at,
                                       row.reachable, row.split->total());
            }
            // Each class series grows with distance and stays within its class total
            if (previous_split) {
                if (row.split->urban < previous_split->urban) {
                    reconciliation_failure(context, "urban reachable" + at + " (non-monotone)",
                                           previous_split->urban, row.split->urban);
                }
                if (row.split->rural < previous_split->rural) {
                    reconciliation_failure(context, "rural reachable" + at + " (non-monotone)",
                                           previous_split->rural, row.split->rural);
                }
            }
            if (class_totals) {
                if (class_totals->urban < row.split->urban) {
                    reconciliation_failure(context, "urban reachable" + at + " (exceeds class total)",
                                           class_totals->urban, row.split->urban);
                }
                if (class_totals->rural < row.split->rural) {
                    reconciliation_failure(context, "rural reachable" + at + " (exceeds class total)",
                                           class_totals->rural, row.split->rural);
                }
            }
        }
        previous = row.reachable;
        previous_split = row.split;
    }
}

void AccessTable::merge(const AccessTable& other, const std::string& context) {
    if (bands.size() != other.bands.size()) {
        throw ReconciliationError(context + ": cannot combine tables with " +
                                  std::to_string(bands.size()) + " and " +
                                  std::to_string(other.bands.size()) + " distance bands");
    }
    if (cumulative.size() != other.cumulative.size()) {
        throw ReconciliationError(context + ": cannot combine tables with different threshold lists");
    }

    const bool keep_split = has_class_split() && other.has_class_split();

    total += other.total;
    populated_cells += other.populated_cells;
    if (keep_split) {
        *class_totals += *other.class_totals;
    } else {
        class_totals.reset();
    }

    for (size_t i = 0; i < bands.size(); ++i) {
        if (bands[i].label != other.bands[i].label) {
            throw ReconciliationError(context + ": band '" + bands[i].label +
                                      "' does not match '" + other.bands[i].label + "'");
        }
        bands[i].population += other.bands[i].population;
        bands[i].cells += other.bands[i].cells;
        if (keep_split && bands[i].split && other.bands[i].split) {
            *bands[i].split += *other.bands[i].split;
        } else {
            bands[i].split.reset();
        }
    }

    for (size_t i = 0; i < cumulative.size(); ++i) {
        if (!same_threshold(cumulative[i].threshold_km, other.cumulative[i].threshold_km)) {
            throw ReconciliationError(context + ": threshold " +
                                      format_km(cumulative[i].threshold_km) + " does not match " +
                                      format_km(other.cumulative[i].threshold_km));
        }
        cumulative[i].reachable += other.cumulative[i].reachable;
        cumulative[i].cells += other.cumulative[i].cells;
        if (keep_split && cumulative[i].split && other.cumulative[i].split) {
            *cumulative[i].split += *other.cumulative[i].split;
        } else {
            cumulative[i].split.reset();
        }
    }
}

AccessTable AccessTable::empty_like() const {
    AccessTable table;
    table.class_totals = ClassTotals{};
    for (const auto& row : bands) {
        BandRow empty;
        empty.label = row.label;
        empty.lower_km = row.lower_km;
        empty.upper_km = row.upper_km;
        empty.split = ClassTotals{};
        table.bands.push_back(empty);
    }
    for (const auto& row : cumulative) {
        ThresholdRow empty;
        empty.threshold_km = row.threshold_km;
        empty.split = ClassTotals{};
        table.cumulative.push_back(empty);
    }
    return table;
}

// ============================================================================
// ScopeAccumulator
// ============================================================================

void ScopeAccumulator::RunningStats::add(double value, double distance_km) {
    ++count;
    if (count == 1) {
        min = max = value;
    } else {
        min = std::min(min, value);
        max = std::max(max, value);
    }
    // Welford update
    const double delta = value - mean;
    mean += delta / static_cast<double>(count);
    m2 += delta * (value - mean);

    weighted_distance += static_cast<long double>(value) * distance_km;
    weight += value;
}

ClassStatistics ScopeAccumulator::RunningStats::finish() const {
    ClassStatistics stats;
    stats.cells = count;
    stats.mean = mean;
    stats.min = min;
    stats.max = max;
    stats.stddev = count > 0 ? std::sqrt(m2 / static_cast<double>(count)) : 0.0;
    return stats;
}

ScopeAccumulator::ScopeAccumulator(std::string name, const DistanceBands& bands,
                                   std::vector<double> thresholds_km,
                                   std::vector<double> gap_thresholds_km)
    : name_(std::move(name)), bands_(bands), thresholds_(std::move(thresholds_km)),
      gap_thresholds_(std::move(gap_thresholds_km)) {
    validate_thresholds(thresholds_, "Cumulative thresholds");
    if (!gap_thresholds_.empty()) {
        validate_thresholds(gap_thresholds_, "Gap thresholds");
        validate_gap_thresholds(gap_thresholds_, thresholds_);
    }
    band_buckets_.resize(bands_.band_count());
    threshold_buckets_.resize(thresholds_.size() + 1);
    gap_within_.resize(gap_thresholds_.size());
}

void ScopeAccumulator::add(const CellRecord& record) {
    if (record.band >= band_buckets_.size()) {
        throw std::out_of_range("Band index " + std::to_string(record.band) +
                                " outside " + std::to_string(band_buckets_.size()) + " bands");
    }

    const PopulationCount population = PopulationCount::from_value(record.population);
    const bool urban = record.urban_class == UrbanClass::URBAN;

    auto add_to = [&](ClassTotals& split) {
        if (urban) {
            split.urban += population;
            ++split.urban_cells;
        } else {
            split.rural += population;
            ++split.rural_cells;
        }
    };

    total_ += population;
    ++populated_cells_;
    add_to(class_totals_);
    max_distance_km_ = std::max(max_distance_km_, record.distance_km);

    Bucket& band = band_buckets_[record.band];
    band.population += population;
    ++band.cells;
    add_to(band.split);

    auto it = std::lower_bound(thresholds_.begin(), thresholds_.end(), record.distance_km);
    Bucket& bucket = threshold_buckets_[static_cast<size_t>(it - thresholds_.begin())];
    bucket.population += population;
    ++bucket.cells;
    add_to(bucket.split);

    for (size_t g = 0; g < gap_thresholds_.size(); ++g) {
        if (record.distance_km <= gap_thresholds_[g]) {
            add_to(gap_within_[g]);
        }
    }

    (urban ? urban_stats_ : rural_stats_).add(record.population, record.distance_km);
}

ScopeResult ScopeAccumulator::finish() const {
    ScopeResult result;
    result.name = name_;
    result.nodata_cells = nodata_cells_;
    result.rejected_cells = rejected_cells_;
    result.max_distance_km = max_distance_km_;

    AccessTable& table = result.table;
    table.total = total_;
    table.populated_cells = populated_cells_;
    table.class_totals = class_totals_;

    for (size_t i = 0; i < band_buckets_.size(); ++i) {
        BandRow row;
        row.label = bands_.label(i);
        row.lower_km = bands_.lower_km(i);
        row.upper_km = bands_.upper_km(i);
        row.population = band_buckets_[i].population;
        row.cells = band_buckets_[i].cells;
        row.split = band_buckets_[i].split;
        table.bands.push_back(row);
    }

    ThresholdRow running;
    running.split = ClassTotals{};
    for (size_t k = 0; k < thresholds_.size(); ++k) {
        running.threshold_km = thresholds_[k];
        running.reachable += threshold_buckets_[k].population;
        running.cells += threshold_buckets_[k].cells;
        *running.split += threshold_buckets_[k].split;
        table.cumulative.push_back(running);
    }

    if (urban_stats_.count > 0) {
        result.urban_stats = urban_stats_.finish();
    }
    if (rural_stats_.count > 0) {
        result.rural_stats = rural_stats_.finish();
    }

    AccessGap gap;
    if (urban_stats_.weight > 0.0L) {
        gap.urban_mean_distance_km = static_cast<double>(urban_stats_.weighted_distance / urban_stats_.weight);
    }
    if (rural_stats_.weight > 0.0L) {
        gap.rural_mean_distance_km = static_cast<double>(rural_stats_.weighted_distance / rural_stats_.weight);
    }
    for (size_t g = 0; g < gap_thresholds_.size(); ++g) {
        CoverageGap coverage;
        coverage.threshold_km = gap_thresholds_[g];
        coverage.urban_percent = 100.0 * PopulationCount::share(gap_within_[g].urban, class_totals_.urban);
        coverage.rural_percent = 100.0 * PopulationCount::share(gap_within_[g].rural, class_totals_.rural);
        gap.coverage.push_back(coverage);
    }
    result.gap = gap;

    table.validate(name_);
    return result;
}

} // namespace popaccess
