/**
 * @file RegionRollup.hpp
 * @brief Country-to-region mapping and region rollups with audit lists
 */

#pragma once

#include "AccessAggregator.hpp"
#include "AccessErrors.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace popaccess {

/**
 * @brief Ordered region table; each country belongs to at most one region
 */
class RegionDefinitions {
public:
    using Region = std::pair<std::string, std::vector<std::string>>;

    RegionDefinitions() = default;

    /**
     * @throws ConfigurationError if the region exists or a member is already assigned
     */
    void add_region(const std::string& name, const std::vector<std::string>& members);

    /// North, West, Central, East and Southern Africa
    static RegionDefinitions african_defaults();

    /**
     * @brief Load {"Region": ["Country", ...], ...} from a JSON file (order preserved)
     * @throws ConfigurationError if the file is unreadable or malformed
     */
    static RegionDefinitions load(const std::string& path);

    std::optional<std::string> region_of(const std::string& country) const;

    const std::vector<Region>& regions() const { return regions_; }
    bool empty() const { return regions_.empty(); }

private:
    std::vector<Region> regions_;
    std::unordered_map<std::string, std::string> country_to_region_;
};

/**
 * @brief A scope that failed and was left out of every rollup
 */
struct ExcludedScope {
    std::string name;
    ErrorKind kind = ErrorKind::FORMAT;
    std::string message;
};

/**
 * @brief Coverage discrepancies found while rolling up
 *
 * missing_members lists configured countries with neither a result nor a
 * recorded failure; failed countries appear in excluded_scopes instead.
 */
struct RollupAudit {
    std::vector<std::string> unmapped_countries;
    std::vector<std::string> missing_members;
    std::vector<std::string> empty_regions;
    std::vector<ExcludedScope> excluded_scopes;
};

struct RegionResult {
    std::string name;
    std::vector<std::string> members;   // members present in the data
    AccessTable table;
};

struct RollupReport {
    std::vector<RegionResult> regions;
    std::optional<RegionResult> continent;  // every successful scope
    RollupAudit audit;
};

/// Name of the all-scopes rollup
constexpr const char* kContinentRollupName = "ALL";

/**
 * @brief Sum member-country tables into region tables
 *
 * @throws ReconciliationError if member tables cannot be combined or a
 *         region total differs from the sum of its members
 */
RollupReport rollup_regions(const std::vector<ScopeResult>& scopes,
                            const RegionDefinitions& definitions,
                            const std::vector<ExcludedScope>& excluded = {});

} // namespace popaccess
