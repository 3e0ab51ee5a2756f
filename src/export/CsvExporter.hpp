/**
 * @file CsvExporter.hpp
 * @brief Flat CSV tables of scope and region results
 *
 * Unknown values (class splits of tables that lack them) are left empty.
 */

#pragma once

#include "../core/AccessAggregator.hpp"
#include "../core/RegionRollup.hpp"
#include "../core/PopulationGrid.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace popaccess {

class CsvExporter {
public:
    struct Options {
        char delimiter;
        int precision;

        Options() : delimiter(','), precision(6) {}
    };

    CsvExporter();
    explicit CsvExporter(const Options& options);

    /**
     * @brief One row per scope, region and the continent rollup
     * @param thresholds_km Thresholds reported as coverage and no-access columns
     */
    bool export_summary(const std::vector<ScopeResult>& scopes,
                        const RollupReport& report,
                        const std::vector<double>& thresholds_km,
                        const std::string& filename) const;

    /// One row per (scope or region, distance band)
    bool export_bands(const std::vector<ScopeResult>& scopes,
                      const RollupReport& report,
                      const std::string& filename) const;

    /// One row per populated cell, with its country, region and cell centre coordinate
    bool export_cell_detail(const std::vector<CellRecord>& records,
                            const RasterGrid& grid,
                            const std::string& filename) const;

    void write_summary(std::ostream& out, const std::vector<ScopeResult>& scopes,
                       const RollupReport& report, const std::vector<double>& thresholds_km) const;
    void write_bands(std::ostream& out, const std::vector<ScopeResult>& scopes,
                     const RollupReport& report) const;

    /// Quote a field when it contains the delimiter, a quote or a newline
    std::string escape(const std::string& field) const;

private:
    Options options_;

    void write_summary_row(std::ostream& out, const std::string& type, const std::string& name,
                           const std::string& region, const AccessTable& table,
                           const ScopeResult* scope, const std::vector<double>& thresholds_km) const;
    void write_band_rows(std::ostream& out, const std::string& type, const std::string& name,
                         const AccessTable& table) const;
    std::string number(double value) const;
};

} // namespace popaccess
