/**
 * @file CsvExporter.cpp
 * @brief Implementation of CSV table export
 */

#include "CsvExporter.hpp"
#include "../core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace popaccess {

CsvExporter::CsvExporter()
    : options_() {}

CsvExporter::CsvExporter(const Options& options)
    : options_(options) {}

std::string CsvExporter::escape(const std::string& field) const {
    if (field.find(options_.delimiter) == std::string::npos &&
        field.find('"') == std::string::npos &&
        field.find('\n') == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char ch : field) {
        if (ch == '"') quoted += '"';
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

std::string CsvExporter::number(double value) const {
    std::ostringstream oss;
    oss.precision(options_.precision);
    oss << std::fixed << value;
    std::string text = oss.str();
    // Trim trailing zeros ("12.500000" -> "12.5", "3.000000" -> "3")
    if (text.find('.') != std::string::npos) {
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    return text;
}

void CsvExporter::write_summary_row(std::ostream& out, const std::string& type,
                                    const std::string& name, const std::string& region,
                                    const AccessTable& table, const ScopeResult* scope,
                                    const std::vector<double>& thresholds_km) const {
    const char d = options_.delimiter;
    out << type << d << escape(name) << d << escape(region) << d << number(table.total.value()) << d;
    if (table.class_totals) {
        out << number(table.class_totals->urban.value()) << d << number(table.class_totals->rural.value()) << d;
    } else {
        out << d << d;
    }
    out << table.populated_cells << d;

    if (scope) {
        out << scope->nodata_cells << d << scope->rejected_cells << d << scope->occupied_cells << d
            << number(scope->max_distance_km) << d;
        if (scope->gap && scope->gap->urban_mean_distance_km) out << number(*scope->gap->urban_mean_distance_km);
        out << d;
        if (scope->gap && scope->gap->rural_mean_distance_km) out << number(*scope->gap->rural_mean_distance_km);
        out << d;
        if (scope->gap && scope->gap->mean_distance_gap_km()) out << number(*scope->gap->mean_distance_gap_km());
    } else {
        out << d << d << d << d << d << d;
    }

    for (double threshold : thresholds_km) {
        const ThresholdRow* row = table.find_threshold(threshold);
        out << d;
        if (row) out << number(100.0 * PopulationCount::share(row->reachable, table.total));
        out << d;
        if (row && row->split && table.class_totals) {
            out << number(100.0 * PopulationCount::share(row->split->urban, table.class_totals->urban));
        }
        out << d;
        if (row && row->split && table.class_totals) {
            out << number(100.0 * PopulationCount::share(row->split->rural, table.class_totals->rural));
        }
        if (!row) {
            out << d << d << d;
            continue;
        }
        const NoAccess residual = table.no_access(threshold);
        out << d << number(residual.total.value()) << d;
        if (residual.urban) out << number(residual.urban->value());
        out << d;
        if (residual.rural) out << number(residual.rural->value());
    }
    out << '\n';
}

void CsvExporter::write_summary(std::ostream& out, const std::vector<ScopeResult>& scopes,
                                const RollupReport& report,
                                const std::vector<double>& thresholds_km) const {
    const char d = options_.delimiter;
    out << "type" << d << "name" << d << "region" << d << "total" << d << "urban" << d << "rural"
        << d << "populated_cells" << d << "nodata_cells" << d << "rejected_cells" << d
        << "occupied_cells" << d << "max_distance_km" << d << "urban_mean_distance_km" << d
        << "rural_mean_distance_km" << d << "mean_distance_gap_km";
    for (double threshold : thresholds_km) {
        const std::string t = number(threshold) + "km";
        out << d << "share_within_" << t << d << "coverage_urban_" << t << d
            << "coverage_rural_" << t << d << "no_access_" << t << d
            << "no_access_urban_" << t << d << "no_access_rural_" << t;
    }
    out << '\n';

    for (const auto& scope : scopes) {
        write_summary_row(out, "country", scope.name, scope.region, scope.table, &scope, thresholds_km);
    }
    for (const auto& region : report.regions) {
        write_summary_row(out, "region", region.name, region.name, region.table, nullptr, thresholds_km);
    }
    if (report.continent) {
        write_summary_row(out, "continent", report.continent->name, "", report.continent->table,
                          nullptr, thresholds_km);
    }
}

void CsvExporter::write_band_rows(std::ostream& out, const std::string& type,
                                  const std::string& name, const AccessTable& table) const {
    const char d = options_.delimiter;
    for (const auto& row : table.bands) {
        out << type << d << escape(name) << d << row.label << d << number(row.lower_km) << d;
        if (row.upper_km) out << number(*row.upper_km);
        out << d << number(row.population.value()) << d << row.cells << d
            << number(100.0 * PopulationCount::share(row.population, table.total)) << d;
        if (row.split) {
            out << number(row.split->urban.value()) << d << number(row.split->rural.value());
        } else {
            out << d;
        }
        out << '\n';
    }
}

void CsvExporter::write_bands(std::ostream& out, const std::vector<ScopeResult>& scopes,
                              const RollupReport& report) const {
    const char d = options_.delimiter;
    out << "type" << d << "name" << d << "band" << d << "lower_km" << d << "upper_km" << d
        << "population" << d << "cells" << d << "share" << d << "urban" << d << "rural" << '\n';
    for (const auto& scope : scopes) {
        write_band_rows(out, "country", scope.name, scope.table);
    }
    for (const auto& region : report.regions) {
        write_band_rows(out, "region", region.name, region.table);
    }
    if (report.continent) {
        write_band_rows(out, "continent", report.continent->name, report.continent->table);
    }
}

bool CsvExporter::export_summary(const std::vector<ScopeResult>& scopes,
                                 const RollupReport& report,
                                 const std::vector<double>& thresholds_km,
                                 const std::string& filename) const {
    Logger logger("CsvExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create CSV file: " + filename);
        return false;
    }
    write_summary(file, scopes, report, thresholds_km);
    logger.info("Exported summary CSV: " + filename);
    return static_cast<bool>(file);
}

bool CsvExporter::export_bands(const std::vector<ScopeResult>& scopes,
                               const RollupReport& report,
                               const std::string& filename) const {
    Logger logger("CsvExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create CSV file: " + filename);
        return false;
    }
    write_bands(file, scopes, report);
    logger.info("Exported band CSV: " + filename);
    return static_cast<bool>(file);
}

bool CsvExporter::export_cell_detail(const std::vector<CellRecord>& records,
                                     const RasterGrid& grid,
                                     const std::string& filename) const {
    Logger logger("CsvExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create CSV file: " + filename);
        return false;
    }

    const char d = options_.delimiter;
    file << "country" << d << "region" << d << "row" << d << "col" << d << "x" << d << "y" << d
         << "population" << d << "class" << d << "distance_km" << d << "band" << '\n';

    for (const auto& record : records) {
        auto [x, y] = grid.coord_of(record.row, record.col);
        if (record.scope) {
            file << escape(record.scope->country) << d << escape(record.scope->region);
        } else {
            file << d;
        }
        file << d << record.row << d << record.col << d
             << number(x) << d << number(y) << d << number(record.population) << d
             << to_string(record.urban_class) << d << number(record.distance_km) << d
             << record.band << '\n';
    }

    logger.detailed("Exported " + std::to_string(records.size()) + " cell records to " + filename);
    return static_cast<bool>(file);
}

} // namespace popaccess
