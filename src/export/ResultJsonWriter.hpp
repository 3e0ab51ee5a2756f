/**
 * @file ResultJsonWriter.hpp
 * @brief JSON documents for scope, region and audit results
 *
 * Each scope is also stored as its own document under scopes/ so that
 * region rollups can be rebuilt later without rerunning the analysis.
 * Unknown class splits are written as null, never as zero.
 */

#pragma once

#include "../core/AccessAggregator.hpp"
#include "../core/RegionRollup.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Run description written into every document
 */
struct RunMetadata {
    std::string version;
    std::string population_raster;
    std::string features_path;
    std::string classification;
    std::vector<std::string> band_labels;
    std::vector<double> gap_thresholds_km;
};

nlohmann::json table_to_json(const AccessTable& table);
nlohmann::json scope_to_json(const ScopeResult& scope);

/**
 * @brief No-access residuals of a table, split into urban and rural where known
 * @throws std::invalid_argument if a threshold is not in the cumulative table
 */
nlohmann::json no_access_to_json(const AccessTable& table, const std::vector<double>& thresholds_km);

/// Region record; no_access is reported at the given thresholds
nlohmann::json region_to_json(const RegionResult& region,
                              const std::vector<double>& no_access_thresholds_km = {});
nlohmann::json audit_to_json(const RollupAudit& audit);

/**
 * @brief Rebuild a table from its JSON form
 * @throws FormatError if required members are missing or mistyped
 */
AccessTable table_from_json(const nlohmann::json& j);

/**
 * @brief Rebuild a scope result from its JSON form
 *
 * Statistics, gap and placement are not restored; the table is validated.
 *
 * @throws FormatError if the document is malformed
 * @throws ReconciliationError if the stored table does not reconcile
 */
ScopeResult scope_from_json(const nlohmann::json& j);

/**
 * @brief Writes result documents into an output directory
 */
class ResultJsonWriter {
public:
    ResultJsonWriter(std::string output_directory, std::string base_name);

    /// <base>_countries.json
    bool write_countries(const std::vector<ScopeResult>& scopes, const RunMetadata& metadata,
                         std::string* written_path = nullptr) const;

    /// <base>_regions.json
    bool write_regions(const RollupReport& report, const RunMetadata& metadata,
                       std::string* written_path = nullptr) const;

    /// scopes/<name>.json
    bool write_scope(const ScopeResult& scope, std::string* written_path = nullptr) const;

    /// scopes/<file_stem>.json
    bool write_scope(const ScopeResult& scope, const std::string& file_stem,
                     std::string* written_path = nullptr) const;

    std::string scope_path(const std::string& scope_name) const;

private:
    std::string output_directory_;
    std::string base_name_;

    bool write_document(const nlohmann::json& document, const std::string& path) const;
};

/**
 * @brief Read every scopes/<name>.json below a directory, sorted by name
 *
 * Accepts either the output directory or its scopes/ subdirectory.
 *
 * @throws FormatError if the directory or a document cannot be read
 */
std::vector<ScopeResult> read_scope_directory(const std::string& directory);

/// File-system safe form of a scope name (keeps UTF-8, replaces separators)
std::string safe_file_stem(const std::string& name);

/**
 * @brief Safe file stems for a list of scope names, distinct from each other
 *
 * Names whose safe forms collide ("A/B" and "A_B") keep the first stem;
 * later ones get "_2", "_3", ... appended.
 */
std::vector<std::string> unique_file_stems(const std::vector<std::string>& names);

} // namespace popaccess
