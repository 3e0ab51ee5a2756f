/**
 * @file ResultJsonWriter.cpp
 * @brief Implementation of result documents
 */

#include "ResultJsonWriter.hpp"
#include "../core/Logger.hpp"
#include "AccessErrors.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

namespace popaccess {

using json = nlohmann::json;

namespace {

json optional_population(const std::optional<PopulationCount>& value) {
    return value ? json(value->value()) : json(nullptr);
}

json percent(const PopulationCount& part, const PopulationCount& whole) {
    return 100.0 * PopulationCount::share(part, whole);
}

json split_to_json(const std::optional<ClassTotals>& split) {
    if (!split) {
        return {{"urban", nullptr}, {"rural", nullptr}, {"urban_cells", nullptr}, {"rural_cells", nullptr}};
    }
    return {{"urban", split->urban.value()}, {"rural", split->rural.value()},
            {"urban_cells", split->urban_cells}, {"rural_cells", split->rural_cells}};
}

std::optional<ClassTotals> split_from_json(const json& j) {
    if (!j.contains("urban") || j["urban"].is_null() || !j.contains("rural") || j["rural"].is_null()) {
        return std::nullopt;
    }
    auto count = [&j](const char* key) -> size_t {
        return j.contains(key) && j[key].is_number() ? j[key].get<size_t>() : 0;
    };
    ClassTotals split;
    split.urban = PopulationCount::from_value(j["urban"].get<double>());
    split.rural = PopulationCount::from_value(j["rural"].get<double>());
    split.urban_cells = count("urban_cells");
    split.rural_cells = count("rural_cells");
    return split;
}

std::string timestamp_utc() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

json metadata_to_json(const RunMetadata& metadata) {
    return {
        {"version", metadata.version},
        {"generated", timestamp_utc()},
        {"population_raster", metadata.population_raster},
        {"features", metadata.features_path},
        {"classification", metadata.classification},
        {"distance_bands", metadata.band_labels},
        {"gap_thresholds_km", metadata.gap_thresholds_km}
    };
}

json stats_to_json(const std::optional<ClassStatistics>& stats) {
    if (!stats) return nullptr;
    return {{"cells", stats->cells}, {"mean", stats->mean}, {"min", stats->min},
            {"max", stats->max}, {"stddev", stats->stddev}};
}

json optional_number(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

json residual_to_json(const NoAccess& residual) {
    return {
        {"threshold_km", residual.threshold_km},
        {"total", residual.total.value()},
        {"urban", optional_population(residual.urban)},
        {"rural", optional_population(residual.rural)}
    };
}

} // anonymous namespace

json no_access_to_json(const AccessTable& table, const std::vector<double>& thresholds_km) {
    json no_access = json::array();
    for (double threshold : thresholds_km) {
        no_access.push_back(residual_to_json(table.no_access(threshold)));
    }
    return no_access;
}

json table_to_json(const AccessTable& table) {
    json j;
    j["total"] = table.total.value();
    j["populated_cells"] = table.populated_cells;
    j["class_totals"] = split_to_json(table.class_totals);

    json bands = json::array();
    for (const auto& row : table.bands) {
        json b = {
            {"label", row.label},
            {"lower_km", row.lower_km},
            {"upper_km", optional_number(row.upper_km)},
            {"population", row.population.value()},
            {"cells", row.cells},
            {"share", percent(row.population, table.total)}
        };
        b.update(split_to_json(row.split));
        bands.push_back(b);
    }
    j["bands"] = bands;

    json cumulative = json::array();
    for (const auto& row : table.cumulative) {
        json c = {
            {"threshold_km", row.threshold_km},
            {"reachable", row.reachable.value()},
            {"cells", row.cells},
            {"share", percent(row.reachable, table.total)}
        };
        c.update(split_to_json(row.split));
        if (row.split && table.class_totals) {
            c["share_urban"] = percent(row.split->urban, table.total);
            c["share_rural"] = percent(row.split->rural, table.total);
            c["coverage_urban"] = percent(row.split->urban, table.class_totals->urban);
            c["coverage_rural"] = percent(row.split->rural, table.class_totals->rural);
        } else {
            c["share_urban"] = nullptr;
            c["share_rural"] = nullptr;
            c["coverage_urban"] = nullptr;
            c["coverage_rural"] = nullptr;
        }
        const NoAccess residual = table.no_access(row.threshold_km);
        c["no_access"] = residual.total.value();
        c["no_access_urban"] = optional_population(residual.urban);
        c["no_access_rural"] = optional_population(residual.rural);
        cumulative.push_back(c);
    }
    j["cumulative"] = cumulative;
    return j;
}

AccessTable table_from_json(const json& j) {
    try {
        AccessTable table;
        table.total = PopulationCount::from_value(j.at("total").get<double>());
        table.populated_cells = j.at("populated_cells").get<size_t>();
        if (j.contains("class_totals")) {
            table.class_totals = split_from_json(j["class_totals"]);
        }

        for (const auto& b : j.at("bands")) {
            BandRow row;
            row.label = b.at("label").get<std::string>();
            row.lower_km = b.at("lower_km").get<double>();
            if (b.contains("upper_km") && !b["upper_km"].is_null()) {
                row.upper_km = b["upper_km"].get<double>();
            }
            row.population = PopulationCount::from_value(b.at("population").get<double>());
            row.cells = b.at("cells").get<size_t>();
            row.split = split_from_json(b);
            table.bands.push_back(row);
        }

        for (const auto& c : j.at("cumulative")) {
            ThresholdRow row;
            row.threshold_km = c.at("threshold_km").get<double>();
            row.reachable = PopulationCount::from_value(c.at("reachable").get<double>());
            row.cells = c.at("cells").get<size_t>();
            row.split = split_from_json(c);
            table.cumulative.push_back(row);
        }
        return table;
    } catch (const json::exception& e) {
        throw FormatError(std::string("Malformed access table: ") + e.what());
    }
}

json scope_to_json(const ScopeResult& scope) {
    json j;
    j["name"] = scope.name;
    j["region"] = scope.region.empty() ? json(nullptr) : json(scope.region);
    j["table"] = table_to_json(scope.table);
    j["cells"] = {
        {"nodata", scope.nodata_cells},
        {"rejected", scope.rejected_cells},
        {"occupied", scope.occupied_cells}
    };
    j["max_distance_km"] = scope.max_distance_km;

    std::vector<double> gap_thresholds;
    if (scope.gap) {
        for (const auto& coverage : scope.gap->coverage) {
            gap_thresholds.push_back(coverage.threshold_km);
        }
    }
    j["no_access"] = no_access_to_json(scope.table, gap_thresholds);

    j["class_stats"] = {{"urban", stats_to_json(scope.urban_stats)},
                        {"rural", stats_to_json(scope.rural_stats)}};

    if (scope.gap) {
        json coverage = json::array();
        for (const auto& c : scope.gap->coverage) {
            coverage.push_back({
                {"threshold_km", c.threshold_km},
                {"urban_percent", c.urban_percent},
                {"rural_percent", c.rural_percent},
                {"gap_percent", c.gap_percent()}
            });
        }
        j["gap"] = {
            {"urban_mean_distance_km", optional_number(scope.gap->urban_mean_distance_km)},
            {"rural_mean_distance_km", optional_number(scope.gap->rural_mean_distance_km)},
            {"mean_distance_gap_km", optional_number(scope.gap->mean_distance_gap_km())},
            {"coverage", coverage}
        };
    } else {
        j["gap"] = nullptr;
    }

    if (scope.placement) {
        j["placement"] = {
            {"urban", scope.placement->urban},
            {"rural", scope.placement->rural},
            {"unpopulated", scope.placement->unpopulated},
            {"outside", scope.placement->outside},
            {"total", scope.placement->total()}
        };
    } else {
        j["placement"] = nullptr;
    }

    if (scope.boundary) {
        j["boundary"] = {{"area_km2", scope.boundary->area_km2},
                         {"overlap_ratio", scope.boundary->overlap_ratio}};
    } else {
        j["boundary"] = nullptr;
    }
    return j;
}

ScopeResult scope_from_json(const json& j) {
    ScopeResult scope;
    try {
        scope.name = j.at("name").get<std::string>();
        if (j.contains("region") && j["region"].is_string()) {
            scope.region = j["region"].get<std::string>();
        }
        scope.table = table_from_json(j.at("table"));
        if (j.contains("cells")) {
            const json& cells = j["cells"];
            scope.nodata_cells = cells.value("nodata", size_t{0});
            scope.rejected_cells = cells.value("rejected", size_t{0});
            scope.occupied_cells = cells.value("occupied", size_t{0});
        }
        scope.max_distance_km = j.value("max_distance_km", 0.0);
        if (j.contains("boundary") && j["boundary"].is_object()) {
            BoundaryDiagnostics diagnostics;
            diagnostics.area_km2 = j["boundary"].value("area_km2", 0.0);
            diagnostics.overlap_ratio = j["boundary"].value("overlap_ratio", 1.0);
            scope.boundary = diagnostics;
        }
    } catch (const json::exception& e) {
        throw FormatError(std::string("Malformed scope document: ") + e.what());
    }
    scope.table.validate(scope.name);
    return scope;
}

json region_to_json(const RegionResult& region, const std::vector<double>& no_access_thresholds_km) {
    return {
        {"name", region.name},
        {"members", region.members},
        {"table", table_to_json(region.table)},
        {"no_access", no_access_to_json(region.table, no_access_thresholds_km)}
    };
}

json audit_to_json(const RollupAudit& audit) {
    json excluded = json::array();
    for (const auto& scope : audit.excluded_scopes) {
        excluded.push_back({{"name", scope.name}, {"error", to_string(scope.kind)},
                            {"message", scope.message}});
    }
    return {
        {"unmapped_countries", audit.unmapped_countries},
        {"missing_members", audit.missing_members},
        {"empty_regions", audit.empty_regions},
        {"excluded_scopes", excluded}
    };
}

// ============================================================================
// ResultJsonWriter
// ============================================================================

ResultJsonWriter::ResultJsonWriter(std::string output_directory, std::string base_name)
    : output_directory_(std::move(output_directory)), base_name_(std::move(base_name)) {
}

bool ResultJsonWriter::write_document(const json& document, const std::string& path) const {
    Logger logger("ResultJsonWriter");

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        logger.error("Cannot create directory for " + path + ": " + ec.message());
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        logger.error("Failed to create JSON file: " + path);
        return false;
    }
    file << document.dump(2) << '\n';
    if (!file) {
        logger.error("Failed to write JSON file: " + path);
        return false;
    }
    logger.debug("Wrote " + path);
    return true;
}

bool ResultJsonWriter::write_countries(const std::vector<ScopeResult>& scopes,
                                       const RunMetadata& metadata,
                                       std::string* written_path) const {
    json countries = json::array();
    for (const auto& scope : scopes) {
        countries.push_back(scope_to_json(scope));
    }
    json document = {{"metadata", metadata_to_json(metadata)}, {"countries", countries}};

    const std::string path = (std::filesystem::path(output_directory_) /
                              (base_name_ + "_countries.json")).string();
    if (written_path) *written_path = path;
    return write_document(document, path);
}

bool ResultJsonWriter::write_regions(const RollupReport& report, const RunMetadata& metadata,
                                     std::string* written_path) const {
    json regions = json::array();
    for (const auto& region : report.regions) {
        regions.push_back(region_to_json(region, metadata.gap_thresholds_km));
    }
    json document = {
        {"metadata", metadata_to_json(metadata)},
        {"regions", regions},
        {"continent", report.continent
            ? region_to_json(*report.continent, metadata.gap_thresholds_km) : json(nullptr)},
        {"audit", audit_to_json(report.audit)}
    };

    const std::string path = (std::filesystem::path(output_directory_) /
                              (base_name_ + "_regions.json")).string();
    if (written_path) *written_path = path;
    return write_document(document, path);
}

std::string ResultJsonWriter::scope_path(const std::string& scope_name) const {
    return (std::filesystem::path(output_directory_) / "scopes" /
            (safe_file_stem(scope_name) + ".json")).string();
}

bool ResultJsonWriter::write_scope(const ScopeResult& scope, std::string* written_path) const {
    return write_scope(scope, safe_file_stem(scope.name), written_path);
}

bool ResultJsonWriter::write_scope(const ScopeResult& scope, const std::string& file_stem,
                                   std::string* written_path) const {
    const std::string path = (std::filesystem::path(output_directory_) / "scopes" /
                              (file_stem + ".json")).string();
    if (written_path) *written_path = path;
    return write_document(scope_to_json(scope), path);
}

std::vector<ScopeResult> read_scope_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    Logger logger("ResultJsonWriter");

    fs::path root(directory);
    if (fs::is_directory(root / "scopes")) {
        root /= "scopes";
    }
    if (!fs::is_directory(root)) {
        throw FormatError("Scope result directory does not exist: " + directory);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<ScopeResult> scopes;
    for (const auto& file : files) {
        std::ifstream in(file);
        if (!in.is_open()) {
            throw FormatError("Cannot open scope document " + file.string());
        }
        json document;
        try {
            in >> document;
        } catch (const json::exception& e) {
            throw FormatError("Cannot parse " + file.string() + ": " + e.what());
        }
        scopes.push_back(scope_from_json(document));
    }

    logger.info("Read " + std::to_string(scopes.size()) + " scope results from " + root.string());
    return scopes;
}

std::string safe_file_stem(const std::string& name) {
    std::string stem = name;
    for (char& ch : stem) {
        if (ch == '/' || ch == '\\' || ch == ':' || ch == '*' || ch == '?' ||
            ch == '"' || ch == '<' || ch == '>' || ch == '|') {
            ch = '_';
        }
    }
    return stem.empty() ? std::string("unnamed") : stem;
}

std::vector<std::string> unique_file_stems(const std::vector<std::string>& names) {
    std::vector<std::string> stems;
    std::set<std::string> taken;
    for (const auto& name : names) {
        const std::string base = safe_file_stem(name);
        std::string stem = base;
        for (int suffix = 2; taken.count(stem) > 0; ++suffix) {
            stem = base + "_" + std::to_string(suffix);
        }
        taken.insert(stem);
        stems.push_back(stem);
    }
    return stems;
}

} // namespace popaccess
