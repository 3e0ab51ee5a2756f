#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "core/AccessAggregator.hpp"
#include "core/RegionRollup.hpp"
#include "export/ResultJsonWriter.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace popaccess;
using json = nlohmann::json;

static ScopeResult MakeScope(const std::string& name, double urban, double rural, double rural_km) {
    DistanceBands bands;
    ScopeAccumulator acc(name, bands, {1.0, 5.0});

    CellRecord town;
    town.population = urban;
    town.urban_class = UrbanClass::URBAN;
    town.distance_km = 0.25;
    town.band = bands.band_of(town.distance_km);
    acc.add(town);

    CellRecord village;
    village.row = 3;
    village.population = rural;
    village.urban_class = UrbanClass::RURAL;
    village.distance_km = rural_km;
    village.band = bands.band_of(village.distance_km);
    acc.add(village);
    acc.count_nodata(4);

    ScopeResult result = acc.finish();
    result.region = "North";
    return result;
}

static void TestScopeDocument() {
    ScopeResult scope = MakeScope("Alpha", 120.5, 30.25, 7.0);
    json j = scope_to_json(scope);

    EXPECT_EQ(j["name"].get<std::string>(), std::string("Alpha"));
    EXPECT_EQ(j["region"].get<std::string>(), std::string("North"));
    EXPECT_NEAR(j["table"]["total"].get<double>(), 150.75, 1e-9);
    EXPECT_EQ(j["cells"]["nodata"].get<size_t>(), static_cast<size_t>(4));
    EXPECT_EQ(j["table"]["bands"].size(), static_cast<size_t>(8));
    EXPECT_TRUE(j["table"]["bands"][7]["upper_km"].is_null());

    const json& at_one = j["table"]["cumulative"][0];
    EXPECT_NEAR(at_one["coverage_urban"].get<double>(), 100.0, 1e-9);
    EXPECT_NEAR(at_one["coverage_rural"].get<double>(), 0.0, 1e-9);
    EXPECT_NEAR(at_one["no_access"].get<double>(), 30.25, 1e-9);
    EXPECT_NEAR(at_one["no_access_urban"].get<double>(), 0.0, 1e-9);
    EXPECT_NEAR(at_one["no_access_rural"].get<double>(), 30.25, 1e-9);

    ASSERT_TRUE(j["no_access"].size() == 2);
    EXPECT_NEAR(j["no_access"][0]["rural"].get<double>(), 30.25, 1e-9);
    EXPECT_NEAR(j["no_access"][1]["total"].get<double>(), 30.25, 1e-9);
    EXPECT_TRUE(j["placement"].is_null());
    EXPECT_NEAR(j["gap"]["coverage"][0]["gap_percent"].get<double>(), 100.0, 1e-9);

    ScopeResult restored = scope_from_json(j);
    EXPECT_EQ(restored.name, scope.name);
    EXPECT_EQ(restored.region, scope.region);
    EXPECT_TRUE(restored.table.total == scope.table.total);
    EXPECT_EQ(restored.nodata_cells, scope.nodata_cells);
    ASSERT_TRUE(restored.table.has_class_split());
    EXPECT_TRUE(restored.table.class_totals->rural == scope.table.class_totals->rural);
    EXPECT_FALSE(restored.table.bands[7].upper_km.has_value());
}

static void TestUnknownSplitIsNull() {
    ScopeResult scope = MakeScope("Beta", 10.0, 5.0, 2.0);
    scope.table.class_totals.reset();
    for (auto& row : scope.table.bands) row.split.reset();
    for (auto& row : scope.table.cumulative) row.split.reset();

    json j = scope_to_json(scope);
    EXPECT_TRUE(j["table"]["class_totals"]["urban"].is_null());
    EXPECT_TRUE(j["table"]["bands"][0]["rural"].is_null());
    EXPECT_TRUE(j["table"]["cumulative"][1]["coverage_urban"].is_null());
    EXPECT_TRUE(j["no_access"][0]["urban"].is_null());
    EXPECT_TRUE(j["table"]["cumulative"][0]["no_access_rural"].is_null());
    EXPECT_NEAR(j["table"]["cumulative"][0]["no_access"].get<double>(), 5.0, 1e-9);
    EXPECT_NEAR(j["no_access"][0]["total"].get<double>(), 5.0, 1e-9);

    AccessTable restored = table_from_json(j["table"]);
    EXPECT_FALSE(restored.has_class_split());
    EXPECT_FALSE(restored.bands[0].split.has_value());
}

static void TestMalformedDocuments() {
    EXPECT_THROW(table_from_json(json::object()), FormatError);
    EXPECT_THROW(table_from_json(json{{"total", "many"}, {"populated_cells", 1}}), FormatError);
    EXPECT_THROW(scope_from_json(json{{"table", json::object()}}), FormatError);

    // A stored table that no longer reconciles is rejected
    json j = scope_to_json(MakeScope("Gamma", 10.0, 5.0, 2.0));
    j["table"]["total"] = 99.0;
    EXPECT_THROW(scope_from_json(j), ReconciliationError);
}

static void TestRollupFromStoredScopes() {
    const fs::path dir = MakeTempPath("popaccess_results");
    ResultJsonWriter writer(dir.string(), "africa");

    std::vector<ScopeResult> scopes = {
        MakeScope("Alpha", 100.0, 50.0, 3.0),
        MakeScope("Beta", 40.0, 60.0, 30.0),
        MakeScope("Gamma/Delta", 7.0, 3.0, 0.5),
    };
    for (const auto& scope : scopes) {
        std::string path;
        EXPECT_TRUE(writer.write_scope(scope, &path));
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_EQ(fs::path(writer.scope_path("Gamma/Delta")).filename().string(), std::string("Gamma_Delta.json"));

    RegionDefinitions defs;
    defs.add_region("North", {"Alpha", "Beta"});
    defs.add_region("South", {"Gamma/Delta"});
    RollupReport direct = rollup_regions(scopes, defs);

    std::vector<ScopeResult> stored = read_scope_directory(dir.string());
    ASSERT_TRUE(stored.size() == 3);
    EXPECT_EQ(stored[0].name, std::string("Alpha"));
    RollupReport rebuilt = rollup_regions(stored, defs);

    ASSERT_TRUE(rebuilt.regions.size() == direct.regions.size());
    for (size_t i = 0; i < direct.regions.size(); ++i) {
        const AccessTable& a = direct.regions[i].table;
        const AccessTable& b = rebuilt.regions[i].table;
        EXPECT_TRUE(a.total == b.total);
        for (size_t k = 0; k < a.bands.size(); ++k) {
            EXPECT_TRUE(a.bands[k].population == b.bands[k].population);
        }
        for (size_t k = 0; k < a.cumulative.size(); ++k) {
            EXPECT_TRUE(a.cumulative[k].reachable == b.cumulative[k].reachable);
        }
    }
    EXPECT_TRUE(rebuilt.continent->table.total == direct.continent->table.total);

    // The scopes/ subdirectory is accepted directly
    EXPECT_EQ(read_scope_directory((dir / "scopes").string()).size(), static_cast<size_t>(3));

    RunMetadata metadata;
    metadata.version = "test";
    metadata.classification = "sign";
    std::string regions_path;
    EXPECT_TRUE(writer.write_regions(direct, metadata, &regions_path));
    std::ifstream in(regions_path);
    json document = json::parse(in);
    EXPECT_EQ(document["regions"].size(), static_cast<size_t>(2));
    EXPECT_EQ(document["continent"]["name"].get<std::string>(), std::string("ALL"));
    EXPECT_TRUE(document["audit"]["unmapped_countries"].empty());
    EXPECT_EQ(document["metadata"]["classification"].get<std::string>(), std::string("sign"));

    std::string countries_path;
    EXPECT_TRUE(writer.write_countries(scopes, metadata, &countries_path));
    EXPECT_TRUE(fs::exists(countries_path));

    std::error_code ec;
    fs::remove_all(dir, ec);

    EXPECT_THROW(read_scope_directory(dir.string()), FormatError);
}

static void TestRegionNoAccess() {
    std::vector<ScopeResult> scopes = {
        MakeScope("Alpha", 100.0, 50.0, 3.0),
        MakeScope("Beta", 40.0, 60.0, 30.0),
    };
    RegionDefinitions defs;
    defs.add_region("North", {"Alpha", "Beta"});
    RollupReport report = rollup_regions(scopes, defs);
    ASSERT_TRUE(report.regions.size() == 1);

    json region = region_to_json(report.regions[0], {1.0, 5.0});
    ASSERT_TRUE(region["no_access"].size() == 2);
    // Both villages lie beyond 1 km, only Beta's lies beyond 5 km
    EXPECT_NEAR(region["no_access"][0]["total"].get<double>(), 110.0, 1e-9);
    EXPECT_NEAR(region["no_access"][0]["urban"].get<double>(), 0.0, 1e-9);
    EXPECT_NEAR(region["no_access"][0]["rural"].get<double>(), 110.0, 1e-9);
    EXPECT_NEAR(region["no_access"][1]["rural"].get<double>(), 60.0, 1e-9);
    EXPECT_NEAR(region["no_access"][1]["threshold_km"].get<double>(), 5.0, 1e-12);

    EXPECT_TRUE(region_to_json(report.regions[0])["no_access"].empty());
    EXPECT_THROW(no_access_to_json(report.regions[0].table, {2.0}), std::invalid_argument);

    RegionResult unknown = report.regions[0];
    unknown.table.class_totals.reset();
    for (auto& row : unknown.table.bands) row.split.reset();
    for (auto& row : unknown.table.cumulative) row.split.reset();
    json without_split = region_to_json(unknown, {5.0});
    EXPECT_TRUE(without_split["no_access"][0]["urban"].is_null());
    EXPECT_NEAR(without_split["no_access"][0]["total"].get<double>(), 60.0, 1e-9);
}

static void TestUniqueFileStems() {
    const auto stems = unique_file_stems({"A/B", "A_B", "C", "A:B", "A_B_2"});
    ASSERT_TRUE(stems.size() == 5);
    EXPECT_EQ(stems[0], std::string("A_B"));
    EXPECT_EQ(stems[1], std::string("A_B_2"));
    EXPECT_EQ(stems[2], std::string("C"));
    EXPECT_EQ(stems[3], std::string("A_B_3"));
    EXPECT_EQ(stems[4], std::string("A_B_2_2"));

    const fs::path dir = MakeTempPath("popaccess_stems");
    ResultJsonWriter writer(dir.string(), "africa");
    std::string first, second;
    EXPECT_TRUE(writer.write_scope(MakeScope("A/B", 1.0, 1.0, 2.0), stems[0], &first));
    EXPECT_TRUE(writer.write_scope(MakeScope("A_B", 2.0, 2.0, 2.0), stems[1], &second));
    EXPECT_NE(first, second);
    EXPECT_EQ(fs::path(second).filename().string(), std::string("A_B_2.json"));

    std::vector<ScopeResult> stored = read_scope_directory(dir.string());
    ASSERT_TRUE(stored.size() == 2);
    std::vector<std::string> names = {stored[0].name, stored[1].name};
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names[0], std::string("A/B"));
    EXPECT_EQ(names[1], std::string("A_B"));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    TestScopeDocument();
    TestUnknownSplitIsNull();
    TestMalformedDocuments();
    TestRollupFromStoredScopes();
    TestRegionNoAccess();
    TestUniqueFileStems();
    return ReportResult("popaccess_result_json_tests");
}
