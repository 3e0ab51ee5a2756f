#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/InputValidator.hpp"

#include <fstream>

using namespace popaccess;

/// Owns argv storage for CommandLineInterface::parse_arguments
struct ArgumentList {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit ArgumentList(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "popaccess");
        for (auto& arg : storage) pointers.push_back(arg.data());
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }
};

static bool Parse(CommandLineInterface& cli, std::vector<std::string> args) {
    ArgumentList list(std::move(args));
    return cli.parse_arguments(list.argc(), list.argv());
}

static void TestDistanceLists() {
    auto list = ConfigurationManager::parse_distance_list(" 1, 2.5 ,10 ");
    ASSERT_TRUE(list.size() == 3);
    EXPECT_EQ(list[1], 2.5);

    auto range = ConfigurationManager::parse_distance_list("1:100:1");
    ASSERT_TRUE(range.size() == 100);
    EXPECT_EQ(range.front(), 1.0);
    EXPECT_EQ(range.back(), 100.0);

    // Stop is included even when the step does not divide exactly in binary
    auto tenths = ConfigurationManager::parse_distance_list("0.1:0.5:0.1");
    ASSERT_TRUE(tenths.size() == 5);
    EXPECT_NEAR(tenths.back(), 0.5, 1e-12);

    auto uneven = ConfigurationManager::parse_distance_list("5:12:5");
    EXPECT_EQ(uneven.size(), static_cast<size_t>(2));

    EXPECT_THROW(ConfigurationManager::parse_distance_list("1,two,3"), ConfigurationError);
    EXPECT_THROW(ConfigurationManager::parse_distance_list("1:5"), ConfigurationError);
    EXPECT_THROW(ConfigurationManager::parse_distance_list("5:1:1"), ConfigurationError);
    EXPECT_THROW(ConfigurationManager::parse_distance_list("1:5:0"), ConfigurationError);
    EXPECT_TRUE(ConfigurationManager::parse_distance_list("").empty());

    auto names = ConfigurationManager::parse_string_list("json, csv,,");
    ASSERT_TRUE(names.size() == 2);
    EXPECT_EQ(names[1], std::string("csv"));

    EXPECT_TRUE(ConfigurationManager::parse_policy("sign") == ClassificationPolicy::SIGN);
    EXPECT_THROW(ConfigurationManager::parse_policy("density"), ConfigurationError);
}

static void TestJsonConfiguration() {
    ConfigurationManager manager;
    manager.load_from_string(R"({
        "population_raster": "africa_pop.tif",
        "population_band": 2,
        "nodata": -9999,
        "features": "roads.gpkg",
        "feature_filter_field": "GP_RTP",
        "feature_filter_values": [1, "2"],
        "classification_policy": "sign",
        "cumulative_thresholds_km": "1:10:1",
        "gap_thresholds_km": [2, 10],
        "output_formats": "json",
        "threads": 4
    })");

    const AnalysisConfig& config = manager.to_analysis_config();
    EXPECT_EQ(config.population_raster, std::string("africa_pop.tif"));
    EXPECT_EQ(config.population_band, std::string("2"));
    ASSERT_TRUE(config.nodata_override.has_value());
    EXPECT_EQ(*config.nodata_override, -9999.0);
    ASSERT_TRUE(config.feature_filter_values.size() == 2);
    EXPECT_EQ(config.feature_filter_values[0], std::string("1"));
    EXPECT_TRUE(config.classification_policy == ClassificationPolicy::SIGN);
    EXPECT_EQ(config.cumulative_thresholds_km.size(), static_cast<size_t>(10));
    EXPECT_EQ(config.gap_thresholds_km.back(), 10.0);
    EXPECT_EQ(config.output_formats.size(), static_cast<size_t>(1));
    EXPECT_EQ(config.num_threads, 4);
    // Keys not in the document keep their defaults
    EXPECT_EQ(config.base_name, std::string("accessibility"));
    EXPECT_EQ(config.distance_bands_km.size(), static_cast<size_t>(7));

    // Serialized form loads back to the same settings
    ConfigurationManager copy;
    copy.load_from_string(manager.to_json_string());
    const AnalysisConfig& reloaded = copy.to_analysis_config();
    EXPECT_EQ(reloaded.population_band, config.population_band);
    EXPECT_TRUE(reloaded.nodata_override == config.nodata_override);
    EXPECT_TRUE(reloaded.feature_filter_values == config.feature_filter_values);
    EXPECT_TRUE(reloaded.cumulative_thresholds_km == config.cumulative_thresholds_km);
    EXPECT_TRUE(reloaded.classification_policy == config.classification_policy);
    EXPECT_FALSE(reloaded.density_threshold.has_value());
}

static void TestMalformedConfiguration() {
    ConfigurationManager manager;
    manager.load_from_string(R"({"base_name": "kept"})");

    EXPECT_THROW(manager.load_from_string("{ not json"), ConfigurationError);
    EXPECT_THROW(manager.load_from_string("[1, 2]"), ConfigurationError);
    EXPECT_THROW(manager.load_from_string(R"({"threads": "many"})"), ConfigurationError);
    EXPECT_THROW(manager.load_from_string(R"({"distance_bands_km": [1, "x"]})"), ConfigurationError);
    EXPECT_THROW(manager.load_from_string(R"({"classification_policy": "mixed"})"), ConfigurationError);
    EXPECT_THROW(manager.load_from_string(R"({"base_name": "lost", "threads": "many"})"), ConfigurationError);

    // A failed load leaves the previous settings intact
    EXPECT_EQ(manager.to_analysis_config().base_name, std::string("kept"));

    EXPECT_FALSE(manager.load_from_file("/nonexistent/popaccess/config.json"));
}

static void TestCommandLine() {
    CommandLineInterface cli;
    EXPECT_TRUE(Parse(cli, {"--population", "pop.tif", "-f", "roads.shp", "--nodata", "-9999",
                            "--thresholds", "1:5:1", "--policy", "sign", "--filter-values", "1,2",
                            "--cell-detail", "-j", "2", "--output-dir", "results/"}));
    const AnalysisConfig& config = cli.get_config();
    EXPECT_EQ(config.population_raster, std::string("pop.tif"));
    EXPECT_EQ(config.features_path, std::string("roads.shp"));
    ASSERT_TRUE(config.nodata_override.has_value());
    EXPECT_EQ(*config.nodata_override, -9999.0);
    EXPECT_EQ(config.cumulative_thresholds_km.size(), static_cast<size_t>(5));
    EXPECT_TRUE(config.classification_policy == ClassificationPolicy::SIGN);
    EXPECT_EQ(config.feature_filter_values.size(), static_cast<size_t>(2));
    EXPECT_TRUE(config.write_cell_detail);
    EXPECT_EQ(config.num_threads, 2);
    EXPECT_EQ(config.output_directory, std::string("results"));
    EXPECT_FALSE(cli.is_dry_run());

    CommandLineInterface unknown;
    EXPECT_FALSE(Parse(unknown, {"--population", "pop.tif", "--colour", "red"}));
    EXPECT_EQ(unknown.exit_code(), 1);

    CommandLineInterface bad_number;
    EXPECT_FALSE(Parse(bad_number, {"--threshold", "lots"}));
    EXPECT_EQ(bad_number.exit_code(), 1);

    CommandLineInterface stray;
    EXPECT_FALSE(Parse(stray, {"pop.tif"}));
    EXPECT_EQ(stray.exit_code(), 1);

    CommandLineInterface version;
    EXPECT_FALSE(Parse(version, {"--version"}));
    EXPECT_EQ(version.exit_code(), 0);
}

static void TestConfigFileThenCommandLine() {
    const fs::path path = MakeTempPath("popaccess_config").string() + ".json";

    CommandLineInterface creator;
    EXPECT_FALSE(Parse(creator, {"--create-config", path.string()}));
    EXPECT_EQ(creator.exit_code(), 0);
    ASSERT_TRUE(fs::exists(path));

    {
        std::ofstream out(path);
        out << R"({"population_raster": "from_file.tif", "features": "file_roads.gpkg", "base_name": "file"})";
    }

    // Command line options win over the file
    CommandLineInterface cli;
    EXPECT_TRUE(Parse(cli, {"--config", path.string(), "--base-name", "cli", "--dry-run"}));
    EXPECT_EQ(cli.get_config().population_raster, std::string("from_file.tif"));
    EXPECT_EQ(cli.get_config().base_name, std::string("cli"));
    EXPECT_TRUE(cli.is_dry_run());

    CommandLineInterface missing;
    EXPECT_FALSE(Parse(missing, {"--config", path.string() + ".missing"}));
    EXPECT_EQ(missing.exit_code(), 1);

    std::error_code ec;
    fs::remove(path, ec);
}

static AnalysisConfig ValidConfig() {
    AnalysisConfig config;
    config.population_raster = "pop.tif";
    config.features_path = "roads.gpkg";
    return config;
}

static bool Mentions(const ValidationResult& result, const std::string& text) {
    for (const auto& conflict : result.conflicts) {
        if (conflict.description.find(text) != std::string::npos) return true;
    }
    return false;
}

static void TestValidator() {
    InputValidator validator;
    EXPECT_FALSE(validator.validate(ValidConfig(), false).has_errors());

    AnalysisConfig sign_with_threshold = ValidConfig();
    sign_with_threshold.classification_policy = ClassificationPolicy::SIGN;
    sign_with_threshold.density_threshold = 500.0;
    ValidationResult r1 = validator.validate(sign_with_threshold, false);
    EXPECT_TRUE(r1.has_errors());
    EXPECT_TRUE(Mentions(r1, "sign policy"));

    AnalysisConfig two_scope_sources = ValidConfig();
    two_scope_sources.boundaries_path = "countries.gpkg";
    two_scope_sources.country_rasters_dir = "rasters";
    EXPECT_TRUE(Mentions(validator.validate(two_scope_sources, false), "not both"));

    AnalysisConfig no_features = ValidConfig();
    no_features.features_path.clear();
    EXPECT_TRUE(Mentions(validator.validate(no_features, false), "reference features"));

    // Every problem is reported at once
    AnalysisConfig many = ValidConfig();
    many.distance_bands_km = {5, 2};
    many.output_formats = {"json", "xlsx"};
    many.log_level = 9;
    many.feature_filter_field = "GP_RTP";
    ValidationResult r2 = validator.validate(many, false);
    EXPECT_EQ(r2.conflicts.size(), static_cast<size_t>(4));
    const std::string message = r2.format_error_message();
    EXPECT_TRUE(message.find("Conflict 4:") != std::string::npos);
    EXPECT_TRUE(message.find("Suggested solutions:") != std::string::npos);

    AnalysisConfig untabulated_gap = ValidConfig();
    untabulated_gap.cumulative_thresholds_km = {10.0, 20.0};
    ValidationResult r3 = validator.validate(untabulated_gap, false);
    EXPECT_EQ(r3.conflicts.size(), static_cast<size_t>(1));
    EXPECT_TRUE(Mentions(r3, "Gap thresholds must be among the cumulative thresholds"));
    untabulated_gap.gap_thresholds_km = {10.0};
    EXPECT_FALSE(validator.validate(untabulated_gap, false).has_errors());

    // Default thresholds run 1..100 km and tabulate the default gap thresholds
    AnalysisConfig far_gap = ValidConfig();
    far_gap.gap_thresholds_km = {2.5};
    EXPECT_TRUE(Mentions(validator.validate(far_gap, false), "Gap thresholds"));

    AnalysisConfig rollup;
    rollup.rollup_only_dir = "previous_run";
    EXPECT_FALSE(validator.validate(rollup, false).has_errors());
    rollup.write_cell_detail = true;
    EXPECT_TRUE(validator.validate(rollup, false).has_errors());

    AnalysisConfig missing_files = ValidConfig();
    missing_files.population_raster = "/nonexistent/popaccess/pop.tif";
    EXPECT_FALSE(validator.validate(missing_files, false).has_errors());
    EXPECT_TRUE(validator.validate(missing_files, true).has_errors());
    EXPECT_THROW(validator.validate_or_throw(missing_files), ConfigurationError);
}

int main() {
    TestDistanceLists();
    TestJsonConfiguration();
    TestMalformedConfiguration();
    TestCommandLine();
    TestConfigFileThenCommandLine();
    TestValidator();
    return ReportResult("popaccess_config_tests");
}
