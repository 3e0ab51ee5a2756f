#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "core/AccessAggregator.hpp"
#include "core/CellClassifier.hpp"

#include <limits>
#include <random>

using namespace popaccess;

static const std::vector<double> kThresholds = {1.0, 2.0, 5.0};

static CellRecord Record(size_t row, size_t col, double population, UrbanClass cls,
                         double distance_km, const DistanceBands& bands) {
    CellRecord record;
    record.row = row;
    record.col = col;
    record.population = population;
    record.urban_class = cls;
    record.distance_km = distance_km;
    record.band = bands.band_of(distance_km);
    return record;
}

/// Four urban cells of 100 and four rural cells of 50 around a road at (0,0)
static ScopeResult FourByFourScope(const DistanceBands& bands) {
    ScopeAccumulator acc("Testland", bands, kThresholds);
    acc.add(Record(0, 0, 100.0, UrbanClass::URBAN, 0.0, bands));
    acc.add(Record(0, 1, 100.0, UrbanClass::URBAN, 1.0, bands));
    acc.add(Record(1, 0, 100.0, UrbanClass::URBAN, 1.0, bands));
    acc.add(Record(1, 1, 100.0, UrbanClass::URBAN, std::sqrt(2.0), bands));
    acc.add(Record(0, 2, 50.0, UrbanClass::RURAL, 2.0, bands));
    acc.add(Record(0, 3, 50.0, UrbanClass::RURAL, 3.0, bands));
    acc.add(Record(1, 2, 50.0, UrbanClass::RURAL, std::sqrt(5.0), bands));
    acc.add(Record(1, 3, 50.0, UrbanClass::RURAL, std::sqrt(10.0), bands));
    acc.count_nodata(2);
    return acc.finish();
}

static void TestFourByFourTables() {
    DistanceBands bands;
    ScopeResult result = FourByFourScope(bands);
    const AccessTable& table = result.table;

    EXPECT_EQ(result.name, std::string("Testland"));
    EXPECT_EQ(result.nodata_cells, static_cast<size_t>(2));
    EXPECT_EQ(table.populated_cells, static_cast<size_t>(8));
    EXPECT_NEAR(table.total.value(), 600.0, 1e-9);
    ASSERT_TRUE(table.has_class_split());
    EXPECT_NEAR(table.class_totals->urban.value(), 400.0, 1e-9);
    EXPECT_NEAR(table.class_totals->rural.value(), 200.0, 1e-9);
    EXPECT_EQ(table.class_totals->urban_cells, static_cast<size_t>(4));

    ASSERT_TRUE(table.bands.size() == bands.band_count());
    const BandRow& nearest = table.bands[0];
    EXPECT_EQ(nearest.label, std::string("0-1km"));
    EXPECT_EQ(nearest.cells, static_cast<size_t>(3));
    ASSERT_TRUE(nearest.split.has_value());
    EXPECT_NEAR(nearest.split->urban.value(), 300.0, 1e-9);
    EXPECT_TRUE(nearest.split->rural.is_zero());

    // (1,1] holds the diagonal urban cell and the rural cell at exactly 2 km
    EXPECT_NEAR(table.bands[1].population.value(), 150.0, 1e-9);
    EXPECT_NEAR(table.bands[2].population.value(), 150.0, 1e-9);
    EXPECT_TRUE(table.bands[3].population.is_zero());

    ASSERT_TRUE(table.cumulative.size() == kThresholds.size());
    EXPECT_NEAR(table.cumulative[0].reachable.value(), 300.0, 1e-9);
    EXPECT_NEAR(table.cumulative[1].reachable.value(), 450.0, 1e-9);
    EXPECT_NEAR(table.cumulative[2].reachable.value(), 600.0, 1e-9);
    EXPECT_EQ(table.cumulative[2].cells, static_cast<size_t>(8));

    EXPECT_NEAR(result.max_distance_km, std::sqrt(10.0), 1e-12);
}

static void TestCoverageGap() {
    DistanceBands bands;
    ScopeResult result = FourByFourScope(bands);
    ASSERT_TRUE(result.gap.has_value());
    const AccessGap& gap = *result.gap;

    ASSERT_TRUE(gap.coverage.size() == 2);
    EXPECT_NEAR(gap.coverage[0].threshold_km, 1.0, 1e-12);
    EXPECT_NEAR(gap.coverage[0].urban_percent, 75.0, 1e-9);
    EXPECT_NEAR(gap.coverage[0].rural_percent, 0.0, 1e-9);
    EXPECT_NEAR(gap.coverage[0].gap_percent(), 75.0, 1e-9);
    EXPECT_NEAR(gap.coverage[1].urban_percent, 100.0, 1e-9);
    EXPECT_NEAR(gap.coverage[1].rural_percent, 100.0, 1e-9);

    const double urban_mean = (0.0 + 1.0 + 1.0 + std::sqrt(2.0)) / 4.0;
    const double rural_mean = (2.0 + 3.0 + std::sqrt(5.0) + std::sqrt(10.0)) / 4.0;
    ASSERT_TRUE(gap.urban_mean_distance_km.has_value());
    EXPECT_NEAR(*gap.urban_mean_distance_km, urban_mean, 1e-9);
    EXPECT_NEAR(*gap.rural_mean_distance_km, rural_mean, 1e-9);
    EXPECT_NEAR(*gap.mean_distance_gap_km(), rural_mean - urban_mean, 1e-9);

    ASSERT_TRUE(result.urban_stats.has_value());
    EXPECT_EQ(result.urban_stats->cells, static_cast<size_t>(4));
    EXPECT_NEAR(result.urban_stats->mean, 100.0, 1e-12);
    EXPECT_NEAR(result.urban_stats->stddev, 0.0, 1e-12);
    EXPECT_NEAR(result.rural_stats->max, 50.0, 1e-12);
}

static void TestNoAccess() {
    DistanceBands bands;
    ScopeResult result = FourByFourScope(bands);

    NoAccess at_one = result.table.no_access(1.0);
    EXPECT_NEAR(at_one.total.value(), 300.0, 1e-9);
    ASSERT_TRUE(at_one.urban.has_value() && at_one.rural.has_value());
    EXPECT_NEAR(at_one.urban->value(), 100.0, 1e-9);
    EXPECT_NEAR(at_one.rural->value(), 200.0, 1e-9);

    EXPECT_TRUE(result.table.no_access(5.0).total.is_zero());
    EXPECT_THROW(result.table.no_access(3.0), std::invalid_argument);
}

static void TestMergeDropsUnknownSplit() {
    DistanceBands bands;
    ScopeResult a = FourByFourScope(bands);
    ScopeResult b = FourByFourScope(bands);

    AccessTable combined = a.table;
    combined.merge(b.table, "pair");
    EXPECT_NEAR(combined.total.value(), 1200.0, 1e-9);
    ASSERT_TRUE(combined.has_class_split());
    EXPECT_NEAR(combined.class_totals->urban.value(), 800.0, 1e-9);
    combined.validate("pair");

    // A member without a class split leaves the combined split unknown
    AccessTable unsplit = b.table;
    unsplit.class_totals.reset();
    for (auto& row : unsplit.bands) row.split.reset();
    for (auto& row : unsplit.cumulative) row.split.reset();

    AccessTable partial = a.table;
    partial.merge(unsplit, "partial");
    EXPECT_FALSE(partial.has_class_split());
    EXPECT_NEAR(partial.total.value(), 1200.0, 1e-9);
    partial.validate("partial");

    NoAccess residual = partial.no_access(1.0);
    EXPECT_NEAR(residual.total.value(), 600.0, 1e-9);
    EXPECT_FALSE(residual.urban.has_value());
    EXPECT_FALSE(residual.rural.has_value());

    AccessTable empty = a.table.empty_like();
    EXPECT_TRUE(empty.total.is_zero());
    EXPECT_EQ(empty.bands.size(), a.table.bands.size());
    EXPECT_EQ(empty.bands[4].label, a.table.bands[4].label);
    empty.merge(a.table, "empty");
    EXPECT_TRUE(empty.total == a.table.total);
}

static void TestReconciliationFailures() {
    DistanceBands bands;
    ScopeResult result = FourByFourScope(bands);

    AccessTable broken_total = result.table;
    broken_total.total += PopulationCount::from_value(1.0);
    EXPECT_THROW(broken_total.validate("broken"), ReconciliationError);

    AccessTable broken_monotone = result.table;
    broken_monotone.cumulative[1].reachable = PopulationCount::from_value(100.0);
    broken_monotone.cumulative[1].split.reset();
    EXPECT_THROW(broken_monotone.validate("broken"), ReconciliationError);

    AccessTable broken_split = result.table;
    broken_split.bands[0].split->rural = PopulationCount::from_value(5.0);
    EXPECT_THROW(broken_split.validate("broken"), ReconciliationError);

    // Reachable totals stay monotone while the rural series falls from 60 to 50
    AccessTable rural_falls = result.table;
    rural_falls.cumulative[0].split->urban = PopulationCount::from_value(240.0);
    rural_falls.cumulative[0].split->rural = PopulationCount::from_value(60.0);
    EXPECT_THROW(rural_falls.validate("broken"), ReconciliationError);

    AccessTable urban_falls = result.table;
    urban_falls.cumulative[1].split->urban = PopulationCount::from_value(290.0);
    urban_falls.cumulative[1].split->rural = PopulationCount::from_value(160.0);
    EXPECT_THROW(urban_falls.validate("broken"), ReconciliationError);

    AccessTable split_mismatch = result.table;
    split_mismatch.cumulative[2].split->rural = PopulationCount::from_value(150.0);
    EXPECT_THROW(split_mismatch.validate("broken"), ReconciliationError);

    DistanceBands coarse({10.0});
    ScopeAccumulator other("Coarse", coarse, kThresholds);
    other.add(Record(0, 0, 10.0, UrbanClass::RURAL, 3.0, coarse));
    AccessTable mismatched = result.table;
    EXPECT_THROW(mismatched.merge(other.finish().table, "mixed"), ReconciliationError);
}

static void TestFractionalPopulationSumsExactly() {
    DistanceBands bands;
    ScopeAccumulator acc("Fractions", bands, kThresholds, {});
    double expected = 0.0;
    for (int i = 0; i < 1000; ++i) {
        const double population = 0.1 + 0.001 * i;
        const double distance = 0.013 * i;
        expected += population;
        acc.add(Record(0, static_cast<size_t>(i), population,
                       i % 3 == 0 ? UrbanClass::URBAN : UrbanClass::RURAL, distance, bands));
    }
    ScopeResult result = acc.finish();
    EXPECT_NEAR(result.table.total.value(), expected, 1e-3);

    PopulationCount band_sum;
    for (const auto& row : result.table.bands) band_sum += row.population;
    EXPECT_TRUE(band_sum == result.table.total);
    EXPECT_TRUE(result.gap->coverage.empty());
}

static void TestThresholdValidation() {
    validate_thresholds({0.5, 1.0, 20.0}, "Thresholds");
    EXPECT_THROW(validate_thresholds({}, "Thresholds"), ConfigurationError);
    EXPECT_THROW(validate_thresholds({1.0, 1.0}, "Thresholds"), ConfigurationError);
    EXPECT_THROW(validate_thresholds({-1.0, 2.0}, "Thresholds"), ConfigurationError);

    DistanceBands bands;
    EXPECT_THROW(ScopeAccumulator("bad", bands, {5.0, 2.0}), ConfigurationError);

    ScopeAccumulator acc("bounds", bands, kThresholds);
    CellRecord record;
    record.population = 1.0;
    record.band = bands.band_count();
    EXPECT_THROW(acc.add(record), std::out_of_range);
}

static void TestGapThresholdsMustBeTabulated() {
    validate_gap_thresholds({1.0, 5.0}, kThresholds);
    validate_gap_thresholds({}, {1.0});
    EXPECT_THROW(validate_gap_thresholds({1.0, 5.0}, {1.0, 2.0}), ConfigurationError);

    DistanceBands bands;
    EXPECT_THROW(ScopeAccumulator("far", bands, {10.0, 20.0}), ConfigurationError);
    ScopeAccumulator explicit_gaps("far", bands, {10.0, 20.0}, {20.0});
    explicit_gaps.add(Record(0, 0, 5.0, UrbanClass::RURAL, 15.0, bands));
    ScopeResult result = explicit_gaps.finish();
    ASSERT_TRUE(result.gap->coverage.size() == 1);
    EXPECT_NEAR(result.gap->coverage[0].rural_percent, 100.0, 1e-9);
}

static void TestNonFiniteOrHugePopulationRejected() {
    EXPECT_THROW(PopulationCount::from_value(std::numeric_limits<double>::infinity()), FormatError);
    EXPECT_THROW(PopulationCount::from_value(std::numeric_limits<double>::quiet_NaN()), FormatError);
    EXPECT_THROW(PopulationCount::from_value(1.0e13), FormatError);
    EXPECT_NEAR(PopulationCount::from_value(-2.5).value(), -2.5, 1e-12);

    DistanceBands bands;
    ScopeAccumulator acc("Overflow", bands, kThresholds);
    acc.add(Record(0, 0, 10.0, UrbanClass::URBAN, 0.5, bands));
    EXPECT_THROW(acc.add(Record(0, 1, std::numeric_limits<double>::infinity(), UrbanClass::RURAL,
                                0.5, bands)),
                 FormatError);
    // The rejected cell left no trace
    ScopeResult result = acc.finish();
    EXPECT_NEAR(result.table.total.value(), 10.0, 1e-12);
    EXPECT_EQ(result.table.populated_cells, static_cast<size_t>(1));
}

static void TestRandomScopesKeepTableProperties() {
    const std::vector<double> thresholds = {1.0, 2.0, 5.0, 10.0, 25.0, 50.0, 100.0};
    DistanceBands bands;
    std::mt19937 rng(20240611u);
    std::uniform_int_distribution<int> cell_count(1, 60);
    std::uniform_real_distribution<double> population(0.001, 5000.0);
    std::uniform_real_distribution<double> distance(0.0, 150.0);
    std::bernoulli_distribution is_urban(0.4);

    for (int trial = 0; trial < 200; ++trial) {
        ScopeAccumulator acc("Random", bands, thresholds);
        const int cells = cell_count(rng);
        for (int i = 0; i < cells; ++i) {
            acc.add(Record(0, static_cast<size_t>(i), population(rng),
                           is_urban(rng) ? UrbanClass::URBAN : UrbanClass::RURAL, distance(rng), bands));
        }
        const ScopeResult result = acc.finish();
        const AccessTable& table = result.table;
        ASSERT_TRUE(table.has_class_split());

        double band_share = 0.0;
        for (const auto& row : table.bands) band_share += PopulationCount::share(row.population, table.total);
        EXPECT_NEAR(band_share, 1.0, 1e-3);
        EXPECT_NEAR(PopulationCount::share(table.class_totals->urban, table.total) +
                    PopulationCount::share(table.class_totals->rural, table.total), 1.0, 1e-3);

        PopulationCount previous_urban;
        PopulationCount previous_rural;
        for (const auto& row : table.cumulative) {
            const NoAccess residual = table.no_access(row.threshold_km);
            EXPECT_TRUE(residual.total.value() >= 0.0);
            EXPECT_TRUE(residual.urban->value() >= 0.0);
            EXPECT_TRUE(residual.rural->value() >= 0.0);
            EXPECT_TRUE(previous_urban <= row.split->urban);
            EXPECT_TRUE(previous_rural <= row.split->rural);
            previous_urban = row.split->urban;
            previous_rural = row.split->rural;
        }
    }
}

int main() {
    TestFourByFourTables();
    TestCoverageGap();
    TestNoAccess();
    TestMergeDropsUnknownSplit();
    TestReconciliationFailures();
    TestFractionalPopulationSumsExactly();
    TestThresholdValidation();
    TestGapThresholdsMustBeTabulated();
    TestNonFiniteOrHugePopulationRejected();
    TestRandomScopesKeepTableProperties();
    return ReportResult("popaccess_aggregation_tests");
}
