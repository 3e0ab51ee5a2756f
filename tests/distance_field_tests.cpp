#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "core/DistanceField.hpp"

#include <limits>
#include <random>

using namespace popaccess;

static OccupancyGrid MakeOccupancy(size_t rows, size_t cols,
                                   const std::vector<std::pair<size_t, size_t>>& occupied) {
    OccupancyGrid grid(rows, cols, GeoTransform::north_up(kOriginX, kOriginY, 1000.0, 1000.0));
    for (const auto& [r, c] : occupied) {
        grid.mark(r, c);
    }
    return grid;
}

static double BruteForce(const OccupancyGrid& grid, size_t row, size_t col, double sx, double sy) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t r = 0; r < grid.rows(); ++r) {
        for (size_t c = 0; c < grid.cols(); ++c) {
            if (!grid.occupied(r, c)) continue;
            const double dy = (static_cast<double>(r) - static_cast<double>(row)) * sy;
            const double dx = (static_cast<double>(c) - static_cast<double>(col)) * sx;
            best = std::min(best, std::sqrt(dx * dx + dy * dy));
        }
    }
    return best;
}

static void TestSingleSourceDistances() {
    OccupancyGrid grid = MakeOccupancy(4, 4, {{0, 0}});
    DistanceField field = compute_distances(grid, 1.0, 1.0);

    EXPECT_EQ(field.rows(), static_cast<size_t>(4));
    EXPECT_EQ(field.cols(), static_cast<size_t>(4));
    EXPECT_EQ(field.at(0, 0), 0.0);
    EXPECT_EQ(field.at(0, 1), 1.0);
    EXPECT_EQ(field.at(1, 0), 1.0);
    EXPECT_NEAR(field.at(1, 1), std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(field.at(0, 2), 2.0, 1e-12);
    EXPECT_NEAR(field.at(1, 3), std::sqrt(10.0), 1e-12);
    EXPECT_NEAR(field.max_km(), std::sqrt(18.0), 1e-12);
}

static void TestMatchesBruteForceOnRandomGrids() {
    std::mt19937 rng(20240611u);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (int trial = 0; trial < 12; ++trial) {
        const size_t rows = 3 + static_cast<size_t>(unit(rng) * 25.0);
        const size_t cols = 3 + static_cast<size_t>(unit(rng) * 25.0);
        const double density = 0.01 + unit(rng) * 0.2;

        std::vector<std::pair<size_t, size_t>> occupied;
        for (size_t r = 0; r < rows; ++r) {
            for (size_t c = 0; c < cols; ++c) {
                if (unit(rng) < density) occupied.emplace_back(r, c);
            }
        }
        if (occupied.empty()) occupied.emplace_back(rows / 2, cols / 2);
        OccupancyGrid grid = MakeOccupancy(rows, cols, occupied);

        const double sx = 0.25 + unit(rng) * 2.0;
        const double sy = 0.25 + unit(rng) * 2.0;
        DistanceField parallel = compute_distances(ParallelPolicy{}, grid, sx, sy);
        DistanceField sequential = compute_distances(SequentialPolicy{}, grid, sx, sy);

        size_t mismatches = 0;
        for (size_t r = 0; r < rows; ++r) {
            for (size_t c = 0; c < cols; ++c) {
                const double expected = BruteForce(grid, r, c, sx, sy);
                if (std::fabs(parallel.at(r, c) - expected) > 1e-9) ++mismatches;
                if (parallel.at(r, c) != sequential.at(r, c)) ++mismatches;
            }
        }
        EXPECT_EQ(mismatches, static_cast<size_t>(0));
    }
}

static void TestAnisotropicSpacing() {
    OccupancyGrid grid = MakeOccupancy(5, 5, {{2, 2}});
    DistanceField field = compute_distances(grid, 2.0, 0.5);

    // Each axis scaled by its own spacing
    EXPECT_NEAR(field.at(2, 4), 4.0, 1e-12);
    EXPECT_NEAR(field.at(0, 2), 1.0, 1e-12);
    EXPECT_NEAR(field.at(0, 0), std::sqrt(16.0 + 1.0), 1e-12);

    // A closer source along the cheap axis wins
    OccupancyGrid two = MakeOccupancy(5, 5, {{0, 0}, {4, 4}});
    DistanceField split = compute_distances(two, 10.0, 1.0);
    EXPECT_NEAR(split.at(4, 0), 4.0, 1e-12);
}

static void TestErrors() {
    OccupancyGrid empty = MakeOccupancy(3, 3, {});
    EXPECT_THROW(compute_distances(empty, 1.0, 1.0), NoReferenceFeaturesError);

    OccupancyGrid one = MakeOccupancy(3, 3, {{1, 1}});
    EXPECT_THROW(compute_distances(one, 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(compute_distances(one, 1.0, -2.0), std::invalid_argument);
}

int main() {
    TestSingleSourceDistances();
    TestMatchesBruteForceOnRandomGrids();
    TestAnisotropicSpacing();
    TestErrors();
    return ReportResult("popaccess_distance_field_tests");
}
