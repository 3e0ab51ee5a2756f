/**
 * @file FeatureRasterizer.hpp
 * @brief Burns reference features into a binary occupancy grid
 *
 * The occupancy grid has the same shape and transform as the population
 * grid it was built against, so a cell index means the same place in both.
 */

#pragma once

#include "PopulationGrid.hpp"
#include "FeatureSet.hpp"
#include <cstdint>
#include <vector>

namespace popaccess {

class UrbanRuralClassifier;

/**
 * @brief Binary grid marking cells touched by at least one feature
 */
class OccupancyGrid {
public:
    OccupancyGrid() = default;
    OccupancyGrid(size_t rows, size_t cols, const GeoTransform& transform)
        : rows_(rows), cols_(cols), cells_(rows * cols, 0), transform_(transform) {}

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    const GeoTransform& transform() const { return transform_; }

    bool occupied(size_t row, size_t col) const { return cells_[row * cols_ + col] != 0; }
    void mark(size_t row, size_t col) { cells_[row * cols_ + col] = 1; }

    size_t occupied_count() const;

    std::vector<std::uint8_t>& cells() { return cells_; }
    const std::vector<std::uint8_t>& cells() const { return cells_; }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<std::uint8_t> cells_;
    GeoTransform transform_;
};

/**
 * @brief Rasterize features against a reference grid (all-touched rule)
 *
 * Points mark their containing cell; lines and polygons mark every cell
 * they pass through or cover. Geometries outside the extent contribute
 * nothing.
 *
 * @throws CrsMismatchError if features and grid use different CRSs
 */
OccupancyGrid rasterize_features(const FeatureSet& features, const RasterGrid& reference);

/**
 * @brief Where features sit relative to the settlement classes
 */
struct FeaturePlacement {
    size_t urban = 0;
    size_t rural = 0;
    size_t unpopulated = 0;  // zero or no-data cells
    size_t outside = 0;      // beyond the grid extent

    size_t total() const { return urban + rural + unpopulated + outside; }
    size_t inside() const { return urban + rural + unpopulated; }
};

/**
 * @brief Classify each feature by the cell under its representative point
 *
 * Representative point: the point itself, a polygon's centroid, or the
 * first vertex of a line.
 */
FeaturePlacement tally_feature_placement(const FeatureSet& features, const RasterGrid& grid,
                                         const UrbanRuralClassifier& classifier);

} // namespace popaccess
