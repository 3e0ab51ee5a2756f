/**
 * @file DistanceField.hpp
 * @brief Exact Euclidean distance transform over an occupancy grid
 *
 * Distances are measured between cell centres in kilometres. Cell sizes
 * along x and y may differ (geographic grids, anisotropic rasters); the
 * transform is separable, so each axis is scaled by its own spacing.
 */

#pragma once

#include "FeatureRasterizer.hpp"
#include "ExecutionPolicies.hpp"
#include <vector>

namespace popaccess {

/**
 * @brief Per-cell distance (km) to the nearest occupied cell
 */
class DistanceField {
public:
    DistanceField() = default;
    DistanceField(size_t rows, size_t cols, std::vector<double> km)
        : rows_(rows), cols_(cols), km_(std::move(km)) {}

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    double at(size_t row, size_t col) const { return km_[row * cols_ + col]; }
    const std::vector<double>& values() const { return km_; }

    double max_km() const;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> km_;
};

/**
 * @brief Compute the distance field (parallel rows and columns)
 *
 * @param occupancy Binary grid of reference features
 * @param cell_size_x_km Cell width in kilometres
 * @param cell_size_y_km Cell height in kilometres
 * @throws NoReferenceFeaturesError if no cell is occupied
 * @throws std::invalid_argument if a cell size is not positive
 */
DistanceField compute_distances(const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km);

DistanceField compute_distances(SequentialPolicy policy, const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km);

DistanceField compute_distances(ParallelPolicy policy, const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km);

} // namespace popaccess
