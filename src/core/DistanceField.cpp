/**
 * @file DistanceField.cpp
 * @brief Separable lower-envelope Euclidean distance transform
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "DistanceField.hpp"
#include "Logger.hpp"
#include "AccessErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace popaccess {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

/**
 * @brief One-dimensional squared distance transform of sampled function f
 *
 * Samples sit at positions i * spacing. Infinite samples are not parabola
 * sites; if every sample is infinite the output stays infinite.
 * v and z are scratch buffers of size n and n + 1.
 */
void transform_line(const double* f, size_t n, double spacing, double* out,
                    std::vector<size_t>& v, std::vector<double>& z) {
    size_t first = 0;
    while (first < n && !std::isfinite(f[first])) {
        ++first;
    }
    if (first == n) {
        std::fill(out, out + n, kInfinity);
        return;
    }

    auto intersect = [&](size_t q, size_t p) {
        const double xq = static_cast<double>(q) * spacing;
        const double xp = static_cast<double>(p) * spacing;
        return ((f[q] + xq * xq) - (f[p] + xp * xp)) / (2.0 * (xq - xp));
    };

    size_t k = 0;
    v[0] = first;
    z[0] = -kInfinity;
    z[1] = kInfinity;

    for (size_t q = first + 1; q < n; ++q) {
        if (!std::isfinite(f[q])) continue;
        double s = intersect(q, v[k]);
        while (s <= z[k]) {
            --k;
            s = intersect(q, v[k]);
        }
        ++k;
        v[k] = q;
        z[k] = s;
        z[k + 1] = kInfinity;
    }

    k = 0;
    for (size_t q = 0; q < n; ++q) {
        const double x = static_cast<double>(q) * spacing;
        while (z[k + 1] < x) {
            ++k;
        }
        const double dx = x - static_cast<double>(v[k]) * spacing;
        out[q] = dx * dx + f[v[k]];
    }
}

template<typename Policy>
DistanceField compute_distances_impl(Policy policy, const OccupancyGrid& occupancy,
                                     double cell_size_x_km, double cell_size_y_km) {
    Logger logger("DistanceField");

    if (!(cell_size_x_km > 0.0) || !(cell_size_y_km > 0.0)) {
        std::ostringstream msg;
        msg << "Cell sizes must be positive, got " << cell_size_x_km << " x " << cell_size_y_km;
        throw std::invalid_argument(msg.str());
    }

    const size_t rows = occupancy.rows();
    const size_t cols = occupancy.cols();
    const size_t occupied = occupancy.occupied_count();
    if (occupied == 0) {
        throw NoReferenceFeaturesError("Occupancy grid of " + std::to_string(rows) + "x" +
                                       std::to_string(cols) + " cells has no reference feature");
    }

    std::vector<double> squared(rows * cols);
    for (size_t i = 0; i < squared.size(); ++i) {
        squared[i] = occupancy.cells()[i] ? 0.0 : kInfinity;
    }

    // Pass 1: columns (y spacing)
    for_each_index(policy, 0, cols, [&](size_t col) {
        std::vector<double> line(rows);
        std::vector<double> result(rows);
        std::vector<size_t> v(rows);
        std::vector<double> z(rows + 1);
        for (size_t r = 0; r < rows; ++r) {
            line[r] = squared[r * cols + col];
        }
        transform_line(line.data(), rows, cell_size_y_km, result.data(), v, z);
        for (size_t r = 0; r < rows; ++r) {
            squared[r * cols + col] = result[r];
        }
    });

    // Pass 2: rows (x spacing); every row now holds at least one finite value
    for_each_index(policy, 0, rows, [&](size_t row) {
        std::vector<double> line(squared.begin() + row * cols, squared.begin() + (row + 1) * cols);
        std::vector<size_t> v(cols);
        std::vector<double> z(cols + 1);
        transform_line(line.data(), cols, cell_size_x_km, &squared[row * cols], v, z);
    });

    for (double& value : squared) {
        value = std::sqrt(value);
    }

    DistanceField field(rows, cols, std::move(squared));

    std::ostringstream msg;
    msg << "Distance field " << rows << "x" << cols << " from " << occupied
        << " occupied cells (cell " << cell_size_x_km << " x " << cell_size_y_km
        << " km), max " << field.max_km() << " km";
    logger.detailed(msg.str());
    return field;
}

} // anonymous namespace

double DistanceField::max_km() const {
    if (km_.empty()) return 0.0;
    return *std::max_element(km_.begin(), km_.end());
}

DistanceField compute_distances(const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km) {
    return compute_distances_impl(ParallelPolicy{}, occupancy, cell_size_x_km, cell_size_y_km);
}

DistanceField compute_distances(SequentialPolicy policy, const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km) {
    return compute_distances_impl(policy, occupancy, cell_size_x_km, cell_size_y_km);
}

DistanceField compute_distances(ParallelPolicy policy, const OccupancyGrid& occupancy,
                                double cell_size_x_km, double cell_size_y_km) {
    return compute_distances_impl(policy, occupancy, cell_size_x_km, cell_size_y_km);
}

} // namespace popaccess
