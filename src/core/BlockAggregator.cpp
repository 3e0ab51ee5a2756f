/**
 * @file BlockAggregator.cpp
 * @brief Implementation of block aggregation
 */

#include "BlockAggregator.hpp"
#include "CellClassifier.hpp"
#include "ExecutionPolicies.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace popaccess {

size_t BlockSummary::valid_blocks() const {
    return static_cast<size_t>(std::count_if(rural_cells.begin(), rural_cells.end(),
        [](double v) { return v != kNoData; }));
}

BlockSummary aggregate_blocks(const RasterGrid& grid, int factor,
                              const UrbanRuralClassifier& classifier) {
    Logger logger("BlockAggregator");

    if (factor < 1) {
        throw std::invalid_argument("Block factor must be at least 1, got " + std::to_string(factor));
    }

    BlockSummary summary;
    summary.factor = factor;
    summary.rows = grid.rows() / static_cast<size_t>(factor);
    summary.cols = grid.cols() / static_cast<size_t>(factor);
    summary.transform = grid.transform().scaled(factor);
    summary.crs_wkt = grid.crs_wkt();

    const size_t blocks = summary.rows * summary.cols;
    summary.rural_population.assign(blocks, BlockSummary::kNoData);
    summary.rural_cells.assign(blocks, BlockSummary::kNoData);
    summary.urban_population.assign(blocks, BlockSummary::kNoData);
    summary.urban_cells.assign(blocks, BlockSummary::kNoData);

    for_each_index(ParallelPolicy{}, 0, summary.rows, [&](size_t block_row) {
        for (size_t block_col = 0; block_col < summary.cols; ++block_col) {
            bool any_valid = false;
            double rural_pop = 0.0;
            double urban_pop = 0.0;
            size_t rural_count = 0;
            size_t urban_count = 0;

            const size_t r0 = block_row * static_cast<size_t>(factor);
            const size_t c0 = block_col * static_cast<size_t>(factor);
            for (size_t r = r0; r < r0 + static_cast<size_t>(factor); ++r) {
                for (size_t c = c0; c < c0 + static_cast<size_t>(factor); ++c) {
                    const double value = grid.at(r, c);
                    if (grid.is_nodata(value)) continue;
                    any_valid = true;

                    auto classified = classifier.classify(value);
                    if (!classified) continue;
                    if (classified->urban_class == UrbanClass::URBAN) {
                        urban_pop += classified->population;
                        ++urban_count;
                    } else {
                        rural_pop += classified->population;
                        ++rural_count;
                    }
                }
            }

            if (!any_valid) continue;
            const size_t idx = block_row * summary.cols + block_col;
            summary.rural_population[idx] = rural_pop;
            summary.rural_cells[idx] = static_cast<double>(rural_count);
            summary.urban_population[idx] = urban_pop;
            summary.urban_cells[idx] = static_cast<double>(urban_count);
        }
    });

    std::ostringstream msg;
    msg << "Aggregated " << grid.rows() << "x" << grid.cols() << " cells into "
        << summary.rows << "x" << summary.cols << " blocks of " << factor << "x" << factor
        << " (" << summary.valid_blocks() << " with data)";
    logger.info(msg.str());
    return summary;
}

} // namespace popaccess
