/**
 * @file BlockAggregator.hpp
 * @brief Coarse block summaries of a population grid
 *
 * Collapses factor x factor cells into one block carrying rural population,
 * rural cell count, urban population and urban cell count. Trailing cells
 * that do not fill a whole block are dropped.
 */

#pragma once

#include "PopulationGrid.hpp"
#include <string>
#include <vector>

namespace popaccess {

class UrbanRuralClassifier;

struct BlockSummary {
    static constexpr double kNoData = -9999.0;

    size_t rows = 0;
    size_t cols = 0;
    int factor = 1;
    GeoTransform transform;
    std::string crs_wkt;

    // One value per block, kNoData where the block holds no valid cell
    std::vector<double> rural_population;
    std::vector<double> rural_cells;
    std::vector<double> urban_population;
    std::vector<double> urban_cells;

    size_t valid_blocks() const;
};

/**
 * @brief Aggregate a grid into blocks
 * @throws std::invalid_argument if factor < 1
 */
BlockSummary aggregate_blocks(const RasterGrid& grid, int factor,
                              const UrbanRuralClassifier& classifier);

} // namespace popaccess
