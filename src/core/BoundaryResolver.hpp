/**
 * @file BoundaryResolver.hpp
 * @brief Country boundaries and the per-country grids they cut out
 *
 * Boundaries come from one vector file (one or more features per country,
 * named by an attribute) or from a directory holding one file per country
 * (file stem = country name). Per-country rasters are the alternative
 * scope source when no boundaries are available.
 */

#pragma once

#include "PopulationGrid.hpp"
#include "AccessAggregator.hpp"
#include "RegionRollup.hpp"
#include <ogr_geometry.h>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Named country polygon in its source CRS
 */
struct ScopeBoundary {
    std::string name;
    OGRGeometryUniquePtr geometry;   // polygon or multipolygon
    std::string crs_wkt;
};

/**
 * @brief Boundaries that loaded, plus the ones that did not
 */
struct BoundaryCatalog {
    std::vector<ScopeBoundary> boundaries;
    std::vector<ExcludedScope> failures;
};

/**
 * @brief Load boundaries from a file or a directory of files
 *
 * Parts sharing a name are combined into one multipolygon. Files named
 * "NULL" are skipped. A directory file that cannot be read becomes a
 * recorded failure; an unreadable single file is fatal.
 *
 * @throws FormatError if a single boundary file cannot be read or the name field is missing
 */
BoundaryCatalog load_boundaries(const std::string& path, const std::string& name_field = "name");

/**
 * @brief Country grid cut from the continental grid
 */
struct ResolvedScope {
    RasterGrid grid;
    BoundaryDiagnostics diagnostics;
};

/**
 * @brief Mask the grid to one boundary
 *
 * The boundary is reprojected to the grid CRS when needed. The overlap
 * ratio is the share of the boundary's area inside the grid extent.
 *
 * @throws NoOverlapError if the boundary lies outside the grid
 * @throws CrsError if the boundary cannot be reprojected
 */
ResolvedScope resolve_scope(const RasterGrid& grid, const ScopeBoundary& boundary);

/**
 * @brief Area of a polygon in square kilometres
 *
 * Geographic coordinates are projected to a local equal-area CRS first.
 */
double polygon_area_km2(const OGRGeometry& polygon, const std::string& crs_wkt);

/**
 * @brief Named raster files of a per-country raster directory, sorted by name
 */
std::vector<std::pair<std::string, std::string>> list_country_rasters(const std::string& directory);

} // namespace popaccess
