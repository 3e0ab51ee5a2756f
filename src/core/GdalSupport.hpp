/**
 * @file GdalSupport.hpp
 * @brief RAII wrappers and spatial-reference helpers shared by GDAL users
 */

#pragma once

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <memory>
#include <string>

namespace popaccess {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief Register all GDAL/OGR drivers exactly once per process
 */
void ensure_gdal_registered();

/**
 * @brief Create an in-memory raster dataset (MEM driver)
 * @throws FormatError if the MEM driver is unavailable or creation fails
 */
GDALDatasetPtr create_mem_raster(int width, int height, int bands, GDALDataType type);

/**
 * @brief Build a spatial reference from WKT, "EPSG:n" or any user input GDAL accepts
 *
 * Axis order is forced to traditional GIS order (x = longitude/easting).
 *
 * @throws CrsError if the definition cannot be parsed
 */
OGRSpatialReference make_spatial_reference(const std::string& definition);

/**
 * @brief Normalize a CRS definition to WKT
 * @throws CrsError if the definition cannot be parsed
 */
std::string to_wkt(const std::string& definition);

/**
 * @brief True when both definitions describe the same CRS
 */
bool same_crs(const std::string& a, const std::string& b);

/**
 * @brief Kilometres per CRS unit along the axes
 *
 * Geographic CRS: kKilometresPerDegree per degree.
 * Projected CRS: linear unit in metres / 1000.
 */
double kilometres_per_unit(const std::string& crs_definition);

/**
 * @brief True for CRS definitions whose coordinates are angular
 */
bool is_geographic(const std::string& crs_definition);

} // namespace popaccess
