/**
 * @file GeoTIFFExporter.hpp
 * @brief GeoTIFF raster export with georeferencing
 *
 * Writes distance fields and block summaries as georeferenced TIFF
 * rasters so they can be inspected next to the population grid in GIS
 * applications.
 */

#pragma once

#include "../core/PopulationGrid.hpp"
#include "../core/DistanceField.hpp"
#include "../core/BlockAggregator.hpp"
#include <gdal_priv.h>
#include <string>

namespace popaccess {

/**
 * @brief Exports analysis grids as GeoTIFF rasters
 */
class GeoTIFFExporter {
public:
    struct Options {
        enum class Compression {
            NONE,
            LZW,
            DEFLATE
        };

        Compression compression;
        bool tiled;
        double nodata_value;

        Options()
            : compression(Compression::DEFLATE),
              tiled(true),
              nodata_value(-9999.0) {}
    };

    GeoTIFFExporter();
    explicit GeoTIFFExporter(const Options& options);

    /**
     * @brief Export a distance field (km) on the grid it was computed for
     *
     * Cells that are no-data in the grid are written as the no-data value.
     *
     * @return true if export succeeded
     */
    bool export_distance_field(const DistanceField& distances,
                               const RasterGrid& grid,
                               const std::string& filename);

    /**
     * @brief Export a block summary as a four-band raster
     *
     * Bands: rural population, rural cells, urban population, urban cells.
     *
     * @return true if export succeeded
     */
    bool export_block_summary(const BlockSummary& summary, const std::string& filename);

    /**
     * @brief Export from a pre-built GDAL dataset
     * @return true if export succeeded
     */
    bool export_from_dataset(GDALDataset* dataset,
                             const std::string& filename,
                             const GeoTransform& transform,
                             const std::string& crs_wkt);

    void set_compression(Options::Compression compression);

private:
    Options options_;

    /**
     * @brief Write GeoTIFF using GDAL CreateCopy with georeferencing
     */
    bool write_geotiff_with_copy(GDALDataset* source,
                                 const std::string& filename,
                                 const GeoTransform& transform,
                                 const std::string& crs_wkt);

    const char* get_compression_option() const;
};

} // namespace popaccess
