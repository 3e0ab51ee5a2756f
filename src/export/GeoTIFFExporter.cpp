/**
 * @file GeoTIFFExporter.cpp
 * @brief Implementation of GeoTIFF export with georeferencing
 */

#include "GeoTIFFExporter.hpp"
#include "../core/GdalSupport.hpp"
#include "../core/Logger.hpp"
#include "AccessErrors.hpp"
#include <cpl_string.h>
#include <algorithm>
#include <filesystem>
#include <vector>

namespace popaccess {

GeoTIFFExporter::GeoTIFFExporter()
    : options_() {
    ensure_gdal_registered();
}

GeoTIFFExporter::GeoTIFFExporter(const Options& options)
    : options_(options) {
    ensure_gdal_registered();
}

void GeoTIFFExporter::set_compression(Options::Compression compression) {
    options_.compression = compression;
}

const char* GeoTIFFExporter::get_compression_option() const {
    switch (options_.compression) {
        case Options::Compression::NONE:
            return "NONE";
        case Options::Compression::LZW:
            return "LZW";
        case Options::Compression::DEFLATE:
            return "DEFLATE";
        default:
            return "DEFLATE";
    }
}

bool GeoTIFFExporter::write_geotiff_with_copy(GDALDataset* source,
                                              const std::string& filename,
                                              const GeoTransform& transform,
                                              const std::string& crs_wkt) {
    Logger logger("GeoTIFFExporter");

    if (!source) {
        logger.error("Null source dataset");
        return false;
    }

    double geotransform[6];
    std::copy(transform.c.begin(), transform.c.end(), geotransform);
    source->SetGeoTransform(geotransform);
    if (!crs_wkt.empty()) {
        source->SetProjection(crs_wkt.c_str());
    }

    GDALDriver* gtiff_driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!gtiff_driver) {
        logger.error("GeoTIFF driver not available");
        return false;
    }

    const std::filesystem::path parent = std::filesystem::path(filename).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    char** options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", get_compression_option());
    if (options_.tiled) {
        options = CSLSetNameValue(options, "TILED", "YES");
        options = CSLSetNameValue(options, "BLOCKXSIZE", "256");
        options = CSLSetNameValue(options, "BLOCKYSIZE", "256");
    }

    GDALDataset* gtiff_dataset = gtiff_driver->CreateCopy(
        filename.c_str(),
        source,
        FALSE,      // Not strict
        options,
        nullptr,    // Progress function
        nullptr     // Progress data
    );

    CSLDestroy(options);

    if (!gtiff_dataset) {
        logger.error("Failed to create GeoTIFF file: " + filename + " (" + CPLGetLastErrorMsg() + ")");
        return false;
    }

    GDALClose(gtiff_dataset);
    return true;
}

bool GeoTIFFExporter::export_from_dataset(GDALDataset* dataset,
                                          const std::string& filename,
                                          const GeoTransform& transform,
                                          const std::string& crs_wkt) {
    Logger logger("GeoTIFFExporter");

    if (!dataset) {
        logger.error("Null dataset");
        return false;
    }

    bool success = write_geotiff_with_copy(dataset, filename, transform, crs_wkt);

    if (success) {
        logger.info("Exported GeoTIFF: " + filename + " (" +
                   std::to_string(dataset->GetRasterXSize()) + "x" +
                   std::to_string(dataset->GetRasterYSize()) + ")");
    }

    return success;
}

bool GeoTIFFExporter::export_distance_field(const DistanceField& distances,
                                            const RasterGrid& grid,
                                            const std::string& filename) {
    Logger logger("GeoTIFFExporter");

    if (distances.rows() != grid.rows() || distances.cols() != grid.cols()) {
        logger.error("Distance field and grid differ in shape, not writing " + filename);
        return false;
    }
    if (grid.empty()) {
        logger.warning("Empty grid, not writing " + filename);
        return false;
    }

    std::vector<float> values(grid.size());
    for (size_t r = 0; r < grid.rows(); ++r) {
        for (size_t c = 0; c < grid.cols(); ++c) {
            const size_t idx = r * grid.cols() + c;
            values[idx] = grid.is_valid(r, c)
                ? static_cast<float>(distances.at(r, c))
                : static_cast<float>(options_.nodata_value);
        }
    }

    try {
        GDALDatasetPtr dataset = create_mem_raster(static_cast<int>(grid.cols()),
                                                   static_cast<int>(grid.rows()), 1, GDT_Float32);
        GDALRasterBand* band = dataset->GetRasterBand(1);
        band->SetNoDataValue(options_.nodata_value);
        band->SetDescription("distance_km");
        CPLErr err = band->RasterIO(GF_Write, 0, 0,
                                    static_cast<int>(grid.cols()), static_cast<int>(grid.rows()),
                                    values.data(),
                                    static_cast<int>(grid.cols()), static_cast<int>(grid.rows()),
                                    GDT_Float32, 0, 0);
        if (err != CE_None) {
            logger.error("Failed to fill distance raster for " + filename);
            return false;
        }
        return export_from_dataset(dataset.get(), filename, grid.transform(), grid.crs_wkt());
    } catch (const FormatError& e) {
        logger.error(e.what());
        return false;
    }
}

bool GeoTIFFExporter::export_block_summary(const BlockSummary& summary, const std::string& filename) {
    Logger logger("GeoTIFFExporter");

    if (summary.rows == 0 || summary.cols == 0) {
        logger.warning("Block summary is empty, not writing " + filename);
        return false;
    }

    const std::vector<const std::vector<double>*> layers = {
        &summary.rural_population, &summary.rural_cells,
        &summary.urban_population, &summary.urban_cells
    };
    const char* descriptions[] = {"rural_population", "rural_cells", "urban_population", "urban_cells"};

    try {
        GDALDatasetPtr dataset = create_mem_raster(static_cast<int>(summary.cols),
                                                   static_cast<int>(summary.rows),
                                                   static_cast<int>(layers.size()), GDT_Float64);
        for (size_t i = 0; i < layers.size(); ++i) {
            GDALRasterBand* band = dataset->GetRasterBand(static_cast<int>(i) + 1);
            band->SetNoDataValue(BlockSummary::kNoData);
            band->SetDescription(descriptions[i]);
            std::vector<double> values = *layers[i];
            CPLErr err = band->RasterIO(GF_Write, 0, 0,
                                        static_cast<int>(summary.cols), static_cast<int>(summary.rows),
                                        values.data(),
                                        static_cast<int>(summary.cols), static_cast<int>(summary.rows),
                                        GDT_Float64, 0, 0);
            if (err != CE_None) {
                logger.error(std::string("Failed to fill band ") + descriptions[i] + " of " + filename);
                return false;
            }
        }
        return export_from_dataset(dataset.get(), filename, summary.transform, summary.crs_wkt);
    } catch (const FormatError& e) {
        logger.error(e.what());
        return false;
    }
}

} // namespace popaccess
