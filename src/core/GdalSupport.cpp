/**
 * @file GdalSupport.cpp
 * @brief Implementation of shared GDAL helpers
 */

#include "GdalSupport.hpp"
#include "AccessErrors.hpp"
#include "popaccess.hpp"
#include <cpl_conv.h>
#include <mutex>

namespace popaccess {

void ensure_gdal_registered() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

GDALDatasetPtr create_mem_raster(int width, int height, int bands, GDALDataType type) {
    ensure_gdal_registered();

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        throw FormatError("GDAL MEM driver not available");
    }

    GDALDatasetPtr dataset(mem_driver->Create("", width, height, bands, type, nullptr));
    if (!dataset) {
        throw FormatError("Failed to create in-memory raster " +
                          std::to_string(width) + "x" + std::to_string(height));
    }
    return dataset;
}

OGRSpatialReference make_spatial_reference(const std::string& definition) {
    OGRSpatialReference srs;
    if (definition.empty() || srs.SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        throw CrsError("Cannot interpret coordinate reference '" +
                       definition.substr(0, 80) + "'");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

std::string to_wkt(const std::string& definition) {
    OGRSpatialReference srs = make_spatial_reference(definition);

    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        throw CrsError("Cannot export coordinate reference to WKT");
    }
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

bool same_crs(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    OGRSpatialReference srs_a = make_spatial_reference(a);
    OGRSpatialReference srs_b = make_spatial_reference(b);
    return srs_a.IsSame(&srs_b) != 0;
}

double kilometres_per_unit(const std::string& crs_definition) {
    OGRSpatialReference srs = make_spatial_reference(crs_definition);
    if (srs.IsGeographic()) {
        return kKilometresPerDegree;
    }
    double metres_per_unit = srs.GetLinearUnits();
    if (metres_per_unit <= 0.0) {
        throw CrsError("Coordinate reference has no usable linear unit");
    }
    return metres_per_unit / 1000.0;
}

bool is_geographic(const std::string& crs_definition) {
    OGRSpatialReference srs = make_spatial_reference(crs_definition);
    return srs.IsGeographic() != 0;
}

} // namespace popaccess
