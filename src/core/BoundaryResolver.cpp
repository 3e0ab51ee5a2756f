/**
 * @file BoundaryResolver.cpp
 * @brief Boundary loading, reprojection, overlap diagnostics and masking
 */

#include "BoundaryResolver.hpp"
#include "GdalSupport.hpp"
#include "Logger.hpp"
#include "AccessErrors.hpp"
#include <ogrsf_frmts.h>
#include <ogr_api.h>
#include <cpl_conv.h>
#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <sstream>

namespace popaccess {

namespace {

namespace fs = std::filesystem;

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using CoordinateTransformationPtr =
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

const std::set<std::string> kVectorExtensions = {".gpkg", ".shp", ".geojson", ".json", ".kml"};
const std::set<std::string> kRasterExtensions = {".tif", ".tiff", ".img", ".vrt"};

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

/// Copy the polygonal parts of a geometry into a multipolygon
size_t append_polygons(OGRMultiPolygon& target, const OGRGeometry& geometry) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbPolygon:
            target.addGeometry(&geometry);
            return 1;
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            size_t added = 0;
            const auto* collection = geometry.toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                added += append_polygons(target, *collection->getGeometryRef(i));
            }
            return added;
        }
        default:
            return 0;
    }
}

std::string layer_crs_wkt(OGRLayer& layer, const std::string& path, const Logger& logger) {
    const OGRSpatialReference* srs = layer.GetSpatialRef();
    if (srs) {
        char* wkt = nullptr;
        std::string result;
        if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
            result = wkt;
        }
        CPLFree(wkt);
        if (!result.empty()) return result;
    }
    logger.warning(path + " declares no CRS, assuming " + kAssumedFeatureCrs);
    return to_wkt(kAssumedFeatureCrs);
}

GDALDatasetPtr open_vector(const std::string& path) {
    ensure_gdal_registered();
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset || dataset->GetLayerCount() == 0) {
        throw FormatError("Cannot open boundary source " + path + ": " + CPLGetLastErrorMsg());
    }
    return dataset;
}

/// Whole first layer of one file as a single named boundary
ScopeBoundary load_single_boundary(const fs::path& path, const Logger& logger) {
    GDALDatasetPtr dataset = open_vector(path.string());
    OGRLayer* layer = dataset->GetLayer(0);

    ScopeBoundary boundary;
    boundary.name = path.stem().string();
    boundary.crs_wkt = layer_crs_wkt(*layer, path.string(), logger);

    auto combined = std::make_unique<OGRMultiPolygon>();
    layer->ResetReading();
    for (auto& feature : *layer) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (geometry) {
            append_polygons(*combined, *geometry);
        }
    }
    if (combined->IsEmpty()) {
        throw FormatError("Boundary file " + path.string() + " holds no polygon");
    }
    boundary.geometry.reset(combined.release());
    return boundary;
}

double geometry_area(const OGRGeometry& geometry) {
    return OGR_G_Area(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(&geometry)));
}

} // anonymous namespace

BoundaryCatalog load_boundaries(const std::string& path, const std::string& name_field) {
    Logger logger("BoundaryResolver");
    BoundaryCatalog catalog;

    if (fs::is_directory(path)) {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file() && kVectorExtensions.count(lower_extension(entry.path()))) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            if (file.stem() == "NULL") {
                logger.detailed("Skipping placeholder boundary " + file.string());
                continue;
            }
            try {
                catalog.boundaries.push_back(load_single_boundary(file, logger));
            } catch (const AccessError& e) {
                logger.warning(e.what());
                catalog.failures.push_back({file.stem().string(), e.kind(), e.what()});
            }
        }

        logger.info("Loaded " + std::to_string(catalog.boundaries.size()) +
                    " boundaries from directory " + path);
        return catalog;
    }

    GDALDatasetPtr dataset = open_vector(path);
    OGRLayer* layer = dataset->GetLayer(0);
    const int name_index = layer->GetLayerDefn()->GetFieldIndex(name_field.c_str());
    if (name_index < 0) {
        throw FormatError("Boundary source " + path + " has no '" + name_field + "' field");
    }
    const std::string crs_wkt = layer_crs_wkt(*layer, path, logger);

    // Group parts by name, keeping first-seen order
    std::vector<std::string> order;
    std::map<std::string, std::unique_ptr<OGRMultiPolygon>> parts;
    layer->ResetReading();
    for (auto& feature : *layer) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry || !feature->IsFieldSetAndNotNull(name_index)) continue;

        const std::string name = feature->GetFieldAsString(name_index);
        if (name.empty() || name == "NULL") continue;

        auto& slot = parts[name];
        if (!slot) {
            slot = std::make_unique<OGRMultiPolygon>();
            order.push_back(name);
        }
        append_polygons(*slot, *geometry);
    }

    for (const auto& name : order) {
        auto& geometry = parts[name];
        if (geometry->IsEmpty()) {
            catalog.failures.push_back({name, ErrorKind::FORMAT, "Boundary holds no polygon"});
            continue;
        }
        ScopeBoundary boundary;
        boundary.name = name;
        boundary.crs_wkt = crs_wkt;
        boundary.geometry.reset(geometry.release());
        catalog.boundaries.push_back(std::move(boundary));
    }

    logger.info("Loaded " + std::to_string(catalog.boundaries.size()) + " boundaries from " + path);
    return catalog;
}

double polygon_area_km2(const OGRGeometry& polygon, const std::string& crs_wkt) {
    if (!is_geographic(crs_wkt)) {
        const double k = kilometres_per_unit(crs_wkt);
        return geometry_area(polygon) * k * k;
    }

    OGRPoint centroid;
    if (polygon.Centroid(&centroid) != OGRERR_NONE) {
        throw CrsError("Cannot compute boundary centroid for area projection");
    }

    std::ostringstream proj;
    proj << "+proj=laea +lat_0=" << centroid.getY() << " +lon_0=" << centroid.getX()
         << " +datum=WGS84 +units=m +no_defs";
    OGRSpatialReference source = make_spatial_reference(crs_wkt);
    OGRSpatialReference equal_area = make_spatial_reference(proj.str());

    CoordinateTransformationPtr transform(OGRCreateCoordinateTransformation(&source, &equal_area));
    if (!transform) {
        throw CrsError("No equal-area transformation for boundary");
    }
    OGRGeometryUniquePtr projected(polygon.clone());
    if (projected->transform(transform.get()) != OGRERR_NONE) {
        throw CrsError("Failed to project boundary to equal-area CRS");
    }
    return geometry_area(*projected) / 1e6;
}

ResolvedScope resolve_scope(const RasterGrid& grid, const ScopeBoundary& boundary) {
    Logger logger("BoundaryResolver");

    OGRGeometryUniquePtr geometry(boundary.geometry->clone());
    if (!same_crs(boundary.crs_wkt, grid.crs_wkt())) {
        OGRSpatialReference source = make_spatial_reference(boundary.crs_wkt);
        OGRSpatialReference target = make_spatial_reference(grid.crs_wkt());
        CoordinateTransformationPtr transform(OGRCreateCoordinateTransformation(&source, &target));
        if (!transform || geometry->transform(transform.get()) != OGRERR_NONE) {
            throw CrsError("Cannot reproject boundary of " + boundary.name + " to grid CRS");
        }
    }

    const BoundingBox ext = grid.extent();
    OGRLinearRing ring;
    ring.addPoint(ext.min_x, ext.min_y);
    ring.addPoint(ext.max_x, ext.min_y);
    ring.addPoint(ext.max_x, ext.max_y);
    ring.addPoint(ext.min_x, ext.max_y);
    ring.closeRings();
    OGRPolygon extent_polygon;
    extent_polygon.addRing(&ring);

    ResolvedScope resolved;
    const double boundary_area = geometry_area(*geometry);
    OGRGeometryUniquePtr overlap(geometry->Intersection(&extent_polygon));
    if (overlap) {
        resolved.diagnostics.overlap_ratio =
            boundary_area > 0.0 ? geometry_area(*overlap) / boundary_area : 0.0;
    } else {
        // Without GEOS fall back to bounding-box overlap
        OGREnvelope env;
        geometry->getEnvelope(&env);
        const BoundingBox box(env.MinX, env.MinY, env.MaxX, env.MaxY);
        resolved.diagnostics.overlap_ratio =
            box.intersects(ext) && box.area() > 0.0 ? box.intersection(ext).area() / box.area() : 0.0;
        logger.debug("Polygon intersection unavailable, using envelope overlap for " + boundary.name);
    }

    if (resolved.diagnostics.overlap_ratio <= 0.0) {
        throw NoOverlapError(boundary.name + " lies outside the population grid");
    }
    if (resolved.diagnostics.overlap_ratio < 0.5) {
        logger.warning(boundary.name + ": low overlap with population grid (" +
                       std::to_string(static_cast<int>(resolved.diagnostics.overlap_ratio * 100)) + "%)");
    } else if (resolved.diagnostics.overlap_ratio < 0.9) {
        logger.warning(boundary.name + ": moderate overlap with population grid (" +
                       std::to_string(static_cast<int>(resolved.diagnostics.overlap_ratio * 100)) + "%)");
    }

    resolved.diagnostics.area_km2 = polygon_area_km2(*geometry, grid.crs_wkt());
    resolved.grid = grid.mask(*geometry);
    return resolved;
}

std::vector<std::pair<std::string, std::string>> list_country_rasters(const std::string& directory) {
    if (!fs::is_directory(directory)) {
        throw ConfigurationError("Country raster directory does not exist: " + directory);
    }

    std::vector<std::pair<std::string, std::string>> rasters;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file() || !kRasterExtensions.count(lower_extension(entry.path()))) {
            continue;
        }
        const std::string name = entry.path().stem().string();
        if (name == "NULL") continue;
        rasters.emplace_back(name, entry.path().string());
    }
    std::sort(rasters.begin(), rasters.end());
    return rasters;
}

} // namespace popaccess
