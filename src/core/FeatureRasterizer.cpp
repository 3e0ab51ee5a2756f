/**
 * @file FeatureRasterizer.cpp
 * @brief Feature rasterization through GDALRasterizeGeometries
 */

#include "FeatureRasterizer.hpp"
#include "CellClassifier.hpp"
#include "GdalSupport.hpp"
#include "Logger.hpp"
#include "AccessErrors.hpp"
#include <gdal_alg.h>
#include <cpl_string.h>
#include <algorithm>
#include <sstream>

namespace popaccess {

size_t OccupancyGrid::occupied_count() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), std::uint8_t{1}));
}

OccupancyGrid rasterize_features(const FeatureSet& features, const RasterGrid& reference) {
    Logger logger("FeatureRasterizer");

    if (!same_crs(features.crs_wkt(), reference.crs_wkt())) {
        throw CrsMismatchError("Feature CRS differs from grid CRS; reproject features first");
    }

    OccupancyGrid occupancy(reference.rows(), reference.cols(), reference.transform());
    if (reference.empty() || features.empty()) {
        return occupancy;
    }

    std::vector<OGRGeometryH> geometries;
    geometries.reserve(features.size());
    for (const auto& feature : features.features()) {
        if (feature.geometry && !feature.geometry->IsEmpty()) {
            geometries.push_back(OGRGeometry::ToHandle(feature.geometry.get()));
        }
    }
    if (geometries.empty()) {
        return occupancy;
    }

    const int width = static_cast<int>(reference.cols());
    const int height = static_cast<int>(reference.rows());
    GDALDatasetPtr target = create_mem_raster(width, height, 1, GDT_Byte);

    double gt[6];
    std::copy(reference.transform().c.begin(), reference.transform().c.end(), gt);
    target->SetGeoTransform(gt);

    int band_list[1] = {1};
    std::vector<double> burn_values(geometries.size(), 1.0);
    CPLStringList options;
    options.SetNameValue("ALL_TOUCHED", "TRUE");

    CPLErr err = GDALRasterizeGeometries(GDALDataset::ToHandle(target.get()), 1, band_list,
                                         static_cast<int>(geometries.size()), geometries.data(),
                                         nullptr, nullptr, burn_values.data(),
                                         options.List(), nullptr, nullptr);
    if (err != CE_None) {
        throw FormatError(std::string("Feature rasterization failed: ") + CPLGetLastErrorMsg());
    }

    err = target->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, width, height,
                                             occupancy.cells().data(), width, height,
                                             GDT_Byte, 0, 0);
    if (err != CE_None) {
        throw FormatError(std::string("Reading occupancy raster failed: ") + CPLGetLastErrorMsg());
    }

    std::ostringstream msg;
    msg << "Rasterized " << geometries.size() << " geometries into "
        << occupancy.occupied_count() << " occupied cells of " << height << "x" << width;
    logger.detailed(msg.str());
    return occupancy;
}

namespace {

bool representative_point(const OGRGeometry& geometry, double& x, double& y) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbPoint: {
            const auto* point = geometry.toPoint();
            x = point->getX();
            y = point->getY();
            return true;
        }
        case wkbLineString: {
            const auto* line = geometry.toLineString();
            if (line->getNumPoints() == 0) return false;
            x = line->getX(0);
            y = line->getY(0);
            return true;
        }
        case wkbMultiLineString: {
            const auto* lines = geometry.toMultiLineString();
            if (lines->getNumGeometries() == 0) return false;
            return representative_point(*lines->getGeometryRef(0), x, y);
        }
        default: {
            OGRPoint centroid;
            if (geometry.Centroid(&centroid) != OGRERR_NONE || centroid.IsEmpty()) {
                return false;
            }
            x = centroid.getX();
            y = centroid.getY();
            return true;
        }
    }
}

} // anonymous namespace

FeaturePlacement tally_feature_placement(const FeatureSet& features, const RasterGrid& grid,
                                         const UrbanRuralClassifier& classifier) {
    FeaturePlacement placement;
    for (const auto& feature : features.features()) {
        double x = 0.0;
        double y = 0.0;
        if (!feature.geometry || !representative_point(*feature.geometry, x, y)) {
            ++placement.outside;
            continue;
        }

        const CellIndex cell = grid.cell_of(x, y);
        if (!grid.contains(cell)) {
            ++placement.outside;
            continue;
        }

        const double value = grid.at(static_cast<size_t>(cell.row), static_cast<size_t>(cell.col));
        if (grid.is_nodata(value)) {
            ++placement.unpopulated;
            continue;
        }

        auto classified = classifier.classify(value);
        if (!classified) {
            ++placement.unpopulated;
        } else if (classified->urban_class == UrbanClass::URBAN) {
            ++placement.urban;
        } else {
            ++placement.rural;
        }
    }
    return placement;
}

} // namespace popaccess
