/**
 * @file PopulationGrid.cpp
 * @brief Raster grid loading, addressing and polygon masking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PopulationGrid.hpp"
#include "GdalSupport.hpp"
#include "Logger.hpp"
#include "AccessErrors.hpp"
#include <gdal_alg.h>
#include <ogr_geometry.h>
#include <cpl_string.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace popaccess {

// ============================================================================
// GeoTransform
// ============================================================================

bool GeoTransform::geo_to_pixel(double x, double y, double& col, double& row) const {
    const double det = c[1] * c[5] - c[2] * c[4];
    if (det == 0.0) {
        return false;
    }
    const double dx = x - c[0];
    const double dy = y - c[3];
    col = (dx * c[5] - dy * c[2]) / det;
    row = (dy * c[1] - dx * c[4]) / det;
    return true;
}

GeoTransform GeoTransform::window(long row_off, long col_off) const {
    GeoTransform result(*this);
    pixel_to_geo(static_cast<double>(col_off), static_cast<double>(row_off),
                 result.c[0], result.c[3]);
    return result;
}

GeoTransform GeoTransform::scaled(int factor) const {
    GeoTransform result(*this);
    result.c[1] *= factor;
    result.c[2] *= factor;
    result.c[4] *= factor;
    result.c[5] *= factor;
    return result;
}

// ============================================================================
// RasterGrid
// ============================================================================

RasterGrid::RasterGrid(size_t rows, size_t cols, std::vector<double> values,
                       const GeoTransform& transform, std::string crs_wkt,
                       std::optional<double> nodata)
    : rows_(rows), cols_(cols), values_(std::move(values)), transform_(transform),
      crs_wkt_(std::move(crs_wkt)), nodata_(nodata) {
    if (values_.size() != rows_ * cols_) {
        std::ostringstream msg;
        msg << "Grid value count " << values_.size() << " does not match "
            << rows_ << "x" << cols_;
        throw std::invalid_argument(msg.str());
    }
}

size_t RasterGrid::valid_cell_count() const {
    return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
        [this](double v) { return !is_nodata(v); }));
}

CellIndex RasterGrid::cell_of(double x, double y) const {
    double col = 0.0;
    double row = 0.0;
    if (!transform_.geo_to_pixel(x, y, col, row)) {
        throw CrsError("Grid geotransform is not invertible");
    }
    return CellIndex{static_cast<long>(std::floor(row)), static_cast<long>(std::floor(col))};
}

std::pair<double, double> RasterGrid::coord_of(size_t row, size_t col) const {
    double x = 0.0;
    double y = 0.0;
    transform_.pixel_to_geo(static_cast<double>(col) + 0.5, static_cast<double>(row) + 0.5, x, y);
    return {x, y};
}

BoundingBox RasterGrid::extent() const {
    double xs[4];
    double ys[4];
    transform_.pixel_to_geo(0, 0, xs[0], ys[0]);
    transform_.pixel_to_geo(static_cast<double>(cols_), 0, xs[1], ys[1]);
    transform_.pixel_to_geo(0, static_cast<double>(rows_), xs[2], ys[2]);
    transform_.pixel_to_geo(static_cast<double>(cols_), static_cast<double>(rows_), xs[3], ys[3]);

    return BoundingBox(*std::min_element(xs, xs + 4), *std::min_element(ys, ys + 4),
                       *std::max_element(xs, xs + 4), *std::max_element(ys, ys + 4));
}

double RasterGrid::cell_size_x_km() const {
    const double units = std::hypot(transform_.c[1], transform_.c[4]);
    return units * kilometres_per_unit(crs_wkt_);
}

double RasterGrid::cell_size_y_km() const {
    const double units = std::hypot(transform_.c[2], transform_.c[5]);
    return units * kilometres_per_unit(crs_wkt_);
}

RasterGrid RasterGrid::mask(const OGRGeometry& polygon) const {
    Logger logger("PopulationGrid");

    OGREnvelope envelope;
    polygon.getEnvelope(&envelope);
    const BoundingBox poly_box(envelope.MinX, envelope.MinY, envelope.MaxX, envelope.MaxY);
    const BoundingBox grid_box = extent();

    if (!grid_box.intersects(poly_box)) {
        std::ostringstream msg;
        msg << "Polygon extent (" << poly_box.min_x << "," << poly_box.min_y << ")-("
            << poly_box.max_x << "," << poly_box.max_y << ") does not intersect grid extent ("
            << grid_box.min_x << "," << grid_box.min_y << ")-("
            << grid_box.max_x << "," << grid_box.max_y << ")";
        throw NoOverlapError(msg.str());
    }

    // Pixel window covering the polygon's bounding box, clamped to the grid
    double col_min = std::numeric_limits<double>::max();
    double col_max = std::numeric_limits<double>::lowest();
    double row_min = std::numeric_limits<double>::max();
    double row_max = std::numeric_limits<double>::lowest();
    const double corners[4][2] = {
        {poly_box.min_x, poly_box.min_y}, {poly_box.max_x, poly_box.min_y},
        {poly_box.min_x, poly_box.max_y}, {poly_box.max_x, poly_box.max_y}};
    for (const auto& corner : corners) {
        double col = 0.0;
        double row = 0.0;
        if (!transform_.geo_to_pixel(corner[0], corner[1], col, row)) {
            throw CrsError("Grid geotransform is not invertible");
        }
        col_min = std::min(col_min, col);
        col_max = std::max(col_max, col);
        row_min = std::min(row_min, row);
        row_max = std::max(row_max, row);
    }

    const long c0 = std::clamp(static_cast<long>(std::floor(col_min)), 0L, static_cast<long>(cols_));
    const long c1 = std::clamp(static_cast<long>(std::ceil(col_max)), 0L, static_cast<long>(cols_));
    const long r0 = std::clamp(static_cast<long>(std::floor(row_min)), 0L, static_cast<long>(rows_));
    const long r1 = std::clamp(static_cast<long>(std::ceil(row_max)), 0L, static_cast<long>(rows_));
    if (c0 >= c1 || r0 >= r1) {
        throw NoOverlapError("Polygon covers no grid cells");
    }

    const int win_cols = static_cast<int>(c1 - c0);
    const int win_rows = static_cast<int>(r1 - r0);
    const GeoTransform win_transform = transform_.window(r0, c0);

    // Burn the polygon interior (cell-centre rule) into a byte mask
    GDALDatasetPtr mask_ds = create_mem_raster(win_cols, win_rows, 1, GDT_Byte);
    double gt[6];
    std::copy(win_transform.c.begin(), win_transform.c.end(), gt);
    mask_ds->SetGeoTransform(gt);

    int band_list[1] = {1};
    double burn_value[1] = {1.0};
    OGRGeometryH geometries[1] = {OGRGeometry::ToHandle(const_cast<OGRGeometry*>(&polygon))};
    CPLErr err = GDALRasterizeGeometries(GDALDataset::ToHandle(mask_ds.get()), 1, band_list,
                                         1, geometries, nullptr, nullptr, burn_value,
                                         nullptr, nullptr, nullptr);
    if (err != CE_None) {
        throw FormatError(std::string("Polygon rasterization failed: ") + CPLGetLastErrorMsg());
    }

    std::vector<unsigned char> inside(static_cast<size_t>(win_cols) * win_rows, 0);
    err = mask_ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, win_cols, win_rows, inside.data(),
                                              win_cols, win_rows, GDT_Byte, 0, 0);
    if (err != CE_None) {
        throw FormatError(std::string("Reading polygon mask failed: ") + CPLGetLastErrorMsg());
    }

    const double fill = nodata_.value_or(std::numeric_limits<double>::quiet_NaN());
    std::vector<double> masked(inside.size(), fill);
    size_t kept = 0;
    for (int r = 0; r < win_rows; ++r) {
        for (int c = 0; c < win_cols; ++c) {
            const size_t idx = static_cast<size_t>(r) * win_cols + c;
            if (inside[idx]) {
                masked[idx] = at(static_cast<size_t>(r0 + r), static_cast<size_t>(c0 + c));
                ++kept;
            }
        }
    }

    std::ostringstream msg;
    msg << "Masked grid to " << win_rows << "x" << win_cols << " window at ("
        << r0 << "," << c0 << "), " << kept << " cells inside polygon";
    logger.debug(msg.str());

    return RasterGrid(static_cast<size_t>(win_rows), static_cast<size_t>(win_cols),
                      std::move(masked), win_transform, crs_wkt_, nodata_);
}

// ============================================================================
// Loading
// ============================================================================

namespace {

int resolve_band(GDALDataset& dataset, const std::string& selector, const std::string& path) {
    const int band_count = dataset.GetRasterCount();
    const bool numeric = !selector.empty() &&
        std::all_of(selector.begin(), selector.end(), [](unsigned char ch) { return std::isdigit(ch); });

    if (numeric) {
        const int index = std::stoi(selector);
        if (index < 1 || index > band_count) {
            throw FormatError("Band " + selector + " does not exist in " + path +
                              " (" + std::to_string(band_count) + " bands)");
        }
        return index;
    }

    for (int i = 1; i <= band_count; ++i) {
        const char* description = dataset.GetRasterBand(i)->GetDescription();
        if (description && selector == description) {
            return i;
        }
    }
    throw FormatError("No band named '" + selector + "' in " + path);
}

} // anonymous namespace

RasterGrid load_raster(const std::string& path, const std::string& band_selector,
                       std::optional<double> nodata_override) {
    Logger logger("PopulationGrid");
    ensure_gdal_registered();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw FormatError("Cannot open raster " + path + ": " + CPLGetLastErrorMsg());
    }

    const int band_index = resolve_band(*dataset, band_selector, path);

    const char* projection = dataset->GetProjectionRef();
    if (!projection || projection[0] == '\0') {
        throw CrsError("Raster " + path + " declares no coordinate reference");
    }

    double gt[6];
    if (dataset->GetGeoTransform(gt) != CE_None) {
        throw CrsError("Raster " + path + " has no geotransform");
    }

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    GDALRasterBand* band = dataset->GetRasterBand(band_index);

    std::vector<double> values(static_cast<size_t>(width) * height);
    CPLErr err = band->RasterIO(GF_Read, 0, 0, width, height, values.data(),
                                width, height, GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw FormatError("Failed to read band " + std::to_string(band_index) + " of " + path +
                          ": " + CPLGetLastErrorMsg());
    }

    std::optional<double> nodata = nodata_override;
    if (!nodata.has_value()) {
        int has_nodata = 0;
        const double file_nodata = band->GetNoDataValue(&has_nodata);
        if (has_nodata) {
            nodata = file_nodata;
        }
    }

    std::ostringstream msg;
    msg << "Loaded " << path << " band " << band_index << ": " << width << "x" << height
        << " cells, pixel " << gt[1] << " x " << -gt[5];
    if (nodata.has_value()) {
        msg << ", nodata " << *nodata;
    }
    logger.info(msg.str());

    const auto non_finite = std::count_if(values.begin(), values.end(),
        [](double v) { return std::isinf(v); });
    if (non_finite > 0) {
        logger.warning(std::to_string(non_finite) + " infinite cells in " + path +
                       " are treated as no-data");
    }

    return RasterGrid(static_cast<size_t>(height), static_cast<size_t>(width), std::move(values),
                      GeoTransform({gt[0], gt[1], gt[2], gt[3], gt[4], gt[5]}),
                      std::string(projection), nodata);
}

} // namespace popaccess
