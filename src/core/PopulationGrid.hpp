/**
 * @file PopulationGrid.hpp
 * @brief Georeferenced raster grid of population values
 *
 * A RasterGrid couples a row-major block of cell values with the affine
 * transform that places it on the earth and the identity of its CRS.
 * Grids are immutable; masking returns a new grid.
 */

#pragma once

#include "popaccess.hpp"
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class OGRGeometry;

namespace popaccess {

/**
 * @brief Six-coefficient affine transform (GDAL convention)
 *
 * x = c[0] + col * c[1] + row * c[2]
 * y = c[3] + col * c[4] + row * c[5]
 */
struct GeoTransform {
    std::array<double, 6> c{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};

    GeoTransform() = default;
    explicit GeoTransform(const std::array<double, 6>& coefficients) : c(coefficients) {}

    /// North-up transform with top-left origin and positive cell sizes
    static GeoTransform north_up(double origin_x, double origin_y, double size_x, double size_y) {
        return GeoTransform({origin_x, size_x, 0.0, origin_y, 0.0, -size_y});
    }

    void pixel_to_geo(double col, double row, double& x, double& y) const {
        x = c[0] + col * c[1] + row * c[2];
        y = c[3] + col * c[4] + row * c[5];
    }

    /**
     * @brief Inverse transform to fractional pixel coordinates
     * @return false if the transform is degenerate
     */
    bool geo_to_pixel(double x, double y, double& col, double& row) const;

    /// Transform of the sub-window starting at (row_off, col_off)
    GeoTransform window(long row_off, long col_off) const;

    /// Transform of a grid whose cells are factor x factor source cells
    GeoTransform scaled(int factor) const;
};

/**
 * @brief Population raster with georeferencing
 */
class RasterGrid {
public:
    RasterGrid() = default;

    /**
     * @brief Construct from row-major values
     * @throws std::invalid_argument if values.size() != rows * cols
     */
    RasterGrid(size_t rows, size_t cols, std::vector<double> values,
               const GeoTransform& transform, std::string crs_wkt,
               std::optional<double> nodata = std::nullopt);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    double at(size_t row, size_t col) const { return values_[row * cols_ + col]; }
    const std::vector<double>& values() const { return values_; }

    const GeoTransform& transform() const { return transform_; }
    const std::string& crs_wkt() const { return crs_wkt_; }
    std::optional<double> nodata() const { return nodata_; }

    /// Non-finite values and the no-data sentinel both mark cells without data
    bool is_nodata(double value) const {
        return !std::isfinite(value) || (nodata_.has_value() && value == *nodata_);
    }

    bool is_valid(size_t row, size_t col) const { return !is_nodata(at(row, col)); }

    size_t valid_cell_count() const;

    /**
     * @brief Cell containing a world coordinate
     *
     * The returned index may lie outside the grid; check with contains().
     */
    CellIndex cell_of(double x, double y) const;

    bool contains(const CellIndex& cell) const {
        return cell.row >= 0 && cell.col >= 0 &&
               static_cast<size_t>(cell.row) < rows_ && static_cast<size_t>(cell.col) < cols_;
    }

    /// World coordinate of a cell centre
    std::pair<double, double> coord_of(size_t row, size_t col) const;

    BoundingBox extent() const;

    /**
     * @brief Physical cell size along x and y in kilometres
     * @throws CrsError when the CRS has no usable unit
     */
    double cell_size_x_km() const;
    double cell_size_y_km() const;

    /**
     * @brief Grid restricted to a polygon
     *
     * Cells whose centre lies outside the polygon become no-data and the
     * extent is cropped to the polygon's bounding box. The polygon must be
     * expressed in this grid's CRS.
     *
     * @throws NoOverlapError if polygon and grid do not intersect
     */
    RasterGrid mask(const OGRGeometry& polygon) const;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> values_;
    GeoTransform transform_;
    std::string crs_wkt_;
    std::optional<double> nodata_;
};

/**
 * @brief Load one band of a raster file through GDAL
 *
 * @param path Raster path or any GDAL connection string
 * @param band_selector 1-based band index, or the band description
 * @param nodata_override Sentinel used instead of the file's own no-data value
 * @throws FormatError if the source or band cannot be read
 * @throws CrsError if the source has no CRS or geotransform
 */
RasterGrid load_raster(const std::string& path,
                       const std::string& band_selector = "1",
                       std::optional<double> nodata_override = std::nullopt);

} // namespace popaccess
