#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "core/BoundaryResolver.hpp"

#include <fstream>
#include <sstream>

using namespace popaccess;

/// GeoJSON polygon ring for an axis-aligned box in fixture metres
static std::string BoxCoordinates(double x0, double y0, double x1, double y1) {
    std::ostringstream out;
    out.precision(12);
    out << "[[[" << x0 << "," << y0 << "],[" << x1 << "," << y0 << "],[" << x1 << "," << y1
        << "],[" << x0 << "," << y1 << "],[" << x0 << "," << y0 << "]]]";
    return out.str();
}

static std::string BoxFeature(const std::string& name, double x0, double y0, double x1, double y1) {
    return R"({"type":"Feature","properties":{"name":")" + name +
           R"("},"geometry":{"type":"Polygon","coordinates":)" + BoxCoordinates(x0, y0, x1, y1) + "}}";
}

static void WriteCollection(const fs::path& path, const std::vector<std::string>& features) {
    std::ofstream out(path);
    out << R"({"type":"FeatureCollection",)"
        << R"("crs":{"type":"name","properties":{"name":"urn:ogc:def:crs:EPSG::32633"}},)"
        << R"("features":[)";
    for (size_t i = 0; i < features.size(); ++i) {
        if (i > 0) out << ",";
        out << features[i];
    }
    out << "]}";
}

static void TestLoadGroupsPartsByName() {
    const fs::path dir = MakeTempPath("popaccess_boundaries");
    fs::create_directories(dir);
    const fs::path file = dir / "countries.geojson";

    WriteCollection(file, {
        BoxFeature("Alpha", kOriginX, kOriginY - 2000.0, kOriginX + 2000.0, kOriginY),
        BoxFeature("Beta", kOriginX + 900000.0, kOriginY, kOriginX + 901000.0, kOriginY + 1000.0),
        BoxFeature("Alpha", kOriginX + 3000.0, kOriginY - 4000.0, kOriginX + 4000.0, kOriginY - 3000.0),
        BoxFeature("NULL", kOriginX, kOriginY - 1000.0, kOriginX + 1000.0, kOriginY),
    });

    BoundaryCatalog catalog = load_boundaries(file.string());
    ASSERT_TRUE(catalog.boundaries.size() == 2);
    EXPECT_TRUE(catalog.failures.empty());
    EXPECT_EQ(catalog.boundaries[0].name, std::string("Alpha"));
    EXPECT_EQ(catalog.boundaries[1].name, std::string("Beta"));
    EXPECT_TRUE(same_crs(catalog.boundaries[0].crs_wkt, UtmWkt()));

    const auto* alpha = catalog.boundaries[0].geometry->toMultiPolygon();
    EXPECT_EQ(alpha->getNumGeometries(), 2);
    EXPECT_NEAR(polygon_area_km2(*alpha, catalog.boundaries[0].crs_wkt), 5.0, 1e-9);

    EXPECT_THROW(load_boundaries(file.string(), "admin"), FormatError);
    EXPECT_THROW(load_boundaries((dir / "missing.geojson").string()), FormatError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void TestDirectoryOfBoundaries() {
    const fs::path dir = MakeTempPath("popaccess_boundary_dir");
    fs::create_directories(dir);

    WriteCollection(dir / "Gamma.geojson",
                    {BoxFeature("ignored", kOriginX, kOriginY - 1000.0, kOriginX + 1000.0, kOriginY)});
    WriteCollection(dir / "NULL.geojson",
                    {BoxFeature("x", kOriginX, kOriginY - 1000.0, kOriginX + 1000.0, kOriginY)});
    {
        std::ofstream broken(dir / "Delta.geojson");
        broken << "this is not a boundary";
    }
    {
        std::ofstream notes(dir / "README.txt");
        notes << "not a vector file";
    }

    BoundaryCatalog catalog = load_boundaries(dir.string());
    ASSERT_TRUE(catalog.boundaries.size() == 1);
    EXPECT_EQ(catalog.boundaries[0].name, std::string("Gamma"));
    ASSERT_TRUE(catalog.failures.size() == 1);
    EXPECT_EQ(catalog.failures[0].name, std::string("Delta"));
    EXPECT_TRUE(catalog.failures[0].kind == ErrorKind::FORMAT);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static ScopeBoundary MakeBoundary(const std::string& name, const std::string& wkt, const std::string& crs) {
    OGRGeometry* geometry = nullptr;
    ScopeBoundary boundary;
    boundary.name = name;
    boundary.crs_wkt = crs;
    if (OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &geometry) == OGRERR_NONE) {
        boundary.geometry.reset(geometry);
    }
    return boundary;
}

static std::string BoxWkt(double x0, double y0, double x1, double y1) {
    std::ostringstream out;
    out.precision(12);
    out << "POLYGON ((" << x0 << " " << y0 << "," << x1 << " " << y0 << "," << x1 << " " << y1
        << "," << x0 << " " << y1 << "," << x0 << " " << y0 << "))";
    return out.str();
}

static void TestResolveScope() {
    std::vector<double> values(16);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i + 1);
    RasterGrid grid = MakeUtmGrid(4, 4, values, 1000.0, -9999.0);

    // Fully inside: the top-left 2x2 block
    ScopeBoundary inside = MakeBoundary(
        "Inside", BoxWkt(kOriginX, kOriginY - 2000.0, kOriginX + 2000.0, kOriginY), UtmWkt());
    ASSERT_TRUE(inside.geometry != nullptr);
    ResolvedScope resolved = resolve_scope(grid, inside);
    EXPECT_NEAR(resolved.diagnostics.overlap_ratio, 1.0, 1e-9);
    EXPECT_NEAR(resolved.diagnostics.area_km2, 4.0, 1e-9);
    EXPECT_EQ(resolved.grid.rows(), static_cast<size_t>(2));
    EXPECT_EQ(resolved.grid.valid_cell_count(), static_cast<size_t>(4));
    EXPECT_EQ(resolved.grid.at(1, 1), 6.0);

    // Half of the boundary hangs off the grid's east edge
    ScopeBoundary straddling = MakeBoundary(
        "Edge", BoxWkt(kOriginX + 2000.0, kOriginY - 2000.0, kOriginX + 6000.0, kOriginY), UtmWkt());
    ResolvedScope partial = resolve_scope(grid, straddling);
    EXPECT_NEAR(partial.diagnostics.overlap_ratio, 0.5, 1e-9);
    EXPECT_EQ(partial.grid.cols(), static_cast<size_t>(2));
    EXPECT_EQ(partial.grid.valid_cell_count(), static_cast<size_t>(4));

    ScopeBoundary distant = MakeBoundary(
        "Distant", BoxWkt(kOriginX + 50000.0, kOriginY, kOriginX + 51000.0, kOriginY + 1000.0), UtmWkt());
    EXPECT_THROW(resolve_scope(grid, distant), NoOverlapError);

    // A geographic boundary is reprojected onto the grid first
    ScopeBoundary geographic = MakeBoundary("Geo", "POLYGON ((14.9 8.9,15.2 8.9,15.2 9.2,14.9 9.2,14.9 8.9))",
                                            Wgs84Wkt());
    ResolvedScope covering = resolve_scope(grid, geographic);
    EXPECT_EQ(covering.grid.valid_cell_count(), static_cast<size_t>(16));
    EXPECT_TRUE(covering.diagnostics.overlap_ratio < 0.05);
    EXPECT_TRUE(covering.diagnostics.area_km2 > 900.0);
}

static void TestPolygonArea() {
    OGRGeometry* geometry = nullptr;
    const std::string wkt = BoxWkt(0.0, 0.0, 1.0, 1.0);
    ASSERT_TRUE(OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &geometry) == OGRERR_NONE);
    OGRGeometryUniquePtr degree_box(geometry);

    // One degree square at the equator is about 12300 km2
    EXPECT_NEAR(polygon_area_km2(*degree_box, Wgs84Wkt()), 12308.0, 150.0);
    // In metres the same coordinates cover one square metre
    EXPECT_NEAR(polygon_area_km2(*degree_box, UtmWkt()), 1e-6, 1e-12);
}

static void TestCountryRasterListing() {
    EXPECT_THROW(list_country_rasters("/nonexistent/popaccess/rasters"), ConfigurationError);

    const fs::path dir = MakeTempPath("popaccess_country_rasters");
    fs::create_directories(dir);
    for (const char* name : {"Kenya.tif", "Benin.TIF", "NULL.tif", "notes.txt"}) {
        std::ofstream(dir / name) << "x";
    }

    auto rasters = list_country_rasters(dir.string());
    ASSERT_TRUE(rasters.size() == 2);
    EXPECT_EQ(rasters[0].first, std::string("Benin"));
    EXPECT_EQ(rasters[1].first, std::string("Kenya"));
    EXPECT_EQ(rasters[1].second, (dir / "Kenya.tif").string());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    ensure_gdal_registered();
    TestLoadGroupsPartsByName();
    TestDirectoryOfBoundaries();
    TestResolveScope();
    TestPolygonArea();
    TestCountryRasterListing();
    return ReportResult("popaccess_boundary_resolver_tests");
}
