/**
 * @file FeatureSet.hpp
 * @brief Reference features (facilities, roads) with a shared CRS
 */

#pragma once

#include "popaccess.hpp"
#include <ogr_geometry.h>
#include <map>
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief One vector feature: geometry plus string attributes
 */
struct Feature {
    OGRGeometryUniquePtr geometry;
    std::map<std::string, std::string> attributes;

    Feature clone() const;

    /// Attribute value or empty string when absent
    std::string attribute(const std::string& name) const {
        auto it = attributes.find(name);
        return it != attributes.end() ? it->second : std::string();
    }
};

/**
 * @brief Collection of features that share one coordinate reference
 *
 * Move-only; filter() and reproject() return new sets with cloned geometries.
 */
class FeatureSet {
public:
    FeatureSet() = default;
    explicit FeatureSet(std::string crs_wkt) : crs_wkt_(std::move(crs_wkt)) {}

    FeatureSet(FeatureSet&&) = default;
    FeatureSet& operator=(FeatureSet&&) = default;
    FeatureSet(const FeatureSet&) = delete;
    FeatureSet& operator=(const FeatureSet&) = delete;

    void add(OGRGeometryUniquePtr geometry,
             std::map<std::string, std::string> attributes = {});

    /**
     * @brief Add a feature parsed from WKT
     * @throws FormatError if the WKT is malformed
     */
    void add_wkt(const std::string& wkt, std::map<std::string, std::string> attributes = {});

    size_t size() const { return features_.size(); }
    bool empty() const { return features_.empty(); }
    const std::vector<Feature>& features() const { return features_; }
    const std::string& crs_wkt() const { return crs_wkt_; }

    BoundingBox extent() const;

    /**
     * @brief Keep features whose attribute value is in the accepted set
     *
     * Numeric values compare numerically, so "1" matches "1.0".
     *
     * @throws FormatError if no feature carries the attribute
     */
    FeatureSet filter(const std::string& field, const std::vector<std::string>& accepted) const;

    /**
     * @brief Transform every geometry into another CRS
     * @throws CrsError if no transformation exists or a geometry fails to transform
     */
    FeatureSet reproject(const std::string& target_crs) const;

private:
    std::vector<Feature> features_;
    std::string crs_wkt_;
};

/**
 * @brief Load a vector layer through OGR
 *
 * Sources without a declared CRS are taken to be WGS84.
 *
 * @param path Vector dataset path
 * @param layer_name Layer to read; empty selects the first layer
 * @throws FormatError if the dataset or layer cannot be read
 */
FeatureSet load_features(const std::string& path, const std::string& layer_name = "");

} // namespace popaccess
