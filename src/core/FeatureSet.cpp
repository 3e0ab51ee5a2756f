/**
 * @file FeatureSet.cpp
 * @brief OGR feature loading, attribute filtering and reprojection
 */

#include "FeatureSet.hpp"
#include "GdalSupport.hpp"
#include "Logger.hpp"
#include "AccessErrors.hpp"
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <sstream>

namespace popaccess {

namespace {

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

bool parse_number(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end != nullptr && *end == '\0';
}

bool value_matches(const std::string& value, const std::vector<std::string>& accepted) {
    double numeric = 0.0;
    const bool value_numeric = parse_number(value, numeric);
    for (const auto& candidate : accepted) {
        if (candidate == value) return true;
        double candidate_numeric = 0.0;
        if (value_numeric && parse_number(candidate, candidate_numeric) &&
            candidate_numeric == numeric) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

Feature Feature::clone() const {
    Feature copy;
    if (geometry) {
        copy.geometry.reset(geometry->clone());
    }
    copy.attributes = attributes;
    return copy;
}

void FeatureSet::add(OGRGeometryUniquePtr geometry, std::map<std::string, std::string> attributes) {
    Feature feature;
    feature.geometry = std::move(geometry);
    feature.attributes = std::move(attributes);
    features_.push_back(std::move(feature));
}

void FeatureSet::add_wkt(const std::string& wkt, std::map<std::string, std::string> attributes) {
    OGRGeometry* geometry = nullptr;
    if (OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &geometry) != OGRERR_NONE || !geometry) {
        throw FormatError("Malformed WKT geometry: " + wkt.substr(0, 60));
    }
    add(OGRGeometryUniquePtr(geometry), std::move(attributes));
}

BoundingBox FeatureSet::extent() const {
    OGREnvelope total;
    bool any = false;
    for (const auto& feature : features_) {
        if (!feature.geometry || feature.geometry->IsEmpty()) continue;
        OGREnvelope env;
        feature.geometry->getEnvelope(&env);
        total.Merge(env);
        any = true;
    }
    if (!any) return BoundingBox();
    return BoundingBox(total.MinX, total.MinY, total.MaxX, total.MaxY);
}

FeatureSet FeatureSet::filter(const std::string& field, const std::vector<std::string>& accepted) const {
    Logger logger("FeatureSet");

    FeatureSet result(crs_wkt_);
    bool field_seen = false;
    for (const auto& feature : features_) {
        auto it = feature.attributes.find(field);
        if (it == feature.attributes.end()) continue;
        field_seen = true;
        if (value_matches(it->second, accepted)) {
            result.features_.push_back(feature.clone());
        }
    }

    if (!field_seen && !features_.empty()) {
        throw FormatError("No feature carries attribute '" + field + "'");
    }

    std::ostringstream msg;
    msg << "Attribute filter " << field << " kept " << result.size() << " of "
        << features_.size() << " features";
    logger.info(msg.str());
    return result;
}

FeatureSet FeatureSet::reproject(const std::string& target_crs) const {
    Logger logger("FeatureSet");

    const std::string target_wkt = to_wkt(target_crs);
    if (same_crs(crs_wkt_, target_wkt)) {
        FeatureSet copy(crs_wkt_);
        for (const auto& feature : features_) {
            copy.features_.push_back(feature.clone());
        }
        return copy;
    }

    OGRSpatialReference source = make_spatial_reference(crs_wkt_);
    OGRSpatialReference target = make_spatial_reference(target_wkt);
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter> transform(
        OGRCreateCoordinateTransformation(&source, &target));
    if (!transform) {
        throw CrsError(std::string("No coordinate transformation available: ") + CPLGetLastErrorMsg());
    }

    FeatureSet result(target_wkt);
    for (const auto& feature : features_) {
        Feature copy = feature.clone();
        if (copy.geometry && copy.geometry->transform(transform.get()) != OGRERR_NONE) {
            throw CrsError("Failed to reproject feature geometry");
        }
        result.features_.push_back(std::move(copy));
    }

    logger.detailed("Reprojected " + std::to_string(result.size()) + " features");
    return result;
}

FeatureSet load_features(const std::string& path, const std::string& layer_name) {
    Logger logger("FeatureSet");
    ensure_gdal_registered();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw FormatError("Cannot open vector source " + path + ": " + CPLGetLastErrorMsg());
    }

    OGRLayer* layer = layer_name.empty() ? dataset->GetLayer(0)
                                         : dataset->GetLayerByName(layer_name.c_str());
    if (!layer) {
        throw FormatError("Layer '" + (layer_name.empty() ? std::string("#0") : layer_name) +
                          "' not found in " + path);
    }

    std::string crs_wkt;
    const OGRSpatialReference* srs = layer->GetSpatialRef();
    if (srs) {
        char* wkt = nullptr;
        if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
            crs_wkt = wkt;
        }
        CPLFree(wkt);
    }
    if (crs_wkt.empty()) {
        logger.warning(path + " declares no CRS, assuming " + kAssumedFeatureCrs);
        crs_wkt = to_wkt(kAssumedFeatureCrs);
    }

    FeatureSet result(crs_wkt);
    size_t skipped = 0;
    layer->ResetReading();
    for (auto& ogr_feature : *layer) {
        OGRGeometry* geometry = ogr_feature->StealGeometry();
        if (!geometry) {
            ++skipped;
            continue;
        }

        std::map<std::string, std::string> attributes;
        for (int i = 0; i < ogr_feature->GetFieldCount(); ++i) {
            if (ogr_feature->IsFieldSetAndNotNull(i)) {
                attributes[ogr_feature->GetFieldDefnRef(i)->GetNameRef()] =
                    ogr_feature->GetFieldAsString(i);
            }
        }
        result.add(OGRGeometryUniquePtr(geometry), std::move(attributes));
    }

    std::ostringstream msg;
    msg << "Loaded " << result.size() << " features from " << path;
    if (skipped > 0) {
        msg << " (" << skipped << " without geometry skipped)";
    }
    logger.info(msg.str());
    return result;
}

} // namespace popaccess
