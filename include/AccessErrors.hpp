#pragma once

/**
 * @file AccessErrors.hpp
 * @brief Exception taxonomy for accessibility analysis failures
 *
 * Scope-level errors abort the analysis of one country or region and are
 * recorded for the audit report; cross-cutting errors abort the whole run.
 */

#include <string>
#include <stdexcept>

namespace popaccess {

/**
 * @brief Category of an analysis failure
 */
enum class ErrorKind {
    FORMAT,
    CRS,
    CRS_MISMATCH,
    NO_OVERLAP,
    NO_REFERENCE_FEATURES,
    RECONCILIATION,
    CONFIGURATION
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FORMAT: return "FormatError";
        case ErrorKind::CRS: return "CrsError";
        case ErrorKind::CRS_MISMATCH: return "CrsMismatchError";
        case ErrorKind::NO_OVERLAP: return "NoOverlapError";
        case ErrorKind::NO_REFERENCE_FEATURES: return "NoReferenceFeaturesError";
        case ErrorKind::RECONCILIATION: return "ReconciliationError";
        case ErrorKind::CONFIGURATION: return "ConfigurationError";
    }
    return "UnknownError";
}

/**
 * @brief Base class of every analysis exception
 */
class AccessError : public std::runtime_error {
public:
    AccessError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief True when the failure only invalidates the current scope
     *
     * Reconciliation and configuration failures indicate a defect or a
     * contradictory setup and must stop the run.
     */
    bool is_scope_level() const {
        return kind_ != ErrorKind::RECONCILIATION && kind_ != ErrorKind::CONFIGURATION;
    }

private:
    ErrorKind kind_;
};

/// Unreadable input or missing band/layer
class FormatError : public AccessError {
public:
    explicit FormatError(const std::string& message)
        : AccessError(ErrorKind::FORMAT, message) {}
};

/// Coordinate reference cannot be determined
class CrsError : public AccessError {
public:
    explicit CrsError(const std::string& message)
        : AccessError(ErrorKind::CRS, message) {}
};

/// Features and grid use different coordinate references
class CrsMismatchError : public AccessError {
public:
    explicit CrsMismatchError(const std::string& message)
        : AccessError(ErrorKind::CRS_MISMATCH, message) {}
};

/// Mask polygon and grid extents do not intersect
class NoOverlapError : public AccessError {
public:
    explicit NoOverlapError(const std::string& message)
        : AccessError(ErrorKind::NO_OVERLAP, message) {}
};

/// Distance transform requested on an empty occupancy grid
class NoReferenceFeaturesError : public AccessError {
public:
    explicit NoReferenceFeaturesError(const std::string& message)
        : AccessError(ErrorKind::NO_REFERENCE_FEATURES, message) {}
};

/// Partition sums disagree with the scope total
class ReconciliationError : public AccessError {
public:
    explicit ReconciliationError(const std::string& message)
        : AccessError(ErrorKind::RECONCILIATION, message) {}
};

/// Contradictory or invalid run configuration
class ConfigurationError : public AccessError {
public:
    explicit ConfigurationError(const std::string& message)
        : AccessError(ErrorKind::CONFIGURATION, message) {}
};

} // namespace popaccess
