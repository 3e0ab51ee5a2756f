/**
 * @file PopulationCount.hpp
 * @brief Fixed-point population amount for exact partition sums
 *
 * Population is accumulated in integer micro-persons so that the sum of
 * any partition of a scope (bands, classes, members of a region) is equal
 * to the scope total without floating-point drift.
 */

#pragma once

#include "AccessErrors.hpp"
#include <cmath>
#include <cstdint>
#include <string>

namespace popaccess {

class PopulationCount {
public:
    static constexpr std::int64_t kScale = 1000000;

    constexpr PopulationCount() = default;

    /// Largest magnitude accepted by from_value, well inside the int64 range
    static constexpr double kMaxPersons = 1.0e12;

    /**
     * @throws FormatError if the amount is not finite or exceeds kMaxPersons
     */
    static PopulationCount from_value(double persons) {
        if (!std::isfinite(persons) || std::fabs(persons) > kMaxPersons) {
            throw FormatError("Population amount " + std::to_string(persons) +
                              " is not a finite count");
        }
        return PopulationCount(static_cast<std::int64_t>(std::llround(persons * kScale)));
    }

    double value() const { return static_cast<double>(micro_) / kScale; }
    constexpr bool is_zero() const { return micro_ == 0; }

    PopulationCount& operator+=(const PopulationCount& other) {
        micro_ += other.micro_;
        return *this;
    }

    PopulationCount& operator-=(const PopulationCount& other) {
        micro_ -= other.micro_;
        return *this;
    }

    friend PopulationCount operator+(PopulationCount a, const PopulationCount& b) { return a += b; }
    friend PopulationCount operator-(PopulationCount a, const PopulationCount& b) { return a -= b; }

    friend constexpr bool operator==(const PopulationCount& a, const PopulationCount& b) {
        return a.micro_ == b.micro_;
    }
    friend constexpr bool operator!=(const PopulationCount& a, const PopulationCount& b) {
        return a.micro_ != b.micro_;
    }
    friend constexpr bool operator<(const PopulationCount& a, const PopulationCount& b) {
        return a.micro_ < b.micro_;
    }
    friend constexpr bool operator<=(const PopulationCount& a, const PopulationCount& b) {
        return a.micro_ <= b.micro_;
    }

    /// Ratio of two amounts; 0 when the denominator is zero
    static double share(const PopulationCount& part, const PopulationCount& whole) {
        return whole.micro_ == 0 ? 0.0
            : static_cast<double>(part.micro_) / static_cast<double>(whole.micro_);
    }

private:
    constexpr explicit PopulationCount(std::int64_t micro) : micro_(micro) {}

    std::int64_t micro_ = 0;
};

} // namespace popaccess
