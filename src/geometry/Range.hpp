#ifndef VELLUM_RANGE_HPP
#define VELLUM_RANGE_HPP

#include <algorithm>
#include <cmath>
#include <limits>

namespace vellum {

// Closed interval used by constraints. A missing limit is stored as +/- infinity.
class Range {
   public:
    Range() = default;

    Range(float lower, float upper) : lower_{std::min(lower, upper)}, upper_{std::max(lower, upper)} {}

    // [value - variance, value + variance]
    static Range with_variance(float value, float variance) {
        float v = std::fabs(variance);
        return Range(value - v, value + v);
    }

    static Range lower_only(float lower) {
        return Range(lower, std::numeric_limits<float>::infinity());
    }

    static Range upper_only(float upper) {
        return Range(-std::numeric_limits<float>::infinity(), upper);
    }

    static Range constant(float value) { return Range(value, value); }

    static Range no_limits() { return Range(); }

    float lower() const { return lower_; }
    float upper() const { return upper_; }

    float clamp(float value) const { return std::clamp(value, lower_, upper_); }

    bool contains(float value) const { return value >= lower_ && value <= upper_; }

    bool operator==(const Range&) const = default;

   private:
    float lower_{-std::numeric_limits<float>::infinity()};
    float upper_{std::numeric_limits<float>::infinity()};
};

}  // namespace vellum

#endif  // VELLUM_RANGE_HPP
