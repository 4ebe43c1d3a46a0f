// <MathUtils> -*- C++ -*-

#pragma once

#include <cmath>
#include <limits>
#include <numeric>
#include <type_traits>
#include <vector>

namespace parksim {
namespace utils {

//! Floating-point equality within a tolerance. The tolerance is applied
//! both relative to the larger magnitude and as an absolute floor so that
//! comparisons against zero behave.
template <typename T>
typename std::enable_if<std::is_floating_point<T>::value, bool>::type
approximatelyEqual(const T a, const T b,
                   const T epsilon = std::numeric_limits<T>::epsilon())
{
    const T fabs_a = std::fabs(a);
    const T fabs_b = std::fabs(b);
    const T fabs_diff = std::fabs(a - b);

    return (fabs_diff <= epsilon) ||
           (fabs_diff <= ((fabs_a < fabs_b ? fabs_b : fabs_a) * epsilon));
}

//! Arithmetic mean, 0 for an empty sequence
template <typename T>
double mean(const std::vector<T> & vals)
{
    if(vals.empty()) {
        return 0.0;
    }
    return std::accumulate(vals.begin(), vals.end(), 0.0) / static_cast<double>(vals.size());
}

} // namespace utils
} // namespace parksim
