#pragma once

#include <cmath>

namespace data_capturing {

/**
 * @brief Compare two doubles up to @p precision decimal places.
 *
 * Returns true when `|lhs - rhs| <= 10^-precision`.
 */
[[nodiscard]] inline bool equal(double lhs, double rhs, int precision) {
    const double max_difference = 1.0 / std::pow(10.0, precision);
    return std::fabs(lhs - rhs) <= max_difference;
}

}  // namespace data_capturing
