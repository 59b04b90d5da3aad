#pragma once

#include <cmath>

namespace pivot {

/// Division that never produces NaN or infinity: a zero denominator or a
/// non-finite quotient yields 0.
[[nodiscard]] inline auto safe_divide(double numerator, double denominator) noexcept -> double {
    if (denominator == 0.0) {
        return 0.0;
    }
    double result = numerator / denominator;
    return std::isfinite(result) ? result : 0.0;
}

[[nodiscard]] inline auto finite_or_zero(double value) noexcept -> double {
    return std::isfinite(value) ? value : 0.0;
}

/// Round half away from zero to `digits` decimal places.
[[nodiscard]] inline auto round_to(double value, int digits) noexcept -> double {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

}  // namespace pivot
