/**
 * @file motion_math.cpp
 * @brief Pure math helpers implementation
 * @author TCMU Team
 * @date 2025
 */

#include "motion_math.h"

namespace MotionMath {

double roundTo(double value, int decimals)
{
    if (!std::isfinite(value)) {
        return value;
    }

    const double factor = std::pow(10.0, decimals);
    const double scaled = value * factor;
    double rounded = std::round(scaled);

    // The product may land on a .5 tie the exact value does not reach
    // (0.4995 * 1000 == 499.5 in double while the stored 0.4995 is below it).
    // fma yields the exact rounding error of the product.
    if (std::fabs(scaled - std::trunc(scaled)) == 0.5) {
        const double residual = std::fma(value, factor, -scaled);
        if (scaled > 0.0 && residual < 0.0) {
            rounded -= 1.0;
        } else if (scaled < 0.0 && residual > 0.0) {
            rounded += 1.0;
        }
    }

    return rounded / factor;
}

uint32_t stepCount(double duration_s, double frequency_hz)
{
    if (!std::isfinite(duration_s) || duration_s <= 0.0 || frequency_hz <= 0.0) {
        return 0;
    }

    return static_cast<uint32_t>(std::lround(duration_s * frequency_hz));
}

} // namespace MotionMath
