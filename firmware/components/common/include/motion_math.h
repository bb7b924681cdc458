/**
 * @file motion_math.h
 * @brief Pure math helpers shared by the planner, providers and encoder
 * @author TCMU Team
 * @date 2025
 *
 * @note All functions are pure and depend only on <cmath>. No hardware,
 *       no globals, no side effects. Unit tests exercise the same formulas
 *       the engine uses.
 */

#ifndef MOTION_MATH_H
#define MOTION_MATH_H

#include <cmath>
#include <cstdint>

namespace MotionMath {

/**
 * @brief Round a value to a fixed number of decimal places
 *
 * Rounds the exact binary value half away from zero. A product that only
 * reaches a .5 tie through floating point error is rounded toward the
 * exact value, so 0.5 * 0.999 rounds to 0.499 at 3 decimals.
 *
 * @param[in] value Value to round
 * @param[in] decimals Number of decimal places (0 rounds to integer)
 *
 * @return Rounded value, or value unchanged if it is not finite
 */
double roundTo(double value, int decimals);

/** Clamp value into [lo, hi]. */
inline double clamp(double value, double lo, double hi)
{
    return value < lo ? lo : (value > hi ? hi : value);
}

/** True if value is finite and within [0, 1]. */
inline bool isUnitValue(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

/** Sign of a displacement: -1, 0 or +1. */
inline int direction(double from, double to)
{
    const double distance = to - from;
    return distance > 0.0 ? 1 : (distance < 0.0 ? -1 : 0);
}

/**
 * @brief Number of ticks covering a duration
 *
 * @param[in] duration_s Duration in seconds
 * @param[in] frequency_hz Tick frequency
 *
 * @return round(duration_s * frequency_hz), 0 for non-positive input
 */
uint32_t stepCount(double duration_s, double frequency_hz);

} // namespace MotionMath

#endif // MOTION_MATH_H
