/**
 * @file value_provider.h
 * @brief Value provider construction and standard ramps
 * @author TCMU Team
 * @date 2025
 *
 * @note Providers are evaluated once per tick by the TickExecutor. The
 *       factory also builds the per-tick ValueContext so every provider,
 *       built-in or custom, sees the same parameters.
 */

#ifndef VALUE_PROVIDER_H
#define VALUE_PROVIDER_H

#include <cstdint>
#include "movement_types.h"

/**
 * @brief Standard ramp shapes for custom value providers
 *
 * Each ramp moves from 'from' to 'to' as x goes from 0 to 1:
 * - RAMP_LINEAR:              x
 * - RAMP_COS:                 (1 - cos(pi x)) / 2
 * - RAMP_PARABOLIC:           x^2
 * - RAMP_NEGATIVE_PARABOLIC:  1 - (1 - x)^2
 */
typedef enum {
    RAMP_LINEAR,
    RAMP_COS,
    RAMP_PARABOLIC,
    RAMP_NEGATIVE_PARABOLIC
} RampShape;

namespace ValueProviderFactory {

/**
 * @brief Create the provider for a planned movement
 *
 * - custom value function: used as is
 * - boolean axis: constant target state
 * - numeric target equal to from: no change
 * - otherwise: from + x * (to - from)
 *
 * @param[in] movement Planned movement
 *
 * @return Provider to evaluate every tick
 */
ValueProvider create(const ResolvedMovement& movement);

/**
 * @brief Build the context for one provider evaluation
 *
 * @param[in] movement Planned movement
 * @param[in] index Tick index
 * @param[in] current_value Last committed axis value
 *
 * @return Context with time = index * period and x = (index + 1) / step_count
 *         (infinite for immediate movements)
 */
ValueContext makeContext(const ResolvedMovement& movement, uint32_t index, double current_value);

/**
 * @brief Create a ramp provider
 *
 * Usable as MovementRequest::value together with a target:
 * @code
 * MovementRequest::create("stroke").target(0.0).withDuration(1.0)
 *     .withValue(ValueProviderFactory::ramp(RAMP_COS));
 * @endcode
 * Without a target the ramp reports no change.
 */
ValueProvider ramp(RampShape shape);

/** @brief Ramp weight for x in [0, 1] */
double rampWeight(RampShape shape, double x);

} // namespace ValueProviderFactory

#endif // VALUE_PROVIDER_H
