/**
 * @file value_provider.cpp
 * @brief Value provider factory implementation
 * @author TCMU Team
 * @date 2025
 */

#include "value_provider.h"

#include <cmath>

namespace ValueProviderFactory {

ValueProvider create(const ResolvedMovement& movement)
{
    if (movement.value) {
        return movement.value;
    }

    if (movement.is_boolean) {
        const bool state = movement.to_state;
        return [state](const ValueContext&) { return ProviderValue::ofState(state); };
    }

    if (movement.target_kind == TARGET_NONE || movement.to == movement.from) {
        return [](const ValueContext&) { return ProviderValue::none(); };
    }

    return [](const ValueContext& ctx) {
        return ProviderValue::of(ctx.from + ctx.x * (ctx.to - ctx.from));
    };
}

ValueContext makeContext(const ResolvedMovement& movement, uint32_t index, double current_value)
{
    ValueContext ctx{};
    ctx.axis = movement.axis;
    ctx.target = movement.target_kind;
    ctx.to = movement.to;
    ctx.from = movement.from;
    ctx.direction = movement.direction;
    ctx.has_speed = movement.has_speed;
    ctx.speed = movement.speed;
    ctx.has_duration = movement.has_duration;
    ctx.duration = movement.duration;
    ctx.step_count = movement.step_count;
    ctx.period = movement.period;
    ctx.frequency = movement.frequency;

    ctx.index = index;
    ctx.time = index * movement.period;
    ctx.current_value = current_value;
    // No step count: x is infinite and interpolating providers yield a non-finite value
    ctx.x = movement.step_count > 0
        ? static_cast<double>(index + 1) / static_cast<double>(movement.step_count)
        : INFINITY;
    return ctx;
}

double rampWeight(RampShape shape, double x)
{
    switch (shape) {
        case RAMP_COS:
            return (1.0 - std::cos(M_PI * x)) / 2.0;
        case RAMP_PARABOLIC:
            return x * x;
        case RAMP_NEGATIVE_PARABOLIC:
            return 1.0 - (1.0 - x) * (1.0 - x);
        case RAMP_LINEAR:
        default:
            return x;
    }
}

ValueProvider ramp(RampShape shape)
{
    return [shape](const ValueContext& ctx) {
        if (ctx.target != TARGET_NUMBER) {
            return ProviderValue::none();
        }
        return ProviderValue::of(ctx.from + (ctx.to - ctx.from) * rampWeight(shape, ctx.x));
    };
}

} // namespace ValueProviderFactory
