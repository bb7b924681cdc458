/**
 * @file tick_executor.cpp
 * @brief Tick executor implementation
 * @author TCMU Team
 * @date 2025
 */

#include "tick_executor.h"
#include "config_defaults.h"
#include "config_errors.h"
#include "error_format.h"
#include "motion_math.h"
#include "movement_planner.h"
#include "tcode_encoder.h"
#include "value_provider.h"

#include "esp_log.h"
#include "esp_timer.h"
#include <cmath>

static const char* TAG = "TICK_EXEC";

TickExecutor::TickExecutor(AxisRegistry& registry, OutputDeviceSet& devices,
                           MovementQueue& queue, CooperativeScheduler& scheduler)
    : registry_(registry)
    , devices_(devices)
    , queue_(queue)
    , scheduler_(scheduler)
{
}

esp_err_t TickExecutor::execute(uint32_t movement_id, const ResolvedMovement* movements,
                                size_t count, bool* completed, char* err_msg, size_t err_len)
{
    if (movements == nullptr || completed == nullptr || count == 0 || count > LIMIT_MAX_BATCH_SIZE) {
        return ESP_ERR_INVALID_ARG;
    }
    *completed = false;

    for (size_t i = 0; i < count; i++) {
        providers_[i] = ValueProviderFactory::create(movements[i]);
    }

    const uint32_t total_steps = MovementPlanner::maxStepCount(movements, count);
    const double period = movements[0].period;
    const int64_t start_us = esp_timer_get_time();
    uint32_t ticks = 0;
    bool active[LIMIT_MAX_BATCH_SIZE];

    // Immediate movements
    for (size_t i = 0; i < count; i++) {
        active[i] = movements[i].step_count == 0;
    }
    esp_err_t ret = executeTick(movements, active, count, 0, err_msg, err_len);

    for (uint32_t index = 0; ret == ESP_OK && index < total_steps; index++) {
        for (size_t i = 0; i < count; i++) {
            active[i] = movements[i].step_count > 0 && index < movements[i].step_count;
        }

        ret = executeTick(movements, active, count, index, err_msg, err_len);
        if (ret != ESP_OK) {
            break;
        }

        ticks++;
        // Absolute deadlines keep the average rate when a period is not a whole tick count
        scheduler_.yieldUntil(start_us + static_cast<int64_t>(std::llround(ticks * period * 1e6)));

        if (!queue_.exists(movement_id)) {
            ESP_LOGD(TAG, "Movement %u cancelled at tick %u", static_cast<unsigned>(movement_id),
                     static_cast<unsigned>(index));
            break;
        }

        if (index + 1 == total_steps) {
            *completed = true;
        }
    }

    if (ret == ESP_OK && total_steps == 0) {
        *completed = true;
    }

    ESP_LOGD(TAG, "Movement %u: %u/%u ticks in %lld us", static_cast<unsigned>(movement_id),
             static_cast<unsigned>(ticks), static_cast<unsigned>(total_steps),
             static_cast<long long>(esp_timer_get_time() - start_us));

    for (size_t i = 0; i < count; i++) {
        providers_[i] = nullptr;
    }
    return ret;
}

esp_err_t TickExecutor::executeTick(const ResolvedMovement* movements, const bool* active,
                                    size_t count, uint32_t index, char* err_msg, size_t err_len)
{
    TCodeLine line;
    int axis_indices[LIMIT_MAX_BATCH_SIZE];
    ProviderValue values[LIMIT_MAX_BATCH_SIZE];
    size_t emitted = 0;

    for (size_t i = 0; i < count; i++) {
        if (!active[i]) {
            continue;
        }

        const ResolvedMovement& movement = movements[i];
        const Axis* axis = registry_.at(movement.axis_index);
        if (axis == nullptr || !providers_[i]) {
            continue;
        }

        const double current = axis->isBoolean() ? (axis->state ? 1.0 : 0.0) : axis->value;
        ProviderValue value = providers_[i](ValueProviderFactory::makeContext(movement, index, current));

        if (value.isNone()) {
            continue;
        }

        if (value.kind == PROVIDER_VALUE_NUMBER) {
            if (!std::isfinite(value.number)) {
                ESP_LOGW(TAG, "Invalid value provided: %f", value.number);
                continue;
            }
            value.number = MotionMath::clamp(MotionMath::roundTo(value.number, DEFAULT_ROUND_DECIMALS),
                                             DEFAULT_POSITION_MIN, DEFAULT_POSITION_MAX);
        }

        esp_err_t ret = line.append(*axis, value);
        if (ret != ESP_OK) {
            format_error_message(err_msg, err_len, ERR_COMMUNICATION,
                                 "Protocol line too long at axis %s", axis->name);
            return ret;
        }

        axis_indices[emitted] = movement.axis_index;
        values[emitted] = value;
        emitted++;
    }

    if (emitted == 0) {
        return ESP_OK;
    }

    esp_err_t ret = devices_.write(line.finish(), err_msg, err_len);
    if (ret != ESP_OK) {
        return ret;
    }

    for (size_t i = 0; i < emitted; i++) {
        const Axis* axis = registry_.at(axis_indices[i]);
        const ProviderValue& value = values[i];

        if (axis->isBoolean()) {
            const bool state = (value.kind == PROVIDER_VALUE_BOOLEAN)
                ? value.flag
                : value.number >= DEFAULT_BOOLEAN_THRESHOLD;
            ret = registry_.commitState(axis_indices[i], state);
        } else {
            const double position = (value.kind == PROVIDER_VALUE_BOOLEAN)
                ? (value.flag ? 1.0 : 0.0)
                : value.number;
            ret = registry_.commitValue(axis_indices[i], position);
        }

        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Commit to axis %s failed: %s", axis->name, esp_err_to_name(ret));
        }
    }

    return ESP_OK;
}
