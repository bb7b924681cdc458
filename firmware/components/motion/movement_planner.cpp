/**
 * @file movement_planner.cpp
 * @brief Movement planning implementation
 * @author TCMU Team
 * @date 2025
 */

#include "movement_planner.h"
#include "config_defaults.h"
#include "motion_math.h"

#include "esp_log.h"
#include <cmath>
#include <cstring>

static const char* TAG = "MOVE_PLAN";

MovementPlanner::MovementPlanner(const AxisRegistry& registry)
    : registry_(registry)
{
}

esp_err_t MovementPlanner::plan(const MovementRequest* requests, size_t count,
                                const char* default_axis, double frequency_hz,
                                ResolvedMovement* out) const
{
    if (requests == nullptr || out == nullptr || count == 0 || count > LIMIT_MAX_BATCH_SIZE ||
        !(frequency_hz > 0.0)) {
        return ESP_ERR_INVALID_ARG;
    }

    const double period = 1.0 / frequency_hz;
    double max_duration = 0.0;

    // Pass 1: everything derivable from the request alone
    for (size_t i = 0; i < count; i++) {
        const MovementRequest& req = requests[i];
        ResolvedMovement& mv = out[i];

        const char* key = req.axis[0] != '\0' ? req.axis : default_axis;
        const int index = registry_.resolve(key);
        if (index < 0) {
            ESP_LOGE(TAG, "Unresolved axis in planned batch: %s", key != nullptr ? key : "(null)");
            return ESP_ERR_INVALID_ARG;
        }
        const Axis* axis = registry_.at(index);

        mv = ResolvedMovement{};
        mv.axis_index = index;
        strncpy(mv.axis, axis->name, LIMIT_AXIS_NAME_MAX_LENGTH);
        mv.is_boolean = axis->isBoolean();
        mv.target_kind = req.target_kind;
        mv.to_state = req.to_state;
        mv.from = axis->isBoolean() ? (axis->state ? 1.0 : 0.0) : axis->value;
        mv.has_speed = req.has_speed;
        mv.speed = req.speed;
        mv.has_duration = req.has_duration;
        mv.duration = req.duration;
        mv.period = period;
        mv.frequency = frequency_hz;
        mv.value = req.value;

        if (req.hasTarget()) {
            mv.to = (req.target_kind == TARGET_BOOLEAN) ? (req.to_state ? 1.0 : 0.0) : req.to;
            const double distance = std::fabs(mv.to - mv.from);

            if (req.has_duration) {
                mv.has_speed = true;
                mv.speed = MotionMath::roundTo(distance / req.duration, DEFAULT_ROUND_DECIMALS);
            } else if (req.has_speed) {
                mv.has_duration = true;
                mv.duration = MotionMath::roundTo(distance / req.speed, DEFAULT_ROUND_DECIMALS);
            }

            mv.direction = MotionMath::direction(mv.from, mv.to);
        }

        if (mv.has_duration && mv.duration > max_duration) {
            max_duration = mv.duration;
        }
    }

    // Pass 2: sync and implicit durations, then step counts
    for (size_t i = 0; i < count; i++) {
        ResolvedMovement& mv = out[i];

        if (requests[i].hasSync()) {
            size_t current = i;
            for (size_t hops = 0; hops < count && requests[current].hasSync(); hops++) {
                const int target = registry_.resolve(requests[current].sync);
                size_t next = count;
                for (size_t j = 0; j < count; j++) {
                    if (out[j].axis_index == target) {
                        next = j;
                        break;
                    }
                }
                if (next == count) {
                    return ESP_ERR_INVALID_ARG;
                }
                current = next;
            }

            const ResolvedMovement& synced = out[current];
            mv.has_duration = true;
            mv.duration = (synced.has_duration && synced.duration > 0.0) ? synced.duration : max_duration;

            if (mv.target_kind != TARGET_NONE) {
                mv.has_speed = true;
                mv.speed = mv.duration > 0.0
                    ? MotionMath::roundTo(std::fabs(mv.to - mv.from) / mv.duration, DEFAULT_ROUND_DECIMALS)
                    : 0.0;
            }
        } else if (!mv.has_duration && !mv.is_boolean) {
            mv.has_duration = true;
            mv.duration = max_duration;
        }

        mv.step_count = mv.has_duration ? MotionMath::stepCount(mv.duration, frequency_hz) : 0;

        ESP_LOGD(TAG, "%s: from %.4f to %.4f dur %.4f speed %.4f steps %u",
                 mv.axis, mv.from, mv.to, mv.duration, mv.speed,
                 static_cast<unsigned>(mv.step_count));
    }

    return ESP_OK;
}

uint32_t MovementPlanner::maxStepCount(const ResolvedMovement* movements, size_t count)
{
    uint32_t max_steps = 0;
    for (size_t i = 0; i < count; i++) {
        if (movements[i].step_count > max_steps) {
            max_steps = movements[i].step_count;
        }
    }
    return max_steps;
}
