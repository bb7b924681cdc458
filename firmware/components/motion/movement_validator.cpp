/**
 * @file movement_validator.cpp
 * @brief Movement batch validation implementation
 * @author TCMU Team
 * @date 2025
 */

#include "movement_validator.h"
#include "config_errors.h"
#include "error_format.h"
#include "motion_math.h"

#include "esp_log.h"
#include <cctype>
#include <cmath>

static const char* TAG = "MOVE_VALID";

static bool is_blank(const char* text)
{
    if (text == nullptr) {
        return true;
    }
    for (const char* p = text; *p != '\0'; p++) {
        if (!isspace(static_cast<unsigned char>(*p))) {
            return false;
        }
    }
    return true;
}

static const char* request_key(const MovementRequest& request, const char* default_axis)
{
    return request.axis[0] != '\0' ? request.axis : default_axis;
}

MovementValidator::MovementValidator(const AxisRegistry& registry)
    : registry_(registry)
{
}

esp_err_t MovementValidator::validate(const MovementRequest* requests, size_t count,
                                      const char* default_axis,
                                      char* err_msg, size_t err_len) const
{
    if (requests == nullptr || count == 0) {
        format_error_message(err_msg, err_len, ERR_INVALID_MOVEMENT, "%s", MSG_NO_MOVEMENTS);
        return ESP_ERR_INVALID_ARG;
    }

    if (count > LIMIT_MAX_BATCH_SIZE) {
        format_error_message(err_msg, err_len, ERR_INVALID_MOVEMENT,
                             "Too many movements in one batch: %u", static_cast<unsigned>(count));
        return ESP_ERR_INVALID_ARG;
    }

    int axis_indices[LIMIT_MAX_BATCH_SIZE];
    bool any_timed = false;
    bool any_non_boolean = false;

    for (size_t i = 0; i < count; i++) {
        const MovementRequest& request = requests[i];
        const char* key = request_key(request, default_axis);

        if (key == nullptr || key[0] == '\0') {
            format_error_message(err_msg, err_len, ERR_INVALID_AXIS, "%s", MSG_NO_DEFAULT_AXIS);
            return ESP_ERR_INVALID_ARG;
        }

        esp_err_t ret = validateRequest(request, key, err_msg, err_len);
        if (ret != ESP_OK) {
            ESP_LOGD(TAG, "Request %u rejected", static_cast<unsigned>(i));
            return ret;
        }

        const int index = registry_.resolve(key);
        for (size_t j = 0; j < i; j++) {
            if (axis_indices[j] == index) {
                format_error_message(err_msg, err_len, ERR_INVALID_MOVEMENT,
                                     "Duplicate axis movement: %s", key);
                return ESP_ERR_INVALID_ARG;
            }
        }
        axis_indices[i] = index;

        if (request.has_speed || request.has_duration) {
            any_timed = true;
        }
        if (!registry_.at(index)->isBoolean()) {
            any_non_boolean = true;
        }
    }

    esp_err_t ret = validateSyncChains(requests, axis_indices, count, default_axis,
                                       err_msg, err_len);
    if (ret != ESP_OK) {
        return ret;
    }

    if (!any_timed && any_non_boolean) {
        format_error_message(err_msg, err_len, ERR_INVALID_MOVEMENT, "%s", MSG_NO_TIMING);
        return ESP_ERR_INVALID_ARG;
    }

    return ESP_OK;
}

esp_err_t MovementValidator::validateRequest(const MovementRequest& request, const char* key,
                                             char* err_msg, size_t err_len) const
{
    // Axis
    const bool explicit_axis = request.axis[0] != '\0';
    const int index = registry_.resolve(key);
    if ((explicit_axis && is_blank(request.axis)) || index < 0) {
        format_error_message(err_msg, err_len, ERR_INVALID_AXIS,
                             "Invalid value for parameter 'axis': %s", key);
        return ESP_ERR_INVALID_ARG;
    }
    const Axis* axis = registry_.at(index);

    // Target
    if (request.hasTarget()) {
        bool invalid_to;
        if (axis->isBoolean()) {
            invalid_to = request.target_kind != TARGET_BOOLEAN;
        } else {
            invalid_to = request.target_kind != TARGET_NUMBER || !MotionMath::isUnitValue(request.to);
        }

        if (invalid_to) {
            if (request.target_kind == TARGET_BOOLEAN) {
                format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER,
                                     "Invalid value for parameter 'to': %s",
                                     request.to_state ? "true" : "false");
            } else {
                format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER,
                                     "Invalid value for parameter 'to': %g", request.to);
            }
            return ESP_ERR_INVALID_ARG;
        }
    } else if (!request.hasValue()) {
        format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER, "%s", MSG_MISSING_TARGET);
        return ESP_ERR_INVALID_ARG;
    }

    // Timing
    if (request.has_speed && request.has_duration) {
        format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER, "%s", MSG_SPEED_AND_DURATION);
        return ESP_ERR_INVALID_ARG;
    }

    if (request.has_speed && (!std::isfinite(request.speed) || request.speed <= 0.0)) {
        format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER,
                             "Invalid value for parameter 'speed': %g", request.speed);
        return ESP_ERR_INVALID_ARG;
    }

    if (request.has_duration && (!std::isfinite(request.duration) || request.duration <= 0.0)) {
        format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER,
                             "Invalid value for parameter 'duration': %g", request.duration);
        return ESP_ERR_INVALID_ARG;
    }

    if (request.has_speed && !request.hasTarget()) {
        format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER, "%s", MSG_SPEED_WITHOUT_TARGET);
        return ESP_ERR_INVALID_ARG;
    }

    // Sync
    if (request.hasSync()) {
        if (is_blank(request.sync)) {
            format_error_message(err_msg, err_len, ERR_INVALID_SYNC,
                                 "Invalid value for parameter 'sync': %s", request.sync);
            return ESP_ERR_INVALID_ARG;
        }

        if (request.has_speed || request.has_duration) {
            format_error_message(err_msg, err_len, ERR_INVALID_SYNC,
                                 "Cannot specify a speed or duration when sync property is present: %s",
                                 key);
            return ESP_ERR_INVALID_ARG;
        }
    }

    // Boolean axes
    if (axis->isBoolean()) {
        if (request.has_speed) {
            format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER,
                                 "Cannot specify speed for boolean axes: %s", key);
            return ESP_ERR_INVALID_ARG;
        }

        if (request.has_duration && request.hasTarget() && !request.hasValue()) {
            format_error_message(err_msg, err_len, ERR_INVALID_PARAMETER, "%s",
                                 MSG_BOOLEAN_CONST_DURATION);
            return ESP_ERR_INVALID_ARG;
        }
    }

    return ESP_OK;
}

esp_err_t MovementValidator::validateSyncChains(const MovementRequest* requests,
                                                const int* axis_indices, size_t count,
                                                const char* default_axis,
                                                char* err_msg, size_t err_len) const
{
    for (size_t origin = 0; origin < count; origin++) {
        size_t current = origin;
        size_t hops = 0;

        while (requests[current].hasSync()) {
            const int target_index = registry_.resolve(requests[current].sync);

            size_t next = count;
            for (size_t j = 0; j < count; j++) {
                if (target_index >= 0 && axis_indices[j] == target_index) {
                    next = j;
                    break;
                }
            }

            if (next == count) {
                format_error_message(err_msg, err_len, ERR_INVALID_SYNC,
                                     "Cannot sync with axis not specified in movement: %s -> %s",
                                     request_key(requests[current], default_axis),
                                     requests[current].sync);
                return ESP_ERR_INVALID_ARG;
            }

            // A chain longer than the batch revisits some request
            hops++;
            if (next == origin || hops > count) {
                format_error_message(err_msg, err_len, ERR_INVALID_SYNC, "%s", MSG_SYNC_CYCLE);
                return ESP_ERR_INVALID_ARG;
            }

            current = next;
        }
    }

    return ESP_OK;
}
