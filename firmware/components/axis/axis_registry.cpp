/**
 * @file axis_registry.cpp
 * @brief Axis registry implementation
 * @author TCMU Team
 * @date 2025
 */

#include "axis_registry.h"
#include "config_defaults.h"
#include "config_errors.h"
#include "error_format.h"
#include "motion_math.h"

#include "esp_log.h"
#include <cstring>

static const char* TAG = "AXIS_REG";

/* ==========================================================================
 * Helpers
 * ========================================================================== */

static bool key_matches(const Axis& axis, const char* key)
{
    if (strcmp(axis.name, key) == 0) {
        return true;
    }
    return axis.alias[0] != '\0' && strcmp(axis.alias, key) == 0;
}

static bool is_valid_type(AxisType type)
{
    return type == AXIS_TYPE_LINEAR || type == AXIS_TYPE_ROTATION ||
           type == AXIS_TYPE_AUXILIARY || type == AXIS_TYPE_BOOLEAN;
}

/* ==========================================================================
 * AxisRegistry Implementation
 * ========================================================================== */

AxisRegistry::AxisRegistry()
    : axes_{}
    , count_(0)
{
}

esp_err_t AxisRegistry::validateConfig(const AxisConfig& config, int existing,
                                       char* err_msg, size_t err_len) const
{
    // Required fields
    const bool missing_name = config.name[0] == '\0';
    const bool missing_type = config.type == AXIS_TYPE_NONE;
    if (missing_name || missing_type) {
        format_error_message(err_msg, err_len, ERR_CONFIGURATION,
                             "Configuration is missing properties: %s%s%s",
                             missing_name ? "name" : "",
                             (missing_name && missing_type) ? ", " : "",
                             missing_type ? "type" : "");
        return ESP_ERR_INVALID_ARG;
    }

    // Optional limits must lie in [0, 1]
    const bool invalid_max = config.has_max && !MotionMath::isUnitValue(config.max);
    const bool invalid_min = config.has_min && !MotionMath::isUnitValue(config.min);
    if (invalid_max && invalid_min) {
        format_error_message(err_msg, err_len, ERR_CONFIGURATION,
                             "Invalid configuration parameter(s): max = %g, min = %g",
                             config.max, config.min);
        return ESP_ERR_INVALID_ARG;
    }
    if (invalid_max || invalid_min) {
        format_error_message(err_msg, err_len, ERR_CONFIGURATION,
                             "Invalid configuration parameter(s): %s = %g",
                             invalid_max ? "max" : "min",
                             invalid_max ? config.max : config.min);
        return ESP_ERR_INVALID_ARG;
    }

    if (!is_valid_type(config.type)) {
        format_error_message(err_msg, err_len, ERR_CONFIGURATION,
                             "Invalid type. Must be linear, rotation, auxiliary, or boolean: %d",
                             static_cast<int>(config.type));
        return ESP_ERR_INVALID_ARG;
    }

    const double min = config.has_min ? config.min : DEFAULT_LIMIT_MIN;
    const double max = config.has_max ? config.max : DEFAULT_LIMIT_MAX;
    if (min >= max) {
        format_error_message(err_msg, err_len, ERR_CONFIGURATION,
                             "Invalid configuration parameter(s): max = %g, min = %g",
                             max, min);
        return ESP_ERR_INVALID_ARG;
    }

    // Name and alias must not collide with any other axis
    for (size_t i = 0; i < count_; i++) {
        if (static_cast<int>(i) == existing) {
            continue;
        }

        if (axes_[i].alias[0] != '\0' && strcmp(axes_[i].alias, config.name) == 0) {
            format_error_message(err_msg, err_len, ERR_ALIAS_COLLISION,
                                 "Name already used as an alias of axis: %s", axes_[i].name);
            return ESP_ERR_INVALID_ARG;
        }

        if (config.alias[0] != '\0' && key_matches(axes_[i], config.alias)) {
            format_error_message(err_msg, err_len, ERR_ALIAS_COLLISION,
                                 "Alias already refers to another axis: %s", config.alias);
            return ESP_ERR_INVALID_ARG;
        }
    }

    if (config.alias[0] != '\0' && strcmp(config.alias, config.name) == 0) {
        format_error_message(err_msg, err_len, ERR_ALIAS_COLLISION,
                             "Alias already refers to another axis: %s", config.alias);
        return ESP_ERR_INVALID_ARG;
    }

    if (existing < 0 && count_ >= LIMIT_MAX_AXES) {
        format_error_message(err_msg, err_len, ERR_REGISTRY_FULL,
                             "Cannot configure more than %d axes", LIMIT_MAX_AXES);
        return ESP_ERR_NO_MEM;
    }

    return ESP_OK;
}

esp_err_t AxisRegistry::configureAxis(const AxisConfig& config, char* err_msg, size_t err_len)
{
    int existing = -1;
    for (size_t i = 0; i < count_; i++) {
        if (strcmp(axes_[i].name, config.name) == 0) {
            existing = static_cast<int>(i);
            break;
        }
    }

    esp_err_t ret = validateConfig(config, existing, err_msg, err_len);
    if (ret != ESP_OK) {
        ESP_LOGD(TAG, "Rejected configuration for axis '%s'", config.name);
        return ret;
    }

    Axis& axis = (existing >= 0) ? axes_[existing] : axes_[count_];

    if (existing < 0) {
        // New axis starts at its home value
        axis.value = DEFAULT_AXIS_VALUE;
        axis.state = DEFAULT_BOOLEAN_AXIS_STATE;
        count_++;
    }

    strncpy(axis.name, config.name, LIMIT_AXIS_NAME_MAX_LENGTH);
    axis.name[LIMIT_AXIS_NAME_MAX_LENGTH] = '\0';
    strncpy(axis.alias, config.alias, LIMIT_ALIAS_MAX_LENGTH);
    axis.alias[LIMIT_ALIAS_MAX_LENGTH] = '\0';
    axis.type = config.type;
    axis.min = config.has_min ? config.min : DEFAULT_LIMIT_MIN;
    axis.max = config.has_max ? config.max : DEFAULT_LIMIT_MAX;

    ESP_LOGI(TAG, "%s axis %s%s%s (%s) limits [%.3f, %.3f]",
             existing >= 0 ? "Reconfigured" : "Configured",
             axis.name,
             axis.alias[0] != '\0' ? " / " : "",
             axis.alias,
             axis_type_to_string(axis.type),
             axis.min, axis.max);
    return ESP_OK;
}

esp_err_t AxisRegistry::getAxis(const char* key, Axis* axis) const
{
    if (key == nullptr || axis == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    int index = resolve(key);
    if (index < 0) {
        return ESP_ERR_NOT_FOUND;
    }

    *axis = axes_[index];
    return ESP_OK;
}

esp_err_t AxisRegistry::updateLimits(const char* key, double lo, double hi,
                                     char* err_msg, size_t err_len)
{
    if (!MotionMath::isUnitValue(lo) || !MotionMath::isUnitValue(hi) || lo == hi) {
        format_error_message(err_msg, err_len, ERR_INVALID_LIMITS,
                             "Invalid limits: min = %g, max = %g", lo, hi);
        return ESP_ERR_INVALID_ARG;
    }

    int index = resolve(key);
    if (index < 0) {
        format_error_message(err_msg, err_len, ERR_INVALID_AXIS,
                             "Invalid axis: %s", key != nullptr ? key : "(null)");
        return ESP_ERR_NOT_FOUND;
    }

    axes_[index].min = lo < hi ? lo : hi;
    axes_[index].max = lo < hi ? hi : lo;

    ESP_LOGD(TAG, "Axis %s limits [%.3f, %.3f]", axes_[index].name,
             axes_[index].min, axes_[index].max);
    return ESP_OK;
}

int AxisRegistry::resolve(const char* key) const
{
    if (key == nullptr || key[0] == '\0') {
        return -1;
    }

    for (size_t i = 0; i < count_; i++) {
        if (key_matches(axes_[i], key)) {
            return static_cast<int>(i);
        }
    }

    return -1;
}

const Axis* AxisRegistry::at(int index) const
{
    if (index < 0 || static_cast<size_t>(index) >= count_) {
        return nullptr;
    }
    return &axes_[index];
}

size_t AxisRegistry::getAxes(Axis* axes, size_t max_count) const
{
    if (axes == nullptr) {
        return 0;
    }

    // Insertion sort by name into the caller's array
    size_t written = 0;
    for (size_t i = 0; i < count_ && written < max_count; i++) {
        size_t pos = written;
        while (pos > 0 && strcmp(axes[pos - 1].name, axes_[i].name) > 0) {
            axes[pos] = axes[pos - 1];
            pos--;
        }
        axes[pos] = axes_[i];
        written++;
    }

    return written;
}

esp_err_t AxisRegistry::commitValue(int index, double value)
{
    if (index < 0 || static_cast<size_t>(index) >= count_) {
        return ESP_ERR_INVALID_ARG;
    }

    axes_[index].value = value;
    return ESP_OK;
}

esp_err_t AxisRegistry::commitState(int index, bool state)
{
    if (index < 0 || static_cast<size_t>(index) >= count_) {
        return ESP_ERR_INVALID_ARG;
    }

    axes_[index].state = state;
    return ESP_OK;
}

void AxisRegistry::clear()
{
    count_ = 0;
}
