/**
 * @file axis_registry.h
 * @brief Registry of configured axes and their live values
 * @author TCMU Team
 * @date 2025
 *
 * @note Holds per-axis configuration keyed by machine name and optional
 *       alias, plus the last committed value of every axis.
 *
 * Thread Safety:
 * - Not internally synchronized
 * - MotionEngine serializes all access through its CooperativeScheduler
 */

#ifndef AXIS_REGISTRY_H
#define AXIS_REGISTRY_H

#include <cstddef>
#include "esp_err.h"
#include "axis_types.h"
#include "config_limits.h"

/**
 * @brief Fixed-capacity axis registry
 *
 * Every configured name and alias maps to exactly one entry. Entries keep
 * their index for their lifetime, so planners and executors may refer to
 * axes by index within one movement.
 *
 * Usage:
 * @code
 * AxisRegistry registry;
 * AxisConfig cfg = AxisConfig::create("L0", AXIS_TYPE_LINEAR, "stroke");
 * cfg.withLimits(0.3, 0.9);
 * registry.configureAxis(cfg);
 *
 * Axis axis;
 * registry.getAxis("stroke", &axis);  // axis.name == "L0"
 * @endcode
 */
class AxisRegistry {
public:
    /**
     * @brief Default constructor
     *
     * Creates an empty registry.
     */
    AxisRegistry();

    /**
     * @brief Configure (add or replace) an axis
     *
     * Validates the whole configuration before touching any entry. When an
     * axis with the same name exists it is replaced in place, keeping its
     * live value, and its previous alias is released.
     *
     * @param[in] config Axis configuration
     * @param[out] err_msg Optional buffer for a descriptive error
     * @param[in] err_len Size of err_msg
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if name/type are missing, type is unknown,
     *         limits are out of [0, 1] or not ordered, or the alias (or
     *         name) is already bound to another axis
     * @return ESP_ERR_NO_MEM if LIMIT_MAX_AXES axes are already configured
     */
    esp_err_t configureAxis(const AxisConfig& config, char* err_msg = nullptr, size_t err_len = 0);

    /**
     * @brief Get a snapshot of an axis
     *
     * @param[in] key Machine name or alias
     * @param[out] axis Snapshot destination
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if key or axis is nullptr
     * @return ESP_ERR_NOT_FOUND if no axis matches key
     */
    esp_err_t getAxis(const char* key, Axis* axis) const;

    /**
     * @brief Update the output limits of an axis
     *
     * Stores min = min(lo, hi) and max = max(lo, hi).
     *
     * @param[in] key Machine name or alias
     * @param[in] lo First bound in [0, 1]
     * @param[in] hi Second bound in [0, 1], different from lo
     * @param[out] err_msg Optional buffer for a descriptive error
     * @param[in] err_len Size of err_msg
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if a bound is out of range or lo == hi
     * @return ESP_ERR_NOT_FOUND if the axis is unknown
     */
    esp_err_t updateLimits(const char* key, double lo, double hi,
                           char* err_msg = nullptr, size_t err_len = 0);

    /**
     * @brief Resolve a name or alias to an entry index
     *
     * @param[in] key Machine name or alias
     *
     * @return Index in [0, count()), or -1 if key is unknown, empty or NULL
     */
    int resolve(const char* key) const;

    /**
     * @brief Access an entry by index
     *
     * @return Pointer to the entry, or nullptr if index is out of range
     */
    const Axis* at(int index) const;

    /**
     * @brief Copy all axes sorted by machine name
     *
     * @param[out] axes Destination array
     * @param[in] max_count Capacity of axes
     *
     * @return Number of axes written
     */
    size_t getAxes(Axis* axes, size_t max_count) const;

    /** @brief Number of configured axes */
    size_t count() const { return count_; }

    /**
     * @brief Commit a new numeric value
     *
     * @param[in] index Entry index
     * @param[in] value New position (stored as given)
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if index is out of range
     */
    esp_err_t commitValue(int index, double value);

    /**
     * @brief Commit a new boolean state
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if index is out of range
     */
    esp_err_t commitState(int index, bool state);

    /** @brief Remove all axes */
    void clear();

private:
    esp_err_t validateConfig(const AxisConfig& config, int existing,
                             char* err_msg, size_t err_len) const;

    Axis axes_[LIMIT_MAX_AXES];   ///< Entries, valid in [0, count_)
    size_t count_;                ///< Number of configured axes
};

#endif // AXIS_REGISTRY_H
