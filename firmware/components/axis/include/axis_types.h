/**
 * @file axis_types.h
 * @brief Axis type definitions for the TCode Motion Unit
 * @author TCMU Team
 * @date 2025
 *
 * @note Defines AxisType, the AxisConfig input structure accepted by
 *       AxisRegistry::configureAxis() and the Axis snapshot returned by
 *       AxisRegistry::getAxis(). Positions are normalized to [0, 1].
 */

#ifndef AXIS_TYPES_H
#define AXIS_TYPES_H

#include <cstdint>
#include <cstring>
#include "config_limits.h"
#include "config_defaults.h"

/**
 * @defgroup axis_types Axis Type Definitions
 * @brief Enums and structs for the axis registry
 * @{
 */

/**
 * @brief Axis type enumeration
 *
 * Linear, rotation and auxiliary axes hold a numeric position in [0, 1].
 * Boolean axes hold an on/off state and ignore limits.
 */
typedef enum {
    AXIS_TYPE_NONE,         ///< Not set (rejected by configureAxis)
    AXIS_TYPE_LINEAR,       ///< Linear travel (stroke, surge, sway)
    AXIS_TYPE_ROTATION,     ///< Rotation (twist, roll, pitch)
    AXIS_TYPE_AUXILIARY,    ///< Auxiliary numeric channel (vibe, valve)
    AXIS_TYPE_BOOLEAN       ///< On/off channel (lube)
} AxisType;

/**
 * @brief Convert an axis type name to its enum value
 *
 * @param[in] name "linear", "rotation", "auxiliary" or "boolean"
 *
 * @return Matching AxisType, or AXIS_TYPE_NONE if name is unknown or NULL
 */
AxisType axis_type_from_string(const char* name);

/**
 * @brief Convert an axis type to its name
 *
 * @return Type name, or "none" for AXIS_TYPE_NONE / invalid values
 */
const char* axis_type_to_string(AxisType type);

/**
 * @brief Axis configuration structure
 *
 * Input to AxisRegistry::configureAxis(). Limits are optional; absent
 * limits default to DEFAULT_LIMIT_MIN / DEFAULT_LIMIT_MAX.
 */
struct AxisConfig {
    /**
     * @brief Machine name of the axis (e.g. "L0")
     *
     * Emitted as the token prefix on the wire. Must be non-empty.
     */
    char name[LIMIT_AXIS_NAME_MAX_LENGTH + 1];

    /** @brief Axis type, must not be AXIS_TYPE_NONE */
    AxisType type;

    /**
     * @brief Optional alias (e.g. "stroke")
     *
     * Empty string means no alias. An alias is a second unique key for
     * the same axis and may not collide with any other name or alias.
     */
    char alias[LIMIT_ALIAS_MAX_LENGTH + 1];

    bool has_min;   ///< min was specified
    double min;     ///< Lower output limit in [0, 1]
    bool has_max;   ///< max was specified
    double max;     ///< Upper output limit in [0, 1]

    /**
     * @brief Create an axis configuration without limits
     *
     * Names longer than the buffers are truncated; configureAxis() then
     * validates the result.
     *
     * @param[in] name Machine name
     * @param[in] type Axis type
     * @param[in] alias Optional alias (NULL for none)
     *
     * @return AxisConfig ready to pass to configureAxis()
     */
    static AxisConfig create(const char* name, AxisType type, const char* alias = nullptr) {
        AxisConfig cfg{};
        if (name != nullptr) {
            strncpy(cfg.name, name, LIMIT_AXIS_NAME_MAX_LENGTH);
        }
        cfg.type = type;
        if (alias != nullptr) {
            strncpy(cfg.alias, alias, LIMIT_ALIAS_MAX_LENGTH);
        }
        cfg.has_min = false;
        cfg.min = DEFAULT_LIMIT_MIN;
        cfg.has_max = false;
        cfg.max = DEFAULT_LIMIT_MAX;
        return cfg;
    }

    /**
     * @brief Set both output limits
     *
     * @return Reference to this config for chaining
     */
    AxisConfig& withLimits(double lo, double hi) {
        has_min = true;
        min = lo;
        has_max = true;
        max = hi;
        return *this;
    }
};

/**
 * @brief Axis snapshot
 *
 * Copy of an axis entry returned by AxisRegistry::getAxis(). Changes to a
 * snapshot do not affect the registry.
 */
struct Axis {
    char name[LIMIT_AXIS_NAME_MAX_LENGTH + 1];  ///< Machine name
    char alias[LIMIT_ALIAS_MAX_LENGTH + 1];     ///< Alias or empty
    AxisType type;                              ///< Axis type
    double min;                                 ///< Lower output limit
    double max;                                 ///< Upper output limit
    double value;                               ///< Live position (non-boolean axes)
    bool state;                                 ///< Live state (boolean axes)

    /** True for boolean axes. */
    bool isBoolean() const { return type == AXIS_TYPE_BOOLEAN; }
};

/** @} */ // end axis_types

#endif // AXIS_TYPES_H
