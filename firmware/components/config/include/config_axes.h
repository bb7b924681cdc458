/**
 * @file config_axes.h
 * @brief Default axis set (OSR2 / SR6 style TCode device)
 * @author TCMU Team
 * @date 2025
 *
 * @note Machine names and aliases of the axes configured when an engine is
 *       created without an explicit axis list. Use these constants instead of
 *       string literals.
 */

#ifndef CONFIG_AXES_H
#define CONFIG_AXES_H

#include "config_limits.h"

/**
 * @defgroup config_axes Default Axes
 * @brief Axis names and aliases for the default configuration
 * @{
 */

/** @brief Name of the default engine configuration */
#define DEFAULT_CONFIG_NAME         "OSR2"

/** @brief Axis commanded when a movement request names no axis */
#define DEFAULT_AXIS_ALIAS          AXIS_ALIAS_L0

/**
 * @defgroup axis_names Axis Machine Names
 * @brief Names emitted on the wire
 * @{
 */

/** @brief Up/down stroke */
#define AXIS_NAME_L0    "L0"

/** @brief Forward/back surge */
#define AXIS_NAME_L1    "L1"

/** @brief Left/right sway */
#define AXIS_NAME_L2    "L2"

/** @brief Twist */
#define AXIS_NAME_R0    "R0"

/** @brief Roll */
#define AXIS_NAME_R1    "R1"

/** @brief Pitch */
#define AXIS_NAME_R2    "R2"

/** @brief Vibration */
#define AXIS_NAME_V0    "V0"

/** @brief Pump */
#define AXIS_NAME_V1    "V1"

/** @brief Valve */
#define AXIS_NAME_A0    "A0"

/** @brief Suction */
#define AXIS_NAME_A1    "A1"

/** @brief Lubricant (on/off) */
#define AXIS_NAME_A2    "A2"

/** @} */ // end axis_names

/**
 * @defgroup axis_aliases Axis Aliases
 * @brief Human-readable keys resolving to the machine names
 * @{
 */

#define AXIS_ALIAS_L0   "stroke"
#define AXIS_ALIAS_L1   "forward"
#define AXIS_ALIAS_L2   "left"
#define AXIS_ALIAS_R0   "twist"
#define AXIS_ALIAS_R1   "roll"
#define AXIS_ALIAS_R2   "pitch"
#define AXIS_ALIAS_V0   "vibe"
#define AXIS_ALIAS_V1   "pump"
#define AXIS_ALIAS_A0   "valve"
#define AXIS_ALIAS_A1   "suck"
#define AXIS_ALIAS_A2   "lube"

/** @} */ // end axis_aliases

/** @brief Number of axes in the default configuration */
#define DEFAULT_AXIS_COUNT          11

static_assert(DEFAULT_AXIS_COUNT <= LIMIT_MAX_AXES,
              "Default axis set exceeds registry capacity");

/** @} */ // end config_axes

#endif // CONFIG_AXES_H
