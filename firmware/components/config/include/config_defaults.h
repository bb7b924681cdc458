/**
 * @file config_defaults.h
 * @brief Default axis values, home parameters and rounding precision
 * @author TCMU Team
 * @date 2025
 *
 * @note Axis positions are normalized to [0, 1]. Axis limits map that range
 *       onto the device's usable travel when commands are encoded.
 */

#ifndef CONFIG_DEFAULTS_H
#define CONFIG_DEFAULTS_H

/**
 * @defgroup config_defaults Default Parameters
 * @brief Compile-time default values for axes and movements
 * @{
 */

/**
 * @defgroup axis_defaults Default Axis Configuration
 * @brief Values applied when an axis configuration omits them
 * @{
 */

/** @brief Lower bound of the normalized position range */
#define DEFAULT_POSITION_MIN        0.0

/** @brief Upper bound of the normalized position range */
#define DEFAULT_POSITION_MAX        1.0

/** @brief Default minimum limit for a configured axis */
#define DEFAULT_LIMIT_MIN           DEFAULT_POSITION_MIN

/** @brief Default maximum limit for a configured axis */
#define DEFAULT_LIMIT_MAX           DEFAULT_POSITION_MAX

/**
 * @brief Initial value of linear, rotation and auxiliary axes
 *
 * 0.5 is the neutral (home) position.
 */
#define DEFAULT_AXIS_VALUE          0.5

/** @brief Initial state of boolean axes */
#define DEFAULT_BOOLEAN_AXIS_STATE  false

/** @brief Numeric value at or above which a boolean axis is considered on */
#define DEFAULT_BOOLEAN_THRESHOLD   0.5

/** @} */ // end axis_defaults

/**
 * @defgroup home_defaults Home Movement
 * @brief Parameters used by home() when none are given
 * @{
 */

/** @brief Default home target position */
#define DEFAULT_HOME_POSITION       0.5

/** @brief Default home speed (units per second) */
#define DEFAULT_HOME_SPEED          0.5

/** @} */ // end home_defaults

/**
 * @defgroup precision_defaults Numeric Precision
 * @brief Decimal places used when rounding computed values
 *
 * Speeds, durations and provider outputs are rounded to
 * DEFAULT_ROUND_DECIMALS to remove floating point accumulation noise
 * before they feed step count computation.
 * @{
 */

/** @brief Decimal places for computed speeds, durations and values */
#define DEFAULT_ROUND_DECIMALS      10

/** @} */ // end precision_defaults

/** @} */ // end config_defaults

#endif // CONFIG_DEFAULTS_H
