/**
 * @file config.h
 * @brief Master configuration header for the TCode Motion Unit
 * @author TCMU Team
 * @date 2025
 *
 * @note This is the main include file for all configuration constants.
 *       Include this file to access all configuration headers.
 *
 * @code
 * #include "config.h"
 * // Now you have access to limits, timing, defaults, axes, protocol, errors
 * @endcode
 */

#ifndef CONFIG_H
#define CONFIG_H

/**
 * @defgroup config Master Configuration
 * @brief Central configuration header including all sub-headers
 * @{
 */

/**
 * @defgroup firmware_version Firmware Version
 * @brief Version information for the motion unit firmware
 * @{
 */

/** @brief Firmware product name */
#define FIRMWARE_NAME               "TCODE_MOTION_UNIT"

/** @brief Version string for display and logging */
#define FIRMWARE_VERSION_STRING     "1.0.0"

/** @} */ // end firmware_version

/**
 * @defgroup feature_flags Feature Flags
 * @brief Compile-time feature enable/disable switches
 *
 * Set to 1 to enable, 0 to disable at compile time.
 * @{
 */

/**
 * @brief Run the demonstration stroke behavior after boot
 *
 * When disabled, the firmware homes the device and idles.
 */
#define FEATURE_DEMO_BEHAVIOR       1

/** @} */ // end feature_flags

/*
 * Include all configuration sub-headers
 */

/** @brief Timing constants (Hz, ms) and task priorities */
#include "config_timing.h"

/** @brief Buffer sizes, axis counts, frequency bounds, stack sizes */
#include "config_limits.h"

/** @brief Default axis values and rounding precision */
#include "config_defaults.h"

/** @brief Default axis set names and aliases */
#include "config_axes.h"

/** @brief TCode token layout and value encoding */
#include "config_protocol.h"

/** @brief Error codes and messages */
#include "config_errors.h"

/** @} */ // end config

#endif // CONFIG_H
