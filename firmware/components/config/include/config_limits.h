/**
 * @file config_limits.h
 * @brief Buffer sizes, axis counts, tick rate bounds and stack sizes
 * @author TCMU Team
 * @date 2025
 *
 * @note All numeric limits for the motion unit are defined here.
 *       Includes compile-time validation via static_assert.
 */

#ifndef CONFIG_LIMITS_H
#define CONFIG_LIMITS_H

#include <assert.h>

/**
 * @defgroup config_limits System Limits and Sizes
 * @brief Buffer sizes, axis counts and memory allocation limits
 * @{
 */

/**
 * @defgroup limits_buffer Buffer Sizes
 * @brief Maximum sizes for protocol lines, names and error messages
 * @{
 */

/** @brief Maximum protocol line length including newline and terminator (bytes) */
#define LIMIT_CMD_MAX_LENGTH        256

/** @brief Maximum error message length including terminator (bytes) */
#define LIMIT_ERROR_MSG_LENGTH      160

/** @brief Maximum axis machine name length (characters, e.g. "L0") */
#define LIMIT_AXIS_NAME_MAX_LENGTH  8

/** @brief Maximum axis alias length (characters, e.g. "stroke") */
#define LIMIT_ALIAS_MAX_LENGTH      16

/**
 * @brief Maximum length of any axis key (name or alias)
 *
 * Movement requests and sync references accept either form.
 */
#define LIMIT_AXIS_KEY_MAX_LENGTH   LIMIT_ALIAS_MAX_LENGTH

/** @brief Maximum engine configuration name length (characters) */
#define LIMIT_ENGINE_NAME_MAX_LENGTH 32

/** @} */ // end limits_buffer

/**
 * @defgroup limits_axis Axis Configuration
 * @brief Number of axes the registry can hold
 * @{
 */

/** @brief Maximum number of configured axes */
#define LIMIT_MAX_AXES              16

/** @brief Maximum number of requests in one movement batch (one per axis) */
#define LIMIT_MAX_BATCH_SIZE        LIMIT_MAX_AXES

/** @brief Maximum number of registered output devices */
#define LIMIT_MAX_OUTPUT_DEVICES    4

/** @} */ // end limits_axis

/**
 * @defgroup limits_queue Queue Depths
 * @brief Capacity of the movement admission queue and behavior action lists
 * @{
 */

/** @brief Maximum number of movements registered (executing + waiting) */
#define LIMIT_MAX_PENDING_MOVEMENTS 32

/** @brief Maximum number of pending actions per behavior */
#define LIMIT_MAX_ACTIONS           32

/** @} */ // end limits_queue

/**
 * @defgroup limits_tick Tick Rate Limits
 * @brief Bounds for the fixed control loop frequency
 *
 * @note MotionEngine::init() also rejects frequencies above
 *       configTICK_RATE_HZ, since a period shorter than one FreeRTOS tick
 *       cannot be paced.
 * @{
 */

/** @brief Minimum control loop frequency (Hz) */
#define LIMIT_MIN_FREQUENCY_HZ      1

/** @brief Maximum control loop frequency (Hz) */
#define LIMIT_MAX_FREQUENCY_HZ      500

/** @} */ // end limits_tick

/**
 * @defgroup limits_task Task Stack Sizes
 * @brief FreeRTOS stack allocations (bytes)
 * @{
 */

/** @brief Behavior runner task stack size */
#define LIMIT_STACK_BEHAVIOR        8192

/** @} */ // end limits_task

/* Compile-time validation */
static_assert(LIMIT_AXIS_KEY_MAX_LENGTH >= LIMIT_AXIS_NAME_MAX_LENGTH,
              "Axis key buffer must hold a full axis name");
static_assert(LIMIT_MAX_BATCH_SIZE <= LIMIT_MAX_AXES,
              "A batch holds at most one request per axis");
static_assert(LIMIT_MIN_FREQUENCY_HZ > 0 && LIMIT_MIN_FREQUENCY_HZ < LIMIT_MAX_FREQUENCY_HZ,
              "Frequency bounds must be positive and ordered");
static_assert(LIMIT_CMD_MAX_LENGTH >= LIMIT_MAX_AXES * (LIMIT_AXIS_NAME_MAX_LENGTH + 4) + 2,
              "Protocol line buffer must hold one token per axis");

/** @} */ // end config_limits

#endif // CONFIG_LIMITS_H
