/**
 * @file config_timing.h
 * @brief Control loop rate, task priorities and time conversion constants
 * @author TCMU Team
 * @date 2025
 *
 * @note The control loop is paced in FreeRTOS ticks. One period is
 *       1 / frequency seconds and is rounded to whole ticks by pdMS_TO_TICKS.
 */

#ifndef CONFIG_TIMING_H
#define CONFIG_TIMING_H

/**
 * @defgroup config_timing Timing Configuration
 * @brief Tick rate and scheduling parameters
 * @{
 */

/**
 * @brief Default control loop frequency (Hz)
 *
 * 50 Hz gives a 20 ms period, the usual update rate for TCode devices.
 */
#define TIMING_DEFAULT_FREQUENCY_HZ     50

/** @brief Microseconds per second */
#define TIMING_US_PER_S                 1000000ULL

/**
 * @defgroup task_priorities Task Priorities
 * @brief FreeRTOS priorities for motion unit tasks
 * @{
 */

/** @brief Behavior runner task priority */
#define TIMING_BEHAVIOR_TASK_PRIORITY   10

/** @brief Core the behavior runner is pinned to */
#define TIMING_BEHAVIOR_TASK_CORE       1

/** @} */ // end task_priorities

/** @} */ // end config_timing

#endif // CONFIG_TIMING_H
