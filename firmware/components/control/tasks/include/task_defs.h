/**
 * @file task_defs.h
 * @brief FreeRTOS task function declarations
 * @author TCMU Team
 * @date 2025
 *
 * @note Declares the FreeRTOS task entry points of the motion unit.
 *       Callers of MotionEngine::move() block, so behaviors run in their
 *       own task.
 */

#ifndef TASK_DEFS_H
#define TASK_DEFS_H

#include "i_behavior.h"

class MotionEngine;

/**
 * @brief Argument of behavior_task()
 *
 * Must stay valid until the task has deleted itself.
 */
struct BehaviorTaskArgs {
    MotionEngine* engine;       ///< Engine running the behavior
    IBehavior* behavior;        ///< Behavior to run
};

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @defgroup tasks FreeRTOS Task Functions
 * @brief Task entry points for the motion unit
 * @{
 */

/**
 * @brief Behavior runner task
 *
 * Calls MotionEngine::runBehavior() and deletes itself once the behavior
 * completes, fails, is superseded or stopped.
 * Priority: TIMING_BEHAVIOR_TASK_PRIORITY, Core: TIMING_BEHAVIOR_TASK_CORE
 *
 * @param arg Pointer to BehaviorTaskArgs
 */
void behavior_task(void* arg);

/** @} */ // end tasks

#ifdef __cplusplus
}
#endif

#endif // TASK_DEFS_H
