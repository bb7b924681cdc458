/**
 * @file i_behavior.h
 * @brief Abstract interface for behaviors run by the motion engine
 * @author TCMU Team
 * @date 2025
 */

#ifndef I_BEHAVIOR_H
#define I_BEHAVIOR_H

#include <cstddef>
#include "esp_err.h"
#include "i_motion_engine.h"

/**
 * @brief A behavior performs one step per perform() call
 *
 * MotionEngine::runBehavior() calls perform() repeatedly until
 * isComplete() reports true, the behavior is superseded or stop() is called.
 *
 * Implementations:
 * - ActionScheduler: Action list driven behavior
 */
class IBehavior {
public:
    virtual ~IBehavior() = default;

    /**
     * @brief Perform the next step
     *
     * @param engine Engine to drive
     * @param err_msg Optional buffer for a descriptive error
     * @param err_len Size of err_msg
     * @return ESP_OK on success, error code to end the behavior
     */
    virtual esp_err_t perform(IMotionEngine& engine, char* err_msg, size_t err_len) = 0;

    /** @brief True once the behavior has finished */
    virtual bool isComplete() const = 0;
};

#endif // I_BEHAVIOR_H
