/**
 * @file i_motion_engine.h
 * @brief Abstract interface of the motion engine used by behaviors
 * @author TCMU Team
 * @date 2025
 *
 * @note Behaviors drive the engine only through this interface, so they can
 *       be unit tested against a mock engine.
 */

#ifndef I_MOTION_ENGINE_H
#define I_MOTION_ENGINE_H

#include <cstddef>
#include "esp_err.h"
#include "axis_types.h"
#include "movement_types.h"

/**
 * @brief Abstract motion engine interface
 *
 * Implementations:
 * - MotionEngine: Real engine writing TCode to output devices
 * - MockMotionEngine: Records calls for unit tests
 */
class IMotionEngine {
public:
    virtual ~IMotionEngine() = default;

    /**
     * @brief Perform a movement batch
     *
     * Blocks the calling task until the batch completes or is cancelled.
     *
     * @param requests Batch of requests (one per axis)
     * @param count Number of requests
     * @param completed Optional, set to true on completion, false on cancellation
     * @return ESP_OK on completion or cancellation
     * @return ESP_ERR_INVALID_ARG if the batch is invalid
     * @return Output device error if a line could not be written
     */
    virtual esp_err_t move(const MovementRequest* requests, size_t count, bool* completed) = 0;

    /**
     * @brief Suspend the calling task
     *
     * @param seconds Finite, non-negative number of seconds
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if seconds is negative or not finite
     */
    virtual esp_err_t sleep(double seconds) = 0;

    /** @brief Cancel every pending and executing movement and the running behavior */
    virtual void stop() = 0;

    /**
     * @brief Get a snapshot of an axis
     *
     * @return ESP_OK, or ESP_ERR_NOT_FOUND if key is unknown
     */
    virtual esp_err_t getAxis(const char* key, Axis* axis) const = 0;

    /** @brief Seconds per tick */
    virtual double period() const = 0;

    /**
     * @brief Copy the message of the last failed operation
     *
     * @param[out] buf Destination buffer
     * @param[in] len Size of buf
     */
    virtual void getLastError(char* buf, size_t len) const = 0;
};

#endif // I_MOTION_ENGINE_H
