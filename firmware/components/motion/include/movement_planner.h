/**
 * @file movement_planner.h
 * @brief Resolves a validated batch into a single timeline
 * @author TCMU Team
 * @date 2025
 *
 * @note Two passes over the batch:
 *       1. from / direction from the current axis values, and the missing
 *          one of speed or duration for requests with a target.
 *       2. sync requests adopt the duration of the axis they follow
 *          (transitively), untimed numeric requests adopt the longest
 *          duration of the batch; step counts follow from the duration.
 *
 *       Derived speeds and durations are rounded to 10 decimals before the
 *       step count is computed.
 */

#ifndef MOVEMENT_PLANNER_H
#define MOVEMENT_PLANNER_H

#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "axis_registry.h"
#include "movement_types.h"

class MovementPlanner {
public:
    explicit MovementPlanner(const AxisRegistry& registry);

    /**
     * @brief Plan a validated batch
     *
     * @param[in] requests Batch that passed MovementValidator::validate()
     * @param[in] count Number of requests (<= LIMIT_MAX_BATCH_SIZE)
     * @param[in] default_axis Key for requests without an axis
     * @param[in] frequency_hz Tick frequency
     * @param[out] out Array of at least count entries
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if arguments are invalid or an axis does
     *         not resolve (batch was not validated)
     */
    esp_err_t plan(const MovementRequest* requests, size_t count, const char* default_axis,
                   double frequency_hz, ResolvedMovement* out) const;

    /**
     * @brief Longest step count of a planned batch
     *
     * @return Maximum step_count, 0 if every movement is immediate
     */
    static uint32_t maxStepCount(const ResolvedMovement* movements, size_t count);

private:
    const AxisRegistry& registry_;
};

#endif // MOVEMENT_PLANNER_H
