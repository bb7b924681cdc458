/**
 * @file tick_executor.h
 * @brief Fixed-rate stepping of a planned movement batch
 * @author TCMU Team
 * @date 2025
 *
 * @note Immediate movements (step_count == 0) run once before the first
 *       tick. Then, for index = 0 .. max step count - 1, every movement with
 *       index < step_count is evaluated, the results are written as one
 *       line to every output device and committed to the registry. After
 *       each tick the executor suspends for one period and stops if the
 *       movement was cancelled meanwhile.
 *
 * Thread Safety:
 * - execute() must be called with the engine lock held; the lock is
 *   released only while suspended between ticks
 */

#ifndef TICK_EXECUTOR_H
#define TICK_EXECUTOR_H

#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "axis_registry.h"
#include "config_limits.h"
#include "cooperative_scheduler.h"
#include "movement_queue.h"
#include "movement_types.h"
#include "output_device_set.h"

class TickExecutor {
public:
    /**
     * @brief Construct an executor
     *
     * All collaborators are borrowed and must outlive the executor.
     */
    TickExecutor(AxisRegistry& registry, OutputDeviceSet& devices,
                 MovementQueue& queue, CooperativeScheduler& scheduler);

    /**
     * @brief Run a planned batch to completion or cancellation
     *
     * @param[in] movement_id Queue id of the batch, checked after every tick
     * @param[in] movements Planned movements
     * @param[in] count Number of movements
     * @param[out] completed true if every tick ran, false if cancelled
     * @param[out] err_msg Optional buffer for a descriptive error
     * @param[in] err_len Size of err_msg
     *
     * @return ESP_OK on completion or cancellation
     * @return ESP_ERR_INVALID_ARG on invalid arguments
     * @return Output device error if a line could not be written
     */
    esp_err_t execute(uint32_t movement_id, const ResolvedMovement* movements, size_t count,
                      bool* completed, char* err_msg = nullptr, size_t err_len = 0);

    /**
     * @brief Evaluate and emit one tick
     *
     * @param[in] movements Planned movements
     * @param[in] active Per-movement flag, evaluated only where true
     * @param[in] count Number of movements
     * @param[in] index Tick index passed to the providers
     *
     * @return ESP_OK if the tick was written (or produced no values)
     * @return Output device / encoding error otherwise
     */
    esp_err_t executeTick(const ResolvedMovement* movements, const bool* active, size_t count,
                          uint32_t index, char* err_msg = nullptr, size_t err_len = 0);

private:
    AxisRegistry& registry_;
    OutputDeviceSet& devices_;
    MovementQueue& queue_;
    CooperativeScheduler& scheduler_;

    ValueProvider providers_[LIMIT_MAX_BATCH_SIZE];   ///< Providers of the executing batch
};

#endif // TICK_EXECUTOR_H
