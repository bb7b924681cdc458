/**
 * @file movement_queue.h
 * @brief FIFO admission queue for movement batches
 * @author TCMU Team
 * @date 2025
 *
 * @note Every move() registers an id here. A movement may start only when
 *       its id is at the head and no other movement is executing. stop()
 *       clears all ids; waiting callers then see their id gone and report
 *       cancellation, the executing movement notices at its next tick.
 *
 * Thread Safety:
 * - Not internally synchronized, accessed under the engine lock
 */

#ifndef MOVEMENT_QUEUE_H
#define MOVEMENT_QUEUE_H

#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "config_limits.h"

class MovementQueue {
public:
    MovementQueue();

    /**
     * @brief Register a new movement at the tail
     *
     * @param[out] id Assigned movement id (never 0)
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if id is nullptr
     * @return ESP_ERR_NO_MEM if LIMIT_MAX_PENDING_MOVEMENTS are registered
     */
    esp_err_t submit(uint32_t* id);

    /** @brief True while the id is registered (not completed or cancelled) */
    bool exists(uint32_t id) const;

    /** @brief True if the id is at the head and nothing is executing */
    bool isReady(uint32_t id) const;

    /**
     * @brief Mark the movement as executing
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_STATE if the movement is not ready
     */
    esp_err_t begin(uint32_t id);

    /**
     * @brief Remove the id and clear the executing flag
     *
     * Safe to call after clear() removed the id.
     */
    void finish(uint32_t id);

    /** @brief Remove every registered id */
    void clear();

    /** @brief True while a movement is executing */
    bool inProgress() const { return in_progress_; }

    /** @brief Number of registered ids, executing one included */
    size_t size() const { return count_; }

private:
    uint32_t ids_[LIMIT_MAX_PENDING_MOVEMENTS];   ///< FIFO, head at index 0
    size_t count_;
    uint32_t next_id_;
    bool in_progress_;
    uint32_t executing_id_;
};

#endif // MOVEMENT_QUEUE_H
