/**
 * @file movement_validator.h
 * @brief Batch validation for move() requests
 * @author TCMU Team
 * @date 2025
 *
 * @note Checks a whole movement batch before anything is queued. The
 *       first failing rule rejects the batch; nothing is modified.
 */

#ifndef MOVEMENT_VALIDATOR_H
#define MOVEMENT_VALIDATOR_H

#include <cstddef>
#include "esp_err.h"
#include "axis_registry.h"
#include "movement_types.h"

/**
 * @brief Validates movement batches against the axis registry
 *
 * Rules, checked per request in batch order:
 * - axis resolves (an empty axis uses the default axis)
 * - 'to' or a value provider is present; 'to' matches the axis type
 * - speed and duration are exclusive, finite and positive
 * - speed needs a target
 * - sync excludes speed and duration
 * - boolean axes take no speed, and no duration with a constant target
 * - no axis appears twice
 *
 * Then, for the whole batch:
 * - every sync chain stays inside the batch and never cycles
 * - at least one request is timed unless every axis is boolean
 */
class MovementValidator {
public:
    explicit MovementValidator(const AxisRegistry& registry);

    /**
     * @brief Validate a movement batch
     *
     * @param[in] requests Batch of requests
     * @param[in] count Number of requests
     * @param[in] default_axis Key used for requests without an axis (may be NULL)
     * @param[out] err_msg Optional buffer for a descriptive error
     * @param[in] err_len Size of err_msg
     *
     * @return ESP_OK if the batch is valid
     * @return ESP_ERR_INVALID_ARG on the first violated rule
     */
    esp_err_t validate(const MovementRequest* requests, size_t count, const char* default_axis,
                       char* err_msg = nullptr, size_t err_len = 0) const;

private:
    esp_err_t validateRequest(const MovementRequest& request, const char* key,
                              char* err_msg, size_t err_len) const;
    esp_err_t validateSyncChains(const MovementRequest* requests, const int* axis_indices,
                                 size_t count, const char* default_axis,
                                 char* err_msg, size_t err_len) const;

    const AxisRegistry& registry_;
};

#endif // MOVEMENT_VALIDATOR_H
