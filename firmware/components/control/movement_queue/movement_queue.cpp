/**
 * @file movement_queue.cpp
 * @brief Movement admission queue implementation
 * @author TCMU Team
 * @date 2025
 */

#include "movement_queue.h"

#include "esp_log.h"

static const char* TAG = "MOVE_QUEUE";

MovementQueue::MovementQueue()
    : ids_{}
    , count_(0)
    , next_id_(1)
    , in_progress_(false)
    , executing_id_(0)
{
}

esp_err_t MovementQueue::submit(uint32_t* id)
{
    if (id == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    if (count_ >= LIMIT_MAX_PENDING_MOVEMENTS) {
        ESP_LOGW(TAG, "Movement queue full (%d)", LIMIT_MAX_PENDING_MOVEMENTS);
        return ESP_ERR_NO_MEM;
    }

    *id = next_id_++;
    if (next_id_ == 0) {
        next_id_ = 1;
    }

    ids_[count_++] = *id;
    ESP_LOGD(TAG, "Movement %u queued (%u registered)", static_cast<unsigned>(*id),
             static_cast<unsigned>(count_));
    return ESP_OK;
}

bool MovementQueue::exists(uint32_t id) const
{
    for (size_t i = 0; i < count_; i++) {
        if (ids_[i] == id) {
            return true;
        }
    }
    return false;
}

bool MovementQueue::isReady(uint32_t id) const
{
    return !in_progress_ && count_ > 0 && ids_[0] == id;
}

esp_err_t MovementQueue::begin(uint32_t id)
{
    if (!isReady(id)) {
        return ESP_ERR_INVALID_STATE;
    }

    in_progress_ = true;
    executing_id_ = id;
    return ESP_OK;
}

void MovementQueue::finish(uint32_t id)
{
    if (in_progress_ && executing_id_ == id) {
        in_progress_ = false;
        executing_id_ = 0;
    }

    for (size_t i = 0; i < count_; i++) {
        if (ids_[i] == id) {
            for (size_t j = i + 1; j < count_; j++) {
                ids_[j - 1] = ids_[j];
            }
            count_--;
            break;
        }
    }
}

void MovementQueue::clear()
{
    if (count_ > 0) {
        ESP_LOGD(TAG, "Cancelling %u movements", static_cast<unsigned>(count_));
    }
    count_ = 0;
}
