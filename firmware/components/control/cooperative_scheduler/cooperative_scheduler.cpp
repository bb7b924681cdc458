/**
 * @file cooperative_scheduler.cpp
 * @brief Engine lock implementation
 * @author TCMU Team
 * @date 2025
 */

#include "cooperative_scheduler.h"
#include "config_timing.h"

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/task.h"
#include <cmath>

static const char* TAG = "COOP_SCHED";

CooperativeScheduler::CooperativeScheduler()
{
}

CooperativeScheduler::~CooperativeScheduler()
{
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

esp_err_t CooperativeScheduler::init()
{
    if (mutex_ != nullptr) {
        return ESP_OK;
    }

    mutex_ = xSemaphoreCreateRecursiveMutex();
    if (mutex_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create engine mutex");
        return ESP_ERR_NO_MEM;
    }

    return ESP_OK;
}

bool CooperativeScheduler::heldByCaller() const
{
    return depth_ > 0 && owner_ == xTaskGetCurrentTaskHandle();
}

void CooperativeScheduler::lock()
{
    configASSERT(mutex_ != nullptr);
    xSemaphoreTakeRecursive(mutex_, portMAX_DELAY);
    owner_ = xTaskGetCurrentTaskHandle();
    depth_++;
}

void CooperativeScheduler::unlock()
{
    configASSERT(heldByCaller());
    if (--depth_ == 0) {
        owner_ = nullptr;
    }
    xSemaphoreGiveRecursive(mutex_);
}

void CooperativeScheduler::yieldFor(double seconds)
{
    const TickType_t ticks = toTicks(seconds);

    if (!heldByCaller()) {
        if (ticks > 0) {
            vTaskDelay(ticks);
        } else {
            taskYIELD();
        }
        return;
    }

    const uint32_t depth = depth_.load();
    for (uint32_t i = 0; i < depth; i++) {
        unlock();
    }

    if (ticks > 0) {
        vTaskDelay(ticks);
    } else {
        taskYIELD();
    }

    for (uint32_t i = 0; i < depth; i++) {
        lock();
    }
}

void CooperativeScheduler::yieldUntil(int64_t deadline_us)
{
    int64_t remaining_us = deadline_us - esp_timer_get_time();
    if (remaining_us <= 0) {
        yieldFor(0.0);
        return;
    }

    // vTaskDelay() may end early by up to one partial tick
    while (remaining_us > 0) {
        yieldFor(static_cast<double>(remaining_us) / TIMING_US_PER_S);
        remaining_us = deadline_us - esp_timer_get_time();
    }
}

TickType_t CooperativeScheduler::toTicks(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return 0;
    }

    const uint64_t us = static_cast<uint64_t>(std::llround(seconds * TIMING_US_PER_S));
    const uint64_t ticks = (us * configTICK_RATE_HZ + TIMING_US_PER_S - 1) / TIMING_US_PER_S;
    return static_cast<TickType_t>(ticks);
}
