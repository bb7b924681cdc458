/**
 * @file cooperative_scheduler.h
 * @brief Engine lock with cooperative suspension points
 * @author TCMU Team
 * @date 2025
 *
 * @note Every engine operation runs while holding a single FreeRTOS
 *       recursive mutex. The mutex is released only inside yieldFor(), so
 *       tasks that call into the engine concurrently interleave at tick
 *       boundaries, queue polls and sleeps, never in the middle of a tick.
 *
 * Thread Safety:
 * - lock() / unlock() / yieldFor() may be called from any task
 * - Not usable from ISR context
 */

#ifndef COOPERATIVE_SCHEDULER_H
#define COOPERATIVE_SCHEDULER_H

#include <atomic>
#include <cstdint>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

/**
 * @brief Engine lock and suspension primitive
 *
 * Usage:
 * @code
 * CooperativeScheduler scheduler;
 * scheduler.init();
 *
 * SchedulerLock guard(scheduler);
 * // ... one tick of work ...
 * scheduler.yieldFor(0.02);   // other tasks may run here
 * @endcode
 */
class CooperativeScheduler {
public:
    CooperativeScheduler();
    ~CooperativeScheduler();

    /**
     * @brief Create the engine mutex
     *
     * @return ESP_OK on success (or if already initialized)
     * @return ESP_ERR_NO_MEM if the mutex cannot be allocated
     */
    esp_err_t init();

    /** @brief True once init() succeeded */
    bool isInitialized() const { return mutex_ != nullptr; }

    /** @brief Acquire the engine lock (blocks, re-entrant) */
    void lock();

    /** @brief Release one level of the engine lock */
    void unlock();

    /**
     * @brief Suspend the calling task
     *
     * Releases every level of the lock the caller holds, delays for the
     * given time and re-acquires the lock to the same depth. Called without
     * the lock it is a plain delay.
     *
     * @param seconds Delay in seconds (<= 0 just yields)
     */
    void yieldFor(double seconds);

    /**
     * @brief Suspend the calling task until an absolute time
     *
     * Same lock handling as yieldFor(). Returns once the deadline has passed;
     * a deadline already passed just yields.
     *
     * @param deadline_us esp_timer_get_time() value to wait for
     */
    void yieldUntil(int64_t deadline_us);

    /**
     * @brief Convert seconds to FreeRTOS ticks
     *
     * Rounds up to whole ticks so the delay is never shorter than asked.
     *
     * @return Tick count, 0 for non-positive or non-finite input
     */
    static TickType_t toTicks(double seconds);

private:
    bool heldByCaller() const;

    SemaphoreHandle_t mutex_ = nullptr;
    // Read by tasks that do not hold the lock (heldByCaller)
    std::atomic<TaskHandle_t> owner_{nullptr};  ///< Task holding the lock, valid while depth_ > 0
    std::atomic<uint32_t> depth_{0};            ///< Recursion depth of the holder
};

/**
 * @brief Scoped engine lock
 */
class SchedulerLock {
public:
    explicit SchedulerLock(CooperativeScheduler& scheduler)
        : scheduler_(scheduler)
    {
        scheduler_.lock();
    }

    ~SchedulerLock() { scheduler_.unlock(); }

    SchedulerLock(const SchedulerLock&) = delete;
    SchedulerLock& operator=(const SchedulerLock&) = delete;

private:
    CooperativeScheduler& scheduler_;
};

#endif // COOPERATIVE_SCHEDULER_H
