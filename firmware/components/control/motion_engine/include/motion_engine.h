/**
 * @file motion_engine.h
 * @brief Public movement and axis API of the TCode Motion Unit
 * @author TCMU Team
 * @date 2025
 *
 * @note The engine owns the axis registry, the admission queue and the
 *       output devices. move() validates a batch, waits for its turn in
 *       the queue, plans it against the axis values at execution start and
 *       steps it at the configured frequency.
 *
 * Thread Safety:
 * - Every public method may be called from any task
 * - All state is guarded by the engine lock (CooperativeScheduler); the
 *   lock is released only while a caller is suspended
 */

#ifndef MOTION_ENGINE_H
#define MOTION_ENGINE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "axis_registry.h"
#include "axis_types.h"
#include "config_limits.h"
#include "cooperative_scheduler.h"
#include "i_behavior.h"
#include "i_motion_engine.h"
#include "i_output_device.h"
#include "movement_planner.h"
#include "movement_queue.h"
#include "movement_types.h"
#include "movement_validator.h"
#include "output_device_set.h"
#include "tick_executor.h"

/**
 * @brief Engine construction parameters
 *
 * The axis table is borrowed for the duration of init() only.
 */
struct EngineConfig {
    char name[LIMIT_ENGINE_NAME_MAX_LENGTH + 1];        ///< Configuration name (e.g. "OSR2")
    char default_axis[LIMIT_AXIS_KEY_MAX_LENGTH + 1];   ///< Axis used when a request names none, may be empty
    uint32_t frequency_hz;                              ///< Tick rate
    const AxisConfig* axes;                             ///< Axes to configure
    size_t axis_count;

    /**
     * @brief Default configuration
     *
     * OSR2 axis set from config_axes.h, "stroke" as default axis,
     * TIMING_DEFAULT_FREQUENCY_HZ.
     */
    static EngineConfig defaults();
};

/**
 * @brief Motion engine
 *
 * Usage:
 * @code
 * MotionEngine engine;
 * engine.init(EngineConfig::defaults());
 * engine.addOutputDevice(&console);
 *
 * MovementRequest batch[] = {
 *     MovementRequest::create("stroke").target(0.0).withSpeed(2.0),
 *     MovementRequest::create("twist").target(1.0).withSync("stroke"),
 * };
 * bool completed = false;
 * engine.move(batch, 2, &completed);
 * @endcode
 */
class MotionEngine : public IMotionEngine {
public:
    MotionEngine();
    ~MotionEngine() override = default;

    MotionEngine(const MotionEngine&) = delete;
    MotionEngine& operator=(const MotionEngine&) = delete;

    /**
     * @brief Initialize the engine and configure the axis table
     *
     * @param[in] config Engine configuration
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if the frequency is out of range or an axis
     *         configuration is rejected (see getLastError())
     * @return ESP_ERR_INVALID_STATE if already initialized
     * @return ESP_ERR_NO_MEM if the lock cannot be created
     */
    esp_err_t init(const EngineConfig& config);

    bool isInitialized() const { return initialized_; }

    // ------------------------------------------------------------------
    // Axis API
    // ------------------------------------------------------------------

    /** @brief Add or replace an axis (see AxisRegistry::configureAxis()) */
    esp_err_t configureAxis(const AxisConfig& config);

    esp_err_t getAxis(const char* key, Axis* axis) const override;

    /** @brief Set both output limits of an axis (see AxisRegistry::updateLimits()) */
    esp_err_t updateLimits(const char* key, double min, double max);

    /**
     * @brief Snapshot all axes sorted by name
     *
     * @return Number of axes copied
     */
    size_t getAxes(Axis* axes, size_t max_count) const;

    // ------------------------------------------------------------------
    // Output
    // ------------------------------------------------------------------

    /**
     * @brief Register an output device
     *
     * @return ESP_OK, ESP_ERR_INVALID_ARG for NULL, ESP_ERR_NO_MEM when full
     */
    esp_err_t addOutputDevice(IOutputDevice* device);

    /**
     * @brief Write a raw command line to every output device
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_STATE if no device is registered
     * @return ESP_ERR_INVALID_ARG if the command is blank
     * @return First device error otherwise
     */
    esp_err_t write(const char* command);

    // ------------------------------------------------------------------
    // Movement API
    // ------------------------------------------------------------------

    esp_err_t move(const MovementRequest* requests, size_t count, bool* completed) override;

    /**
     * @brief Move every linear and rotation axis to one position
     *
     * Axes are moved in one batch, ordered by name. Without linear or
     * rotation axes a warning is logged and nothing is moved.
     */
    esp_err_t home(double to = DEFAULT_HOME_POSITION, double speed = DEFAULT_HOME_SPEED,
                   bool* completed = nullptr);

    esp_err_t sleep(double seconds) override;

    /** @brief Suspend the calling task for one period */
    esp_err_t sleep() { return sleep(period_); }

    void stop() override;

    // ------------------------------------------------------------------
    // Behaviors
    // ------------------------------------------------------------------

    /**
     * @brief Run a behavior until it completes, is superseded or stopped
     *
     * Cancels every movement and any running behavior first. Blocks the
     * calling task; run it from a dedicated task.
     *
     * @return ESP_OK when the loop ended normally
     * @return Error returned by IBehavior::perform() otherwise (logged)
     */
    esp_err_t runBehavior(IBehavior& behavior);

    /** @brief True while at least one behavior loop is active */
    bool isPerforming() const { return active_behaviors_.load() > 0; }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    const char* name() const { return name_; }
    const char* defaultAxis() const { return default_axis_; }
    uint32_t frequency() const { return frequency_; }
    double period() const override { return period_; }

    /** @brief Number of movements pending or executing */
    size_t pendingMovements() const;

    void getLastError(char* buf, size_t len) const override;

private:
    bool initialized_;
    char name_[LIMIT_ENGINE_NAME_MAX_LENGTH + 1];
    char default_axis_[LIMIT_AXIS_KEY_MAX_LENGTH + 1];
    uint32_t frequency_;
    double period_;

    mutable CooperativeScheduler scheduler_;
    AxisRegistry registry_;
    MovementValidator validator_;
    MovementPlanner planner_;
    OutputDeviceSet devices_;
    MovementQueue queue_;
    TickExecutor executor_;

    ResolvedMovement plan_[LIMIT_MAX_BATCH_SIZE];   ///< Plan of the executing batch
    mutable char last_error_[LIMIT_ERROR_MSG_LENGTH];

    std::atomic<uint32_t> behavior_generation_;
    std::atomic<int> active_behaviors_;
};

#endif // MOTION_ENGINE_H
