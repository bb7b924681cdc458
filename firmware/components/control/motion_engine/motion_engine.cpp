/**
 * @file motion_engine.cpp
 * @brief Motion engine implementation
 * @author TCMU Team
 * @date 2025
 */

#include "motion_engine.h"
#include "config_axes.h"
#include "config_defaults.h"
#include "config_errors.h"
#include "config_timing.h"
#include "error_format.h"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include <cmath>
#include <cstring>

static const char* TAG = "MOTION_ENG";

/* ==========================================================================
 * Default Configuration
 * ========================================================================== */

namespace {

struct DefaultAxisTable {
    AxisConfig axes[DEFAULT_AXIS_COUNT];

    DefaultAxisTable()
        : axes{
            AxisConfig::create(AXIS_NAME_L0, AXIS_TYPE_LINEAR, AXIS_ALIAS_L0),
            AxisConfig::create(AXIS_NAME_L1, AXIS_TYPE_LINEAR, AXIS_ALIAS_L1),
            AxisConfig::create(AXIS_NAME_L2, AXIS_TYPE_LINEAR, AXIS_ALIAS_L2),
            AxisConfig::create(AXIS_NAME_R0, AXIS_TYPE_ROTATION, AXIS_ALIAS_R0),
            AxisConfig::create(AXIS_NAME_R1, AXIS_TYPE_ROTATION, AXIS_ALIAS_R1),
            AxisConfig::create(AXIS_NAME_R2, AXIS_TYPE_ROTATION, AXIS_ALIAS_R2),
            AxisConfig::create(AXIS_NAME_V0, AXIS_TYPE_AUXILIARY, AXIS_ALIAS_V0),
            AxisConfig::create(AXIS_NAME_V1, AXIS_TYPE_AUXILIARY, AXIS_ALIAS_V1),
            AxisConfig::create(AXIS_NAME_A0, AXIS_TYPE_AUXILIARY, AXIS_ALIAS_A0),
            AxisConfig::create(AXIS_NAME_A1, AXIS_TYPE_AUXILIARY, AXIS_ALIAS_A1),
            AxisConfig::create(AXIS_NAME_A2, AXIS_TYPE_BOOLEAN, AXIS_ALIAS_A2),
        }
    {
    }
};

} // namespace

EngineConfig EngineConfig::defaults()
{
    static const DefaultAxisTable table;

    EngineConfig config{};
    strncpy(config.name, DEFAULT_CONFIG_NAME, LIMIT_ENGINE_NAME_MAX_LENGTH);
    strncpy(config.default_axis, DEFAULT_AXIS_ALIAS, LIMIT_AXIS_KEY_MAX_LENGTH);
    config.frequency_hz = TIMING_DEFAULT_FREQUENCY_HZ;
    config.axes = table.axes;
    config.axis_count = DEFAULT_AXIS_COUNT;
    return config;
}

/* ==========================================================================
 * MotionEngine Implementation
 * ========================================================================== */

MotionEngine::MotionEngine()
    : initialized_(false)
    , name_{}
    , default_axis_{}
    , frequency_(TIMING_DEFAULT_FREQUENCY_HZ)
    , period_(1.0 / TIMING_DEFAULT_FREQUENCY_HZ)
    , scheduler_()
    , registry_()
    , validator_(registry_)
    , planner_(registry_)
    , devices_()
    , queue_()
    , executor_(registry_, devices_, queue_, scheduler_)
    , plan_()
    , last_error_{}
    , behavior_generation_(0)
    , active_behaviors_(0)
{
}

esp_err_t MotionEngine::init(const EngineConfig& config)
{
    if (initialized_) {
        ESP_LOGW(TAG, "Already initialized");
        return ESP_ERR_INVALID_STATE;
    }

    if (config.frequency_hz < LIMIT_MIN_FREQUENCY_HZ || config.frequency_hz > LIMIT_MAX_FREQUENCY_HZ) {
        format_error_message(last_error_, sizeof(last_error_), ERR_CONFIGURATION,
                             "Invalid frequency: %u (must be %d..%d Hz)",
                             static_cast<unsigned>(config.frequency_hz),
                             LIMIT_MIN_FREQUENCY_HZ, LIMIT_MAX_FREQUENCY_HZ);
        ESP_LOGE(TAG, "%s", last_error_);
        return ESP_ERR_INVALID_ARG;
    }

    // A period shorter than one RTOS tick cannot be paced
    if (config.frequency_hz > configTICK_RATE_HZ) {
        format_error_message(last_error_, sizeof(last_error_), ERR_CONFIGURATION,
                             "Invalid frequency: %u (exceeds the %u Hz RTOS tick rate)",
                             static_cast<unsigned>(config.frequency_hz),
                             static_cast<unsigned>(configTICK_RATE_HZ));
        ESP_LOGE(TAG, "%s", last_error_);
        return ESP_ERR_INVALID_ARG;
    }

    if (config.axes == nullptr && config.axis_count > 0) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = scheduler_.init();
    if (ret != ESP_OK) {
        return ret;
    }

    for (size_t i = 0; i < config.axis_count; i++) {
        ret = registry_.configureAxis(config.axes[i], last_error_, sizeof(last_error_));
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Axis %u rejected: %s", static_cast<unsigned>(i), last_error_);
            registry_.clear();
            return ret;
        }
    }

    strncpy(name_, config.name, LIMIT_ENGINE_NAME_MAX_LENGTH);
    strncpy(default_axis_, config.default_axis, LIMIT_AXIS_KEY_MAX_LENGTH);
    frequency_ = config.frequency_hz;
    period_ = 1.0 / static_cast<double>(frequency_);
    initialized_ = true;

    ESP_LOGI(TAG, "Engine '%s' initialized: %u axes, %u Hz, default axis '%s'",
             name_, static_cast<unsigned>(registry_.count()),
             static_cast<unsigned>(frequency_), default_axis_);
    return ESP_OK;
}

esp_err_t MotionEngine::configureAxis(const AxisConfig& config)
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    esp_err_t ret = registry_.configureAxis(config, last_error_, sizeof(last_error_));
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "%s", last_error_);
    }
    return ret;
}

esp_err_t MotionEngine::getAxis(const char* key, Axis* axis) const
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    esp_err_t ret = registry_.getAxis(key, axis);
    if (ret == ESP_ERR_NOT_FOUND) {
        format_error_message(last_error_, sizeof(last_error_), ERR_INVALID_AXIS,
                             "Invalid axis: %s", key != nullptr ? key : "(null)");
    }
    return ret;
}

esp_err_t MotionEngine::updateLimits(const char* key, double min, double max)
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    esp_err_t ret = registry_.updateLimits(key, min, max, last_error_, sizeof(last_error_));
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "%s", last_error_);
    }
    return ret;
}

size_t MotionEngine::getAxes(Axis* axes, size_t max_count) const
{
    if (!initialized_) {
        return 0;
    }

    SchedulerLock guard(scheduler_);
    return registry_.getAxes(axes, max_count);
}

esp_err_t MotionEngine::addOutputDevice(IOutputDevice* device)
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    return devices_.add(device, last_error_, sizeof(last_error_));
}

esp_err_t MotionEngine::write(const char* command)
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    esp_err_t ret = devices_.write(command, last_error_, sizeof(last_error_));
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Write failed: %s", last_error_);
    }
    return ret;
}

esp_err_t MotionEngine::move(const MovementRequest* requests, size_t count, bool* completed)
{
    if (completed != nullptr) {
        *completed = false;
    }
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);

    esp_err_t ret = validator_.validate(requests, count, default_axis_, last_error_, sizeof(last_error_));
    if (ret != ESP_OK) {
        ESP_LOGD(TAG, "Movement rejected: %s", last_error_);
        return ret;
    }

    uint32_t id = 0;
    ret = queue_.submit(&id);
    if (ret != ESP_OK) {
        format_error_message(last_error_, sizeof(last_error_), ERR_INVALID_MOVEMENT,
                             "Too many pending movements (max %d)", LIMIT_MAX_PENDING_MOVEMENTS);
        ESP_LOGW(TAG, "%s", last_error_);
        return ret;
    }

    // Admission: wait for the head of the queue
    while (queue_.exists(id) && !queue_.isReady(id)) {
        scheduler_.yieldFor(period_);
    }

    if (!queue_.exists(id)) {
        ESP_LOGD(TAG, "Movement %u cancelled before start", static_cast<unsigned>(id));
        return ESP_OK;
    }

    ret = queue_.begin(id);
    if (ret != ESP_OK) {
        return ret;
    }

    bool done = false;
    ret = planner_.plan(requests, count, default_axis_, static_cast<double>(frequency_), plan_);
    if (ret == ESP_OK) {
        ret = executor_.execute(id, plan_, count, &done, last_error_, sizeof(last_error_));
    } else {
        format_error_message(last_error_, sizeof(last_error_), ERR_INVALID_MOVEMENT,
                             "Movement could not be planned");
    }

    queue_.finish(id);
    for (size_t i = 0; i < count; i++) {
        plan_[i].value = nullptr;
    }

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Movement %u failed: %s", static_cast<unsigned>(id), last_error_);
        return ret;
    }

    if (completed != nullptr) {
        *completed = done;
    }
    return ESP_OK;
}

esp_err_t MotionEngine::home(double to, double speed, bool* completed)
{
    if (completed != nullptr) {
        *completed = false;
    }
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    Axis axes[LIMIT_MAX_AXES];
    const size_t axis_count = getAxes(axes, LIMIT_MAX_AXES);

    MovementRequest batch[LIMIT_MAX_BATCH_SIZE];
    size_t count = 0;
    for (size_t i = 0; i < axis_count; i++) {
        if (axes[i].type == AXIS_TYPE_LINEAR || axes[i].type == AXIS_TYPE_ROTATION) {
            batch[count++] = MovementRequest::create(axes[i].name).target(to).withSpeed(speed);
        }
    }

    if (count == 0) {
        ESP_LOGW(TAG, "No linear or rotation axes configured.");
        if (completed != nullptr) {
            *completed = true;
        }
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Homing %u axes to %.3f at %.3f/s", static_cast<unsigned>(count), to, speed);
    return move(batch, count, completed);
}

esp_err_t MotionEngine::sleep(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        format_error_message(last_error_, sizeof(last_error_), ERR_INVALID_PARAMETER,
                             "Invalid value for parameter 'seconds': %g", seconds);
        return ESP_ERR_INVALID_ARG;
    }
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    SchedulerLock guard(scheduler_);
    scheduler_.yieldFor(seconds);
    return ESP_OK;
}

void MotionEngine::stop()
{
    if (!initialized_) {
        return;
    }

    SchedulerLock guard(scheduler_);
    const size_t cancelled = queue_.size();
    queue_.clear();
    behavior_generation_++;
    ESP_LOGI(TAG, "Stopped (%u movements cancelled)", static_cast<unsigned>(cancelled));
}

esp_err_t MotionEngine::runBehavior(IBehavior& behavior)
{
    if (!initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    uint32_t generation;
    {
        SchedulerLock guard(scheduler_);
        queue_.clear();
        generation = ++behavior_generation_;
    }

    active_behaviors_++;
    ESP_LOGI(TAG, "Behavior %u started", static_cast<unsigned>(generation));

    esp_err_t ret = ESP_OK;
    char err_msg[LIMIT_ERROR_MSG_LENGTH];

    while (behavior_generation_.load() == generation && !behavior.isComplete()) {
        err_msg[0] = '\0';
        ret = behavior.perform(*this, err_msg, sizeof(err_msg));
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Error performing behavior: %s",
                     err_msg[0] != '\0' ? err_msg : esp_err_to_name(ret));
            copy_error_message(last_error_, sizeof(last_error_), err_msg);
            break;
        }
        taskYIELD();
    }

    active_behaviors_--;
    ESP_LOGI(TAG, "Behavior %u ended (%s)", static_cast<unsigned>(generation),
             ret != ESP_OK ? "error" : behavior.isComplete() ? "complete" : "stopped");
    return ret;
}

size_t MotionEngine::pendingMovements() const
{
    if (!initialized_) {
        return 0;
    }

    SchedulerLock guard(scheduler_);
    return queue_.size();
}

void MotionEngine::getLastError(char* buf, size_t len) const
{
    copy_error_message(buf, len, last_error_);
}
