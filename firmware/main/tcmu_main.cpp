/**
 * @file tcmu_main.cpp
 * @brief TCode Motion Unit firmware entry point
 * @author TCMU Team
 * @date 2025
 *
 * @note Builds the engine with the default OSR2 axis set, writes to the
 *       console, homes the device and optionally starts the demo stroke.
 */

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "config.h"
#include "task_defs.h"
#include "action_scheduler.h"
#include "console_output_device.h"
#include "motion_engine.h"
#include "value_provider.h"

static const char* TAG = "main";

static MotionEngine s_engine;
static ConsoleOutputDevice s_console;

#if FEATURE_DEMO_BEHAVIOR
static ActionScheduler s_demo;
static BehaviorTaskArgs s_demo_args;

/**
 * @brief Demo stroke: cosine down and up with the twist following the stroke
 */
static void demo_generate(ActionScheduler& self)
{
    MovementRequest down[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.5)
            .withValue(ValueProviderFactory::ramp(RAMP_COS)),
        MovementRequest::create("twist").target(0.25).withSync("stroke"),
    };
    MovementRequest up[] = {
        MovementRequest::create("stroke").target(1.0).withSpeed(1.5)
            .withValue(ValueProviderFactory::ramp(RAMP_COS)),
        MovementRequest::create("twist").target(0.75).withSync("stroke"),
    };

    self.queueMove(down, 2);
    self.queueMove(up, 2);
}
#endif

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "Firmware: %s v%s", FIRMWARE_NAME, FIRMWARE_VERSION_STRING);

    esp_err_t ret = s_console.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Console init failed: %s", esp_err_to_name(ret));
        return;
    }

    ret = s_engine.init(EngineConfig::defaults());
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Engine init failed: %s", esp_err_to_name(ret));
        return;
    }

    ret = s_engine.addOutputDevice(&s_console);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Output device rejected: %s", esp_err_to_name(ret));
        return;
    }

    bool completed = false;
    ret = s_engine.home(DEFAULT_HOME_POSITION, DEFAULT_HOME_SPEED, &completed);
    if (ret != ESP_OK) {
        char err_msg[LIMIT_ERROR_MSG_LENGTH];
        s_engine.getLastError(err_msg, sizeof(err_msg));
        ESP_LOGE(TAG, "Homing failed: %s", err_msg);
        return;
    }
    ESP_LOGI(TAG, "Homed (%s)", completed ? "complete" : "cancelled");

#if FEATURE_DEMO_BEHAVIOR
    s_demo.setGenerator(demo_generate);
    s_demo_args.engine = &s_engine;
    s_demo_args.behavior = &s_demo;

    if (xTaskCreatePinnedToCore(behavior_task, "behavior", LIMIT_STACK_BEHAVIOR, &s_demo_args,
                                TIMING_BEHAVIOR_TASK_PRIORITY, nullptr,
                                TIMING_BEHAVIOR_TASK_CORE) != pdPASS) {
        ESP_LOGE(TAG, "Failed to create behavior task");
        return;
    }
#endif

    ESP_LOGI(TAG, "TCode Motion Unit - '%s' running at %u Hz", s_engine.name(),
             static_cast<unsigned>(s_engine.frequency()));
}
