/**
 * @file behavior_task.cpp
 * @brief Behavior runner task
 * @author TCMU Team
 * @date 2025
 */

#include "task_defs.h"
#include "motion_engine.h"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

static const char* TAG = "BEHAVIOR_TASK";

extern "C" void behavior_task(void* arg)
{
    BehaviorTaskArgs* args = static_cast<BehaviorTaskArgs*>(arg);
    configASSERT(args != nullptr && args->engine != nullptr && args->behavior != nullptr);

    esp_err_t ret = args->engine->runBehavior(*args->behavior);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Behavior ended with %s", esp_err_to_name(ret));
    } else {
        ESP_LOGI(TAG, "Behavior finished");
    }

    vTaskDelete(nullptr);
}
