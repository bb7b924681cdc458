/**
 * @file console_output_device.cpp
 * @brief Console output device implementation
 * @author TCMU Team
 * @date 2025
 */

#include "console_output_device.h"

#include "esp_log.h"

static const char* TAG = "CONSOLE_OUT";

ConsoleOutputDevice::ConsoleOutputDevice(FILE* stream)
    : stream_(stream)
{
}

ConsoleOutputDevice::~ConsoleOutputDevice()
{
    if (tx_mutex_) {
        vSemaphoreDelete(tx_mutex_);
        tx_mutex_ = nullptr;
    }
}

esp_err_t ConsoleOutputDevice::init()
{
    if (stream_ == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    if (tx_mutex_ == nullptr) {
        tx_mutex_ = xSemaphoreCreateMutex();
        if (tx_mutex_ == nullptr) {
            ESP_LOGE(TAG, "Failed to create TX mutex");
            return ESP_ERR_NO_MEM;
        }
    }

    lines_written_ = 0;
    return ESP_OK;
}

esp_err_t ConsoleOutputDevice::write(const char* line)
{
    if (tx_mutex_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (line == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = ESP_OK;
    xSemaphoreTake(tx_mutex_, portMAX_DELAY);
    if (fputs(line, stream_) < 0 || fflush(stream_) != 0) {
        ret = ESP_FAIL;
    } else {
        lines_written_++;
    }
    xSemaphoreGive(tx_mutex_);

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Console write failed");
    }
    return ret;
}
