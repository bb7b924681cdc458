/**
 * @file output_device_set.cpp
 * @brief Output device fan-out implementation
 * @author TCMU Team
 * @date 2025
 */

#include "output_device_set.h"
#include "config_errors.h"
#include "error_format.h"

#include "esp_log.h"
#include <cctype>

static const char* TAG = "OUT_DEV";

OutputDeviceSet::OutputDeviceSet()
    : devices_{}
    , count_(0)
{
}

esp_err_t OutputDeviceSet::add(IOutputDevice* device, char* err_msg, size_t err_len)
{
    if (device == nullptr) {
        format_error_message(err_msg, err_len, ERR_COMMUNICATION, "Invalid device: null");
        return ESP_ERR_INVALID_ARG;
    }

    if (count_ >= LIMIT_MAX_OUTPUT_DEVICES) {
        format_error_message(err_msg, err_len, ERR_COMMUNICATION,
                             "Cannot add more than %d output devices", LIMIT_MAX_OUTPUT_DEVICES);
        return ESP_ERR_NO_MEM;
    }

    devices_[count_++] = device;
    ESP_LOGI(TAG, "Output device %u registered", static_cast<unsigned>(count_));
    return ESP_OK;
}

esp_err_t OutputDeviceSet::write(const char* command, char* err_msg, size_t err_len)
{
    if (count_ == 0) {
        format_error_message(err_msg, err_len, ERR_COMMUNICATION, "%s", MSG_NO_OUTPUT_DEVICES);
        return ESP_ERR_INVALID_STATE;
    }

    if (command == nullptr) {
        format_error_message(err_msg, err_len, ERR_INVALID_COMMAND, "Invalid command: null");
        return ESP_ERR_INVALID_ARG;
    }

    bool blank = true;
    for (const char* p = command; *p != '\0'; p++) {
        if (!isspace(static_cast<unsigned char>(*p))) {
            blank = false;
            break;
        }
    }
    if (blank) {
        format_error_message(err_msg, err_len, ERR_INVALID_COMMAND, "%s", MSG_BLANK_COMMAND);
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t result = ESP_OK;
    for (size_t i = 0; i < count_; i++) {
        esp_err_t ret = devices_[i]->write(command);
        if (ret != ESP_OK && result == ESP_OK) {
            ESP_LOGE(TAG, "Device %u write failed: %s", static_cast<unsigned>(i),
                     esp_err_to_name(ret));
            format_error_message(err_msg, err_len, ERR_COMMUNICATION,
                                 "Output device write failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    return result;
}
