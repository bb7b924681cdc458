/**
 * @file output_device_set.h
 * @brief Fan-out of protocol lines to all registered output devices
 * @author TCMU Team
 * @date 2025
 */

#ifndef OUTPUT_DEVICE_SET_H
#define OUTPUT_DEVICE_SET_H

#include <cstddef>
#include "esp_err.h"
#include "config_limits.h"
#include "i_output_device.h"

/**
 * @brief Fixed-capacity set of output devices
 *
 * Devices are not owned; they must outlive the set.
 */
class OutputDeviceSet {
public:
    OutputDeviceSet();

    /**
     * @brief Register a device
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_ARG if device is nullptr
     * @return ESP_ERR_NO_MEM if LIMIT_MAX_OUTPUT_DEVICES are registered
     */
    esp_err_t add(IOutputDevice* device, char* err_msg = nullptr, size_t err_len = 0);

    /**
     * @brief Write a command to every device
     *
     * @param[in] command Line to write
     * @param[out] err_msg Optional buffer for a descriptive error
     * @param[in] err_len Size of err_msg
     *
     * @return ESP_OK if every device accepted the line
     * @return ESP_ERR_INVALID_STATE if no device is registered
     * @return ESP_ERR_INVALID_ARG if command is NULL or blank
     * @return First device error otherwise (remaining devices still written)
     */
    esp_err_t write(const char* command, char* err_msg = nullptr, size_t err_len = 0);

    size_t count() const { return count_; }

private:
    IOutputDevice* devices_[LIMIT_MAX_OUTPUT_DEVICES];
    size_t count_;
};

#endif // OUTPUT_DEVICE_SET_H
