/**
 * @file console_output_device.h
 * @brief Output device writing protocol lines to a stdio stream
 * @author TCMU Team
 * @date 2025
 *
 * @details On target the console stream is routed to the UART / USB serial
 *          JTAG port by ESP-IDF VFS, so a TCode device attached to the
 *          console receives the lines directly. On the Linux host target the
 *          stream is the process stdout.
 */

#ifndef CONSOLE_OUTPUT_DEVICE_H
#define CONSOLE_OUTPUT_DEVICE_H

#include <cstdint>
#include <cstdio>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "i_output_device.h"

/**
 * @brief Console output device
 *
 * Each write() is flushed immediately. Writes are serialized by a FreeRTOS
 * mutex so lines from different engines sharing the stream do not mix.
 */
class ConsoleOutputDevice : public IOutputDevice {
public:
    /**
     * @brief Construct a console device
     *
     * @param stream Destination stream (not owned), stdout by default
     */
    explicit ConsoleOutputDevice(FILE* stream = stdout);
    ~ConsoleOutputDevice() override;

    /**
     * @brief Create the TX mutex
     *
     * @return ESP_OK on success
     * @return ESP_ERR_NO_MEM if the mutex cannot be allocated
     * @return ESP_ERR_INVALID_ARG if the stream is NULL
     */
    esp_err_t init();

    /**
     * @brief Write one line and flush
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_STATE if init() was not called
     * @return ESP_ERR_INVALID_ARG if line is NULL
     * @return ESP_FAIL on a stream error
     */
    esp_err_t write(const char* line) override;

    /** @brief Number of lines written since init */
    uint32_t linesWritten() const { return lines_written_; }

private:
    FILE* stream_;
    SemaphoreHandle_t tx_mutex_ = nullptr;
    uint32_t lines_written_ = 0;
};

#endif // CONSOLE_OUTPUT_DEVICE_H
