/**
 * @file i_output_device.h
 * @brief Abstract interface for TCode line sinks
 * @author TCMU Team
 * @date 2025
 *
 * @note Anything that can accept a protocol line (serial port, socket,
 *       console, test recorder) implements this interface. The engine
 *       writes every line to every registered device.
 */

#ifndef I_OUTPUT_DEVICE_H
#define I_OUTPUT_DEVICE_H

#include "esp_err.h"

/**
 * @brief Abstract interface for output devices
 *
 * Implementations:
 * - ConsoleOutputDevice: Writes lines to a stdio stream
 * - MockOutputDevice: Records lines for unit tests
 */
class IOutputDevice {
public:
    virtual ~IOutputDevice() = default;

    /**
     * @brief Write one protocol line
     *
     * Called with the engine lock held; must not block for longer than a
     * fraction of one tick period.
     *
     * @param line Null-terminated line, normally ending in '\n'
     * @return ESP_OK on success, error code on failure
     */
    virtual esp_err_t write(const char* line) = 0;
};

#endif // I_OUTPUT_DEVICE_H
