/**
 * @file error_format.h
 * @brief Error message formatting into caller-provided buffers
 * @author TCMU Team
 * @date 2025
 *
 * @note Produces "<code> <detail>" strings, e.g.
 *       "E003 Invalid value for parameter 'to': 1.500000".
 *       Thread-safe: operates on caller-provided buffers only.
 */

#ifndef ERROR_FORMAT_H
#define ERROR_FORMAT_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @defgroup error_format Error Formatter
 * @brief Build descriptive error strings
 * @{
 */

/**
 * @brief Format an error message
 *
 * Writes "<code> <formatted detail>" into buf, truncating if needed.
 * Does nothing when buf is NULL or len is 0, so callers may pass an
 * optional buffer straight through.
 *
 * @param[out] buf Buffer to write into (may be NULL)
 * @param[in] len Size of buffer in bytes
 * @param[in] code Error code string (ERR_* from config_errors.h)
 * @param[in] fmt Printf-style format string for the detail
 * @param[in] ... Format arguments
 *
 * @par Example
 * @code
 * char buf[64];
 * format_error_message(buf, sizeof(buf), ERR_INVALID_AXIS, "Invalid axis: %s", "Q9");
 * // Result: "E002 Invalid axis: Q9"
 * @endcode
 */
void format_error_message(char* buf, size_t len, const char* code, const char* fmt, ...)
    __attribute__((format(printf, 4, 5)));

/**
 * @brief Copy an already formatted message
 *
 * @param[out] buf Buffer to write into (may be NULL)
 * @param[in] len Size of buffer in bytes
 * @param[in] msg Message to copy (NULL clears the buffer)
 */
void copy_error_message(char* buf, size_t len, const char* msg);

/** @} */ // end error_format

#ifdef __cplusplus
}
#endif

#endif // ERROR_FORMAT_H
