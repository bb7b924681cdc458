/**
 * @file tcode_encoder.h
 * @brief TCode token and line encoding
 * @author TCMU Team
 * @date 2025
 *
 * @note Token format: <axis name><3 digits>, e.g. "L0499".
 *       Numeric values are pre-scaled by PROTOCOL_OUTPUT_SCALE and rounded
 *       to PROTOCOL_ROUND_DECIMALS, mapped into the axis [min, max] range
 *       and emitted as round(scaled * 1000) clamped to 0..999. Boolean
 *       values are emitted as 999 / 000. Tokens are space separated and the
 *       line ends with '\n'.
 */

#ifndef TCODE_ENCODER_H
#define TCODE_ENCODER_H

#include <cstddef>
#include "esp_err.h"
#include "axis_types.h"
#include "config_limits.h"
#include "movement_types.h"

namespace TCodeEncoder {

/**
 * @brief Digits for a numeric value on an axis range
 *
 * @param value Normalized value in [0, 1]
 * @param min Axis lower limit
 * @param max Axis upper limit
 *
 * @return Value in 0..PROTOCOL_VALUE_MAX
 */
int encodeDigits(double value, double min, double max);

/**
 * @brief Format one token
 *
 * @param[in] axis Axis the value belongs to
 * @param[in] value NUMBER or BOOLEAN provider value
 * @param[out] buf Destination
 * @param[in] len Size of buf
 *
 * @return ESP_OK on success
 * @return ESP_ERR_INVALID_ARG if value is PROVIDER_VALUE_NONE or buf is NULL
 * @return ESP_ERR_INVALID_SIZE if buf is too small
 */
esp_err_t formatToken(const Axis& axis, const ProviderValue& value, char* buf, size_t len);

} // namespace TCodeEncoder

/**
 * @brief Builds one protocol line from tokens
 */
class TCodeLine {
public:
    TCodeLine();

    /**
     * @brief Append a token, separated from the previous one by a space
     *
     * @return ESP_OK on success
     * @return ESP_ERR_INVALID_SIZE if the line would exceed LIMIT_CMD_MAX_LENGTH
     */
    esp_err_t append(const Axis& axis, const ProviderValue& value);

    /**
     * @brief Terminate the line with '\n'
     *
     * @return Line text, or nullptr if no token was appended
     */
    const char* finish();

    size_t tokenCount() const { return tokens_; }

private:
    char buf_[LIMIT_CMD_MAX_LENGTH];
    size_t len_;
    size_t tokens_;
};

#endif // TCODE_ENCODER_H
