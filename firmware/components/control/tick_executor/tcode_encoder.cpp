/**
 * @file tcode_encoder.cpp
 * @brief TCode encoding implementation
 * @author TCMU Team
 * @date 2025
 */

#include "tcode_encoder.h"
#include "config_protocol.h"
#include "motion_math.h"

#include <cmath>
#include <cstdio>
#include <cstring>

namespace TCodeEncoder {

int encodeDigits(double value, double min, double max)
{
    const double prescaled = MotionMath::roundTo(value * PROTOCOL_OUTPUT_SCALE, PROTOCOL_ROUND_DECIMALS);
    const double scaled = (max - min) * prescaled + min;
    const double digits = std::round(MotionMath::roundTo(scaled, PROTOCOL_ROUND_DECIMALS) * PROTOCOL_VALUE_SCALE);
    return static_cast<int>(MotionMath::clamp(digits, 0.0, PROTOCOL_VALUE_MAX));
}

esp_err_t formatToken(const Axis& axis, const ProviderValue& value, char* buf, size_t len)
{
    if (buf == nullptr || value.kind == PROVIDER_VALUE_NONE) {
        return ESP_ERR_INVALID_ARG;
    }

    int written;
    if (value.kind == PROVIDER_VALUE_BOOLEAN) {
        written = snprintf(buf, len, "%s%s", axis.name,
                           value.flag ? PROTOCOL_BOOL_TRUE : PROTOCOL_BOOL_FALSE);
    } else {
        written = snprintf(buf, len, "%s%0*d", axis.name, PROTOCOL_VALUE_DIGITS,
                           encodeDigits(value.number, axis.min, axis.max));
    }

    if (written < 0 || static_cast<size_t>(written) >= len) {
        return ESP_ERR_INVALID_SIZE;
    }
    return ESP_OK;
}

} // namespace TCodeEncoder

TCodeLine::TCodeLine()
    : buf_{}
    , len_(0)
    , tokens_(0)
{
}

esp_err_t TCodeLine::append(const Axis& axis, const ProviderValue& value)
{
    size_t pos = len_;
    if (tokens_ > 0) {
        // Keep room for the separator and the final newline
        if (pos + 2 >= sizeof(buf_)) {
            return ESP_ERR_INVALID_SIZE;
        }
        buf_[pos++] = PROTOCOL_TOKEN_SEPARATOR;
    }

    // One byte stays reserved for the line terminator
    esp_err_t ret = TCodeEncoder::formatToken(axis, value, &buf_[pos], sizeof(buf_) - pos - 1);
    if (ret != ESP_OK) {
        buf_[len_] = '\0';
        return ret;
    }

    len_ = pos + strlen(&buf_[pos]);
    tokens_++;
    return ESP_OK;
}

const char* TCodeLine::finish()
{
    if (tokens_ == 0) {
        return nullptr;
    }

    if (len_ == 0 || buf_[len_ - 1] != PROTOCOL_LINE_TERMINATOR) {
        buf_[len_++] = PROTOCOL_LINE_TERMINATOR;
        buf_[len_] = '\0';
    }
    return buf_;
}
