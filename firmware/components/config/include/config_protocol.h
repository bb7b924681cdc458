/**
 * @file config_protocol.h
 * @brief TCode wire format constants
 * @author TCMU Team
 * @date 2025
 *
 * @note One protocol line is sent per tick:
 *       "<axis><digits> <axis><digits> ...\n"
 *       Digits are a zero-padded integer in [0, 999] scaled into the axis limits.
 */

#ifndef CONFIG_PROTOCOL_H
#define CONFIG_PROTOCOL_H

/**
 * @defgroup config_protocol Protocol Format
 * @brief Token layout and value encoding for TCode lines
 * @{
 */

/** @brief Number of digits in an encoded axis value */
#define PROTOCOL_VALUE_DIGITS       3

/** @brief Largest encoded axis value */
#define PROTOCOL_VALUE_MAX          999

/** @brief Multiplier from a rounded position to its integer encoding */
#define PROTOCOL_VALUE_SCALE        1000.0

/**
 * @brief Pre-scale applied to numeric values before encoding
 *
 * Keeps a full-range value (1.0) within the three digit range.
 */
#define PROTOCOL_OUTPUT_SCALE       0.999

/** @brief Decimal places kept after the output pre-scale */
#define PROTOCOL_ROUND_DECIMALS     3

/** @brief Encoded digits for a boolean axis set to true */
#define PROTOCOL_BOOL_TRUE          "999"

/** @brief Encoded digits for a boolean axis set to false */
#define PROTOCOL_BOOL_FALSE         "000"

/** @brief Separator between tokens on one line */
#define PROTOCOL_TOKEN_SEPARATOR    ' '

/** @brief Line terminator */
#define PROTOCOL_LINE_TERMINATOR    '\n'

/** @} */ // end config_protocol

#endif // CONFIG_PROTOCOL_H
