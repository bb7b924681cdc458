/**
 * @file config_errors.h
 * @brief Error code identifiers and messages
 * @author TCMU Team
 * @date 2025
 *
 * @note Error messages are formatted as "<code> <detail>" into caller
 *       buffers and kept as the engine's last error.
 */

#ifndef CONFIG_ERRORS_H
#define CONFIG_ERRORS_H

/**
 * @defgroup config_errors Error Codes
 * @brief Error code identifiers (E0xx format)
 * @{
 */

/**
 * @defgroup err_config Configuration Errors
 * @{
 */

/** @brief Invalid axis configuration */
#define ERR_CONFIGURATION           "E010"

/** @brief Alias already bound to another axis */
#define ERR_ALIAS_COLLISION         "E020"

/** @brief Invalid axis limits */
#define ERR_INVALID_LIMITS          "E021"

/** @brief Axis registry full */
#define ERR_REGISTRY_FULL           "E022"

/** @} */ // end err_config

/**
 * @defgroup err_validation Validation Errors
 * @{
 */

/** @brief Invalid or unknown axis */
#define ERR_INVALID_AXIS            "E002"

/** @brief Invalid parameter value */
#define ERR_INVALID_PARAMETER       "E003"

/** @brief Malformed movement batch */
#define ERR_INVALID_MOVEMENT        "E030"

/** @brief Sync references form a cycle or leave the batch */
#define ERR_INVALID_SYNC            "E031"

/** @} */ // end err_validation

/**
 * @defgroup err_runtime Runtime Errors
 * @{
 */

/** @brief No output device or device write failed */
#define ERR_COMMUNICATION           "E009"

/** @brief Blank or oversized command */
#define ERR_INVALID_COMMAND         "E001"

/** @brief Behavior action invalid or behavior failed */
#define ERR_BEHAVIOR                "E040"

/** @} */ // end err_runtime

/**
 * @defgroup err_messages Error Messages
 * @brief Fixed messages paired with the codes above
 * @{
 */

#define MSG_NO_MOVEMENTS            "Must supply at least one movement."
#define MSG_NO_DEFAULT_AXIS         "No default axis configured. Must specify an axis for each movement."
#define MSG_MISSING_TARGET          "Must provide a 'to' property or 'value' function."
#define MSG_SPEED_AND_DURATION      "Cannot supply both speed and duration."
#define MSG_SPEED_WITHOUT_TARGET    "Must provide a target position when specifying speed."
#define MSG_SYNC_CYCLE              "Sync axes cannot form a cycle."
#define MSG_BOOLEAN_CONST_DURATION  "Cannot specify a duration for a boolean axis movement with constant value."
#define MSG_NO_TIMING               "At least one movement must have a speed or duration."
#define MSG_NO_OUTPUT_DEVICES       "No output devices have been added."
#define MSG_BLANK_COMMAND           "Cannot send a blank command."
#define MSG_NOT_IMPLEMENTED         "Behavior does not implement generateActions()"
#define MSG_NO_ACTIONS              "Behavior did not generate any actions."

/** @} */ // end err_messages

/** @} */ // end config_errors

#endif // CONFIG_ERRORS_H
