/**
 * @file movement_types.h
 * @brief Movement request, resolved movement and value provider types
 * @author TCMU Team
 * @date 2025
 *
 * @note A movement batch is an array of MovementRequest, at most one per
 *       axis. MovementValidator checks a batch, MovementPlanner turns it
 *       into ResolvedMovement entries and ValueProviderFactory attaches the
 *       per-tick value functions the TickExecutor evaluates.
 */

#ifndef MOVEMENT_TYPES_H
#define MOVEMENT_TYPES_H

#include <cstdint>
#include <cstring>
#include <functional>
#include "config_limits.h"

/**
 * @defgroup movement_types Movement Type Definitions
 * @brief Request, plan and provider structures
 * @{
 */

/**
 * @brief Kind of target a request carries
 */
typedef enum {
    TARGET_NONE,        ///< No 'to' given (value provider only)
    TARGET_NUMBER,      ///< Numeric target in [0, 1]
    TARGET_BOOLEAN      ///< Boolean target (boolean axes)
} TargetKind;

/**
 * @brief Kind of value a provider produced for one tick
 */
typedef enum {
    PROVIDER_VALUE_NONE,     ///< No change this tick
    PROVIDER_VALUE_NUMBER,   ///< Numeric position
    PROVIDER_VALUE_BOOLEAN   ///< Boolean state
} ProviderValueKind;

/**
 * @brief Result of one value provider evaluation
 *
 * A NUMBER result may carry a non-finite value; the executor warns and
 * skips the axis for that tick.
 */
struct ProviderValue {
    ProviderValueKind kind;
    double number;
    bool flag;

    static ProviderValue none() { return ProviderValue{PROVIDER_VALUE_NONE, 0.0, false}; }
    static ProviderValue of(double value) { return ProviderValue{PROVIDER_VALUE_NUMBER, value, false}; }
    static ProviderValue ofState(bool state) { return ProviderValue{PROVIDER_VALUE_BOOLEAN, 0.0, state}; }

    bool isNone() const { return kind == PROVIDER_VALUE_NONE; }
};

/**
 * @brief Parameters passed to a value provider on every tick
 *
 * Carries the resolved movement parameters plus the per-tick values.
 * Optional fields are flagged by has_to / has_speed / has_duration.
 */
struct ValueContext {
    const char* axis;           ///< Canonical axis name
    TargetKind target;          ///< Kind of 'to'
    double to;                  ///< Numeric target (1.0 / 0.0 for boolean targets)
    double from;                ///< Axis value when the batch was planned
    int direction;              ///< -1, 0 or +1 (0 without a target)
    bool has_speed;
    double speed;               ///< Units per second
    bool has_duration;
    double duration;            ///< Seconds
    uint32_t step_count;        ///< Ticks of this movement (0 = immediate)
    double period;              ///< Seconds per tick
    double frequency;           ///< Ticks per second

    uint32_t index;             ///< Tick index, starting at 0
    double time;                ///< index * period
    double current_value;       ///< Last committed axis value
    double x;                   ///< (index + 1) / step_count, 1.0 when immediate
};

/**
 * @brief Per-tick value function
 *
 * Returns the axis value for the tick described by the context, or
 * ProviderValue::none() for no change.
 */
using ValueProvider = std::function<ProviderValue(const ValueContext& ctx)>;

/**
 * @brief One axis movement within a batch
 *
 * Build with create() and the chaining setters:
 * @code
 * MovementRequest req = MovementRequest::create("stroke").target(0.0).withSpeed(1.0);
 * MovementRequest twist = MovementRequest::create("twist").target(0.5).withSync("stroke");
 * @endcode
 */
struct MovementRequest {
    char axis[LIMIT_AXIS_KEY_MAX_LENGTH + 1];   ///< Name or alias, empty = default axis
    TargetKind target_kind;
    double to;                                  ///< Valid when target_kind == TARGET_NUMBER
    bool to_state;                              ///< Valid when target_kind == TARGET_BOOLEAN
    ValueProvider value;                        ///< Optional custom provider
    bool has_speed;
    double speed;
    bool has_duration;
    double duration;
    char sync[LIMIT_AXIS_KEY_MAX_LENGTH + 1];   ///< Axis to synchronize with, empty = none

    static MovementRequest create(const char* axis_key = nullptr) {
        MovementRequest req{};
        if (axis_key != nullptr) {
            strncpy(req.axis, axis_key, LIMIT_AXIS_KEY_MAX_LENGTH);
        }
        req.target_kind = TARGET_NONE;
        return req;
    }

    MovementRequest& target(double position) {
        target_kind = TARGET_NUMBER;
        to = position;
        return *this;
    }

    MovementRequest& targetState(bool state) {
        target_kind = TARGET_BOOLEAN;
        to_state = state;
        return *this;
    }

    MovementRequest& withValue(ValueProvider provider) {
        value = std::move(provider);
        return *this;
    }

    MovementRequest& withSpeed(double units_per_s) {
        has_speed = true;
        speed = units_per_s;
        return *this;
    }

    MovementRequest& withDuration(double seconds) {
        has_duration = true;
        duration = seconds;
        return *this;
    }

    MovementRequest& withSync(const char* axis_key) {
        memset(sync, 0, sizeof(sync));
        if (axis_key != nullptr) {
            strncpy(sync, axis_key, LIMIT_AXIS_KEY_MAX_LENGTH);
        }
        return *this;
    }

    bool hasTarget() const { return target_kind != TARGET_NONE; }
    bool hasValue() const { return static_cast<bool>(value); }
    bool hasSync() const { return sync[0] != '\0'; }
};

/**
 * @brief Fully timed movement of one axis
 *
 * Produced by MovementPlanner. step_count == 0 marks an immediate
 * movement that runs once before the first tick.
 */
struct ResolvedMovement {
    int axis_index;                             ///< Registry index
    char axis[LIMIT_AXIS_NAME_MAX_LENGTH + 1];  ///< Canonical axis name
    bool is_boolean;                            ///< Target axis is a boolean axis
    TargetKind target_kind;
    double to;                                  ///< Numeric target (1.0 / 0.0 for boolean)
    bool to_state;
    double from;
    int direction;
    bool has_speed;
    double speed;
    bool has_duration;
    double duration;
    uint32_t step_count;
    double period;
    double frequency;
    ValueProvider value;                        ///< Custom provider from the request, may be empty
};

/** @} */ // end movement_types

#endif // MOVEMENT_TYPES_H
