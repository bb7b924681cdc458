/**
 * @file action_scheduler.h
 * @brief Action list driven behavior runtime
 * @author TCMU Team
 * @date 2025
 *
 * @note A behavior is an ordered list of actions. Each perform() runs
 *       exactly one action; when the list is empty at the start of
 *       perform(), generateActions() refills it. queue*() appends to the
 *       back, insert*() puts the action in front of everything listed.
 *
 * Thread Safety:
 * - Not thread-safe. A scheduler is driven by one behavior loop; function
 *   actions may modify the list from inside perform()
 */

#ifndef ACTION_SCHEDULER_H
#define ACTION_SCHEDULER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include "esp_err.h"
#include "config_limits.h"
#include "i_behavior.h"
#include "i_motion_engine.h"
#include "movement_types.h"

class ActionScheduler;

/**
 * @brief Function action
 *
 * Receives the scheduler running it and the engine. May queue or insert
 * further actions. A non-OK return ends perform() with that error.
 */
using ActionFunction = std::function<esp_err_t(ActionScheduler& scheduler, IMotionEngine& engine)>;

/** @brief Planning callback used when generateActions() is not overridden */
using ActionGenerator = std::function<void(ActionScheduler& scheduler)>;

typedef enum {
    ACTION_NONE,
    ACTION_MOVE,        ///< engine.move(batch)
    ACTION_SLEEP,       ///< engine.sleep(seconds)
    ACTION_FUNCTION,    ///< callback(scheduler, engine)
    ACTION_BEHAVIOR,    ///< One perform() of a nested scheduler per perform()
    ACTION_COMPLETE     ///< Marks the scheduler complete
} ActionType;

/**
 * @brief One entry of the action list
 */
struct Action {
    ActionType type = ACTION_NONE;

    std::unique_ptr<MovementRequest[]> batch;   ///< ACTION_MOVE
    size_t batch_count = 0;

    double seconds = 0.0;                       ///< ACTION_SLEEP

    ActionFunction function;                    ///< ACTION_FUNCTION

    ActionScheduler* behavior = nullptr;        ///< ACTION_BEHAVIOR (borrowed)
    uint32_t repeat = 0;                        ///< Generate cycles to run, 0 = until complete
    bool started = false;
    uint32_t generate_base = 0;                 ///< Nested generate count when started
};

/**
 * @brief Behavior runtime
 *
 * Supply the plan either by subclassing and overriding generateActions()
 * or with setGenerator():
 * @code
 * ActionScheduler stroke;
 * stroke.setGenerator([](ActionScheduler& self) {
 *     MovementRequest down = MovementRequest::create("stroke").target(0.0).withSpeed(1.0);
 *     MovementRequest up = MovementRequest::create("stroke").target(1.0).withSpeed(1.0);
 *     self.queueMove(&down, 1);
 *     self.queueMove(&up, 1);
 * });
 * engine.runBehavior(stroke);
 * @endcode
 */
class ActionScheduler : public IBehavior {
public:
    ActionScheduler();
    ~ActionScheduler() override = default;

    ActionScheduler(const ActionScheduler&) = delete;
    ActionScheduler& operator=(const ActionScheduler&) = delete;

    /**
     * @brief Run the next action
     *
     * Refills the list first if it is empty.
     *
     * @return ESP_OK on success (and once complete)
     * @return ESP_ERR_NOT_SUPPORTED if there is no planning callback
     * @return ESP_ERR_INVALID_STATE if planning produced no actions
     * @return ESP_ERR_INVALID_ARG if an invalid action was added
     * @return ESP_ERR_NO_MEM if an action was dropped because the list was full
     * @return Error of the engine call or function action otherwise
     */
    esp_err_t perform(IMotionEngine& engine, char* err_msg = nullptr, size_t err_len = 0) override;

    bool isComplete() const override { return complete_; }

    /** @brief Use a callback instead of overriding generateActions() */
    void setGenerator(ActionGenerator generator) { generator_ = std::move(generator); }

    // Append to the back
    esp_err_t queueMove(const MovementRequest* requests, size_t count);
    esp_err_t queueSleep(double seconds);
    esp_err_t queueFunction(ActionFunction function);
    esp_err_t queueBehavior(ActionScheduler* behavior, uint32_t repeat = 0);
    esp_err_t queueComplete();

    // Put in front of everything listed
    esp_err_t insertMove(const MovementRequest* requests, size_t count);
    esp_err_t insertSleep(double seconds);
    esp_err_t insertFunction(ActionFunction function);
    esp_err_t insertBehavior(ActionScheduler* behavior, uint32_t repeat = 0);
    esp_err_t insertComplete();

    /** @brief Number of times the list has been (re)generated */
    uint32_t generateCount() const { return generate_count_; }

    /** @brief Number of actions waiting */
    size_t pendingActions() const { return count_; }

    /** @brief Type of the next action, ACTION_NONE when the list is empty */
    ActionType nextAction() const;

    /** @brief Drop every pending action */
    void clearActions();

protected:
    /**
     * @brief Fill the action list
     *
     * The default implementation calls the generator set with
     * setGenerator().
     *
     * @return ESP_OK, or ESP_ERR_NOT_SUPPORTED without a generator
     */
    virtual esp_err_t generateActions();

private:
    esp_err_t add(Action&& action, bool front);
    esp_err_t insertOrQueueMove(const MovementRequest* requests, size_t count, bool front);
    esp_err_t insertOrQueueSleep(double seconds, bool front);
    esp_err_t insertOrQueueFunction(ActionFunction function, bool front);
    esp_err_t insertOrQueueBehavior(ActionScheduler* behavior, uint32_t repeat, bool front);
    esp_err_t reject(const char* type, const char* value);
    esp_err_t recordPendingError(esp_err_t code, const char* message);
    esp_err_t takePendingError(char* err_msg, size_t err_len);
    esp_err_t runAction(Action& action, IMotionEngine& engine, char* err_msg, size_t err_len);
    esp_err_t performNested(Action& action, IMotionEngine& engine, char* err_msg, size_t err_len);
    void popFront();

    Action actions_[LIMIT_MAX_ACTIONS];     ///< Ring buffer
    size_t head_;
    size_t count_;

    ActionGenerator generator_;
    uint32_t generate_count_;
    bool complete_;

    char pending_error_[LIMIT_ERROR_MSG_LENGTH];    ///< First rejected action since last perform()
    esp_err_t pending_ret_;                         ///< Code reported with pending_error_
};

#endif // ACTION_SCHEDULER_H
