/**
 * @file action_scheduler.cpp
 * @brief Behavior runtime implementation
 * @author TCMU Team
 * @date 2025
 */

#include "action_scheduler.h"
#include "config_errors.h"
#include "error_format.h"

#include "esp_log.h"
#include <cmath>
#include <cstdio>
#include <new>

static const char* TAG = "ACTION_SCHED";

ActionScheduler::ActionScheduler()
    : actions_()
    , head_(0)
    , count_(0)
    , generator_()
    , generate_count_(0)
    , complete_(false)
    , pending_error_{}
    , pending_ret_(ESP_OK)
{
}

/* ==========================================================================
 * Action list
 * ========================================================================== */

esp_err_t ActionScheduler::add(Action&& action, bool front)
{
    if (count_ >= LIMIT_MAX_ACTIONS) {
        char message[LIMIT_ERROR_MSG_LENGTH];
        format_error_message(message, sizeof(message), ERR_BEHAVIOR, "Action list full (%d actions)",
                             LIMIT_MAX_ACTIONS);
        return recordPendingError(ESP_ERR_NO_MEM, message);
    }

    size_t slot;
    if (front) {
        head_ = (head_ + LIMIT_MAX_ACTIONS - 1) % LIMIT_MAX_ACTIONS;
        slot = head_;
    } else {
        slot = (head_ + count_) % LIMIT_MAX_ACTIONS;
    }

    actions_[slot] = std::move(action);
    count_++;
    return ESP_OK;
}

void ActionScheduler::popFront()
{
    if (count_ == 0) {
        return;
    }
    actions_[head_] = Action();
    head_ = (head_ + 1) % LIMIT_MAX_ACTIONS;
    count_--;
}

void ActionScheduler::clearActions()
{
    while (count_ > 0) {
        popFront();
    }
    head_ = 0;
}

ActionType ActionScheduler::nextAction() const
{
    return count_ > 0 ? actions_[head_].type : ACTION_NONE;
}

esp_err_t ActionScheduler::reject(const char* type, const char* value)
{
    char message[LIMIT_ERROR_MSG_LENGTH];
    format_error_message(message, sizeof(message), ERR_BEHAVIOR, "Invalid action: (%s, %s)", type, value);
    return recordPendingError(ESP_ERR_INVALID_ARG, message);
}

esp_err_t ActionScheduler::recordPendingError(esp_err_t code, const char* message)
{
    ESP_LOGW(TAG, "%s", message);

    // Keep the first one, it is reported by the next perform()
    if (pending_error_[0] == '\0') {
        copy_error_message(pending_error_, sizeof(pending_error_), message);
        pending_ret_ = code;
    }
    return code;
}

esp_err_t ActionScheduler::takePendingError(char* err_msg, size_t err_len)
{
    if (pending_error_[0] == '\0') {
        return ESP_OK;
    }
    copy_error_message(err_msg, err_len, pending_error_);
    pending_error_[0] = '\0';

    const esp_err_t ret = pending_ret_;
    pending_ret_ = ESP_OK;
    return ret;
}

/* ==========================================================================
 * queue / insert
 * ========================================================================== */

static esp_err_t make_move(const MovementRequest* requests, size_t count, Action* action)
{
    action->batch.reset(new (std::nothrow) MovementRequest[count]);
    if (!action->batch) {
        return ESP_ERR_NO_MEM;
    }
    for (size_t i = 0; i < count; i++) {
        action->batch[i] = requests[i];
    }
    action->type = ACTION_MOVE;
    action->batch_count = count;
    return ESP_OK;
}

esp_err_t ActionScheduler::queueMove(const MovementRequest* requests, size_t count)
{
    return insertOrQueueMove(requests, count, false);
}

esp_err_t ActionScheduler::insertMove(const MovementRequest* requests, size_t count)
{
    return insertOrQueueMove(requests, count, true);
}

esp_err_t ActionScheduler::insertOrQueueMove(const MovementRequest* requests, size_t count, bool front)
{
    if (requests == nullptr || count == 0 || count > LIMIT_MAX_BATCH_SIZE) {
        char value[32];
        snprintf(value, sizeof(value), "%u movements", static_cast<unsigned>(requests == nullptr ? 0 : count));
        return reject("move", value);
    }

    Action action;
    esp_err_t ret = make_move(requests, count, &action);
    if (ret != ESP_OK) {
        return ret;
    }
    return add(std::move(action), front);
}

esp_err_t ActionScheduler::insertOrQueueSleep(double seconds, bool front)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        char value[24];
        snprintf(value, sizeof(value), "%g", seconds);
        return reject("sleep", value);
    }

    Action action;
    action.type = ACTION_SLEEP;
    action.seconds = seconds;
    return add(std::move(action), front);
}

esp_err_t ActionScheduler::queueSleep(double seconds)
{
    return insertOrQueueSleep(seconds, false);
}

esp_err_t ActionScheduler::insertSleep(double seconds)
{
    return insertOrQueueSleep(seconds, true);
}

esp_err_t ActionScheduler::insertOrQueueFunction(ActionFunction function, bool front)
{
    if (!function) {
        return reject("function", "null");
    }

    Action action;
    action.type = ACTION_FUNCTION;
    action.function = std::move(function);
    return add(std::move(action), front);
}

esp_err_t ActionScheduler::queueFunction(ActionFunction function)
{
    return insertOrQueueFunction(std::move(function), false);
}

esp_err_t ActionScheduler::insertFunction(ActionFunction function)
{
    return insertOrQueueFunction(std::move(function), true);
}

esp_err_t ActionScheduler::insertOrQueueBehavior(ActionScheduler* behavior, uint32_t repeat, bool front)
{
    if (behavior == nullptr) {
        return reject("behavior", "null");
    }
    if (behavior == this) {
        return reject("behavior", "self");
    }

    Action action;
    action.type = ACTION_BEHAVIOR;
    action.behavior = behavior;
    action.repeat = repeat;
    return add(std::move(action), front);
}

esp_err_t ActionScheduler::queueBehavior(ActionScheduler* behavior, uint32_t repeat)
{
    return insertOrQueueBehavior(behavior, repeat, false);
}

esp_err_t ActionScheduler::insertBehavior(ActionScheduler* behavior, uint32_t repeat)
{
    return insertOrQueueBehavior(behavior, repeat, true);
}

esp_err_t ActionScheduler::queueComplete()
{
    Action action;
    action.type = ACTION_COMPLETE;
    return add(std::move(action), false);
}

esp_err_t ActionScheduler::insertComplete()
{
    Action action;
    action.type = ACTION_COMPLETE;
    return add(std::move(action), true);
}

/* ==========================================================================
 * perform
 * ========================================================================== */

esp_err_t ActionScheduler::generateActions()
{
    if (!generator_) {
        return ESP_ERR_NOT_SUPPORTED;
    }
    generator_(*this);
    return ESP_OK;
}

esp_err_t ActionScheduler::perform(IMotionEngine& engine, char* err_msg, size_t err_len)
{
    if (complete_) {
        return ESP_OK;
    }

    if (count_ == 0) {
        esp_err_t ret = generateActions();
        generate_count_++;

        if (ret == ESP_ERR_NOT_SUPPORTED) {
            format_error_message(err_msg, err_len, ERR_BEHAVIOR, MSG_NOT_IMPLEMENTED);
            return ret;
        }
        if (ret != ESP_OK) {
            return ret;
        }
    }

    esp_err_t ret = takePendingError(err_msg, err_len);
    if (ret != ESP_OK) {
        return ret;
    }

    if (count_ == 0) {
        format_error_message(err_msg, err_len, ERR_BEHAVIOR, MSG_NO_ACTIONS);
        return ESP_ERR_INVALID_STATE;
    }

    if (actions_[head_].type == ACTION_BEHAVIOR) {
        ret = performNested(actions_[head_], engine, err_msg, err_len);
    } else {
        // Taken off the list first so that anything it inserts runs next
        Action action = std::move(actions_[head_]);
        popFront();
        ret = runAction(action, engine, err_msg, err_len);
    }

    if (ret != ESP_OK) {
        return ret;
    }
    return takePendingError(err_msg, err_len);
}

esp_err_t ActionScheduler::runAction(Action& action, IMotionEngine& engine, char* err_msg, size_t err_len)
{
    esp_err_t ret = ESP_OK;

    switch (action.type) {
        case ACTION_MOVE: {
            bool completed = false;
            ret = engine.move(action.batch.get(), action.batch_count, &completed);
            if (ret != ESP_OK) {
                engine.getLastError(err_msg, err_len);
            } else if (!completed) {
                ESP_LOGD(TAG, "Move cancelled");
            }
            break;
        }

        case ACTION_SLEEP:
            ret = engine.sleep(action.seconds);
            if (ret != ESP_OK) {
                engine.getLastError(err_msg, err_len);
            }
            break;

        case ACTION_FUNCTION:
            ret = action.function(*this, engine);
            if (ret != ESP_OK) {
                format_error_message(err_msg, err_len, ERR_BEHAVIOR, "Function action failed: %s",
                                     esp_err_to_name(ret));
            }
            break;

        case ACTION_COMPLETE:
            complete_ = true;
            ESP_LOGD(TAG, "Behavior complete after %u generate cycles",
                     static_cast<unsigned>(generate_count_));
            break;

        case ACTION_BEHAVIOR:
        case ACTION_NONE:
        default:
            ESP_LOGE(TAG, "Unexpected action type %d", static_cast<int>(action.type));
            ret = ESP_ERR_INVALID_STATE;
            break;
    }

    return ret;
}

esp_err_t ActionScheduler::performNested(Action& action, IMotionEngine& engine, char* err_msg, size_t err_len)
{
    ActionScheduler* nested = action.behavior;
    if (!action.started) {
        action.started = true;
        action.generate_base = nested->generateCount();
    }
    const uint32_t generate_base = action.generate_base;
    const uint32_t repeat = action.repeat;

    esp_err_t ret = nested->perform(engine, err_msg, err_len);
    if (ret != ESP_OK) {
        return ret;
    }

    const uint32_t cycles = nested->generateCount() - generate_base;
    const bool exhausted = repeat > 0 && cycles >= repeat && nested->pendingActions() == 0;

    if (nested->isComplete() || exhausted) {
        // The nested perform() may have changed this list through a captured pointer
        if (count_ > 0 && actions_[head_].type == ACTION_BEHAVIOR && actions_[head_].behavior == nested) {
            popFront();
        }
    }
    return ESP_OK;
}
