/**
 * @file test_movement_queue.cpp
 * @brief Unit tests for MovementQueue
 * @author TCMU Team
 * @date 2025
 */

#include "unity.h"
#include "movement_queue.h"

static MovementQueue* s_queue = nullptr;

void setUp(void) {
    s_queue = new MovementQueue();
}

void tearDown(void) {
    delete s_queue;
    s_queue = nullptr;
}

void test_submit_assigns_increasing_ids(void) {
    uint32_t a = 0;
    uint32_t b = 0;
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&a));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&b));

    TEST_ASSERT_NOT_EQUAL(0, a);
    TEST_ASSERT_TRUE(b > a);
    TEST_ASSERT_EQUAL(2, s_queue->size());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, s_queue->submit(nullptr));
}

void test_only_head_is_ready(void) {
    uint32_t a = 0;
    uint32_t b = 0;
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&a));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&b));

    TEST_ASSERT_TRUE(s_queue->isReady(a));
    TEST_ASSERT_FALSE(s_queue->isReady(b));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, s_queue->begin(b));
}

void test_executing_movement_blocks_next(void) {
    uint32_t a = 0;
    uint32_t b = 0;
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&a));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&b));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->begin(a));

    TEST_ASSERT_TRUE(s_queue->inProgress());
    TEST_ASSERT_FALSE(s_queue->isReady(a));
    TEST_ASSERT_FALSE(s_queue->isReady(b));

    s_queue->finish(a);

    TEST_ASSERT_FALSE(s_queue->inProgress());
    TEST_ASSERT_FALSE(s_queue->exists(a));
    TEST_ASSERT_TRUE(s_queue->isReady(b));
}

void test_clear_cancels_all(void) {
    uint32_t a = 0;
    uint32_t b = 0;
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&a));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&b));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->begin(a));

    s_queue->clear();

    TEST_ASSERT_FALSE(s_queue->exists(a));
    TEST_ASSERT_FALSE(s_queue->exists(b));
    TEST_ASSERT_EQUAL(0, s_queue->size());

    // Executing movement still owns the flag until it finishes
    TEST_ASSERT_TRUE(s_queue->inProgress());
    s_queue->finish(a);
    TEST_ASSERT_FALSE(s_queue->inProgress());
}

void test_queue_capacity(void) {
    uint32_t id = 0;
    for (int i = 0; i < LIMIT_MAX_PENDING_MOVEMENTS; i++) {
        TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&id));
    }
    TEST_ASSERT_EQUAL(ESP_ERR_NO_MEM, s_queue->submit(&id));
}

void test_finish_removes_from_middle(void) {
    uint32_t a = 0;
    uint32_t b = 0;
    uint32_t c = 0;
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&a));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&b));
    TEST_ASSERT_EQUAL(ESP_OK, s_queue->submit(&c));

    s_queue->finish(b);

    TEST_ASSERT_TRUE(s_queue->exists(a));
    TEST_ASSERT_FALSE(s_queue->exists(b));
    TEST_ASSERT_TRUE(s_queue->exists(c));
    s_queue->finish(a);
    TEST_ASSERT_TRUE(s_queue->isReady(c));
}

extern "C" int run_movement_queue_tests(void) {
    UNITY_BEGIN();

    RUN_TEST(test_submit_assigns_increasing_ids);
    RUN_TEST(test_only_head_is_ready);
    RUN_TEST(test_executing_movement_blocks_next);
    RUN_TEST(test_clear_cancels_all);
    RUN_TEST(test_queue_capacity);
    RUN_TEST(test_finish_removes_from_middle);

    return UNITY_END();
}
