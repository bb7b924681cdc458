/**
 * @file test_movement_planner.cpp
 * @brief Unit tests for MovementPlanner
 * @author TCMU Team
 * @date 2025
 *
 * Tests verify:
 * - speed / duration derivation from the distance to travel
 * - step count = round(duration * frequency)
 * - explicit and transitive sync durations
 * - implicit sync to the longest duration of the batch
 * - boolean movements without timing stay immediate
 */

#include "unity.h"
#include "movement_planner.h"
#include "axis_registry.h"
#include "config_limits.h"

// ============================================================================
// Test Fixtures
// ============================================================================

static constexpr double FREQUENCY = 50.0;

static AxisRegistry* s_registry = nullptr;
static MovementPlanner* s_planner = nullptr;
static ResolvedMovement s_plan[LIMIT_MAX_BATCH_SIZE];

void setUp(void) {
    s_registry = new AxisRegistry();
    s_registry->configureAxis(AxisConfig::create("L0", AXIS_TYPE_LINEAR, "stroke"));
    s_registry->configureAxis(AxisConfig::create("R0", AXIS_TYPE_ROTATION, "twist"));
    s_registry->configureAxis(AxisConfig::create("R1", AXIS_TYPE_ROTATION, "roll"));
    s_registry->configureAxis(AxisConfig::create("A2", AXIS_TYPE_BOOLEAN, "lube"));
    s_planner = new MovementPlanner(*s_registry);
}

void tearDown(void) {
    delete s_planner;
    s_planner = nullptr;
    delete s_registry;
    s_registry = nullptr;
}

static void set_value(const char* key, double value)
{
    TEST_ASSERT_EQUAL(ESP_OK, s_registry->commitValue(s_registry->resolve(key), value));
}

static esp_err_t plan(const MovementRequest* batch, size_t count)
{
    return s_planner->plan(batch, count, "stroke", FREQUENCY, s_plan);
}

// ============================================================================
// Speed / Duration Derivation
// ============================================================================

void test_speed_derives_duration_and_step_count(void) {
    set_value("stroke", 0.0);
    MovementRequest batch[] = { MovementRequest::create("stroke").target(1.0).withSpeed(1.0) };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 1));

    TEST_ASSERT_EQUAL_STRING("L0", s_plan[0].axis);
    TEST_ASSERT_EQUAL_DOUBLE(0.0, s_plan[0].from);
    TEST_ASSERT_EQUAL(1, s_plan[0].direction);
    TEST_ASSERT_EQUAL_DOUBLE(1.0, s_plan[0].duration);
    TEST_ASSERT_EQUAL_UINT32(50, s_plan[0].step_count);
    TEST_ASSERT_EQUAL_DOUBLE(0.02, s_plan[0].period);
    TEST_ASSERT_EQUAL_DOUBLE(FREQUENCY, s_plan[0].frequency);
}

void test_duration_derives_speed(void) {
    MovementRequest batch[] = { MovementRequest::create().target(0.0).withDuration(2.0) };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 1));

    TEST_ASSERT_EQUAL_DOUBLE(0.5, s_plan[0].from);
    TEST_ASSERT_EQUAL(-1, s_plan[0].direction);
    TEST_ASSERT_EQUAL_DOUBLE(0.25, s_plan[0].speed);
    TEST_ASSERT_EQUAL_UINT32(100, s_plan[0].step_count);
}

void test_derived_values_are_rounded_to_ten_decimals(void) {
    set_value("stroke", 0.0);
    MovementRequest batch[] = { MovementRequest::create("stroke").target(1.0).withDuration(3.0) };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 1));

    TEST_ASSERT_EQUAL_DOUBLE(0.3333333333, s_plan[0].speed);
    TEST_ASSERT_EQUAL_UINT32(150, s_plan[0].step_count);
}

void test_zero_distance_has_zero_direction(void) {
    MovementRequest batch[] = { MovementRequest::create("stroke").target(0.5).withDuration(1.0) };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 1));

    TEST_ASSERT_EQUAL(0, s_plan[0].direction);
    TEST_ASSERT_EQUAL_DOUBLE(0.0, s_plan[0].speed);
    TEST_ASSERT_EQUAL_UINT32(50, s_plan[0].step_count);
}

// ============================================================================
// Sync Tests
// ============================================================================

void test_explicit_sync_adopts_duration(void) {
    set_value("stroke", 0.0);
    set_value("twist", 0.0);
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(1.0).withDuration(2.0),
        MovementRequest::create("twist").target(1.0).withSync("stroke"),
    };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 2));

    TEST_ASSERT_EQUAL_DOUBLE(2.0, s_plan[1].duration);
    TEST_ASSERT_EQUAL_DOUBLE(0.5, s_plan[1].speed);
    TEST_ASSERT_EQUAL_UINT32(100, s_plan[1].step_count);
}

void test_transitive_sync_follows_chain(void) {
    MovementRequest batch[] = {
        MovementRequest::create("roll").target(1.0).withSync("twist"),
        MovementRequest::create("twist").target(1.0).withSync("L0"),
        MovementRequest::create("stroke").target(1.0).withSpeed(0.5),
    };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 3));

    TEST_ASSERT_EQUAL_DOUBLE(1.0, s_plan[2].duration);
    TEST_ASSERT_EQUAL_DOUBLE(1.0, s_plan[1].duration);
    TEST_ASSERT_EQUAL_DOUBLE(1.0, s_plan[0].duration);
    TEST_ASSERT_EQUAL_UINT32(50, s_plan[0].step_count);
}

void test_sync_to_untimed_axis_uses_max_duration(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(1.0).withDuration(3.0),
        MovementRequest::create("twist").target(0.5).withSpeed(1.0),   // zero distance -> duration 0
        MovementRequest::create("roll").target(1.0).withSync("twist"),
    };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 3));

    TEST_ASSERT_EQUAL_DOUBLE(0.0, s_plan[1].duration);
    TEST_ASSERT_EQUAL_UINT32(0, s_plan[1].step_count);
    TEST_ASSERT_EQUAL_DOUBLE(3.0, s_plan[2].duration);
    TEST_ASSERT_EQUAL_UINT32(150, s_plan[2].step_count);
}

void test_untimed_numeric_axis_adopts_max_duration(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(1.0).withDuration(1.0),
        MovementRequest::create("twist").target(0.0).withDuration(2.5),
        MovementRequest::create("roll").target(0.0),
    };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 3));

    TEST_ASSERT_EQUAL_DOUBLE(2.5, s_plan[2].duration);
    TEST_ASSERT_EQUAL_UINT32(125, s_plan[2].step_count);
    TEST_ASSERT_EQUAL_UINT32(125, MovementPlanner::maxStepCount(s_plan, 3));
}

// ============================================================================
// Boolean Tests
// ============================================================================

void test_boolean_without_timing_is_immediate(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(1.0).withDuration(1.0),
        MovementRequest::create("lube").targetState(true),
    };

    TEST_ASSERT_EQUAL(ESP_OK, plan(batch, 2));

    TEST_ASSERT_TRUE(s_plan[1].is_boolean);
    TEST_ASSERT_FALSE(s_plan[1].has_duration);
    TEST_ASSERT_EQUAL_UINT32(0, s_plan[1].step_count);
    TEST_ASSERT_EQUAL_DOUBLE(0.0, s_plan[1].from);
    TEST_ASSERT_EQUAL_DOUBLE(1.0, s_plan[1].to);
}

void test_unresolved_axis_is_rejected(void) {
    MovementRequest batch[] = { MovementRequest::create("Q9").target(1.0).withDuration(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, plan(batch, 1));
}

// ============================================================================
// Test Runner
// ============================================================================

extern "C" int run_movement_planner_tests(void) {
    UNITY_BEGIN();

    RUN_TEST(test_speed_derives_duration_and_step_count);
    RUN_TEST(test_duration_derives_speed);
    RUN_TEST(test_derived_values_are_rounded_to_ten_decimals);
    RUN_TEST(test_zero_distance_has_zero_direction);

    RUN_TEST(test_explicit_sync_adopts_duration);
    RUN_TEST(test_transitive_sync_follows_chain);
    RUN_TEST(test_sync_to_untimed_axis_uses_max_duration);
    RUN_TEST(test_untimed_numeric_axis_adopts_max_duration);

    RUN_TEST(test_boolean_without_timing_is_immediate);
    RUN_TEST(test_unresolved_axis_is_rejected);

    return UNITY_END();
}
