/**
 * @file test_movement_validator.cpp
 * @brief Unit tests for MovementValidator
 * @author TCMU Team
 * @date 2025
 *
 * Tests verify:
 * - Empty batches and missing default axis are rejected
 * - 'to' is checked against the axis type
 * - speed / duration rules
 * - sync references stay in the batch and never cycle
 * - Untimed batches are rejected unless every axis is boolean
 */

#include "unity.h"
#include "movement_validator.h"
#include "axis_registry.h"
#include "config_errors.h"
#include "config_limits.h"
#include <cmath>
#include <cstring>

// ============================================================================
// Test Fixtures
// ============================================================================

static AxisRegistry* s_registry = nullptr;
static MovementValidator* s_validator = nullptr;
static char s_error[LIMIT_ERROR_MSG_LENGTH];

static ProviderValue constant_quarter(const ValueContext&)
{
    return ProviderValue::of(0.25);
}

void setUp(void) {
    s_registry = new AxisRegistry();
    s_registry->configureAxis(AxisConfig::create("L0", AXIS_TYPE_LINEAR, "stroke"));
    s_registry->configureAxis(AxisConfig::create("L1", AXIS_TYPE_LINEAR, "forward"));
    s_registry->configureAxis(AxisConfig::create("R0", AXIS_TYPE_ROTATION, "twist"));
    s_registry->configureAxis(AxisConfig::create("R1", AXIS_TYPE_ROTATION, "roll"));
    s_registry->configureAxis(AxisConfig::create("A2", AXIS_TYPE_BOOLEAN, "lube"));
    s_validator = new MovementValidator(*s_registry);
    memset(s_error, 0, sizeof(s_error));
}

void tearDown(void) {
    delete s_validator;
    s_validator = nullptr;
    delete s_registry;
    s_registry = nullptr;
}

static esp_err_t validate(const MovementRequest* batch, size_t count,
                          const char* default_axis = "stroke")
{
    return s_validator->validate(batch, count, default_axis, s_error, sizeof(s_error));
}

static void assert_error_contains(const char* text)
{
    TEST_ASSERT_NOT_NULL_MESSAGE(strstr(s_error, text), s_error);
}

// ============================================================================
// Basic Batch Tests
// ============================================================================

void test_valid_single_movement(void) {
    MovementRequest batch[] = { MovementRequest::create("stroke").target(0.0).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_OK, validate(batch, 1));
}

void test_empty_batch_fails(void) {
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(nullptr, 0));
    assert_error_contains(MSG_NO_MOVEMENTS);
}

void test_default_axis_used_when_axis_empty(void) {
    MovementRequest batch[] = { MovementRequest::create().target(1.0).withDuration(2.0) };
    TEST_ASSERT_EQUAL(ESP_OK, validate(batch, 1));
}

void test_missing_default_axis_fails(void) {
    MovementRequest batch[] = { MovementRequest::create().target(1.0).withDuration(2.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1, nullptr));
    assert_error_contains(MSG_NO_DEFAULT_AXIS);
}

void test_unknown_or_blank_axis_fails(void) {
    MovementRequest unknown[] = { MovementRequest::create("Q9").target(1.0).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(unknown, 1));
    assert_error_contains("Invalid value for parameter 'axis': Q9");

    MovementRequest blank[] = { MovementRequest::create("  ").target(1.0).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(blank, 1));
    assert_error_contains("Invalid value for parameter 'axis'");
}

// ============================================================================
// Target Tests
// ============================================================================

void test_missing_target_and_value_fails(void) {
    MovementRequest batch[] = { MovementRequest::create("stroke").withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1));
    assert_error_contains(MSG_MISSING_TARGET);
}

void test_out_of_range_target_fails(void) {
    MovementRequest high[] = { MovementRequest::create("stroke").target(1.5).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(high, 1));
    assert_error_contains("Invalid value for parameter 'to': 1.5");

    MovementRequest nan_to[] = { MovementRequest::create("stroke").target(NAN).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(nan_to, 1));
}

void test_target_type_must_match_axis_type(void) {
    MovementRequest bool_on_linear[] = { MovementRequest::create("stroke").targetState(true).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(bool_on_linear, 1));
    assert_error_contains("Invalid value for parameter 'to': true");

    MovementRequest number_on_bool[] = { MovementRequest::create("lube").target(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(number_on_bool, 1));
    assert_error_contains("Invalid value for parameter 'to': 1");
}

void test_value_provider_without_target_is_valid(void) {
    MovementRequest batch[] = { MovementRequest::create("stroke").withValue(constant_quarter).withDuration(1.0) };
    TEST_ASSERT_EQUAL(ESP_OK, validate(batch, 1));
}

// ============================================================================
// Timing Tests
// ============================================================================

void test_speed_and_duration_are_exclusive(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0).withDuration(1.0)
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1));
    assert_error_contains(MSG_SPEED_AND_DURATION);
}

void test_non_positive_speed_or_duration_fails(void) {
    MovementRequest zero_speed[] = { MovementRequest::create("stroke").target(0.0).withSpeed(0.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(zero_speed, 1));
    assert_error_contains("Invalid value for parameter 'speed': 0");

    MovementRequest neg_duration[] = { MovementRequest::create("stroke").target(0.0).withDuration(-1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(neg_duration, 1));
    assert_error_contains("Invalid value for parameter 'duration': -1");

    MovementRequest inf_speed[] = { MovementRequest::create("stroke").target(0.0).withSpeed(INFINITY) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(inf_speed, 1));
}

void test_speed_requires_target(void) {
    MovementRequest batch[] = { MovementRequest::create("stroke").withValue(constant_quarter).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1));
    assert_error_contains(MSG_SPEED_WITHOUT_TARGET);
}

void test_batch_without_timing_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0),
        MovementRequest::create("twist").target(0.2),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains(MSG_NO_TIMING);
}

void test_all_boolean_batch_needs_no_timing(void) {
    MovementRequest batch[] = { MovementRequest::create("lube").targetState(true) };
    TEST_ASSERT_EQUAL(ESP_OK, validate(batch, 1));
}

// ============================================================================
// Boolean Axis Tests
// ============================================================================

void test_boolean_axis_rejects_speed(void) {
    MovementRequest batch[] = { MovementRequest::create("lube").targetState(true).withSpeed(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1));
    assert_error_contains("Cannot specify speed for boolean axes: lube");
}

void test_boolean_axis_rejects_duration_with_constant_target(void) {
    MovementRequest batch[] = { MovementRequest::create("lube").targetState(true).withDuration(1.0) };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 1));
    assert_error_contains(MSG_BOOLEAN_CONST_DURATION);

    MovementRequest with_value[] = {
        MovementRequest::create("lube").targetState(true).withDuration(1.0).withValue(constant_quarter)
    };
    TEST_ASSERT_EQUAL(ESP_OK, validate(with_value, 1));
}

// ============================================================================
// Duplicate and Sync Tests
// ============================================================================

void test_duplicate_axis_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("stroke").target(1.0).withSpeed(1.0),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains("Duplicate axis movement: stroke");
}

void test_duplicate_via_alias_and_name_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("L0").target(1.0).withSpeed(1.0),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains("Duplicate axis movement: L0");
}

void test_sync_with_timing_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("twist").target(0.0).withSync("stroke").withDuration(1.0),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains("Cannot specify a speed or duration when sync property is present: twist");
}

void test_sync_outside_batch_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("twist").target(0.0).withSync("roll"),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains("Cannot sync with axis not specified in movement: twist -> roll");
}

void test_sync_by_name_or_alias_is_valid(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("twist").target(0.0).withSync("L0"),
        MovementRequest::create("roll").target(0.0).withSync("twist"),
    };
    TEST_ASSERT_EQUAL(ESP_OK, validate(batch, 3));
}

void test_two_axis_sync_cycle_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSync("twist"),
        MovementRequest::create("twist").target(0.0).withSync("stroke"),
        MovementRequest::create("roll").target(0.0).withSpeed(1.0),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 3));
    assert_error_contains(MSG_SYNC_CYCLE);
}

void test_self_sync_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSync("stroke"),
        MovementRequest::create("twist").target(0.0).withSpeed(1.0),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains(MSG_SYNC_CYCLE);
}

void test_cycle_not_containing_origin_fails(void) {
    // forward -> stroke -> twist -> roll -> stroke
    MovementRequest batch[] = {
        MovementRequest::create("forward").target(0.0).withSync("stroke"),
        MovementRequest::create("stroke").target(0.0).withSync("twist"),
        MovementRequest::create("twist").target(0.0).withSync("roll"),
        MovementRequest::create("roll").target(0.0).withSync("stroke"),
        MovementRequest::create("lube").targetState(true),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 5));
    assert_error_contains(MSG_SYNC_CYCLE);
}

void test_blank_sync_fails(void) {
    MovementRequest batch[] = {
        MovementRequest::create("stroke").target(0.0).withSpeed(1.0),
        MovementRequest::create("twist").target(0.0).withSync(" "),
    };
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, validate(batch, 2));
    assert_error_contains("Invalid value for parameter 'sync'");
}

// ============================================================================
// Test Runner
// ============================================================================

extern "C" int run_movement_validator_tests(void) {
    UNITY_BEGIN();

    RUN_TEST(test_valid_single_movement);
    RUN_TEST(test_empty_batch_fails);
    RUN_TEST(test_default_axis_used_when_axis_empty);
    RUN_TEST(test_missing_default_axis_fails);
    RUN_TEST(test_unknown_or_blank_axis_fails);

    RUN_TEST(test_missing_target_and_value_fails);
    RUN_TEST(test_out_of_range_target_fails);
    RUN_TEST(test_target_type_must_match_axis_type);
    RUN_TEST(test_value_provider_without_target_is_valid);

    RUN_TEST(test_speed_and_duration_are_exclusive);
    RUN_TEST(test_non_positive_speed_or_duration_fails);
    RUN_TEST(test_speed_requires_target);
    RUN_TEST(test_batch_without_timing_fails);
    RUN_TEST(test_all_boolean_batch_needs_no_timing);

    RUN_TEST(test_boolean_axis_rejects_speed);
    RUN_TEST(test_boolean_axis_rejects_duration_with_constant_target);

    RUN_TEST(test_duplicate_axis_fails);
    RUN_TEST(test_duplicate_via_alias_and_name_fails);
    RUN_TEST(test_sync_with_timing_fails);
    RUN_TEST(test_sync_outside_batch_fails);
    RUN_TEST(test_sync_by_name_or_alias_is_valid);
    RUN_TEST(test_two_axis_sync_cycle_fails);
    RUN_TEST(test_self_sync_fails);
    RUN_TEST(test_cycle_not_containing_origin_fails);
    RUN_TEST(test_blank_sync_fails);

    return UNITY_END();
}
