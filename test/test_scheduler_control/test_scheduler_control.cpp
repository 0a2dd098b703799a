/*
 * File: test/test_scheduler_control/test_scheduler_control.cpp
 * Description: Scheduler tick behaviour against a fake engine.
 * Covers single auto-start per window, auto-stop on window exit, manual
 * suppression and re-arming.
 */
#include <unity.h>
#include "Scheduler.h"
#include "MockSessionHAL.h"

// --- Helper ---
// Mon-Fri, 09:00 - 17:00
static ScheduleConfig officeHours(bool enabled = true) {
    ScheduleConfig c;
    c.enabled = enabled;
    for (uint8_t d = 0; d < DAYS_PER_WEEK; d++) c.activeDays[d] = d < 5;
    c.startTimeOfDay = 9 * 3600;
    c.endTimeOfDay = 17 * 3600;
    return c;
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST GROUP: AUTO START / STOP
// ============================================================================

void test_disabled_scheduler_does_nothing(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours(false));

    hal.setWallClock(0, 10, 0);
    scheduler.tick();

    TEST_ASSERT_EQUAL(0, engine.startRequests);
    TEST_ASSERT_FALSE(engine.running);
}

void test_window_entry_starts_default_mode_once(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 8, 30);
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.startRequests);

    hal.setWallClock(0, 9, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);
    TEST_ASSERT_NULL(engine.lastModel);
    TEST_ASSERT_TRUE(scheduler.getRuntimeState().autoStarted);

    hal.setWallClock(0, 9, 30);
    scheduler.tick();
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);
}

void test_window_exit_stops_auto_started_engine(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 10, 0);
    scheduler.tick();

    hal.setWallClock(0, 17, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.stopRequests);
    TEST_ASSERT_FALSE(engine.running);
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().autoStarted);

    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.stopRequests);
}

void test_manual_run_outside_window_is_left_alone(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 20, 0);
    engine.running = true;
    scheduler.onManualStart();
    scheduler.tick();

    TEST_ASSERT_EQUAL(0, engine.stopRequests);
    TEST_ASSERT_TRUE(engine.running);
}

void test_manual_run_in_window_is_not_stopped_at_exit(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    // User started before the window opened
    hal.setWallClock(0, 8, 0);
    engine.running = true;
    scheduler.tick();

    hal.setWallClock(0, 12, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.startRequests);

    hal.setWallClock(0, 18, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.stopRequests);
    TEST_ASSERT_TRUE(engine.running);
}

void test_rejected_start_retries_next_tick(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    engine.rejectStarts = true;
    hal.setWallClock(0, 10, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().autoStarted);
    TEST_ASSERT_TRUE(hal.hasLogContaining("rejected"));

    engine.rejectStarts = false;
    scheduler.tick();
    TEST_ASSERT_EQUAL(2, engine.startRequests);
    TEST_ASSERT_TRUE(engine.running);
}

void test_engine_stopped_elsewhere_is_not_restarted(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 10, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);

    // e.g. the ramp ended the run
    engine.running = false;
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);
}

void test_inactive_day_does_not_start(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(5, 10, 0); // Saturday
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.startRequests);
}

// ============================================================================
// TEST GROUP: MANUAL OVERRIDES
// ============================================================================

void test_manual_stop_suppresses_until_window_ends(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 10, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);

    engine.running = false;
    scheduler.onManualStop();
    TEST_ASSERT_TRUE(scheduler.getRuntimeState().manuallySuppressedThisWindow);
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().autoStarted);

    hal.setWallClock(0, 11, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);

    // Leave and come back the next day
    hal.setWallClock(0, 18, 0);
    scheduler.tick();
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().manuallySuppressedThisWindow);

    hal.setWallClock(1, 9, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(2, engine.startRequests);
}

void test_manual_start_clears_suppression(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 10, 0);
    scheduler.tick();
    engine.running = false;
    scheduler.onManualStop();

    engine.running = true;
    scheduler.onManualStart();
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().manuallySuppressedThisWindow);

    // Not auto-started, so leaving the window does not stop it
    hal.setWallClock(0, 17, 30);
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.stopRequests);
}

void test_manual_stop_outside_window_has_no_effect(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 8, 0);
    scheduler.onManualStop();
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().manuallySuppressedThisWindow);

    hal.setWallClock(0, 9, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, engine.startRequests);
}

void test_manual_stop_when_disabled_has_no_effect(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours(false));

    hal.setWallClock(0, 10, 0);
    scheduler.onManualStop();
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().manuallySuppressedThisWindow);
}

void test_disabling_resets_runtime(void) {
    MockSessionHAL hal;
    MockEngineControl engine;
    Scheduler scheduler(hal, engine, officeHours());

    hal.setWallClock(0, 10, 0);
    scheduler.tick();
    TEST_ASSERT_TRUE(scheduler.getRuntimeState().autoStarted);

    scheduler.setConfig(officeHours(false));
    TEST_ASSERT_FALSE(scheduler.getRuntimeState().autoStarted);

    hal.setWallClock(0, 18, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(0, engine.stopRequests);
}

int main(void) {
    UNITY_BEGIN();

    // Auto start / stop
    RUN_TEST(test_disabled_scheduler_does_nothing);
    RUN_TEST(test_window_entry_starts_default_mode_once);
    RUN_TEST(test_window_exit_stops_auto_started_engine);
    RUN_TEST(test_manual_run_outside_window_is_left_alone);
    RUN_TEST(test_manual_run_in_window_is_not_stopped_at_exit);
    RUN_TEST(test_rejected_start_retries_next_tick);
    RUN_TEST(test_engine_stopped_elsewhere_is_not_restarted);
    RUN_TEST(test_inactive_day_does_not_start);

    // Manual overrides
    RUN_TEST(test_manual_stop_suppresses_until_window_ends);
    RUN_TEST(test_manual_start_clears_suppression);
    RUN_TEST(test_manual_stop_outside_window_has_no_effect);
    RUN_TEST(test_manual_stop_when_disabled_has_no_effect);
    RUN_TEST(test_disabling_resets_runtime);

    return UNITY_END();
}
