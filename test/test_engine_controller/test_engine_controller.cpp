/*
 * File: test/test_engine_controller/test_engine_controller.cpp
 * Description: EngineController wired to a real SessionEngine, IntensityRamp
 * and Scheduler over the spy gateway/store.
 * Covers default mode, session mode, ramp end-on-complete and window-driven
 * start/stop, checking that every path leaves the baselines restored.
 */
#include <unity.h>
#include "EngineController.h"
#include "IntensityRamp.h"
#include "MockSessionHAL.h"
#include "Scheduler.h"
#include "Session.h"
#include "StandardRules.h"

// --- Fixture ---
struct Rig {
    MockSessionHAL hal;
    MockFeatureGateway features;
    MockParameterStore store;
    StandardRules rules;
    SessionEngine session;
    EngineController engine;
    IntensityRamp ramp;

    Rig()
        : session(hal, features, rules),
          engine(hal, session, features),
          ramp(hal, store, engine) {
        session.setListener(&engine);
        engine.attachRamp(&ramp);

        std::vector<std::string> defaults;
        defaults.push_back("flash");
        defaults.push_back("subliminal");
        engine.setDefaultFeatures(defaults);

        store.define("FlashOpacity", 10.0, 100.0);
    }
};

// --- Helpers ---
static RampConfig rampOf(uint32_t minutes, double multiplier, bool endOnComplete) {
    RampConfig c;
    c.enabled = true;
    c.durationMinutes = minutes;
    c.multiplier = multiplier;
    c.linkedParameters.push_back("FlashOpacity");
    c.endOnComplete = endOnComplete;
    return c;
}

static TimelineModel flashSession() {
    TimelineModel m("flash5", "Flash Five", 5);
    std::string start = m.addStart("flash", 0);
    m.addStop(start, 3);
    return m;
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST GROUP: DEFAULT MODE
// ============================================================================

void test_default_mode_enables_and_restores_features(void) {
    Rig rig;
    rig.features.enabled.insert("flash"); // already on before start

    TEST_ASSERT_TRUE(rig.engine.requestStart(nullptr));
    TEST_ASSERT_EQUAL(ENGINE_DEFAULT, rig.engine.getMode());
    TEST_ASSERT_TRUE(rig.engine.isEngineRunning());
    TEST_ASSERT_TRUE(rig.features.isFeatureEnabled("subliminal"));
    TEST_ASSERT_EQUAL(0, rig.features.countCalls("flash", true));

    rig.engine.requestStop();

    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("subliminal"));
    // Not switched on by the engine, so not switched off either
    TEST_ASSERT_TRUE(rig.features.isFeatureEnabled("flash"));
}

void test_second_start_is_rejected(void) {
    Rig rig;

    TEST_ASSERT_TRUE(rig.engine.requestStart(nullptr));
    TimelineModel m = flashSession();
    TEST_ASSERT_FALSE(rig.engine.requestStart(&m));
    TEST_ASSERT_EQUAL(ENGINE_DEFAULT, rig.engine.getMode());
    TEST_ASSERT_EQUAL(SESSION_IDLE, rig.session.getState());
}

void test_failing_default_feature_is_skipped(void) {
    Rig rig;
    rig.features.failing.insert("subliminal");

    TEST_ASSERT_TRUE(rig.engine.requestStart(nullptr));
    TEST_ASSERT_TRUE(rig.features.isFeatureEnabled("flash"));
    TEST_ASSERT_TRUE(rig.hal.hasLogContaining("failed to start"));

    rig.engine.requestStop();
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("flash"));
    TEST_ASSERT_EQUAL(0, rig.features.countCalls("subliminal", false));
}

void test_stop_when_off_is_noop(void) {
    Rig rig;
    rig.engine.requestStop();
    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_EQUAL(0, (int)rig.features.calls.size());
}

// ============================================================================
// TEST GROUP: RAMP
// ============================================================================

void test_ramp_end_on_complete_stops_engine_and_restores(void) {
    Rig rig;
    rig.engine.setRampConfig(rampOf(10, 3.0, true));

    TEST_ASSERT_TRUE(rig.engine.requestStart(nullptr));
    TEST_ASSERT_TRUE(rig.ramp.isActive());

    rig.hal.advanceMinutes(5);
    rig.ramp.tick();
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 20.0f, (float)rig.store.getParameter("FlashOpacity"));

    rig.hal.advanceMinutes(5);
    rig.ramp.tick();

    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_FALSE(rig.ramp.isActive());
    TEST_ASSERT_TRUE(rig.store.getParameter("FlashOpacity") == 10.0);
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("flash"));
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("subliminal"));
}

void test_disabled_ramp_is_not_started(void) {
    Rig rig;
    RampConfig c = rampOf(10, 3.0, false);
    c.enabled = false;
    rig.engine.setRampConfig(c);

    rig.engine.requestStart(nullptr);
    TEST_ASSERT_FALSE(rig.ramp.isActive());
}

// ============================================================================
// TEST GROUP: SESSION MODE
// ============================================================================

void test_finished_session_shuts_engine_down(void) {
    Rig rig;
    TimelineModel m = flashSession();

    TEST_ASSERT_TRUE(rig.engine.requestStart(&m));
    TEST_ASSERT_EQUAL(ENGINE_SESSION, rig.engine.getMode());
    TEST_ASSERT_TRUE(rig.features.isFeatureEnabled("flash"));
    // Session mode does not touch the default features
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("subliminal"));

    rig.hal.advanceMinutes(5);
    rig.session.tick();
    rig.engine.tick();

    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_EQUAL(SESSION_IDLE, rig.session.getState());
    TEST_ASSERT_EQUAL_UINT32(60, rig.engine.getTotalXp());
    TEST_ASSERT_EQUAL_UINT32(1, rig.engine.getCompletedSessions());
    TEST_ASSERT_TRUE(rig.hal.hasLogContaining("Session finished"));

    // Ready for the next run
    TEST_ASSERT_TRUE(rig.engine.requestStart(&m));
}

void test_stop_mid_session_abandons_without_xp(void) {
    Rig rig;
    TimelineModel m = flashSession();

    rig.engine.requestStart(&m);
    rig.hal.advanceMinutes(2);
    rig.session.tick();
    rig.engine.tick();
    TEST_ASSERT_EQUAL(ENGINE_SESSION, rig.engine.getMode());

    rig.engine.requestStop();

    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_EQUAL(SESSION_IDLE, rig.session.getState());
    TEST_ASSERT_EQUAL_UINT32(0, rig.engine.getTotalXp());
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("flash"));
    TEST_ASSERT_TRUE(rig.hal.hasLogContaining("abandoned"));
}

void test_session_end_stops_ramp(void) {
    Rig rig;
    rig.engine.setRampConfig(rampOf(10, 2.0, false));
    TimelineModel m = flashSession();

    rig.engine.requestStart(&m);
    rig.hal.advanceMinutes(4);
    rig.ramp.tick();
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 14.0f, (float)rig.store.getParameter("FlashOpacity"));

    rig.hal.advanceMinutes(1);
    rig.session.tick();
    rig.engine.tick();

    TEST_ASSERT_FALSE(rig.ramp.isActive());
    TEST_ASSERT_TRUE(rig.store.getParameter("FlashOpacity") == 10.0);
}

// ============================================================================
// TEST GROUP: SCHEDULER
// ============================================================================

void test_scheduler_window_drives_default_mode(void) {
    Rig rig;

    ScheduleConfig c;
    c.enabled = true;
    for (uint8_t d = 0; d < DAYS_PER_WEEK; d++) c.activeDays[d] = true;
    c.startTimeOfDay = 9 * 3600;
    c.endTimeOfDay = 17 * 3600;
    Scheduler scheduler(rig.hal, rig.engine, c);

    rig.hal.setWallClock(0, 9, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(ENGINE_DEFAULT, rig.engine.getMode());
    TEST_ASSERT_TRUE(rig.features.isFeatureEnabled("flash"));

    rig.hal.setWallClock(0, 12, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(1, rig.features.countCalls("flash", true));

    rig.hal.setWallClock(0, 17, 0);
    scheduler.tick();
    TEST_ASSERT_EQUAL(ENGINE_OFF, rig.engine.getMode());
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("flash"));
    TEST_ASSERT_FALSE(rig.features.isFeatureEnabled("subliminal"));
}

int main(void) {
    UNITY_BEGIN();

    // Default mode
    RUN_TEST(test_default_mode_enables_and_restores_features);
    RUN_TEST(test_second_start_is_rejected);
    RUN_TEST(test_failing_default_feature_is_skipped);
    RUN_TEST(test_stop_when_off_is_noop);

    // Ramp
    RUN_TEST(test_ramp_end_on_complete_stops_engine_and_restores);
    RUN_TEST(test_disabled_ramp_is_not_started);

    // Session mode
    RUN_TEST(test_finished_session_shuts_engine_down);
    RUN_TEST(test_stop_mid_session_abandons_without_xp);
    RUN_TEST(test_session_end_stops_ramp);

    // Scheduler
    RUN_TEST(test_scheduler_window_drives_default_mode);

    return UNITY_END();
}
