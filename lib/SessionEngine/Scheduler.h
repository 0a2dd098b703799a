/*
 * =================================================================================
 * File:      lib/SessionEngine/Scheduler.h
 * Description: Weekly time-window auto start/stop of the main engine.
 *
 * Auto-start happens at most once per window entry. A manual stop inside the
 * window suppresses auto-start until the window is left.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "SessionContext.h"

class Scheduler {
public:
    Scheduler(ISessionHAL& hal, IEngineControl& engine, const ScheduleConfig& config);

    /**
     * Pure window test. Same-day windows are [start, end); a window with
     * end < start wraps past midnight. Only the weekday of 'now' is checked.
     */
    static bool isInWindow(const WallClock& now, const ScheduleConfig& config);

    // --- Main Loop Tick (every SCHEDULER_TICK_INTERVAL_SEC, plus once at startup) ---
    void tick();

    // --- User notifications ---
    void onManualStart();
    void onManualStop();

    void setConfig(const ScheduleConfig& config);
    const ScheduleConfig& getConfig() const { return _config; }
    const SchedulerRuntimeState& getRuntimeState() const { return _runtime; }

    void printStartupDiagnostics();

private:
    ISessionHAL& _hal;
    IEngineControl& _engine;
    ScheduleConfig _config;
    SchedulerRuntimeState _runtime;

    void resetRuntime();
    void logKeyValue(const char *key, const char *value);
};
