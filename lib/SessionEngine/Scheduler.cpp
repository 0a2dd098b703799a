/*
 * =================================================================================
 * File:      lib/SessionEngine/Scheduler.cpp
 *
 * Description:
 * Polling window controller. Reads the wall clock from the HAL on every tick
 * and drives IEngineControl. Holds no timers of its own.
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "Scheduler.h"
#include "TimeUtils.h"

Scheduler::Scheduler(ISessionHAL& hal, IEngineControl& engine, const ScheduleConfig& config)
    : _hal(hal),
      _engine(engine),
      _config(config)
{
    resetRuntime();
}

void Scheduler::logKeyValue(const char *key, const char *value) {
    char tempBuf[LOG_LINE_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void Scheduler::resetRuntime() {
    _runtime.autoStarted = false;
    _runtime.manuallySuppressedThisWindow = false;
}

void Scheduler::setConfig(const ScheduleConfig& config) {
    _config = config;
    if (!_config.enabled) resetRuntime();
}

bool Scheduler::isInWindow(const WallClock& now, const ScheduleConfig& config) {
    if (now.weekday >= DAYS_PER_WEEK) return false;
    if (!config.activeDays[now.weekday]) return false;

    uint32_t t = now.secondsOfDay;
    uint32_t start = config.startTimeOfDay;
    uint32_t end = config.endTimeOfDay;

    if (end >= start) {
        return t >= start && t < end;
    }
    // Overnight window, e.g. 22:00 -> 02:00
    return t >= start || t < end;
}

// =================================================================================
// SECTION: CONTROL LOOP
// =================================================================================

void Scheduler::tick() {
    if (!_config.enabled) return;

    WallClock now = _hal.getWallClock();
    bool inWindow = isInWindow(now, _config);
    bool running = _engine.isEngineRunning();

    if (inWindow) {
        if (running || _runtime.autoStarted || _runtime.manuallySuppressedThisWindow) return;

        logKeyValue("Schedule", "Window open. Auto-starting engine.");
        if (_engine.requestStart(nullptr)) {
            _runtime.autoStarted = true;
        } else {
            logKeyValue("Schedule", "Auto-start rejected by engine");
        }
        return;
    }

    if (running && _runtime.autoStarted) {
        logKeyValue("Schedule", "Window closed. Auto-stopping engine.");
        _engine.requestStop();
        _runtime.autoStarted = false;
    }

    // Leaving the window re-arms it
    resetRuntime();
}

void Scheduler::onManualStart() {
    _runtime.manuallySuppressedThisWindow = false;
}

void Scheduler::onManualStop() {
    if (!_config.enabled) return;

    if (isInWindow(_hal.getWallClock(), _config)) {
        _runtime.manuallySuppressedThisWindow = true;
        _runtime.autoStarted = false;
        logKeyValue("Schedule", "Manual stop. Auto-start suppressed until window ends.");
    }
}

void Scheduler::printStartupDiagnostics() {
    char logBuf[LOG_LINE_LENGTH];
    char startStr[8];
    char endStr[8];
    char daysStr[32];

    _hal.log("[ SCHEDULER ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Enabled", _config.enabled ? "YES" : "NO");
    _hal.log(logBuf);

    TimeUtils::formatTimeOfDay(_config.startTimeOfDay, startStr, sizeof(startStr));
    TimeUtils::formatTimeOfDay(_config.endTimeOfDay, endStr, sizeof(endStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s - %s", "Window", startStr, endStr);
    _hal.log(logBuf);

    daysStr[0] = '\0';
    for (uint8_t d = 0; d < DAYS_PER_WEEK; d++) {
        if (!_config.activeDays[d]) continue;
        if (daysStr[0] != '\0') strncat(daysStr, " ", sizeof(daysStr) - strlen(daysStr) - 1);
        strncat(daysStr, weekdayToString(d), sizeof(daysStr) - strlen(daysStr) - 1);
    }
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Active Days", daysStr[0] ? daysStr : "(none)");
    _hal.log(logBuf);
}
