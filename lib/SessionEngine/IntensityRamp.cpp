/*
 * =================================================================================
 * File:      lib/SessionEngine/IntensityRamp.cpp
 *
 * Description:
 * Linear intensity ramp.
 * - Multiplier goes 1.0 -> target over the configured duration.
 * - Every write is capped at the store's per-parameter ceiling.
 * - stop() puts every linked parameter back to its exact baseline.
 * =================================================================================
 */
#include <stdio.h>

#include "IntensityRamp.h"

IntensityRamp::IntensityRamp(ISessionHAL& hal, IParameterStore& store, IEngineControl& engine)
    : _hal(hal),
      _store(store),
      _engine(engine)
{
    _config.enabled = false;
    _config.durationMinutes = 0;
    _config.multiplier = 1.0;
    _config.endOnComplete = false;
    _startMillis = 0;
    _active = false;
    _completionHandled = false;
    _currentMultiplier = 1.0;
    _progress = 0.0;
}

void IntensityRamp::logKeyValue(const char *key, const char *value) {
    char tempBuf[LOG_LINE_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

// =================================================================================
// SECTION: COMMANDS
// =================================================================================

bool IntensityRamp::start(const RampConfig& config) {
    if (_active) {
        logKeyValue("Ramp", "Start Failed: Already active");
        return false;
    }
    if (config.durationMinutes == 0) {
        logKeyValue("Ramp", "Start Failed: Duration is 0");
        return false;
    }
    if (config.multiplier <= 0.0) {
        logKeyValue("Ramp", "Start Failed: Multiplier must be > 0");
        return false;
    }
    if (config.linkedParameters.empty()) {
        logKeyValue("Ramp", "Start Failed: No linked parameters");
        return false;
    }

    _config = config;
    _baseline.clear();
    for (size_t i = 0; i < _config.linkedParameters.size(); i++) {
        const std::string& name = _config.linkedParameters[i];
        _baseline[name] = _store.getParameter(name);
    }

    _startMillis = _hal.getMillis();
    _active = true;
    _completionHandled = false;
    _currentMultiplier = 1.0;
    _progress = 0.0;

    char logBuf[LOG_LINE_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Started: x%.2f over %u min (%u params)",
             _config.multiplier, _config.durationMinutes, (unsigned)_baseline.size());
    logKeyValue("Ramp", logBuf);
    return true;
}

void IntensityRamp::stop() {
    if (!_active) return;

    // Exact restore, not baseline * 1.0
    for (std::map<std::string, double>::const_iterator it = _baseline.begin(); it != _baseline.end(); ++it) {
        _store.setParameter(it->first, it->second);
    }

    _baseline.clear();
    _active = false;
    _completionHandled = false;
    _currentMultiplier = 1.0;
    _progress = 0.0;

    logKeyValue("Ramp", "Stopped. Baseline restored.");
}

// =================================================================================
// SECTION: TICK
// =================================================================================

void IntensityRamp::applyMultiplier(double multiplier) {
    for (std::map<std::string, double>::const_iterator it = _baseline.begin(); it != _baseline.end(); ++it) {
        double value = it->second * multiplier;
        double ceiling = _store.getParameterCeiling(it->first);
        if (value > ceiling) value = ceiling;
        _store.setParameter(it->first, value);
    }
}

void IntensityRamp::tick() {
    if (!_active) return;

    unsigned long elapsedMs = _hal.getMillis() - _startMillis;
    double totalMs = (double)_config.durationMinutes * 60000.0;

    double progress = (double)elapsedMs / totalMs;
    if (progress < 0.0) progress = 0.0;
    if (progress > 1.0) progress = 1.0;

    _progress = progress;
    _currentMultiplier = 1.0 + (_config.multiplier - 1.0) * progress;
    applyMultiplier(_currentMultiplier);

    if (progress >= 1.0 && !_completionHandled) {
        _completionHandled = true;

        char logBuf[LOG_LINE_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "Complete at x%.2f", _currentMultiplier);
        logKeyValue("Ramp", logBuf);

        if (_config.endOnComplete) {
            logKeyValue("Ramp", "End on complete: requesting engine stop");
            // The engine's shutdown path calls stop(); nothing may touch
            // members after this returns.
            _engine.requestStop();
        }
    }
}
