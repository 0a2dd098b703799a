/*
 * =================================================================================
 * File:      lib/SessionEngine/IntensityRamp.h
 * Description: Scales a set of linked numeric parameters from their captured
 * baseline up to baseline * multiplier over a fixed duration.
 * =================================================================================
 */
#pragma once
#include <map>
#include <string>

#include "Types.h"
#include "SessionContext.h"

class IntensityRamp {
public:
    IntensityRamp(ISessionHAL& hal, IParameterStore& store, IEngineControl& engine);

    // --- Commands ---
    bool start(const RampConfig& config);
    void stop();

    // --- Main Loop Tick (every RAMP_TICK_INTERVAL_SEC) ---
    void tick();

    // --- Accessors ---
    bool isActive() const { return _active; }
    double getCurrentMultiplier() const { return _currentMultiplier; }
    double getProgress() const { return _progress; }
    const RampConfig& getConfig() const { return _config; }

private:
    ISessionHAL& _hal;
    IParameterStore& _store;
    IEngineControl& _engine;

    RampConfig _config;
    std::map<std::string, double> _baseline;
    unsigned long _startMillis;

    bool _active;
    bool _completionHandled;
    double _currentMultiplier;
    double _progress;

    void applyMultiplier(double multiplier);
    void logKeyValue(const char *key, const char *value);
};
