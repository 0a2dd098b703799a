/*
 * =================================================================================
 * File:      lib/SessionEngine/SessionContext.h
 * Description: Abstraction layer for the collaborators the engine drives:
 * platform (clock + logging), feature gateway, parameter store, main engine
 * control, and the outbound session listener.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "Timeline.h"

class ISessionHAL {
public:
    virtual ~ISessionHAL() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Clock ---
    // Monotonic milliseconds. Used for elapsed-time math only.
    virtual unsigned long getMillis() = 0;

    // Local calendar time (weekday + time of day). Used by the Scheduler.
    virtual WallClock getWallClock() = 0;
};

class IFeatureGateway {
public:
    virtual ~IFeatureGateway() {}

    // Idempotent. Returns false if the feature could not be switched;
    // callers log and carry on.
    virtual bool enableFeature(const std::string& featureId) = 0;
    virtual bool disableFeature(const std::string& featureId) = 0;

    virtual bool isFeatureEnabled(const std::string& featureId) const = 0;
};

class IParameterStore {
public:
    virtual ~IParameterStore() {}

    virtual double getParameter(const std::string& name) const = 0;
    virtual void setParameter(const std::string& name, double value) = 0;

    // Per-parameter ceiling. Policy data owned by the store.
    virtual double getParameterCeiling(const std::string& name) const = 0;
};

class IEngineControl {
public:
    virtual ~IEngineControl() {}

    // model == nullptr starts the engine in its default (free-running) mode.
    // Returns false if the request was rejected.
    virtual bool requestStart(const TimelineModel* model) = 0;
    virtual void requestStop() = 0;

    virtual bool isEngineRunning() const = 0;
};

class ISessionListener {
public:
    virtual ~ISessionListener() {}

    virtual void onSessionStarted(const TimelineModel& model) { (void)model; }
    virtual void onSessionStopped() {}

    // Fired every tick while RUNNING.
    virtual void onProgressUpdated(const SessionProgress& progress) = 0;

    // Fired for every timeline event the engine applies.
    virtual void onPhaseChanged(const std::string& featureId, TimelineEventType type, uint32_t minute) = 0;

    virtual void onSessionCompleted(const TimelineModel& model, uint32_t elapsedSeconds, uint32_t xp) = 0;

    // Zero-XP completion after a stopSession(false).
    virtual void onSessionAbandoned(const TimelineModel& model, uint32_t elapsedSeconds) = 0;
};
