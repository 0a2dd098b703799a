/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Session.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the SessionEngine class.
 *
 * DESIGN NOTES:
 * 1. Decoupled from the platform via ISessionHAL (clock + log).
 * 2. Decoupled from effect implementations via IFeatureGateway.
 * 3. Decoupled from reward math via ISessionRules.
 * 4. Implements "Internal Event" pattern via changeState().
 * 5. Plays a private copy of the TimelineModel; callers may edit theirs freely.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "Timeline.h"
#include "SessionContext.h"
#include "SessionRules.h"

class SessionEngine {
public:
    SessionEngine(ISessionHAL& hal, IFeatureGateway& features, ISessionRules& rules);

    // --- Main Loop Tick ---
    void tick();

    // --- API Commands ---
    StartResult startSession(const TimelineModel& model);
    void stopSession(bool completed);
    void resetToIdle();

    // --- Observers ---
    void setListener(ISessionListener* listener) { _listener = listener; }

    // --- State Accessors (Read-Only) ---
    SessionState getState() const { return _state; }
    bool isRunning() const { return _state == SESSION_RUNNING; }
    const SessionProgress& getProgress() const { return _progress; }
    uint32_t getLastXp() const { return _lastXp; }
    const TimelineModel* getActiveModel() const {
        if (_state == SESSION_IDLE) return nullptr;
        return &_model;
    }

    void printStartupDiagnostics();

private:
    // Flattened, pre-validated playback schedule built at start
    struct ScheduledAction {
        uint32_t minute;
        TimelineEventType type;
        std::string featureId;
        std::string eventId;
    };

    struct FeatureBaseline {
        std::string featureId;
        bool enabled;
    };

    // --- Dependencies ---
    ISessionHAL& _hal;
    IFeatureGateway& _features;
    ISessionRules& _rules;
    ISessionListener* _listener;

    // --- Dynamic State ---
    SessionState _state;
    TimelineModel _model;
    std::vector<ScheduledAction> _actions;
    size_t _nextAction;
    std::vector<FeatureBaseline> _baseline;
    unsigned long _startMillis;
    SessionProgress _progress;
    uint32_t _lastXp;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM (Internal Events)
    // =========================================================================

    void changeState(SessionState newState);

    // =========================================================================
    // SECTION: LOGIC HELPERS
    // =========================================================================

    void buildSchedule();
    void captureBaseline();
    void restoreBaseline();
    void applyThrough(uint32_t minute);
    void applyAction(const ScheduledAction& action);

    uint32_t elapsedSeconds();
    void updateProgress(uint32_t elapsed);
    void completeSession();

    void logKeyValue(const char *key, const char *value);
};
