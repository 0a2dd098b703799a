/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Session.cpp
 *
 * Description:
 * Timeline playback core.
 * - Uses 'changeState' for all state transitions (IDLE/RUNNING/COMPLETED/STOPPED_EARLY).
 * - Applies timeline events through IFeatureGateway, Stops before Starts per minute.
 * - Restores the captured feature baseline on every exit path.
 * - Uses 'SessionRules' for the XP award.
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>
#include <algorithm>

#include "Session.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

SessionEngine::SessionEngine(ISessionHAL& hal, IFeatureGateway& features, ISessionRules& rules)
    : _hal(hal),
      _features(features),
      _rules(rules),
      _listener(nullptr)
{
    _state = SESSION_IDLE;
    _nextAction = 0;
    _startMillis = 0;
    _lastXp = 0;
    memset(&_progress, 0, sizeof(_progress));
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Utils)
// =================================================================================

void SessionEngine::logKeyValue(const char *key, const char *value) {
    char tempBuf[LOG_LINE_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

uint32_t SessionEngine::elapsedSeconds() {
    return (uint32_t)((_hal.getMillis() - _startMillis) / 1000UL);
}

void SessionEngine::updateProgress(uint32_t elapsed) {
    uint64_t totalSeconds = (uint64_t)_model.getDurationMinutes() * 60;
    if (elapsed > totalSeconds) elapsed = (uint32_t)totalSeconds;

    uint64_t remaining = totalSeconds - elapsed;
    _progress.elapsedSeconds = elapsed;
    _progress.remainingSeconds = remaining > UINT32_MAX ? UINT32_MAX : (uint32_t)remaining;
    _progress.percent = totalSeconds > 0 ? (100.0 * elapsed) / (double)totalSeconds : 100.0;
}

void SessionEngine::printStartupDiagnostics() {
    char logBuf[LOG_LINE_LENGTH];

    _hal.log("==========================================================================");
    _hal.log("                        SESSION ENGINE DIAGNOSTICS                        ");
    _hal.log("==========================================================================");

    _hal.log("[ ENGINE STATE ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current Mode", sessionStateToString(_state));
    _hal.log(logBuf);

    const TimelineModel* active = getActiveModel();
    if (active == nullptr) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Active Session", "(none)");
        _hal.log(logBuf);
        return;
    }

    _hal.log("");
    _hal.log("[ ACTIVE SESSION ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Name", active->getName().c_str());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u min", "Duration", active->getDurationMinutes());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u (%u scheduled)", "Events",
             (unsigned)active->getEventCount(), (unsigned)_actions.size());
    _hal.log(logBuf);

    char timeStr[48];
    TimeUtils::formatSeconds(_progress.elapsedSeconds, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%.1f%%)", "Elapsed", timeStr, _progress.percent);
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM (The Event Core)
// =================================================================================

/**
 * Centralized State Machine Transition.
 * All state changes MUST go through this function.
 */
void SessionEngine::changeState(SessionState newState) {
    if (_state == newState) return;

    _state = newState;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", sessionStateToString(_state));
    logKeyValue("Session", logBuf);
}

// =================================================================================
// SECTION: SCHEDULE & BASELINE
// =================================================================================

/**
 * Flattens the private model copy into an ordered action list.
 * Malformed Stops (no Start, Start points elsewhere, not after the Start) are
 * dropped here, so their Start simply runs to the end of the session.
 */
void SessionEngine::buildSchedule() {
    _actions.clear();
    _nextAction = 0;

    const std::vector<TimelineEvent>& events = _model.getEvents();
    char logBuf[LOG_LINE_LENGTH];

    for (size_t i = 0; i < events.size(); i++) {
        const TimelineEvent& e = events[i];

        if (e.type == EVENT_STOP) {
            const TimelineEvent* start = _model.findEvent(e.pairedEventId);
            bool valid = start != nullptr &&
                         start->type == EVENT_START &&
                         start->pairedEventId == e.id &&
                         start->featureId == e.featureId &&
                         e.minute > start->minute;
            if (!valid) {
                snprintf(logBuf, sizeof(logBuf), "Ignoring orphan Stop '%s' (%s @ %u min)",
                         e.id.c_str(), e.featureId.c_str(), e.minute);
                logKeyValue("Timeline", logBuf);
                continue;
            }
        }

        ScheduledAction action;
        action.minute = e.minute;
        action.type = e.type;
        action.featureId = e.featureId;
        action.eventId = e.id;
        _actions.push_back(action);
    }

    // Nondecreasing minute; inside a minute every Stop runs before any Start
    std::stable_sort(_actions.begin(), _actions.end(),
                     [](const ScheduledAction& a, const ScheduledAction& b) {
                         if (a.minute != b.minute) return a.minute < b.minute;
                         return a.type == EVENT_STOP && b.type == EVENT_START;
                     });
}

void SessionEngine::captureBaseline() {
    _baseline.clear();
    std::vector<std::string> ids = _model.getFeatureIds();
    for (size_t i = 0; i < ids.size(); i++) {
        FeatureBaseline b;
        b.featureId = ids[i];
        b.enabled = _features.isFeatureEnabled(ids[i]);
        _baseline.push_back(b);
    }
}

/**
 * Puts every touched feature back the way it was found.
 * A failing feature is logged and the rest are still restored.
 */
void SessionEngine::restoreBaseline() {
    char logBuf[LOG_LINE_LENGTH];

    for (size_t i = 0; i < _baseline.size(); i++) {
        const FeatureBaseline& b = _baseline[i];
        bool ok = b.enabled ? _features.enableFeature(b.featureId)
                            : _features.disableFeature(b.featureId);
        if (!ok) {
            snprintf(logBuf, sizeof(logBuf), "Restore failed for '%s'", b.featureId.c_str());
            logKeyValue("Session", logBuf);
        }
    }
    _baseline.clear();
}

// =================================================================================
// SECTION: EVENT APPLICATION
// =================================================================================

void SessionEngine::applyThrough(uint32_t minute) {
    while (_nextAction < _actions.size() && _actions[_nextAction].minute <= minute) {
        // Copy: a listener callback must not be able to invalidate the reference
        ScheduledAction action = _actions[_nextAction];
        _nextAction++;
        applyAction(action);

        // A listener may have stopped the session from inside the callback
        if (_state != SESSION_RUNNING) return;
    }
}

void SessionEngine::applyAction(const ScheduledAction& action) {
    char logBuf[LOG_LINE_LENGTH];

    bool ok = (action.type == EVENT_START) ? _features.enableFeature(action.featureId)
                                           : _features.disableFeature(action.featureId);
    if (!ok) {
        snprintf(logBuf, sizeof(logBuf), "Feature '%s' failed to %s @ %u min. Skipping.",
                 action.featureId.c_str(), eventTypeToString(action.type), action.minute);
        logKeyValue("Session", logBuf);
        return;
    }

    snprintf(logBuf, sizeof(logBuf), "%s %s @ %u min",
             eventTypeToString(action.type), action.featureId.c_str(), action.minute);
    logKeyValue("Timeline", logBuf);

    if (_listener) _listener->onPhaseChanged(action.featureId, action.type, action.minute);
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

/**
 * Called 1x/sec. Elapsed time is read from the HAL clock, so a late or
 * batched tick still lands on the right minute boundary.
 */
void SessionEngine::tick() {
    if (_state != SESSION_RUNNING) return;

    unsigned long elapsedMs = _hal.getMillis() - _startMillis;
    uint32_t duration = _model.getDurationMinutes();

    // 1. Apply everything in (previous boundary, current boundary]
    unsigned long boundary = elapsedMs / 60000UL;
    if (boundary > duration) boundary = duration;
    applyThrough((uint32_t)boundary);
    if (_state != SESSION_RUNNING) return;

    // 2. Progress (every tick, event or not)
    updateProgress((uint32_t)(elapsedMs / 1000UL));
    if (_listener) _listener->onProgressUpdated(_progress);
    if (_state != SESSION_RUNNING) return;

    // 3. Completion
    if ((uint64_t)elapsedMs >= (uint64_t)duration * 60000ULL) {
        completeSession();
    }
}

// =================================================================================
// SECTION: ACTIONS & TRANSITIONS
// =================================================================================

/**
 * Starts playback of a private copy of the model.
 */
StartResult SessionEngine::startSession(const TimelineModel& model) {
    if (_state != SESSION_IDLE) {
        logKeyValue("Session", "Start Failed: Engine not IDLE");
        return START_ALREADY_RUNNING;
    }

    if (model.getDurationMinutes() == 0) {
        logKeyValue("Session", "Start Failed: Session has no duration");
        return START_INVALID_MODEL;
    }

    // 1. Freeze the model
    _model = model;

    std::string problem;
    if (!_model.isWellFormed(problem)) {
        char warnBuf[LOG_LINE_LENGTH];
        snprintf(warnBuf, sizeof(warnBuf), "Warning: %s", problem.c_str());
        logKeyValue("Timeline", warnBuf);
    }

    // 2. Prepare playback
    buildSchedule();
    captureBaseline();
    _startMillis = _hal.getMillis();
    _lastXp = 0;
    updateProgress(0);

    char logBuf[LOG_LINE_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Starting '%s' (%u min, %u events)",
             _model.getName().c_str(), _model.getDurationMinutes(), (unsigned)_actions.size());
    logKeyValue("Session", logBuf);

    // 3. Transition
    changeState(SESSION_RUNNING);
    if (_listener) _listener->onSessionStarted(_model);

    // 4. Establish the t=0 state
    if (_state == SESSION_RUNNING) applyThrough(0);

    return START_OK;
}

void SessionEngine::completeSession() {
    uint32_t elapsed = elapsedSeconds();

    applyThrough(_model.getDurationMinutes());
    restoreBaseline();

    _lastXp = _rules.calculateDifficulty(_model).xp;
    changeState(SESSION_COMPLETED);

    char logBuf[LOG_LINE_LENGTH];
    char timeStr[48];
    TimeUtils::formatSeconds(elapsed, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Completed '%s' in %s. XP: %u", _model.getName().c_str(), timeStr, _lastXp);
    logKeyValue("Session", logBuf);

    if (_listener) {
        _listener->onSessionStopped();
        _listener->onSessionCompleted(_model, elapsed, _lastXp);
    }
}

/**
 * Ends a RUNNING session early. The flag only selects which notification
 * goes out; the state is STOPPED_EARLY either way.
 */
void SessionEngine::stopSession(bool completed) {
    if (_state != SESSION_RUNNING) return;

    uint32_t elapsed = elapsedSeconds();
    updateProgress(elapsed);
    restoreBaseline();

    _lastXp = completed ? _rules.calculateDifficulty(_model).xp : 0;
    changeState(SESSION_STOPPED_EARLY);

    char logBuf[LOG_LINE_LENGTH];
    if (completed) {
        snprintf(logBuf, sizeof(logBuf), "Stopped '%s' as completed. XP: %u", _model.getName().c_str(), _lastXp);
    } else {
        snprintf(logBuf, sizeof(logBuf), "Stopped '%s' early. Abandoned.", _model.getName().c_str());
    }
    logKeyValue("Session", logBuf);

    if (_listener) {
        _listener->onSessionStopped();
        if (completed) {
            _listener->onSessionCompleted(_model, elapsed, _lastXp);
        } else {
            _listener->onSessionAbandoned(_model, elapsed);
        }
    }
}

void SessionEngine::resetToIdle() {
    if (_state == SESSION_RUNNING) {
        stopSession(false);
    }

    _actions.clear();
    _nextAction = 0;
    _baseline.clear();
    _model = TimelineModel();
    memset(&_progress, 0, sizeof(_progress));

    changeState(SESSION_IDLE);
}
