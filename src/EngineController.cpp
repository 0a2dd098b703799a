/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      src/EngineController.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "EngineController.h"
#include <stdio.h>

#include "Logger.h"
#include "TimeUtils.h"

static const char *engineModeToString(EngineMode m) {
  switch (m) {
  case ENGINE_OFF:
    return "OFF";
  case ENGINE_DEFAULT:
    return "DEFAULT";
  case ENGINE_SESSION:
    return "SESSION";
  default:
    return "UNKNOWN";
  }
}

EngineController::EngineController(ISessionHAL &hal, SessionEngine &session, IFeatureGateway &features)
    : _hal(hal), _session(session), _ramp(nullptr), _features(features), _mode(ENGINE_OFF), _lastProgressMinute(0), _totalXp(0),
      _completedSessions(0) {
  _rampConfig.enabled = false;
  _rampConfig.durationMinutes = 0;
  _rampConfig.multiplier = 1.0;
  _rampConfig.endOnComplete = false;
}

void EngineController::logKeyValue(const char *key, const char *value) {
  char tempBuf[LOG_LINE_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

// =================================================================================
// SECTION: START / STOP
// =================================================================================

void EngineController::startRamp() {
  if (!_rampConfig.enabled || _ramp == nullptr) return;
  if (!_ramp->start(_rampConfig)) {
    logKeyValue("Engine", "Ramp not started (see above).");
  }
}

bool EngineController::requestStart(const TimelineModel *model) {
  if (_mode != ENGINE_OFF) {
    logKeyValue("Engine", "Start ignored: already running.");
    return false;
  }

  // A finished session is still parked in COMPLETED/STOPPED_EARLY until reset
  if (_session.getState() != SESSION_IDLE) _session.resetToIdle();

  if (model != nullptr) {
    StartResult result = _session.startSession(*model);
    if (result != START_OK) {
      logKeyValue("Engine", "Start rejected by session engine.");
      return false;
    }
    _mode = ENGINE_SESSION;
    _lastProgressMinute = 0;
  } else {
    _enabledByDefaultMode.clear();
    for (size_t i = 0; i < _defaultFeatures.size(); i++) {
      const std::string &id = _defaultFeatures[i];
      if (_features.isFeatureEnabled(id)) continue;
      if (_features.enableFeature(id)) {
        _enabledByDefaultMode.push_back(id);
      } else {
        char logBuf[LOG_LINE_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "Default feature '%s' failed to start", id.c_str());
        logKeyValue("Engine", logBuf);
      }
    }
    _mode = ENGINE_DEFAULT;
  }

  startRamp();

  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), ">>> ENGINE STARTED: %s", engineModeToString(_mode));
  logKeyValue("Engine", logBuf);
  return true;
}

void EngineController::shutdown() {
  // 1. Timeline (restores its own baseline)
  if (_session.isRunning()) _session.stopSession(false);
  if (_session.getState() != SESSION_IDLE) _session.resetToIdle();

  // 2. Ramp (restores parameter baseline)
  if (_ramp) _ramp->stop();

  // 3. Default-mode features
  for (size_t i = 0; i < _enabledByDefaultMode.size(); i++) {
    if (!_features.disableFeature(_enabledByDefaultMode[i])) {
      char logBuf[LOG_LINE_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Default feature '%s' failed to stop", _enabledByDefaultMode[i].c_str());
      logKeyValue("Engine", logBuf);
    }
  }
  _enabledByDefaultMode.clear();

  _mode = ENGINE_OFF;
  logKeyValue("Engine", ">>> ENGINE STOPPED");
}

void EngineController::requestStop() {
  if (_mode == ENGINE_OFF) return;
  shutdown();
}

void EngineController::tick() {
  if (_mode != ENGINE_SESSION) return;

  SessionState s = _session.getState();
  if (s == SESSION_COMPLETED || s == SESSION_STOPPED_EARLY) {
    logKeyValue("Engine", "Session finished. Shutting down.");
    shutdown();
  }
}

// =================================================================================
// SECTION: SESSION LISTENER
// =================================================================================

void EngineController::onSessionStarted(const TimelineModel &model) {
  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "'%s' started (%u min)", model.getName().c_str(), model.getDurationMinutes());
  logKeyValue("Listener", logBuf);
}

void EngineController::onProgressUpdated(const SessionProgress &progress) {
  // Once per minute is enough on a console
  uint32_t minute = progress.elapsedSeconds / 60;
  if (minute == _lastProgressMinute) return;
  _lastProgressMinute = minute;

  char remaining[48];
  TimeUtils::formatSeconds(progress.remainingSeconds, remaining, sizeof(remaining));

  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "%.0f%% done, %s left", progress.percent, remaining);
  logKeyValue("Progress", logBuf);
}

void EngineController::onPhaseChanged(const std::string &featureId, TimelineEventType type, uint32_t minute) {
  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "min %u: %s %s", minute, featureId.c_str(), type == EVENT_START ? "on" : "off");
  logKeyValue("Phase", logBuf);
}

void EngineController::onSessionCompleted(const TimelineModel &model, uint32_t elapsedSeconds, uint32_t xp) {
  _totalXp += xp;
  _completedSessions++;

  char elapsed[48];
  TimeUtils::formatSeconds(elapsedSeconds, elapsed, sizeof(elapsed));

  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "'%s' completed after %s: +%u XP (total %u)", model.getName().c_str(), elapsed, xp, _totalXp);
  logKeyValue("Listener", logBuf);
}

void EngineController::onSessionAbandoned(const TimelineModel &model, uint32_t elapsedSeconds) {
  char elapsed[48];
  TimeUtils::formatSeconds(elapsedSeconds, elapsed, sizeof(elapsed));

  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "'%s' abandoned after %s. No XP.", model.getName().c_str(), elapsed);
  logKeyValue("Listener", logBuf);
}

// =================================================================================
// SECTION: STATUS
// =================================================================================

void EngineController::printStatus() {
  char logBuf[128];

  _hal.log(LOG_SEP_MINOR);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Engine", engineModeToString(_mode));
  _hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session", sessionStateToString(_session.getState()));
  _hal.log(logBuf);

  const TimelineModel *active = _session.getActiveModel();
  if (active != nullptr) {
    const SessionProgress &p = _session.getProgress();
    char elapsed[48];
    TimeUtils::formatSeconds(p.elapsedSeconds, elapsed, sizeof(elapsed));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s, %s (%.1f%%)", "Active", active->getName().c_str(), elapsed, p.percent);
    _hal.log(logBuf);
  }

  if (_ramp && _ramp->isActive()) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : x%.2f (%.0f%%)", "Ramp", _ramp->getCurrentMultiplier(), _ramp->getProgress() * 100.0);
  } else {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Ramp", "inactive");
  }
  _hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u (%u sessions)", "Total XP", _totalXp, _completedSessions);
  _hal.log(logBuf);
}
