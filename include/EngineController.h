/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      include/EngineController.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * The "main engine" as seen by the Scheduler and the console. Owns the
 * start/stop policy:
 * - Default mode (no timeline): enables the configured default features.
 * - Session mode: hands the timeline to the SessionEngine.
 * In both modes the IntensityRamp runs alongside when enabled, and stopping
 * restores everything that was touched.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "IntensityRamp.h"
#include "Session.h"
#include "SessionContext.h"
#include "Types.h"

enum EngineMode : uint8_t { ENGINE_OFF, ENGINE_DEFAULT, ENGINE_SESSION };

class EngineController : public IEngineControl, public ISessionListener {
public:
  EngineController(ISessionHAL &hal, SessionEngine &session, IFeatureGateway &features);

  // The ramp calls back into this controller, so it is attached after construction
  void attachRamp(IntensityRamp *ramp) { _ramp = ramp; }

  void setRampConfig(const RampConfig &config) { _rampConfig = config; }
  void setDefaultFeatures(const std::vector<std::string> &features) { _defaultFeatures = features; }

  // --- IEngineControl ---
  bool requestStart(const TimelineModel *model) override;
  void requestStop() override;
  bool isEngineRunning() const override { return _mode != ENGINE_OFF; }

  // --- Main Loop Tick (after SessionEngine::tick) ---
  // Shuts the engine down once a timeline session has finished.
  void tick();

  // --- ISessionListener ---
  void onSessionStarted(const TimelineModel &model) override;
  void onProgressUpdated(const SessionProgress &progress) override;
  void onPhaseChanged(const std::string &featureId, TimelineEventType type, uint32_t minute) override;
  void onSessionCompleted(const TimelineModel &model, uint32_t elapsedSeconds, uint32_t xp) override;
  void onSessionAbandoned(const TimelineModel &model, uint32_t elapsedSeconds) override;

  // --- Accessors ---
  EngineMode getMode() const { return _mode; }
  uint32_t getTotalXp() const { return _totalXp; }
  uint32_t getCompletedSessions() const { return _completedSessions; }

  void printStatus();

private:
  ISessionHAL &_hal;
  SessionEngine &_session;
  IntensityRamp *_ramp;
  IFeatureGateway &_features;

  RampConfig _rampConfig;
  std::vector<std::string> _defaultFeatures;

  EngineMode _mode;
  // Default-mode features that were OFF before start (switched back off on stop)
  std::vector<std::string> _enabledByDefaultMode;
  uint32_t _lastProgressMinute;

  uint32_t _totalXp;
  uint32_t _completedSessions;

  void startRamp();
  void shutdown();
  void logKeyValue(const char *key, const char *value);
};
