/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// --- Enums ---
enum SessionState : uint8_t { SESSION_IDLE, SESSION_RUNNING, SESSION_COMPLETED, SESSION_STOPPED_EARLY };
enum TimelineEventType : uint8_t { EVENT_START, EVENT_STOP };
enum DifficultyTier : uint8_t { DIFFICULTY_EASY, DIFFICULTY_MEDIUM, DIFFICULTY_HARD, DIFFICULTY_EXTREME };
enum StartResult : uint8_t { START_OK, START_ALREADY_RUNNING, START_INVALID_MODEL };

// --- Constants ---

// Tick cadence (seconds of wall time per tick)
#define SESSION_TICK_INTERVAL_SEC 1
#define RAMP_TICK_INTERVAL_SEC 2
#define SCHEDULER_TICK_INTERVAL_SEC 30

// Calendar
#define DAYS_PER_WEEK 7
#define SECONDS_PER_DAY 86400UL

// Scheduler fallback window (16:00 - 22:00)
#define DEFAULT_WINDOW_START_SEC (16UL * 3600UL)
#define DEFAULT_WINDOW_END_SEC (22UL * 3600UL)

// Logging
#define LOG_LINE_LENGTH 150

// --- Clock Structs ---

// Local wall-clock reading. weekday: 0 = Monday .. 6 = Sunday.
struct WallClock {
  uint8_t weekday;
  uint32_t secondsOfDay;
};

// --- Configuration Structs ---
struct ScheduleConfig {
  bool enabled;
  bool activeDays[DAYS_PER_WEEK]; // Mon..Sun
  uint32_t startTimeOfDay;        // seconds since midnight
  uint32_t endTimeOfDay;          // seconds since midnight
};

struct RampConfig {
  bool enabled;
  uint32_t durationMinutes;
  double multiplier;
  std::vector<std::string> linkedParameters;
  bool endOnComplete;
};

// --- State Structs ---
struct SchedulerRuntimeState {
  bool autoStarted;
  bool manuallySuppressedThisWindow;
};

struct SessionProgress {
  uint32_t elapsedSeconds;
  uint32_t remainingSeconds;
  double percent;
};

struct DifficultyResult {
  DifficultyTier tier;
  uint32_t xp;
};

extern const char *sessionStateToString(SessionState s);
extern const char *eventTypeToString(TimelineEventType t);
extern const char *difficultyToString(DifficultyTier d);
extern const char *weekdayToString(uint8_t weekday);
