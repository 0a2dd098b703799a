/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *sessionStateToString(SessionState s) {
  switch (s) {
  case SESSION_IDLE:
    return "IDLE";
  case SESSION_RUNNING:
    return "RUNNING";
  case SESSION_COMPLETED:
    return "COMPLETED";
  case SESSION_STOPPED_EARLY:
    return "STOPPED_EARLY";
  default:
    return "IDLE";
  }
}

const char *eventTypeToString(TimelineEventType t) {
  switch (t) {
  case EVENT_STOP:
    return "STOP";
  default:
    return "START";
  }
}

const char *difficultyToString(DifficultyTier d) {
  switch (d) {
  case DIFFICULTY_MEDIUM:
    return "Medium";
  case DIFFICULTY_HARD:
    return "Hard";
  case DIFFICULTY_EXTREME:
    return "Extreme";
  default:
    return "Easy";
  }
}

const char *weekdayToString(uint8_t weekday) {
  static const char *names[DAYS_PER_WEEK] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
  if (weekday >= DAYS_PER_WEEK) return "???";
  return names[weekday];
}
