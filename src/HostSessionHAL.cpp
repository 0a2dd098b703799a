/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      src/HostSessionHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Host platform layer. Monotonic milliseconds from steady_clock, weekday and
 * time of day from the local calendar, log lines into the Logger queue.
 * =================================================================================
 */
#include "HostSessionHAL.h"
#include <stdio.h>
#include <time.h>

#include "Config.h"
#include "Logger.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

HostSessionHAL::HostSessionHAL() : _bootTime(std::chrono::steady_clock::now()) {}

HostSessionHAL &HostSessionHAL::getInstance() {
  static HostSessionHAL instance;
  return instance;
}

bool HostSessionHAL::lockState(uint32_t timeoutMs) {
  return _stateMutex.try_lock_for(std::chrono::milliseconds(timeoutMs));
}

void HostSessionHAL::unlockState() { _stateMutex.unlock(); }

// =================================================================================
// SECTION: LOGGING
// =================================================================================

void HostSessionHAL::log(const char *message) { logMessage(message); }

void HostSessionHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[LOG_LINE_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  log(tempBuf);
}

// =================================================================================
// SECTION: CLOCK
// =================================================================================

unsigned long HostSessionHAL::getMillis() {
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - _bootTime)
      .count();
}

WallClock HostSessionHAL::getWallClock() {
  time_t now = time(nullptr);
  struct tm local;
  localtime_r(&now, &local);

  WallClock clock;
  // tm_wday: 0 = Sunday. WallClock: 0 = Monday.
  clock.weekday = (uint8_t)((local.tm_wday + 6) % 7);
  clock.secondsOfDay = (uint32_t)(local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec);
  return clock;
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void HostSessionHAL::printStartupDiagnostics() {
  char logBuf[128];
  char timeStr[16];

  log("==========================================================================");
  log("                             HOST DIAGNOSTICS                             ");
  log("==========================================================================");

  log("[ CLOCK ]");
  WallClock clock = getWallClock();
  TimeUtils::formatTimeOfDay(clock.secondsOfDay, timeStr, sizeof(timeStr));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s %s", "Local Time", weekdayToString(clock.weekday), timeStr);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d ms", "Master Tick", MASTER_TICK_MS);
  log(logBuf);

  log("");
  log("[ FEATURES ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Registered", (unsigned)REGISTERED_FEATURE_COUNT);
  log(logBuf);
}
