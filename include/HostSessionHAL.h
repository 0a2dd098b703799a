/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      include/HostSessionHAL.h
 * Description: Header for the desktop host implementation of ISessionHAL.
 * Encapsulates the monotonic clock, local wall clock, and logging.
 * =================================================================================
 */
#pragma once

#include "SessionContext.h"
#include "Types.h"
#include <chrono>
#include <mutex>

class HostSessionHAL : public ISessionHAL {
private:
  HostSessionHAL();

  std::chrono::steady_clock::time_point _bootTime;

  // Guards engine state between the main loop and the ticker/console threads
  std::recursive_timed_mutex _stateMutex;

public:
  static HostSessionHAL &getInstance();

  // --- Thread Safety (Mutex Wrapper) ---
  // Returns true if lock acquired, false if timeout/busy
  bool lockState(uint32_t timeoutMs = 100);
  void unlockState();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();

  // --- ISessionHAL Implementation ---
  unsigned long getMillis() override;
  WallClock getWallClock() override;
};
