/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      main.cpp
 * Description: Application entry point.
 * Wires the host collaborators into the engine, then runs the single-threaded
 * event loop fed by a 1-second ticker thread and a console reader thread.
 * =================================================================================
 */

#include <signal.h>
#include <stdio.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// --- Module Includes ---
#include "Config.h"
#include "EngineController.h"
#include "FeatureGateway.h"
#include "HostSessionHAL.h"
#include "Logger.h"
#include "SettingsManager.h"

// --- Session Engine Includes ---
#include "BuiltInSessions.h"
#include "IntensityRamp.h"
#include "Scheduler.h"
#include "Session.h"
#include "StandardRules.h"

// --- Main ticker ---
static uint32_t tickCounter = 0;
static std::mutex timerMux;

// --- Console input ---
static std::deque<std::string> commandQueue;
static std::mutex commandMux;

static std::atomic<bool> running(true);

// --- Dependencies ---
static HostSessionHAL &hal = HostSessionHAL::getInstance();

static void handleSignal(int) { running = false; }

/**
 * Prints high-level application identity and build information.
 */
static void printAppDiagnostics() {
  char logBuf[128];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                          APPLICATION IDENTITY                            ");
  hal.log(LOG_SEP_MAJOR);

  hal.log("[ VERSION INFO ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Application", APP_NAME);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", APP_VERSION);
  hal.log(logBuf);

  hal.log("");
  hal.log("[ BUILD DETAILS ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
  hal.log(logBuf);

  hal.log(LOG_SEP_MAJOR);
}

static void printHelp() {
  hal.log("Commands: start | start <sessionId> | stop | status | list | quit");
}

static void listSessions() {
  std::vector<TimelineModel> sessions = BuiltInSessions::all();
  char logBuf[LOG_LINE_LENGTH];
  for (size_t i = 0; i < sessions.size(); i++) {
    snprintf(logBuf, sizeof(logBuf), " %-16s : %s (%u min)", sessions[i].getId().c_str(), sessions[i].getName().c_str(),
             sessions[i].getDurationMinutes());
    hal.log(logBuf);
  }
}

/**
 * Host side of 'status': what the gateway and store currently hold, plus the
 * tail of the log ring.
 */
static void printHostStatus(const ConsoleFeatureGateway &features, const MemoryParameterStore &parameters) {
  char logBuf[LOG_LINE_LENGTH];

  std::vector<std::string> enabled = features.getEnabledFeatures();
  std::string list;
  for (size_t i = 0; i < enabled.size(); i++) {
    if (!list.empty()) list += ", ";
    list += enabled[i];
  }
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Enabled Features", list.empty() ? "(none)" : list.c_str());
  hal.log(logBuf);

  const std::map<std::string, double> &values = parameters.getValues();
  for (std::map<std::string, double>::const_iterator it = values.begin(); it != values.end(); ++it) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f / %.1f", it->first.c_str(), it->second,
             parameters.getParameterCeiling(it->first));
    hal.log(logBuf);
  }

  // Copy first: logging below appends to the same ring
  std::vector<std::string> recent = getRecentLogs(STATUS_RECENT_LOG_LINES);
  hal.log("[ RECENT LOG ]");
  for (size_t i = 0; i < recent.size(); i++) {
    snprintf(logBuf, sizeof(logBuf), "  | %s", recent[i].c_str());
    hal.log(logBuf);
  }
  hal.log(LOG_SEP_MINOR);
}

static void readConsole() {
  std::string line;
  while (running && std::getline(std::cin, line)) {
    std::lock_guard<std::mutex> lock(commandMux);
    commandQueue.push_back(line);
  }
}

static void executeCommand(const std::string &line, EngineController &engine, Scheduler &scheduler,
                           const ConsoleFeatureGateway &features, const MemoryParameterStore &parameters) {
  std::string cmd = line;
  std::string arg;
  size_t space = line.find(' ');
  if (space != std::string::npos) {
    cmd = line.substr(0, space);
    arg = line.substr(space + 1);
    while (!arg.empty() && arg[0] == ' ') arg.erase(0, 1);
  }

  if (cmd.empty()) return;

  if (cmd == "start") {
    bool started = false;
    if (arg.empty()) {
      started = engine.requestStart(nullptr);
    } else {
      TimelineModel model;
      if (!BuiltInSessions::findById(arg, model)) {
        hal.logKeyValue("Console", ("Unknown session: " + arg).c_str());
        return;
      }
      started = engine.requestStart(&model);
    }
    if (started) scheduler.onManualStart();
  } else if (cmd == "stop") {
    engine.requestStop();
    scheduler.onManualStop();
  } else if (cmd == "status") {
    engine.printStatus();
    printHostStatus(features, parameters);
  } else if (cmd == "list") {
    listSessions();
  } else if (cmd == "quit" || cmd == "exit") {
    running = false;
  } else {
    hal.logKeyValue("Console", ("Unknown command: " + cmd).c_str());
    printHelp();
  }
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  signal(SIGINT, handleSignal);
  signal(SIGTERM, handleSignal);

  // 1. Identity
  printAppDiagnostics();
  processLogQueue();

  // 2. Load Settings
  const char *settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;
  AppSettings settings;
  SettingsManager::load(settingsPath, settings);

  // 3. Host Collaborators
  ConsoleFeatureGateway features(hal);
  for (size_t i = 0; i < REGISTERED_FEATURE_COUNT; i++) {
    features.registerFeature(REGISTERED_FEATURES[i]);
  }
  MemoryParameterStore parameters(hal);
  parameters.load(settings.parameters);

  // 4. Initialize Engine
  StandardRules rules(settings.featureWeights);
  SessionEngine sessionEngine(hal, features, rules);

  EngineController engine(hal, sessionEngine, features);
  engine.setRampConfig(settings.ramp);
  engine.setDefaultFeatures(settings.defaultFeatures);
  sessionEngine.setListener(&engine);

  IntensityRamp ramp(hal, parameters, engine);
  engine.attachRamp(&ramp);

  Scheduler scheduler(hal, engine, settings.schedule);

  // 5. Diagnostics
  hal.printStartupDiagnostics();
  processLogQueue();

  SettingsManager::printStartupDiagnostics(settings);
  scheduler.printStartupDiagnostics();
  processLogQueue();

  sessionEngine.printStartupDiagnostics();
  hal.log(LOG_SEP_MAJOR);
  printHelp();
  processLogQueue();

  // 6. Startup scheduler check (don't wait 30s for the first window test)
  scheduler.tick();

  // 7. Start Master Timer
  hal.logKeyValue("Session", "Attaching master 1-second ticker.");
  std::thread ticker([]() {
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(MASTER_TICK_MS));
      std::lock_guard<std::mutex> lock(timerMux);
      tickCounter++;
    }
  });

  // 8. Console (blocks in getline, never joined)
  std::thread console(readConsole);
  console.detach();

  uint32_t totalTicks = 0;

  while (running) {
    // 1. Logging
    processLogQueue();

    // 2. Engine Ticks
    uint32_t pendingTicks = 0;
    {
      std::lock_guard<std::mutex> lock(timerMux);
      pendingTicks = tickCounter;
      tickCounter = 0;
    }

    if (pendingTicks > 0 && hal.lockState()) {
      while (pendingTicks > 0) {
        totalTicks++;

        sessionEngine.tick();
        engine.tick();

        if (totalTicks % RAMP_TICK_INTERVAL_SEC == 0) ramp.tick();
        if (totalTicks % SCHEDULER_TICK_INTERVAL_SEC == 0) scheduler.tick();

        pendingTicks--;
      }
      hal.unlockState();
    }

    // 3. Console Commands
    std::deque<std::string> commands;
    {
      std::lock_guard<std::mutex> lock(commandMux);
      commands.swap(commandQueue);
    }
    for (size_t i = 0; i < commands.size(); i++) {
      if (hal.lockState()) {
        executeCommand(commands[i], engine, scheduler, features, parameters);
        hal.unlockState();
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(MAIN_LOOP_IDLE_MS));
  }

  // Graceful shutdown: restore every baseline
  hal.logKeyValue("System", "Shutting down...");
  engine.requestStop();
  ticker.join();
  processLogQueue();
  return 0;
}
