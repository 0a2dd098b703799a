/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of settings file loading and validation.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Config.h"
#include "HostSessionHAL.h" // For logging
#include <stdio.h>
#include <fstream>
#include <sstream>

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { HostSessionHAL::getInstance().logKeyValue(key, val); }

bool SettingsManager::readFile(const char *path, std::string &outText) {
  std::ifstream in(path);
  if (!in.is_open()) return false;

  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return false;

  outText = ss.str();
  return true;
}

bool SettingsManager::load(const char *path, AppSettings &outSettings) {
  outSettings = defaultAppSettings();

  char logBuf[LOG_LINE_LENGTH];
  std::string text;

  if (!readFile(path, text)) {
    snprintf(logBuf, sizeof(logBuf), "'%s' not found. Using defaults.", path);
    log("Settings", logBuf);
    return true;
  }

  std::string errorMsg;
  bool ok = ConfigValidators::parseSettings(text.c_str(), outSettings, errorMsg);
  if (!ok) {
    snprintf(logBuf, sizeof(logBuf), "Warning in '%s':", path);
    log("Settings", logBuf);
    // Long messages are split across lines
    const size_t chunk = LOG_LINE_LENGTH - 20;
    for (size_t pos = 0; pos < errorMsg.size(); pos += chunk) {
      log("Settings", errorMsg.substr(pos, chunk).c_str());
    }
  } else {
    snprintf(logBuf, sizeof(logBuf), "Loaded '%s'", path);
    log("Settings", logBuf);
  }
  return ok;
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void SettingsManager::printStartupDiagnostics(const AppSettings &s) {
  HostSessionHAL &hal = HostSessionHAL::getInstance();
  char logBuf[128];

  hal.log("[ RAMP ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Enabled", s.ramp.enabled ? "YES" : "NO");
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : x%.2f over %u min", "Target", s.ramp.multiplier, s.ramp.durationMinutes);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Linked Parameters", (unsigned)s.ramp.linkedParameters.size());
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "End On Complete", s.ramp.endOnComplete ? "YES" : "NO");
  hal.log(logBuf);

  hal.log("");
  hal.log("[ PARAMETERS ]");
  for (size_t i = 0; i < s.parameters.size(); i++) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f (max %.1f)", s.parameters[i].name.c_str(), s.parameters[i].value,
             s.parameters[i].ceiling);
    hal.log(logBuf);
  }

  hal.log("");
  hal.log("[ DEFAULT MODE ]");
  std::string features;
  for (size_t i = 0; i < s.defaultFeatures.size(); i++) {
    if (i > 0) features += ", ";
    features += s.defaultFeatures[i];
  }
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Features", features.empty() ? "(none)" : features.c_str());
  hal.log(logBuf);
}
