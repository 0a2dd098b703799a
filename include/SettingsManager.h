/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for application configuration.
 * - Reads the JSON settings file from disk.
 * - Validates it via ConfigValidators on top of the Config.h defaults.
 * =================================================================================
 */
#pragma once
#include "ConfigValidators.h"
#include <string>

class SettingsManager {
public:
  /**
   * Loads settings, starting from defaultAppSettings().
   * A missing or unreadable file is not an error: defaults are used.
   * @return false if the file existed but was (partly) rejected.
   */
  static bool load(const char *path, AppSettings &outSettings);

  static void printStartupDiagnostics(const AppSettings &settings);

private:
  static bool readFile(const char *path, std::string &outText);
  static void log(const char *key, const char *value);
};
