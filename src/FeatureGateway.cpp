/*
 * =================================================================================
 * File:      src/FeatureGateway.cpp
 * =================================================================================
 */
#include "FeatureGateway.h"
#include <stdio.h>
#include <limits>

#include "HostSessionHAL.h"

// =================================================================================
// SECTION: FEATURES
// =================================================================================

ConsoleFeatureGateway::ConsoleFeatureGateway(HostSessionHAL &hal) : _hal(hal) {}

void ConsoleFeatureGateway::registerFeature(const std::string &featureId) { _registered.insert(featureId); }

bool ConsoleFeatureGateway::isRegistered(const std::string &featureId) const {
  return _registered.find(featureId) != _registered.end();
}

bool ConsoleFeatureGateway::setEnabled(const std::string &featureId, bool enabled) {
  char logBuf[LOG_LINE_LENGTH];

  if (!isRegistered(featureId)) {
    snprintf(logBuf, sizeof(logBuf), "Unknown feature '%s'", featureId.c_str());
    _hal.logKeyValue("Feature", logBuf);
    return false;
  }

  bool wasEnabled = isFeatureEnabled(featureId);
  if (wasEnabled == enabled) return true;

  if (enabled) {
    _enabled.insert(featureId);
  } else {
    _enabled.erase(featureId);
  }

  snprintf(logBuf, sizeof(logBuf), "%s -> %s", featureId.c_str(), enabled ? "ON" : "OFF");
  _hal.logKeyValue("Feature", logBuf);
  return true;
}

bool ConsoleFeatureGateway::enableFeature(const std::string &featureId) { return setEnabled(featureId, true); }

bool ConsoleFeatureGateway::disableFeature(const std::string &featureId) { return setEnabled(featureId, false); }

bool ConsoleFeatureGateway::isFeatureEnabled(const std::string &featureId) const {
  return _enabled.find(featureId) != _enabled.end();
}

std::vector<std::string> ConsoleFeatureGateway::getEnabledFeatures() const {
  return std::vector<std::string>(_enabled.begin(), _enabled.end());
}

// =================================================================================
// SECTION: PARAMETERS
// =================================================================================

MemoryParameterStore::MemoryParameterStore(HostSessionHAL &hal) : _hal(hal) {}

void MemoryParameterStore::load(const std::vector<ParameterSetting> &settings) {
  for (size_t i = 0; i < settings.size(); i++) {
    _values[settings[i].name] = settings[i].value;
    _ceilings[settings[i].name] = settings[i].ceiling;
  }
}

double MemoryParameterStore::getParameter(const std::string &name) const {
  std::map<std::string, double>::const_iterator it = _values.find(name);
  return it != _values.end() ? it->second : 0.0;
}

void MemoryParameterStore::setParameter(const std::string &name, double value) {
  std::map<std::string, double>::iterator it = _values.find(name);
  if (it != _values.end() && it->second == value) return;

  _values[name] = value;

  char logBuf[LOG_LINE_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "%s = %.2f", name.c_str(), value);
  _hal.logKeyValue("Param", logBuf);
}

double MemoryParameterStore::getParameterCeiling(const std::string &name) const {
  std::map<std::string, double>::const_iterator it = _ceilings.find(name);
  // No ceiling configured: uncapped
  return it != _ceilings.end() ? it->second : std::numeric_limits<double>::max();
}
