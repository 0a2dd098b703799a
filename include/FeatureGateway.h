/*
 * =================================================================================
 * File:      include/FeatureGateway.h
 * Description: Host feature gateway and parameter store. The host has no
 * renderer; switching a feature or writing a parameter records the new state
 * and logs it.
 * =================================================================================
 */
#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

#include "ConfigValidators.h"
#include "SessionContext.h"

class HostSessionHAL;

class ConsoleFeatureGateway : public IFeatureGateway {
public:
  explicit ConsoleFeatureGateway(HostSessionHAL &hal);

  // Only registered ids can be switched
  void registerFeature(const std::string &featureId);
  bool isRegistered(const std::string &featureId) const;

  bool enableFeature(const std::string &featureId) override;
  bool disableFeature(const std::string &featureId) override;
  bool isFeatureEnabled(const std::string &featureId) const override;

  std::vector<std::string> getEnabledFeatures() const;

private:
  HostSessionHAL &_hal;
  std::set<std::string> _registered;
  std::set<std::string> _enabled;

  bool setEnabled(const std::string &featureId, bool enabled);
};

class MemoryParameterStore : public IParameterStore {
public:
  explicit MemoryParameterStore(HostSessionHAL &hal);

  void load(const std::vector<ParameterSetting> &settings);

  double getParameter(const std::string &name) const override;
  void setParameter(const std::string &name, double value) override;
  double getParameterCeiling(const std::string &name) const override;

  const std::map<std::string, double> &getValues() const { return _values; }

private:
  HostSessionHAL &_hal;
  std::map<std::string, double> _values;
  std::map<std::string, double> _ceilings;
};
