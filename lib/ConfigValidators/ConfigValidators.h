#pragma once
#include <ArduinoJson.h>
#include <string.h>
#include <string>
#include <vector>

#include "Types.h"
#include "StandardRules.h"

// Ramp ranges accepted from the settings file
#define RAMP_MIN_DURATION_MIN 10
#define RAMP_MAX_DURATION_MIN 180
#define RAMP_DEFAULT_DURATION_MIN 60
#define RAMP_MIN_MULTIPLIER 1.0
#define RAMP_MAX_MULTIPLIER 3.0
#define RAMP_DEFAULT_MULTIPLIER 1.0

struct ParameterSetting {
    std::string name;
    double value;
    double ceiling;
};

struct AppSettings {
    ScheduleConfig schedule;
    RampConfig ramp;
    std::vector<ParameterSetting> parameters;
    std::vector<std::string> defaultFeatures;
    std::vector<FeatureWeight> featureWeights;
};

/**
 * Settings file parsing.
 *
 * Every parser works on an in/out struct that already holds defaults: keys that
 * are missing keep their current value. A false return means part of the input
 * was rejected or corrected; the reason is in errorMsg and the output is still
 * usable.
 */
class ConfigValidators {
public:
    // "scheduler": { enabled, activeDays: ["Mon", ...], startTime: "HH:MM", endTime: "HH:MM" }
    // An unparsable startTime falls back to 16:00, an unparsable endTime to 22:00.
    static bool parseScheduleConfig(JsonVariantConst json, ScheduleConfig& ioConfig, std::string& errorMsg);

    // "ramp": { enabled, durationMinutes, multiplier, linkedParameters: [...], endOnComplete }
    static bool parseRampConfig(JsonVariantConst json, RampConfig& ioConfig, std::string& errorMsg);

    // "parameters": { "<name>": <value> | { "value": v, "ceiling": c } }
    // Known names are updated in place, new names are appended.
    static bool parseParameters(JsonVariantConst json, std::vector<ParameterSetting>& ioParams, std::string& errorMsg);

    // "defaultFeatures": [ "<featureId>", ... ]
    static bool parseFeatureList(JsonVariantConst json, std::vector<std::string>& ioFeatures, std::string& errorMsg);

    // "session": { "featureWeights": { "<featureId>": { "xp": n, "weight": n } } }
    static bool parseFeatureWeights(JsonVariantConst json, std::vector<FeatureWeight>& ioWeights, std::string& errorMsg);

    // Whole settings document. A syntax error leaves ioSettings untouched.
    static bool parseSettings(const char* jsonText, AppSettings& ioSettings, std::string& errorMsg);

    // Weekday abbreviation ("Mon".."Sun", case-insensitive) to index 0..6, or -1.
    static int parseWeekday(const char* name);
};
