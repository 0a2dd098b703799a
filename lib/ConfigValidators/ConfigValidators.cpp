#include "ConfigValidators.h"
#include "TimeUtils.h"
#include <strings.h>

// Ceiling given to parameters that only exist in the settings file
#define PARAMETER_DEFAULT_CEILING 100.0

static void appendError(std::string& errorMsg, const std::string& message) {
    if (!errorMsg.empty()) errorMsg += " ";
    errorMsg += message;
}

int ConfigValidators::parseWeekday(const char* name) {
    static const char* names[DAYS_PER_WEEK] = { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
    if (!name) return -1;
    for (int i = 0; i < DAYS_PER_WEEK; i++) {
        if (strcasecmp(name, names[i]) == 0) return i;
    }
    return -1;
}

bool ConfigValidators::parseScheduleConfig(JsonVariantConst json, ScheduleConfig& ioConfig, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "scheduler must be an object.";
        return false;
    }

    bool ok = true;

    // 1. Flag
    ioConfig.enabled = json["enabled"] | ioConfig.enabled;

    // 2. Days (list replaces the current set)
    JsonVariantConst days = json["activeDays"];
    if (days.is<JsonArrayConst>()) {
        bool active[DAYS_PER_WEEK] = { false, false, false, false, false, false, false };
        for (JsonVariantConst v : days.as<JsonArrayConst>()) {
            int d = v.is<const char*>() ? parseWeekday(v.as<const char*>()) : -1;
            if (d < 0) {
                appendError(errorMsg, "Unknown weekday in activeDays.");
                ok = false;
                continue;
            }
            active[d] = true;
        }
        memcpy(ioConfig.activeDays, active, sizeof(active));
    } else if (!days.isNull()) {
        appendError(errorMsg, "activeDays must be an array.");
        ok = false;
    }

    // 3. Window. Each end falls back on its own.
    uint32_t start = ioConfig.startTimeOfDay;
    uint32_t end = ioConfig.endTimeOfDay;

    JsonVariantConst startVal = json["startTime"];
    if (!startVal.isNull()) {
        const char* text = startVal.is<const char*>() ? startVal.as<const char*>() : nullptr;
        if (!TimeUtils::parseTimeOfDay(text, start)) {
            start = DEFAULT_WINDOW_START_SEC;
            appendError(errorMsg, "Invalid startTime. Using 16:00.");
            ok = false;
        }
    }
    JsonVariantConst endVal = json["endTime"];
    if (!endVal.isNull()) {
        const char* text = endVal.is<const char*>() ? endVal.as<const char*>() : nullptr;
        if (!TimeUtils::parseTimeOfDay(text, end)) {
            end = DEFAULT_WINDOW_END_SEC;
            appendError(errorMsg, "Invalid endTime. Using 22:00.");
            ok = false;
        }
    }

    ioConfig.startTimeOfDay = start;
    ioConfig.endTimeOfDay = end;
    return ok;
}

bool ConfigValidators::parseRampConfig(JsonVariantConst json, RampConfig& ioConfig, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "ramp must be an object.";
        return false;
    }

    bool ok = true;

    // 1. Booleans
    ioConfig.enabled = json["enabled"] | ioConfig.enabled;
    ioConfig.endOnComplete = json["endOnComplete"] | ioConfig.endOnComplete;

    // 2. Duration, clamped to [10, 180]
    JsonVariantConst dur = json["durationMinutes"];
    if (!dur.isNull()) {
        if (!dur.is<long>()) {
            appendError(errorMsg, "durationMinutes must be an integer.");
            ioConfig.durationMinutes = RAMP_DEFAULT_DURATION_MIN;
            ok = false;
        } else {
            long minutes = dur.as<long>();
            if (minutes < RAMP_MIN_DURATION_MIN || minutes > RAMP_MAX_DURATION_MIN) {
                minutes = minutes < RAMP_MIN_DURATION_MIN ? RAMP_MIN_DURATION_MIN : RAMP_MAX_DURATION_MIN;
                appendError(errorMsg, "durationMinutes out of range (10-180), clamped to " + std::to_string(minutes) + ".");
                ok = false;
            }
            ioConfig.durationMinutes = (uint32_t)minutes;
        }
    }

    // 3. Multiplier, clamped to [1.0, 3.0]
    JsonVariantConst mult = json["multiplier"];
    if (!mult.isNull()) {
        if (!mult.is<double>()) {
            appendError(errorMsg, "multiplier must be a number.");
            ioConfig.multiplier = RAMP_DEFAULT_MULTIPLIER;
            ok = false;
        } else {
            double m = mult.as<double>();
            if (m < RAMP_MIN_MULTIPLIER) {
                m = RAMP_MIN_MULTIPLIER;
                appendError(errorMsg, "multiplier below 1.0, clamped.");
                ok = false;
            } else if (m > RAMP_MAX_MULTIPLIER) {
                m = RAMP_MAX_MULTIPLIER;
                appendError(errorMsg, "multiplier above 3.0, clamped.");
                ok = false;
            }
            ioConfig.multiplier = m;
        }
    }

    // 4. Linked parameters (list replaces the current set)
    JsonVariantConst linked = json["linkedParameters"];
    if (linked.is<JsonArrayConst>()) {
        ioConfig.linkedParameters.clear();
        for (JsonVariantConst v : linked.as<JsonArrayConst>()) {
            if (!v.is<const char*>() || strlen(v.as<const char*>()) == 0) {
                appendError(errorMsg, "linkedParameters entries must be non-empty strings.");
                ok = false;
                continue;
            }
            ioConfig.linkedParameters.push_back(v.as<const char*>());
        }
    } else if (!linked.isNull()) {
        appendError(errorMsg, "linkedParameters must be an array.");
        ok = false;
    }

    return ok;
}

bool ConfigValidators::parseParameters(JsonVariantConst json, std::vector<ParameterSetting>& ioParams, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "parameters must be an object.";
        return false;
    }

    bool ok = true;

    for (JsonPairConst kv : json.as<JsonObjectConst>()) {
        std::string name = kv.key().c_str();

        ParameterSetting* existing = nullptr;
        for (size_t i = 0; i < ioParams.size(); i++) {
            if (ioParams[i].name == name) {
                existing = &ioParams[i];
                break;
            }
        }

        ParameterSetting entry;
        entry.name = name;
        entry.value = existing ? existing->value : 0.0;
        entry.ceiling = existing ? existing->ceiling : PARAMETER_DEFAULT_CEILING;

        JsonVariantConst v = kv.value();
        if (v.is<double>()) {
            entry.value = v.as<double>();
        } else if (v.is<JsonObjectConst>()) {
            entry.value = v["value"] | entry.value;
            entry.ceiling = v["ceiling"] | entry.ceiling;
        } else {
            appendError(errorMsg, "Parameter '" + name + "' must be a number or object.");
            ok = false;
            continue;
        }

        if (entry.value < 0.0 || entry.ceiling <= 0.0) {
            appendError(errorMsg, "Parameter '" + name + "' has a negative value or non-positive ceiling.");
            ok = false;
            continue;
        }
        if (entry.value > entry.ceiling) {
            entry.value = entry.ceiling;
            appendError(errorMsg, "Parameter '" + name + "' above its ceiling, clamped.");
            ok = false;
        }

        if (existing) {
            *existing = entry;
        } else {
            ioParams.push_back(entry);
        }
    }
    return ok;
}

bool ConfigValidators::parseFeatureList(JsonVariantConst json, std::vector<std::string>& ioFeatures, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonArrayConst>()) {
        errorMsg = "defaultFeatures must be an array.";
        return false;
    }

    bool ok = true;
    ioFeatures.clear();
    for (JsonVariantConst v : json.as<JsonArrayConst>()) {
        if (!v.is<const char*>() || strlen(v.as<const char*>()) == 0) {
            appendError(errorMsg, "defaultFeatures entries must be non-empty strings.");
            ok = false;
            continue;
        }
        std::string id = v.as<const char*>();
        bool duplicate = false;
        for (size_t i = 0; i < ioFeatures.size(); i++) {
            if (ioFeatures[i] == id) duplicate = true;
        }
        if (!duplicate) ioFeatures.push_back(id);
    }
    return ok;
}

bool ConfigValidators::parseFeatureWeights(JsonVariantConst json, std::vector<FeatureWeight>& ioWeights, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "session must be an object.";
        return false;
    }

    JsonVariantConst weights = json["featureWeights"];
    if (weights.isNull()) return true;
    if (!weights.is<JsonObjectConst>()) {
        errorMsg = "featureWeights must be an object.";
        return false;
    }

    bool ok = true;
    for (JsonPairConst kv : weights.as<JsonObjectConst>()) {
        std::string id = kv.key().c_str();
        JsonVariantConst v = kv.value();

        if (!v.is<JsonObjectConst>() ||
            (!v["xp"].isNull() && !v["xp"].is<uint32_t>()) ||
            (!v["weight"].isNull() && !v["weight"].is<uint32_t>())) {
            appendError(errorMsg, "Weight for '" + id + "' must be { xp, weight } with non-negative integers.");
            ok = false;
            continue;
        }

        FeatureWeight* existing = nullptr;
        for (size_t i = 0; i < ioWeights.size(); i++) {
            if (ioWeights[i].featureId == id) {
                existing = &ioWeights[i];
                break;
            }
        }

        FeatureWeight entry;
        entry.featureId = id;
        entry.xpBonus = v["xp"] | (existing ? existing->xpBonus : (uint32_t)FALLBACK_FEATURE_XP);
        entry.difficultyWeight = v["weight"] | (existing ? existing->difficultyWeight : (uint32_t)FALLBACK_FEATURE_WEIGHT);

        if (existing) {
            *existing = entry;
        } else {
            ioWeights.push_back(entry);
        }
    }
    return ok;
}

bool ConfigValidators::parseSettings(const char* jsonText, AppSettings& ioSettings, std::string& errorMsg) {
    if (!jsonText) {
        errorMsg = "No settings text.";
        return false;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, jsonText);
    if (err) {
        errorMsg = std::string("JSON parse error: ") + err.c_str();
        return false;
    }

    JsonVariantConst root = doc.as<JsonVariantConst>();
    if (!root.is<JsonObjectConst>()) {
        errorMsg = "Settings root must be an object.";
        return false;
    }

    AppSettings staged = ioSettings;
    bool ok = true;
    std::string sectionErr;

    if (!parseScheduleConfig(root["scheduler"], staged.schedule, sectionErr)) {
        appendError(errorMsg, "[scheduler] " + sectionErr);
        ok = false;
    }
    sectionErr.clear();
    if (!parseRampConfig(root["ramp"], staged.ramp, sectionErr)) {
        appendError(errorMsg, "[ramp] " + sectionErr);
        ok = false;
    }
    sectionErr.clear();
    if (!parseParameters(root["parameters"], staged.parameters, sectionErr)) {
        appendError(errorMsg, "[parameters] " + sectionErr);
        ok = false;
    }
    sectionErr.clear();
    if (!parseFeatureList(root["defaultFeatures"], staged.defaultFeatures, sectionErr)) {
        appendError(errorMsg, "[defaultFeatures] " + sectionErr);
        ok = false;
    }
    sectionErr.clear();
    if (!parseFeatureWeights(root["session"], staged.featureWeights, sectionErr)) {
        appendError(errorMsg, "[session] " + sectionErr);
        ok = false;
    }

    ioSettings = staged;
    return ok;
}
