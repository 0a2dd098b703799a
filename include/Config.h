/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines host constants, the registered feature
 * set, parameter defaults and ceilings, and the defaults used when the settings
 * file is missing or incomplete.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "ConfigValidators.h"

// --- Application Name String ---
#define APP_NAME "PulsePanel"
#define APP_VERSION "1.0.0"

// =================================================================================
// SECTION: HOST & SYSTEM
// =================================================================================

#define DEFAULT_SETTINGS_PATH "pulsepanel.json"

// Master ticker period. Everything else is a multiple of this.
#define MASTER_TICK_MS 1000

// Main loop idle wait when no tick or command is pending
#define MAIN_LOOP_IDLE_MS 50

// Recent log lines echoed by the 'status' command
#define STATUS_RECENT_LOG_LINES 10

// =================================================================================
// SECTION: FEATURES
// =================================================================================

// Capabilities the host gateway accepts. Unknown ids fail enable/disable.
static const char* const REGISTERED_FEATURES[] = {
    "flash",
    "subliminal",
    "audio_whispers",
    "bouncing_text",
    "pink_filter",
    "spiral",
    "bubbles",
    "bubble_count",
    "mandatory_videos",
    "lock_cards",
    "mind_wipe",
    "brain_drain",
    "corner_gif"
};
static const size_t REGISTERED_FEATURE_COUNT = sizeof(REGISTERED_FEATURES) / sizeof(REGISTERED_FEATURES[0]);

// Enabled by a free-running (no timeline) engine start
static const char* const DEFAULT_ENGINE_FEATURES[] = { "flash", "subliminal" };

// =================================================================================
// SECTION: PARAMETERS
// =================================================================================

static const ParameterSetting DEFAULT_PARAMETERS[] = {
    // name                 value   ceiling
    { "FlashOpacity",       50.0,   100.0 },
    { "SpiralOpacity",      20.0,   50.0  },
    { "PinkFilterOpacity",  10.0,   50.0  },
    { "MasterVolume",       40.0,   100.0 },
    { "SubAudioVolume",     30.0,   100.0 }
};
static const size_t DEFAULT_PARAMETER_COUNT = sizeof(DEFAULT_PARAMETERS) / sizeof(DEFAULT_PARAMETERS[0]);

// =================================================================================
// SECTION: SETTINGS DEFAULTS
// =================================================================================

// Scheduler off; Mon-Fri 16:00 - 22:00 when switched on
#define DEFAULT_SCHEDULER_ENABLED false

// Ramp off; x1.0 over 60 min, flash opacity + volume linked
#define DEFAULT_RAMP_ENABLED false
#define DEFAULT_RAMP_END_ON_COMPLETE false
static const char* const DEFAULT_RAMP_LINKED[] = { "FlashOpacity", "MasterVolume" };

/**
 * Builds the settings used before (and underneath) the settings file.
 */
static inline AppSettings defaultAppSettings() {
    AppSettings s;

    s.schedule.enabled = DEFAULT_SCHEDULER_ENABLED;
    for (uint8_t d = 0; d < DAYS_PER_WEEK; d++) s.schedule.activeDays[d] = (d < 5);
    s.schedule.startTimeOfDay = DEFAULT_WINDOW_START_SEC;
    s.schedule.endTimeOfDay = DEFAULT_WINDOW_END_SEC;

    s.ramp.enabled = DEFAULT_RAMP_ENABLED;
    s.ramp.durationMinutes = RAMP_DEFAULT_DURATION_MIN;
    s.ramp.multiplier = RAMP_DEFAULT_MULTIPLIER;
    s.ramp.endOnComplete = DEFAULT_RAMP_END_ON_COMPLETE;
    for (size_t i = 0; i < sizeof(DEFAULT_RAMP_LINKED) / sizeof(DEFAULT_RAMP_LINKED[0]); i++) {
        s.ramp.linkedParameters.push_back(DEFAULT_RAMP_LINKED[i]);
    }

    for (size_t i = 0; i < DEFAULT_PARAMETER_COUNT; i++) {
        s.parameters.push_back(DEFAULT_PARAMETERS[i]);
    }

    for (size_t i = 0; i < sizeof(DEFAULT_ENGINE_FEATURES) / sizeof(DEFAULT_ENGINE_FEATURES[0]); i++) {
        s.defaultFeatures.push_back(DEFAULT_ENGINE_FEATURES[i]);
    }

    s.featureWeights = defaultFeatureWeights();
    return s;
}
