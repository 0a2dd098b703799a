/*
 * File: test/MockSessionHAL.h
 * Description: "Spy" implementations of the engine collaborators for Native Unit Tests.
 * - MockSessionHAL: fake millisecond clock, settable wall clock, captured logs.
 * - MockFeatureGateway: records every call, can be told to fail per feature.
 * - MockParameterStore: plain map with per-parameter ceilings.
 * - MockEngineControl: counts start/stop requests.
 * - RecordingListener: records every SessionEngine notification.
 */
#pragma once
#include "SessionContext.h"
#include <map>
#include <set>
#include <string>
#include <vector>
#include <stdio.h>
#include <cstring>

class MockSessionHAL : public ISessionHAL {
public:
    // Simulation Variables
    unsigned long currentMillis = 1000;
    WallClock wallClock = { 0, 12 * 3600 }; // Monday 12:00
    std::vector<std::string> logs;

    // --- Helpers for Test Control ---

    void advanceTime(unsigned long ms) {
        currentMillis += ms;
    }

    void advanceMinutes(uint32_t minutes) {
        currentMillis += (unsigned long)minutes * 60000UL;
    }

    void setWallClock(uint8_t weekday, uint32_t hour, uint32_t minute) {
        wallClock.weekday = weekday;
        wallClock.secondsOfDay = hour * 3600 + minute * 60;
    }

    bool hasLogContaining(const char* fragment) const {
        for (size_t i = 0; i < logs.size(); i++) {
            if (logs[i].find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    // --- ISessionHAL Implementation ---

    void log(const char* message) override {
        logs.push_back(std::string(message));
    }

    unsigned long getMillis() override {
        return currentMillis;
    }

    WallClock getWallClock() override {
        return wallClock;
    }
};

class MockFeatureGateway : public IFeatureGateway {
public:
    struct Call {
        std::string featureId;
        bool enable;
    };

    std::set<std::string> enabled;
    std::set<std::string> failing; // enable/disable on these returns false
    std::vector<Call> calls;

    bool enableFeature(const std::string& featureId) override {
        calls.push_back({featureId, true});
        if (failing.count(featureId)) return false;
        enabled.insert(featureId);
        return true;
    }

    bool disableFeature(const std::string& featureId) override {
        calls.push_back({featureId, false});
        if (failing.count(featureId)) return false;
        enabled.erase(featureId);
        return true;
    }

    bool isFeatureEnabled(const std::string& featureId) const override {
        return enabled.count(featureId) > 0;
    }

    int countCalls(const std::string& featureId, bool enable) const {
        int n = 0;
        for (size_t i = 0; i < calls.size(); i++) {
            if (calls[i].featureId == featureId && calls[i].enable == enable) n++;
        }
        return n;
    }
};

class MockParameterStore : public IParameterStore {
public:
    std::map<std::string, double> values;
    std::map<std::string, double> ceilings;
    int writes = 0;

    void define(const std::string& name, double value, double ceiling) {
        values[name] = value;
        ceilings[name] = ceiling;
    }

    double getParameter(const std::string& name) const override {
        std::map<std::string, double>::const_iterator it = values.find(name);
        return it != values.end() ? it->second : 0.0;
    }

    void setParameter(const std::string& name, double value) override {
        values[name] = value;
        writes++;
    }

    double getParameterCeiling(const std::string& name) const override {
        std::map<std::string, double>::const_iterator it = ceilings.find(name);
        return it != ceilings.end() ? it->second : 1.0e9;
    }
};

class MockEngineControl : public IEngineControl {
public:
    bool running = false;
    bool rejectStarts = false;
    int startRequests = 0;
    int stopRequests = 0;
    const TimelineModel* lastModel = nullptr;

    bool requestStart(const TimelineModel* model) override {
        startRequests++;
        lastModel = model;
        if (rejectStarts) return false;
        running = true;
        return true;
    }

    void requestStop() override {
        stopRequests++;
        running = false;
    }

    bool isEngineRunning() const override {
        return running;
    }
};

class RecordingListener : public ISessionListener {
public:
    struct Phase {
        std::string featureId;
        TimelineEventType type;
        uint32_t minute;
    };

    int started = 0;
    int stopped = 0;
    int progressUpdates = 0;
    int completed = 0;
    int abandoned = 0;
    uint32_t lastXp = 0;
    uint32_t lastElapsed = 0;
    SessionProgress lastProgress = { 0, 0, 0.0 };
    std::vector<Phase> phases;

    void onSessionStarted(const TimelineModel& model) override { (void)model; started++; }
    void onSessionStopped() override { stopped++; }

    void onProgressUpdated(const SessionProgress& progress) override {
        progressUpdates++;
        lastProgress = progress;
    }

    void onPhaseChanged(const std::string& featureId, TimelineEventType type, uint32_t minute) override {
        phases.push_back({featureId, type, minute});
    }

    void onSessionCompleted(const TimelineModel& model, uint32_t elapsedSeconds, uint32_t xp) override {
        (void)model;
        completed++;
        lastXp = xp;
        lastElapsed = elapsedSeconds;
    }

    void onSessionAbandoned(const TimelineModel& model, uint32_t elapsedSeconds) override {
        (void)model;
        abandoned++;
        lastElapsed = elapsedSeconds;
    }
};
