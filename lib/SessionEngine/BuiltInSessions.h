/*
 * =================================================================================
 * File:      lib/SessionEngine/BuiltInSessions.h
 * Description: Factory for the session scripts that ship with the application.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "Timeline.h"

class BuiltInSessions {
public:
    // 30 min passive session. Ambient features from the start,
    // pink filter from minute 10, two bubble bursts.
    static TimelineModel morningDrift();

    // 5 min demo exercising overlapping pairs.
    static TimelineModel quickSpark();

    static std::vector<TimelineModel> all();

    /**
     * Copies the built-in session with the given id into 'out'.
     * @return false (out untouched) for an unknown id.
     */
    static bool findById(const std::string& id, TimelineModel& out);
};
