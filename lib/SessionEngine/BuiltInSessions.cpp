/*
 * =================================================================================
 * File:      lib/SessionEngine/BuiltInSessions.cpp
 * =================================================================================
 */
#include "BuiltInSessions.h"

TimelineModel BuiltInSessions::morningDrift() {
    TimelineModel m("morning_drift", "Morning Drift", 30);
    m.setDescription("Gentle background session for a morning routine. No interruptions.");

    // Settling in (0 - 10)
    m.addStart("audio_whispers", 0);
    m.addStart("subliminal", 0);
    m.addStart("bouncing_text", 0);
    m.addStart("flash", 0);

    // Pink filter fades in from 10 and stays on
    m.addStart("pink_filter", 10);

    // Drifting: intermittent bubble bursts
    std::string burst = m.addStart("bubbles", 15);
    m.addStop(burst, 18);
    burst = m.addStart("bubbles", 23);
    m.addStop(burst, 26);

    // Corner GIF for the last stretch, off before the end
    std::string gif = m.addStart("corner_gif", 20);
    m.addStop(gif, 28);

    m.addPhrase("bouncing_text", "Breathe");
    m.addPhrase("bouncing_text", "Relax");
    m.addPhrase("bouncing_text", "Drift");
    return m;
}

TimelineModel BuiltInSessions::quickSpark() {
    TimelineModel m("quick_spark", "Quick Spark", 5);
    m.setDescription("Short demo session.");

    std::string flash = m.addStart("flash", 0);
    m.addStop(flash, 3);

    std::string spiral = m.addStart("spiral", 1);
    m.addStop(spiral, 4);

    m.addStart("audio_whispers", 0);
    return m;
}

std::vector<TimelineModel> BuiltInSessions::all() {
    std::vector<TimelineModel> sessions;
    sessions.push_back(morningDrift());
    sessions.push_back(quickSpark());
    return sessions;
}

bool BuiltInSessions::findById(const std::string& id, TimelineModel& out) {
    std::vector<TimelineModel> sessions = all();
    for (size_t i = 0; i < sessions.size(); i++) {
        if (sessions[i].getId() == id) {
            out = sessions[i];
            return true;
        }
    }
    return false;
}
