/*
 * =================================================================================
 * File:      lib/SessionEngine/SessionRules.h
 * Description: Interface for "Game Logic" policies. Decouples the reward math
 * (difficulty tier, XP award) from the Session State Machine.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "Timeline.h"

class ISessionRules {
public:
    virtual ~ISessionRules() {}

    /**
     * Rates a timeline.
     * Responsibility: Must be a pure function of the model. The same model always
     * yields the same result, and XP never decreases when the duration or the
     * number of distinct features grows.
     */
    virtual DifficultyResult calculateDifficulty(const TimelineModel& model) const = 0;
};
