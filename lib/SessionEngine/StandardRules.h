/* =================================================================================
 * File:      lib/SessionEngine/StandardRules.h
 * =================================================================================
 */
#pragma once
#include "SessionRules.h"
#include <string>
#include <vector>

struct FeatureWeight {
    std::string featureId;
    uint32_t xpBonus;
    uint32_t difficultyWeight;
};

// Weight used for feature ids missing from the table
#define FALLBACK_FEATURE_XP 10
#define FALLBACK_FEATURE_WEIGHT 0

// Rates
#define XP_PER_MINUTE 2
#define DIFFICULTY_MINUTES_PER_POINT 30

static inline std::vector<FeatureWeight> defaultFeatureWeights() {
    std::vector<FeatureWeight> table;
    table.push_back({"audio_whispers", 20, 0});
    table.push_back({"mind_wipe", 50, 1});
    table.push_back({"flash", 50, 1});
    table.push_back({"mandatory_videos", 100, 2});
    table.push_back({"subliminal", 30, 0});
    table.push_back({"bouncing_text", 20, 0});
    table.push_back({"pink_filter", 40, 0});
    table.push_back({"spiral", 50, 1});
    table.push_back({"brain_drain", 80, 2});
    table.push_back({"bubbles", 30, 0});
    table.push_back({"lock_cards", 60, 1});
    table.push_back({"bubble_count", 40, 0});
    table.push_back({"corner_gif", 10, 0});
    return table;
}

class StandardRules : public ISessionRules {
public:
    StandardRules() : _weights(defaultFeatureWeights()) {}
    explicit StandardRules(const std::vector<FeatureWeight>& weights) : _weights(weights) {}

    DifficultyResult calculateDifficulty(const TimelineModel& model) const override {
        // A. Sum weights over DISTINCT features (re-using a feature adds nothing)
        uint64_t bonusSum = 0;
        uint32_t weightSum = 0;
        std::vector<std::string> features = model.getFeatureIds();
        for (size_t i = 0; i < features.size(); i++) {
            FeatureWeight w = lookup(features[i]);
            bonusSum += w.xpBonus;
            weightSum += w.difficultyWeight;
        }

        // B. Tier from feature weights plus length
        uint32_t duration = model.getDurationMinutes();
        uint32_t score = weightSum + duration / DIFFICULTY_MINUTES_PER_POINT;

        DifficultyResult result;
        if (score < 2) result.tier = DIFFICULTY_EASY;
        else if (score < 4) result.tier = DIFFICULTY_MEDIUM;
        else if (score < 6) result.tier = DIFFICULTY_HARD;
        else result.tier = DIFFICULTY_EXTREME;

        // C. XP. Tier bonus is +25% per step.
        // 64-bit so long sessions saturate instead of wrapping
        uint64_t baseXp = (uint64_t)duration * XP_PER_MINUTE + bonusSum;
        uint64_t xp = baseXp * (100 + 25 * (uint64_t)result.tier) / 100;
        result.xp = xp > UINT32_MAX ? UINT32_MAX : (uint32_t)xp;
        return result;
    }

private:
    std::vector<FeatureWeight> _weights;

    FeatureWeight lookup(const std::string& featureId) const {
        for (size_t i = 0; i < _weights.size(); i++) {
            if (_weights[i].featureId == featureId) return _weights[i];
        }
        FeatureWeight fallback = {featureId, FALLBACK_FEATURE_XP, FALLBACK_FEATURE_WEIGHT};
        return fallback;
    }
};
