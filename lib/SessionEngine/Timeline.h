/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Timeline.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Data model of a session script: paired Start/Stop events per feature, anchored
 * to integer minute offsets inside [0, duration]. The model owns the editing
 * invariants (pairing, ordering, clamping). It holds no runtime state; the
 * SessionEngine plays a private copy of it.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <string>
#include <vector>

struct TimelineEvent {
  std::string id;
  std::string featureId;
  TimelineEventType type;
  uint32_t minute;
  // Start: id of its Stop (empty = runs to end). Stop: id of its Start.
  std::string pairedEventId;
};

struct PhrasePool {
  std::string name;
  std::vector<std::string> phrases;
};

class TimelineModel {
public:
  TimelineModel();
  TimelineModel(const std::string &id, const std::string &name, uint32_t durationMinutes);

  // --- Identity ---
  const std::string &getId() const { return _id; }
  const std::string &getName() const { return _name; }
  const std::string &getDescription() const { return _description; }
  void setName(const std::string &name) { _name = name; }
  void setDescription(const std::string &description) { _description = description; }

  // --- Duration ---
  uint32_t getDurationMinutes() const { return _durationMinutes; }

  // Clamps every event past the new end down onto it. Never deletes events.
  void setDuration(uint32_t minutes);

  // --- Editing ---

  /**
   * Adds an unpaired Start event. Minute is clamped to [0, duration].
   * @return The new event id.
   */
  std::string addStart(const std::string &featureId, uint32_t minute);

  /**
   * Adds a Stop paired to an existing, unpaired Start.
   * A minute at or before the Start is forced to min(start + 1, duration).
   * @return The new event id, or an empty string if the pair cannot be formed.
   */
  std::string addStop(const std::string &startEventId, uint32_t minute);

  /**
   * Removes an event. Removing a Start also removes its paired Stop;
   * removing a Stop leaves its Start unpaired.
   */
  bool removeEvent(const std::string &eventId);

  /**
   * Raw insertion for loaders of untrusted data. Clamps the minute only,
   * pairing is taken as given. A missing id is generated.
   */
  std::string insertEvent(const TimelineEvent &event);

  // --- Queries ---
  const std::vector<TimelineEvent> &getEvents() const { return _events; }
  size_t getEventCount() const { return _events.size(); }
  const TimelineEvent *findEvent(const std::string &eventId) const;
  const TimelineEvent *pairedStopOf(const std::string &startEventId) const;
  std::vector<std::string> getFeatureIds() const;
  bool isWellFormed(std::string &errorMsg) const;

  // --- Phrase Pools ---
  void addPhrase(const std::string &pool, const std::string &phrase);
  const std::vector<std::string> *getPhrases(const std::string &pool) const;

private:
  std::string _id;
  std::string _name;
  std::string _description;
  uint32_t _durationMinutes;
  std::vector<TimelineEvent> _events;
  std::vector<PhrasePool> _phrasePools;
  uint32_t _nextEventNumber;

  TimelineEvent *findMutable(const std::string &eventId);
  std::string nextEventId();
  uint32_t clampMinute(uint32_t minute) const;
  void sortEvents();
};
