/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/Timeline.cpp
 *
 * Description:
 * Editing operations and invariant checks for TimelineModel.
 * =================================================================================
 */
#include <stdio.h>
#include <algorithm>

#include "Timeline.h"

// =================================================================================
// SECTION: CONSTRUCTION
// =================================================================================

TimelineModel::TimelineModel()
    : _id(""), _name(""), _description(""), _durationMinutes(1), _nextEventNumber(1) {}

TimelineModel::TimelineModel(const std::string &id, const std::string &name, uint32_t durationMinutes)
    : _id(id), _name(name), _description(""), _durationMinutes(durationMinutes), _nextEventNumber(1) {
  // A session always has at least one minute
  if (_durationMinutes == 0) _durationMinutes = 1;
}

// =================================================================================
// SECTION: INTERNAL HELPERS
// =================================================================================

TimelineEvent *TimelineModel::findMutable(const std::string &eventId) {
  if (eventId.empty()) return nullptr;
  for (size_t i = 0; i < _events.size(); i++) {
    if (_events[i].id == eventId) return &_events[i];
  }
  return nullptr;
}

std::string TimelineModel::nextEventId() {
  char buf[24];
  do {
    snprintf(buf, sizeof(buf), "evt-%u", _nextEventNumber++);
  } while (findEvent(buf) != nullptr);
  return std::string(buf);
}

uint32_t TimelineModel::clampMinute(uint32_t minute) const {
  return minute > _durationMinutes ? _durationMinutes : minute;
}

void TimelineModel::sortEvents() {
  // Stable: events sharing a minute keep their insertion order
  std::stable_sort(_events.begin(), _events.end(),
                   [](const TimelineEvent &a, const TimelineEvent &b) { return a.minute < b.minute; });
}

// =================================================================================
// SECTION: DURATION
// =================================================================================

void TimelineModel::setDuration(uint32_t minutes) {
  if (minutes == 0) minutes = 1;
  _durationMinutes = minutes;

  // 1. Clamp anything past the new end
  for (size_t i = 0; i < _events.size(); i++) {
    if (_events[i].minute > _durationMinutes) {
      _events[i].minute = _durationMinutes;
    }
  }

  // 2. A clamped Stop may now sit on its Start. Pull the Start back one minute.
  for (size_t i = 0; i < _events.size(); i++) {
    TimelineEvent &start = _events[i];
    if (start.type != EVENT_START || start.pairedEventId.empty()) continue;

    const TimelineEvent *stop = findEvent(start.pairedEventId);
    if (stop && stop->minute <= start.minute && stop->minute > 0) {
      start.minute = stop->minute - 1;
    }
  }

  sortEvents();
}

// =================================================================================
// SECTION: EDITING
// =================================================================================

std::string TimelineModel::addStart(const std::string &featureId, uint32_t minute) {
  TimelineEvent evt;
  evt.id = nextEventId();
  evt.featureId = featureId;
  evt.type = EVENT_START;
  evt.minute = clampMinute(minute);
  evt.pairedEventId = "";

  _events.push_back(evt);
  sortEvents();
  return evt.id;
}

std::string TimelineModel::addStop(const std::string &startEventId, uint32_t minute) {
  TimelineEvent *start = findMutable(startEventId);
  if (!start || start->type != EVENT_START) return "";
  if (!start->pairedEventId.empty()) return "";

  // No room left between the Start and the end of the session
  if (start->minute >= _durationMinutes) return "";

  uint32_t stopMinute = clampMinute(minute);
  if (stopMinute <= start->minute) {
    stopMinute = std::min(start->minute + 1, _durationMinutes);
  }

  TimelineEvent evt;
  evt.id = nextEventId();
  evt.featureId = start->featureId;
  evt.type = EVENT_STOP;
  evt.minute = stopMinute;
  evt.pairedEventId = start->id;

  // Link before push_back: the push may reallocate and invalidate 'start'
  start->pairedEventId = evt.id;
  _events.push_back(evt);
  sortEvents();
  return evt.id;
}

bool TimelineModel::removeEvent(const std::string &eventId) {
  TimelineEvent *evt = findMutable(eventId);
  if (!evt) return false;

  std::string pairedId = evt->pairedEventId;
  TimelineEventType type = evt->type;

  _events.erase(std::remove_if(_events.begin(), _events.end(),
                               [&eventId](const TimelineEvent &e) { return e.id == eventId; }),
                _events.end());

  if (pairedId.empty()) return true;

  if (type == EVENT_START) {
    // The Stop is an orphan now
    _events.erase(std::remove_if(_events.begin(), _events.end(),
                                 [&pairedId](const TimelineEvent &e) {
                                   return e.id == pairedId && e.type == EVENT_STOP;
                                 }),
                  _events.end());
  } else {
    TimelineEvent *start = findMutable(pairedId);
    if (start && start->pairedEventId == eventId) {
      start->pairedEventId = "";
    }
  }
  return true;
}

std::string TimelineModel::insertEvent(const TimelineEvent &event) {
  TimelineEvent evt = event;
  if (evt.id.empty() || findEvent(evt.id) != nullptr) {
    evt.id = nextEventId();
  }
  evt.minute = clampMinute(evt.minute);

  _events.push_back(evt);
  sortEvents();
  return evt.id;
}

// =================================================================================
// SECTION: QUERIES
// =================================================================================

const TimelineEvent *TimelineModel::findEvent(const std::string &eventId) const {
  if (eventId.empty()) return nullptr;
  for (size_t i = 0; i < _events.size(); i++) {
    if (_events[i].id == eventId) return &_events[i];
  }
  return nullptr;
}

const TimelineEvent *TimelineModel::pairedStopOf(const std::string &startEventId) const {
  const TimelineEvent *start = findEvent(startEventId);
  if (!start || start->type != EVENT_START) return nullptr;

  const TimelineEvent *stop = findEvent(start->pairedEventId);
  if (!stop || stop->type != EVENT_STOP) return nullptr;
  return stop;
}

std::vector<std::string> TimelineModel::getFeatureIds() const {
  std::vector<std::string> ids;
  for (size_t i = 0; i < _events.size(); i++) {
    if (std::find(ids.begin(), ids.end(), _events[i].featureId) == ids.end()) {
      ids.push_back(_events[i].featureId);
    }
  }
  return ids;
}

/**
 * Reports the first broken invariant found.
 * Editing through addStart/addStop/removeEvent/setDuration never produces one;
 * only insertEvent can.
 */
bool TimelineModel::isWellFormed(std::string &errorMsg) const {
  errorMsg = "";

  for (size_t i = 0; i < _events.size(); i++) {
    const TimelineEvent &e = _events[i];

    if (e.minute > _durationMinutes) {
      errorMsg = "Event " + e.id + " is past the session end.";
      return false;
    }

    if (e.type == EVENT_START) {
      if (e.pairedEventId.empty()) continue;
      const TimelineEvent *stop = findEvent(e.pairedEventId);
      if (!stop || stop->type != EVENT_STOP || stop->pairedEventId != e.id) {
        errorMsg = "Start " + e.id + " references a missing Stop.";
        return false;
      }
      if (stop->featureId != e.featureId) {
        errorMsg = "Start " + e.id + " is paired with another feature.";
        return false;
      }
      if (stop->minute <= e.minute) {
        errorMsg = "Stop " + stop->id + " is not after its Start.";
        return false;
      }
    } else {
      const TimelineEvent *start = findEvent(e.pairedEventId);
      if (!start || start->type != EVENT_START || start->pairedEventId != e.id) {
        errorMsg = "Stop " + e.id + " has no Start.";
        return false;
      }
    }
  }
  return true;
}

// =================================================================================
// SECTION: PHRASE POOLS
// =================================================================================

void TimelineModel::addPhrase(const std::string &pool, const std::string &phrase) {
  for (size_t i = 0; i < _phrasePools.size(); i++) {
    if (_phrasePools[i].name == pool) {
      _phrasePools[i].phrases.push_back(phrase);
      return;
    }
  }
  PhrasePool p;
  p.name = pool;
  p.phrases.push_back(phrase);
  _phrasePools.push_back(p);
}

const std::vector<std::string> *TimelineModel::getPhrases(const std::string &pool) const {
  for (size_t i = 0; i < _phrasePools.size(); i++) {
    if (_phrasePools[i].name == pool) return &_phrasePools[i].phrases;
  }
  return nullptr;
}
