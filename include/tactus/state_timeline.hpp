#pragma once

#include "tactus/sorted_timeline.hpp"
#include "tactus/types.hpp"

#include <cstddef>
#include <optional>

namespace tactus {

class StateEvent {
public:
  StateEvent(PlaybackState state, double time, std::optional<Ticks> offset = std::nullopt)
      : state(state), time(time), offset(offset) {}

  double getTime() const { return this->time; }

  bool operator==(const StateEvent &other) const {
    return this->state == other.state && this->time == other.time && this->offset == other.offset;
  }

  PlaybackState state;
  double time;
  /* Only meaningful for Started: where the tick counter restarts from. */
  std::optional<Ticks> offset;
};

/**
 * A timeline of discrete playback states, queryable as of any time.
 *
 * Before the first recorded transition, the timeline reports the initial state it was constructed with.
 * */
class StateTimeline {
public:
  explicit StateTimeline(PlaybackState initial) : initial(initial) {}

  PlaybackState getValueAtTime(double time) const;
  void setStateAtTime(PlaybackState state, double time, std::optional<Ticks> offset = std::nullopt);

  std::optional<const StateEvent *> get(double time) const { return this->timeline.get(time); }
  std::optional<const StateEvent *> getAfter(double time) const { return this->timeline.getAfter(time); }

  void cancel(double after) { this->timeline.cancel(after); }
  void clear() { this->timeline.clear(); }
  std::size_t size() const { return this->timeline.size(); }

  PlaybackState getInitialState() const { return this->initial; }

private:
  PlaybackState initial;
  SortedTimeline<StateEvent> timeline;
};

} // namespace tactus
