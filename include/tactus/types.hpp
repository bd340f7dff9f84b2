#pragma once

#include <cstdint>
#include <limits>

namespace tactus {

/*
 * Musical time: an integer count of pulses, PPQ of which make a quarter note.
 * */
using Ticks = std::int64_t;

/*
 * Used for events which last forever, for example repeats with no duration.
 * */
constexpr double INFINITE_DURATION = std::numeric_limits<double>::infinity();

/*
 * The states a Clock or Transport can be in.  Transitions are recorded on a StateTimeline so that the state at any
 * time can be answered after the fact.
 * */
enum class PlaybackState {
  Started,
  Stopped,
  Paused,
};

inline const char *playbackStateName(PlaybackState state) {
  switch (state) {
  case PlaybackState::Started:
    return "started";
  case PlaybackState::Stopped:
    return "stopped";
  case PlaybackState::Paused:
    return "paused";
  }
  return "unknown";
}

} // namespace tactus
