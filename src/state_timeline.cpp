#include "tactus/state_timeline.hpp"

#include "tactus/error.hpp"

#include <cmath>
#include <optional>

namespace tactus {

PlaybackState StateTimeline::getValueAtTime(double time) const {
  auto event = this->timeline.get(time);
  if (event) {
    return (*event)->state;
  }
  return this->initial;
}

void StateTimeline::setStateAtTime(PlaybackState state, double time, std::optional<Ticks> offset) {
  if (std::isfinite(time) == false) {
    throw EValidation("State transitions must have a finite time");
  }
  this->timeline.add(StateEvent(state, time, offset));
}

} // namespace tactus
