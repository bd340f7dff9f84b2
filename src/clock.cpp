#include "tactus/clock.hpp"

#include "tactus/at_scope_exit.hpp"
#include "tactus/context.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <cmath>
#include <optional>
#include <utility>

namespace tactus {

Clock::Clock(Context &context, TickCallback callback, double initial_frequency, ParameterUnits units)
    : context(context), callback(std::move(callback)), frequency(context.getEngine(), initial_frequency, units),
      next_tick(context.now()) {
  if (std::isfinite(initial_frequency) == false || initial_frequency <= 0.0) {
    throw ERange("Clock frequency must be finite and positive");
  }
  if (this->callback == nullptr) {
    throw EValidation("Clock needs a callback");
  }
  context.registerClock(this);
}

Clock::Clock(Context &context, TickCallback callback, const ClockConfig &config)
    : Clock(context, std::move(callback), config.frequency, config.units) {}

Clock::~Clock() { this->context.unregisterClock(this); }

double Clock::resolveTime(std::optional<double> time) const {
  if (time) {
    return *time;
  }
  return this->context.now();
}

PlaybackState Clock::getState() const { return this->getStateAtTime(this->context.now()); }

void Clock::start(std::optional<double> time, std::optional<Ticks> offset) {
  double t = this->resolveTime(time);
  if (this->state.getValueAtTime(t) != PlaybackState::Started) {
    this->state.setStateAtTime(PlaybackState::Started, t, offset);
  }
}

void Clock::stop(std::optional<double> time) {
  double t = this->resolveTime(time);
  if (std::isfinite(t) == false) {
    throw EValidation("Time must be finite");
  }
  this->state.cancel(t);
  this->state.setStateAtTime(PlaybackState::Stopped, t);
}

void Clock::pause(std::optional<double> time) {
  double t = this->resolveTime(time);
  if (this->state.getValueAtTime(t) == PlaybackState::Started) {
    this->state.setStateAtTime(PlaybackState::Paused, t);
  }
}

void Clock::emitTransition(PlaybackState new_state) {
  this->last_state = new_state;
  auto maybe_event = this->state.get(this->next_tick);
  if (!maybe_event) {
    // Only the initial state has no event, and the clock starts out in it.
    return;
  }
  auto event = **maybe_event;
  logDebug("Clock %s at %f", playbackStateName(new_state), event.time);

  switch (new_state) {
  case PlaybackState::Started:
    this->next_tick = event.time;
    if (event.offset) {
      this->ticks = *event.offset;
    }
    this->emitter.emit(ClockEvent::Start, event.time, this->ticks);
    break;
  case PlaybackState::Stopped:
    this->ticks = 0;
    this->emitter.emit(ClockEvent::Stop, event.time, this->ticks);
    break;
  case PlaybackState::Paused:
    this->emitter.emit(ClockEvent::Pause, event.time, this->ticks);
    break;
  }
}

void Clock::processHeartbeat() {
  double now = this->context.now();
  double window_end = now + this->context.getLookAhead() + this->context.getUpdateInterval() + this->context.getLag() * 2;

  while (window_end > this->next_tick) {
    auto current_state = this->state.getValueAtTime(this->next_tick);
    if (current_state != this->last_state) {
      this->emitTransition(current_state);
    }

    double tick_time = this->next_tick;
    double rate = this->frequency.getValueAtTime(tick_time);
    if (std::isfinite(rate) == false || rate <= 0.0) {
      if (this->stalled == false) {
        logWarn("Clock frequency is %f at %f; stalling until it is positive", rate, tick_time);
        this->stalled = true;
      }
      break;
    }
    this->stalled = false;

    this->next_tick += 1.0 / rate;
    if (current_state == PlaybackState::Started) {
      // The tick counts as emitted even if the callback throws, so ticks and tick times stay paired.
      auto count_tick = AtScopeExit([&]() { this->ticks++; });
      this->callback(tick_time);
    }
  }
}

} // namespace tactus
