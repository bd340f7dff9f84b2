#pragma once

#include "tactus/emitter.hpp"
#include "tactus/parameter_automation.hpp"
#include "tactus/state_timeline.hpp"
#include "tactus/types.hpp"

#include <functional>
#include <optional>

namespace tactus {

class Context;

struct ClockConfig {
  /* Ticks per second. */
  double frequency = 1.0;
  ParameterUnits units = ParameterUnits::Frequency;
};

enum class ClockEvent {
  Start,
  Stop,
  Pause,
};

/**
 * A clock which calls a callback once per tick, ahead of time.
 *
 * On every heartbeat of its context the clock walks forward from its next tick until the end of the lookahead window,
 * calling the callback with the exact engine time each tick falls on.  The callback is expected to schedule native
 * events at that time rather than do anything immediately.  The window is widened by twice the context's lag so that
 * a late heartbeat doesn't leave a gap.
 *
 * The frequency is automatable; each tick is 1 / frequency(time of the tick) after the previous one, so tempo changes
 * never move ticks which were already emitted.
 *
 * Start, stop and pause may be scheduled in the future.  Listeners are notified as the clock reaches them, with the
 * time of the transition and the tick counter after it.
 * */
class Clock {
public:
  using TickCallback = std::function<void(double)>;

  Clock(Context &context, TickCallback callback, double initial_frequency,
        ParameterUnits units = ParameterUnits::Frequency);
  Clock(Context &context, TickCallback callback, const ClockConfig &config = ClockConfig{});
  ~Clock();

  Clock(const Clock &) = delete;
  Clock &operator=(const Clock &) = delete;

  /* Does nothing if already started at `time`.  If given, the tick counter restarts at `offset`. */
  void start(std::optional<double> time = std::nullopt, std::optional<Ticks> offset = std::nullopt);
  /* Cancels any transitions scheduled at or after `time`. */
  void stop(std::optional<double> time = std::nullopt);
  /* Only has an effect if the clock is started at `time`. */
  void pause(std::optional<double> time = std::nullopt);

  PlaybackState getStateAtTime(double time) const { return this->state.getValueAtTime(time); }
  PlaybackState getState() const;

  Ticks getTicks() const { return this->ticks; }
  void setTicks(Ticks new_ticks) { this->ticks = new_ticks; }

  ParameterAutomation &getFrequency() { return this->frequency; }
  const ParameterAutomation &getFrequency() const { return this->frequency; }

  /* When the next tick which hasn't been emitted yet falls. */
  double getNextTickTime() const { return this->next_tick; }

  const StateTimeline &getStateTimeline() const { return this->state; }

  Emitter<ClockEvent, double, Ticks> &getEmitter() { return this->emitter; }

  /**
   * Emit every tick inside the lookahead window.  Called by the context once per heartbeat.
   * */
  void processHeartbeat();

private:
  double resolveTime(std::optional<double> time) const;
  void emitTransition(PlaybackState new_state);

  Context &context;
  TickCallback callback;
  ParameterAutomation frequency;
  StateTimeline state{PlaybackState::Stopped};
  PlaybackState last_state = PlaybackState::Stopped;
  double next_tick;
  Ticks ticks = 0;
  bool stalled = false;
  Emitter<ClockEvent, double, Ticks> emitter;
};

} // namespace tactus
