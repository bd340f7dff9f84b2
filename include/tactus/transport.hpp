#pragma once

#include "tactus/clock.hpp"
#include "tactus/config.hpp"
#include "tactus/emitter.hpp"
#include "tactus/engine.hpp"
#include "tactus/interval_index.hpp"
#include "tactus/parameter_automation.hpp"
#include "tactus/sorted_timeline.hpp"
#include "tactus/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tactus {

class Context;

struct TransportConfig {
  double bpm = config::BPM;
  /* Quarter notes per measure. */
  double time_signature = config::TIME_SIGNATURE;
  Ticks ppq = config::PPQ;
  /* 0 to 1. */
  double swing = 0.0;
  /* Defaults to an eighth note. */
  std::optional<Ticks> swing_subdivision;
  Ticks loop_start = 0;
  /* Defaults to 4 measures. */
  std::optional<Ticks> loop_end;
  bool loop = false;
};

/*
 * Notifications a Transport sends.  Listeners get the engine time of the transition and, for Start and LoopStart,
 * the transport's position in seconds at that point (0 for everything else).
 * */
enum class TransportEvent {
  Start,
  Stop,
  Pause,
  Loop,
  LoopStart,
  LoopEnd,
};

using TransportCallback = std::function<void(double)>;
using TransportEventId = unsigned long long;

/**
 * Something scheduled on a transport.  Immutable once scheduled.
 *
 * For repeating events the interval covers `duration + 1` ticks: the end is inclusive, so a repeat lasting 12 ticks
 * still fires on the 12th.
 * */
class ScheduledEvent {
public:
  double getTime() const { return (double)this->time; }
  double getDuration() const;

  bool operator==(const ScheduledEvent &other) const { return this->id == other.id; }

  TransportEventId id = 0;
  Ticks time = 0;
  /* Repeats only. */
  Ticks interval = 0;
  double duration = INFINITE_DURATION;
  std::shared_ptr<const TransportCallback> callback;
};

/**
 * Musical time on top of a Clock.
 *
 * The clock ticks PPQ times per quarter note, so its frequency is `bpm / 60 * PPQ`.  Each tick the transport applies
 * swing, handles looping, and then calls everything scheduled on that tick with the engine time it falls on, in this
 * order: events scheduled with scheduleOnce, then with schedule, then repeating events.
 *
 * Everything here happens on the context's heartbeat.  See Context::enqueueCommand for driving a transport from other
 * threads.
 * */
class Transport {
public:
  explicit Transport(Context &context, const TransportConfig &config = TransportConfig{});

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  /**
   * Call `callback` at tick `time` each time the transport passes it (so again on every loop).
   * */
  TransportEventId schedule(TransportCallback callback, Ticks time);
  /**
   * Like schedule, but the event is dropped once it fires.  Events scheduled in the past fire on the next tick.
   * */
  TransportEventId scheduleOnce(TransportCallback callback, Ticks time);
  /**
   * Call `callback` every `interval` ticks from `start_time` through `start_time + duration` inclusive.  Throws ERange
   * if the interval or the duration isn't positive.
   * */
  TransportEventId scheduleRepeat(TransportCallback callback, Ticks interval, Ticks start_time = 0,
                                  double duration = INFINITE_DURATION);
  /* Unknown ids are ignored. */
  void clear(TransportEventId id);
  /* Remove everything scheduled at or after `after`. */
  void cancel(Ticks after = 0);
  std::size_t getScheduledCount() const { return this->scheduled.size(); }

  void start(std::optional<double> time = std::nullopt, std::optional<Ticks> offset = std::nullopt);
  void stop(std::optional<double> time = std::nullopt);
  void pause(std::optional<double> time = std::nullopt);
  /* Start if not started at `time`, otherwise stop. */
  void toggle(std::optional<double> time = std::nullopt);
  PlaybackState getState() const { return this->clock.getState(); }
  PlaybackState getStateAtTime(double time) const { return this->clock.getStateAtTime(time); }

  double getBpm() const;
  double getBpmAtTime(double time) const;
  /* Replaces any scheduled tempo changes. */
  void setBpm(double bpm);
  void setBpmAtTime(double bpm, double time);
  /* Exponential ramp, anchored at `start_time` (default now). */
  void rampBpm(double bpm, double ramp_time, std::optional<double> start_time = std::nullopt);
  /* The clock's frequency in ticks per second, for direct automation. */
  ParameterAutomation &getTickRate() { return this->clock.getFrequency(); }

  double getTimeSignature() const { return this->time_signature; }
  void setTimeSignature(double numerator, double denominator = 4.0);

  Ticks getPpq() const { return this->ppq; }
  /* Keeps the tempo in bpm. */
  void setPpq(Ticks new_ppq);

  double getSwing() const { return this->swing; }
  void setSwing(double amount);
  Ticks getSwingSubdivision() const { return this->swing_subdivision; }
  void setSwingSubdivision(Ticks subdivision);

  bool getLoop() const { return this->loop; }
  void setLoop(bool enabled) { this->loop = enabled; }
  Ticks getLoopStart() const { return this->loop_start; }
  Ticks getLoopEnd() const { return this->loop_end; }
  /* The loop start must stay before the loop end; these throw ERange otherwise. */
  void setLoopStart(Ticks ticks);
  void setLoopEnd(Ticks ticks);
  void setLoopPoints(Ticks start, Ticks end);
  double getLoopStartSeconds() const { return this->ticksToSeconds((double)this->loop_start); }
  double getLoopEndSeconds() const { return this->ticksToSeconds((double)this->loop_end); }

  Ticks getTicks() const { return this->clock.getTicks(); }
  /**
   * Move the playhead.  While started, listeners see a stop followed by a start at the current time.  Throws ERange
   * for negative ticks.
   * */
  void setTicks(Ticks ticks);
  double getSeconds() const;
  void setSeconds(double seconds);
  /* "bars:beats:sixteenths", with sixteenths to 3 decimal places.  Beats are fractional in meters like 7/8. */
  std::string getPosition() const;
  void setPosition(double bars, double beats = 0.0, double sixteenths = 0.0);
  /* How far through the loop the playhead is, from 0 to 1.  0 when not looping. */
  double getProgress() const;

  /* Conversions at the current tempo. */
  double ticksToSeconds(double ticks) const;
  Ticks secondsToTicks(double seconds) const;
  double getTicksPerMeasure() const { return this->time_signature * (double)this->ppq; }

  /**
   * The engine time of the next tick which is a multiple of `subdivision`, or 0 if the transport isn't started.
   * */
  double nextSubdivision(Ticks subdivision) const;

  /**
   * Drive `signal` from the tempo: the signal's native parameter is fed the clock's frequency times `ratio`, so that
   * it follows tempo changes.  Without a ratio, it is chosen so the signal keeps its current value at the current
   * tempo.  Throws EInvariant if the signal is already synced.  The signal must outlive the sync.
   * */
  void syncSignal(ParameterAutomation &signal, std::optional<double> ratio = std::nullopt);
  /* Disconnect a synced signal and restore its value.  Does nothing if the signal isn't synced. */
  void unsyncSignal(ParameterAutomation &signal);

  Emitter<TransportEvent, double, double> &getEmitter() { return this->emitter; }
  Clock &getClock() { return this->clock; }

private:
  enum class EventStore {
    Timeline,
    Once,
    Repeat,
  };

  struct ScheduledRecord {
    EventStore store;
    ScheduledEvent event;
  };

  struct SyncedSignal {
    ParameterAutomation *signal;
    std::unique_ptr<NativeConnection> connection;
    double initial;
  };

  static const TransportConfig &validateConfig(const TransportConfig &config);
  static double bpmToRate(double bpm, Ticks ppq) { return bpm / 60.0 * (double)ppq; }
  double getRate() const;
  /* Like ticksToSeconds, but at the tempo of `time`, and 0 if the clock is stalled there. */
  double ticksToSecondsAt(double ticks, double time) const;
  void processTick(double tick_time);
  TransportEventId addEvent(EventStore store, ScheduledEvent event);

  Context &context;
  Ticks ppq;
  double time_signature;
  double swing;
  Ticks swing_subdivision;
  Ticks loop_start;
  Ticks loop_end;
  bool loop;

  SortedTimeline<ScheduledEvent> timeline;
  SortedTimeline<ScheduledEvent> once_events;
  IntervalIndex<ScheduledEvent> repeated_events;
  std::unordered_map<TransportEventId, ScheduledRecord> scheduled;
  TransportEventId next_event_id = 1;
  std::vector<SyncedSignal> synced_signals;
  Emitter<TransportEvent, double, double> emitter;
  // Last, so that it is registered after and unregistered before everything its ticks touch.
  Clock clock;
};

} // namespace tactus
