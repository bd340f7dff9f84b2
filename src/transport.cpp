#include "tactus/transport.hpp"

#include "tactus/context.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace tactus {

static constexpr double PI = 3.14159265358979323846;

double ScheduledEvent::getDuration() const {
  if (std::isinf(this->duration)) {
    return INFINITE_DURATION;
  }
  return std::floor(this->duration) + 1.0;
}

static void checkPositive(double value, const char *what) {
  if (std::isfinite(value) == false || value <= 0.0) {
    throw ERange(std::string(what) + " must be finite and positive");
  }
}

const TransportConfig &Transport::validateConfig(const TransportConfig &config) {
  checkPositive(config.bpm, "Bpm");
  checkPositive(config.time_signature, "Time signature");
  if (config.ppq <= 0) {
    throw ERange("PPQ must be positive");
  }
  if (!(config.swing >= 0.0 && config.swing <= 1.0)) {
    throw ERange("Swing must be between 0 and 1");
  }
  if (config.swing_subdivision && *config.swing_subdivision <= 0) {
    throw ERange("Swing subdivision must be positive");
  }
  if (config.loop_start < 0) {
    throw ERange("Loop start can't be negative");
  }
  if (config.loop_end && *config.loop_end <= config.loop_start) {
    throw ERange("Loop start must be before loop end");
  }
  return config;
}

Transport::Transport(Context &context, const TransportConfig &config)
    : context(context), ppq(validateConfig(config).ppq), time_signature(config.time_signature), swing(config.swing),
      swing_subdivision(config.swing_subdivision ? *config.swing_subdivision : config.ppq / 2),
      loop_start(config.loop_start), loop(config.loop),
      clock(context, [this](double tick_time) { this->processTick(tick_time); }, bpmToRate(config.bpm, config.ppq),
            ParameterUnits::Bpm) {
  if (config.loop_end) {
    this->loop_end = *config.loop_end;
  } else {
    this->loop_end = (Ticks)std::llround(4.0 * this->getTicksPerMeasure());
    if (this->loop_end <= this->loop_start) {
      throw ERange("Loop start must be before loop end");
    }
  }
  if (this->swing_subdivision <= 0) {
    throw ERange("Swing subdivision must be positive");
  }

  auto &clock_events = this->clock.getEmitter();
  clock_events.on(ClockEvent::Start, [this](double time, Ticks ticks) {
    this->emitter.emit(TransportEvent::Start, time, this->ticksToSecondsAt((double)ticks, time));
  });
  clock_events.on(ClockEvent::Stop, [this](double time, Ticks) { this->emitter.emit(TransportEvent::Stop, time, 0.0); });
  clock_events.on(ClockEvent::Pause,
                  [this](double time, Ticks) { this->emitter.emit(TransportEvent::Pause, time, 0.0); });
}

TransportEventId Transport::addEvent(EventStore store, ScheduledEvent event) {
  if (event.callback == nullptr || *event.callback == nullptr) {
    throw EValidation("Scheduled events need a callback");
  }
  auto id = this->next_event_id++;
  event.id = id;

  switch (store) {
  case EventStore::Timeline:
    this->timeline.add(event);
    break;
  case EventStore::Once:
    this->once_events.add(event);
    break;
  case EventStore::Repeat:
    this->repeated_events.add(event);
    break;
  }
  this->scheduled.emplace(id, ScheduledRecord{store, std::move(event)});
  return id;
}

TransportEventId Transport::schedule(TransportCallback callback, Ticks time) {
  ScheduledEvent event;
  event.time = time;
  event.callback = std::make_shared<const TransportCallback>(std::move(callback));
  return this->addEvent(EventStore::Timeline, std::move(event));
}

TransportEventId Transport::scheduleOnce(TransportCallback callback, Ticks time) {
  ScheduledEvent event;
  event.time = time;
  event.callback = std::make_shared<const TransportCallback>(std::move(callback));
  return this->addEvent(EventStore::Once, std::move(event));
}

TransportEventId Transport::scheduleRepeat(TransportCallback callback, Ticks interval, Ticks start_time,
                                           double duration) {
  if (interval <= 0) {
    throw ERange("Repeat interval must be positive");
  }
  if (std::isnan(duration) || duration <= 0.0) {
    throw ERange("Repeat duration must be positive");
  }
  ScheduledEvent event;
  event.time = start_time;
  event.interval = interval;
  event.duration = duration;
  event.callback = std::make_shared<const TransportCallback>(std::move(callback));
  return this->addEvent(EventStore::Repeat, std::move(event));
}

void Transport::clear(TransportEventId id) {
  auto it = this->scheduled.find(id);
  if (it == this->scheduled.end()) {
    return;
  }
  auto &record = it->second;
  switch (record.store) {
  case EventStore::Timeline:
    this->timeline.remove(record.event);
    break;
  case EventStore::Once:
    this->once_events.remove(record.event);
    break;
  case EventStore::Repeat:
    this->repeated_events.remove(record.event);
    break;
  }
  this->scheduled.erase(it);
}

void Transport::cancel(Ticks after) {
  this->timeline.cancel((double)after);
  this->once_events.cancel((double)after);
  this->repeated_events.cancel((double)after);

  for (auto it = this->scheduled.begin(); it != this->scheduled.end();) {
    if (it->second.event.time >= after) {
      it = this->scheduled.erase(it);
    } else {
      ++it;
    }
  }
}

void Transport::start(std::optional<double> time, std::optional<Ticks> offset) {
  if (offset && *offset < 0) {
    throw ERange("Start offset can't be negative");
  }
  this->clock.start(time, offset);
}

void Transport::stop(std::optional<double> time) { this->clock.stop(time); }

void Transport::pause(std::optional<double> time) { this->clock.pause(time); }

void Transport::toggle(std::optional<double> time) {
  double t = time ? *time : this->context.now();
  if (this->clock.getStateAtTime(t) != PlaybackState::Started) {
    this->start(t);
  } else {
    this->stop(t);
  }
}

double Transport::getRate() const { return this->clock.getFrequency().getValueAtTime(this->context.now()); }

double Transport::getBpm() const { return this->getRate() / (double)this->ppq * 60.0; }

double Transport::getBpmAtTime(double time) const {
  return this->clock.getFrequency().getValueAtTime(time) / (double)this->ppq * 60.0;
}

void Transport::setBpm(double bpm) {
  checkPositive(bpm, "Bpm");
  this->clock.getFrequency().setValue(bpmToRate(bpm, this->ppq));
}

void Transport::setBpmAtTime(double bpm, double time) {
  checkPositive(bpm, "Bpm");
  this->clock.getFrequency().setValueAtTime(bpmToRate(bpm, this->ppq), time);
}

void Transport::rampBpm(double bpm, double ramp_time, std::optional<double> start_time) {
  checkPositive(bpm, "Bpm");
  this->clock.getFrequency().rampTo(bpmToRate(bpm, this->ppq), ramp_time, start_time);
}

void Transport::setTimeSignature(double numerator, double denominator) {
  checkPositive(numerator, "Time signature numerator");
  checkPositive(denominator, "Time signature denominator");
  this->time_signature = numerator / (denominator / 4.0);
}

void Transport::setPpq(Ticks new_ppq) {
  if (new_ppq <= 0) {
    throw ERange("PPQ must be positive");
  }
  double bpm = this->getBpm();
  this->ppq = new_ppq;
  this->setBpm(bpm);
}

void Transport::setSwing(double amount) {
  if (!(amount >= 0.0 && amount <= 1.0)) {
    throw ERange("Swing must be between 0 and 1");
  }
  this->swing = amount;
}

void Transport::setSwingSubdivision(Ticks subdivision) {
  if (subdivision <= 0) {
    throw ERange("Swing subdivision must be positive");
  }
  this->swing_subdivision = subdivision;
}

void Transport::setLoopStart(Ticks ticks) { this->setLoopPoints(ticks, this->loop_end); }

void Transport::setLoopEnd(Ticks ticks) { this->setLoopPoints(this->loop_start, ticks); }

void Transport::setLoopPoints(Ticks start, Ticks end) {
  if (start < 0) {
    throw ERange("Loop start can't be negative");
  }
  if (start >= end) {
    throw ERange("Loop start must be before loop end");
  }
  this->loop_start = start;
  this->loop_end = end;
}

void Transport::setTicks(Ticks ticks) {
  if (ticks < 0) {
    throw ERange("Ticks can't be negative");
  }
  if (this->clock.getTicks() == ticks) {
    return;
  }
  double now = this->context.now();
  if (this->getState() == PlaybackState::Started) {
    this->emitter.emit(TransportEvent::Stop, now, 0.0);
    this->clock.setTicks(ticks);
    this->emitter.emit(TransportEvent::Start, now, this->ticksToSecondsAt((double)ticks, now));
  } else {
    this->clock.setTicks(ticks);
  }
}

double Transport::getSeconds() const { return this->ticksToSeconds((double)this->getTicks()); }

void Transport::setSeconds(double seconds) {
  if (std::isfinite(seconds) == false) {
    throw EValidation("Seconds must be finite");
  }
  this->setTicks(this->secondsToTicks(seconds));
}

std::string Transport::getPosition() const {
  double quarters = (double)this->getTicks() / (double)this->ppq;
  auto measures = (long long)std::floor(quarters / this->time_signature);
  double sixteenths = (quarters - std::floor(quarters)) * 4.0;
  sixteenths = std::round(sixteenths * 1000.0) / 1000.0;
  // Fractional with meters like 7/8, where a bar is 3.5 quarters.
  double beats = std::fmod(std::floor(quarters), this->time_signature);

  char buf[96];
  std::snprintf(buf, sizeof(buf), "%lld:%g:%g", measures, beats, sixteenths);
  return buf;
}

void Transport::setPosition(double bars, double beats, double sixteenths) {
  if (std::isfinite(bars) == false || std::isfinite(beats) == false || std::isfinite(sixteenths) == false) {
    throw EValidation("Position must be finite");
  }
  double quarters = bars * this->time_signature + beats + sixteenths / 4.0;
  this->setTicks((Ticks)std::llround(quarters * (double)this->ppq));
}

double Transport::getProgress() const {
  if (this->loop == false) {
    return 0.0;
  }
  return (double)(this->getTicks() - this->loop_start) / (double)(this->loop_end - this->loop_start);
}

double Transport::ticksToSeconds(double ticks) const {
  double rate = this->getRate();
  if (std::isfinite(rate) == false || rate <= 0.0) {
    throw ERange("Tempo isn't positive");
  }
  return ticks / rate;
}

double Transport::ticksToSecondsAt(double ticks, double time) const {
  double rate = this->clock.getFrequency().getValueAtTime(time);
  if (std::isfinite(rate) == false || rate <= 0.0) {
    return 0.0;
  }
  return ticks / rate;
}

Ticks Transport::secondsToTicks(double seconds) const {
  double rate = this->getRate();
  if (std::isfinite(rate) == false || rate <= 0.0) {
    throw ERange("Tempo isn't positive");
  }
  // Absorb float error so that exact positions don't floor to the tick before.
  return (Ticks)std::floor(seconds * rate + 1e-6);
}

double Transport::nextSubdivision(Ticks subdivision) const {
  if (subdivision <= 0) {
    throw ERange("Subdivision must be positive");
  }
  if (this->getState() != PlaybackState::Started) {
    return 0.0;
  }
  Ticks ticks = this->clock.getTicks();
  Ticks phase = ((ticks % subdivision) + subdivision) % subdivision;
  Ticks remaining = (subdivision - phase) % subdivision;
  double next_tick = this->clock.getNextTickTime();
  if (remaining == 0) {
    return next_tick;
  }
  double rate = this->clock.getFrequency().getValueAtTime(next_tick);
  if (std::isfinite(rate) == false || rate <= 0.0) {
    throw ERange("Tempo isn't positive");
  }
  return next_tick + (double)remaining / rate;
}

void Transport::syncSignal(ParameterAutomation &signal, std::optional<double> ratio) {
  for (auto &s : this->synced_signals) {
    if (s.signal == &signal) {
      throw EInvariant("Signal is already synced to this transport");
    }
  }
  if (ratio && std::isfinite(*ratio) == false) {
    throw EValidation("Ratio must be finite");
  }

  double initial = signal.getValue();
  double computed_ratio = 0.0;
  if (ratio) {
    computed_ratio = *ratio;
  } else {
    double rate = this->getRate();
    if (initial != 0.0 && rate > 0.0) {
      computed_ratio = initial / rate;
    }
  }

  auto connection = this->context.getEngine().connectScaled(this->clock.getFrequency().getNativeParam(),
                                                             signal.getNativeParam(), computed_ratio);
  if (connection == nullptr) {
    throw EInternal("Engine failed to connect the signal");
  }
  signal.getNativeParam().setValue(0.0);
  this->synced_signals.push_back({&signal, std::move(connection), initial});
  logDebug("Synced signal with ratio %f", computed_ratio);
}

void Transport::unsyncSignal(ParameterAutomation &signal) {
  for (auto it = this->synced_signals.begin(); it != this->synced_signals.end(); ++it) {
    if (it->signal == &signal) {
      signal.getNativeParam().setValue(it->initial);
      this->synced_signals.erase(it);
      return;
    }
  }
}

void Transport::processTick(double tick_time) {
  Ticks ticks = this->clock.getTicks();
  // The clock only ticks at positive rates.
  double rate = this->clock.getFrequency().getValueAtTime(tick_time);

  Ticks swing_span = this->swing_subdivision * 2;
  if (this->swing > 0.0 && ticks % this->ppq != 0 && ticks % swing_span != 0) {
    double progress = (double)(ticks % swing_span) / (double)swing_span;
    double amount = std::sin(progress * PI) * this->swing;
    tick_time += (double)swing_span / 3.0 / rate * amount;
  }

  if (this->loop && ticks >= this->loop_end) {
    this->emitter.emit(TransportEvent::LoopEnd, tick_time, 0.0);
    this->clock.setTicks(this->loop_start);
    ticks = this->loop_start;
    this->emitter.emit(TransportEvent::LoopStart, tick_time, (double)ticks / rate);
    this->emitter.emit(TransportEvent::Loop, tick_time, 0.0);
  }

  this->once_events.forEachBefore((double)ticks, [&](const ScheduledEvent &event) {
    this->once_events.remove(event);
    this->scheduled.erase(event.id);
    (*event.callback)(tick_time);
  });

  this->timeline.forEachAtTime((double)ticks, [&](const ScheduledEvent &event) { (*event.callback)(tick_time); });

  this->repeated_events.forEachAtTime((double)ticks, [&](const ScheduledEvent &event) {
    if ((ticks - event.time) % event.interval == 0) {
      (*event.callback)(tick_time);
    }
  });
}

} // namespace tactus
