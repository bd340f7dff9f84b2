#include "tactus/parameter_automation.hpp"

#include "tactus/config.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tactus {

static void checkFinite(double value, const char *what) {
  if (std::isfinite(value) == false) {
    throw EValidation(std::string(what) + " must be finite");
  }
}

ParameterAutomation::ParameterAutomation(AudioEngine &engine, double initial_value, ParameterUnits units)
    : engine(engine), initial_value(initial_value), units(units) {
  checkFinite(initial_value, "Initial value");
  this->native = engine.createParam(initial_value);
  if (this->native == nullptr) {
    throw EInternal("Engine failed to create a native parameter");
  }
}

void ParameterAutomation::addSegment(AutomationSegment segment) { this->segments.add(std::move(segment)); }

double ParameterAutomation::resolveStartTime(std::optional<double> start_time) const {
  if (start_time) {
    checkFinite(*start_time, "Start time");
    return *start_time;
  }
  return this->engine.now();
}

double ParameterAutomation::getValue() const { return this->getValueAtTime(this->engine.now()); }

void ParameterAutomation::setValue(double value) {
  checkFinite(value, "Value");
  this->initial_value = value;
  this->segments.clear();
  this->native->cancelScheduledValues(0.0);
  this->native->setValue(value);
}

void ParameterAutomation::setValueAtTime(double value, double time) {
  checkFinite(value, "Value");
  checkFinite(time, "Time");
  this->native->setValueAtTime(value, time);
  this->addSegment({AutomationType::Set, value, time});
}

void ParameterAutomation::linearRampToValueAtTime(double value, double end_time) {
  checkFinite(value, "Value");
  checkFinite(end_time, "End time");
  this->native->linearRampToValueAtTime(value, end_time);
  this->addSegment({AutomationType::Linear, value, end_time});
}

void ParameterAutomation::exponentialRampToValueAtTime(double value, double end_time) {
  checkFinite(value, "Value");
  checkFinite(end_time, "End time");

  // The ramp would start from 0; move the start up to the floor.
  auto before = this->segments.get(end_time);
  if (before && (*before)->type != AutomationType::Curve && (*before)->value == 0.0) {
    this->setValueAtTime(config::MIN_OUTPUT, (*before)->time);
  }

  double set_value = std::max(value, config::MIN_OUTPUT);
  this->addSegment({AutomationType::Exponential, set_value, end_time});
  if (value < config::MIN_OUTPUT) {
    logDebug("Exponential ramp to %f at %f goes through the floor; jumping to 0 at the end", value, end_time);
    double sample_time = 1.0 / this->engine.getSampleRate();
    this->native->exponentialRampToValueAtTime(config::MIN_OUTPUT, end_time - sample_time);
    this->setValueAtTime(0.0, end_time);
  } else {
    this->native->exponentialRampToValueAtTime(value, end_time);
  }
}

void ParameterAutomation::setTargetAtTime(double value, double start_time, double time_constant) {
  checkFinite(value, "Value");
  checkFinite(start_time, "Start time");
  checkFinite(time_constant, "Time constant");
  value = std::max(config::MIN_OUTPUT, value);
  time_constant = std::max(config::MIN_OUTPUT, time_constant);
  this->native->setTargetAtTime(value, start_time, time_constant);

  AutomationSegment segment{AutomationType::Target, value, start_time};
  segment.time_constant = time_constant;
  this->addSegment(std::move(segment));
}

void ParameterAutomation::setValueCurveAtTime(const std::vector<double> &values, double start_time, double duration,
                                              double scaling) {
  checkFinite(start_time, "Start time");
  checkFinite(duration, "Duration");
  checkFinite(scaling, "Scaling");
  if (values.empty()) {
    throw EValidation("Value curves need at least one value");
  }
  if (duration <= 0.0) {
    throw ERange("Value curves need a positive duration");
  }
  auto curve = std::make_shared<std::vector<double>>();
  curve->reserve(values.size());
  for (auto v : values) {
    checkFinite(v, "Curve value");
    curve->push_back(v * scaling);
  }

  // Desugar to ramps: native curves can't be cancelled part way through.
  this->native->setValueAtTime((*curve)[0], start_time);
  if (curve->size() > 1) {
    double segment_time = duration / (double)(curve->size() - 1);
    for (std::size_t i = 1; i < curve->size(); i++) {
      this->native->linearRampToValueAtTime((*curve)[i], start_time + i * segment_time);
    }
  }

  AutomationSegment segment{AutomationType::Curve, (*curve)[0], start_time};
  segment.duration = duration;
  segment.curve = std::move(curve);
  this->addSegment(std::move(segment));
}

void ParameterAutomation::cancelScheduledValues(double after) {
  checkFinite(after, "Time");
  this->segments.cancel(after);
  this->native->cancelScheduledValues(after);
}

void ParameterAutomation::setRampPoint(double time) {
  checkFinite(time, "Time");
  double value = this->getValueAtTime(time);
  double sample_time = 1.0 / this->engine.getSampleRate();

  auto maybe_before = this->segments.get(time);
  if (maybe_before && (*maybe_before)->time == time) {
    // Something already pins this exact time; just drop whatever comes after it.
    this->cancelScheduledValues(time + sample_time);
    return;
  }

  if (maybe_before && (*maybe_before)->type == AutomationType::Curve &&
      (*maybe_before)->time + (*maybe_before)->duration > time) {
    // Truncate the curve here, ending it at the value it had reached.
    this->cancelScheduledValues(time);
    this->linearRampToValueAtTime(value, time);
    return;
  }

  auto maybe_after = this->segments.getAfter(time);
  if (maybe_after) {
    // Cut the ramp in flight short at its current value, so whatever comes next starts from there.
    auto after_type = (*maybe_after)->type;
    this->cancelScheduledValues(time);
    if (after_type == AutomationType::Linear) {
      this->linearRampToValueAtTime(value, time);
    } else if (after_type == AutomationType::Exponential) {
      this->exponentialRampToValueAtTime(value, time);
    }
  }
  this->setValueAtTime(value, time);
}

void ParameterAutomation::linearRampToValue(double value, double ramp_time, std::optional<double> start_time) {
  checkFinite(value, "Value");
  checkFinite(ramp_time, "Ramp time");
  if (ramp_time < 0.0) {
    throw ERange("Ramp time must not be negative");
  }
  double start = this->resolveStartTime(start_time);
  this->setRampPoint(start);
  this->linearRampToValueAtTime(value, start + ramp_time);
}

void ParameterAutomation::exponentialRampToValue(double value, double ramp_time, std::optional<double> start_time) {
  checkFinite(value, "Value");
  checkFinite(ramp_time, "Ramp time");
  if (ramp_time < 0.0) {
    throw ERange("Ramp time must not be negative");
  }
  double start = this->resolveStartTime(start_time);
  this->setRampPoint(start);
  this->exponentialRampToValueAtTime(value, start + ramp_time);
}

void ParameterAutomation::targetRampTo(double value, double ramp_time, std::optional<double> start_time) {
  checkFinite(value, "Value");
  checkFinite(ramp_time, "Ramp time");
  if (ramp_time < 0.0) {
    throw ERange("Ramp time must not be negative");
  }
  double start = this->resolveStartTime(start_time);
  this->setRampPoint(start);
  double time_constant = std::log(ramp_time + 1.0) / std::log(200.0);
  this->setTargetAtTime(value, start, time_constant);
}

void ParameterAutomation::rampTo(double value, double ramp_time, std::optional<double> start_time) {
  switch (this->units) {
  case ParameterUnits::Frequency:
  case ParameterUnits::Bpm:
  case ParameterUnits::Decibels:
    this->exponentialRampToValue(value, ramp_time, start_time);
    break;
  case ParameterUnits::Default:
    this->linearRampToValue(value, ramp_time, start_time);
    break;
  }
}

double ParameterAutomation::exponentialApproach(double t0, double v0, double v1, double time_constant,
                                                double t) const {
  return v1 + (v0 - v1) * std::exp(-(t - t0) / time_constant);
}

double ParameterAutomation::linearInterpolate(double t0, double v0, double t1, double v1, double t) const {
  if (t1 <= t0) {
    return v1;
  }
  return v0 + (v1 - v0) * ((t - t0) / (t1 - t0));
}

double ParameterAutomation::exponentialInterpolate(double t0, double v0, double t1, double v1, double t) const {
  if (t1 <= t0) {
    return v1;
  }
  v0 = std::max(config::MIN_OUTPUT, v0);
  return v0 * std::pow(v1 / v0, (t - t0) / (t1 - t0));
}

double ParameterAutomation::curveInterpolate(const AutomationSegment &segment, double time) const {
  auto &curve = *segment.curve;
  std::size_t len = curve.size();
  if (time >= segment.time + segment.duration) {
    return curve[len - 1];
  } else if (time <= segment.time) {
    return curve[0];
  }

  double progress = (time - segment.time) / segment.duration;
  double position = progress * (double)(len - 1);
  auto lower = (std::size_t)std::floor(position);
  auto upper = (std::size_t)std::ceil(position);
  if (upper >= len) {
    upper = len - 1;
  }
  if (lower == upper) {
    return curve[lower];
  }
  return this->linearInterpolate((double)lower, curve[lower], (double)upper, curve[upper], position);
}

double ParameterAutomation::segmentEndValue(const AutomationSegment &segment) const {
  if (segment.type == AutomationType::Curve) {
    return segment.curve->back();
  }
  return segment.value;
}

double ParameterAutomation::getValueAtTime(double time) const {
  auto maybe_before = this->segments.get(time);
  if (!maybe_before) {
    return this->initial_value;
  }
  auto &before = **maybe_before;

  if (before.type == AutomationType::Target) {
    auto previous = this->segments.getBefore(before.time);
    double previous_value = previous ? this->segmentEndValue(**previous) : this->initial_value;
    return this->exponentialApproach(before.time, previous_value, before.value, before.time_constant, time);
  }

  if (before.type == AutomationType::Curve) {
    return this->curveInterpolate(before, time);
  }

  auto maybe_after = this->segments.getAfter(time);
  if (!maybe_after) {
    return before.value;
  }
  auto &after = **maybe_after;

  switch (after.type) {
  case AutomationType::Linear:
    return this->linearInterpolate(before.time, before.value, after.time, after.value, time);
  case AutomationType::Exponential:
    return this->exponentialInterpolate(before.time, before.value, after.time, after.value, time);
  default:
    return before.value;
  }
}

} // namespace tactus
