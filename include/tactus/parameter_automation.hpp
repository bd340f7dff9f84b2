#pragma once

#include "tactus/config.hpp"
#include "tactus/engine.hpp"
#include "tactus/sorted_timeline.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace tactus {

enum class AutomationType {
  Set,
  Linear,
  Exponential,
  Target,
  Curve,
};

/*
 * Units only affect which kind of ramp rampTo picks: quantities which are perceived logarithmically ramp
 * exponentially.
 * */
enum class ParameterUnits {
  Default,
  Frequency,
  Bpm,
  Decibels,
};

/**
 * One scheduled change.  Ramps (Linear, Exponential) describe where a ramp ends: they ramp from the segment before
 * them.  Target and Curve start at their time.
 * */
class AutomationSegment {
public:
  double getTime() const { return this->time; }

  AutomationType type;
  double value;
  double time;
  /* Target only. */
  double time_constant = 0.0;
  /* Curve only. */
  double duration = 0.0;
  std::shared_ptr<const std::vector<double>> curve;
};

/**
 * A parameter of the native engine, together with a shadow record of everything which was scheduled on it.
 *
 * Every scheduling call pushes the native instruction and appends a segment to the shadow timeline, so that the value
 * at any past, present, or future time can be computed with the same math the engine uses.  Calls validate all of
 * their arguments first and throw before touching either side if anything is wrong.
 *
 * Times are in seconds of the engine's clock.
 * */
class ParameterAutomation {
public:
  ParameterAutomation(AudioEngine &engine, double initial_value, ParameterUnits units = ParameterUnits::Default);

  ParameterAutomation(const ParameterAutomation &) = delete;
  ParameterAutomation &operator=(const ParameterAutomation &) = delete;

  /**
   * The value at the given time, as the native parameter would compute it from what was scheduled.
   * */
  double getValueAtTime(double time) const;
  /* The value now. */
  double getValue() const;

  /**
   * Replace the value outright: the new value becomes the initial value and everything scheduled is cancelled.
   * */
  void setValue(double value);

  void setValueAtTime(double value, double time);
  void linearRampToValueAtTime(double value, double end_time);
  /**
   * Exponential math is undefined at 0: ramps to values under config::MIN_OUTPUT ramp to MIN_OUTPUT and then jump to
   * 0, and ramps from a scheduled 0 start from MIN_OUTPUT instead.
   * */
  void exponentialRampToValueAtTime(double value, double end_time);
  /**
   * Approach `value` exponentially starting at `start_time`.  Both the value and the time constant are clamped to at
   * least config::MIN_OUTPUT.
   * */
  void setTargetAtTime(double value, double start_time, double time_constant);
  /**
   * Interpolate linearly through `values` (multiplied by `scaling`), spread evenly over `duration` seconds.
   * */
  void setValueCurveAtTime(const std::vector<double> &values, double start_time, double duration,
                           double scaling = 1.0);
  /* Cancel everything at or after `after`. */
  void cancelScheduledValues(double after);

  /**
   * Pin the value at `time` so that new ramps start from where the parameter actually is then, even when that is in
   * the middle of an existing ramp or curve.
   * */
  void setRampPoint(double time);

  /*
   * Conveniences which anchor at start_time (default now) with setRampPoint and then ramp over ramp_time seconds.
   * */
  void linearRampToValue(double value, double ramp_time, std::optional<double> start_time = std::nullopt);
  void exponentialRampToValue(double value, double ramp_time, std::optional<double> start_time = std::nullopt);
  void targetRampTo(double value, double ramp_time, std::optional<double> start_time = std::nullopt);
  /* Exponential for Frequency, Bpm and Decibels; linear otherwise. */
  void rampTo(double value, double ramp_time, std::optional<double> start_time = std::nullopt);

  double getInitialValue() const { return this->initial_value; }
  ParameterUnits getUnits() const { return this->units; }
  std::size_t getSegmentCount() const { return this->segments.size(); }
  NativeParam &getNativeParam() { return *this->native; }

private:
  void addSegment(AutomationSegment segment);
  double exponentialApproach(double t0, double v0, double v1, double time_constant, double t) const;
  double linearInterpolate(double t0, double v0, double t1, double v1, double t) const;
  double exponentialInterpolate(double t0, double v0, double t1, double v1, double t) const;
  double curveInterpolate(const AutomationSegment &segment, double time) const;
  /* Where a segment leaves the parameter once it is over. */
  double segmentEndValue(const AutomationSegment &segment) const;
  double resolveStartTime(std::optional<double> start_time) const;

  AudioEngine &engine;
  std::unique_ptr<NativeParam> native;
  double initial_value;
  ParameterUnits units;
  SortedTimeline<AutomationSegment> segments{config::AUTOMATION_MEMORY};
};

} // namespace tactus
