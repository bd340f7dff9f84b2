#pragma once

#include <memory>

namespace tactus {

/**
 * A parameter of the native audio engine.
 *
 * Write-only: native automation generally can't be read back, so ParameterAutomation keeps its own shadow of
 * everything it pushes here.
 * */
class NativeParam {
public:
  virtual ~NativeParam() {}

  /* Set the intrinsic value, which inputs connected with connectScaled add to. */
  virtual void setValue(double value) = 0;
  virtual void setValueAtTime(double value, double time) = 0;
  virtual void linearRampToValueAtTime(double value, double time) = 0;
  virtual void exponentialRampToValueAtTime(double value, double time) = 0;
  virtual void setTargetAtTime(double value, double time, double time_constant) = 0;
  virtual void cancelScheduledValues(double time) = 0;
};

/**
 * A connection between two native parameters.  Destroying it disconnects them.
 * */
class NativeConnection {
public:
  virtual ~NativeConnection() {}
};

/**
 * What Tactus needs from the audio engine it drives: a monotonic clock, parameters, and the ability to feed one
 * parameter's output into another through a gain.
 *
 * Implementations must make now() safe to call from whatever thread runs the heartbeat.
 * */
class AudioEngine {
public:
  virtual ~AudioEngine() {}

  /* Seconds, monotonic. */
  virtual double now() = 0;
  virtual double getSampleRate() = 0;

  virtual std::unique_ptr<NativeParam> createParam(double initial_value) = 0;

  /**
   * Feed `source` scaled by `ratio` into `destination`, until the returned connection is destroyed.
   * */
  virtual std::unique_ptr<NativeConnection> connectScaled(NativeParam &source, NativeParam &destination,
                                                          double ratio) = 0;
};

} // namespace tactus
