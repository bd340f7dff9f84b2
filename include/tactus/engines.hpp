#pragma once

#include "tactus/config.hpp"
#include "tactus/engine.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace tactus {

/*
 * The engines here don't render audio.  They keep time and record what would have been sent to a real engine, which
 * is what offline scheduling, MIDI-only hosts, and the tests need.
 * */

enum class NativeInstructionType {
  SetValue,
  SetValueAtTime,
  LinearRamp,
  ExponentialRamp,
  SetTarget,
  Cancel,
};

struct NativeInstruction {
  NativeInstructionType type;
  double value;
  double time;
  double time_constant;
};

class RecordingParam : public NativeParam {
public:
  explicit RecordingParam(double initial_value) : intrinsic_value(initial_value) {}

  void setValue(double value) override;
  void setValueAtTime(double value, double time) override;
  void linearRampToValueAtTime(double value, double time) override;
  void exponentialRampToValueAtTime(double value, double time) override;
  void setTargetAtTime(double value, double time, double time_constant) override;
  void cancelScheduledValues(double time) override;

  const std::vector<NativeInstruction> &getInstructions() const { return this->instructions; }
  double getIntrinsicValue() const { return this->intrinsic_value; }

private:
  double intrinsic_value;
  std::vector<NativeInstruction> instructions;
};

class RecordingEngine : public AudioEngine {
public:
  explicit RecordingEngine(double sample_rate = config::SAMPLE_RATE);

  double getSampleRate() override { return this->sample_rate; }
  std::unique_ptr<NativeParam> createParam(double initial_value) override;
  std::unique_ptr<NativeConnection> connectScaled(NativeParam &source, NativeParam &destination,
                                                  double ratio) override;

  std::size_t getConnectionCount();
  /* Ratio of the connection from source to destination, or 0 if there isn't one. */
  double getConnectionRatio(const NativeParam &source, const NativeParam &destination);

private:
  friend class RecordingConnection;

  struct Link {
    unsigned long long id;
    const NativeParam *source;
    const NativeParam *destination;
    double ratio;
  };

  void disconnect(unsigned long long id);

  double sample_rate;
  std::mutex links_mutex;
  std::vector<Link> links;
  unsigned long long next_link_id = 1;
};

/**
 * An engine whose clock only moves when told to.  Used to drive a Context faster than real time.
 * */
class OfflineEngine : public RecordingEngine {
public:
  explicit OfflineEngine(double sample_rate = config::SAMPLE_RATE) : RecordingEngine(sample_rate) {}

  double now() override { return this->time.load(std::memory_order_acquire); }

  /* Time only moves forward; throws ERange otherwise. */
  void setTime(double new_time);
  void advance(double seconds) { this->setTime(this->now() + seconds); }

private:
  std::atomic<double> time{0.0};
};

/**
 * An engine which keeps real time from a monotonic clock, starting at 0 when constructed.
 * */
class WallClockEngine : public RecordingEngine {
public:
  explicit WallClockEngine(double sample_rate = config::SAMPLE_RATE)
      : RecordingEngine(sample_rate), epoch(std::chrono::steady_clock::now()) {}

  double now() override;

private:
  std::chrono::steady_clock::time_point epoch;
};

} // namespace tactus
