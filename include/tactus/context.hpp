#pragma once

#include "tactus/config.hpp"
#include "tactus/engine.hpp"

#include <concurrentqueue.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tactus {

class Clock;

struct ContextConfig {
  double look_ahead = config::LOOK_AHEAD;
  double update_interval = config::UPDATE_INTERVAL;
};

/*
 * Named tradeoffs between latency and robustness against a late heartbeat.
 * */
enum class LatencyHint {
  Interactive,
  Playback,
  Balanced,
  Fastest,
};

/**
 * The context ties a set of clocks to an audio engine and a heartbeat.
 *
 * Something (a HeartbeatThread, a host's timer, or an offline render loop) calls `tick` roughly every update interval.
 * Each tick:
 *
 * - Measures how late it is compared to the previous one, which becomes the lag clocks compensate for.
 * - Runs every command enqueued from other threads since the last tick.
 * - Lets every registered clock compute the ticks which fall into its lookahead window.
 *
 * All of the scheduling state of the clocks and transports on a context is only touched from inside `tick`, so when
 * the heartbeat runs on its own thread everything else must go through `enqueueCommand`.  Settings on the context
 * itself are atomic and may be changed from anywhere.
 *
 * Clocks and transports may be created and destroyed on any thread.  Registration waits for a heartbeat in progress to
 * finish dispatching, so a clock is never ticked after its destructor has started.
 * */
class Context {
public:
  explicit Context(AudioEngine &engine, const ContextConfig &config = ContextConfig{});

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  AudioEngine &getEngine() { return this->engine; }
  double now() { return this->engine.now(); }

  double getLookAhead() const { return this->look_ahead.load(std::memory_order_relaxed); }
  void setLookAhead(double look_ahead);
  double getUpdateInterval() const { return this->update_interval.load(std::memory_order_relaxed); }
  /* Clamped to at least one engine block. */
  void setUpdateInterval(double interval);
  /* Sets the lookahead, and the update interval to a third of it. */
  void setLatencyHint(LatencyHint hint);
  void setLatencyHint(double look_ahead);

  /**
   * How far behind schedule the heartbeat is running, in seconds.  Never negative.
   * */
  double getLag() const;

  /**
   * Run one heartbeat.
   * */
  void tick();

  /**
   * Run a callable on the next heartbeat.  Safe to call from any thread.
   * */
  template <typename CB> void enqueueCommand(CB &&callable) {
    std::function<void()> cmd{std::forward<CB>(callable)};
    while (this->command_queue.enqueue(cmd) == false)
      ;
  }

  /* Clocks register themselves for their lifetime.  Callable from any thread, and from inside the heartbeat. */
  void registerClock(Clock *clock);
  void unregisterClock(Clock *clock);

private:
  void measureLag(double now);
  void runCommands();

  AudioEngine &engine;
  std::atomic<double> look_ahead;
  std::atomic<double> update_interval;
  std::atomic<double> computed_update_interval{0.0};
  std::optional<double> last_update;
  moodycamel::ConcurrentQueue<std::function<void()>> command_queue;
  /* Recursive because clock callbacks running under it may create and destroy clocks. */
  std::recursive_mutex clocks_mutex;
  std::vector<Clock *> clocks;
};

} // namespace tactus
