#pragma once

#include <lightweightsemaphore.h>

#include <atomic>
#include <thread>

namespace tactus {

class Context;

/*
 * Drives a context from a background thread, calling Context::tick once per update interval.
 *
 * While this is running, the clocks and transports of the context must only be touched through
 * Context::enqueueCommand or from their own callbacks.  Exceptions escaping a tick are logged and the thread keeps
 * going.
 *
 * Start and stop are not threadsafe with respect to each other.  The destructor stops the thread.
 * */
class HeartbeatThread {
public:
  explicit HeartbeatThread(Context &context) : context(context) {}
  ~HeartbeatThread();

  HeartbeatThread(const HeartbeatThread &) = delete;
  HeartbeatThread &operator=(const HeartbeatThread &) = delete;

  void start();
  void stop();
  bool isRunning() const { return this->running.load(std::memory_order_relaxed) != 0; }

private:
  void threadFunc();

  Context &context;
  std::thread thread;
  std::atomic<int> running{0};
  moodycamel::LightweightSemaphore wakeup;
};

} // namespace tactus
