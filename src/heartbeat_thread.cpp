#include "tactus/heartbeat_thread.hpp"

#include "tactus/context.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <cstdint>
#include <exception>

namespace tactus {

HeartbeatThread::~HeartbeatThread() { this->stop(); }

void HeartbeatThread::start() {
  if (this->running.load(std::memory_order_relaxed)) {
    throw EInvariant("Heartbeat thread is already running");
  }
  this->running.store(1, std::memory_order_relaxed);
  this->thread = std::thread([this]() { this->threadFunc(); });
}

void HeartbeatThread::stop() {
  if (this->thread.joinable() == false) {
    return;
  }
  this->running.store(0, std::memory_order_relaxed);
  this->wakeup.signal();
  this->thread.join();
}

void HeartbeatThread::threadFunc() {
  setThreadPurpose("heartbeat");
  logDebug("Heartbeat thread started");

  while (this->running.load(std::memory_order_relaxed)) {
    try {
      this->context.tick();
    } catch (std::exception &e) {
      logError("Exception on heartbeat thread: %s", e.what());
    }
    auto timeout = (std::int64_t)(this->context.getUpdateInterval() * 1000000.0);
    // Only stop() signals, so waking early means it's time to exit.
    this->wakeup.wait(timeout);
  }

  logDebug("Heartbeat thread stopped");
}

} // namespace tactus
