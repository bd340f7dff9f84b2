#include "tactus/context.hpp"

#include "tactus/clock.hpp"
#include "tactus/config.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>
#include <vector>

namespace tactus {

static void checkLookAhead(double look_ahead) {
  if (std::isfinite(look_ahead) == false || look_ahead < 0.0) {
    throw ERange("Lookahead must be finite and not negative");
  }
}

Context::Context(AudioEngine &engine, const ContextConfig &config)
    : engine(engine), look_ahead(config.look_ahead), update_interval(config.update_interval) {
  checkLookAhead(config.look_ahead);
  if (std::isfinite(config.update_interval) == false || config.update_interval <= 0.0) {
    throw ERange("Update interval must be finite and positive");
  }
  double sample_rate = engine.getSampleRate();
  if (std::isfinite(sample_rate) == false || sample_rate <= 0.0) {
    throw EValidation("Engine reported an invalid sample rate");
  }
  this->setUpdateInterval(config.update_interval);
}

void Context::setLookAhead(double new_look_ahead) {
  checkLookAhead(new_look_ahead);
  this->look_ahead.store(new_look_ahead, std::memory_order_relaxed);
}

void Context::setUpdateInterval(double interval) {
  if (std::isfinite(interval) == false || interval <= 0.0) {
    throw ERange("Update interval must be finite and positive");
  }
  double block = config::BLOCK_SIZE / this->engine.getSampleRate();
  this->update_interval.store(std::max(interval, block), std::memory_order_relaxed);
}

void Context::setLatencyHint(LatencyHint hint) {
  double seconds = 0.0;
  switch (hint) {
  case LatencyHint::Interactive:
    seconds = 0.1;
    break;
  case LatencyHint::Playback:
    seconds = 0.8;
    break;
  case LatencyHint::Balanced:
    seconds = 0.25;
    break;
  case LatencyHint::Fastest:
    seconds = 0.01;
    break;
  }
  this->setLatencyHint(seconds);
}

void Context::setLatencyHint(double seconds) {
  checkLookAhead(seconds);
  this->setLookAhead(seconds);
  this->setUpdateInterval(seconds / 3.0);
}

double Context::getLag() const {
  double diff = this->computed_update_interval.load(std::memory_order_relaxed) - this->getUpdateInterval();
  return std::max(diff, 0.0);
}

void Context::measureLag(double now) {
  if (this->last_update) {
    double diff = now - *this->last_update;
    double computed = this->computed_update_interval.load(std::memory_order_relaxed);
    this->computed_update_interval.store(std::max(diff, computed * config::LAG_DECAY), std::memory_order_relaxed);
  }
  this->last_update = now;
}

void Context::runCommands() {
  std::function<void()> cmd;
  while (this->command_queue.try_dequeue(cmd)) {
    try {
      cmd();
    } catch (std::exception &e) {
      logError("Got exception running command: %s", e.what());
    }
  }
}

void Context::tick() {
  this->measureLag(this->now());
  this->runCommands();

  std::lock_guard<std::recursive_mutex> guard(this->clocks_mutex);
  // Clocks may be created or destroyed by the callbacks they run.
  auto snapshot = this->clocks;
  for (auto *clock : snapshot) {
    if (std::find(this->clocks.begin(), this->clocks.end(), clock) == this->clocks.end()) {
      continue;
    }
    clock->processHeartbeat();
  }
}

void Context::registerClock(Clock *clock) {
  std::lock_guard<std::recursive_mutex> guard(this->clocks_mutex);
  if (std::find(this->clocks.begin(), this->clocks.end(), clock) == this->clocks.end()) {
    this->clocks.push_back(clock);
  }
}

void Context::unregisterClock(Clock *clock) {
  std::lock_guard<std::recursive_mutex> guard(this->clocks_mutex);
  this->clocks.erase(std::remove(this->clocks.begin(), this->clocks.end(), clock), this->clocks.end());
}

} // namespace tactus
