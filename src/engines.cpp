#include "tactus/engines.hpp"

#include "tactus/error.hpp"
#include "tactus/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <mutex>

namespace tactus {

void RecordingParam::setValue(double value) {
  this->intrinsic_value = value;
  this->instructions.push_back({NativeInstructionType::SetValue, value, 0.0, 0.0});
}

void RecordingParam::setValueAtTime(double value, double time) {
  this->instructions.push_back({NativeInstructionType::SetValueAtTime, value, time, 0.0});
}

void RecordingParam::linearRampToValueAtTime(double value, double time) {
  this->instructions.push_back({NativeInstructionType::LinearRamp, value, time, 0.0});
}

void RecordingParam::exponentialRampToValueAtTime(double value, double time) {
  this->instructions.push_back({NativeInstructionType::ExponentialRamp, value, time, 0.0});
}

void RecordingParam::setTargetAtTime(double value, double time, double time_constant) {
  this->instructions.push_back({NativeInstructionType::SetTarget, value, time, time_constant});
}

void RecordingParam::cancelScheduledValues(double time) {
  this->instructions.push_back({NativeInstructionType::Cancel, 0.0, time, 0.0});
}

class RecordingConnection : public NativeConnection {
public:
  RecordingConnection(RecordingEngine *engine, unsigned long long id) : engine(engine), id(id) {}
  ~RecordingConnection() { this->engine->disconnect(this->id); }

private:
  RecordingEngine *engine;
  unsigned long long id;
};

RecordingEngine::RecordingEngine(double sample_rate) : sample_rate(sample_rate) {
  if (!(sample_rate > 0.0)) {
    throw ERange("Sample rate must be positive");
  }
}

std::unique_ptr<NativeParam> RecordingEngine::createParam(double initial_value) {
  return std::make_unique<RecordingParam>(initial_value);
}

std::unique_ptr<NativeConnection> RecordingEngine::connectScaled(NativeParam &source, NativeParam &destination,
                                                                 double ratio) {
  std::lock_guard<std::mutex> guard(this->links_mutex);
  auto id = this->next_link_id++;
  this->links.push_back({id, &source, &destination, ratio});
  logDebug("Connected native param %p to %p with ratio %f", (void *)&source, (void *)&destination, ratio);
  return std::make_unique<RecordingConnection>(this, id);
}

void RecordingEngine::disconnect(unsigned long long id) {
  std::lock_guard<std::mutex> guard(this->links_mutex);
  this->links.erase(std::remove_if(this->links.begin(), this->links.end(), [&](auto &l) { return l.id == id; }),
                    this->links.end());
}

std::size_t RecordingEngine::getConnectionCount() {
  std::lock_guard<std::mutex> guard(this->links_mutex);
  return this->links.size();
}

double RecordingEngine::getConnectionRatio(const NativeParam &source, const NativeParam &destination) {
  std::lock_guard<std::mutex> guard(this->links_mutex);
  for (auto &l : this->links) {
    if (l.source == &source && l.destination == &destination) {
      return l.ratio;
    }
  }
  return 0.0;
}

void OfflineEngine::setTime(double new_time) {
  if (std::isfinite(new_time) == false || new_time < this->now()) {
    throw ERange("Offline time can only move forward");
  }
  this->time.store(new_time, std::memory_order_release);
}

double WallClockEngine::now() {
  auto elapsed = std::chrono::steady_clock::now() - this->epoch;
  return std::chrono::duration<double>(elapsed).count();
}

} // namespace tactus
