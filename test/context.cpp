#include "tactus/clock.hpp"
#include "tactus/context.hpp"
#include "tactus/engines.hpp"
#include "tactus/error.hpp"
#include "tactus/heartbeat_thread.hpp"
#include "tactus/transport.hpp"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace tactus;

TEST_CASE("Context defaults and latency hints") {
  OfflineEngine engine;
  Context context(engine);
  REQUIRE(context.getLookAhead() == Catch::Approx(0.1));
  REQUIRE(context.getUpdateInterval() == Catch::Approx(0.1 / 3.0));

  context.setLatencyHint(LatencyHint::Playback);
  REQUIRE(context.getLookAhead() == Catch::Approx(0.8));
  REQUIRE(context.getUpdateInterval() == Catch::Approx(0.8 / 3.0));

  context.setLatencyHint(LatencyHint::Fastest);
  REQUIRE(context.getLookAhead() == Catch::Approx(0.01));

  context.setLatencyHint(0.5);
  REQUIRE(context.getUpdateInterval() == Catch::Approx(0.5 / 3.0));

  REQUIRE_THROWS_AS(context.setLookAhead(-1.0), ERange);
  REQUIRE_THROWS_AS(context.setUpdateInterval(0.0), ERange);
}

TEST_CASE("Context clamps the update interval to one block") {
  OfflineEngine engine(44100.0);
  Context context(engine);
  context.setUpdateInterval(1e-6);
  REQUIRE(context.getUpdateInterval() == Catch::Approx(128.0 / 44100.0));
}

TEST_CASE("Context measures lag from late heartbeats and lets it decay") {
  OfflineEngine engine;
  Context context(engine);

  context.tick();
  REQUIRE(context.getLag() == 0.0);

  engine.setTime(0.5);
  context.tick();
  REQUIRE(context.getLag() == Catch::Approx(0.5 - 0.1 / 3.0));

  engine.setTime(0.525);
  context.tick();
  REQUIRE(context.getLag() == Catch::Approx(0.5 * 0.97 - 0.1 / 3.0));

  // On time heartbeats bring it back to 0 eventually.
  for (int i = 0; i < 200; i++) {
    engine.advance(0.02);
    context.tick();
  }
  REQUIRE(context.getLag() == 0.0);
}

TEST_CASE("Context lag widens the clock's window") {
  OfflineEngine engine;
  Context context(engine);
  int count = 0;
  Clock clock(context, [&](double) { count++; }, 100.0);
  clock.start(0.0);

  context.tick();
  int on_time = count;

  engine.setTime(1.0);
  context.tick();
  // Without lag compensation this would reach 1.1333.
  double lag = context.getLag();
  REQUIRE(lag > 0.9);
  REQUIRE(clock.getNextTickTime() >= 1.0 + 0.1 + 0.1 / 3.0 + 2.0 * lag);
  REQUIRE(count > on_time);
}

TEST_CASE("Context runs commands on the next tick, and survives ones that throw") {
  OfflineEngine engine;
  Context context(engine);

  int ran = 0;
  context.enqueueCommand([&]() { ran++; });
  context.enqueueCommand([]() { throw std::runtime_error("command failed"); });
  context.enqueueCommand([&]() { ran++; });
  REQUIRE(ran == 0);

  context.tick();
  REQUIRE(ran == 2);
  context.tick();
  REQUIRE(ran == 2);
}

TEST_CASE("Clocks destroyed mid-heartbeat are skipped") {
  OfflineEngine engine;
  Context context(engine);
  int second_count = 0;
  std::unique_ptr<Clock> second;

  Clock first(context, [&](double) { second.reset(); }, 10.0);
  second = std::make_unique<Clock>(context, [&](double) { second_count++; }, 10.0);
  first.start(0.0);
  second->start(0.0);

  context.tick();
  REQUIRE(second == nullptr);
  REQUIRE(second_count == 0);
}

TEST_CASE("HeartbeatThread drives a context in real time") {
  WallClockEngine engine;
  Context context(engine);
  context.setLatencyHint(LatencyHint::Fastest);

  std::atomic<int> ticks{0};
  std::atomic<int> commands{0};
  Clock clock(context, [&](double) { ticks++; }, 200.0);

  HeartbeatThread heartbeat(context);
  heartbeat.start();
  REQUIRE(heartbeat.isRunning());
  REQUIRE_THROWS_AS(heartbeat.start(), EInvariant);

  context.enqueueCommand([&]() {
    clock.start();
    commands++;
  });

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while ((ticks.load() < 10 || commands.load() == 0) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  heartbeat.stop();

  REQUIRE_FALSE(heartbeat.isRunning());
  REQUIRE(commands.load() == 1);
  REQUIRE(ticks.load() >= 10);

  int after_stop = ticks.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(ticks.load() == after_stop);
}

static bool waitFor(const std::atomic<int> &counter) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (counter.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return counter.load() != 0;
}

TEST_CASE("Clocks and transports come and go off the heartbeat thread") {
  WallClockEngine engine;
  Context context(engine);
  context.setLatencyHint(LatencyHint::Fastest);
  HeartbeatThread heartbeat(context);
  heartbeat.start();

  for (int i = 0; i < 100; i++) {
    std::atomic<int> ticks{0};
    auto clock = std::make_unique<Clock>(context, [&](double) { ticks++; }, 1000.0);
    Clock *raw = clock.get();
    context.enqueueCommand([raw]() { raw->start(); });
    if (waitFor(ticks) == false) {
      heartbeat.stop();
      FAIL("Clock never ticked");
    }
    // The heartbeat may be in the middle of ticking it.
    clock.reset();
  }

  for (int i = 0; i < 20; i++) {
    std::atomic<int> fired{0};
    auto transport = std::make_unique<Transport>(context);
    Transport *raw = transport.get();
    context.enqueueCommand([raw, &fired]() {
      raw->scheduleRepeat([&fired](double) { fired++; }, 1);
      raw->start();
    });
    if (waitFor(fired) == false) {
      heartbeat.stop();
      FAIL("Transport never fired");
    }
    transport.reset();
  }

  heartbeat.stop();
  REQUIRE_FALSE(heartbeat.isRunning());
}
