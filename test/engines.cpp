#include "tactus/engines.hpp"
#include "tactus/error.hpp"

#include <catch2/catch_all.hpp>

#include <cmath>

using namespace tactus;

TEST_CASE("OfflineEngine time only moves forward") {
  OfflineEngine engine;
  REQUIRE(engine.now() == 0.0);
  engine.advance(0.5);
  engine.setTime(2.0);
  REQUIRE(engine.now() == 2.0);
  REQUIRE_THROWS_AS(engine.setTime(1.0), ERange);
  REQUIRE_THROWS_AS(engine.setTime(NAN), ERange);
  REQUIRE(engine.now() == 2.0);
}

TEST_CASE("RecordingEngine connections disconnect when destroyed") {
  OfflineEngine engine;
  auto a = engine.createParam(1.0);
  auto b = engine.createParam(0.0);

  {
    auto conn = engine.connectScaled(*a, *b, 0.25);
    REQUIRE(engine.getConnectionCount() == 1);
    REQUIRE(engine.getConnectionRatio(*a, *b) == 0.25);
    REQUIRE(engine.getConnectionRatio(*b, *a) == 0.0);
  }
  REQUIRE(engine.getConnectionCount() == 0);
}

TEST_CASE("Engines reject bad sample rates") {
  REQUIRE_THROWS_AS(OfflineEngine(0.0), ERange);
  REQUIRE_THROWS_AS(OfflineEngine(-44100.0), ERange);
}

TEST_CASE("WallClockEngine is monotonic") {
  WallClockEngine engine;
  double a = engine.now();
  double b = engine.now();
  REQUIRE(a >= 0.0);
  REQUIRE(b >= a);
}
