#include "tactus/error.hpp"
#include "tactus/state_timeline.hpp"

#include <catch2/catch_all.hpp>

#include <cmath>

using namespace tactus;

TEST_CASE("StateTimeline reports the initial state until the first transition") {
  StateTimeline tl(PlaybackState::Stopped);
  REQUIRE(tl.getValueAtTime(100.0) == PlaybackState::Stopped);

  tl.setStateAtTime(PlaybackState::Started, 1.0, 16);
  tl.setStateAtTime(PlaybackState::Paused, 2.0);
  tl.setStateAtTime(PlaybackState::Started, 3.0);

  REQUIRE(tl.getValueAtTime(0.5) == PlaybackState::Stopped);
  REQUIRE(tl.getValueAtTime(1.0) == PlaybackState::Started);
  REQUIRE(tl.getValueAtTime(2.5) == PlaybackState::Paused);
  REQUIRE(tl.getValueAtTime(10.0) == PlaybackState::Started);

  auto first = tl.get(1.5);
  REQUIRE(first);
  REQUIRE((*first)->offset == 16);
  REQUIRE_FALSE((*tl.get(3.0))->offset);
  REQUIRE((*tl.getAfter(1.0))->state == PlaybackState::Paused);
}

TEST_CASE("StateTimeline cancel drops later transitions") {
  StateTimeline tl(PlaybackState::Stopped);
  tl.setStateAtTime(PlaybackState::Started, 1.0);
  tl.setStateAtTime(PlaybackState::Stopped, 5.0);
  tl.cancel(5.0);

  REQUIRE(tl.size() == 1);
  REQUIRE(tl.getValueAtTime(6.0) == PlaybackState::Started);
}

TEST_CASE("StateTimeline rejects non-finite times") {
  StateTimeline tl(PlaybackState::Stopped);
  REQUIRE_THROWS_AS(tl.setStateAtTime(PlaybackState::Started, NAN), EValidation);
  REQUIRE_THROWS_AS(tl.setStateAtTime(PlaybackState::Started, INFINITY), EValidation);
  REQUIRE(tl.size() == 0);
}
