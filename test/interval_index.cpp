#include "tactus/error.hpp"
#include "tactus/interval_index.hpp"
#include "tactus/types.hpp"

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace tactus;

class Span {
public:
  Span(int id, double time, double duration) : id(id), time(time), duration(duration) {}
  double getTime() const { return this->time; }
  double getDuration() const { return this->duration; }
  bool operator==(const Span &other) const { return this->id == other.id; }

  int id;
  double time;
  double duration;
};

static std::vector<int> idsAt(IntervalIndex<Span> &index, double point) {
  std::vector<int> out;
  index.forEachAtTime(point, [&](const Span &s) { out.push_back(s.id); });
  std::sort(out.begin(), out.end());
  return out;
}

TEST_CASE("IntervalIndex point queries are half-open") {
  IntervalIndex<Span> index;
  index.add(Span(1, 0.0, 10.0));
  index.add(Span(2, 5.0, 2.0));
  index.add(Span(3, 8.0, INFINITE_DURATION));

  REQUIRE(idsAt(index, 0.0) == std::vector<int>{1});
  REQUIRE(idsAt(index, 5.0) == std::vector<int>{1, 2});
  REQUIRE(idsAt(index, 7.0) == std::vector<int>{1});
  REQUIRE(idsAt(index, 9.0) == std::vector<int>{1, 3});
  REQUIRE(idsAt(index, 10.0) == std::vector<int>{3});
  REQUIRE(idsAt(index, 1e9) == std::vector<int>{3});
  REQUIRE(idsAt(index, -1.0).empty());

  REQUIRE((*index.get(9.0))->id == 3);
  REQUIRE((*index.get(6.0))->id == 2);
  REQUIRE_FALSE(index.get(-1.0));
}

TEST_CASE("IntervalIndex rejects bad intervals") {
  IntervalIndex<Span> index;
  REQUIRE_THROWS_AS(index.add(Span(1, 0.0, 0.0)), EValidation);
  REQUIRE_THROWS_AS(index.add(Span(1, 0.0, -1.0)), EValidation);
  REQUIRE_THROWS_AS(index.add(Span(1, 0.0, NAN)), EValidation);
  REQUIRE_THROWS_AS(index.add(Span(1, INFINITY, 1.0)), EValidation);
  REQUIRE(index.empty());
}

TEST_CASE("IntervalIndex stays balanced under random adds and removes") {
  IntervalIndex<Span> index;
  std::vector<Span> live;
  std::mt19937 gen(12);
  std::uniform_real_distribution<double> start_dist(0.0, 1000.0);
  std::uniform_real_distribution<double> len_dist(0.1, 50.0);
  int next_id = 0;

  for (int round = 0; round < 2000; round++) {
    if (live.empty() || gen() % 3 != 0) {
      // Some starts collide on purpose.
      double start = (gen() % 4 == 0) ? 500.0 : start_dist(gen);
      Span s(next_id++, start, len_dist(gen));
      index.add(s);
      live.push_back(s);
    } else {
      auto pos = gen() % live.size();
      REQUIRE(index.remove(live[pos]));
      live.erase(live.begin() + pos);
    }

    if (round % 50 == 0) {
      REQUIRE(index.verifyInvariants());
    }
  }

  REQUIRE(index.verifyInvariants());
  REQUIRE(index.size() == live.size());
  // An AVL tree is never taller than about 1.44 log2(n).
  REQUIRE((double)index.getHeight() <= 1.45 * std::log2((double)live.size() + 2.0));

  for (double point : {0.0, 250.0, 500.0, 500.05, 999.0}) {
    std::vector<int> expected;
    for (auto &s : live) {
      if (s.time <= point && point < s.time + s.duration) {
        expected.push_back(s.id);
      }
    }
    std::sort(expected.begin(), expected.end());
    REQUIRE(idsAt(index, point) == expected);

    // get is the latest start containing the point, and the last one added among equal starts.
    const Span *latest = nullptr;
    for (auto &s : live) {
      if (s.time <= point && point < s.time + s.duration && (latest == nullptr || s.time >= latest->time)) {
        latest = &s;
      }
    }
    auto found = index.get(point);
    if (latest == nullptr) {
      REQUIRE_FALSE(found);
    } else {
      REQUIRE(found);
      REQUIRE((*found)->id == latest->id);
    }
  }
}

TEST_CASE("IntervalIndex keeps equal starts in insertion order") {
  IntervalIndex<Span> index;
  for (int i = 0; i < 20; i++) {
    index.add(Span(i, 1.0, 1.0));
  }
  std::vector<int> order;
  index.forEach([&](const Span &s) { order.push_back(s.id); });
  REQUIRE(order.size() == 20);
  for (int i = 0; i < 20; i++) {
    REQUIRE(order[i] == i);
  }
  REQUIRE((*index.get(1.5))->id == 19);
}

TEST_CASE("IntervalIndex cancel and forEachAfter") {
  IntervalIndex<Span> index;
  for (int i = 0; i < 10; i++) {
    index.add(Span(i, (double)i, 100.0));
  }

  std::vector<int> after;
  index.forEachAfter(7.0, [&](const Span &s) { after.push_back(s.id); });
  REQUIRE(after == std::vector<int>{7, 8, 9});

  index.cancel(5.0);
  REQUIRE(index.size() == 5);
  REQUIRE(index.verifyInvariants());
  REQUIRE(idsAt(index, 50.0) == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("IntervalIndex removal during iteration is deferred and hides the removed items") {
  IntervalIndex<Span> index;
  for (int i = 0; i < 8; i++) {
    index.add(Span(i, 0.0, 10.0));
  }

  std::vector<int> seen;
  index.forEachAtTime(1.0, [&](const Span &s) {
    seen.push_back(s.id);
    if (s.id == 0) {
      index.cancel(0.0);
      index.add(Span(100, 0.0, 10.0));
    }
  });

  REQUIRE(seen == std::vector<int>{0});
  REQUIRE(index.verifyInvariants());
  REQUIRE(index.size() == 1);
  REQUIRE(idsAt(index, 1.0) == std::vector<int>{100});
}

TEST_CASE("IntervalIndex clear") {
  IntervalIndex<Span> index;
  index.add(Span(1, 0.0, 1.0));
  index.add(Span(2, 0.5, 1.0));
  index.clear();
  REQUIRE(index.empty());
  REQUIRE_FALSE(index.get(0.6));
  REQUIRE(index.verifyInvariants());
}

TEST_CASE("IntervalIndex on an empty or single item index") {
  IntervalIndex<Span> index;
  REQUIRE_FALSE(index.get(0.0));
  REQUIRE(idsAt(index, 0.0).empty());
  index.cancel(0.0);
  REQUIRE(index.verifyInvariants());

  index.add(Span(1, 5.0, 1.0));
  index.cancel(6.0);
  REQUIRE(index.size() == 1);
  index.cancel(5.0);
  REQUIRE(index.empty());
  REQUIRE(index.verifyInvariants());
}
