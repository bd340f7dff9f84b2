#include "tactus/sorted_timeline.hpp"

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using namespace tactus;

class Item {
public:
  Item(double time, int tag = 0) : time(time), tag(tag) {}
  double getTime() const { return this->time; }
  bool operator==(const Item &other) const { return this->time == other.time && this->tag == other.tag; }

  double time;
  int tag;
};

static std::vector<double> times(SortedTimeline<Item> &tl) {
  std::vector<double> out;
  tl.forEach([&](const Item &i) { out.push_back(i.time); });
  return out;
}

TEST_CASE("SortedTimeline keeps items sorted regardless of insertion order") {
  SortedTimeline<Item> tl;
  std::mt19937 gen(5);
  std::uniform_real_distribution<double> dist(0.0, 100.0);
  for (int i = 0; i < 500; i++) {
    tl.add(Item(dist(gen), i));
  }

  auto t = times(tl);
  REQUIRE(t.size() == 500);
  for (std::size_t i = 1; i < t.size(); i++) {
    REQUIRE(t[i - 1] <= t[i]);
  }
}

TEST_CASE("SortedTimeline matches a simple model under adds, cancels and eviction") {
  const std::size_t memory = 64;
  SortedTimeline<Item> tl(memory);
  // Stably sorted, like the timeline.
  std::vector<Item> model;
  std::mt19937 gen(9);
  std::uniform_real_distribution<double> dist(0.0, 100.0);

  for (int round = 0; round < 3000; round++) {
    auto op = gen() % 10;
    if (op < 7) {
      // Whole numbers so that equal times are common.
      Item item(std::floor(dist(gen)), round);
      tl.add(item);
      auto pos = std::upper_bound(model.begin(), model.end(), item.time,
                                  [](double t, const Item &i) { return t < i.time; });
      model.insert(pos, item);
      if (model.size() > memory) {
        model.erase(model.begin(), model.begin() + (model.size() - memory));
      }
    } else if (op < 9) {
      double cutoff = std::floor(dist(gen));
      tl.cancel(cutoff);
      auto pos = std::lower_bound(model.begin(), model.end(), cutoff,
                                  [](const Item &i, double t) { return i.time < t; });
      model.erase(pos, model.end());
    } else if (model.empty() == false) {
      auto victim = model[gen() % model.size()];
      REQUIRE(tl.remove(victim));
      model.erase(std::find(model.begin(), model.end(), victim));
    }

    REQUIRE(tl.size() == model.size());
    if (round % 25 == 0) {
      std::vector<int> tags;
      tl.forEach([&](const Item &i) { tags.push_back(i.tag); });
      std::vector<int> expected;
      for (auto &i : model) {
        expected.push_back(i.tag);
      }
      REQUIRE(tags == expected);

      double lookup_time = std::floor(dist(gen));
      auto got = tl.get(lookup_time);
      auto it = std::upper_bound(model.begin(), model.end(), lookup_time,
                                 [](double t, const Item &i) { return t < i.time; });
      if (it == model.begin()) {
        REQUIRE_FALSE(got);
      } else {
        REQUIRE(got);
        REQUIRE((*got)->tag == (it - 1)->tag);
      }
    }
  }
}

TEST_CASE("SortedTimeline lookups resolve runs of equal times to the last one added") {
  SortedTimeline<Item> tl;
  tl.add(Item(1.0, 1));
  tl.add(Item(2.0, 2));
  tl.add(Item(2.0, 3));
  tl.add(Item(2.0, 4));
  tl.add(Item(3.0, 5));

  REQUIRE((*tl.get(2.0))->tag == 4);
  REQUIRE((*tl.get(2.5))->tag == 4);
  REQUIRE((*tl.getBefore(2.0))->tag == 1);
  REQUIRE((*tl.getAfter(2.0))->tag == 5);
  REQUIRE_FALSE(tl.get(0.5));
  REQUIRE_FALSE(tl.getBefore(1.0));
  REQUIRE_FALSE(tl.getAfter(3.0));

  std::vector<int> at_two;
  tl.forEachAtTime(2.0, [&](const Item &i) { at_two.push_back(i.tag); });
  REQUIRE(at_two == std::vector<int>{2, 3, 4});
}

TEST_CASE("SortedTimeline lookups on an empty timeline") {
  SortedTimeline<Item> tl;
  REQUIRE_FALSE(tl.get(0.0));
  REQUIRE_FALSE(tl.getBefore(0.0));
  REQUIRE_FALSE(tl.getAfter(0.0));
  REQUIRE_FALSE(tl.peek());
  REQUIRE_FALSE(tl.shift());
  tl.cancel(0.0);
  tl.cancelBefore(0.0);
  REQUIRE(tl.empty());
}

TEST_CASE("SortedTimeline cancel on a single item") {
  SortedTimeline<Item> tl;
  tl.add(Item(5.0));
  tl.cancel(6.0);
  REQUIRE(tl.size() == 1);
  tl.cancel(5.0);
  REQUIRE(tl.empty());

  tl.add(Item(5.0));
  tl.cancel(1.0);
  REQUIRE(tl.empty());

  tl.add(Item(5.0));
  tl.cancelBefore(4.0);
  REQUIRE(tl.size() == 1);
  tl.cancelBefore(5.0);
  REQUIRE(tl.empty());
}

TEST_CASE("SortedTimeline range iteration") {
  SortedTimeline<Item> tl;
  for (int i = 0; i < 5; i++) {
    tl.add(Item((double)i));
  }

  std::vector<double> before, after, from;
  tl.forEachBefore(2.0, [&](const Item &i) { before.push_back(i.time); });
  tl.forEachAfter(2.0, [&](const Item &i) { after.push_back(i.time); });
  tl.forEachFrom(2.0, [&](const Item &i) { from.push_back(i.time); });
  REQUIRE(before == std::vector<double>{0.0, 1.0, 2.0});
  REQUIRE(after == std::vector<double>{3.0, 4.0});
  REQUIRE(from == std::vector<double>{2.0, 3.0, 4.0});
}

TEST_CASE("SortedTimeline cancel and cancelBefore") {
  SortedTimeline<Item> tl;
  for (int i = 0; i < 6; i++) {
    tl.add(Item((double)i));
  }
  tl.add(Item(3.0, 1));

  tl.cancel(3.0);
  REQUIRE(times(tl) == std::vector<double>{0.0, 1.0, 2.0});

  tl.cancelBefore(1.0);
  REQUIRE(times(tl) == std::vector<double>{2.0});

  tl.clear();
  REQUIRE(tl.empty());
  REQUIRE_FALSE(tl.peek());
}

TEST_CASE("SortedTimeline memory bound drops the oldest items") {
  SortedTimeline<Item> tl(3);
  for (int i = 0; i < 5; i++) {
    tl.add(Item((double)i));
  }
  REQUIRE(times(tl) == std::vector<double>{2.0, 3.0, 4.0});

  tl.setMemory(1);
  REQUIRE(times(tl) == std::vector<double>{4.0});
}

TEST_CASE("SortedTimeline shift and peek") {
  SortedTimeline<Item> tl;
  tl.add(Item(2.0));
  tl.add(Item(1.0));

  REQUIRE((*tl.peek())->time == 1.0);
  auto first = tl.shift();
  REQUIRE(first);
  REQUIRE(first->time == 1.0);
  REQUIRE(tl.size() == 1);
  REQUIRE(tl.shift());
  REQUIRE_FALSE(tl.shift());
}

TEST_CASE("SortedTimeline addItems merges a batch stably") {
  SortedTimeline<Item> tl;
  tl.add(Item(1.0, 0));
  tl.add(Item(3.0, 0));

  std::vector<Item> batch{Item(2.0, 1), Item(1.0, 2), Item(0.5, 3), Item(1.0, 4)};
  tl.addItems(batch.begin(), batch.end());

  std::vector<int> tags;
  tl.forEach([&](const Item &i) { tags.push_back(i.tag); });
  REQUIRE(tags == std::vector<int>{3, 0, 2, 4, 1, 0});
}

TEST_CASE("SortedTimeline removal during iteration is deferred") {
  SortedTimeline<Item> tl;
  for (int i = 0; i < 4; i++) {
    tl.add(Item((double)i, i));
  }

  std::vector<int> seen;
  tl.forEach([&](const Item &i) {
    seen.push_back(i.tag);
    REQUIRE(tl.remove(i));
    if (i.tag == 0) {
      // Adding while iterating doesn't disturb the walk.
      tl.add(Item(10.0, 10));
    }
  });

  REQUIRE(seen == std::vector<int>{0, 1, 2, 3});
  REQUIRE(times(tl) == std::vector<double>{10.0});
  REQUIRE_FALSE(tl.remove(Item(10.0, 11)));
  REQUIRE(tl.remove(Item(10.0, 10)));
  REQUIRE(tl.empty());
}

TEST_CASE("SortedTimeline stays usable after a callback throws") {
  SortedTimeline<Item> tl;
  tl.add(Item(1.0, 1));
  tl.add(Item(2.0, 2));

  REQUIRE_THROWS(tl.forEach([&](const Item &i) {
    tl.remove(i);
    throw std::runtime_error("callback failed");
  }));

  // The removal requested before the throw still happened, and removals are immediate again.
  REQUIRE(tl.size() == 1);
  REQUIRE(tl.remove(Item(2.0, 2)));
  REQUIRE(tl.empty());
}
