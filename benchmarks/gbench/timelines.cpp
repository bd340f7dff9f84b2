#include "tactus/interval_index.hpp"
#include "tactus/sorted_timeline.hpp"

#include <benchmark/benchmark.h>

#include <random>
#include <vector>

namespace {
class Point {
public:
  double getTime() const { return this->time; }
  double time;
};

class Span {
public:
  double getTime() const { return this->time; }
  double getDuration() const { return this->duration; }
  double time;
  double duration;
};

std::vector<double> randomTimes(std::size_t count) {
  std::mt19937 gen(1);
  std::uniform_real_distribution<double> dist(0.0, 10000.0);
  std::vector<double> out(count);
  for (auto &t : out) {
    t = dist(gen);
  }
  return out;
}
} // namespace

void bm_sorted_timeline_add_in_order(benchmark::State &state) {
  for (auto _ : state) {
    tactus::SortedTimeline<Point> tl;
    for (int64_t i = 0; i < state.range(0); i++) {
      tl.add(Point{(double)i});
    }
    benchmark::DoNotOptimize(tl.size());
  }
}

BENCHMARK(bm_sorted_timeline_add_in_order)->Range(64, 8192);

void bm_sorted_timeline_add_items(benchmark::State &state) {
  auto times = randomTimes(state.range(0));
  std::vector<Point> points;
  for (auto t : times) {
    points.push_back(Point{t});
  }

  for (auto _ : state) {
    tactus::SortedTimeline<Point> tl;
    tl.addItems(points.begin(), points.end());
    benchmark::DoNotOptimize(tl.size());
  }
}

BENCHMARK(bm_sorted_timeline_add_items)->Range(64, 8192);

void bm_sorted_timeline_get(benchmark::State &state) {
  tactus::SortedTimeline<Point> tl;
  for (int64_t i = 0; i < state.range(0); i++) {
    tl.add(Point{(double)i});
  }
  double t = 0.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(tl.get(t));
    t += 1.5;
    if (t > (double)state.range(0)) {
      t = 0.0;
    }
  }
}

BENCHMARK(bm_sorted_timeline_get)->Range(64, 8192);

void bm_interval_index_point_query(benchmark::State &state) {
  tactus::IntervalIndex<Span> index;
  for (auto t : randomTimes(state.range(0))) {
    index.add(Span{t, 50.0});
  }

  double point = 0.0;
  for (auto _ : state) {
    std::size_t hits = 0;
    index.forEachAtTime(point, [&](const Span &) { hits++; });
    benchmark::DoNotOptimize(hits);
    point += 7.0;
    if (point > 10000.0) {
      point = 0.0;
    }
  }
}

BENCHMARK(bm_interval_index_point_query)->Range(64, 8192);
