#include "tactus/context.hpp"
#include "tactus/engines.hpp"
#include "tactus/transport.hpp"

#include <benchmark/benchmark.h>

/*
 * A minute of a transport at 120 bpm with a busy schedule, rendered offline.
 * */
void bm_transport_offline_minute(benchmark::State &state) {
  for (auto _ : state) {
    tactus::OfflineEngine engine;
    tactus::Context context(engine);
    tactus::Transport transport(context);

    std::size_t calls = 0;
    for (int64_t i = 0; i < state.range(0); i++) {
      transport.scheduleRepeat([&](double) { calls++; }, 48 + i, i);
    }
    transport.start(0.0);
    while (engine.now() < 60.0) {
      context.tick();
      engine.advance(context.getUpdateInterval());
    }
    benchmark::DoNotOptimize(calls);
  }
}

BENCHMARK(bm_transport_offline_minute)->Arg(1)->Arg(16)->Arg(256)->Unit(benchmark::kMillisecond);
