/**
 * Renders a few bars of a metronome offline and prints when every click would sound.
 *
 * Accents the downbeat, swings the eighths, and speeds up over the last bar.
 * */
#include "tactus/context.hpp"
#include "tactus/engines.hpp"
#include "tactus/error.hpp"
#include "tactus/logging.hpp"
#include "tactus/transport.hpp"

#include <stdio.h>
#include <stdlib.h>

int main(int argc, char *argv[]) {
  tactus::logToStderr(tactus::LogLevel::Info);

  int bars = 4;
  if (argc == 2) {
    bars = atoi(argv[1]);
  }
  if (bars <= 0) {
    printf("Usage: %s [bars]\n", argv[0]);
    return 1;
  }

  try {
    tactus::OfflineEngine engine;
    tactus::Context context(engine);

    tactus::TransportConfig config;
    config.bpm = 100.0;
    config.swing = 0.3;
    tactus::Transport transport(context, config);

    auto ppq = transport.getPpq();
    auto measure = (tactus::Ticks)transport.getTicksPerMeasure();

    transport.scheduleRepeat(
        [&](double time) { printf("%8.4f  %s  click\n", time, transport.getPosition().c_str()); }, ppq / 2, 0,
        (double)(measure * bars - 1));
    transport.scheduleRepeat([&](double time) { printf("%8.4f  accent\n", time); }, measure, 0,
                             (double)(measure * bars - 1));
    transport.getEmitter().on(tactus::TransportEvent::Stop,
                              [](double time, double) { printf("%8.4f  stop\n", time); });

    transport.scheduleOnce(
        [&](double time) {
          tactus::logInfo("Ramping to 140 bpm at %f", time);
          transport.rampBpm(140.0, transport.ticksToSeconds((double)measure), time);
        },
        measure * (bars - 1));
    transport.scheduleOnce([&](double time) { transport.stop(time); }, measure * bars);

    transport.start(0.0);
    while (transport.getStateAtTime(engine.now()) != tactus::PlaybackState::Stopped) {
      context.tick();
      engine.advance(context.getUpdateInterval());
    }
  } catch (tactus::Error &e) {
    printf("Error: %s\n", e.getMessage().c_str());
    return 1;
  }

  return 0;
}
