#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace tactus {

/* Usage, from inside the tactus namespace, is config::THING. */
namespace config {

/*
 * Pulses per quarter note used by a Transport unless configured otherwise.
 *
 * 192 divides evenly by 2, 3, 4, 6, 8, 12, 16, 24, 32, 48 and 64, which covers every common subdivision including
 * triplets.
 * */
const std::int64_t PPQ = 192;

const double BPM = 120.0;

/*
 * Quarter notes per measure, i.e. 4/4.
 * */
const double TIME_SIGNATURE = 4.0;

/*
 * How far into the future clocks compute ticks.
 * */
const double LOOK_AHEAD = 0.1;

/*
 * How often the heartbeat is expected to fire.  Always a third of the lookahead by default, so that at least two
 * heartbeats land inside every lookahead window.
 * */
const double UPDATE_INTERVAL = LOOK_AHEAD / 3.0;

/*
 * Decay applied to the measured heartbeat interval on every heartbeat.  Lag grows instantly but shrinks slowly.
 * */
const double LAG_DECAY = 0.97;

/*
 * Exponential math is undefined at 0, so exponential ramps and time constants never go below this.
 * */
const double MIN_OUTPUT = 1e-5;

/*
 * The engine sample rate assumed by the bundled engines when none is given.
 * */
const double SAMPLE_RATE = 44100.0;

/*
 * Native engines render in blocks; the update interval can never usefully be shorter than one.
 * */
const std::size_t BLOCK_SIZE = 128;

/*
 * Maximum number of segments a ParameterAutomation keeps.  Older segments are dropped first.
 * */
const std::size_t AUTOMATION_MEMORY = 1000;

/* Used as "no limit" for timelines. */
const std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

} // namespace config
} // namespace tactus
