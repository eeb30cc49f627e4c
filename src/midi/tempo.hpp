// src/midi/tempo.hpp
// Timing utilities: wall-clock gaps -> ticks for recording, and a tempo map
// for ticks -> seconds when reviewing a file.
//
// Contract:
//  - ticks_between(prev, cur, ticksPerBeat, usPerBeat): integer tick delta
//      * 0 when prev is absent (first event of a session)
//      * floor(seconds * ticksPerBeat * 1e6 / usPerBeat), exact integer math
//      * never negative: a cur earlier than prev yields 0
//  - build_tempo_map(const Song&): consumes Song.header + Song.tempi
//      * Assumes PPQN timing. If the file uses SMPTE timing, we currently
//        fall back to a default PPQN (480) inside the implementation.
//  - ticks_to_seconds(tick, TempoMap): converts absolute tick to seconds.

#pragma once
#include "midi/events.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace midi {

// Default tempo: 120 BPM => 500,000 microseconds per quarter note
constexpr std::uint32_t kDefaultUsPerQN = 500000;
constexpr unsigned kDefaultPPQN = 480;

std::uint64_t
ticks_between(std::optional<std::chrono::steady_clock::time_point> prev,
              std::chrono::steady_clock::time_point cur, unsigned ticksPerBeat,
              std::uint32_t usPerBeat);

// Build a tempo map from a parsed Song.
TempoMap build_tempo_map(const Song &song);

// Convert an absolute tick to seconds using the TempoMap.
// - Works for any tick within or after the last segment: beyond the last
//   tempo change we continue with the last tempo.
double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo);

} // namespace midi
