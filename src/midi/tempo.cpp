// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace midi {

std::uint64_t
ticks_between(std::optional<std::chrono::steady_clock::time_point> prev,
              std::chrono::steady_clock::time_point cur, unsigned ticksPerBeat,
              std::uint32_t usPerBeat) {
  if (!prev) {
    return 0;
  }
  if (usPerBeat == 0) {
    throw std::invalid_argument("tempo of 0 us per beat");
  }

  const std::int64_t ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(cur - *prev)
          .count();
  if (ns <= 0) {
    return 0; // reordered or non-monotonic timestamps
  }

  // ticks = ns * tpb / (us * 1000), floored. Split into whole beats and the
  // remainder so the product cannot overflow for long gaps.
  const std::uint64_t nsPerBeat = std::uint64_t{usPerBeat} * 1000u;
  const std::uint64_t gap = static_cast<std::uint64_t>(ns);
  const std::uint64_t beats = gap / nsPerBeat;
  const std::uint64_t rest = gap % nsPerBeat;
  return beats * ticksPerBeat + (rest * ticksPerBeat) / nsPerBeat;
}

TempoMap build_tempo_map(const Song &song) {
  // Decide PPQN (ticks per quarter note)
  const unsigned ppqn = song.header.isPPQN
                            ? song.header.ppqn
                            : kDefaultPPQN; // SMPTE: simple fallback for now

  // Work on a copy so we can sort safely
  std::vector<TempoEv> tempi = song.tempi;
  std::stable_sort(
      tempi.begin(), tempi.end(),
      [](const TempoEv &a, const TempoEv &b) { return a.tick < b.tick; });

  double current_usPerQN = static_cast<double>(kDefaultUsPerQN);
  double accSec = 0.0;
  std::uint32_t lastTick = 0;

  TempoMap map;
  map.ppqn = ppqn;
  map.segments.push_back(TempoSeg{0u, 0.0, current_usPerQN});

  for (const auto &t : tempi) {
    // Advance accumulated seconds from lastTick to this tempo-change tick
    const double deltaQN = (t.tick - lastTick) / static_cast<double>(ppqn);
    accSec += deltaQN * (current_usPerQN * 1e-6);

    current_usPerQN = static_cast<double>(t.usPerQN);
    lastTick = t.tick;

    // A tempo at the same tick as the previous segment replaces it (our own
    // files declare their tempo at tick 0, over the implicit default).
    if (map.segments.back().startTick == t.tick) {
      map.segments.back().usPerQN = current_usPerQN;
    } else {
      map.segments.push_back(TempoSeg{t.tick, accSec, current_usPerQN});
    }
  }

  return map;
}

double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo) {
  // Find the last segment whose startTick <= tick (linear scan is fine; lists
  // are tiny)
  const TempoSeg *seg = &tempo.segments.front();
  for (const auto &s : tempo.segments) {
    if (s.startTick <= tick)
      seg = &s;
    else
      break;
  }

  const double deltaQN =
      (tick - seg->startTick) / static_cast<double>(tempo.ppqn);
  return seg->startSec + deltaQN * (seg->usPerQN * 1e-6);
}

} // namespace midi
