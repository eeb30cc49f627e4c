// tests/test_tempo.cpp
// Wall-clock gaps to ticks, and ticks back to seconds through a tempo map.

#include "harness.hpp"

#include "midi/tempo.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>

using namespace midi;
using namespace std::chrono_literals;
using SteadyTime = std::chrono::steady_clock::time_point;

const SteadyTime t0 = std::chrono::steady_clock::now();

void testFirstEvent() {
  TEST("no previous event gives 0")
    ASSERT(ticks_between(std::nullopt, t0, 480, 500000) == 0);
  PASS()
}

void testWholeBeats() {
  TEST("one beat at 120 BPM is ticks_per_beat")
    ASSERT(ticks_between(t0, t0 + 500ms, 480, 500000) == 480);
    ASSERT(ticks_between(t0, t0 + 250ms, 480, 500000) == 240);
    ASSERT(ticks_between(t0, t0 + 2s, 96, 1000000) == 192);
  PASS()
}

void testFloor() {
  TEST("partial ticks are floored")
    // one tick is 500000/480 us ~= 1041.67 us
    ASSERT(ticks_between(t0, t0 + 1ms, 480, 500000) == 0);
    ASSERT(ticks_between(t0, t0 + 1042us, 480, 500000) == 1);
    ASSERT(ticks_between(t0, t0 + 2083us, 480, 500000) == 1);
    ASSERT(ticks_between(t0, t0 + 2084us, 480, 500000) == 2);
  PASS()
}

void testNonMonotonic() {
  TEST("equal or earlier timestamps give 0")
    ASSERT(ticks_between(t0, t0, 480, 500000) == 0);
    ASSERT(ticks_between(t0 + 1s, t0, 480, 500000) == 0);
  PASS()
}

void testLongGap() {
  TEST("hours-long gaps do not overflow")
    const auto tenHours = std::chrono::hours(10);
    ASSERT(ticks_between(t0, t0 + tenHours, 480, 500000) == 72000ull * 480);
    ASSERT(ticks_between(t0, t0 + tenHours, 32767, 1) ==
           36000ull * 1000000ull * 32767ull);
  PASS()
}

void testZeroTempo() {
  TEST("tempo of 0 is rejected")
    ASSERT_THROWS(ticks_between(t0, t0 + 1s, 480, 0), std::invalid_argument);
  PASS()
}

void testSumOfDeltasNeverExceedsTotal() {
  TEST("per-gap floors sum to at most the total, and lose < 1 tick per gap")
    const std::chrono::microseconds gaps[] = {1ms, 333us, 7ms, 1500us, 42ms,
                                              999us, 2s, 1us, 17ms};
    SteadyTime prev = t0;
    std::uint64_t sum = 0;
    std::size_t n = 0;
    for (const auto gap : gaps) {
      const SteadyTime cur = prev + gap;
      sum += ticks_between(prev, cur, 480, 500000);
      prev = cur;
      ++n;
    }
    const std::uint64_t total = ticks_between(t0, prev, 480, 500000);
    ASSERT(sum <= total);
    ASSERT(total - sum <= n);
  PASS()
}

Song song_with_tempi(unsigned ppqn, std::vector<TempoEv> tempi) {
  Song song;
  song.header.isPPQN = true;
  song.header.ppqn = ppqn;
  song.tempi = std::move(tempi);
  return song;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void testDefaultTempoMap() {
  TEST("no tempo events means 120 BPM")
    const TempoMap map = build_tempo_map(song_with_tempi(480, {}));
    ASSERT(map.segments.size() == 1);
    ASSERT(near(ticks_to_seconds(480, map), 0.5));
    ASSERT(near(ticks_to_seconds(0, map), 0.0));
  PASS()
}

void testTempoAtZeroReplacesDefault() {
  TEST("tempo at tick 0 replaces the implicit default")
    const TempoMap map =
        build_tempo_map(song_with_tempi(480, {TempoEv{0, 1000000}}));
    ASSERT(map.segments.size() == 1);
    ASSERT(near(ticks_to_seconds(480, map), 1.0));
  PASS()
}

void testTempoChanges() {
  TEST("tempo changes accumulate, unsorted input is sorted")
    const TempoMap map = build_tempo_map(song_with_tempi(
        100, {TempoEv{200, 250000}, TempoEv{0, 1000000}}));
    ASSERT(map.segments.size() == 2);
    // 200 ticks at 1 s/beat = 2 s, then 100 ticks at 0.25 s/beat
    ASSERT(near(ticks_to_seconds(200, map), 2.0));
    ASSERT(near(ticks_to_seconds(300, map), 2.25));
    ASSERT(near(ticks_to_seconds(50, map), 0.5));
  PASS()
}

void testSmpteFallsBackToDefaultPpqn() {
  TEST("SMPTE files use the default PPQN")
    Song song = song_with_tempi(0, {});
    song.header.isPPQN = false;
    const TempoMap map = build_tempo_map(song);
    ASSERT(map.ppqn == kDefaultPPQN);
  PASS()
}

int main() {
  std::cout << "\n=== Tick timing tests ===\n" << std::endl;

  testFirstEvent();
  testWholeBeats();
  testFloor();
  testNonMonotonic();
  testLongGap();
  testZeroTempo();
  testSumOfDeltasNeverExceedsTotal();

  std::cout << "\n=== Tempo map tests ===\n" << std::endl;

  testDefaultTempoMap();
  testTempoAtZeroReplacesDefault();
  testTempoChanges();
  testSmpteFallsBackToDefaultPpqn();

  return summary();
}
