// src/app/config.hpp
// Everything the recorder can be told from the outside, with the defaults it
// runs with when nothing is said. Filled in by app::parse_recorder_cli().

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "capture/control_loop.hpp"
#include "capture/engine.hpp"
#include "capture/port_monitor.hpp"
#include "midi/tempo.hpp"

namespace app {

struct RecorderConfig {
  std::filesystem::path baseDir = "midi_recordings";
  std::filesystem::path logFile; // empty: stdout only

  std::chrono::nanoseconds idleTimeout = std::chrono::seconds(5);
  std::chrono::nanoseconds checkInterval = std::chrono::seconds(1);
  std::chrono::nanoseconds idleCheckInterval = std::chrono::seconds(5);
  std::chrono::nanoseconds shortcutTimeout = std::chrono::seconds(1);

  std::uint8_t lowNote = 22;   // A#0/Bb0
  std::uint8_t highNote = 106; // A#7/Bb7

  unsigned ticksPerBeat = midi::kDefaultPPQN;
  std::uint32_t usPerBeat = midi::kDefaultUsPerQN;

  std::string portMatch = "pia"; // matches "Digital Piano", "PIANO", ...

  bool powerControl = true;
  bool verbose = false;
  bool listPorts = false;
};

inline capture::EngineConfig engine_config(const RecorderConfig &cfg) {
  capture::EngineConfig e;
  e.idleTimeout = cfg.idleTimeout;
  e.shortcutTimeout = cfg.shortcutTimeout;
  e.lowNote = cfg.lowNote;
  e.highNote = cfg.highNote;
  return e;
}

inline capture::LoopTiming loop_timing(const RecorderConfig &cfg) {
  capture::LoopTiming t;
  t.checkInterval = cfg.checkInterval;
  t.idleWait = cfg.idleCheckInterval;
  return t;
}

// Port rescans follow the check cadence; failures back off to twice that.
inline capture::PortMonitorTiming port_timing(const RecorderConfig &cfg) {
  capture::PortMonitorTiming t;
  t.scanInterval = cfg.checkInterval;
  t.errorInterval = cfg.checkInterval * 2;
  return t;
}

} // namespace app
