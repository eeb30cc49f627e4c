// src/app/cli.hpp
// Minimal, robust CLI parsing for the two executables.
//
//   midi-recorder [options]            -> app::parse_recorder_cli()
//   midi-review <file.mid>             -> app::parse_review_cli()
//
// Design notes:
//  * Header-only to keep wiring simple.
//  * We throw std::runtime_error on problems (including --help, which
//    carries the usage text); main() catches and prints.

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/config.hpp"

namespace app {

struct ReviewCli {
  std::filesystem::path midiPath;
};

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline std::string recorder_usage(const std::string &argv0) {
  return "Usage:\n  " + argv0 +
         " [options]\n"
         "Options:\n"
         "  --base-dir <dir>            where sessions are saved "
         "(default midi_recordings)\n"
         "  --idle-timeout <s>          end a session after this much "
         "silence (default 5)\n"
         "  --check-interval <s>        timeout check cadence (default 1)\n"
         "  --idle-check-interval <s>   loop wait in low-power mode "
         "(default 5)\n"
         "  --shortcut-timeout <s>      max gap between shortcut taps "
         "(default 1)\n"
         "  --low-note <n>              triple-tap to end session (default "
         "22)\n"
         "  --high-note <n>             triple-tap to end + bookmark "
         "(default 106)\n"
         "  --ticks-per-beat <n>        file resolution (default 480)\n"
         "  --tempo <us>                microseconds per beat (default "
         "500000)\n"
         "  --port <text>               prefer the port whose name contains "
         "this (default pia)\n"
         "  --log-file <path>           also append the log here\n"
         "  --no-power                  never switch the CPU governor\n"
         "  --verbose                   debug logging\n"
         "  --list-ports                print MIDI inputs and exit\n";
}

// Parse a decimal integer in [lo, hi]; the flag name goes into the error.
inline long parse_int(const std::string &flag, const std::string &value,
                      long lo, long hi) {
  std::size_t used = 0;
  long v = 0;
  try {
    v = std::stol(value, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
  }
  if (used != value.size()) {
    throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
  }
  if (v < lo || v > hi) {
    throw std::runtime_error(flag + " must be in " + std::to_string(lo) +
                             ".." + std::to_string(hi));
  }
  return v;
}

// Parse a positive number of seconds ("5", "0.25").
inline std::chrono::nanoseconds parse_seconds(const std::string &flag,
                                              const std::string &value) {
  std::size_t used = 0;
  double s = 0.0;
  try {
    s = std::stod(value, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects seconds, got '" + value + "'");
  }
  if (used != value.size() || !(s > 0.0) || s > 86400.0) {
    throw std::runtime_error(flag + " expects seconds in (0, 86400], got '" +
                             value + "'");
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(s));
}

// Parse argv into a RecorderConfig.
// Throws std::runtime_error on any invalid input.
inline RecorderConfig parse_recorder_cli(int argc, char **argv) {
  const std::string argv0 = argc > 0 ? argv[0] : "midi-recorder";
  RecorderConfig cfg;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc || is_flag_like(argv[i + 1])) {
        throw std::runtime_error(a + " requires a value");
      }
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      throw std::runtime_error(recorder_usage(argv0));
    } else if (a == "--base-dir") {
      cfg.baseDir = value();
    } else if (a == "--log-file") {
      cfg.logFile = value();
    } else if (a == "--idle-timeout") {
      cfg.idleTimeout = parse_seconds(a, value());
    } else if (a == "--check-interval") {
      cfg.checkInterval = parse_seconds(a, value());
    } else if (a == "--idle-check-interval") {
      cfg.idleCheckInterval = parse_seconds(a, value());
    } else if (a == "--shortcut-timeout") {
      cfg.shortcutTimeout = parse_seconds(a, value());
    } else if (a == "--low-note") {
      cfg.lowNote = static_cast<std::uint8_t>(parse_int(a, value(), 0, 127));
    } else if (a == "--high-note") {
      cfg.highNote = static_cast<std::uint8_t>(parse_int(a, value(), 0, 127));
    } else if (a == "--ticks-per-beat") {
      cfg.ticksPerBeat =
          static_cast<unsigned>(parse_int(a, value(), 1, 0x7FFF));
    } else if (a == "--tempo") {
      cfg.usPerBeat =
          static_cast<std::uint32_t>(parse_int(a, value(), 1, 0xFFFFFF));
    } else if (a == "--port") {
      cfg.portMatch = value();
    } else if (a == "--no-power") {
      cfg.powerControl = false;
    } else if (a == "--verbose" || a == "-v") {
      cfg.verbose = true;
    } else if (a == "--list-ports") {
      cfg.listPorts = true;
    } else {
      throw std::runtime_error("Unknown option: " + a);
    }
  }

  if (cfg.lowNote == cfg.highNote) {
    throw std::runtime_error("--low-note and --high-note must differ");
  }
  return cfg;
}

// Contract:
//  - argv[1] must be the MIDI file path (positional), nothing follows it.
//  - Throws std::runtime_error on any invalid input.
inline ReviewCli parse_review_cli(int argc, char **argv) {
  const std::string argv0 = argc > 0 ? argv[0] : "midi-review";
  const std::string usage =
      "Usage:\n  " + argv0 +
      " <file.mid>\n"
      "Prints the header, event counts, duration and first notes.\n";

  if (argc < 2) {
    throw std::runtime_error(usage);
  }

  std::filesystem::path midiPath = argv[1];
  if (is_flag_like(midiPath.string())) {
    if (midiPath == "--help" || midiPath == "-h") {
      throw std::runtime_error(usage);
    }
    throw std::runtime_error(
        "First argument must be a MIDI file path, not a flag.");
  }
  if (!std::filesystem::exists(midiPath) ||
      !std::filesystem::is_regular_file(midiPath)) {
    throw std::runtime_error("MIDI file not found: " + midiPath.string());
  }

  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      throw std::runtime_error(usage);
    }
    throw std::runtime_error("Unexpected argument: " + a);
  }

  ReviewCli cli;

  cli.midiPath = std::filesystem::canonical(midiPath);
  return cli;
}

} // namespace app
