// src/app/preview.hpp
// Pretty, compact console summary of a recorded (or any) MIDI file.
// - SMF header summary
// - Event counts by kind across all tracks, and the duration in seconds
// - First 10 NoteOn/NoteOff events with timestamps (s)

#pragma once
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <ostream>
#include <string>

#include "midi/events.hpp"
#include "midi/tempo.hpp"

namespace app {

// Absolute tick of the last channel/SysEx event in any track.
inline std::uint32_t last_tick(const midi::Song &song) {
  std::uint32_t last = 0;
  for (const auto &track : song.tracks) {
    if (!track.empty()) {
      last = std::max(last, track.back().tick);
    }
  }
  return last;
}

inline void print_preview(const midi::Song &song, const midi::TempoMap &tempo,
                          std::ostream &out = std::cout) {
  // Header
  out << "SMF header:\n";
  out << "  format  = " << song.header.format << "\n";
  out << "  nTracks = " << song.header.nTracks << "\n";
  if (song.header.isPPQN) {
    out << "  PPQN    = " << song.header.ppqn << " ticks/qn\n";
  } else {
    out << "  SMPTE   = " << song.header.smpte_fps << " fps, "
              << song.header.smpte_sub << " subframes\n";
  }
  if (!tempo.segments.empty()) {
    out << "  tempo   = " << std::fixed << std::setprecision(0)
              << tempo.segments.front().usPerQN << " us/qn";
    if (tempo.segments.size() > 1) {
      out << " (+" << tempo.segments.size() - 1 << " changes)";
    }
    out << "\n";
  }

  // Counts by kind; std::map keeps the listing stable
  std::map<std::string, std::size_t> counts;
  std::size_t total = 0;
  for (const auto &track : song.tracks) {
    for (const auto &ev : track) {
      ++counts[midi::kind_name(ev.msg.kind)];
      ++total;
    }
  }
  out << "\nEvents: " << total << "\n";
  for (const auto &[name, n] : counts) {
    out << "  " << std::left << std::setw(15) << name << std::right
              << " " << n << "\n";
  }
  out << "Duration: " << std::fixed << std::setprecision(3)
            << midi::ticks_to_seconds(last_tick(song), tempo) << " s\n";

  // First 10 notes
  out << "\nFirst 10 note events with time:\n";
  const std::size_t limit = std::min<std::size_t>(10, song.notes.size());
  for (std::size_t i = 0; i < limit; ++i) {
    const auto &ev = song.notes[i];
    const double t = midi::ticks_to_seconds(ev.tick, tempo);
    out << "t=" << std::fixed << std::setprecision(3) << t << "s  "
              << (ev.type == midi::EvType::NoteOn ? "On " : "Off")
              << " ch=" << int(ev.ch) << " note=" << int(ev.note)
              << " vel=" << int(ev.vel) << "\n";
  }
}

} // namespace app
