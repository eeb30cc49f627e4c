// src/midi/events.hpp
// Core MIDI domain types shared across the recorder and the review tool.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace midi {

// --- Live message kinds the recorder distinguishes ---
enum class MsgKind {
  NoteOn,        // 0x9n (velocity 0 stays NoteOn; see decode_message)
  NoteOff,       // 0x8n
  ControlChange, // 0xBn
  Clock,         // 0xF8
  ActiveSensing, // 0xFE
  Other          // everything else: program change, bend, SysEx, ...
};

// One complete MIDI message as it came off the wire.
// bytes[0] is always a status byte; note/velocity are filled for note
// messages only.
struct Message {
  MsgKind kind = MsgKind::Other;
  std::vector<std::uint8_t> bytes;
  std::optional<std::uint8_t> note;
  std::optional<std::uint8_t> velocity;

  [[nodiscard]] std::uint8_t status() const {
    return bytes.empty() ? 0 : bytes.front();
  }
  [[nodiscard]] bool is_note() const {
    return kind == MsgKind::NoteOn || kind == MsgKind::NoteOff;
  }
};

// A message placed on a track: delta ticks since the previous event on the
// same track, plus the absolute tick (filled by the reader).
struct TrackEvent {
  std::uint32_t delta = 0;
  std::uint32_t tick = 0;
  Message msg;
};

// Everything needed to serialize one recorded session: format 0, one track,
// a single set-tempo meta at tick 0 followed by the events.
struct SmfTrack {
  unsigned ppqn = 480;              // ticks per quarter note (division)
  std::uint32_t usPerQN = 500000;   // fixed tempo written at tick 0
  std::vector<TrackEvent> events;   // in order; deltas are authoritative
};

// --- Basic event kinds the preview side cares about ---
enum class EvType { NoteOn, NoteOff };

// A channel note event (Note On/Off)
struct NoteEv {
  std::uint32_t tick; // absolute tick in its track timeline
  std::uint8_t ch;    // MIDI channel 0..15
  std::uint8_t note;  // MIDI note number 0..127
  std::uint8_t vel;   // velocity 0..127 (0 + NoteOn == NoteOff)
  EvType type;
};

// A tempo meta event: microseconds per quarter note at a given tick
struct TempoEv {
  std::uint32_t tick;    // absolute tick where tempo takes effect
  std::uint32_t usPerQN; // microseconds per quarter note
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field

  bool isPPQN = true;  // true if PPQN timing, false if SMPTE
  unsigned ppqn = 480; // valid when isPPQN == true
  int smpte_fps = 0;   // valid when isPPQN == false
  int smpte_sub = 0;   // valid when isPPQN == false
};

// A parsed file: header, every track's channel/SysEx events as written, and
// the flattened views the preview consumes.
struct Song {
  SMFHeader header;
  std::vector<std::vector<TrackEvent>> tracks; // per MTrk, meta events omitted
  std::vector<NoteEv> notes;  // flattened across tracks (absolute ticks)
  std::vector<TempoEv> tempi; // collected from all tracks (sorted later)
};

// A precomputed timing map to convert ticks -> seconds under tempo changes.
struct TempoSeg {
  std::uint32_t startTick = 0; // segment begins at this absolute tick
  double startSec = 0;         // time in seconds at startTick
  double usPerQN = 500000.0;   // tempo in this segment
};

// A thin wrapper for tempo info; keeps room for future metadata.
struct TempoMap {
  unsigned ppqn = 480;            // ticks per quarter note
  std::vector<TempoSeg> segments; // ascending by startTick
};

// Human-readable kind name for logs and the preview.
inline const char *kind_name(MsgKind kind) {
  switch (kind) {
  case MsgKind::NoteOn:
    return "note_on";
  case MsgKind::NoteOff:
    return "note_off";
  case MsgKind::ControlChange:
    return "control_change";
  case MsgKind::Clock:
    return "clock";
  case MsgKind::ActiveSensing:
    return "active_sensing";
  case MsgKind::Other:
    break;
  }
  return "other";
}

} // namespace midi
