// src/capture/session.hpp
// The session writer: one in-memory track per recording session, written to
// disk as a Standard MIDI File when the session ends.
//
// Lifecycle:
//   begin(first event)  -> empty track, tempo declared by the SmfTrack itself
//   write(event)*       -> (event, delta ticks) appended in order
//   finish(suffix)      -> file saved if at least one event was written
//
// Delta ticks: the first written event gets 0. Later events are placed at
// ticks_between(first, event) and get the difference to the ticks already
// emitted, so rounding never accumulates over a long session and a
// timestamp that goes backwards yields 0.
//
// Messages without a track representation (system common / real-time other
// than SysEx) are skipped; their time folds into the next written event.

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "capture/collaborators.hpp"
#include "capture/types.hpp"
#include "midi/events.hpp"

namespace capture {

struct Session {
  Instant start;
  WallTime wallStart;
  std::optional<Instant> firstEventTime; // event that opened the session
  std::optional<Instant> lastEventTime;  // last event written to the track
  std::optional<Instant> anchor;         // first event written to the track
  std::uint64_t ticksWritten = 0;        // absolute tick of the last write
  midi::SmfTrack track;
};

class SessionWriter {
public:
  SessionWriter(PathBuilder &paths, unsigned ticksPerBeat,
                std::uint32_t usPerBeat);

  void begin(Instant firstEvent, WallTime wallStart);

  [[nodiscard]] bool active() const { return session_.has_value(); }

  void write(const RawEvent &ev);

  // Ends the session. Returns the saved path, or nullopt when nothing was
  // written (no content, or the save failed and was logged).
  std::optional<std::filesystem::path> finish(const std::string &suffix = "");

  [[nodiscard]] const Session *current() const {
    return session_ ? &*session_ : nullptr;
  }

private:
  PathBuilder &paths_;
  unsigned ticksPerBeat_;
  std::uint32_t usPerBeat_;
  std::optional<Session> session_;
};

} // namespace capture
