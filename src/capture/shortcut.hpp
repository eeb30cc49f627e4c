// src/capture/shortcut.hpp
// Triple-tap gesture on one reserved note.
//
// The recorder runs two of these: the LOW note ends the session, the HIGH
// note ends it with a "-bookmark" file name. Taps are held back in a buffer
// until it is clear whether they form a gesture:
//
//   note_on  (watched) : if the previous tap is older than the timeout the
//                        buffer was ordinary playing -> flush it. Then buffer
//                        this event and count the tap; the third tap returns
//                        Triggered and empties the buffer (the taps are gone).
//   note_off (watched) : buffered, tap count unchanged.
//
// Anything else is not this detector's business; the engine calls flush()
// so interrupted sequences end up in the file as ordinary notes.
//
// A Note On with velocity 0 counts as a tap like any other Note On.

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "capture/types.hpp"

namespace capture {

class ShortcutDetector {
public:
  // Receives buffered events when they turn out to be ordinary notes.
  using Sink = std::function<void(const RawEvent &)>;

  enum class Result { Buffered, Triggered };

  static constexpr int kTapsToTrigger = 3;

  ShortcutDetector(std::uint8_t note, std::string suffix,
                   std::chrono::nanoseconds timeout);

  // True for a note_on / note_off on the watched note.
  [[nodiscard]] bool watches(const midi::Message &msg) const;

  // Only call with events for which watches() is true.
  Result observe(const RawEvent &ev, const Sink &flushTo);

  // Hand every buffered event to the sink, in arrival order, and reset.
  void flush(const Sink &to);

  // Drop the buffer without writing it.
  void reset();

  [[nodiscard]] std::uint8_t note() const { return note_; }
  [[nodiscard]] const std::string &suffix() const { return suffix_; }
  [[nodiscard]] int tap_count() const { return tapCount_; }
  [[nodiscard]] std::size_t pending() const { return buffer_.size(); }

private:
  std::uint8_t note_;
  std::string suffix_;
  std::chrono::nanoseconds timeout_;

  int tapCount_ = 0;
  std::vector<RawEvent> buffer_;
  std::optional<Instant> lastTap_;
};

} // namespace capture
