// src/capture/shortcut.cpp

#include "capture/shortcut.hpp"
#include "common/log.hpp"

#include <utility>

namespace capture {

ShortcutDetector::ShortcutDetector(std::uint8_t note, std::string suffix,
                                   std::chrono::nanoseconds timeout)
    : note_(note), suffix_(std::move(suffix)), timeout_(timeout) {}

bool ShortcutDetector::watches(const midi::Message &msg) const {
  return msg.is_note() && msg.note && *msg.note == note_;
}

ShortcutDetector::Result ShortcutDetector::observe(const RawEvent &ev,
                                                   const Sink &flushTo) {
  if (ev.msg.kind == midi::MsgKind::NoteOn) {
    if (tapCount_ > 0 && lastTap_ && ev.arrival - *lastTap_ > timeout_) {
      blog::debug::rec("note {}: {} tap(s) timed out, keeping them as notes",
                       note_, tapCount_);
      flush(flushTo);
    }

    buffer_.push_back(ev);
    ++tapCount_;
    lastTap_ = ev.arrival;

    if (tapCount_ >= kTapsToTrigger) {
      reset();
      return Result::Triggered;
    }
    return Result::Buffered;
  }

  buffer_.push_back(ev);
  return Result::Buffered;
}

void ShortcutDetector::flush(const Sink &to) {
  for (const auto &ev : buffer_) {
    to(ev);
  }
  reset();
}

void ShortcutDetector::reset() {
  buffer_.clear();
  tapCount_ = 0;
  lastTap_.reset();
}

} // namespace capture
