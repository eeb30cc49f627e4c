// src/capture/session.cpp

#include "capture/session.hpp"
#include "common/log.hpp"
#include "io/io.hpp"
#include "midi/message.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace capture {

namespace {
// Largest delta a VLQ can carry (28 bits).
constexpr std::uint64_t kMaxDelta = 0x0FFFFFFF;
} // namespace

SessionWriter::SessionWriter(PathBuilder &paths, unsigned ticksPerBeat,
                             std::uint32_t usPerBeat)
    : paths_(paths), ticksPerBeat_(ticksPerBeat), usPerBeat_(usPerBeat) {}

void SessionWriter::begin(Instant firstEvent, WallTime wallStart) {
  Session s;
  s.start = Clock::now();
  s.wallStart = wallStart;
  s.firstEventTime = firstEvent;
  s.track.ppqn = ticksPerBeat_;
  s.track.usPerQN = usPerBeat_;
  session_ = std::move(s);
  blog::rec("Started new recording session");
}

void SessionWriter::write(const RawEvent &ev) {
  if (!session_) {
    return;
  }
  if (!midi::is_storable(ev.msg)) {
    blog::debug::rec("skipping {} (status {:#04x}), no track representation",
                     midi::kind_name(ev.msg.kind), ev.msg.status());
    return;
  }

  Session &s = *session_;
  std::uint64_t delta = 0;
  if (!s.anchor) {
    s.anchor = ev.arrival;
  } else {
    const std::uint64_t at =
        midi::ticks_between(s.anchor, ev.arrival, ticksPerBeat_, usPerBeat_);
    delta = at > s.ticksWritten ? at - s.ticksWritten : 0;
    delta = std::min(delta, kMaxDelta);
    s.ticksWritten += delta;
  }

  s.track.events.push_back(midi::TrackEvent{
      static_cast<std::uint32_t>(delta),
      static_cast<std::uint32_t>(std::min(s.ticksWritten, kMaxDelta)), ev.msg});
  s.lastEventTime = ev.arrival;
}

std::optional<std::filesystem::path>
SessionWriter::finish(const std::string &suffix) {
  if (!session_) {
    return std::nullopt;
  }
  Session s = std::move(*session_);
  session_.reset();

  if (s.track.events.empty()) {
    blog::rec("Session ended without musical content, nothing saved");
    return std::nullopt;
  }

  try {
    const auto path = paths_.session_path(s.wallStart, suffix);
    io::write_all_atomic(path, midi::encode_smf(s.track));
    blog::rec("Saved recording to {}", path.string());

    double duration = 0.0;
    if (s.firstEventTime && s.lastEventTime) {
      duration =
          std::chrono::duration<double>(*s.lastEventTime - *s.firstEventTime)
              .count();
    }
    blog::rec("Session duration: {:.1f} seconds, Messages: {}", duration,
              s.track.events.size());
    return path;
  } catch (const std::exception &e) {
    blog::error::rec("Could not save session ({} messages lost): {}",
                     s.track.events.size(), e.what());
  }
  return std::nullopt;
}

} // namespace capture
