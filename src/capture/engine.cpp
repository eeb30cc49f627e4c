// src/capture/engine.cpp

#include "capture/engine.hpp"
#include "common/log.hpp"

#include <exception>
#include <utility>
#include <variant>

namespace capture {

Engine::Engine(const EngineConfig &config, IngestionQueue &queue,
               SessionWriter &writer, PowerControl &power, Instant started)
    : config_(config), queue_(queue), writer_(writer), power_(power),
      low_(config.lowNote, "", config.shortcutTimeout),
      high_(config.highNote, "-bookmark", config.shortcutTimeout),
      lastActivity_(started) {}

std::size_t Engine::process_batch(std::deque<QueueItem> batch) {
  while (!batch.empty()) {
    QueueItem item = std::move(batch.front());
    batch.pop_front();
    Step step = Step::Continue;
    try {
      step = process(item);
    } catch (const std::exception &e) {
      // only the failing item is lost; the rest of the batch still counts
      blog::error::rec("Error processing MIDI message: {}", e.what());
      continue;
    }
    if (step == Step::DiscardRest) {
      if (!batch.empty()) {
        blog::debug::rec("discarding {} event(s) behind the shortcut",
                         batch.size());
      }
      return batch.size();
    }
  }
  return 0;
}

Engine::Step Engine::process(const QueueItem &item) {
  if (const auto *notice = std::get_if<PortNotice>(&item)) {
    if (notice->connected) {
      blog::port("Connected to {}", notice->name);
    } else {
      blog::port("MIDI port lost: {}", notice->name);
    }
    return Step::Continue;
  }
  return process_event(std::get<RawEvent>(item));
}

Engine::Step Engine::process_event(const RawEvent &ev) {
  const auto kind = ev.msg.kind;
  if (kind == midi::MsgKind::Clock || kind == midi::MsgKind::ActiveSensing) {
    return Step::Continue;
  }

  lastActivity_ = ev.arrival;
  if (lowPower_) {
    exit_low_power();
  }
  if (!writer_.active()) {
    writer_.begin(ev.arrival, std::chrono::system_clock::now());
  }

  switch (handle_shortcuts(ev)) {
  case Gesture::Triggered:
    return Step::DiscardRest;
  case Gesture::Handled:
    return Step::Continue;
  case Gesture::NotHandled:
    break;
  }
  writer_.write(ev);
  return Step::Continue;
}

Engine::Gesture Engine::handle_shortcuts(const RawEvent &ev) {
  if (ev.msg.is_note()) {
    for (ShortcutDetector *detector : {&low_, &high_}) {
      if (!detector->watches(ev.msg)) {
        continue;
      }
      const auto sink = [this](const RawEvent &e) { writer_.write(e); };
      if (detector->observe(ev, sink) == ShortcutDetector::Result::Triggered) {
        trigger(*detector);
        return Gesture::Triggered;
      }
      return Gesture::Handled;
    }
  }

  // Anything else interrupts a pending sequence: those taps were notes.
  flush_shortcuts();
  return Gesture::NotHandled;
}

void Engine::flush_shortcuts() {
  const auto sink = [this](const RawEvent &e) { writer_.write(e); };
  low_.flush(sink);
  high_.flush(sink);
}

void Engine::trigger(const ShortcutDetector &detector) {
  const std::string suffix = detector.suffix();
  const std::size_t dropped = queue_.clear();
  blog::rec("Shortcut on note {} - {}", detector.note(),
            suffix.empty() ? "ending session" : "ending session with bookmark");
  if (dropped > 0) {
    blog::debug::rec("dropped {} queued item(s)", dropped);
  }
  stop(suffix, true, true);
}

void Engine::stop(const std::string &suffix, bool skipQueue, bool skipBuffer) {
  if (!writer_.active()) {
    return;
  }

  if (!skipQueue) {
    // Input that already arrived belongs to this session.
    process_batch(queue_.drain());
    if (!writer_.active()) {
      return; // a shortcut in that input ended the session already
    }
  }

  if (skipBuffer) {
    low_.reset();
    high_.reset();
  } else {
    flush_shortcuts();
  }

  writer_.finish(suffix);
}

void Engine::check_timeouts(Instant now) {
  if (now - lastActivity_ <= config_.idleTimeout) {
    return;
  }
  if (writer_.active()) {
    blog::rec("Session timeout - stopping recording");
    stop();
    if (now - lastActivity_ <= config_.idleTimeout) {
      return; // the closing drain picked up fresh input
    }
  }
  if (!lowPower_) {
    enter_low_power();
  }
}

void Engine::shutdown() {
  if (writer_.active()) {
    blog::rec("Shutdown - saving current session");
    stop();
  }
  if (lowPower_) {
    exit_low_power();
  }
}

void Engine::enter_low_power() {
  lowPower_ = true;
  blog::power("Entering low power mode");
  power_.set_power_mode(true);
}

void Engine::exit_low_power() {
  lowPower_ = false;
  blog::power("Exiting low power mode");
  power_.set_power_mode(false);
}

} // namespace capture
