// src/capture/engine.hpp
// The recorder's state: idle/recording, activity tracking, low-power mode
// and the two shortcut detectors. Owned by the control loop and only ever
// touched from its thread.
//
//   Idle --(any event except clock / active sensing)--> Recording
//   Recording --(idle timeout | shortcut)--> Idle
//   Idle for longer than the idle timeout -> low-power mode, once per idle
//   period; the next accepted event leaves it again.

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include "capture/collaborators.hpp"
#include "capture/queue.hpp"
#include "capture/session.hpp"
#include "capture/shortcut.hpp"
#include "capture/types.hpp"

namespace capture {

struct EngineConfig {
  std::chrono::nanoseconds idleTimeout = std::chrono::seconds(5);
  std::chrono::nanoseconds shortcutTimeout = std::chrono::seconds(1);
  std::uint8_t lowNote = 22;   // A#0: end session
  std::uint8_t highNote = 106; // A#7: end session, bookmark the file
};

class Engine {
public:
  // What the caller should do with the rest of a drained batch.
  enum class Step { Continue, DiscardRest };

  Engine(const EngineConfig &config, IngestionQueue &queue,
         SessionWriter &writer, PowerControl &power, Instant started);

  // Processes items in order; a shortcut trigger drops whatever is left.
  // An item whose processing throws is logged and skipped. Returns the number
  // of items dropped behind a trigger.
  std::size_t process_batch(std::deque<QueueItem> batch);

  Step process(const QueueItem &item);
  Step process_event(const RawEvent &ev);

  // Idle-timeout and low-power check; run on a fixed cadence.
  void check_timeouts(Instant now);

  // Ends the current session. skipQueue drops queued input instead of
  // recording it; skipBuffer drops the shortcut buffers instead of writing
  // them.
  void stop(const std::string &suffix = "", bool skipQueue = false,
            bool skipBuffer = false);

  // Graceful termination: flush the running session, restore power mode.
  void shutdown();

  [[nodiscard]] bool recording() const { return writer_.active(); }
  [[nodiscard]] bool low_power() const { return lowPower_; }
  [[nodiscard]] Instant last_activity() const { return lastActivity_; }
  [[nodiscard]] const ShortcutDetector &low_shortcut() const { return low_; }
  [[nodiscard]] const ShortcutDetector &high_shortcut() const { return high_; }

private:
  enum class Gesture { NotHandled, Handled, Triggered };

  Gesture handle_shortcuts(const RawEvent &ev);
  void flush_shortcuts();
  void trigger(const ShortcutDetector &detector);
  void enter_low_power();
  void exit_low_power();

  EngineConfig config_;
  IngestionQueue &queue_;
  SessionWriter &writer_;
  PowerControl &power_;

  ShortcutDetector low_;
  ShortcutDetector high_;

  Instant lastActivity_;
  bool lowPower_ = false;
};

} // namespace capture
