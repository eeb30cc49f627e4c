// src/capture/control_loop.hpp
// The processing thread: drain the queue, run the periodic checks, sleep.
//
// Pacing: while awake the loop waits at most activeWait for new input, in
// low-power mode up to idleWait; either wait ends as soon as input arrives.
// An exception from the processing path is logged and the loop carries on
// after errorBackoff with the session intact.

#pragma once
#include <atomic>
#include <chrono>
#include <optional>

#include "capture/collaborators.hpp"
#include "capture/engine.hpp"
#include "capture/queue.hpp"
#include "capture/types.hpp"

namespace capture {

struct LoopTiming {
  std::chrono::nanoseconds checkInterval = std::chrono::seconds(1);
  std::chrono::nanoseconds activeWait = std::chrono::milliseconds(1);
  std::chrono::nanoseconds idleWait = std::chrono::seconds(5);
  std::chrono::nanoseconds errorBackoff = std::chrono::seconds(1);
};

class ControlLoop {
public:
  ControlLoop(Engine &engine, IngestionQueue &queue, ServiceNotifier &notifier,
              const LoopTiming &timing);

  // Runs until stopRequested is set (call queue.wake() after setting it),
  // then shuts the engine down.
  void run(const std::atomic<bool> &stopRequested);

  // One iteration without the wait: process pending input, then the
  // periodic check if it is due.
  void step(Instant now);

private:
  Engine &engine_;
  IngestionQueue &queue_;
  ServiceNotifier &notifier_;
  LoopTiming timing_;
  std::optional<Instant> lastCheck_;
};

} // namespace capture
