// src/capture/control_loop.cpp

#include "capture/control_loop.hpp"
#include "common/log.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace capture {

ControlLoop::ControlLoop(Engine &engine, IngestionQueue &queue,
                         ServiceNotifier &notifier, const LoopTiming &timing)
    : engine_(engine), queue_(queue), notifier_(notifier), timing_(timing) {}

void ControlLoop::step(Instant now) {
  auto batch = queue_.drain();
  if (!batch.empty()) {
    engine_.process_batch(std::move(batch));
  }

  if (!lastCheck_ || now - *lastCheck_ >= timing_.checkInterval) {
    engine_.check_timeouts(now);
    notifier_.alive();
    lastCheck_ = now;
  }
}

void ControlLoop::run(const std::atomic<bool> &stopRequested) {
  blog::app("Control loop running");

  while (!stopRequested.load()) {
    try {
      step(Clock::now());
      queue_.wait_for(engine_.low_power() ? timing_.idleWait
                                          : timing_.activeWait);
    } catch (const std::exception &e) {
      blog::error::app("Error in main loop: {}", e.what());
      std::this_thread::sleep_for(timing_.errorBackoff);
    }
  }

  blog::app("Shutdown requested");
  notifier_.stopping();
  engine_.shutdown();
}

} // namespace capture
