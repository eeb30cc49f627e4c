// src/capture/queue.hpp
// Ingestion queue: the one concurrency boundary between the delivery threads
// (MIDI callback, port monitor) and the control loop.
//
// Contract:
//  - push() may be called from any thread and never waits on the consumer.
//  - drain() hands over everything queued so far, in push order.
//  - clear() empties the queue in one step and reports how many items it
//    dropped; no item can be both dropped and drained.
//  - wait_for() lets the single consumer sleep until something is pushed,
//    wake() is called, or the timeout passes.

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "capture/types.hpp"

namespace capture {

class IngestionQueue {
public:
  void push(QueueItem item);

  [[nodiscard]] std::deque<QueueItem> drain();

  std::size_t clear();

  // True if items are pending when it returns.
  bool wait_for(std::chrono::nanoseconds timeout);

  // Ends the current (or next) wait_for early.
  void wake();

  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<QueueItem> items_;
  bool woken_ = false;
};

} // namespace capture
