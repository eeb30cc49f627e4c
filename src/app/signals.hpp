// src/app/signals.hpp
// SIGINT/SIGTERM handling for the daemon. The signals are blocked in every
// thread and collected by one sigwait thread, so nothing runs in signal
// context: the watcher raises the stop flag and wakes the control loop.

#pragma once
#include <atomic>
#include <csignal>
#include <thread>

#include <pthread.h>

#include "capture/queue.hpp"
#include "common/log.hpp"

namespace app {

// Owns the sigwait thread; joining it on every exit path.
class SignalWatcher {
public:
  SignalWatcher(std::atomic<bool> &stop, capture::IngestionQueue &queue)
      : thread_([this, &stop, &queue] {
          int sig = 0;
          sigwait(&set_, &sig);
          received_ = true;
          if (!stop.exchange(true)) {
            blog::app("Received signal {}, shutting down", sig);
          }
          queue.wake();
        }) {}

  ~SignalWatcher() {
    // Releases the waiter if no signal ever came; after a real signal the
    // thread is already past sigwait.
    if (!received_) {
      pthread_kill(thread_.native_handle(), SIGTERM);
    }
    thread_.join();
  }

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  [[nodiscard]] bool received() const { return received_; }

  // Must run before any other thread starts so they inherit the mask.
  static void block_signals() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set_, nullptr);
  }

private:
  static inline sigset_t set_{};
  std::atomic<bool> received_{false};
  std::thread thread_;
};

} // namespace app
