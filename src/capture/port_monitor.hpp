// src/capture/port_monitor.hpp
// Background task that keeps one hardware input open.
//
// Every scanInterval (errorInterval after a failure) it lists the ports; if
// nothing is open, or the open port vanished, it closes the stale handle and
// opens the preferred port again. The handle is created, used and destroyed
// on the monitor thread only; the control loop just sees PortNotice items in
// the queue.

#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "capture/collaborators.hpp"
#include "capture/queue.hpp"

namespace capture {

struct PortMonitorTiming {
  std::chrono::nanoseconds scanInterval = std::chrono::seconds(1);
  std::chrono::nanoseconds errorInterval = std::chrono::seconds(2);
};

// First name containing `match` (case-insensitive), else the first name.
std::optional<std::string> select_port(const std::vector<std::string> &names,
                                       const std::string &match);

class PortMonitor {
public:
  PortMonitor(EventSource &source, IngestionQueue &queue, std::string match,
              const PortMonitorTiming &timing);
  ~PortMonitor();

  PortMonitor(const PortMonitor &) = delete;
  PortMonitor &operator=(const PortMonitor &) = delete;

  void start();
  // Joins the thread and closes the port.
  void stop();

  // One rescan. Throws whatever the event source throws.
  void scan_once();

  // Name of the open port. Only meaningful while the thread is not running.
  [[nodiscard]] std::optional<std::string> open_port() const;

private:
  void run();
  void close_port();

  EventSource &source_;
  IngestionQueue &queue_;
  std::string match_;
  PortMonitorTiming timing_;

  std::unique_ptr<InputPort> port_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable wakeup_;
  bool stopping_ = false;
};

} // namespace capture
