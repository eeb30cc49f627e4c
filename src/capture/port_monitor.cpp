// src/capture/port_monitor.cpp

#include "capture/port_monitor.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace capture {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

std::optional<std::string> select_port(const std::vector<std::string> &names,
                                       const std::string &match) {
  if (names.empty()) {
    return std::nullopt;
  }
  if (!match.empty()) {
    const std::string needle = lowercase(match);
    for (const auto &name : names) {
      if (lowercase(name).find(needle) != std::string::npos) {
        return name;
      }
    }
  }
  return names.front();
}

PortMonitor::PortMonitor(EventSource &source, IngestionQueue &queue,
                         std::string match, const PortMonitorTiming &timing)
    : source_(source), queue_(queue), match_(std::move(match)),
      timing_(timing) {}

PortMonitor::~PortMonitor() { stop(); }

void PortMonitor::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void PortMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wakeup_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  close_port();
}

void PortMonitor::scan_once() {
  const auto names = source_.list();

  if (port_ &&
      std::find(names.begin(), names.end(), port_->name()) != names.end()) {
    return; // still connected
  }

  if (port_) {
    const std::string lost = port_->name();
    close_port();
    queue_.push(PortNotice{false, lost});
  }

  const auto chosen = select_port(names, match_);
  if (!chosen) {
    blog::debug::port("No MIDI ports found");
    return;
  }

  port_ = source_.open(*chosen,
                       [&queue = queue_](RawEvent ev) { queue.push(std::move(ev)); });
  queue_.push(PortNotice{true, *chosen});
}

std::optional<std::string> PortMonitor::open_port() const {
  if (port_) {
    return port_->name();
  }
  return std::nullopt;
}

void PortMonitor::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    auto wait = timing_.scanInterval;
    lock.unlock();
    try {
      scan_once();
    } catch (const std::exception &e) {
      blog::error::port("Port monitor error: {}", e.what());
      wait = timing_.errorInterval;
    }
    lock.lock();
    wakeup_.wait_for(lock, wait, [this] { return stopping_; });
  }
}

void PortMonitor::close_port() {
  if (!port_) {
    return;
  }
  try {
    port_->close();
  } catch (const std::exception &e) {
    blog::error::port("Could not close {} cleanly: {}", port_->name(),
                      e.what());
  }
  port_.reset();
}

} // namespace capture
