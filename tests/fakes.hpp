// tests/fakes.hpp
// In-memory stand-ins for the collaborators, plus helpers to build
// timestamped events.

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "capture/collaborators.hpp"
#include "capture/types.hpp"
#include "io/io.hpp"
#include "midi/events.hpp"
#include "midi/smf.hpp"

namespace fakes {

using namespace std::chrono_literals;

// Fixed origin so test timestamps are easy to read: at(1.5) is 1.5 s in.
inline capture::Instant at(double seconds) {
  static const capture::Instant origin = capture::Clock::now();
  return origin + std::chrono::duration_cast<capture::Clock::duration>(
                      std::chrono::duration<double>(seconds));
}

inline capture::RawEvent ev(const midi::Message &msg, double seconds) {
  return capture::RawEvent{msg, at(seconds)};
}

// Hands out <dir>/session_<n><suffix>.mid, one per call.
class PathBuilder : public capture::PathBuilder {
public:
  explicit PathBuilder(std::filesystem::path dir) : dir_(std::move(dir)) {}

  std::filesystem::path session_path(capture::WallTime,
                                     const std::string &suffix) override {
    if (fail) {
      throw std::runtime_error("disk unavailable");
    }
    return dir_ / ("session_" + std::to_string(++calls) + suffix + ".mid");
  }

  // Every .mid file written so far, sorted by name.
  std::vector<std::filesystem::path> files() const {
    std::vector<std::filesystem::path> out;
    for (const auto &entry : std::filesystem::directory_iterator(dir_)) {
      if (entry.path().extension() == ".mid") {
        out.push_back(entry.path());
      }
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  int calls = 0;
  bool fail = false;

private:
  std::filesystem::path dir_;
};

class PowerControl : public capture::PowerControl {
public:
  void set_power_mode(bool saving) override {
    if (failNext) {
      failNext = false;
      throw std::runtime_error("governor write failed");
    }
    modes.push_back(saving);
  }

  int count(bool saving) const {
    return static_cast<int>(std::count(modes.begin(), modes.end(), saving));
  }

  std::vector<bool> modes;
  bool failNext = false;
};

// Counters are atomic so a test can watch a loop running on another thread.
class Notifier : public capture::ServiceNotifier {
public:
  void ready() override { ++readyCount; }
  void alive() override {
    if (failNextAlive.exchange(false)) {
      throw std::runtime_error("notify socket gone");
    }
    ++aliveCount;
  }
  void stopping() override { ++stoppingCount; }

  std::atomic<int> readyCount{0};
  std::atomic<int> aliveCount{0};
  std::atomic<int> stoppingCount{0};
  std::atomic<bool> failNextAlive{false};
};

// A port list the test can edit; open() records the callback so the test can
// inject events as if the hardware had sent them.
class EventSource : public capture::EventSource {
public:
  class Port : public capture::InputPort {
  public:
    Port(EventSource &owner, std::string name)
        : owner_(owner), name_(std::move(name)) {}
    ~Port() override { close(); }

    const std::string &name() const override { return name_; }
    void close() override {
      if (open_) {
        open_ = false;
        std::lock_guard<std::mutex> lock(owner_.mutex_);
        ++owner_.closed;
        owner_.callback_ = nullptr;
      }
    }

  private:
    EventSource &owner_;
    std::string name_;
    bool open_ = true;
  };

  std::vector<std::string> list() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failList) {
      throw std::runtime_error("backend unavailable");
    }
    return ports;
  }

  std::unique_ptr<capture::InputPort> open(const std::string &name,
                                           Callback callback) override {
    std::lock_guard<std::mutex> lock(mutex_);
    opened.push_back(name);
    callback_ = std::move(callback);
    return std::make_unique<Port>(*this, name);
  }

  void set_ports(std::vector<std::string> names) {
    std::lock_guard<std::mutex> lock(mutex_);
    ports = std::move(names);
  }

  void set_fail(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failList = fail;
  }

  // Deliver an event through the open port's callback.
  bool send(capture::RawEvent event) {
    Callback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cb = callback_;
    }
    if (!cb) {
      return false;
    }
    cb(std::move(event));
    return true;
  }

  std::vector<std::string> ports;
  std::vector<std::string> opened;
  int closed = 0;
  bool failList = false;

private:
  std::mutex mutex_;
  Callback callback_;
};

inline midi::Song read_song(const std::filesystem::path &path) {
  return midi::parse_smf(io::read_all(path));
}

} // namespace fakes
