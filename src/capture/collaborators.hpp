// src/capture/collaborators.hpp
// Narrow interfaces to the outside world. The engine only talks to these;
// the concrete versions live under src/sys/ and the tests supply fakes.

#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "capture/types.hpp"

namespace capture {

// An open hardware input. Closing (or destroying) it stops the callback;
// after close() returns the callback is never invoked again.
class InputPort {
public:
  virtual ~InputPort() = default;
  virtual const std::string &name() const = 0;
  virtual void close() = 0;
};

// Where performance events come from. Both calls may throw on backend
// errors; the port monitor logs and retries.
class EventSource {
public:
  // Invoked on the backend's delivery thread, already timestamped.
  using Callback = std::function<void(RawEvent)>;

  virtual ~EventSource() = default;
  virtual std::vector<std::string> list() = 0;
  virtual std::unique_ptr<InputPort> open(const std::string &name,
                                          Callback callback) = 0;
};

// Maps a session start time onto the file it is saved as, creating the
// parent directories. The suffix goes before the extension and the returned
// name is not taken yet. May throw std::filesystem::filesystem_error.
class PathBuilder {
public:
  virtual ~PathBuilder() = default;
  virtual std::filesystem::path session_path(WallTime start,
                                             const std::string &suffix) = 0;
};

// Best effort: implementations log failures and never throw.
class PowerControl {
public:
  virtual ~PowerControl() = default;
  virtual void set_power_mode(bool saving) = 0;
};

// Service manager liveness. Fire-and-forget, never throws.
class ServiceNotifier {
public:
  virtual ~ServiceNotifier() = default;
  virtual void ready() = 0;
  virtual void alive() = 0;
  virtual void stopping() = 0;
};

} // namespace capture
