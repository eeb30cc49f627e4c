// src/capture/types.hpp
// Shared vocabulary of the capture pipeline: clocks, the timestamped event
// that travels through the ingestion queue, and the port-change notice.

#pragma once
#include <chrono>
#include <string>
#include <variant>

#include "midi/events.hpp"

namespace capture {

using Clock = std::chrono::steady_clock;
using Instant = Clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// A message stamped on arrival, before it is queued.
struct RawEvent {
  midi::Message msg;
  Instant arrival;
};

// Sent by the port monitor when the hardware input appears or goes away.
struct PortNotice {
  bool connected = false;
  std::string name;
};

using QueueItem = std::variant<RawEvent, PortNotice>;

} // namespace capture
