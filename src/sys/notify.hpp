// src/sys/notify.hpp
// systemd service notifications (READY=1, WATCHDOG=1, STOPPING=1), sent as
// datagrams to the socket named by $NOTIFY_SOCKET. Without that variable
// (not started by systemd) every call does nothing.

#pragma once
#include <string>

#include "capture/collaborators.hpp"

namespace sys {

class SystemdNotifier : public capture::ServiceNotifier {
public:
  // Reads $NOTIFY_SOCKET once.
  SystemdNotifier();
  explicit SystemdNotifier(std::string socketPath);

  void ready() override { send("READY=1"); }
  void alive() override { send("WATCHDOG=1"); }
  void stopping() override { send("STOPPING=1"); }

  [[nodiscard]] bool enabled() const { return !socketPath_.empty(); }

private:
  void send(const std::string &state);

  std::string socketPath_;
  bool reportedFailure_ = false;
};

} // namespace sys
