// src/sys/notify.cpp

#include "sys/notify.hpp"
#include "common/log.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace sys {

SystemdNotifier::SystemdNotifier() {
  if (const char *env = std::getenv("NOTIFY_SOCKET")) {
    socketPath_ = env;
  }
}

SystemdNotifier::SystemdNotifier(std::string socketPath)
    : socketPath_(std::move(socketPath)) {}

void SystemdNotifier::send(const std::string &state) {
  if (socketPath_.empty()) {
    return;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socketPath_.size() >= sizeof(addr.sun_path)) {
    if (!reportedFailure_) {
      blog::error::app("NOTIFY_SOCKET path too long, notifications disabled");
      reportedFailure_ = true;
    }
    return;
  }
  std::memcpy(addr.sun_path, socketPath_.data(), socketPath_.size());
  if (addr.sun_path[0] == '@') {
    addr.sun_path[0] = '\0'; // abstract namespace socket
  }
  const socklen_t len = static_cast<socklen_t>(
      offsetof(sockaddr_un, sun_path) + socketPath_.size());

  const int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    if (!reportedFailure_) {
      blog::error::app("notify socket: {}", std::strerror(errno));
      reportedFailure_ = true;
    }
    return;
  }

  const ssize_t sent =
      ::sendto(fd, state.data(), state.size(), MSG_NOSIGNAL,
               reinterpret_cast<const sockaddr *>(&addr), len);
  if (sent < 0 && !reportedFailure_) {
    blog::error::app("notify {}: {}", state, std::strerror(errno));
    reportedFailure_ = true;
  }
  ::close(fd);
}

} // namespace sys
