// tests/test_sys.cpp
// Calendar paths, CPU governor switching, systemd notifications and the log
// sinks, all against temporary directories.

#include "harness.hpp"

#include "common/log.hpp"
#include "sys/notify.hpp"
#include "sys/path_builder.hpp"
#include "sys/power.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string slurp(const fs::path &p) {
  std::ifstream in(p);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

void touch(const fs::path &p, const std::string &content = "") {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

// 2024-03-07 10:15:09 local time
std::chrono::system_clock::time_point march_seventh() {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 2;
  tm.tm_mday = 7;
  tm.tm_hour = 10;
  tm.tm_min = 15;
  tm.tm_sec = 9;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

void testCalendarPath() {
  TEST("session path is filed by year, month and day")
    TempDir dir("paths");
    sys::CalendarPathBuilder builder(dir.path());
    const fs::path p = builder.session_path(march_seventh(), "");
    ASSERT(p == dir.path() / "2024" / "03-March" / "07" / "session_101509.mid");
    ASSERT(fs::is_directory(p.parent_path()));
    ASSERT(!fs::exists(p));
  PASS()
}

void testCalendarPathCollision() {
  TEST("a taken name gets a numeric suffix")
    TempDir dir("paths_collision");
    sys::CalendarPathBuilder builder(dir.path());
    const fs::path first = builder.session_path(march_seventh(), "");
    touch(first);
    const fs::path second = builder.session_path(march_seventh(), "");
    ASSERT(second.filename() == "session_101509_2.mid");
    touch(second);
    ASSERT(builder.session_path(march_seventh(), "").filename() ==
           "session_101509_3.mid");
  PASS()
}

void testCalendarPathSuffixCollision() {
  TEST("tagged names are checked for collisions too")
    TempDir dir("paths_suffix");
    sys::CalendarPathBuilder builder(dir.path());
    const fs::path first = builder.session_path(march_seventh(), "-bookmark");
    ASSERT(first.filename() == "session_101509-bookmark.mid");
    touch(first);
    const fs::path second = builder.session_path(march_seventh(), "-bookmark");
    ASSERT(second.filename() == "session_101509_2-bookmark.mid");
    // the plain name is still free
    ASSERT(builder.session_path(march_seventh(), "").filename() ==
           "session_101509.mid");
  PASS()
}

void testGovernorSwitch() {
  TEST("governor is written for every cpuN with cpufreq")
    TempDir dir("power");
    const fs::path root = dir.path();
    touch(root / "cpu0" / "cpufreq" / "scaling_governor", "schedutil\n");
    touch(root / "cpu1" / "cpufreq" / "scaling_governor", "schedutil\n");
    fs::create_directories(root / "cpu2");                     // offline
    touch(root / "cpufreq" / "scaling_governor", "untouched"); // not a cpu
    touch(root / "cpuidle" / "cpufreq" / "scaling_governor", "untouched");

    sys::GovernorPowerControl power(true, root);
    power.set_power_mode(true);
    ASSERT(slurp(root / "cpu0" / "cpufreq" / "scaling_governor") ==
           "powersave\n");
    ASSERT(slurp(root / "cpu1" / "cpufreq" / "scaling_governor") ==
           "powersave\n");
    ASSERT(!fs::exists(root / "cpu2" / "cpufreq"));
    ASSERT(slurp(root / "cpufreq" / "scaling_governor") == "untouched");
    ASSERT(slurp(root / "cpuidle" / "cpufreq" / "scaling_governor") ==
           "untouched");

    power.set_power_mode(false);
    ASSERT(slurp(root / "cpu0" / "cpufreq" / "scaling_governor") ==
           "ondemand\n");
  PASS()
}

void testGovernorDisabledAndMissing() {
  TEST("disabled control and a missing sysfs root are harmless")
    TempDir dir("power_off");
    touch(dir.path() / "cpu0" / "cpufreq" / "scaling_governor", "schedutil\n");
    sys::GovernorPowerControl disabled(false, dir.path());
    disabled.set_power_mode(true);
    ASSERT(slurp(dir.path() / "cpu0" / "cpufreq" / "scaling_governor") ==
           "schedutil\n");

    sys::GovernorPowerControl missing(true, dir.path() / "nope");
    missing.set_power_mode(true);
  PASS()
}

void testNotifierDisabled() {
  TEST("notifier without a socket does nothing")
    sys::SystemdNotifier notifier{std::string()};
    ASSERT(!notifier.enabled());
    notifier.ready();
    notifier.alive();
    notifier.stopping();
  PASS()
}

void testNotifierSends() {
  TEST("notifier sends READY=1, WATCHDOG=1 and STOPPING=1 datagrams")
    TempDir dir("notify");
    const std::string path = (dir.path() / "notify.sock").string();

    const int fd = ::socket(AF_UNIX, SOCK_DGRAM, 0);
    ASSERT(fd >= 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    path.copy(addr.sun_path, sizeof(addr.sun_path) - 1);
    ASSERT(::bind(fd, reinterpret_cast<const sockaddr *>(&addr),
                  sizeof(addr)) == 0);
    timeval tv{2, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    auto receive = [fd] {
      char buf[64] = {};
      const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      return n > 0 ? std::string(buf, static_cast<std::size_t>(n))
                   : std::string();
    };

    sys::SystemdNotifier notifier(path);
    ASSERT(notifier.enabled());
    notifier.ready();
    const std::string first = receive();
    notifier.alive();
    const std::string second = receive();
    notifier.stopping();
    const std::string third = receive();
    ::close(fd);

    ASSERT(first == "READY=1");
    ASSERT(second == "WATCHDOG=1");
    ASSERT(third == "STOPPING=1");
  PASS()
}

void testLogFile() {
  TEST("log lines go to the file, debug only when verbose")
    TempDir dir("log");
    const fs::path file = dir.path() / "logs" / "recorder.log";
    blog::configure(file, false);
    blog::rec("Saved recording to {}", "x.mid");
    blog::debug::rec("not shown");
    blog::error::port("Port monitor error: {}", 42);
    blog::set_verbose(true);
    blog::debug::power("shown");
    blog::set_verbose(false);

    const std::string text = slurp(file);
    ASSERT(text.find(" REC | Saved recording to x.mid\n") != std::string::npos);
    ASSERT(text.find("not shown") == std::string::npos);
    ASSERT(text.find("PORT | ERR Port monitor error: 42\n") !=
           std::string::npos);
    ASSERT(text.find(" PWR | dbg shown\n") != std::string::npos);
  PASS()
}

int main() {
  std::cout << "\n=== System collaborator tests ===\n" << std::endl;

  testCalendarPath();
  testCalendarPathCollision();
  testCalendarPathSuffixCollision();
  testGovernorSwitch();
  testGovernorDisabledAndMissing();
  testNotifierDisabled();
  testNotifierSends();
  testLogFile();

  return summary();
}
