// src/sys/power.cpp

#include "sys/power.hpp"
#include "common/log.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace sys {

GovernorPowerControl::GovernorPowerControl(bool enabled,
                                           std::filesystem::path cpuRoot)
    : enabled_(enabled), cpuRoot_(std::move(cpuRoot)) {}

void GovernorPowerControl::set_power_mode(bool saving) {
  if (!enabled_) {
    return;
  }
  const char *governor = saving ? "powersave" : "ondemand";

  std::error_code ec;
  std::filesystem::directory_iterator it(cpuRoot_, ec);
  if (ec) {
    blog::error::power("Cannot list {}: {}", cpuRoot_.string(), ec.message());
    return;
  }

  int written = 0;
  int failed = 0;
  try {
    for (const auto &entry : it) {
      const std::string name = entry.path().filename().string();
      // cpu0, cpu1, ... but not cpufreq / cpuidle
      if (name.size() < 4 || name.compare(0, 3, "cpu") != 0 ||
          name.find_first_not_of("0123456789", 3) != std::string::npos) {
        continue;
      }
      const auto file = entry.path() / "cpufreq" / "scaling_governor";
      if (!std::filesystem::exists(file, ec)) {
        continue;
      }
      std::ofstream out(file);
      out << governor << '\n';
      out.flush();
      if (out) {
        ++written;
      } else {
        ++failed;
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    blog::error::power("Scanning {} failed: {}", cpuRoot_.string(), e.what());
  }

  if (failed > 0) {
    blog::error::power("Could not set governor '{}' on {} cpu(s)", governor,
                       failed);
  }
  blog::debug::power("governor '{}' set on {} cpu(s)", governor, written);
}

} // namespace sys
