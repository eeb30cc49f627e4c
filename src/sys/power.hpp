// src/sys/power.hpp
// Low-power mode as a CPU frequency governor switch: "powersave" while idle,
// "ondemand" otherwise, written to every cpu*/cpufreq/scaling_governor.
// Needs write access to sysfs; without it the request is logged and ignored.

#pragma once
#include <filesystem>

#include "capture/collaborators.hpp"

namespace sys {

class GovernorPowerControl : public capture::PowerControl {
public:
  explicit GovernorPowerControl(
      bool enabled,
      std::filesystem::path cpuRoot = "/sys/devices/system/cpu");

  void set_power_mode(bool saving) override;

private:
  bool enabled_;
  std::filesystem::path cpuRoot_;
};

} // namespace sys
